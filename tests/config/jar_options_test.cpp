#include "common/jar_test_suite.hpp"
#include "jarstore/config/jar_options.hpp"
#include "jarstore/config/jar_paths.hpp"
#include "jarstore/filter/cuckoo_filter.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <string>

namespace jarstore::test {

class JarOptionsTest : public JarTestSuite {};

TEST_F(JarOptionsTest, Validate) {
  ASSERT_FALSE(JarOptions().Validate());
  ASSERT_TRUE(JarOptions::Uniform(3).Validate());

  auto options = JarOptions::Uniform(2);
  options.filter_fp_rate_ = 1.0;
  ASSERT_FALSE(options.Validate());

  options = JarOptions::Uniform(2);
  options.compression_threads_ = 0;
  ASSERT_FALSE(options.Validate());

  options = JarOptions::Uniform(2);
  options.columns_[1].codec_ = CodecType::kLz4;
  options.columns_[1].train_dictionary_ = true;
  auto res = options.Validate();
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kInvalidArgument);

  options = JarOptions::Uniform(1);
  options.columns_[0].level_ = 1000;
  ASSERT_FALSE(options.Validate());
}

TEST_F(JarOptionsTest, FilterRateBelowFingerprintWidth) {
  auto options = JarOptions::Uniform(1);
  options.filter_fp_rate_ = 1e-5;
  auto res = options.Validate();
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kInvalidArgument);

  options.filter_fp_rate_ = CuckooFilterBuilder::kMinFpRate;
  ASSERT_TRUE(options.Validate());
}

TEST_F(JarOptionsTest, PhfRequiresFilter) {
  auto options = JarOptions::Uniform(1);
  options.with_filter_ = false;
  auto res = options.Validate();
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kInvalidArgument);

  options.with_phf_ = false;
  ASSERT_TRUE(options.Validate());
}

TEST_F(JarOptionsTest, LevelOutOfIntRange) {
  // 4294967299 would wrap to 3 when narrowed to int.
  auto res = JarOptions::FromJson(R"({"columns":[{"codec":"zstd","level":4294967299}]})");
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kInvalidArgument);

  res = JarOptions::FromJson(R"({"columns":[{"codec":"zstd","level":-2147483649}]})");
  ASSERT_FALSE(res);

  auto parsed = JarOptions::FromJson(R"({"columns":[{"codec":"zstd","level":19}]})");
  ASSERT_TRUE(parsed) << parsed.error().ToString();
  ASSERT_EQ(parsed.value().columns_[0].level_, 19);
}

TEST_F(JarOptionsTest, JsonRoundTrip) {
  auto options = JarOptions::Uniform(2);
  options.columns_[0].codec_ = CodecType::kLz4;
  options.columns_[1].level_ = -3;
  options.columns_[1].train_dictionary_ = true;
  options.columns_[1].max_dict_bytes_ = 16 << 10;
  options.compression_threads_ = 4;
  options.with_filter_ = false;
  options.with_phf_ = false;
  options.filter_capacity_ = 123;
  options.filter_fp_rate_ = 0.002;
  options.phf_gamma_ = 3.5;

  auto parsed = JarOptions::FromJson(options.ToJson());
  ASSERT_TRUE(parsed) << parsed.error().ToString();
  const auto& copy = parsed.value();
  ASSERT_EQ(copy.NumColumns(), 2u);
  ASSERT_EQ(copy.columns_[0].codec_, CodecType::kLz4);
  ASSERT_EQ(copy.columns_[1].codec_, CodecType::kZstd);
  ASSERT_EQ(copy.columns_[1].level_, -3);
  ASSERT_TRUE(copy.columns_[1].train_dictionary_);
  ASSERT_EQ(copy.columns_[1].max_dict_bytes_, 16u << 10);
  ASSERT_EQ(copy.compression_threads_, 4u);
  ASSERT_FALSE(copy.with_filter_);
  ASSERT_EQ(copy.filter_capacity_, 123u);
  ASSERT_DOUBLE_EQ(copy.filter_fp_rate_, 0.002);
  ASSERT_FALSE(copy.with_phf_);
  ASSERT_DOUBLE_EQ(copy.phf_gamma_, 3.5);
}

TEST_F(JarOptionsTest, MissingMembersKeepDefaults) {
  auto parsed = JarOptions::FromJson(R"({"columns":[{"codec":"raw"},{}]})");
  ASSERT_TRUE(parsed) << parsed.error().ToString();
  ASSERT_EQ(parsed.value().columns_[0].codec_, CodecType::kRaw);
  ASSERT_EQ(parsed.value().columns_[1].codec_, CodecType::kZstd);
  ASSERT_EQ(parsed.value().compression_threads_, 1u);
  ASSERT_DOUBLE_EQ(parsed.value().filter_fp_rate_, 0.01);
}

TEST_F(JarOptionsTest, BadJson) {
  ASSERT_FALSE(JarOptions::FromJson("not json"));
  ASSERT_FALSE(JarOptions::FromJson(R"({"with_filter":true})"));
  ASSERT_FALSE(JarOptions::FromJson(R"({"columns":[{"codec":"snappy"}]})"));
  ASSERT_FALSE(JarOptions::FromJson(R"({"columns":[{}],"compression_threads":"four"})"));
  ASSERT_FALSE(JarOptions::FromJson(R"({"columns":[]})"));
}

TEST_F(JarOptionsTest, LoadFromFile) {
  auto path = TestCaseDir() + "/options.json";
  {
    std::ofstream file(path);
    file << JarOptions::Uniform(4).ToJson();
  }
  auto options = JarOptions::LoadFromFile(path);
  ASSERT_TRUE(options) << options.error().ToString();
  ASSERT_EQ(options.value().NumColumns(), 4u);

  auto missing = JarOptions::LoadFromFile(TestCaseDir() + "/missing.json");
  ASSERT_FALSE(missing);
  ASSERT_EQ(missing.error().GetCode(), Error::Code::kFileOpen);
}

TEST_F(JarOptionsTest, Paths) {
  ASSERT_EQ(JarPaths::DataFilePath("/data/blocks.jar"), "/data/blocks.jar");
  ASSERT_EQ(JarPaths::TmpFilePath("/data/blocks.jar"), "/data/blocks.jar.tmp");
  ASSERT_EQ(JarPaths::LogFilePath("/data/blocks.jar"), "/data/blocks.jar.log");
}

} // namespace jarstore::test
