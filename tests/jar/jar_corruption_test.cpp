#include "common/jar_test_suite.hpp"
#include "jar/jar_format.hpp"
#include "jarstore/jar.hpp"
#include "jarstore/jar_writer.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <string>

namespace jarstore::test {

class JarCorruptionTest : public JarTestSuite {
protected:
  void SetUp() override {
    JarTestSuite::SetUp();
    path_ = TestCaseDir() + "/origin.jar";
    auto options = JarOptions::Uniform(2);
    options.columns_[1].codec_ = CodecType::kRaw;
    auto writer = JarWriter::Create(path_, options);
    ASSERT_TRUE(writer) << writer.error().ToString();
    for (int i = 0; i < 64; ++i) {
      auto value = std::format("value-{}-{}", i, std::string(i % 13, 'x'));
      ASSERT_TRUE(writer.value()->PushRecord({value, value}));
      ASSERT_TRUE(writer.value()->PushKey(std::format("key-{}", i)));
    }
    ASSERT_TRUE(writer.value()->SetUserHeader("header"));
    ASSERT_TRUE(writer.value()->Seal());

    std::ifstream in(path_, std::ios::binary);
    bytes_.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    ASSERT_GT(bytes_.size(), sizeof(FileHeader) + sizeof(Footer));

    Footer footer;
    std::memcpy(&footer, bytes_.data() + bytes_.size() - sizeof(Footer), sizeof(Footer));
    structure_offset_ = footer.structure_offset_;
  }

  std::string WriteCopy(const std::string& name, const std::string& bytes) {
    auto path = TestCaseDir() + "/" + name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return path;
  }

  static bool IsFormatOrCorruption(const Error& error) {
    return error.GetCategory() == Error::Category::kFormat ||
           error.GetCategory() == Error::Category::kCorruption;
  }

  std::string path_;
  std::string bytes_;
  uint64_t structure_offset_ = 0;
};

TEST_F(JarCorruptionTest, EveryTruncatedPrefixIsRejected) {
  for (uint64_t size = 0; size < bytes_.size(); ++size) {
    auto path = WriteCopy("truncated.jar", bytes_.substr(0, size));
    auto jar = Jar::Open(path);
    ASSERT_FALSE(jar) << "prefix of " << size << " bytes opened";
    ASSERT_TRUE(IsFormatOrCorruption(jar.error()))
        << "size=" << size << ", error=" << jar.error().ToString();
  }
}

TEST_F(JarCorruptionTest, FlippedStructureByteIsRejected) {
  for (uint64_t pos = structure_offset_; pos < bytes_.size(); ++pos) {
    auto corrupted = bytes_;
    corrupted[pos] = static_cast<char>(corrupted[pos] ^ 0xFF);
    auto jar = Jar::Open(WriteCopy("flipped.jar", corrupted));
    ASSERT_FALSE(jar) << "flip at " << pos << " opened";
    ASSERT_TRUE(IsFormatOrCorruption(jar.error()))
        << "pos=" << pos << ", error=" << jar.error().ToString();
  }
}

TEST_F(JarCorruptionTest, FlippedMetaByteIsChecksumMismatch) {
  auto corrupted = bytes_;
  corrupted[bytes_.size() - sizeof(Footer) - 1] ^= 0x01;
  auto jar = Jar::Open(WriteCopy("meta.jar", corrupted));
  ASSERT_FALSE(jar);
  ASSERT_EQ(jar.error().GetCode(), Error::Code::kChecksumMismatch);
}

TEST_F(JarCorruptionTest, BadHeader) {
  auto bad_magic = bytes_;
  bad_magic[0] = 'X';
  auto jar = Jar::Open(WriteCopy("magic.jar", bad_magic));
  ASSERT_FALSE(jar);
  ASSERT_EQ(jar.error().GetCode(), Error::Code::kBadMagic);

  auto bad_version = bytes_;
  bad_version[offsetof(FileHeader, version_)] = 7;
  jar = Jar::Open(WriteCopy("version.jar", bad_version));
  ASSERT_FALSE(jar);
  ASSERT_EQ(jar.error().GetCode(), Error::Code::kUnsupportedVersion);
}

TEST_F(JarCorruptionTest, NotAJar) {
  auto jar = Jar::Open(WriteCopy("text.jar", std::string(4096, 'j')));
  ASSERT_FALSE(jar);
  ASSERT_EQ(jar.error().GetCode(), Error::Code::kIncompleteJar);
}

TEST_F(JarCorruptionTest, FlippedDataByteFailsVerify) {
  // Row data is outside the structure checksum, so the jar still opens.
  auto corrupted = bytes_;
  corrupted[sizeof(FileHeader) + 3] ^= 0x10;
  auto jar = Jar::Open(WriteCopy("data.jar", corrupted));
  ASSERT_TRUE(jar) << jar.error().ToString();

  auto res = jar.value()->Verify();
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kChecksumMismatch);

  auto intact = Jar::Open(path_);
  ASSERT_TRUE(intact);
  ASSERT_TRUE(intact.value()->Verify());
}

TEST_F(JarCorruptionTest, FlippedRawColumnByteChangesOnlyItsRow) {
  auto origin = Jar::Open(path_);
  ASSERT_TRUE(origin);
  const auto& raw_meta = origin.value()->Meta().columns_[1];
  ASSERT_EQ(raw_meta.codec_, CodecType::kRaw);
  auto row0 = origin.value()->GetRawRow(1, 0);
  ASSERT_TRUE(row0);

  auto corrupted = bytes_;
  corrupted[raw_meta.data_.offset_] ^= 0x20;
  auto jar = Jar::Open(WriteCopy("raw.jar", corrupted));
  ASSERT_TRUE(jar);
  ASSERT_NE(jar.value()->GetRawRow(1, 0).value().ToString(), row0.value().ToString());
  ASSERT_EQ(jar.value()->GetRawRow(1, 1).value().ToString(),
            origin.value()->GetRawRow(1, 1).value().ToString());
}

} // namespace jarstore::test
