#include "common/jar_test_suite.hpp"
#include "jarstore/codec/codec.hpp"
#include "utils/random_generator.hpp"

#include <gtest/gtest.h>

#include <format>
#include <memory>
#include <string>
#include <vector>

namespace jarstore::test {

class CodecTest : public JarTestSuite,
                  public ::testing::WithParamInterface<CodecType> {
protected:
  std::unique_ptr<Codec> MakeCodec(CodecType type, Slice dictionary = {}) {
    CodecOptions options;
    options.type_ = type;
    options.dictionary_ = dictionary;
    auto codec = NewCodec(options);
    EXPECT_TRUE(codec) << codec.error().ToString();
    return std::move(codec).value();
  }
};

TEST_P(CodecTest, RoundTrip) {
  auto codec = MakeCodec(GetParam());
  ASSERT_EQ(codec->Type(), GetParam());

  std::vector<std::string> rows = {
      "a",
      std::string(1, '\0'),
      std::string(4096, 'x'),
      utils::RandomGenerator::RandBytes(1000),
      utils::RandomGenerator::RandAlphString(77),
  };
  for (const auto& row : rows) {
    std::string block;
    ASSERT_TRUE(codec->Compress(row, block));
    ASSERT_FALSE(block.empty());

    std::string decoded;
    auto res = codec->Decompress(block, row.size(), decoded);
    ASSERT_TRUE(res) << res.error().ToString();
    ASSERT_EQ(decoded, row);
  }
}

TEST_P(CodecTest, EmptyRowIsEmptyBlock) {
  auto codec = MakeCodec(GetParam());
  std::string block;
  ASSERT_TRUE(codec->Compress(Slice(), block));
  ASSERT_TRUE(block.empty());

  std::string decoded = "stale";
  ASSERT_TRUE(codec->Decompress(Slice(), 0, decoded));
  ASSERT_TRUE(decoded.empty());
}

TEST_P(CodecTest, CompressAppends) {
  auto codec = MakeCodec(GetParam());
  std::string blocks;
  ASSERT_TRUE(codec->Compress("first row", blocks));
  const auto first_size = blocks.size();
  ASSERT_TRUE(codec->Compress("second row", blocks));

  std::string decoded;
  ASSERT_TRUE(codec->Decompress(Slice(blocks).substr(0, first_size), 64, decoded));
  ASSERT_EQ(decoded, "first row");
  ASSERT_TRUE(codec->Decompress(Slice(blocks).substr(first_size), 64, decoded));
  ASSERT_EQ(decoded, "second row");
}

TEST_P(CodecTest, RowLargerThanBoundFails) {
  auto codec = MakeCodec(GetParam());
  std::string row(1000, 'q');
  std::string block;
  ASSERT_TRUE(codec->Compress(row, block));

  std::string decoded;
  auto res = codec->Decompress(block, row.size() - 1, decoded);
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCategory(), Error::Category::kCorruption);
}

INSTANTIATE_TEST_SUITE_P(AllCodecs, CodecTest,
                         ::testing::Values(CodecType::kRaw, CodecType::kZstd, CodecType::kLz4),
                         [](const ::testing::TestParamInfo<CodecType>& info) {
                           return std::string(ToString(info.param));
                         });

class ZstdCodecTest : public CodecTest {};

TEST_F(ZstdCodecTest, BlockMustSpanExactlyOneFrame) {
  auto codec = MakeCodec(CodecType::kZstd);
  std::string row = utils::RandomGenerator::RandAlphString(500);
  std::string block;
  ASSERT_TRUE(codec->Compress(row, block));

  std::string decoded;
  // Truncated
  auto res = codec->Decompress(Slice(block).substr(0, block.size() - 1), row.size(), decoded);
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kDecompressFailed);

  // Trailing bytes of the next block
  std::string longer = block + "zz";
  res = codec->Decompress(longer, row.size(), decoded);
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kDecompressFailed);
}

TEST_F(ZstdCodecTest, Dictionary) {
  std::vector<std::string> rows;
  for (int i = 0; i < 2000; ++i) {
    rows.push_back(std::format(R"({{"id":{},"name":"user_{}","status":"active","tier":"gold"}})",
                               i, i * 7));
  }
  std::vector<Slice> samples(rows.begin(), rows.end());
  auto dictionary = TrainZstdDictionary(samples, 4096);
  ASSERT_TRUE(dictionary) << dictionary.error().ToString();
  ASSERT_FALSE(dictionary.value().empty());
  ASSERT_LE(dictionary.value().size(), 4096u);

  auto with_dict = MakeCodec(CodecType::kZstd, dictionary.value());
  auto without_dict = MakeCodec(CodecType::kZstd);
  std::string dict_blocks;
  std::string plain_blocks;
  for (const auto& row : rows) {
    std::string block;
    ASSERT_TRUE(with_dict->Compress(row, block));
    std::string decoded;
    ASSERT_TRUE(with_dict->Decompress(block, row.size(), decoded));
    ASSERT_EQ(decoded, row);
    dict_blocks += block;
    ASSERT_TRUE(without_dict->Compress(row, plain_blocks));
  }
  ASSERT_LT(dict_blocks.size(), plain_blocks.size());
}

TEST_F(ZstdCodecTest, TrainingNeedsSamples) {
  std::vector<Slice> samples = {Slice("only one sample")};
  auto dictionary = TrainZstdDictionary(samples, 4096);
  ASSERT_FALSE(dictionary);
  ASSERT_EQ(dictionary.error().GetCategory(), Error::Category::kConstruction);
}

TEST_F(ZstdCodecTest, DictionaryOnlyForZstd) {
  CodecOptions options;
  options.type_ = CodecType::kLz4;
  options.dictionary_ = Slice("dict");
  auto codec = NewCodec(options);
  ASSERT_FALSE(codec);
  ASSERT_EQ(codec.error().GetCode(), Error::Code::kInvalidArgument);
}

TEST_F(ZstdCodecTest, CodecNames) {
  for (auto type : {CodecType::kRaw, CodecType::kZstd, CodecType::kLz4}) {
    auto parsed = CodecTypeFromString(ToString(type));
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(*parsed, type);
  }
  ASSERT_FALSE(CodecTypeFromString("snappy").has_value());
}

} // namespace jarstore::test
