#include "common/jar_test_suite.hpp"
#include "jarstore/succinct/elias_fano.hpp"
#include "utils/random_generator.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace jarstore::test {

class EliasFanoTest : public JarTestSuite {};

TEST_F(EliasFanoTest, AccessMatchesInput) {
  for (auto max_gap : {1ull, 8ull, 300ull, 1ull << 20}) {
    succinct::EliasFanoBuilder builder;
    std::vector<uint64_t> values;
    uint64_t value = 0;
    for (int i = 0; i < 3000; ++i) {
      value += utils::RandomGenerator::RandU64(0, max_gap);
      values.push_back(value);
      ASSERT_TRUE(builder.Append(value));
    }

    std::string serialized;
    builder.Serialize(serialized);
    uint64_t consumed = 0;
    auto ef = succinct::EliasFano::Load(serialized, &consumed);
    ASSERT_TRUE(ef) << ef.error().ToString();
    ASSERT_EQ(consumed, serialized.size());
    ASSERT_EQ(ef.value().Size(), values.size());
    for (uint64_t i = 0; i < values.size(); ++i) {
      ASSERT_EQ(ef.value().Get(i), values[i]) << "i=" << i;
      if (i + 1 < values.size()) {
        auto [first, second] = ef.value().GetPair(i);
        ASSERT_EQ(first, values[i]);
        ASSERT_EQ(second, values[i + 1]);
      }
    }
  }
}

TEST_F(EliasFanoTest, RejectsDecreasingValue) {
  succinct::EliasFanoBuilder builder;
  ASSERT_TRUE(builder.Append(10));
  auto res = builder.Append(9);
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kInvalidArgument);
}

class OffsetIndexTest : public JarTestSuite {};

TEST_F(OffsetIndexTest, RowRanges) {
  std::vector<uint64_t> lengths = {5, 0, 0, 17, 1, 0, 4096, 3};
  succinct::OffsetIndexBuilder builder;
  uint64_t total = 0;
  for (auto length : lengths) {
    builder.Append(length);
    total += length;
  }
  ASSERT_EQ(builder.NumRows(), lengths.size());
  ASSERT_EQ(builder.TotalSize(), total);

  std::string serialized;
  builder.Serialize(serialized);
  auto index = succinct::OffsetIndex::Load(serialized, lengths.size(), total);
  ASSERT_TRUE(index) << index.error().ToString();
  ASSERT_EQ(index.value().NumRows(), lengths.size());

  uint64_t offset = 0;
  for (uint64_t row = 0; row < lengths.size(); ++row) {
    auto [begin, end] = index.value().RowRange(row);
    ASSERT_EQ(begin, offset);
    ASSERT_EQ(end - begin, lengths[row]);
    offset = end;
  }
  ASSERT_EQ(index.value().Offset(lengths.size()), total);
}

TEST_F(OffsetIndexTest, ZeroRowsHasSingleZeroOffset) {
  succinct::OffsetIndexBuilder builder;
  std::string serialized;
  builder.Serialize(serialized);

  auto index = succinct::OffsetIndex::Load(serialized, 0, 0);
  ASSERT_TRUE(index) << index.error().ToString();
  ASSERT_EQ(index.value().NumRows(), 0u);
  ASSERT_EQ(index.value().Offset(0), 0u);
}

TEST_F(OffsetIndexTest, SmallerThanRawOffsets) {
  succinct::OffsetIndexBuilder builder;
  const uint64_t num_rows = 100000;
  for (uint64_t i = 0; i < num_rows; ++i) {
    builder.Append(utils::RandomGenerator::RandU64(20, 200));
  }
  std::string serialized;
  builder.Serialize(serialized);
  ASSERT_LT(serialized.size(), (num_rows + 1) * sizeof(uint64_t) / 2);
}

TEST_F(OffsetIndexTest, MismatchedShapeFails) {
  succinct::OffsetIndexBuilder builder;
  builder.Append(10);
  builder.Append(20);
  std::string serialized;
  builder.Serialize(serialized);

  auto wrong_rows = succinct::OffsetIndex::Load(serialized, 3, 30);
  ASSERT_FALSE(wrong_rows);
  ASSERT_EQ(wrong_rows.error().GetCategory(), Error::Category::kCorruption);

  auto wrong_size = succinct::OffsetIndex::Load(serialized, 2, 31);
  ASSERT_FALSE(wrong_size);
  ASSERT_EQ(wrong_size.error().GetCategory(), Error::Category::kCorruption);
}

} // namespace jarstore::test
