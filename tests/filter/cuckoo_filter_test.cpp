#include "common/jar_test_suite.hpp"
#include "jarstore/filter/cuckoo_filter.hpp"

#include <gtest/gtest.h>

#include <format>
#include <string>
#include <vector>

namespace jarstore::test {

class CuckooFilterTest : public JarTestSuite {
protected:
  static std::string Key(uint64_t i) {
    return std::format("key-{}", i);
  }

  static std::string AbsentKey(uint64_t i) {
    return std::format("absent-{}", i);
  }
};

TEST_F(CuckooFilterTest, NoFalseNegatives) {
  const uint64_t num_keys = 20000;
  auto builder = CuckooFilterBuilder::New(num_keys, 0.01);
  ASSERT_TRUE(builder) << builder.error().ToString();
  for (uint64_t i = 0; i < num_keys; ++i) {
    auto res = builder.value().Insert(Key(i));
    ASSERT_TRUE(res) << res.error().ToString();
  }
  ASSERT_EQ(builder.value().NumItems(), num_keys);

  std::string serialized;
  builder.value().Serialize(serialized);
  uint64_t consumed = 0;
  auto filter = CuckooFilter::Load(serialized, &consumed);
  ASSERT_TRUE(filter) << filter.error().ToString();
  ASSERT_EQ(consumed, serialized.size());
  ASSERT_EQ(filter.value().NumItems(), num_keys);

  for (uint64_t i = 0; i < num_keys; ++i) {
    ASSERT_TRUE(builder.value().MightContain(Key(i)));
    ASSERT_TRUE(filter.value().MightContain(Key(i)));
  }
}

TEST_F(CuckooFilterTest, FalsePositiveRateWithinBound) {
  for (auto fp_rate : {0.05, 0.01, 0.001}) {
    for (uint64_t seed = 1; seed <= 3; ++seed) {
      const uint64_t num_keys = 10000;
      auto builder = CuckooFilterBuilder::New(num_keys, fp_rate, seed);
      ASSERT_TRUE(builder);
      for (uint64_t i = 0; i < num_keys; ++i) {
        ASSERT_TRUE(builder.value().Insert(Key(i)));
      }

      const uint64_t num_probes = 100000;
      uint64_t false_positives = 0;
      for (uint64_t i = 0; i < num_probes; ++i) {
        if (builder.value().MightContain(AbsentKey(i))) {
          ++false_positives;
        }
      }
      const double observed = static_cast<double>(false_positives) / num_probes;
      ASSERT_LE(observed, fp_rate * 1.5)
          << "fp_rate=" << fp_rate << ", seed=" << seed << ", observed=" << observed;
    }
  }
}

TEST_F(CuckooFilterTest, FingerprintBitsFollowRate) {
  auto loose = CuckooFilterBuilder::New(100, 0.5);
  auto tight = CuckooFilterBuilder::New(100, CuckooFilterBuilder::kMinFpRate);
  ASSERT_TRUE(loose);
  ASSERT_TRUE(tight);
  ASSERT_EQ(loose.value().Params().fingerprint_bits_, CuckooFilterBuilder::kMinFingerprintBits);
  ASSERT_EQ(tight.value().Params().fingerprint_bits_, CuckooFilterBuilder::kMaxFingerprintBits);
}

TEST_F(CuckooFilterTest, TightestRateIsMet) {
  const uint64_t num_keys = 20000;
  auto builder = CuckooFilterBuilder::New(num_keys, CuckooFilterBuilder::kMinFpRate);
  ASSERT_TRUE(builder) << builder.error().ToString();
  for (uint64_t i = 0; i < num_keys; ++i) {
    ASSERT_TRUE(builder.value().Insert(Key(i)));
  }

  const uint64_t num_probes = 400000;
  uint64_t false_positives = 0;
  for (uint64_t i = 0; i < num_probes; ++i) {
    if (builder.value().MightContain(AbsentKey(i))) {
      ++false_positives;
    }
  }
  const double observed = static_cast<double>(false_positives) / num_probes;
  ASSERT_LE(observed, CuckooFilterBuilder::kMinFpRate * 1.5) << "observed=" << observed;
}

TEST_F(CuckooFilterTest, InvalidRate) {
  // 1e-5 needs fingerprints wider than kMaxFingerprintBits.
  for (auto fp_rate : {0.0, 1.0, -0.1, 1e-5, CuckooFilterBuilder::kMinFpRate / 2}) {
    auto builder = CuckooFilterBuilder::New(100, fp_rate);
    ASSERT_FALSE(builder);
    ASSERT_EQ(builder.error().GetCode(), Error::Code::kInvalidArgument);
  }
}

TEST_F(CuckooFilterTest, CapacityExceededIsAnError) {
  auto builder = CuckooFilterBuilder::New(8, 0.01);
  ASSERT_TRUE(builder);

  Result<void> res;
  uint64_t inserted = 0;
  for (; inserted < 10000 && res; ++inserted) {
    res = builder.value().Insert(Key(inserted));
  }
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kFilterCapacityExceeded);
  ASSERT_EQ(res.error().GetCategory(), Error::Category::kConstruction);
}

TEST_F(CuckooFilterTest, EmptyFilter) {
  auto builder = CuckooFilterBuilder::New(0, 0.01);
  ASSERT_TRUE(builder);
  std::string serialized;
  builder.value().Serialize(serialized);
  uint64_t consumed = 0;
  auto filter = CuckooFilter::Load(serialized, &consumed);
  ASSERT_TRUE(filter);
  ASSERT_FALSE(filter.value().MightContain("anything"));
}

} // namespace jarstore::test
