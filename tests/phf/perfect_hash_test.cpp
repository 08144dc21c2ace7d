#include "common/jar_test_suite.hpp"
#include "jarstore/phf/perfect_hash.hpp"
#include "utils/random_generator.hpp"

#include <gtest/gtest.h>

#include <format>
#include <string>
#include <unordered_set>
#include <vector>

namespace jarstore::test {

class PerfectHashTest : public JarTestSuite {
protected:
  PerfectHash Build(const std::vector<std::string>& keys, std::string& serialized,
                    const PerfectHashOptions& options = {}) {
    std::vector<Slice> key_slices(keys.begin(), keys.end());
    auto res = PerfectHashBuilder::Build(key_slices, options, serialized);
    EXPECT_TRUE(res) << res.error().ToString();

    uint64_t consumed = 0;
    auto phf = PerfectHash::Load(serialized, &consumed);
    EXPECT_TRUE(phf) << phf.error().ToString();
    EXPECT_EQ(consumed, serialized.size());
    return phf.value();
  }
};

TEST_F(PerfectHashTest, MapsEveryKeyToItsIndex) {
  for (auto gamma : {1.0, 2.0, 5.0}) {
    std::vector<std::string> keys;
    std::unordered_set<std::string> unique;
    while (keys.size() < 50000) {
      auto key = utils::RandomGenerator::RandBytes(utils::RandomGenerator::RandU64(1, 40));
      if (unique.insert(key).second) {
        keys.push_back(key);
      }
    }

    std::string serialized;
    PerfectHashOptions options;
    options.gamma_ = gamma;
    auto phf = Build(keys, serialized, options);
    ASSERT_EQ(phf.NumKeys(), keys.size());
    ASSERT_GT(phf.NumLevels(), 0u);
    for (uint64_t i = 0; i < keys.size(); ++i) {
      ASSERT_EQ(phf.Lookup(keys[i]), i) << "gamma=" << gamma;
    }
  }
}

TEST_F(PerfectHashTest, UnknownKeysStayInRange) {
  std::vector<std::string> keys;
  for (int i = 0; i < 1000; ++i) {
    keys.push_back(std::format("member-{}", i));
  }
  std::string serialized;
  auto phf = Build(keys, serialized);
  for (int i = 0; i < 10000; ++i) {
    ASSERT_LT(phf.Lookup(std::format("stranger-{}", i)), keys.size());
  }
}

TEST_F(PerfectHashTest, DuplicateKeyFails) {
  std::vector<std::string> keys = {"a", "b", "c", "b"};
  std::vector<Slice> key_slices(keys.begin(), keys.end());
  std::string serialized;
  auto res = PerfectHashBuilder::Build(key_slices, {}, serialized);
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error(), Error::DuplicateKey(1, 3));
  ASSERT_EQ(res.error().GetCategory(), Error::Category::kConstruction);
}

TEST_F(PerfectHashTest, SingleKeyAndEmptySet) {
  std::string serialized;
  auto single = Build({"only"}, serialized);
  ASSERT_EQ(single.Lookup("only"), 0u);
  ASSERT_EQ(single.Lookup("other"), 0u);

  std::string empty_serialized;
  auto empty = Build({}, empty_serialized);
  ASSERT_EQ(empty.NumKeys(), 0u);
  ASSERT_EQ(empty.Lookup("anything"), 0u);
}

TEST_F(PerfectHashTest, SpaceIndependentOfKeyLength) {
  std::vector<std::string> keys;
  for (int i = 0; i < 20000; ++i) {
    keys.push_back(std::format("{}-{}", std::string(200, 'k'), i));
  }
  std::string serialized;
  Build(keys, serialized);
  // Level bitmaps, rank samples and the permutation, far below the key bytes.
  ASSERT_LT(serialized.size() * 8 / keys.size(), 40u);
}

} // namespace jarstore::test
