#include "jarstore/base/error.hpp"
#include "jarstore/base/result.hpp"

#include <gtest/gtest.h>

#include <format>
#include <memory>
#include <string>

namespace jarstore::test {

namespace {

Result<uint64_t> ParseRow(const std::string& text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return Error::InvalidArgument(std::format("not a row number: '{}'", text));
  }
  return std::stoull(text);
}

Result<uint64_t> ParseRowBelow(const std::string& text, uint64_t limit) {
  auto row = ParseRow(text);
  if (!row) {
    return std::move(row.error());
  }
  if (row.value() >= limit) {
    return Error::OutOfRange("row", row.value(), limit);
  }
  return row;
}

} // namespace

TEST(ResultTest, ValueAndError) {
  auto row = ParseRowBelow("42", 100);
  ASSERT_TRUE(row);
  ASSERT_EQ(row.value(), 42u);

  auto bad = ParseRowBelow("4x2", 100);
  ASSERT_FALSE(bad);
  ASSERT_EQ(bad.error().GetCode(), Error::Code::kInvalidArgument);

  auto out_of_range = ParseRowBelow("420", 100);
  ASSERT_FALSE(out_of_range);
  ASSERT_EQ(out_of_range.error(), Error::OutOfRange("row", 420, 100));
}

TEST(ResultTest, Compare) {
  ASSERT_EQ(Result<int>(42), Result<int>(42));
  ASSERT_NE(Result<int>(42), Result<int>(Error::General("failed")));

  Result<void> ok = {};
  ASSERT_EQ(ok, Result<void>());
  ASSERT_NE(ok, Result<void>(Error::KeyNotFound()));
}

TEST(ResultTest, ConstructFromCopiedError) {
  const auto error = Error::Unsupported("key lookup");
  Result<std::string> res(error);
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error(), error);
  ASSERT_EQ(res.value_or("fallback"), "fallback");
  ASSERT_EQ(Result<std::string>(std::string("jar")).value_or("fallback"), "jar");
}

TEST(ResultTest, MoveOnlyValue) {
  auto res = Result<std::unique_ptr<std::string>>(std::make_unique<std::string>("jar"));
  ASSERT_TRUE(res);
  auto value = std::move(res).value();
  ASSERT_EQ(*value, "jar");

  auto err = Result<std::unique_ptr<std::string>>(Error::KeyNotFound());
  ASSERT_FALSE(err);
  ASSERT_EQ(err.error().GetCategory(), Error::Category::kLookup);
}

} // namespace jarstore::test
