#pragma once

#include "jarstore/base/result.hpp"

#include <rapidjson/document.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace jarstore::utils {

class JsonArray;

/// Thin wrapper over a rapidjson document holding a JSON object. Used for
/// the jar meta section and for option files.
class JsonObj {
public:
  JsonObj() {
    doc_.SetObject();
  }

  ~JsonObj() = default;

  JsonObj(const JsonObj&) = delete;
  JsonObj& operator=(const JsonObj&) = delete;

  JsonObj(JsonObj&& other) noexcept {
    *this = std::move(other);
  }

  JsonObj& operator=(JsonObj&& other) noexcept;

  std::string Serialize() const;
  Result<void> Deserialize(std::string_view json);

  //----------------------------------------------------------------------------
  // Utils to add element to a JSON object
  //----------------------------------------------------------------------------

  void AddBool(std::string_view key, bool value);
  void AddUint64(std::string_view key, uint64_t value);
  void AddInt64(std::string_view key, int64_t value);
  void AddDouble(std::string_view key, double value);
  void AddString(std::string_view key, std::string_view value);
  void AddJsonObj(std::string_view key, const JsonObj& value);
  void AddJsonArray(std::string_view key, const JsonArray& value);

  //----------------------------------------------------------------------------
  // Utils to access element in a JSON object
  //----------------------------------------------------------------------------

  std::optional<bool> GetBool(std::string_view key) const;
  std::optional<uint64_t> GetUint64(std::string_view key) const;
  std::optional<int64_t> GetInt64(std::string_view key) const;
  std::optional<double> GetDouble(std::string_view key) const;
  std::optional<std::string_view> GetString(std::string_view key) const;
  std::optional<JsonObj> GetJsonObj(std::string_view key) const;
  std::optional<JsonArray> GetJsonArray(std::string_view key) const;
  bool HasMember(std::string_view key) const;

private:
  const rapidjson::Value* GetJsonValue(std::string_view key) const;

  rapidjson::Document doc_;

  friend class JsonArray;
};

class JsonArray {
public:
  JsonArray() {
    doc_.SetArray();
  }

  ~JsonArray() = default;

  JsonArray(const JsonArray&) = delete;
  JsonArray& operator=(const JsonArray&) = delete;

  JsonArray(JsonArray&& other) noexcept {
    *this = std::move(other);
  }

  JsonArray& operator=(JsonArray&& other) noexcept {
    if (this != &other) {
      doc_.SetArray();
      doc_.Swap(other.doc_);
    }
    return *this;
  }

  void AppendJsonObj(const JsonObj& value);

  size_t Size() const {
    return doc_.IsArray() ? doc_.Size() : 0;
  }

  std::optional<JsonObj> GetJsonObj(size_t index) const;

private:
  rapidjson::Document doc_;

  friend class JsonObj;
};

} // namespace jarstore::utils
