#include "utils/json.hpp"

#include "jarstore/base/error.hpp"
#include "jarstore/base/result.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace jarstore::utils {

namespace {

rapidjson::Value MakeKey(std::string_view key, rapidjson::Document::AllocatorType& allocator) {
  return rapidjson::Value(key.data(), static_cast<rapidjson::SizeType>(key.size()), allocator);
}

} // namespace

JsonObj& JsonObj::operator=(JsonObj&& other) noexcept {
  if (this != &other) {
    doc_.SetObject();
    doc_.Swap(other.doc_);
  }
  return *this;
}

std::string JsonObj::Serialize() const {
  rapidjson::StringBuffer buffer;
  rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
  doc_.Accept(writer);
  return std::string(buffer.GetString(), buffer.GetSize());
}

Result<void> JsonObj::Deserialize(std::string_view json) {
  doc_.Parse(json.data(), json.size());
  if (doc_.HasParseError()) {
    return Error::InvalidArgument(std::format("Failed to parse JSON at offset {}: {}",
                                              doc_.GetErrorOffset(),
                                              rapidjson::GetParseError_En(doc_.GetParseError())));
  }
  if (!doc_.IsObject()) {
    return Error::InvalidArgument("JSON document is not an object");
  }
  return {};
}

void JsonObj::AddBool(std::string_view key, bool value) {
  auto& allocator = doc_.GetAllocator();
  auto key_copy = MakeKey(key, allocator);
  auto value_copy = rapidjson::Value(value);
  doc_.AddMember(key_copy, value_copy, allocator);
}

void JsonObj::AddUint64(std::string_view key, uint64_t value) {
  auto& allocator = doc_.GetAllocator();
  auto key_copy = MakeKey(key, allocator);
  auto value_copy = rapidjson::Value(value);
  doc_.AddMember(key_copy, value_copy, allocator);
}

void JsonObj::AddInt64(std::string_view key, int64_t value) {
  auto& allocator = doc_.GetAllocator();
  auto key_copy = MakeKey(key, allocator);
  auto value_copy = rapidjson::Value(value);
  doc_.AddMember(key_copy, value_copy, allocator);
}

void JsonObj::AddDouble(std::string_view key, double value) {
  auto& allocator = doc_.GetAllocator();
  auto key_copy = MakeKey(key, allocator);
  auto value_copy = rapidjson::Value(value);
  doc_.AddMember(key_copy, value_copy, allocator);
}

void JsonObj::AddString(std::string_view key, std::string_view value) {
  auto& allocator = doc_.GetAllocator();
  auto value_copy =
      rapidjson::Value(value.data(), static_cast<rapidjson::SizeType>(value.size()), allocator);
  auto key_copy = MakeKey(key, allocator);
  doc_.AddMember(key_copy, value_copy, allocator);
}

void JsonObj::AddJsonObj(std::string_view key, const JsonObj& value) {
  auto& allocator = doc_.GetAllocator();
  auto value_copy = rapidjson::Value(value.doc_, allocator);
  auto key_copy = MakeKey(key, allocator);
  doc_.AddMember(key_copy, value_copy, allocator);
}

void JsonObj::AddJsonArray(std::string_view key, const JsonArray& value) {
  auto& allocator = doc_.GetAllocator();
  auto value_copy = rapidjson::Value(value.doc_, allocator);
  auto key_copy = MakeKey(key, allocator);
  doc_.AddMember(key_copy, value_copy, allocator);
}

const rapidjson::Value* JsonObj::GetJsonValue(std::string_view key) const {
  if (!doc_.IsObject()) {
    return nullptr;
  }
  auto it = doc_.FindMember(
      rapidjson::Value(rapidjson::StringRef(key.data(), static_cast<rapidjson::SizeType>(key.size()))));
  if (it == doc_.MemberEnd()) {
    return nullptr;
  }
  return &it->value;
}

std::optional<bool> JsonObj::GetBool(std::string_view key) const {
  const auto* value = GetJsonValue(key);
  if (value == nullptr || !value->IsBool()) {
    return {};
  }
  return value->GetBool();
}

std::optional<uint64_t> JsonObj::GetUint64(std::string_view key) const {
  const auto* value = GetJsonValue(key);
  if (value == nullptr || !value->IsUint64()) {
    return {};
  }
  return value->GetUint64();
}

std::optional<int64_t> JsonObj::GetInt64(std::string_view key) const {
  const auto* value = GetJsonValue(key);
  if (value == nullptr || !value->IsInt64()) {
    return {};
  }
  return value->GetInt64();
}

std::optional<double> JsonObj::GetDouble(std::string_view key) const {
  const auto* value = GetJsonValue(key);
  if (value == nullptr || !value->IsNumber()) {
    return {};
  }
  return value->GetDouble();
}

std::optional<std::string_view> JsonObj::GetString(std::string_view key) const {
  const auto* value = GetJsonValue(key);
  if (value == nullptr || !value->IsString()) {
    return {};
  }
  return std::string_view(value->GetString(), value->GetStringLength());
}

std::optional<JsonObj> JsonObj::GetJsonObj(std::string_view key) const {
  const auto* value = GetJsonValue(key);
  if (value == nullptr || !value->IsObject()) {
    return {};
  }
  JsonObj result;
  result.doc_.CopyFrom(*value, result.doc_.GetAllocator());
  return result;
}

std::optional<JsonArray> JsonObj::GetJsonArray(std::string_view key) const {
  const auto* value = GetJsonValue(key);
  if (value == nullptr || !value->IsArray()) {
    return {};
  }
  JsonArray result;
  result.doc_.CopyFrom(*value, result.doc_.GetAllocator());
  return result;
}

bool JsonObj::HasMember(std::string_view key) const {
  return GetJsonValue(key) != nullptr;
}

void JsonArray::AppendJsonObj(const JsonObj& value) {
  auto& allocator = doc_.GetAllocator();
  auto value_copy = rapidjson::Value(value.doc_, allocator);
  doc_.PushBack(value_copy, allocator);
}

std::optional<JsonObj> JsonArray::GetJsonObj(size_t index) const {
  if (!doc_.IsArray() || index >= doc_.Size()) {
    return {};
  }
  const auto& value = doc_[static_cast<rapidjson::SizeType>(index)];
  if (!value.IsObject()) {
    return {};
  }
  JsonObj result;
  result.doc_.CopyFrom(value, result.doc_.GetAllocator());
  return result;
}

} // namespace jarstore::utils
