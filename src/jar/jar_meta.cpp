#include "jarstore/jar_meta.hpp"

#include "jarstore/base/error.hpp"
#include "utils/json.hpp"

#include <format>
#include <optional>

namespace jarstore {

namespace {

constexpr auto kKeyVersion = "version";
constexpr auto kKeyRowCount = "row_count";
constexpr auto kKeyColumns = "columns";
constexpr auto kKeyCodec = "codec";
constexpr auto kKeyLevel = "level";
constexpr auto kKeyData = "data";
constexpr auto kKeyOffsets = "offsets";
constexpr auto kKeyDictionary = "dictionary";
constexpr auto kKeyRawBytes = "raw_bytes";
constexpr auto kKeyMaxRowSize = "max_row_size";
constexpr auto kKeyDataCrc = "data_crc";
constexpr auto kKeyFilter = "filter";
constexpr auto kKeyPhf = "phf";
constexpr auto kKeyUserHeader = "user_header";
constexpr auto kKeyOffset = "offset";
constexpr auto kKeySize = "size";

utils::JsonObj RangeToJson(const SectionRange& range) {
  utils::JsonObj json;
  json.AddUint64(kKeyOffset, range.offset_);
  json.AddUint64(kKeySize, range.size_);
  return json;
}

std::optional<SectionRange> RangeFromJson(const utils::JsonObj& parent, std::string_view key) {
  auto json = parent.GetJsonObj(key);
  if (!json) {
    return std::nullopt;
  }
  auto offset = json->GetUint64(kKeyOffset);
  auto size = json->GetUint64(kKeySize);
  if (!offset || !size || *offset + *size < *offset) {
    return std::nullopt;
  }
  return SectionRange{*offset, *size};
}

} // namespace

std::string JarMeta::ToJson() const {
  utils::JsonArray columns_json;
  for (const auto& column : columns_) {
    utils::JsonObj column_json;
    column_json.AddUint64(kKeyCodec, static_cast<uint64_t>(column.codec_));
    column_json.AddInt64(kKeyLevel, column.level_);
    column_json.AddJsonObj(kKeyData, RangeToJson(column.data_));
    column_json.AddJsonObj(kKeyOffsets, RangeToJson(column.offsets_));
    column_json.AddJsonObj(kKeyDictionary, RangeToJson(column.dictionary_));
    column_json.AddUint64(kKeyRawBytes, column.raw_bytes_);
    column_json.AddUint64(kKeyMaxRowSize, column.max_row_size_);
    column_json.AddUint64(kKeyDataCrc, column.data_crc_);
    columns_json.AppendJsonObj(column_json);
  }

  utils::JsonObj json;
  json.AddUint64(kKeyVersion, version_);
  json.AddUint64(kKeyRowCount, row_count_);
  json.AddJsonArray(kKeyColumns, columns_json);
  json.AddJsonObj(kKeyFilter, RangeToJson(filter_));
  json.AddJsonObj(kKeyPhf, RangeToJson(phf_));
  json.AddJsonObj(kKeyUserHeader, RangeToJson(user_header_));
  return json.Serialize();
}

Result<JarMeta> JarMeta::FromJson(std::string_view json, const std::string& file) {
  utils::JsonObj json_obj;
  if (auto res = json_obj.Deserialize(json); !res) {
    return Error::InvalidMeta(file, res.error().Message());
  }

  JarMeta meta;
  auto version = json_obj.GetUint64(kKeyVersion);
  auto row_count = json_obj.GetUint64(kKeyRowCount);
  if (!version || !row_count) {
    return Error::InvalidMeta(file, "missing version or row_count");
  }
  meta.version_ = *version;
  meta.row_count_ = *row_count;

  auto filter = RangeFromJson(json_obj, kKeyFilter);
  auto phf = RangeFromJson(json_obj, kKeyPhf);
  auto user_header = RangeFromJson(json_obj, kKeyUserHeader);
  if (!filter || !phf || !user_header) {
    return Error::InvalidMeta(file, "missing filter, phf or user_header range");
  }
  meta.filter_ = *filter;
  meta.phf_ = *phf;
  meta.user_header_ = *user_header;

  auto columns_json = json_obj.GetJsonArray(kKeyColumns);
  if (!columns_json || columns_json->Size() == 0) {
    return Error::InvalidMeta(file, "missing columns");
  }
  for (size_t i = 0; i < columns_json->Size(); ++i) {
    auto column_json = columns_json->GetJsonObj(i);
    if (!column_json) {
      return Error::InvalidMeta(file, std::format("column {} is not an object", i));
    }

    ColumnMeta column;
    auto codec = column_json->GetUint64(kKeyCodec);
    auto level = column_json->GetInt64(kKeyLevel);
    auto data = RangeFromJson(*column_json, kKeyData);
    auto offsets = RangeFromJson(*column_json, kKeyOffsets);
    auto dictionary = RangeFromJson(*column_json, kKeyDictionary);
    auto raw_bytes = column_json->GetUint64(kKeyRawBytes);
    auto max_row_size = column_json->GetUint64(kKeyMaxRowSize);
    auto data_crc = column_json->GetUint64(kKeyDataCrc);
    if (!codec || !level || !data || !offsets || !dictionary || !raw_bytes || !max_row_size ||
        !data_crc) {
      return Error::InvalidMeta(file, std::format("column {} misses a member", i));
    }
    if (*codec > static_cast<uint64_t>(CodecType::kLz4)) {
      return Error::InvalidMeta(file, std::format("column {} has unknown codec {}", i, *codec));
    }
    column.codec_ = static_cast<CodecType>(*codec);
    column.level_ = static_cast<int>(*level);
    column.data_ = *data;
    column.offsets_ = *offsets;
    column.dictionary_ = *dictionary;
    column.raw_bytes_ = *raw_bytes;
    column.max_row_size_ = *max_row_size;
    column.data_crc_ = static_cast<uint32_t>(*data_crc);
    meta.columns_.push_back(column);
  }
  return meta;
}

} // namespace jarstore
