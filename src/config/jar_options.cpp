#include "jarstore/config/jar_options.hpp"

#include "jarstore/base/error.hpp"
#include "jarstore/base/log.hpp"
#include "jarstore/filter/cuckoo_filter.hpp"
#include "utils/json.hpp"

#include <zstd.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <limits>

namespace jarstore {

namespace {

constexpr auto kKeyColumns = "columns";
constexpr auto kKeyCodec = "codec";
constexpr auto kKeyLevel = "level";
constexpr auto kKeyTrainDictionary = "train_dictionary";
constexpr auto kKeyMaxDictBytes = "max_dict_bytes";
constexpr auto kKeyMaxDictSampleBytes = "max_dict_sample_bytes";
constexpr auto kKeyCompressionThreads = "compression_threads";
constexpr auto kKeyWithFilter = "with_filter";
constexpr auto kKeyFilterCapacity = "filter_capacity";
constexpr auto kKeyFilterFpRate = "filter_fp_rate";
constexpr auto kKeyWithPhf = "with_phf";
constexpr auto kKeyPhfGamma = "phf_gamma";

/// Reads an optional member into target. A member of the wrong type is an
/// error, a missing member keeps the default.
template <typename T, typename Getter>
Result<void> ReadMember(const utils::JsonObj& obj, std::string_view key, Getter getter,
                        T& target) {
  if (!obj.HasMember(key)) {
    return {};
  }
  auto value = getter(obj, key);
  if (!value) {
    return Error::InvalidArgument(std::format("Option {} has an invalid type", key));
  }
  target = static_cast<T>(*value);
  return {};
}

auto GetBool = [](const utils::JsonObj& obj, std::string_view key) { return obj.GetBool(key); };
auto GetUint64 = [](const utils::JsonObj& obj, std::string_view key) {
  return obj.GetUint64(key);
};
auto GetDouble = [](const utils::JsonObj& obj, std::string_view key) {
  return obj.GetDouble(key);
};

Result<ColumnOptions> ColumnFromJson(const utils::JsonObj& obj, size_t column) {
  ColumnOptions options;
  if (obj.HasMember(kKeyCodec)) {
    auto name = obj.GetString(kKeyCodec);
    auto codec = name ? CodecTypeFromString(*name) : std::nullopt;
    if (!codec) {
      return Error::InvalidArgument(std::format("Unknown codec of column {}", column));
    }
    options.codec_ = *codec;
  }
  if (obj.HasMember(kKeyLevel)) {
    auto level = obj.GetInt64(kKeyLevel);
    if (!level) {
      return Error::InvalidArgument(std::format("Option {} has an invalid type", kKeyLevel));
    }
    if (*level < std::numeric_limits<int>::min() || *level > std::numeric_limits<int>::max()) {
      return Error::InvalidArgument(
          std::format("Column {} has level {} out of the int range", column, *level));
    }
    options.level_ = static_cast<int>(*level);
  }
  if (auto res = ReadMember(obj, kKeyTrainDictionary, GetBool, options.train_dictionary_); !res) {
    return std::move(res.error());
  }
  if (auto res = ReadMember(obj, kKeyMaxDictBytes, GetUint64, options.max_dict_bytes_); !res) {
    return std::move(res.error());
  }
  return options;
}

} // namespace

Result<void> JarOptions::Validate() const {
  if (columns_.empty()) {
    return Error::InvalidArgument("A jar needs at least one column");
  }
  for (size_t i = 0; i < columns_.size(); ++i) {
    const auto& column = columns_[i];
    if (column.codec_ == CodecType::kZstd &&
        (column.level_ < ZSTD_minCLevel() || column.level_ > ZSTD_maxCLevel())) {
      return Error::InvalidArgument(
          std::format("Column {} has zstd level {} out of range", i, column.level_));
    }
    if (column.train_dictionary_ && column.codec_ != CodecType::kZstd) {
      return Error::InvalidArgument(
          std::format("Column {} trains a dictionary but uses codec {}", i,
                      ToString(column.codec_)));
    }
    if (column.train_dictionary_ && column.max_dict_bytes_ == 0) {
      return Error::InvalidArgument(std::format("Column {} has an empty dictionary budget", i));
    }
  }
  if (compression_threads_ == 0) {
    return Error::InvalidArgument("compression_threads must be at least 1");
  }
  if (!(filter_fp_rate_ >= CuckooFilterBuilder::kMinFpRate && filter_fp_rate_ < 1.0)) {
    return Error::InvalidArgument(std::format("filter_fp_rate must be in [{}, 1), got {}",
                                              CuckooFilterBuilder::kMinFpRate, filter_fp_rate_));
  }
  // A candidate row is only handed out after the filter admits the key.
  if (with_phf_ && !with_filter_) {
    return Error::InvalidArgument("with_phf requires with_filter");
  }
  if (!(phf_gamma_ >= 1.0)) {
    return Error::InvalidArgument(std::format("phf_gamma must be >= 1, got {}", phf_gamma_));
  }
  return {};
}

std::string JarOptions::ToJson() const {
  utils::JsonArray columns_json;
  for (const auto& column : columns_) {
    utils::JsonObj column_json;
    column_json.AddString(kKeyCodec, ToString(column.codec_));
    column_json.AddInt64(kKeyLevel, column.level_);
    column_json.AddBool(kKeyTrainDictionary, column.train_dictionary_);
    column_json.AddUint64(kKeyMaxDictBytes, column.max_dict_bytes_);
    columns_json.AppendJsonObj(column_json);
  }

  utils::JsonObj json;
  json.AddJsonArray(kKeyColumns, columns_json);
  json.AddUint64(kKeyMaxDictSampleBytes, max_dict_sample_bytes_);
  json.AddUint64(kKeyCompressionThreads, compression_threads_);
  json.AddBool(kKeyWithFilter, with_filter_);
  json.AddUint64(kKeyFilterCapacity, filter_capacity_);
  json.AddDouble(kKeyFilterFpRate, filter_fp_rate_);
  json.AddBool(kKeyWithPhf, with_phf_);
  json.AddDouble(kKeyPhfGamma, phf_gamma_);
  return json.Serialize();
}

Result<JarOptions> JarOptions::FromJson(std::string_view json) {
  utils::JsonObj json_obj;
  if (auto res = json_obj.Deserialize(json); !res) {
    return std::move(res.error());
  }

  JarOptions options;
  auto columns_json = json_obj.GetJsonArray(kKeyColumns);
  if (!columns_json) {
    return Error::InvalidArgument("Options miss the columns array");
  }
  for (size_t i = 0; i < columns_json->Size(); ++i) {
    auto column_json = columns_json->GetJsonObj(i);
    if (!column_json) {
      return Error::InvalidArgument(std::format("Column {} is not an object", i));
    }
    auto column = ColumnFromJson(*column_json, i);
    if (!column) {
      return std::move(column.error());
    }
    options.columns_.push_back(column.value());
  }

  Result<void> res = ReadMember(json_obj, kKeyMaxDictSampleBytes, GetUint64,
                                options.max_dict_sample_bytes_);
  if (res) {
    res = ReadMember(json_obj, kKeyCompressionThreads, GetUint64, options.compression_threads_);
  }
  if (res) {
    res = ReadMember(json_obj, kKeyWithFilter, GetBool, options.with_filter_);
  }
  if (res) {
    res = ReadMember(json_obj, kKeyFilterCapacity, GetUint64, options.filter_capacity_);
  }
  if (res) {
    res = ReadMember(json_obj, kKeyFilterFpRate, GetDouble, options.filter_fp_rate_);
  }
  if (res) {
    res = ReadMember(json_obj, kKeyWithPhf, GetBool, options.with_phf_);
  }
  if (res) {
    res = ReadMember(json_obj, kKeyPhfGamma, GetDouble, options.phf_gamma_);
  }
  if (!res) {
    return std::move(res.error());
  }

  if (auto valid = options.Validate(); !valid) {
    return std::move(valid.error());
  }
  return options;
}

Result<JarOptions> JarOptions::LoadFromFile(const std::string& path) {
  std::ifstream options_file(path);
  if (!options_file.is_open()) {
    return Error::FileOpen(path, errno, strerror(errno));
  }
  std::string json((std::istreambuf_iterator<char>(options_file)),
                   std::istreambuf_iterator<char>());
  if (options_file.bad()) {
    return Error::FileRead(path, errno, strerror(errno));
  }
  Log::Info("Jar options loaded, file={}", path);
  return FromJson(json);
}

} // namespace jarstore
