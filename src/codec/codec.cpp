#include "codec/codec_internal.hpp"
#include "jarstore/base/error.hpp"
#include "jarstore/codec/codec.hpp"

#include <format>

namespace jarstore {

const char* ToString(CodecType type) {
  switch (type) {
  case CodecType::kRaw:
    return "raw";
  case CodecType::kZstd:
    return "zstd";
  case CodecType::kLz4:
    return "lz4";
  }
  return "unknown";
}

std::optional<CodecType> CodecTypeFromString(std::string_view name) {
  if (name == "raw") {
    return CodecType::kRaw;
  }
  if (name == "zstd") {
    return CodecType::kZstd;
  }
  if (name == "lz4") {
    return CodecType::kLz4;
  }
  return std::nullopt;
}

Result<std::unique_ptr<Codec>> NewCodec(const CodecOptions& options) {
  if (options.type_ != CodecType::kZstd && !options.dictionary_.empty()) {
    return Error::InvalidArgument(
        std::format("codec {} does not support dictionaries", ToString(options.type_)));
  }

  switch (options.type_) {
  case CodecType::kRaw:
    return codec::NewRawCodec();
  case CodecType::kZstd:
    return codec::NewZstdCodec(options.level_, options.dictionary_);
  case CodecType::kLz4:
    return codec::NewLz4Codec();
  }
  return Error::InvalidArgument(
      std::format("unknown codec id {}", static_cast<uint32_t>(options.type_)));
}

} // namespace jarstore
