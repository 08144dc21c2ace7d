#include "codec/codec_internal.hpp"
#include "jarstore/base/error.hpp"

#include <lz4.h>

#include <cstdint>
#include <cstring>
#include <format>

namespace jarstore::codec {

namespace {

/// LZ4 block format prefixed with the raw row length as a little-endian
/// uint32, LZ4 blocks do not record their decompressed size.
class Lz4Codec final : public Codec {
public:
  CodecType Type() const override {
    return CodecType::kLz4;
  }

protected:
  Result<void> DoCompress(Slice raw, std::string& out) const override {
    if (raw.size() > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
      return Error::CompressFailed(ToString(Type()),
                                   std::format("row of {} bytes too large", raw.size()));
    }

    const auto raw_size = static_cast<uint32_t>(raw.size());
    const int bound = LZ4_compressBound(static_cast<int>(raw_size));
    const size_t base = out.size();
    out.resize(base + kPrefixSize + static_cast<size_t>(bound));
    std::memcpy(out.data() + base, &raw_size, kPrefixSize);

    const int written =
        LZ4_compress_default(raw.CharData(), out.data() + base + kPrefixSize,
                             static_cast<int>(raw_size), bound);
    if (written <= 0) {
      out.resize(base);
      return Error::CompressFailed(ToString(Type()), "LZ4_compress_default returned 0");
    }
    out.resize(base + kPrefixSize + static_cast<size_t>(written));
    return {};
  }

  Result<void> DoDecompress(Slice block, uint64_t max_raw_size, std::string& out) const override {
    if (block.size() <= kPrefixSize) {
      return Error::DecompressFailed(ToString(Type()),
                                     std::format("block of {} bytes too short", block.size()));
    }

    uint32_t raw_size = 0;
    std::memcpy(&raw_size, block.data(), kPrefixSize);
    if (raw_size == 0 || raw_size > max_raw_size) {
      return Error::DecompressFailed(
          ToString(Type()),
          std::format("recorded row size {} outside (0, {}]", raw_size, max_raw_size));
    }

    out.resize(raw_size);
    const int decoded = LZ4_decompress_safe(block.CharData() + kPrefixSize, out.data(),
                                            static_cast<int>(block.size() - kPrefixSize),
                                            static_cast<int>(raw_size));
    if (decoded < 0 || static_cast<uint32_t>(decoded) != raw_size) {
      out.clear();
      return Error::DecompressFailed(
          ToString(Type()), std::format("decoded {} bytes, expected {}", decoded, raw_size));
    }
    return {};
  }

private:
  static constexpr size_t kPrefixSize = sizeof(uint32_t);
};

} // namespace

std::unique_ptr<Codec> NewLz4Codec() {
  return std::make_unique<Lz4Codec>();
}

} // namespace jarstore::codec
