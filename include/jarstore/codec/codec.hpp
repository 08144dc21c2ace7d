#pragma once

#include "jarstore/base/result.hpp"
#include "jarstore/base/slice.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jarstore {

/// Codec ids persisted in the jar meta. Never renumber.
enum class CodecType : uint8_t {
  kRaw = 0,
  kZstd = 1,
  kLz4 = 2,
};

const char* ToString(CodecType type);
std::optional<CodecType> CodecTypeFromString(std::string_view name);

/// Per-row block compressor. Every row is compressed independently, so a
/// block can be decompressed knowing only its byte range.
///
/// An empty row is always encoded as an empty block and an empty block
/// always decodes to an empty row, whatever the codec. Codecs never produce
/// an empty block for a non-empty row.
class Codec {
public:
  virtual ~Codec() = default;

  virtual CodecType Type() const = 0;

  /// Appends the compressed block of raw to out.
  Result<void> Compress(Slice raw, std::string& out) const {
    if (raw.empty()) {
      return {};
    }
    return DoCompress(raw, out);
  }

  /// Replaces out with the decompressed row of block. Fails if the block is
  /// malformed, does not span exactly the given bytes, or would decompress to
  /// more than max_raw_size bytes.
  Result<void> Decompress(Slice block, uint64_t max_raw_size, std::string& out) const {
    out.clear();
    if (block.empty()) {
      return {};
    }
    return DoDecompress(block, max_raw_size, out);
  }

protected:
  virtual Result<void> DoCompress(Slice raw, std::string& out) const = 0;
  virtual Result<void> DoDecompress(Slice block, uint64_t max_raw_size,
                                    std::string& out) const = 0;
};

struct CodecOptions {
  CodecType type_ = CodecType::kZstd;

  /// Compression level, only meaningful for zstd.
  int level_ = 3;

  /// Trained dictionary, only meaningful for zstd. The codec keeps its own
  /// digested copy, the bytes do not need to outlive it.
  Slice dictionary_;
};

/// Creates a codec. Fails for unknown codec ids or for a dictionary given to
/// a codec that cannot use one.
Result<std::unique_ptr<Codec>> NewCodec(const CodecOptions& options);

/// Trains a zstd dictionary of at most max_dict_bytes from the sample rows.
Result<std::string> TrainZstdDictionary(const std::vector<Slice>& samples, size_t max_dict_bytes);

} // namespace jarstore
