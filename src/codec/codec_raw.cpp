#include "codec/codec_internal.hpp"
#include "jarstore/base/error.hpp"

#include <format>

namespace jarstore::codec {

namespace {

/// Stores rows verbatim. Blocks in a raw column are the rows themselves,
/// which lets readers hand out borrowed views straight from the mapping.
class RawCodec final : public Codec {
public:
  CodecType Type() const override {
    return CodecType::kRaw;
  }

protected:
  Result<void> DoCompress(Slice raw, std::string& out) const override {
    raw.AppendTo(out);
    return {};
  }

  Result<void> DoDecompress(Slice block, uint64_t max_raw_size, std::string& out) const override {
    if (block.size() > max_raw_size) {
      return Error::DecompressFailed(
          ToString(Type()), std::format("block of {} bytes exceeds max row size {}", block.size(),
                                        max_raw_size));
    }
    block.CopyTo(out);
    return {};
  }
};

} // namespace

std::unique_ptr<Codec> NewRawCodec() {
  return std::make_unique<RawCodec>();
}

} // namespace jarstore::codec
