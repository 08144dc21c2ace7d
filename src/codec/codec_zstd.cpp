#include "codec/codec_internal.hpp"
#include "jarstore/base/error.hpp"
#include "jarstore/base/log.hpp"

#include <zdict.h>
#include <zstd.h>

#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <vector>

namespace jarstore::codec {

namespace {

struct CCtxDeleter {
  void operator()(ZSTD_CCtx* ctx) const {
    ZSTD_freeCCtx(ctx);
  }
};

struct DCtxDeleter {
  void operator()(ZSTD_DCtx* ctx) const {
    ZSTD_freeDCtx(ctx);
  }
};

struct CDictDeleter {
  void operator()(ZSTD_CDict* dict) const {
    ZSTD_freeCDict(dict);
  }
};

struct DDictDeleter {
  void operator()(ZSTD_DDict* dict) const {
    ZSTD_freeDDict(dict);
  }
};

/// Contexts are reused per thread, zstd contexts are not thread safe but
/// digested dictionaries are.
ZSTD_CCtx* ThreadLocalCCtx() {
  thread_local std::unique_ptr<ZSTD_CCtx, CCtxDeleter> ctx(ZSTD_createCCtx());
  return ctx.get();
}

ZSTD_DCtx* ThreadLocalDCtx() {
  thread_local std::unique_ptr<ZSTD_DCtx, DCtxDeleter> ctx(ZSTD_createDCtx());
  return ctx.get();
}

class ZstdCodec final : public Codec {
public:
  ZstdCodec(int level, std::unique_ptr<ZSTD_CDict, CDictDeleter> cdict,
            std::unique_ptr<ZSTD_DDict, DDictDeleter> ddict)
      : level_(level),
        cdict_(std::move(cdict)),
        ddict_(std::move(ddict)) {
  }

  CodecType Type() const override {
    return CodecType::kZstd;
  }

protected:
  Result<void> DoCompress(Slice raw, std::string& out) const override {
    auto* cctx = ThreadLocalCCtx();
    if (cctx == nullptr) {
      return Error::CompressFailed(ToString(Type()), "ZSTD_createCCtx failed");
    }

    const size_t bound = ZSTD_compressBound(raw.size());
    const size_t base = out.size();
    out.resize(base + bound);

    // One-shot compression always records the frame content size, which the
    // decompressor relies on to size its output.
    size_t written = 0;
    if (cdict_ != nullptr) {
      written = ZSTD_compress_usingCDict(cctx, out.data() + base, bound, raw.data(), raw.size(),
                                         cdict_.get());
    } else {
      written = ZSTD_compressCCtx(cctx, out.data() + base, bound, raw.data(), raw.size(), level_);
    }
    if (ZSTD_isError(written)) {
      out.resize(base);
      return Error::CompressFailed(ToString(Type()), ZSTD_getErrorName(written));
    }
    out.resize(base + written);
    return {};
  }

  Result<void> DoDecompress(Slice block, uint64_t max_raw_size, std::string& out) const override {
    const size_t frame_size = ZSTD_findFrameCompressedSize(block.data(), block.size());
    if (ZSTD_isError(frame_size)) {
      return Error::DecompressFailed(ToString(Type()), ZSTD_getErrorName(frame_size));
    }
    if (frame_size != block.size()) {
      return Error::DecompressFailed(
          ToString(Type()),
          std::format("frame spans {} bytes, block spans {} bytes", frame_size, block.size()));
    }

    const auto content_size = ZSTD_getFrameContentSize(block.data(), block.size());
    if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
      return Error::DecompressFailed(ToString(Type()), "frame content size missing");
    }
    if (content_size == 0 || content_size > max_raw_size) {
      return Error::DecompressFailed(
          ToString(Type()),
          std::format("frame content size {} outside (0, {}]", content_size, max_raw_size));
    }

    auto* dctx = ThreadLocalDCtx();
    if (dctx == nullptr) {
      return Error::DecompressFailed(ToString(Type()), "ZSTD_createDCtx failed");
    }

    out.resize(content_size);
    size_t decoded = 0;
    if (ddict_ != nullptr) {
      decoded = ZSTD_decompress_usingDDict(dctx, out.data(), out.size(), block.data(),
                                           block.size(), ddict_.get());
    } else {
      decoded = ZSTD_decompressDCtx(dctx, out.data(), out.size(), block.data(), block.size());
    }
    if (ZSTD_isError(decoded)) {
      out.clear();
      return Error::DecompressFailed(ToString(Type()), ZSTD_getErrorName(decoded));
    }
    if (decoded != content_size) {
      out.clear();
      return Error::DecompressFailed(
          ToString(Type()), std::format("decoded {} bytes, expected {}", decoded, content_size));
    }
    return {};
  }

private:
  int level_;
  std::unique_ptr<ZSTD_CDict, CDictDeleter> cdict_;
  std::unique_ptr<ZSTD_DDict, DDictDeleter> ddict_;
};

} // namespace

Result<std::unique_ptr<Codec>> NewZstdCodec(int level, Slice dictionary) {
  if (level < ZSTD_minCLevel() || level > ZSTD_maxCLevel()) {
    return Error::InvalidArgument(std::format("zstd level {} outside [{}, {}]", level,
                                              ZSTD_minCLevel(), ZSTD_maxCLevel()));
  }

  std::unique_ptr<ZSTD_CDict, CDictDeleter> cdict;
  std::unique_ptr<ZSTD_DDict, DDictDeleter> ddict;
  if (!dictionary.empty()) {
    cdict.reset(ZSTD_createCDict(dictionary.data(), dictionary.size(), level));
    ddict.reset(ZSTD_createDDict(dictionary.data(), dictionary.size()));
    if (cdict == nullptr || ddict == nullptr) {
      return Error::InvalidArgument(
          std::format("zstd dictionary of {} bytes rejected", dictionary.size()));
    }
  }
  return std::unique_ptr<Codec>(
      std::make_unique<ZstdCodec>(level, std::move(cdict), std::move(ddict)));
}

} // namespace jarstore::codec

namespace jarstore {

Result<std::string> TrainZstdDictionary(const std::vector<Slice>& samples, size_t max_dict_bytes) {
  if (max_dict_bytes == 0) {
    return Error::InvalidArgument("dictionary size must be positive");
  }

  std::string sample_buffer;
  std::vector<size_t> sample_sizes;
  sample_sizes.reserve(samples.size());
  for (const auto& sample : samples) {
    if (sample.empty()) {
      continue;
    }
    sample.AppendTo(sample_buffer);
    sample_sizes.push_back(sample.size());
  }

  std::string dictionary(max_dict_bytes, '\0');
  const size_t dict_size =
      ZDICT_trainFromBuffer(dictionary.data(), dictionary.size(), sample_buffer.data(),
                            sample_sizes.data(), static_cast<unsigned>(sample_sizes.size()));
  if (ZDICT_isError(dict_size)) {
    return Error::DictionaryTraining(
        "-", std::format("{} (samples={}, bytes={})", ZDICT_getErrorName(dict_size),
                         sample_sizes.size(), sample_buffer.size()));
  }
  dictionary.resize(dict_size);
  Log::Debug("Trained zstd dictionary, samples={}, sample_bytes={}, dict_bytes={}",
             sample_sizes.size(), sample_buffer.size(), dict_size);
  return dictionary;
}

} // namespace jarstore
