#include "jarstore/succinct/elias_fano.hpp"

#include "jarstore/base/error.hpp"
#include "jarstore/succinct/packed_ints.hpp"

#include <format>

namespace jarstore::succinct {

namespace {

constexpr uint64_t kHeaderWords = 4;

uint32_t ChooseLowBits(uint64_t universe, uint64_t count) {
  if (count == 0 || universe <= count) {
    return 0;
  }
  // floor(log2(universe / count))
  return 63 - static_cast<uint32_t>(__builtin_clzll(universe / count));
}

void AppendWord(std::string& out, uint64_t word) {
  out.append(reinterpret_cast<const char*>(&word), sizeof(word));
}

} // namespace

void EliasFanoBuilder::Serialize(std::string& out) const {
  const uint64_t count = values_.size();
  const uint64_t universe = values_.empty() ? 0 : values_.back();
  const uint32_t low_bits = ChooseLowBits(universe, count);
  const uint64_t low_mask = low_bits == 0 ? 0 : ((1ULL << low_bits) - 1);

  std::vector<uint64_t> low(PackedWords(count, low_bits), 0);
  BitVectorBuilder high(count + (universe >> low_bits) + 1);
  for (uint64_t i = 0; i < count; ++i) {
    PackedWrite(low.data(), i, low_bits, values_[i] & low_mask);
    high.Set((values_[i] >> low_bits) + i);
  }

  AppendWord(out, count);
  AppendWord(out, universe);
  AppendWord(out, low_bits);
  AppendWord(out, low.size());
  out.append(reinterpret_cast<const char*>(low.data()), low.size() * sizeof(uint64_t));
  high.Serialize(out);
}

Result<EliasFano> EliasFano::Load(Slice data, uint64_t* consumed) {
  if (reinterpret_cast<uintptr_t>(data.data()) % alignof(uint64_t) != 0) {
    return Error::Corrupted("elias-fano", "-", "-", "unaligned buffer");
  }
  if (data.size() < kHeaderWords * sizeof(uint64_t)) {
    return Error::Corrupted("elias-fano", "-", "-", "truncated header");
  }

  const auto* header = reinterpret_cast<const uint64_t*>(data.data());
  EliasFano ef;
  ef.count_ = header[0];
  ef.universe_ = header[1];
  const uint64_t low_bits = header[2];
  const uint64_t num_low_words = header[3];
  if (low_bits != ChooseLowBits(ef.universe_, ef.count_) ||
      num_low_words != PackedWords(ef.count_, static_cast<uint32_t>(low_bits))) {
    return Error::Corrupted("elias-fano", "-", "-", "inconsistent header");
  }
  ef.low_bits_ = static_cast<uint32_t>(low_bits);

  const uint64_t prefix_bytes = (kHeaderWords + num_low_words) * sizeof(uint64_t);
  if (data.size() < prefix_bytes) {
    return Error::Corrupted("elias-fano", "-", "-",
                            std::format("needs {} bytes, got {}", prefix_bytes, data.size()));
  }
  ef.low_ = header + kHeaderWords;

  uint64_t high_bytes = 0;
  auto high = BitVector::Load(data.substr(prefix_bytes), &high_bytes);
  if (!high) {
    return std::move(high.error());
  }
  ef.high_ = std::move(high.value());
  if (ef.high_.NumOnes() != ef.count_ ||
      ef.high_.Size() != ef.count_ + (ef.universe_ >> ef.low_bits_) + 1) {
    return Error::Corrupted("elias-fano", "-", "-", "high bits disagree with header");
  }

  *consumed = prefix_bytes + high_bytes;
  return ef;
}

uint64_t EliasFano::PackedReadLow(uint64_t i) const {
  return PackedRead(low_, i, low_bits_);
}

Result<OffsetIndex> OffsetIndex::Load(Slice data, uint64_t num_rows, uint64_t data_size) {
  uint64_t consumed = 0;
  auto ef = EliasFano::Load(data, &consumed);
  if (!ef) {
    return std::move(ef.error());
  }

  OffsetIndex index;
  index.offsets_ = std::move(ef.value());
  if (index.offsets_.Size() != num_rows + 1) {
    return Error::Corrupted("offset index", "-", "-",
                            std::format("has {} entries, expected {}", index.offsets_.Size(),
                                        num_rows + 1));
  }
  if (index.offsets_.Get(0) != 0) {
    return Error::Corrupted("offset index", "-", 0, "first offset is not 0");
  }
  if (index.offsets_.Universe() != data_size ||
      index.offsets_.Get(num_rows) != data_size) {
    return Error::Corrupted("offset index", "-", num_rows,
                            std::format("last offset {} does not match data size {}",
                                        index.offsets_.Get(num_rows), data_size));
  }
  return index;
}

} // namespace jarstore::succinct
