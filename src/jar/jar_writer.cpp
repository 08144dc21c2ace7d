#include "jarstore/jar_writer.hpp"

#include "jar/jar_format.hpp"
#include "jarstore/base/error.hpp"
#include "jarstore/base/log.hpp"
#include "jarstore/codec/codec.hpp"
#include "jarstore/config/jar_paths.hpp"
#include "jarstore/filter/cuckoo_filter.hpp"
#include "jarstore/io/file_writer.hpp"
#include "jarstore/jar_meta.hpp"
#include "jarstore/phf/perfect_hash.hpp"
#include "jarstore/succinct/elias_fano.hpp"
#include "utils/crc32.hpp"
#include "utils/parallelize.hpp"
#include "utils/phase_timer.hpp"

#include <algorithm>
#include <cstring>
#include <format>
#include <utility>

namespace jarstore {

namespace {

/// Fewer samples than this are not worth training a dictionary on.
constexpr uint64_t kMinDictSamples = 8;

/// Rows compressed per parallel round, bounds the memory of pending blocks.
constexpr uint64_t kRowsPerBatch = 64 << 10;

constexpr char kZeros[kJarSectionAlignment] = {};

/// Pads structure to the section alignment, appends bytes and returns their
/// absolute range. base is the file offset of structure[0].
SectionRange AppendSection(std::string& structure, uint64_t base, Slice bytes) {
  if (bytes.empty()) {
    return {};
  }
  structure.append(AlignUp(structure.size(), kJarSectionAlignment) - structure.size(), '\0');
  SectionRange range{base + structure.size(), bytes.size()};
  bytes.AppendTo(structure);
  return range;
}

/// Everything that is built for a column before its rows are compressed.
struct ColumnPlan {
  std::unique_ptr<Codec> codec_;
  std::string dictionary_;
};

} // namespace

const char* ToString(JarWriter::State state) {
  switch (state) {
  case JarWriter::State::kOpen:
    return "open";
  case JarWriter::State::kSealing:
    return "sealing";
  case JarWriter::State::kSealed:
    return "sealed";
  case JarWriter::State::kFailed:
    return "failed";
  }
  return "unknown";
}

Result<std::unique_ptr<JarWriter>> JarWriter::Create(std::string jar_path, JarOptions options) {
  if (jar_path.empty()) {
    return Error::InvalidArgument("Jar path is empty");
  }
  if (auto res = options.Validate(); !res) {
    return std::move(res.error());
  }
  return std::unique_ptr<JarWriter>(new JarWriter(std::move(jar_path), std::move(options)));
}

JarWriter::JarWriter(std::string jar_path, JarOptions options)
    : jar_path_(std::move(jar_path)),
      options_(std::move(options)),
      columns_(options_.NumColumns()) {
}

JarWriter::~JarWriter() = default;

Result<void> JarWriter::CheckOpen() const {
  if (state_ != State::kOpen) {
    return Error::WriterState(ToString(state_));
  }
  return {};
}

Result<void> JarWriter::PushRow(uint64_t column, Slice row) {
  if (auto res = CheckOpen(); !res) {
    return std::move(res.error());
  }
  if (column >= columns_.size()) {
    return Error::OutOfRange("column", column, columns_.size());
  }
  auto& staged = columns_[column];
  row.AppendTo(staged.bytes_);
  staged.row_ends_.push_back(staged.bytes_.size());
  return {};
}

Result<void> JarWriter::PushRecord(const std::vector<Slice>& rows) {
  if (auto res = CheckOpen(); !res) {
    return std::move(res.error());
  }
  if (rows.size() != columns_.size()) {
    return Error::InvalidArgument(
        std::format("Record has {} rows, jar has {} columns", rows.size(), columns_.size()));
  }
  for (uint64_t column = 0; column < rows.size(); ++column) {
    if (auto res = PushRow(column, rows[column]); !res) {
      return std::move(res.error());
    }
  }
  return {};
}

Result<void> JarWriter::PushKey(Slice key) {
  if (auto res = CheckOpen(); !res) {
    return std::move(res.error());
  }
  key.AppendTo(key_bytes_);
  key_ends_.push_back(key_bytes_.size());
  return {};
}

Result<void> JarWriter::SetUserHeader(Slice header) {
  if (auto res = CheckOpen(); !res) {
    return std::move(res.error());
  }
  header.CopyTo(user_header_);
  return {};
}

uint64_t JarWriter::NumRows(uint64_t column) const {
  if (column >= options_.NumColumns()) {
    return 0;
  }
  if (state_ == State::kSealed) {
    return sealed_rows_;
  }
  return columns_[column].row_ends_.size();
}

uint64_t JarWriter::NumKeys() const {
  return state_ == State::kSealed ? sealed_keys_ : key_ends_.size();
}

Result<void> JarWriter::CheckSchema() const {
  const uint64_t expected = columns_[0].row_ends_.size();
  for (uint64_t column = 1; column < columns_.size(); ++column) {
    const uint64_t rows = columns_[column].row_ends_.size();
    if (rows != expected) {
      return Error::SchemaMismatch(column, rows, expected);
    }
  }
  return {};
}

std::vector<Slice> JarWriter::StagedKeys() const {
  std::vector<Slice> keys;
  keys.reserve(key_ends_.size());
  uint64_t begin = 0;
  for (auto end : key_ends_) {
    keys.emplace_back(key_bytes_.data() + begin, end - begin);
    begin = end;
  }
  return keys;
}

Result<JarStats> JarWriter::Seal() {
  if (auto res = CheckOpen(); !res) {
    return std::move(res.error());
  }

  // Checked before the sealing starts so a mismatch never touches the disk.
  if (auto res = CheckSchema(); !res) {
    state_ = State::kFailed;
    Log::Error("Seal jar failed, path={}, error={}", jar_path_, res.error().ToString());
    return std::move(res.error());
  }

  state_ = State::kSealing;
  auto stats = DoSeal();
  if (!stats) {
    state_ = State::kFailed;
    Log::Error("Seal jar failed, path={}, error={}", jar_path_, stats.error().ToString());
    if (auto res = RemoveFileIfExists(JarPaths::TmpFilePath(jar_path_)); !res) {
      Log::Warn("Remove temporary jar failed, error={}", res.error().ToString());
    }
    return stats;
  }

  state_ = State::kSealed;
  sealed_rows_ = stats.value().rows_;
  sealed_keys_ = key_ends_.size();
  columns_.clear();
  columns_.shrink_to_fit();
  key_bytes_.clear();
  key_bytes_.shrink_to_fit();
  key_ends_.clear();
  key_ends_.shrink_to_fit();
  return stats;
}

namespace {

/// Trains the dictionary of a column. Falls back to no dictionary, with a
/// warning, when the rows do not allow to train one.
std::string TrainDictionary(uint64_t column, const std::vector<Slice>& rows,
                            const ColumnOptions& column_options, uint64_t max_sample_bytes) {
  uint64_t total_bytes = 0;
  for (const auto& row : rows) {
    total_bytes += row.size();
  }

  // Spread the samples over the whole column when it exceeds the budget.
  const uint64_t stride =
      total_bytes <= max_sample_bytes ? 1 : (total_bytes + max_sample_bytes - 1) / max_sample_bytes;
  std::vector<Slice> samples;
  uint64_t sample_bytes = 0;
  for (uint64_t i = 0; i < rows.size(); i += stride) {
    if (rows[i].empty()) {
      continue;
    }
    if (sample_bytes + rows[i].size() > max_sample_bytes) {
      break;
    }
    samples.push_back(rows[i]);
    sample_bytes += rows[i].size();
  }

  if (samples.size() < kMinDictSamples) {
    Log::Warn("Too few samples to train a dictionary, column={}, samples={}, min={}", column,
              samples.size(), kMinDictSamples);
    return {};
  }

  auto dictionary = TrainZstdDictionary(samples, column_options.max_dict_bytes_);
  if (!dictionary) {
    Log::Warn("Dictionary training failed, compressing without dictionary, column={}, error={}",
              column, dictionary.error().ToString());
    return {};
  }
  Log::Info("Dictionary trained, column={}, samples={}, sample_bytes={}, dict_bytes={}", column,
            samples.size(), sample_bytes, dictionary.value().size());
  return std::move(dictionary.value());
}

/// Compresses every row of a column, in row order, into writer. Records the
/// compressed length of every row in offsets.
Result<void> CompressColumn(const std::vector<Slice>& rows, const Codec& codec,
                            uint64_t num_threads, FileWriter& writer,
                            succinct::OffsetIndexBuilder& offsets, ColumnMeta& meta) {
  utils::Crc32Calculator crc;
  std::vector<std::string> chunks(num_threads);
  std::vector<std::vector<uint64_t>> lengths(num_threads);

  offsets.Reserve(rows.size());
  for (uint64_t batch_begin = 0; batch_begin < rows.size(); batch_begin += kRowsPerBatch) {
    const uint64_t batch_rows = std::min<uint64_t>(kRowsPerBatch, rows.size() - batch_begin);
    for (uint64_t t = 0; t < num_threads; ++t) {
      chunks[t].clear();
      lengths[t].clear();
    }

    // Range i goes to thread i, so chunks concatenated by thread id are in
    // row order.
    auto compressed = utils::Parallelize::Range(
        num_threads, batch_rows,
        [&](uint64_t thread_id, uint64_t begin, uint64_t end) -> Result<void> {
          auto& chunk = chunks[thread_id];
          for (uint64_t i = batch_begin + begin; i < batch_begin + end; ++i) {
            const uint64_t before = chunk.size();
            if (auto res = codec.Compress(rows[i], chunk); !res) {
              return res;
            }
            lengths[thread_id].push_back(chunk.size() - before);
          }
          return {};
        });
    if (!compressed) {
      return compressed;
    }

    for (uint64_t t = 0; t < num_threads; ++t) {
      if (auto res = writer.Append(chunks[t]); !res) {
        return std::move(res.error());
      }
      crc.Update(chunks[t]);
      for (auto length : lengths[t]) {
        offsets.Append(length);
      }
    }
  }

  for (const auto& row : rows) {
    meta.raw_bytes_ += row.size();
    meta.max_row_size_ = std::max<uint64_t>(meta.max_row_size_, row.size());
  }
  meta.data_crc_ = crc.Get();
  return {};
}

} // namespace

Result<JarStats> JarWriter::DoSeal() {
  const uint64_t num_rows = columns_[0].row_ends_.size();
  const uint64_t num_columns = columns_.size();
  const uint64_t num_keys = key_ends_.size();
  Log::Info("Seal jar started, path={}, rows={}, columns={}, keys={}", jar_path_, num_rows,
            num_columns, num_keys);
  JarStats stats;
  utils::PhaseTimer timer;

  // Key structures are built before any I/O, their failures leave no file.
  if (num_keys > 0 && num_keys != num_rows) {
    return Error::KeyCountMismatch(num_keys, num_rows);
  }
  if (num_keys > 0 && options_.with_filter_ && options_.filter_capacity_ != 0 &&
      options_.filter_capacity_ < num_keys) {
    return Error::FilterCapacityExceeded(options_.filter_capacity_, num_keys);
  }
  std::string filter_bytes;
  std::string phf_bytes;
  if (num_keys > 0 && (options_.with_filter_ || options_.with_phf_)) {
    auto keys = StagedKeys();
    if (options_.with_phf_) {
      PerfectHashOptions phf_options;
      phf_options.gamma_ = options_.phf_gamma_;
      if (auto res = PerfectHashBuilder::Build(keys, phf_options, phf_bytes); !res) {
        return std::move(res.error());
      }
    } else if (auto res = PerfectHashBuilder::CheckUnique(keys); !res) {
      return std::move(res.error());
    }

    if (options_.with_filter_) {
      const uint64_t capacity =
          options_.filter_capacity_ == 0 ? num_keys : options_.filter_capacity_;
      auto filter = CuckooFilterBuilder::New(capacity, options_.filter_fp_rate_);
      if (!filter) {
        return std::move(filter.error());
      }
      for (const auto& key : keys) {
        if (auto res = filter.value().Insert(key); !res) {
          return std::move(res.error());
        }
      }
      filter.value().Serialize(filter_bytes);
    }
  }

  timer.Lap("keys");

  // Dictionaries and codecs.
  std::vector<std::vector<Slice>> rows(num_columns);
  std::vector<ColumnPlan> plans(num_columns);
  for (uint64_t column = 0; column < num_columns; ++column) {
    const auto& staged = columns_[column];
    const auto& column_options = options_.columns_[column];
    rows[column].reserve(num_rows);
    for (uint64_t row = 0; row < num_rows; ++row) {
      rows[column].push_back(staged.Row(row));
    }

    auto& plan = plans[column];
    if (column_options.train_dictionary_) {
      plan.dictionary_ = TrainDictionary(column, rows[column], column_options,
                                         options_.max_dict_sample_bytes_);
    }
    CodecOptions codec_options;
    codec_options.type_ = column_options.codec_;
    codec_options.level_ = column_options.level_;
    codec_options.dictionary_ = plan.dictionary_;
    auto codec = NewCodec(codec_options);
    if (!codec) {
      return std::move(codec.error());
    }
    plan.codec_ = std::move(codec.value());
  }

  timer.Lap("dictionaries");

  // Header and column data.
  auto tmp_path = JarPaths::TmpFilePath(jar_path_);
  auto writer = FileWriter::New(tmp_path);
  if (!writer) {
    return std::move(writer.error());
  }
  auto& file = writer.value();

  const uint16_t flags = (filter_bytes.empty() ? 0 : kJarFlagHasFilter) |
                         (phf_bytes.empty() ? 0 : kJarFlagHasPhf);
  FileHeader header{kJarMagic, kJarFormatVersion, flags, 0};
  if (auto res = file.Append(Slice(reinterpret_cast<const uint8_t*>(&header), sizeof(header)));
      !res) {
    return std::move(res.error());
  }

  JarMeta meta;
  meta.version_ = kJarFormatVersion;
  meta.row_count_ = num_rows;
  meta.columns_.resize(num_columns);
  std::vector<succinct::OffsetIndexBuilder> offsets(num_columns);
  for (uint64_t column = 0; column < num_columns; ++column) {
    auto& column_meta = meta.columns_[column];
    column_meta.codec_ = options_.columns_[column].codec_;
    column_meta.level_ = options_.columns_[column].level_;
    column_meta.data_.offset_ = file.BytesWritten();
    if (auto res = CompressColumn(rows[column], *plans[column].codec_,
                                  options_.compression_threads_, file, offsets[column],
                                  column_meta);
        !res) {
      return std::move(res.error());
    }
    column_meta.data_.size_ = file.BytesWritten() - column_meta.data_.offset_;
    stats.raw_bytes_ += column_meta.raw_bytes_;
    stats.compressed_bytes_ += column_meta.data_.size_;
  }

  timer.Lap("columns");

  // Structural sections, all kept in memory to checksum them in one pass.
  const uint64_t structure_offset = AlignUp(file.BytesWritten(), kJarSectionAlignment);
  if (auto res = file.Append(Slice(kZeros, structure_offset - file.BytesWritten())); !res) {
    return std::move(res.error());
  }

  std::string structure;
  for (uint64_t column = 0; column < num_columns; ++column) {
    std::string serialized;
    offsets[column].Serialize(serialized);
    meta.columns_[column].offsets_ = AppendSection(structure, structure_offset, serialized);
    stats.offset_index_bytes_ += serialized.size();
  }
  for (uint64_t column = 0; column < num_columns; ++column) {
    meta.columns_[column].dictionary_ =
        AppendSection(structure, structure_offset, plans[column].dictionary_);
    stats.dictionary_bytes_ += plans[column].dictionary_.size();
  }
  meta.filter_ = AppendSection(structure, structure_offset, filter_bytes);
  meta.phf_ = AppendSection(structure, structure_offset, phf_bytes);
  meta.user_header_ = AppendSection(structure, structure_offset, user_header_);
  stats.filter_bytes_ = filter_bytes.size();
  stats.phf_bytes_ = phf_bytes.size();

  const std::string meta_json = meta.ToJson();
  const SectionRange meta_range = AppendSection(structure, structure_offset, meta_json);

  Footer footer;
  footer.meta_offset_ = meta_range.offset_;
  footer.meta_size_ = meta_range.size_;
  footer.structure_offset_ = structure_offset;
  footer.file_size_ = structure_offset + structure.size() + sizeof(Footer);
  footer.structure_crc_ = utils::Crc32(structure);
  footer.version_ = kJarFormatVersion;
  footer.flags_ = flags;
  footer.magic_ = kJarMagic;

  if (auto res = file.Append(structure); !res) {
    return std::move(res.error());
  }
  // Everything before the footer must be durable before the footer is.
  if (auto res = file.Sync(); !res) {
    return std::move(res.error());
  }
  if (auto res = file.Append(Slice(reinterpret_cast<const uint8_t*>(&footer), sizeof(footer)));
      !res) {
    return std::move(res.error());
  }
  if (auto res = file.Close(); !res) {
    return std::move(res.error());
  }
  if (auto res = RenameFile(tmp_path, JarPaths::DataFilePath(jar_path_)); !res) {
    return std::move(res.error());
  }

  timer.Lap("structure");

  stats.rows_ = num_rows;
  stats.columns_ = num_columns;
  stats.file_size_ = footer.file_size_;
  Log::Info("Seal jar finished, path={}, rows={}, raw_bytes={}, compressed_bytes={}, "
            "ratio={:.2f}, file_size={}, {}",
            jar_path_, stats.rows_, stats.raw_bytes_, stats.compressed_bytes_,
            stats.CompressionRatio(), stats.file_size_, timer.ToString());
  return stats;
}

} // namespace jarstore
