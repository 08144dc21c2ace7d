#include "jarstore/jar.hpp"

#include "jar/jar_format.hpp"
#include "jarstore/base/error.hpp"
#include "jarstore/base/log.hpp"
#include "jarstore/config/jar_paths.hpp"
#include "jarstore/io/file_writer.hpp"
#include "utils/crc32.hpp"

#include <cstring>
#include <format>
#include <utility>

namespace jarstore {

namespace {

bool InBounds(const SectionRange& range, uint64_t begin, uint64_t end) {
  return range.offset_ >= begin && range.offset_ <= end && range.size_ <= end - range.offset_;
}

/// Structural sections are either empty or aligned and inside the structure.
bool IsValidStructural(const SectionRange& range, uint64_t begin, uint64_t end) {
  if (range.size_ == 0) {
    return true;
  }
  return range.offset_ % kJarSectionAlignment == 0 && InBounds(range, begin, end);
}

} // namespace

Result<std::unique_ptr<Jar>> Jar::Open(std::string_view path) {
  auto file = MmapFile::Open(path);
  if (!file) {
    return std::move(file.error());
  }

  std::unique_ptr<Jar> jar(new Jar(std::move(file.value())));
  if (auto res = jar->Load(); !res) {
    Log::Warn("Open jar failed, path={}, error={}", path, res.error().ToString());
    return std::move(res.error());
  }
  Log::Debug("Jar opened, path={}, rows={}, columns={}, filter={}, phf={}", path,
             jar->RowCount(), jar->ColumnCount(), jar->meta_.HasFilter(), jar->meta_.HasPhf());
  return jar;
}

Result<void> Jar::Remove(const std::string& path) {
  if (auto res = RemoveFileIfExists(JarPaths::TmpFilePath(path)); !res) {
    return res;
  }
  return RemoveFileIfExists(JarPaths::DataFilePath(path));
}

Jar::Jar(MmapFile file) : file_(std::move(file)) {
}

Jar::~Jar() = default;

Result<void> Jar::Load() {
  const std::string& path = file_.Path();
  const uint64_t file_size = file_.Size();
  if (file_size < sizeof(FileHeader) + sizeof(Footer)) {
    return Error::IncompleteJar(path, std::format("file has only {} bytes", file_size));
  }

  // The footer is written last, validate it before trusting anything else.
  const uint64_t footer_start = file_size - sizeof(Footer);
  Footer footer;
  std::memcpy(&footer, file_.Data().data() + footer_start, sizeof(Footer));
  if (footer.magic_ != kJarMagic) {
    return Error::IncompleteJar(path, "footer magic not found");
  }
  const uint64_t recorded_size = footer.file_size_;
  if (recorded_size != file_size) {
    return Error::IncompleteJar(
        path, std::format("footer records {} bytes, file has {}", recorded_size, file_size));
  }

  FileHeader header;
  std::memcpy(&header, file_.Data().data(), sizeof(FileHeader));
  if (header.magic_ != kJarMagic) {
    return Error::BadMagic(path, "header");
  }
  const uint16_t header_version = header.version_;
  const uint16_t footer_version = footer.version_;
  if (header_version != kJarFormatVersion) {
    return Error::UnsupportedVersion(path, header_version);
  }
  if (footer_version != kJarFormatVersion) {
    return Error::UnsupportedVersion(path, footer_version);
  }
  if (header.flags_ != footer.flags_) {
    return Error::InvalidMeta(path, "header and footer flags differ");
  }

  const uint64_t structure_offset = footer.structure_offset_;
  if (structure_offset < sizeof(FileHeader) || structure_offset > footer_start ||
      structure_offset % kJarSectionAlignment != 0) {
    return Error::InvalidMeta(path, std::format("bad structure offset {}", structure_offset));
  }
  const SectionRange meta_range{footer.meta_offset_, footer.meta_size_};
  if (meta_range.size_ == 0 || !IsValidStructural(meta_range, structure_offset, footer_start)) {
    return Error::InvalidMeta(
        path, std::format("bad meta range [{}, {})", meta_range.offset_, meta_range.End()));
  }

  auto structure = file_.Data().substr(structure_offset, footer_start - structure_offset);
  const uint32_t expected_crc = footer.structure_crc_;
  const uint32_t actual_crc = utils::Crc32(structure);
  if (actual_crc != expected_crc) {
    return Error::ChecksumMismatch("structure", expected_crc, actual_crc);
  }

  auto meta = JarMeta::FromJson(
      file_.Data().substr(meta_range.offset_, meta_range.size_).StringView(), path);
  if (!meta) {
    return std::move(meta.error());
  }
  meta_ = std::move(meta.value());
  if (meta_.version_ != kJarFormatVersion) {
    return Error::UnsupportedVersion(path, meta_.version_);
  }
  if (meta_.HasFilter() != ((footer.flags_ & kJarFlagHasFilter) != 0) ||
      meta_.HasPhf() != ((footer.flags_ & kJarFlagHasPhf) != 0)) {
    return Error::InvalidMeta(path, "meta disagrees with the footer flags");
  }

  if (auto res = LoadColumns(structure_offset, meta_range.offset_); !res) {
    return res;
  }
  if (auto res = LoadKeyIndex(structure_offset, meta_range.offset_); !res) {
    return res;
  }

  if (!IsValidStructural(meta_.user_header_, structure_offset, meta_range.offset_)) {
    return Error::InvalidMeta(path, "user header outside the structure");
  }
  user_header_ = file_.Data().substr(meta_.user_header_.offset_, meta_.user_header_.size_);
  return {};
}

Result<void> Jar::LoadColumns(uint64_t structure_offset, uint64_t structure_end) {
  const std::string& path = file_.Path();
  columns_.resize(meta_.columns_.size());
  for (uint64_t column = 0; column < meta_.columns_.size(); ++column) {
    const auto& column_meta = meta_.columns_[column];
    auto& reader = columns_[column];

    if (!InBounds(column_meta.data_, sizeof(FileHeader), structure_offset)) {
      return Error::InvalidMeta(path, std::format("data of column {} outside the data area", column));
    }
    if (column_meta.offsets_.size_ == 0 ||
        !IsValidStructural(column_meta.offsets_, structure_offset, structure_end) ||
        !IsValidStructural(column_meta.dictionary_, structure_offset, structure_end)) {
      return Error::InvalidMeta(
          path, std::format("offsets or dictionary of column {} outside the structure", column));
    }

    reader.data_ = file_.Data().substr(column_meta.data_.offset_, column_meta.data_.size_);
    auto offsets = succinct::OffsetIndex::Load(
        file_.Data().substr(column_meta.offsets_.offset_, column_meta.offsets_.size_),
        meta_.row_count_, column_meta.data_.size_);
    if (!offsets) {
      return Error::Corrupted("offset index", column, "-", offsets.error().Message());
    }
    reader.offsets_ = std::move(offsets.value());

    CodecOptions codec_options;
    codec_options.type_ = column_meta.codec_;
    codec_options.level_ = column_meta.level_;
    codec_options.dictionary_ =
        file_.Data().substr(column_meta.dictionary_.offset_, column_meta.dictionary_.size_);
    auto codec = NewCodec(codec_options);
    if (!codec) {
      return std::move(codec.error());
    }
    reader.codec_ = std::move(codec.value());
  }
  return {};
}

Result<void> Jar::LoadKeyIndex(uint64_t structure_offset, uint64_t structure_end) {
  const std::string& path = file_.Path();
  if (!IsValidStructural(meta_.filter_, structure_offset, structure_end) ||
      !IsValidStructural(meta_.phf_, structure_offset, structure_end)) {
    return Error::InvalidMeta(path, "filter or perfect hash outside the structure");
  }

  uint64_t consumed = 0;
  if (meta_.HasFilter()) {
    auto filter =
        CuckooFilter::Load(file_.Data().substr(meta_.filter_.offset_, meta_.filter_.size_),
                           &consumed);
    if (!filter) {
      return std::move(filter.error());
    }
    filter_ = std::move(filter.value());
    if (filter_.NumItems() != meta_.row_count_) {
      return Error::Corrupted("filter", "-", "-",
                              std::format("holds {} keys, jar has {} rows", filter_.NumItems(),
                                          meta_.row_count_));
    }
  }
  if (meta_.HasPhf()) {
    auto phf = PerfectHash::Load(file_.Data().substr(meta_.phf_.offset_, meta_.phf_.size_),
                                 &consumed);
    if (!phf) {
      return std::move(phf.error());
    }
    phf_ = std::move(phf.value());
    if (phf_.NumKeys() != meta_.row_count_) {
      return Error::Corrupted("phf", "-", "-",
                              std::format("holds {} keys, jar has {} rows", phf_.NumKeys(),
                                          meta_.row_count_));
    }
  }
  return {};
}

Result<Slice> Jar::GetRawRow(uint64_t column, uint64_t row) const {
  if (column >= ColumnCount()) {
    return Error::OutOfRange("column", column, ColumnCount());
  }
  if (row >= RowCount()) {
    return Error::OutOfRange("row", row, RowCount());
  }

  const auto& reader = columns_[column];
  auto [begin, end] = reader.offsets_.RowRange(row);
  if (begin > end || end > reader.data_.size()) {
    auto error = Error::Corrupted(
        "row", column, row,
        std::format("block [{}, {}) outside column data of {} bytes", begin, end,
                    reader.data_.size()));
    Log::Warn("Read row failed, path={}, error={}", Path(), error.ToString());
    return error;
  }
  return reader.data_.substr(begin, end - begin);
}

Result<void> Jar::GetRow(uint64_t column, uint64_t row, std::string* out) const {
  auto raw = GetRawRow(column, row);
  if (!raw) {
    return std::move(raw.error());
  }

  const auto& column_meta = meta_.columns_[column];
  if (auto res = columns_[column].codec_->Decompress(raw.value(), column_meta.max_row_size_, *out);
      !res) {
    auto error = Error::Corrupted("row", column, row, res.error().Message());
    Log::Warn("Read row failed, path={}, error={}", Path(), error.ToString());
    return error;
  }
  return {};
}

Result<ByteBuffer> Jar::GetRow(uint64_t column, uint64_t row) const {
  std::string bytes;
  if (auto res = GetRow(column, row, &bytes); !res) {
    return std::move(res.error());
  }
  return ByteBuffer(std::move(bytes));
}

Result<std::vector<ByteBuffer>> Jar::GetRecord(uint64_t row,
                                               const std::vector<uint64_t>& columns) const {
  std::vector<ByteBuffer> record;
  if (columns.empty()) {
    record.reserve(ColumnCount());
    for (uint64_t column = 0; column < ColumnCount(); ++column) {
      auto value = GetRow(column, row);
      if (!value) {
        return std::move(value.error());
      }
      record.push_back(std::move(value).value());
    }
    return record;
  }

  record.reserve(columns.size());
  for (auto column : columns) {
    auto value = GetRow(column, row);
    if (!value) {
      return std::move(value.error());
    }
    record.push_back(std::move(value).value());
  }
  return record;
}

Result<KeyLookup> Jar::LookupKey(Slice key) const {
  if (!HasKeyIndex()) {
    return Error::Unsupported("key lookup on a jar without filter and perfect hash");
  }
  if (RowCount() == 0 || !filter_.MightContain(key)) {
    return KeyLookup::Absent();
  }
  return KeyLookup::Candidate(phf_.Lookup(key));
}

Result<uint64_t> Jar::GetByKey(Slice key) const {
  auto lookup = LookupKey(key);
  if (!lookup) {
    return std::move(lookup.error());
  }
  if (lookup.value().IsAbsent()) {
    return Error::KeyNotFound();
  }
  return lookup.value().CandidateRow();
}

Result<std::optional<uint64_t>> Jar::FindByKey(
    Slice key, const std::function<bool(uint64_t row)>& verifier) const {
  auto lookup = LookupKey(key);
  if (!lookup) {
    return std::move(lookup.error());
  }
  if (lookup.value().IsAbsent()) {
    return std::optional<uint64_t>();
  }
  const uint64_t row = lookup.value().CandidateRow();
  if (!verifier(row)) {
    return std::optional<uint64_t>();
  }
  return std::optional<uint64_t>(row);
}

Result<void> Jar::Verify() const {
  for (uint64_t column = 0; column < ColumnCount(); ++column) {
    if (auto res = VerifyColumn(column); !res) {
      Log::Warn("Verify jar failed, path={}, error={}", Path(), res.error().ToString());
      return res;
    }
  }
  Log::Info("Jar verified, path={}, rows={}, columns={}", Path(), RowCount(), ColumnCount());
  return {};
}

Result<void> Jar::VerifyColumn(uint64_t column) const {
  const auto& reader = columns_[column];
  const auto& column_meta = meta_.columns_[column];

  const uint32_t actual_crc = utils::Crc32(reader.data_);
  if (actual_crc != column_meta.data_crc_) {
    return Error::ChecksumMismatch(std::format("column {} data", column), column_meta.data_crc_,
                                   actual_crc);
  }

  uint64_t prev = reader.offsets_.Offset(0);
  for (uint64_t i = 1; i <= RowCount(); ++i) {
    const uint64_t offset = reader.offsets_.Offset(i);
    if (offset < prev) {
      return Error::Corrupted("offset index", column, i,
                              std::format("offset {} after {}", offset, prev));
    }
    prev = offset;
  }
  if (prev != reader.data_.size()) {
    return Error::Corrupted("offset index", column, RowCount(),
                            std::format("last offset {} does not match data size {}", prev,
                                        reader.data_.size()));
  }

  std::string row_bytes;
  uint64_t raw_bytes = 0;
  for (uint64_t row = 0; row < RowCount(); ++row) {
    if (auto res = GetRow(column, row, &row_bytes); !res) {
      return res;
    }
    raw_bytes += row_bytes.size();
  }
  if (raw_bytes != column_meta.raw_bytes_) {
    return Error::Corrupted("column", column, "-",
                            std::format("rows hold {} bytes, meta records {}", raw_bytes,
                                        column_meta.raw_bytes_));
  }
  return {};
}

} // namespace jarstore
