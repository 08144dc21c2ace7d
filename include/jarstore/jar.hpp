#pragma once

#include "jarstore/base/byte_buffer.hpp"
#include "jarstore/base/result.hpp"
#include "jarstore/base/slice.hpp"
#include "jarstore/codec/codec.hpp"
#include "jarstore/filter/cuckoo_filter.hpp"
#include "jarstore/io/mmap_file.hpp"
#include "jarstore/jar_meta.hpp"
#include "jarstore/phf/perfect_hash.hpp"
#include "jarstore/succinct/elias_fano.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jarstore {

/// Outcome of a key lookup.
///
/// A candidate is NOT a proof of membership: the filter may report a key
/// that was never pushed, and the perfect hash then maps it to some row in
/// range. Jars do not store keys, so confirming a candidate against the
/// row's own key material is up to the caller, see Jar::FindByKey().
class KeyLookup {
public:
  static KeyLookup Absent() {
    return KeyLookup(false, 0);
  }

  static KeyLookup Candidate(uint64_t row) {
    return KeyLookup(true, row);
  }

  /// The key was definitely never pushed.
  bool IsAbsent() const {
    return !is_candidate_;
  }

  bool IsCandidate() const {
    return is_candidate_;
  }

  /// The candidate row, only meaningful if IsCandidate().
  uint64_t CandidateRow() const {
    return row_;
  }

  bool operator==(const KeyLookup& other) const = default;

private:
  KeyLookup(bool is_candidate, uint64_t row) : is_candidate_(is_candidate), row_(row) {
  }

  bool is_candidate_;
  uint64_t row_;
};

/// A sealed jar opened for reading.
///
/// Every structure is viewed in place through a read-only mapping, nothing
/// is copied at open time except the decoded meta. All const methods are
/// safe to call from any number of threads at the same time. Slices handed
/// out by the jar are valid as long as the jar is alive.
class Jar {
public:
  /// Opens and validates the jar at path. Fails with a format error if the
  /// file is not a complete jar of a supported version, and with a
  /// corruption error if a structure does not pass its checksum or
  /// consistency checks.
  static Result<std::unique_ptr<Jar>> Open(std::string_view path);

  /// Deletes the jar at path together with any temporary file a writer left.
  static Result<void> Remove(const std::string& path);

  ~Jar();

  Jar(const Jar&) = delete;
  Jar& operator=(const Jar&) = delete;

  uint64_t RowCount() const {
    return meta_.row_count_;
  }

  uint64_t ColumnCount() const {
    return meta_.columns_.size();
  }

  const JarMeta& Meta() const {
    return meta_;
  }

  const std::string& Path() const {
    return file_.Path();
  }

  Slice UserHeader() const {
    return user_header_;
  }

  /// Whether the jar supports key lookups.
  bool HasKeyIndex() const {
    return meta_.HasFilter() && meta_.HasPhf();
  }

  /// Returns the compressed block of a row, borrowed from the mapping. For
  /// kRaw columns this is the row itself.
  Result<Slice> GetRawRow(uint64_t column, uint64_t row) const;

  /// Returns a copy of the decompressed row.
  Result<ByteBuffer> GetRow(uint64_t column, uint64_t row) const;

  /// Decompresses the row into out, reusing its capacity.
  Result<void> GetRow(uint64_t column, uint64_t row, std::string* out) const;

  /// Returns the rows of the given columns, all columns when columns is empty.
  Result<std::vector<ByteBuffer>> GetRecord(uint64_t row,
                                            const std::vector<uint64_t>& columns = {}) const;

  /// Filter then perfect hash. Unsupported when the jar has no key index.
  Result<KeyLookup> LookupKey(Slice key) const;

  /// Like LookupKey(), but an absent key is a KeyNotFound error. The
  /// returned row is a candidate, it is exact only for pushed keys.
  Result<uint64_t> GetByKey(Slice key) const;

  /// Looks up key and confirms the candidate with verifier, which is called
  /// with the candidate row and returns whether the row belongs to key.
  /// Returns std::nullopt if the key is absent or the candidate is rejected.
  Result<std::optional<uint64_t>> FindByKey(
      Slice key, const std::function<bool(uint64_t row)>& verifier) const;

  /// Scans the whole jar: data checksums, offset monotonicity, and that
  /// every row decompresses to at most the recorded maximum row size.
  Result<void> Verify() const;

private:
  struct ColumnReader {
    Slice data_;
    succinct::OffsetIndex offsets_;
    std::unique_ptr<Codec> codec_;
  };

  explicit Jar(MmapFile file);

  Result<void> Load();

  Result<void> LoadColumns(uint64_t structure_offset, uint64_t structure_end);

  Result<void> LoadKeyIndex(uint64_t structure_offset, uint64_t structure_end);

  Result<void> VerifyColumn(uint64_t column) const;

  MmapFile file_;
  JarMeta meta_;
  std::vector<ColumnReader> columns_;
  CuckooFilter filter_;
  PerfectHash phf_;
  Slice user_header_;
};

} // namespace jarstore
