#pragma once

#include "jarstore/base/portable.h"

#include <cstdint>

namespace jarstore {

/// "JARSTOR1" read as a little-endian uint64.
constexpr uint64_t kJarMagic = 0x31524F545352414AULL;

/// Bumped on every incompatible layout change.
constexpr uint16_t kJarFormatVersion = 1;

/// Structural sections start on 8-byte boundaries so they can be viewed in
/// place through the mapping.
constexpr uint64_t kJarSectionAlignment = 8;

enum JarFlags : uint16_t {
  kJarFlagHasFilter = 1 << 0,
  kJarFlagHasPhf = 1 << 1,
};

/// First bytes of every jar, followed by the column data blobs.
struct FileHeader {
  uint64_t magic_;
  uint16_t version_;
  uint16_t flags_;
  uint32_t reserved_;
} PACKED;

/// Last bytes of every jar, written after everything else has been written.
/// A file without a valid footer is an incomplete jar.
struct Footer {
  uint64_t meta_offset_;
  uint64_t meta_size_;

  /// Start of the structural sections. structure_crc_ covers
  /// [structure_offset_, footer start).
  uint64_t structure_offset_;

  /// Size of the whole file including the footer.
  uint64_t file_size_;

  uint32_t structure_crc_;
  uint16_t version_;
  uint16_t flags_;
  uint64_t magic_;
} PACKED;

static_assert(sizeof(FileHeader) == 16);
static_assert(sizeof(Footer) == 48);

inline uint64_t AlignUp(uint64_t value, uint64_t alignment) {
  return (value + alignment - 1) / alignment * alignment;
}

} // namespace jarstore
