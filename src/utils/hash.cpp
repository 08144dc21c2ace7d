#include "utils/hash.hpp"

namespace jarstore::utils {

uint64_t KeyHash::Hash(Slice key, uint64_t seed) {
  // from http://en.wikipedia.org/wiki/Fowler_Noll_Vo_hash
  uint64_t hash_val = kFnvOffsetBasis64 ^ Remix(seed);
  for (auto octet : key) {
    hash_val = hash_val ^ octet;
    hash_val = hash_val * kFnvPrime64;
  }
  return Remix(hash_val ^ key.size());
}

} // namespace jarstore::utils
