#pragma once

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>

namespace jarstore::utils {

inline thread_local std::mt19937_64 tls_rand_generator{std::random_device{}()};

class RandomGenerator {
public:
  /// Get a random number between min inclusive and max exclusive, i.e. in the
  /// range [min, max)
  static uint64_t RandU64(uint64_t min, uint64_t max) {
    std::uniform_int_distribution<uint64_t> distribution(min, max - 1);
    return distribution(tls_rand_generator);
  }

  static uint64_t RandU64() {
    return tls_rand_generator();
  }

  static void Seed(uint64_t seed) {
    tls_rand_generator.seed(seed);
  }

  static std::string RandAlphString(size_t len) {
    static constexpr char kChars[] = "0123456789"
                                     "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                     "abcdefghijklmnopqrstuvwxyz";
    auto result = std::string(len, '\0');
    std::generate_n(begin(result), len,
                    [&]() { return kChars[RandU64(0, sizeof(kChars) - 1)]; });
    return result;
  }

  /// Arbitrary binary bytes, including zeros.
  static std::string RandBytes(size_t len) {
    auto result = std::string(len, '\0');
    std::generate_n(begin(result), len, [&]() { return static_cast<char>(RandU64(0, 256)); });
    return result;
  }
};

} // namespace jarstore::utils
