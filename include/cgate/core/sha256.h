#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cgate::core {

// Sha256 is an incremental FIPS 180-4 SHA-256 hasher.
// Feed data with update() in any number of pieces, then call hex_digest() once.
// Pure C++20, no external dependencies.
class Sha256 {
 public:
  Sha256() noexcept;

  void update(std::string_view data) noexcept;

  // Finalizes the hash and returns a 64-character lower-case hex digest.
  // The hasher must not be updated after this call.
  [[nodiscard]] std::string hex_digest();

 private:
  void compress(const std::uint8_t* block) noexcept;

  std::array<std::uint32_t, 8> state_{};
  std::array<std::uint8_t, 64> buffer_{};
  std::size_t buffered_{0};
  std::uint64_t total_bytes_{0};
};

// sha256_hex returns the SHA-256 digest of input as a lower-case hex string.
[[nodiscard]] std::string sha256_hex(std::string_view input);

}  // namespace cgate::core
