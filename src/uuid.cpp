/**
 * @file uuid.cpp
 * @brief Random job identifiers implementation
 */

#include "smart_cut/uuid.hpp"

#include <array>
#include <cstdint>
#include <random>

#include <fmt/core.h>

namespace smart_cut {

std::string generate_job_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::array<uint8_t, 16> id{};
  for (auto &b : id)
    b = static_cast<uint8_t>(rng());

  /// RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10)
      out += '-';
    out += fmt::format("{:02x}", id[i]);
  }
  return out;
}

} // namespace smart_cut
