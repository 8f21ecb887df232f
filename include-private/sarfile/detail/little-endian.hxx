#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sarfile::detail {
/**
 * @brief Append the low @p width bytes of @p value in little-endian order.
 */
inline void put_le(std::string &out, std::uint64_t value, std::size_t width) {
  for (std::size_t i = 0; i < width; ++i) {
    out.push_back(static_cast<char>(value & 0xff));
    value >>= 8;
  }
}

/**
 * @brief Read a @p width byte little-endian unsigned integer.
 */
inline std::uint64_t get_le(const char *p, std::size_t width) {
  auto bytes = reinterpret_cast<const unsigned char *>(p);
  std::uint64_t value = 0;
  for (std::size_t i = width; i > 0; --i)
    value = (value << 8) | bytes[i - 1];
  return value;
}
} // namespace sarfile::detail
