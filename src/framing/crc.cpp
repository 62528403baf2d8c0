#include "oggmux/framing/crc.hpp"

#include <array>

namespace oggmux::framing {

// Non-reflected (MSB-first) table for PAGE_CRC_POLY
static constexpr std::array<std::uint32_t, 256> PAGE_CRC_TABLE = []{
  std::array<std::uint32_t, 256> t{};
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i << 24;
    for (int k = 0; k < 8; ++k) {
      c = (c & 0x80000000u) ? ((c << 1) ^ PAGE_CRC_POLY) : (c << 1);
    }
    t[i] = c;
  }
  return t;
}();

static_assert(PAGE_CRC_TABLE[1] == PAGE_CRC_POLY);
static_assert(PAGE_CRC_TABLE[255] == 0xB1F740B4u);

// Offset and width of the checksum field inside a page header
static constexpr std::size_t CHECKSUM_OFFSET = 22;
static constexpr std::size_t CHECKSUM_WIDTH = 4;

auto crc32_update(std::uint32_t crc, std::span<const std::uint8_t> bytes) -> std::uint32_t {
  for (auto b : bytes) {
    crc = (crc << 8) ^ PAGE_CRC_TABLE[((crc >> 24) ^ b) & 0xFFu];
  }
  return crc;
}

auto crc32(std::span<const std::uint8_t> bytes) -> std::uint32_t {
  return crc32_update(0u, bytes);
}

auto page_checksum(std::span<const std::uint8_t> header, std::span<const std::uint8_t> body)
    -> std::uint32_t {
  static constexpr std::array<std::uint8_t, CHECKSUM_WIDTH> zeros{};
  std::uint32_t c = crc32_update(0u, header.first(CHECKSUM_OFFSET));
  c = crc32_update(c, zeros);
  c = crc32_update(c, header.subspan(CHECKSUM_OFFSET + CHECKSUM_WIDTH));
  return crc32_update(c, body);
}

} // namespace oggmux::framing
