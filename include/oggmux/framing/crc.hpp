#pragma once

/** \file crc.hpp
 *  \brief Page checksum: CRC-32 with generator 0x04C11DB7, MSB-first.
 *
 * Parameters: polynomial 0x04C11DB7, not reflected, initial value 0, no final
 * XOR. This is NOT the zlib/Ethernet CRC-32 (which is reflected and inverted);
 * the two produce different values for the same input.
 * Thread-safety: functions are stateless and thread-safe.
 */

#include <cstdint>
#include <span>

namespace oggmux::framing {

constexpr std::uint32_t PAGE_CRC_POLY = 0x04C11DB7u;

/** Continue a running checksum over \p bytes. */
auto crc32_update(std::uint32_t crc, std::span<const std::uint8_t> bytes) -> std::uint32_t;

/** Checksum of \p bytes from the initial value 0. */
auto crc32(std::span<const std::uint8_t> bytes) -> std::uint32_t;

/** \brief Checksum of a page: header (checksum field bytes 22..25 read as zero) then body.
 *  \p header must be at least 26 bytes; the stored checksum field is ignored.
 */
auto page_checksum(std::span<const std::uint8_t> header, std::span<const std::uint8_t> body)
    -> std::uint32_t;

} // namespace oggmux::framing
