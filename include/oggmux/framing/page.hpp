#pragma once

/** \file page.hpp
 *  \brief Page value type, serialization and validating parse (pure, in-memory).
 *
 * Wire layout (little-endian):
 *   0..3   capture pattern "OggS"
 *   4      structure version (0)
 *   5      flags: bit0 continued, bit1 beginning of stream, bit2 end of stream
 *   6..13  granule position (int64)
 *   14..17 serial number
 *   18..21 page sequence number
 *   22..25 checksum (see crc.hpp), computed with this field zeroed
 *   26     segment count N
 *   27..   N lacing values, then the body (sum of lacing values bytes)
 *
 * Thread-safety: functions are stateless and thread-safe.
 * Errors: returned via std::expected with oggmux::core::error.
 */

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "oggmux/error.hpp"
#include "oggmux/framing/bytes.hpp"

namespace oggmux::framing {

constexpr std::array<std::uint8_t, 4> CAPTURE_PATTERN{'O', 'g', 'g', 'S'};
constexpr std::size_t PAGE_HEADER_SIZE = 27;  // fixed part, before the lacing table
constexpr std::size_t MAX_PAGE_SIZE = PAGE_HEADER_SIZE + MAX_SEGMENTS + MAX_BODY_SIZE;

constexpr std::uint8_t FLAG_CONTINUED = 0x01;
constexpr std::uint8_t FLAG_BOS = 0x02;
constexpr std::uint8_t FLAG_EOS = 0x04;

constexpr std::int64_t GRANULE_UNSET = -1;

/** \brief One page. Owns its lacing table and body. */
struct Page {
  std::uint8_t version{0};
  std::uint8_t flags{0};
  std::int64_t granule_position{GRANULE_UNSET};
  std::int32_t serial_number{0};
  std::uint32_t sequence_number{0};
  std::uint32_t checksum{0};          /**< as parsed, or as stored by seal_page/serialize */
  std::vector<std::uint8_t> lacing;   /**< at most MAX_SEGMENTS entries */
  std::vector<std::uint8_t> body;     /**< lacing_body_size(lacing) bytes */

  bool continued() const noexcept { return (flags & FLAG_CONTINUED) != 0; }
  bool bos() const noexcept { return (flags & FLAG_BOS) != 0; }
  bool eos() const noexcept { return (flags & FLAG_EOS) != 0; }

  std::size_t segment_count() const noexcept { return lacing.size(); }
  std::size_t header_size() const noexcept { return PAGE_HEADER_SIZE + lacing.size(); }
  std::size_t total_size() const noexcept { return header_size() + body.size(); }

  /** Packets that complete on this page (lacing values below 255). */
  std::size_t packet_count() const { return count_completed_packets(lacing); }

  bool operator==(const Page&) const = default;
};

/** \brief Result of a successful parse. */
struct ParsedPage {
  Page page;
  std::size_t consumed{};  /**< header_size() + body size */
};

/** \brief Serialize a page, computing the checksum.
 *  Errors: invalid_argument when the page violates a structural invariant
 *  (version != 0, more than 255 lacing values, body size != lacing sum).
 */
auto serialize_page(const Page& page) -> std::expected<std::vector<std::uint8_t>, core::error>;

/** \brief Recompute page.checksum from the current header fields and body. */
auto seal_page(Page& page) -> std::expected<void, core::error>;

/** \brief Parse and validate one page starting at \p offset.
 *
 * Error codes:
 * - need_more_data: every byte present so far is consistent with a page
 * - malformed: capture pattern or version mismatch
 * - data_integrity: checksum mismatch
 * - invalid_argument: offset beyond the buffer
 */
auto parse_page(std::span<const std::uint8_t> bytes, std::size_t offset = 0)
    -> std::expected<ParsedPage, core::error>;

} // namespace oggmux::framing
