#pragma once

/** \file bytes.hpp
 *  \brief Little-endian field access and lacing table arithmetic for page headers.
 *
 * Endianness: all multi-byte page fields are little-endian on every platform.
 * Thread-safety: functions are stateless and thread-safe.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace oggmux::framing {

/** Largest value of one lacing entry; also marks "packet continues". */
constexpr std::uint8_t LACING_CONTINUE = 255;
/** A page carries at most 255 lacing values. */
constexpr std::size_t MAX_SEGMENTS = 255;
/** Largest body one page can hold (255 segments of 255 bytes). */
constexpr std::size_t MAX_BODY_SIZE = MAX_SEGMENTS * LACING_CONTINUE;

inline auto load_le32(const std::uint8_t* p) -> std::uint32_t {
  return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}
inline auto load_le64(const std::uint8_t* p) -> std::uint64_t {
  return static_cast<std::uint64_t>(load_le32(p)) |
         (static_cast<std::uint64_t>(load_le32(p + 4)) << 32);
}

inline void store_le32(std::uint8_t* p, std::uint32_t v) {
  p[0] = static_cast<std::uint8_t>(v);
  p[1] = static_cast<std::uint8_t>(v >> 8);
  p[2] = static_cast<std::uint8_t>(v >> 16);
  p[3] = static_cast<std::uint8_t>(v >> 24);
}
inline void store_le64(std::uint8_t* p, std::uint64_t v) {
  store_le32(p, static_cast<std::uint32_t>(v));
  store_le32(p + 4, static_cast<std::uint32_t>(v >> 32));
}

/** \brief Append-only little-endian writer over an owned byte vector. */
class ByteWriter {
public:
  explicit ByteWriter(std::vector<std::uint8_t>& out) : out_(out) {}

  void put_u8(std::uint8_t v) { out_.push_back(v); }
  void put_le32(std::uint32_t v) {
    const auto at = grow(4);
    store_le32(out_.data() + at, v);
  }
  void put_le64(std::uint64_t v) {
    const auto at = grow(8);
    store_le64(out_.data() + at, v);
  }
  void put_bytes(std::span<const std::uint8_t> bytes) {
    out_.insert(out_.end(), bytes.begin(), bytes.end());
  }
  std::size_t size() const noexcept { return out_.size(); }

private:
  auto grow(std::size_t n) -> std::size_t {
    const auto at = out_.size();
    out_.resize(at + n);
    return at;
  }

  std::vector<std::uint8_t>& out_;
};

/** \brief Lacing values for one packet of \p packet_size bytes.
 *
 * Emits packet_size / 255 entries of 255 followed by one terminal entry of
 * packet_size % 255. The terminal entry is present even when it is 0, so a
 * packet of exactly 255*k bytes ends with a zero-length segment and an empty
 * packet is a single 0 entry.
 */
auto build_lacing(std::size_t packet_size) -> std::vector<std::uint8_t>;

/** Number of lacing entries build_lacing() produces for \p packet_size. */
constexpr auto lacing_count(std::size_t packet_size) noexcept -> std::size_t {
  return packet_size / LACING_CONTINUE + 1;
}

/** Sum of lacing values, i.e. the body size the table describes. */
auto lacing_body_size(std::span<const std::uint8_t> table) -> std::size_t;

/** Number of entries below 255: packets that terminate within the table. */
auto count_completed_packets(std::span<const std::uint8_t> table) -> std::size_t;

} // namespace oggmux::framing
