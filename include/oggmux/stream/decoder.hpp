#pragma once

/** \file decoder.hpp
 *  \brief Per-stream page-to-packet reassembly (decode path).
 *
 * Notes
 * - Not thread-safe; one decoder per logical stream. The caller routes pages
 *   by serial number (see Demultiplexer).
 * - Sequence gaps and continuation mismatches are recoverable: they are
 *   reported in PageInEvents and counted in stats(), partial packet state is
 *   dropped and decoding continues at the next packet boundary.
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <optional>
#include <vector>

#include "oggmux/error.hpp"
#include "oggmux/framing/page.hpp"
#include "oggmux/stream/packet.hpp"

namespace oggmux::stream {

struct DecoderOptions {
  bool verbose{false};  /**< log gaps and mismatches to std::cerr (also OGGMUX_DEBUG) */
};

/** \brief Recoverable anomalies observed while accepting one page. */
struct PageInEvents {
  bool sequence_gap{false};           /**< page sequence != previous + 1 */
  bool continuation_mismatch{false};  /**< continued flag disagrees with pending partial state */
  std::size_t packets_completed{};    /**< packets queued by this page */

  bool clean() const noexcept { return !sequence_gap && !continuation_mismatch; }
};

struct DecoderStats {
  std::uint64_t pages{};
  std::uint64_t packets{};
  std::uint64_t sequence_gaps{};
  std::uint64_t continuation_mismatches{};
  std::uint64_t bytes_dropped{};  /**< partial packet bytes discarded on anomalies */
};

class StreamDecoder {
public:
  /** Closed decoder; every operation fails with stream_not_open. */
  StreamDecoder() = default;

  StreamDecoder(StreamDecoder&&) noexcept = default;
  StreamDecoder& operator=(StreamDecoder&&) noexcept = default;
  StreamDecoder(const StreamDecoder&) = delete;
  StreamDecoder& operator=(const StreamDecoder&) = delete;

  static auto open(std::int32_t serial, const DecoderOptions& opts = {})
      -> std::expected<StreamDecoder, core::error>;

  /** Accept a page of this stream.
   *  Errors: stream_not_open, wrong_serial, unsupported (version != 0),
   *  invalid_argument (body size disagrees with the lacing table). */
  auto page_in(const framing::Page& page) -> std::expected<PageInEvents, core::error>;

  /** Pop the oldest completed packet. */
  auto packet_out() -> std::expected<std::optional<Packet>, core::error>;

  /** Copy of the oldest completed packet, left queued. */
  auto packet_peek() const -> std::expected<std::optional<Packet>, core::error>;

  /** Drop queued packets, partial data and sequencing state. */
  auto reset() -> std::expected<void, core::error>;

  /** reset() and follow \p serial (stream chaining). */
  auto reset(std::int32_t serial) -> std::expected<void, core::error>;

  void close() noexcept;

  bool is_open() const noexcept { return state_ == StreamState::open; }
  /** An EOS page has been accepted. */
  bool is_end_of_stream() const noexcept { return eos_seen_; }

  std::int32_t serial_number() const noexcept { return serial_; }
  std::size_t packets_ready() const noexcept { return ready_.size(); }
  /** Bytes of a packet still waiting for its continuation. */
  std::size_t partial_bytes() const noexcept { return partial_.size(); }
  std::int64_t next_packet_sequence() const noexcept { return packet_seq_; }
  const DecoderStats& stats() const noexcept { return stats_; }

private:
  auto check_open() const -> std::expected<void, core::error>;
  void drop_partial() noexcept;
  void clear_state() noexcept;

  StreamState state_{StreamState::closed};
  bool verbose_{false};
  std::int32_t serial_{};

  std::optional<std::uint32_t> last_page_seq_;
  std::int64_t packet_seq_{};
  std::vector<std::uint8_t> partial_;
  bool have_partial_{false};   /**< last segment seen was 255 */
  bool partial_bos_{false};    /**< partial packet started on a BOS page */
  std::deque<Packet> ready_;
  bool eos_seen_{false};
  DecoderStats stats_{};
};

} // namespace oggmux::stream
