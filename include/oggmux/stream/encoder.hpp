#pragma once

/** \file encoder.hpp
 *  \brief Per-stream packet-to-page segmentation (encode path).
 *
 * Notes
 * - Not thread-safe; one encoder per logical stream.
 * - add_packet copies the payload; pages returned are independent values.
 * - Output is deterministic: the same packets and the same sequence of
 *   page_out/flush calls produce identical pages.
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <optional>
#include <span>
#include <vector>

#include "oggmux/error.hpp"
#include "oggmux/framing/page.hpp"
#include "oggmux/stream/packet.hpp"

namespace oggmux::stream {

/** Default body size a page should reach before page_out() emits it. */
constexpr std::size_t DEFAULT_PAGE_FILL = 4096;

struct EncoderOptions {
  std::optional<std::int32_t> serial;      /**< explicit serial number */
  SerialSource serial_source;              /**< used when serial is unset; default_serial_source() if empty */
  std::optional<std::size_t> fill_bytes;   /**< page_out threshold in [1, 65025]; else OGGMUX_PAGE_FILL or 4096 */
  bool verbose{false};                     /**< log page emission to std::cerr (also OGGMUX_DEBUG) */
};

class StreamEncoder {
public:
  /** Closed encoder; every operation fails with stream_not_open. */
  StreamEncoder() = default;

  StreamEncoder(StreamEncoder&&) noexcept = default;
  StreamEncoder& operator=(StreamEncoder&&) noexcept = default;
  StreamEncoder(const StreamEncoder&) = delete;
  StreamEncoder& operator=(const StreamEncoder&) = delete;

  static auto open(const EncoderOptions& opts = {})
      -> std::expected<StreamEncoder, core::error>;

  /** Queue one packet; returns its packet sequence number.
   *  Fails with stream_not_open when closed or once EOS has been queued. */
  auto add_packet(std::span<const std::uint8_t> data,
                  std::int64_t granule_position = framing::GRANULE_UNSET,
                  bool eos = false) -> std::expected<std::int64_t, core::error>;

  /** Packet overload; uses data, granule_position and eos. */
  auto add_packet(const Packet& packet) -> std::expected<std::int64_t, core::error>;

  /** Mark the end of stream without a packet. The next flush carries EOS,
   *  as an empty page if nothing else is pending. */
  auto end_stream() -> std::expected<void, core::error>;

  /** Emit a page if enough data is pending (see DEFAULT_PAGE_FILL). */
  auto page_out() -> std::expected<std::optional<framing::Page>, core::error>;

  /** page_out() with an explicit fill threshold for this call. */
  auto page_out_fill(std::size_t nfill) -> std::expected<std::optional<framing::Page>, core::error>;

  /** Emit pending data regardless of fill; one page per call. */
  auto flush() -> std::expected<std::optional<framing::Page>, core::error>;

  /** flush() that still cuts pages at the first packet boundary past \p nfill. */
  auto flush_fill(std::size_t nfill) -> std::expected<std::optional<framing::Page>, core::error>;

  /** Drop pending data and restart page/packet counters and BOS/EOS state. */
  auto reset() -> std::expected<void, core::error>;

  /** reset() and switch to \p serial (stream chaining). */
  auto reset(std::int32_t serial) -> std::expected<void, core::error>;

  /** Release buffers and move to the closed state. */
  void close() noexcept;

  bool is_open() const noexcept { return state_ == StreamState::open; }
  /** An EOS page has been emitted. */
  bool is_end_of_stream() const noexcept { return eos_emitted_; }

  std::int32_t serial_number() const noexcept { return serial_; }
  std::uint32_t next_page_sequence() const noexcept { return page_seq_; }
  std::int64_t next_packet_sequence() const noexcept { return packet_seq_; }
  std::size_t fill_bytes() const noexcept { return fill_; }
  std::size_t pending_bytes() const noexcept { return body_.size() - body_returned_; }
  std::size_t pending_segments() const noexcept { return segments_.size(); }

private:
  struct Segment {
    std::uint8_t lacing;
    bool begins_packet;
    std::int64_t granule;  /**< packet granule on the terminal segment, else -1 */
  };

  auto check_open() const -> std::expected<void, core::error>;
  auto emit(bool force, std::size_t nfill) -> std::expected<std::optional<framing::Page>, core::error>;
  auto make_page(std::size_t vals, std::size_t body_len, std::int64_t granule)
      -> std::expected<framing::Page, core::error>;
  void clear_pending() noexcept;

  StreamState state_{StreamState::closed};
  bool verbose_{false};
  std::int32_t serial_{};
  std::size_t fill_{DEFAULT_PAGE_FILL};

  std::deque<Segment> segments_;
  std::vector<std::uint8_t> body_;
  std::size_t body_returned_{};

  std::uint32_t page_seq_{};
  std::int64_t packet_seq_{};
  bool bos_emitted_{false};
  bool eos_queued_{false};
  bool eos_emitted_{false};
};

} // namespace oggmux::stream
