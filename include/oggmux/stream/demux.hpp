#pragma once

/** \file demux.hpp
 *  \brief Routes pages of one physical stream to per-serial decoders.
 *
 * One SyncScanner is shared by every logical stream; a StreamDecoder is
 * created the first time a serial number is seen. A BOS page for a serial
 * whose decoder already reached EOS restarts that decoder (chained stream
 * reusing its serial).
 */

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <span>
#include <vector>

#include "oggmux/error.hpp"
#include "oggmux/framing/sync.hpp"
#include "oggmux/stream/decoder.hpp"

namespace oggmux::stream {

struct DemuxOptions {
  framing::SyncOptions sync{};
  DecoderOptions decoder{};
};

/** \brief What one poll() did. */
struct DemuxEvent {
  std::int32_t serial{};
  std::uint32_t page_sequence{};
  bool new_stream{false};   /**< a decoder was created or restarted for this page */
  bool bos{false};
  bool eos{false};
  PageInEvents page{};
};

class Demultiplexer {
public:
  explicit Demultiplexer(DemuxOptions opts = {});

  void feed(std::span<const std::uint8_t> bytes);

  /** Route the next buffered page; nullopt when more input is needed. */
  auto poll() -> std::expected<std::optional<DemuxEvent>, core::error>;

  /** Pop a packet of stream \p serial. Fails with wrong_serial for unknown streams. */
  auto packet_out(std::int32_t serial) -> std::expected<std::optional<Packet>, core::error>;

  /** Serial numbers seen so far, ascending. */
  auto serials() const -> std::vector<std::int32_t>;

  /** Decoder for \p serial, or nullptr. */
  auto decoder(std::int32_t serial) const -> const StreamDecoder*;

  /** All streams seen so far reached EOS. */
  bool all_ended() const noexcept;

  std::uint64_t bytes_skipped() const noexcept { return sync_.bytes_skipped(); }

private:
  DemuxOptions opts_{};
  framing::SyncScanner sync_;
  std::map<std::int32_t, StreamDecoder> decoders_;
};

} // namespace oggmux::stream
