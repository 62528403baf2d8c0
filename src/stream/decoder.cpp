#include "oggmux/stream/decoder.hpp"

#include <iostream>
#include <utility>

#include "oggmux/core/platform_utils.hpp"
#include "oggmux/framing/bytes.hpp"

namespace oggmux::stream {

using framing::LACING_CONTINUE;
using framing::Page;

auto StreamDecoder::open(std::int32_t serial, const DecoderOptions& opts)
    -> std::expected<StreamDecoder, core::error> {
  StreamDecoder dec;
  dec.verbose_ = core::debug_enabled(opts.verbose);
  dec.serial_ = serial;
  dec.state_ = StreamState::open;
  return dec;
}

auto StreamDecoder::check_open() const -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (state_ != StreamState::open) {
    return std::unexpected(error{error_code::stream_not_open, "decoder not open", "stream.decoder"});
  }
  return {};
}

auto StreamDecoder::page_in(const Page& page) -> std::expected<PageInEvents, core::error> {
  using core::error; using core::error_code;
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  if (page.serial_number != serial_) {
    return std::unexpected(error{error_code::wrong_serial, "page serial does not match stream", "stream.decoder"});
  }
  if (page.version != 0) {
    return std::unexpected(error{error_code::unsupported, "unsupported page version", "stream.decoder"});
  }
  if (page.lacing.size() > framing::MAX_SEGMENTS ||
      framing::lacing_body_size(page.lacing) != page.body.size()) {
    return std::unexpected(error{error_code::invalid_argument, "body size != lacing sum", "stream.decoder"});
  }

  PageInEvents ev{};
  if (last_page_seq_ && page.sequence_number != *last_page_seq_ + 1u) {
    ev.sequence_gap = true;
    stats_.sequence_gaps += 1;
    if (verbose_) {
      std::cerr << "[oggmux][decoder] serial=" << serial_ << " sequence gap: expected "
                << (*last_page_seq_ + 1u) << " got " << page.sequence_number << std::endl;
    }
    drop_partial();
    packet_seq_ += 1;  // leave a hole in packet numbering
  }
  last_page_seq_ = page.sequence_number;

  const std::size_t n = page.lacing.size();
  std::size_t seg = 0;
  std::size_t offset = 0;

  if (page.continued() && !have_partial_) {
    // Nothing to continue: skip the fragment up to the first packet boundary
    if (!ev.sequence_gap) {
      ev.continuation_mismatch = true;
      stats_.continuation_mismatches += 1;
    }
    while (seg < n) {
      const std::uint8_t v = page.lacing[seg++];
      offset += v;
      if (v < LACING_CONTINUE) break;
    }
    stats_.bytes_dropped += offset;
  } else if (!page.continued() && have_partial_) {
    ev.continuation_mismatch = true;
    stats_.continuation_mismatches += 1;
    drop_partial();
  }
  if (verbose_ && ev.continuation_mismatch) {
    std::cerr << "[oggmux][decoder] serial=" << serial_ << " continuation mismatch on page "
              << page.sequence_number << std::endl;
  }

  // Index of the last packet terminating on this page; it carries the page granule
  std::size_t last_terminal = n;
  for (std::size_t i = n; i > seg; --i) {
    if (page.lacing[i - 1] < LACING_CONTINUE) { last_terminal = i - 1; break; }
  }

  bool started_on_page = false;
  for (; seg < n; ++seg) {
    const std::uint8_t v = page.lacing[seg];
    if (!have_partial_) {
      partial_bos_ = page.bos() && !started_on_page;
      started_on_page = true;
    }
    partial_.insert(partial_.end(), page.body.begin() + static_cast<std::ptrdiff_t>(offset),
                    page.body.begin() + static_cast<std::ptrdiff_t>(offset + v));
    offset += v;
    if (v == LACING_CONTINUE) {
      have_partial_ = true;
      continue;
    }
    Packet p;
    p.data = std::move(partial_);
    p.bos = partial_bos_;
    p.eos = page.eos() && seg == last_terminal;
    p.granule_position = (seg == last_terminal) ? page.granule_position : framing::GRANULE_UNSET;
    p.sequence_number = packet_seq_++;
    ready_.push_back(std::move(p));
    partial_.clear();
    have_partial_ = false;
    partial_bos_ = false;
    ev.packets_completed += 1;
  }

  stats_.pages += 1;
  stats_.packets += ev.packets_completed;
  if (page.eos()) {
    eos_seen_ = true;
    if (verbose_) {
      std::cerr << "[oggmux][decoder] serial=" << serial_ << " end of stream at page "
                << page.sequence_number << std::endl;
    }
  }
  return ev;
}

auto StreamDecoder::packet_out() -> std::expected<std::optional<Packet>, core::error> {
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  if (ready_.empty()) return std::optional<Packet>{};
  std::optional<Packet> out{std::move(ready_.front())};
  ready_.pop_front();
  return out;
}

auto StreamDecoder::packet_peek() const -> std::expected<std::optional<Packet>, core::error> {
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  if (ready_.empty()) return std::optional<Packet>{};
  return std::optional<Packet>{ready_.front()};
}

void StreamDecoder::drop_partial() noexcept {
  stats_.bytes_dropped += partial_.size();
  partial_.clear();
  have_partial_ = false;
  partial_bos_ = false;
}

void StreamDecoder::clear_state() noexcept {
  last_page_seq_.reset();
  packet_seq_ = 0;
  partial_.clear();
  have_partial_ = false;
  partial_bos_ = false;
  ready_.clear();
  eos_seen_ = false;
  stats_ = {};
}

auto StreamDecoder::reset() -> std::expected<void, core::error> {
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  clear_state();
  return {};
}

auto StreamDecoder::reset(std::int32_t serial) -> std::expected<void, core::error> {
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  clear_state();
  serial_ = serial;
  return {};
}

void StreamDecoder::close() noexcept {
  clear_state();
  state_ = StreamState::closed;
}

} // namespace oggmux::stream
