#include "oggmux/stream/encoder.hpp"

#include <algorithm>
#include <iostream>

#include "oggmux/core/platform_utils.hpp"
#include "oggmux/framing/bytes.hpp"

namespace oggmux::stream {

using framing::LACING_CONTINUE;
using framing::MAX_BODY_SIZE;
using framing::MAX_SEGMENTS;
using framing::Page;

namespace {

auto resolve_fill(const EncoderOptions& opts, bool verbose) -> std::expected<std::size_t, core::error> {
  using core::error; using core::error_code;
  if (opts.fill_bytes) {
    if (*opts.fill_bytes == 0 || *opts.fill_bytes > MAX_BODY_SIZE) {
      return std::unexpected(error{error_code::config_invalid, "fill_bytes out of range", "stream.encoder"});
    }
    return *opts.fill_bytes;
  }
  if (auto env = core::env_size("OGGMUX_PAGE_FILL")) {
    if (*env > 0 && *env <= MAX_BODY_SIZE) return *env;
    if (verbose) {
      std::cerr << "[oggmux][encoder] ignoring OGGMUX_PAGE_FILL=" << *env << " (out of range)" << std::endl;
    }
  }
  return DEFAULT_PAGE_FILL;
}

}

auto StreamEncoder::open(const EncoderOptions& opts) -> std::expected<StreamEncoder, core::error> {
  StreamEncoder enc;
  enc.verbose_ = core::debug_enabled(opts.verbose);
  auto fill = resolve_fill(opts, enc.verbose_);
  if (!fill) return std::unexpected(fill.error());
  enc.fill_ = *fill;
  if (opts.serial) {
    enc.serial_ = *opts.serial;
  } else {
    const SerialSource source = opts.serial_source ? opts.serial_source : default_serial_source();
    enc.serial_ = source();
  }
  enc.state_ = StreamState::open;
  if (enc.verbose_) {
    std::cerr << "[oggmux][encoder] open serial=" << enc.serial_ << " fill=" << enc.fill_ << std::endl;
  }
  return enc;
}

auto StreamEncoder::check_open() const -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (state_ != StreamState::open) {
    return std::unexpected(error{error_code::stream_not_open, "encoder not open", "stream.encoder"});
  }
  return {};
}

auto StreamEncoder::add_packet(std::span<const std::uint8_t> data, std::int64_t granule_position, bool eos)
    -> std::expected<std::int64_t, core::error> {
  using core::error; using core::error_code;
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  if (eos_queued_) {
    return std::unexpected(error{error_code::stream_not_open, "stream already ended", "stream.encoder"});
  }

  const auto lacing = framing::build_lacing(data.size());
  for (std::size_t i = 0; i < lacing.size(); ++i) {
    const bool last = (i + 1 == lacing.size());
    segments_.push_back(Segment{lacing[i], i == 0, last ? granule_position : framing::GRANULE_UNSET});
  }
  body_.insert(body_.end(), data.begin(), data.end());
  if (eos) eos_queued_ = true;
  return packet_seq_++;
}

auto StreamEncoder::add_packet(const Packet& packet) -> std::expected<std::int64_t, core::error> {
  return add_packet(packet.data, packet.granule_position, packet.eos);
}

auto StreamEncoder::end_stream() -> std::expected<void, core::error> {
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  eos_queued_ = true;
  return {};
}

auto StreamEncoder::page_out() -> std::expected<std::optional<Page>, core::error> {
  return page_out_fill(fill_);
}

auto StreamEncoder::page_out_fill(std::size_t nfill) -> std::expected<std::optional<Page>, core::error> {
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  const bool force = (eos_queued_ && !segments_.empty()) ||
                     pending_bytes() > nfill ||
                     segments_.size() >= MAX_SEGMENTS ||
                     (!segments_.empty() && !bos_emitted_);
  return emit(force, nfill);
}

auto StreamEncoder::flush() -> std::expected<std::optional<Page>, core::error> {
  return flush_fill(MAX_BODY_SIZE);
}

auto StreamEncoder::flush_fill(std::size_t nfill) -> std::expected<std::optional<Page>, core::error> {
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  return emit(true, nfill);
}

auto StreamEncoder::emit(bool force, std::size_t nfill) -> std::expected<std::optional<Page>, core::error> {
  const std::size_t maxvals = std::min(segments_.size(), MAX_SEGMENTS);
  if (maxvals == 0) {
    // Nothing pending: only an outstanding EOS marker produces a page
    if (!force || !eos_queued_ || eos_emitted_) return std::optional<Page>{};
    auto page = make_page(0, 0, framing::GRANULE_UNSET);
    if (!page) return std::unexpected(page.error());
    return std::optional<Page>{std::move(*page)};
  }

  std::size_t vals = 0;
  std::size_t acc = 0;
  std::int64_t granule = framing::GRANULE_UNSET;
  if (!bos_emitted_) {
    // The BOS page carries the first packet only
    while (vals < maxvals) {
      const Segment& s = segments_[vals++];
      acc += s.lacing;
      if (s.lacing < LACING_CONTINUE) { granule = s.granule; break; }
    }
    force = true;
  } else {
    for (; vals < maxvals; ++vals) {
      const bool at_boundary = vals > 0 && segments_[vals - 1].lacing < LACING_CONTINUE;
      if (at_boundary && acc >= nfill) { force = true; break; }
      const Segment& s = segments_[vals];
      acc += s.lacing;
      if (s.lacing < LACING_CONTINUE) granule = s.granule;
    }
    if (vals == MAX_SEGMENTS) force = true;
  }
  if (!force) return std::optional<Page>{};

  auto page = make_page(vals, acc, granule);
  if (!page) return std::unexpected(page.error());
  return std::optional<Page>{std::move(*page)};
}

auto StreamEncoder::make_page(std::size_t vals, std::size_t body_len, std::int64_t granule)
    -> std::expected<Page, core::error> {
  using core::error; using core::error_code;
  Page page;
  page.serial_number = serial_;
  page.sequence_number = page_seq_;
  page.granule_position = granule;
  if (vals > 0 && !segments_.front().begins_packet) page.flags |= framing::FLAG_CONTINUED;
  if (!bos_emitted_) page.flags |= framing::FLAG_BOS;
  if (eos_queued_ && vals == segments_.size()) page.flags |= framing::FLAG_EOS;

  page.lacing.reserve(vals);
  for (std::size_t i = 0; i < vals; ++i) page.lacing.push_back(segments_[i].lacing);
  const auto first = body_.begin() + static_cast<std::ptrdiff_t>(body_returned_);
  page.body.assign(first, first + static_cast<std::ptrdiff_t>(body_len));

  if (auto sealed = framing::seal_page(page); !sealed) {
    return std::unexpected(error{error_code::internal, sealed.error().message, "stream.encoder"});
  }

  segments_.erase(segments_.begin(), segments_.begin() + static_cast<std::ptrdiff_t>(vals));
  body_returned_ += body_len;
  if (body_returned_ == body_.size()) {
    body_.clear();
    body_returned_ = 0;
  } else if (body_returned_ > body_.size() / 2) {
    body_.erase(body_.begin(), body_.begin() + static_cast<std::ptrdiff_t>(body_returned_));
    body_returned_ = 0;
  }

  page_seq_ += 1;
  bos_emitted_ = true;
  if (page.eos()) {
    eos_emitted_ = true;
    if (verbose_) {
      std::cerr << "[oggmux][encoder] serial=" << serial_ << " emitted EOS page seq="
                << page.sequence_number << std::endl;
    }
  }
  return page;
}

void StreamEncoder::clear_pending() noexcept {
  segments_.clear();
  body_.clear();
  body_returned_ = 0;
  page_seq_ = 0;
  packet_seq_ = 0;
  bos_emitted_ = false;
  eos_queued_ = false;
  eos_emitted_ = false;
}

auto StreamEncoder::reset() -> std::expected<void, core::error> {
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  clear_pending();
  return {};
}

auto StreamEncoder::reset(std::int32_t serial) -> std::expected<void, core::error> {
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  clear_pending();
  serial_ = serial;
  if (verbose_) {
    std::cerr << "[oggmux][encoder] chained to serial=" << serial_ << std::endl;
  }
  return {};
}

void StreamEncoder::close() noexcept {
  clear_pending();
  state_ = StreamState::closed;
}

} // namespace oggmux::stream
