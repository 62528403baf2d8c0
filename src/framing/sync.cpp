#include "oggmux/framing/sync.hpp"

#include <algorithm>
#include <iostream>

#include "oggmux/core/platform_utils.hpp"

namespace oggmux::framing {

namespace {

// Length of the longest proper prefix of the capture pattern that ends \p tail
auto partial_capture_suffix(std::span<const std::uint8_t> tail) -> std::size_t {
  for (std::size_t n = std::min(tail.size(), CAPTURE_PATTERN.size() - 1); n > 0; --n) {
    if (std::equal(tail.end() - static_cast<std::ptrdiff_t>(n), tail.end(), CAPTURE_PATTERN.begin())) {
      return n;
    }
  }
  return 0;
}

}

SyncScanner::SyncScanner(SyncOptions opts)
  : opts_(opts), verbose_(core::debug_enabled(opts.verbose)) {}

void SyncScanner::feed(std::span<const std::uint8_t> bytes) {
  if (opts_.auto_compact && cursor_ > 0 && cursor_ >= opts_.compact_threshold) {
    compact();
  }
  buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

auto SyncScanner::seek() -> SeekStep {
  using core::error_code;
  const std::span<const std::uint8_t> avail{buf_.data() + cursor_, buf_.size() - cursor_};
  if (avail.empty()) return SeekStep{};

  const auto hit = std::search(avail.begin(), avail.end(), CAPTURE_PATTERN.begin(), CAPTURE_PATTERN.end());
  if (hit != avail.begin()) {
    // Garbage before the next candidate; keep a trailing partial pattern buffered
    std::size_t n = static_cast<std::size_t>(hit - avail.begin());
    if (hit == avail.end()) n -= partial_capture_suffix(avail);
    if (n == 0) return SeekStep{};
    cursor_ += n;
    skipped_ += n;
    return SeekStep{SeekStep::Kind::skipped, n, std::nullopt};
  }

  auto parsed = parse_page(buf_, cursor_);
  if (parsed) {
    const std::size_t n = parsed->consumed;
    cursor_ += n;
    pages_ += 1;
    return SeekStep{SeekStep::Kind::page, n, std::move(parsed->page)};
  }
  if (parsed.error().code == error_code::need_more_data) {
    return SeekStep{};
  }
  // Invalid candidate: step past its first byte only, a real page may start inside it
  cursor_ += 1;
  skipped_ += 1;
  return SeekStep{SeekStep::Kind::skipped, 1, std::nullopt};
}

auto SyncScanner::next_page() -> std::optional<Page> {
  std::size_t skipped_now = 0;
  while (true) {
    auto step = seek();
    switch (step.kind) {
      case SeekStep::Kind::skipped:
        skipped_now += step.bytes;
        continue;
      case SeekStep::Kind::page:
        if (verbose_ && skipped_now > 0) {
          std::cerr << "[oggmux][sync] resynced after skipping " << skipped_now
                    << " bytes (total " << skipped_ << ")" << std::endl;
        }
        return std::move(step.page);
      case SeekStep::Kind::need_more:
        if (verbose_ && skipped_now > 0) {
          std::cerr << "[oggmux][sync] skipped " << skipped_now
                    << " bytes, waiting for more input" << std::endl;
        }
        return std::nullopt;
    }
  }
}

void SyncScanner::compact() {
  if (cursor_ == 0) return;
  buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(cursor_));
  cursor_ = 0;
}

void SyncScanner::reset() {
  buf_.clear();
  cursor_ = 0;
  skipped_ = 0;
  pages_ = 0;
}

} // namespace oggmux::framing
