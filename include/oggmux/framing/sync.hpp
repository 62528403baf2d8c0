#pragma once

/** \file sync.hpp
 *  \brief Page synchronization over an unaligned, possibly corrupted byte stream.
 *
 * Notes
 * - The scanner owns an append-only buffer; feed() copies the caller's bytes.
 * - Corruption is never an error: invalid candidates are skipped one byte at a
 *   time and counted in bytes_skipped().
 * - Serial-number agnostic; one scanner serves every logical stream of a
 *   physical stream.
 * - Not thread-safe; one scanner per physical stream.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "oggmux/framing/page.hpp"

namespace oggmux::framing {

struct SyncOptions {
  bool auto_compact{true};                /**< release the consumed prefix on feed() */
  std::size_t compact_threshold{65536};   /**< consumed bytes before auto compaction */
  bool verbose{false};                    /**< log resyncs to std::cerr (also OGGMUX_DEBUG) */
};

/** \brief Outcome of one scan step.
 *  - page: a valid page was consumed (bytes = its size)
 *  - skipped: bytes were passed over while looking for a page
 *  - need_more: buffered data ends inside a candidate page or capture pattern
 */
struct SeekStep {
  enum class Kind : std::uint8_t { page, skipped, need_more };
  Kind kind{Kind::need_more};
  std::size_t bytes{};
  std::optional<Page> page;
};

class SyncScanner {
public:
  explicit SyncScanner(SyncOptions opts = {});

  SyncScanner(SyncScanner&&) noexcept = default;
  SyncScanner& operator=(SyncScanner&&) noexcept = default;
  SyncScanner(const SyncScanner&) = delete;
  SyncScanner& operator=(const SyncScanner&) = delete;

  /** Append raw bytes. */
  void feed(std::span<const std::uint8_t> bytes);

  /** Single scan step from the read cursor. */
  auto seek() -> SeekStep;

  /** Next valid page, skipping garbage; nullopt when more input is needed. */
  auto next_page() -> std::optional<Page>;

  /** Drop bytes before the read cursor. */
  void compact();

  /** Drop all buffered data and zero the counters. */
  void reset();

  std::uint64_t bytes_skipped() const noexcept { return skipped_; }
  std::uint64_t pages_returned() const noexcept { return pages_; }
  /** Bytes fed but not yet consumed as pages or skipped. */
  std::size_t buffered() const noexcept { return buf_.size() - cursor_; }
  /** Bytes held in memory, including the consumed prefix not yet compacted. */
  std::size_t capacity_used() const noexcept { return buf_.size(); }

private:
  SyncOptions opts_{};
  bool verbose_{false};
  std::vector<std::uint8_t> buf_;
  std::size_t cursor_{};
  std::uint64_t skipped_{};
  std::uint64_t pages_{};
};

} // namespace oggmux::framing
