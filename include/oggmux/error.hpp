#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 * - "No data yet" is never an error: engines return an empty std::optional.
 *   need_more_data is only produced by the low-level page parser.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace oggmux::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  need_more_data = 1002,
  config_invalid = 2001,
  data_integrity = 3001,
  malformed = 3002,
  precondition_failed = 4001,
  stream_not_open = 4002,
  wrong_serial = 4003,
  internal = 9001,
  invalid_argument = 9002,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "framing.page" */
};

constexpr std::string_view to_string(error_code ec) noexcept {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::need_more_data: return "need_more_data";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::malformed: return "malformed";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::stream_not_open: return "stream_not_open";
    case error_code::wrong_serial: return "wrong_serial";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::unsupported: return "unsupported";
  }
  return "unknown";
}

} // namespace oggmux::core
