#pragma once

/** \file packet.hpp
 *  \brief Logical packet value and stream lifecycle types shared by encoder and decoder.
 */

#include <cstdint>
#include <functional>
#include <vector>

#include "oggmux/framing/page.hpp"

namespace oggmux::stream {

/** \brief One logical packet. Payload is opaque and owned. */
struct Packet {
  std::vector<std::uint8_t> data;
  bool bos{false};
  bool eos{false};
  std::int64_t granule_position{framing::GRANULE_UNSET};  /**< -1: undetermined */
  std::int64_t sequence_number{-1};                       /**< assigned by the engine */

  bool operator==(const Packet&) const = default;
};

/** Typed lifecycle, checked at every public entry point. */
enum class StreamState : std::uint8_t { closed, open };

/** Supplies serial numbers when none is given explicitly. */
using SerialSource = std::function<std::int32_t()>;

/** Default source: Mersenne twister seeded from std::random_device, range [1, INT32_MAX]. */
auto default_serial_source() -> SerialSource;

} // namespace oggmux::stream
