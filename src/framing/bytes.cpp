#include "oggmux/framing/bytes.hpp"

#include <algorithm>
#include <numeric>

namespace oggmux::framing {

auto build_lacing(std::size_t packet_size) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out(lacing_count(packet_size), LACING_CONTINUE);
  out.back() = static_cast<std::uint8_t>(packet_size % LACING_CONTINUE);
  return out;
}

auto lacing_body_size(std::span<const std::uint8_t> table) -> std::size_t {
  return std::accumulate(table.begin(), table.end(), std::size_t{0});
}

auto count_completed_packets(std::span<const std::uint8_t> table) -> std::size_t {
  return static_cast<std::size_t>(
      std::count_if(table.begin(), table.end(), [](std::uint8_t v){ return v < LACING_CONTINUE; }));
}

} // namespace oggmux::framing
