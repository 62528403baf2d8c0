#include "oggmux/stream/packet.hpp"

#include <limits>
#include <memory>
#include <random>

namespace oggmux::stream {

auto default_serial_source() -> SerialSource {
  auto rng = std::make_shared<std::mt19937>(std::random_device{}());
  return [rng]() {
    std::uniform_int_distribution<std::int32_t> dist(1, std::numeric_limits<std::int32_t>::max());
    return dist(*rng);
  };
}

} // namespace oggmux::stream
