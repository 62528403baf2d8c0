#pragma once

/** \file oggmux.hpp
 *  \brief Umbrella header for the page codec and stream engines.
 *
 *  Includes:
 *   - CRC and byte helpers (framing/crc.hpp, framing/bytes.hpp)
 *   - Page serialize/parse (framing/page.hpp)
 *   - Resynchronizing page scanner (framing/sync.hpp)
 *   - Stream encoder / decoder (stream/encoder.hpp, stream/decoder.hpp)
 *   - Multi-stream routing (stream/demux.hpp)
 */

#include "oggmux/error.hpp"
#include "oggmux/framing/bytes.hpp"
#include "oggmux/framing/crc.hpp"
#include "oggmux/framing/page.hpp"
#include "oggmux/framing/sync.hpp"
#include "oggmux/stream/packet.hpp"
#include "oggmux/stream/encoder.hpp"
#include "oggmux/stream/decoder.hpp"
#include "oggmux/stream/demux.hpp"
