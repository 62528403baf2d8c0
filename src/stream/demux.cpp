#include "oggmux/stream/demux.hpp"

#include <algorithm>

namespace oggmux::stream {

Demultiplexer::Demultiplexer(DemuxOptions opts)
  : opts_(opts), sync_(opts.sync) {}

void Demultiplexer::feed(std::span<const std::uint8_t> bytes) {
  sync_.feed(bytes);
}

auto Demultiplexer::poll() -> std::expected<std::optional<DemuxEvent>, core::error> {
  auto page = sync_.next_page();
  if (!page) return std::optional<DemuxEvent>{};

  DemuxEvent ev{};
  ev.serial = page->serial_number;
  ev.page_sequence = page->sequence_number;
  ev.bos = page->bos();
  ev.eos = page->eos();

  auto it = decoders_.find(ev.serial);
  if (it == decoders_.end()) {
    auto dec = StreamDecoder::open(ev.serial, opts_.decoder);
    if (!dec) return std::unexpected(dec.error());
    it = decoders_.emplace(ev.serial, std::move(*dec)).first;
    ev.new_stream = true;
  } else if (ev.bos && it->second.is_end_of_stream()) {
    if (auto r = it->second.reset(); !r) return std::unexpected(r.error());
    ev.new_stream = true;
  }

  auto accepted = it->second.page_in(*page);
  if (!accepted) return std::unexpected(accepted.error());
  ev.page = *accepted;
  return std::optional<DemuxEvent>{ev};
}

auto Demultiplexer::packet_out(std::int32_t serial) -> std::expected<std::optional<Packet>, core::error> {
  using core::error; using core::error_code;
  auto it = decoders_.find(serial);
  if (it == decoders_.end()) {
    return std::unexpected(error{error_code::wrong_serial, "unknown serial", "stream.demux"});
  }
  return it->second.packet_out();
}

auto Demultiplexer::serials() const -> std::vector<std::int32_t> {
  std::vector<std::int32_t> out;
  out.reserve(decoders_.size());
  for (const auto& [serial, dec] : decoders_) out.push_back(serial);
  return out;
}

auto Demultiplexer::decoder(std::int32_t serial) const -> const StreamDecoder* {
  auto it = decoders_.find(serial);
  return it == decoders_.end() ? nullptr : &it->second;
}

bool Demultiplexer::all_ended() const noexcept {
  return !decoders_.empty() &&
         std::all_of(decoders_.begin(), decoders_.end(),
                     [](const auto& kv){ return kv.second.is_end_of_stream(); });
}

} // namespace oggmux::stream
