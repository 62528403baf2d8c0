#include <catch2/catch_all.hpp>
#include <oggmux/stream/demux.hpp>
#include <oggmux/framing/sync.hpp>

#include <algorithm>
#include <map>
#include <vector>

#include <tests/support/page_test_helpers.hpp>

using namespace oggmux;
using oggmux::core::error_code;
using framing::Page;
using stream::Packet;
using test_support::encode_stream;
using test_support::make_packets;
using test_support::to_bytes;

namespace {

// Alternates pages of two streams, keeping each stream's order
std::vector<Page> interleave(const std::vector<Page>& a, const std::vector<Page>& b) {
  std::vector<Page> out;
  for (std::size_t i = 0; i < std::max(a.size(), b.size()); ++i) {
    if (i < a.size()) out.push_back(a[i]);
    if (i < b.size()) out.push_back(b[i]);
  }
  return out;
}

}

TEST_CASE("two interleaved streams are separated by serial", "[demux]") {
  const std::vector<std::size_t> sizes_a{30, 700, 70000, 5};
  const std::vector<std::size_t> sizes_b{1, 2, 3, 4000, 255};
  const auto packets_a = make_packets(sizes_a, 100);
  const auto packets_b = make_packets(sizes_b, 200);
  const auto bytes = to_bytes(interleave(encode_stream(1001, packets_a, false),
                                         encode_stream(2002, packets_b, false)));

  stream::Demultiplexer demux;
  std::map<std::int32_t, std::vector<Packet>> out;
  std::size_t new_streams = 0;
  for (std::size_t off = 0; off < bytes.size(); off += 37) {
    const std::size_t n = std::min<std::size_t>(37, bytes.size() - off);
    demux.feed(std::span<const std::uint8_t>{bytes.data() + off, n});
    while (true) {
      auto ev = demux.poll();
      REQUIRE(ev.has_value());
      if (!ev->has_value()) break;
      REQUIRE((*ev)->page.clean());
      if ((*ev)->new_stream) {
        ++new_streams;
        REQUIRE((*ev)->bos);
      }
      const auto serial = (*ev)->serial;
      while (auto pk = demux.packet_out(serial).value()) out[serial].push_back(std::move(*pk));
    }
  }

  REQUIRE(new_streams == 2);
  REQUIRE(demux.serials() == std::vector<std::int32_t>{1001, 2002});
  REQUIRE(demux.all_ended());
  REQUIRE(demux.bytes_skipped() == 0);
  REQUIRE(out[1001].size() == packets_a.size());
  REQUIRE(out[2002].size() == packets_b.size());
  for (std::size_t i = 0; i < packets_a.size(); ++i) REQUIRE(out[1001][i].data == packets_a[i].data);
  for (std::size_t i = 0; i < packets_b.size(); ++i) REQUIRE(out[2002][i].data == packets_b[i].data);

  const auto* dec = demux.decoder(2002);
  REQUIRE(dec != nullptr);
  REQUIRE(dec->stats().packets == packets_b.size());
  REQUIRE(demux.decoder(3003) == nullptr);
}

TEST_CASE("one scanner can feed decoders routed by hand", "[demux][sync]") {
  const std::vector<std::size_t> sizes{12, 13, 14};
  const auto bytes = to_bytes(interleave(encode_stream(7, make_packets(sizes, 1), true),
                                         encode_stream(8, make_packets(sizes, 2), true)));
  framing::SyncScanner scanner;
  scanner.feed(bytes);
  auto d7 = stream::StreamDecoder::open(7);
  auto d8 = stream::StreamDecoder::open(8);
  REQUIRE(d7.has_value());
  REQUIRE(d8.has_value());
  while (auto page = scanner.next_page()) {
    auto& dec = page->serial_number == 7 ? *d7 : *d8;
    REQUIRE(dec.page_in(*page).has_value());
  }
  REQUIRE(d7->packets_ready() == 3);
  REQUIRE(d8->packets_ready() == 3);
  REQUIRE(d7->is_end_of_stream());
  REQUIRE(d8->is_end_of_stream());
}

TEST_CASE("unknown serial is reported", "[demux][errors]") {
  stream::Demultiplexer demux;
  auto r = demux.packet_out(42);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::wrong_serial);
  REQUIRE_FALSE(demux.all_ended());
  REQUIRE(demux.serials().empty());

  auto ev = demux.poll();
  REQUIRE(ev.has_value());
  REQUIRE_FALSE(ev->has_value());
}

TEST_CASE("a chained stream reusing its serial restarts the decoder", "[demux][chain]") {
  const std::vector<std::size_t> sizes{40, 50};
  const auto first = make_packets(sizes, 1);
  const auto second = make_packets(sizes, 2);
  auto bytes = to_bytes(encode_stream(9, first, true));
  const auto more = to_bytes(encode_stream(9, second, true));
  bytes.insert(bytes.end(), more.begin(), more.end());

  stream::Demultiplexer demux;
  demux.feed(bytes);
  std::vector<Packet> out;
  std::size_t restarts = 0;
  while (true) {
    auto ev = demux.poll();
    REQUIRE(ev.has_value());
    if (!ev->has_value()) break;
    REQUIRE((*ev)->page.clean());
    if ((*ev)->new_stream) ++restarts;
    while (auto pk = demux.packet_out(9).value()) out.push_back(std::move(*pk));
  }
  REQUIRE(restarts == 2);
  REQUIRE(out.size() == 4);
  REQUIRE(out[0].bos);
  REQUIRE(out[2].bos);
  REQUIRE(out[2].sequence_number == 0);
  REQUIRE(out[3].data == second[1].data);
  REQUIRE(demux.all_ended());
}
