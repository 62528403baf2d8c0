/**
 * Multiplexing example using oggmux
 *
 * This example demonstrates:
 * - Encoding two logical streams into pages
 * - Interleaving them into one physical byte stream
 * - Recovering both streams with the demultiplexer, after injected garbage
 */

#include <oggmux/oggmux.hpp>
#include <algorithm>
#include <iostream>
#include <random>
#include <vector>

namespace {

std::vector<std::uint8_t> make_packet(std::size_t size, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::vector<std::uint8_t> out(size);
    for (auto& b : out) {
        b = static_cast<std::uint8_t>(gen());
    }
    return out;
}

bool encode(std::int32_t serial, const std::vector<std::size_t>& sizes,
            std::vector<oggmux::framing::Page>& pages) {
    using namespace oggmux;
    auto enc = stream::StreamEncoder::open({.serial = serial, .fill_bytes = 1024});
    if (!enc) {
        std::cerr << "open failed: " << enc.error().message << std::endl;
        return false;
    }
    for (std::size_t i = 0; i < sizes.size(); ++i) {
        const bool last = (i + 1 == sizes.size());
        auto added = enc->add_packet(make_packet(sizes[i], serial + static_cast<std::uint32_t>(i)),
                                     static_cast<std::int64_t>(i) * 960, last);
        if (!added) {
            std::cerr << "add_packet failed: " << added.error().message << std::endl;
            return false;
        }
        while (true) {
            auto page = enc->page_out();
            if (!page) return false;
            if (!page->has_value()) break;
            pages.push_back(std::move(**page));
        }
    }
    while (true) {
        auto page = enc->flush();
        if (!page) return false;
        if (!page->has_value()) break;
        pages.push_back(std::move(**page));
    }
    return true;
}

} // namespace

int main() {
    using namespace oggmux;

    std::vector<framing::Page> audio, video;
    if (!encode(0x1000, {12, 300, 300, 80000, 300, 40}, audio)) return 1;
    if (!encode(0x2000, {64, 5000, 5000, 5000}, video)) return 1;
    std::cout << "Encoded " << audio.size() << " + " << video.size() << " pages" << std::endl;

    // Interleave and inject some garbage between pages
    std::vector<std::uint8_t> physical;
    for (std::size_t i = 0; i < std::max(audio.size(), video.size()); ++i) {
        for (const auto* pages : {&audio, &video}) {
            if (i >= pages->size()) continue;
            auto bytes = framing::serialize_page((*pages)[i]);
            if (!bytes) {
                std::cerr << "serialize failed: " << bytes.error().message << std::endl;
                return 1;
            }
            physical.insert(physical.end(), bytes->begin(), bytes->end());
            physical.insert(physical.end(), 17, 0xAA);
        }
    }

    stream::Demultiplexer demux;
    demux.feed(physical);
    std::size_t packets = 0;
    while (true) {
        auto ev = demux.poll();
        if (!ev) {
            std::cerr << "demux failed: " << ev.error().message << std::endl;
            return 1;
        }
        if (!ev->has_value()) break;
        const auto& e = **ev;
        if (e.new_stream) {
            std::cout << "New stream serial=0x" << std::hex << e.serial << std::dec << std::endl;
        }
        while (true) {
            auto pk = demux.packet_out(e.serial);
            if (!pk || !pk->has_value()) break;
            ++packets;
        }
    }

    std::cout << "Recovered " << packets << " packets, skipped "
              << demux.bytes_skipped() << " bytes" << std::endl;
    std::cout << (demux.all_ended() ? "All streams ended" : "Streams still open") << std::endl;
    return 0;
}
