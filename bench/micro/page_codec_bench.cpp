#include <benchmark/benchmark.h>
#include <oggmux/framing/sync.hpp>
#include <oggmux/stream/encoder.hpp>

#include <random>
#include <vector>

using namespace oggmux;

static std::vector<std::uint8_t> payload(std::size_t n, std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::vector<std::uint8_t> out(n);
  for (auto& b : out) b = static_cast<std::uint8_t>(rng());
  return out;
}

static framing::Page full_page() {
  framing::Page p;
  p.serial_number = 1;
  p.lacing.assign(framing::MAX_SEGMENTS, 255);
  p.body = payload(framing::MAX_BODY_SIZE, 1);
  return p;
}

static void BM_SerializeFullPage(benchmark::State& state) {
  const auto page = full_page();
  for (auto _ : state) {
    auto bytes = framing::serialize_page(page);
    benchmark::DoNotOptimize(bytes);
  }
  state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * framing::MAX_PAGE_SIZE);
}
BENCHMARK(BM_SerializeFullPage);

static void BM_ParseFullPage(benchmark::State& state) {
  const auto bytes = framing::serialize_page(full_page()).value();
  for (auto _ : state) {
    auto parsed = framing::parse_page(bytes);
    benchmark::DoNotOptimize(parsed);
  }
  state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * framing::MAX_PAGE_SIZE);
}
BENCHMARK(BM_ParseFullPage);

// Scanner throughput with garbage between pages
static void BM_ScanWithGarbage(benchmark::State& state) {
  framing::Page p;
  p.serial_number = 1;
  p.lacing = framing::build_lacing(4000);
  p.body = payload(4000, 2);
  const auto page = framing::serialize_page(p).value();
  std::vector<std::uint8_t> stream;
  for (int i = 0; i < 64; ++i) {
    stream.insert(stream.end(), static_cast<std::size_t>(state.range(0)), 0xAA);
    stream.insert(stream.end(), page.begin(), page.end());
  }
  for (auto _ : state) {
    framing::SyncScanner scanner;
    scanner.feed(stream);
    std::size_t n = 0;
    while (scanner.next_page()) ++n;
    benchmark::DoNotOptimize(n);
  }
  state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * stream.size()));
}
BENCHMARK(BM_ScanWithGarbage)->Arg(0)->Arg(512);

static void BM_EncodePackets(benchmark::State& state) {
  const auto data = payload(static_cast<std::size_t>(state.range(0)), 3);
  for (auto _ : state) {
    auto enc = stream::StreamEncoder::open({.serial = 1}).value();
    std::size_t pages = 0;
    for (int i = 0; i < 256; ++i) {
      (void)enc.add_packet(data, i).value();
      while (enc.page_out().value()) ++pages;
    }
    while (enc.flush().value()) ++pages;
    benchmark::DoNotOptimize(pages);
  }
}
BENCHMARK(BM_EncodePackets)->Arg(100)->Arg(4000);

BENCHMARK_MAIN();
