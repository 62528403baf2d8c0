#include <catch2/catch_all.hpp>
#include <oggmux/framing/page.hpp>

#include <array>
#include <vector>

#include <tests/support/page_test_helpers.hpp>

using namespace oggmux::framing;
using oggmux::core::error_code;

namespace {

Page sample_page() {
  Page p;
  p.flags = FLAG_CONTINUED;
  p.granule_position = 0x0102030405060708ll;
  p.serial_number = -559038737;  // 0xDEADBEEF
  p.sequence_number = 42;
  p.lacing = {255, 255, 17, 0, 9};
  p.body = test_support::make_payload(lacing_body_size(p.lacing), 7);
  return p;
}

}

TEST_CASE("serialize matches the reference layout byte for byte", "[page]") {
  Page p;
  p.flags = FLAG_BOS;
  p.granule_position = 0;
  p.serial_number = 0x01020304;
  p.sequence_number = 0;
  p.lacing = {3};
  p.body = {'a', 'b', 'c'};
  const std::vector<std::uint8_t> expected = {
      0x4F, 0x67, 0x67, 0x53, 0x00, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
      0x04, 0x03, 0x02, 0x01, 0x00, 0x00, 0x00, 0x00, 0x67, 0xF9, 0x98, 0xD4, 0x01, 0x03,
      0x61, 0x62, 0x63};
  auto bytes = serialize_page(p);
  REQUIRE(bytes.has_value());
  REQUIRE(*bytes == expected);

  REQUIRE(seal_page(p).has_value());
  REQUIRE(p.checksum == 0xD498F967u);
}

TEST_CASE("serialize then parse restores every header field", "[page]") {
  Page p = sample_page();
  REQUIRE(seal_page(p).has_value());
  auto bytes = serialize_page(p);
  REQUIRE(bytes.has_value());
  REQUIRE(bytes->size() == p.total_size());
  REQUIRE(p.header_size() == 27 + 5);

  auto parsed = parse_page(*bytes);
  REQUIRE(parsed.has_value());
  REQUIRE(parsed->consumed == bytes->size());
  REQUIRE(parsed->page == p);
  REQUIRE(parsed->page.continued());
  REQUIRE_FALSE(parsed->page.bos());
  REQUIRE_FALSE(parsed->page.eos());
  REQUIRE(parsed->page.packet_count() == 3);
}

TEST_CASE("zero-segment page is legal and has an empty body", "[page]") {
  Page p;
  p.flags = FLAG_EOS;
  p.serial_number = 9;
  p.sequence_number = 3;
  auto bytes = serialize_page(p);
  REQUIRE(bytes.has_value());
  REQUIRE(bytes->size() == PAGE_HEADER_SIZE);
  auto parsed = parse_page(*bytes);
  REQUIRE(parsed.has_value());
  REQUIRE(parsed->page.body.empty());
  REQUIRE(parsed->page.lacing.empty());
  REQUIRE(parsed->page.eos());
  REQUIRE(parsed->page.packet_count() == 0);
}

TEST_CASE("parse at an offset ignores surrounding bytes", "[page]") {
  Page p = sample_page();
  auto bytes = serialize_page(p);
  REQUIRE(bytes.has_value());
  std::vector<std::uint8_t> buf(11, 0x5A);
  buf.insert(buf.end(), bytes->begin(), bytes->end());
  buf.insert(buf.end(), {0x01, 0x02, 0x03});
  auto parsed = parse_page(buf, 11);
  REQUIRE(parsed.has_value());
  REQUIRE(parsed->consumed == bytes->size());
  REQUIRE(parsed->page.body == p.body);

  auto bad = parse_page(buf, buf.size() + 1);
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == error_code::invalid_argument);
}

TEST_CASE("every truncated prefix reports need_more_data", "[page]") {
  auto bytes = serialize_page(sample_page());
  REQUIRE(bytes.has_value());
  for (std::size_t n = 0; n < bytes->size(); ++n) {
    auto parsed = parse_page(std::span<const std::uint8_t>{bytes->data(), n});
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE(parsed.error().code == error_code::need_more_data);
  }
}

TEST_CASE("structural failures are malformed", "[page]") {
  auto bytes = serialize_page(sample_page());
  REQUIRE(bytes.has_value());

  SECTION("capture pattern") {
    auto b = *bytes; b[2] = 'x';
    auto parsed = parse_page(b);
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE(parsed.error().code == error_code::malformed);
    // partial prefix that already mismatches
    auto short_parse = parse_page(std::span<const std::uint8_t>{b.data(), 3});
    REQUIRE(short_parse.error().code == error_code::malformed);
  }
  SECTION("version") {
    auto b = *bytes; b[4] = 1;
    auto parsed = parse_page(b);
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE(parsed.error().code == error_code::malformed);
  }
}

TEST_CASE("single bit flips are rejected by the checksum", "[page][crc]") {
  auto bytes = serialize_page(sample_page());
  REQUIRE(bytes.has_value());
  const std::size_t header_len = 27 + 5;

  // Fixed offsets in flags, granule, serial, sequence, checksum and body
  const std::array<std::size_t, 12> offsets{5, 6, 13, 14, 17, 18, 21, 22, 25,
                                            header_len, header_len + 300, bytes->size() - 1};
  for (auto off : offsets) {
    for (int bit = 0; bit < 8; bit += 3) {
      auto b = *bytes;
      b[off] ^= static_cast<std::uint8_t>(1u << bit);
      auto parsed = parse_page(b);
      INFO("offset " << off << " bit " << bit);
      REQUIRE_FALSE(parsed.has_value());
      REQUIRE(parsed.error().code == error_code::data_integrity);
    }
  }

  // Any flip anywhere is rejected, whatever the reason
  for (std::size_t off = 0; off < bytes->size(); off += 7) {
    auto b = *bytes;
    b[off] ^= 0x10;
    REQUIRE_FALSE(parse_page(b).has_value());
  }
}

TEST_CASE("serialize rejects pages that break structural invariants", "[page]") {
  SECTION("body does not match lacing") {
    Page p = sample_page();
    p.body.pop_back();
    auto r = serialize_page(p);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::invalid_argument);
    REQUIRE(r.error().component == "framing.page");
  }
  SECTION("more than 255 segments") {
    Page p;
    p.lacing.assign(256, 1);
    p.body.assign(256, 0);
    auto r = serialize_page(p);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::invalid_argument);
  }
  SECTION("non-zero version") {
    Page p;
    p.version = 2;
    REQUIRE_FALSE(serialize_page(p).has_value());
    REQUIRE_FALSE(seal_page(p).has_value());
  }
}

TEST_CASE("largest page round-trips", "[page]") {
  Page p;
  p.lacing.assign(MAX_SEGMENTS, 255);
  p.body = test_support::make_payload(MAX_BODY_SIZE, 3);
  auto bytes = serialize_page(p);
  REQUIRE(bytes.has_value());
  REQUIRE(bytes->size() == MAX_PAGE_SIZE);
  auto parsed = parse_page(*bytes);
  REQUIRE(parsed.has_value());
  REQUIRE(parsed->page.body == p.body);
  REQUIRE(parsed->page.packet_count() == 0);
}
