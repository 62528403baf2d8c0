#include "oggmux/framing/page.hpp"

#include <algorithm>

#include "oggmux/framing/crc.hpp"

namespace oggmux::framing {

namespace {

auto check_structure(const Page& page) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (page.version != 0) {
    return std::unexpected(error{error_code::invalid_argument, "version != 0", "framing.page"});
  }
  if (page.lacing.size() > MAX_SEGMENTS) {
    return std::unexpected(error{error_code::invalid_argument, "too many segments", "framing.page"});
  }
  if (lacing_body_size(page.lacing) != page.body.size()) {
    return std::unexpected(error{error_code::invalid_argument, "body size != lacing sum", "framing.page"});
  }
  return {};
}

// Header bytes with the checksum field set to \p checksum
auto encode_header(const Page& page, std::uint32_t checksum) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out;
  out.reserve(page.header_size() + page.body.size());
  ByteWriter w{out};
  w.put_bytes(CAPTURE_PATTERN);
  w.put_u8(page.version);
  w.put_u8(page.flags);
  w.put_le64(static_cast<std::uint64_t>(page.granule_position));
  w.put_le32(static_cast<std::uint32_t>(page.serial_number));
  w.put_le32(page.sequence_number);
  w.put_le32(checksum);
  w.put_u8(static_cast<std::uint8_t>(page.lacing.size()));
  w.put_bytes(page.lacing);
  return out;
}

} // namespace

auto serialize_page(const Page& page) -> std::expected<std::vector<std::uint8_t>, core::error> {
  if (auto ok = check_structure(page); !ok) return std::unexpected(ok.error());
  std::vector<std::uint8_t> out = encode_header(page, 0);
  const std::uint32_t c = page_checksum(out, page.body);
  ByteWriter{out}.put_bytes(page.body);
  store_le32(out.data() + 22, c);
  return out;
}

auto seal_page(Page& page) -> std::expected<void, core::error> {
  if (auto ok = check_structure(page); !ok) return std::unexpected(ok.error());
  const auto header = encode_header(page, 0);
  page.checksum = page_checksum(header, page.body);
  return {};
}

auto parse_page(std::span<const std::uint8_t> bytes, std::size_t offset)
    -> std::expected<ParsedPage, core::error> {
  using core::error; using core::error_code;
  if (offset > bytes.size()) {
    return std::unexpected(error{error_code::invalid_argument, "offset beyond buffer", "framing.page"});
  }
  const auto avail = bytes.subspan(offset);

  // Reject on whatever prefix of the capture pattern is present
  const std::size_t cap_n = std::min(avail.size(), CAPTURE_PATTERN.size());
  if (!std::equal(avail.begin(), avail.begin() + static_cast<std::ptrdiff_t>(cap_n), CAPTURE_PATTERN.begin())) {
    return std::unexpected(error{error_code::malformed, "bad capture pattern", "framing.page"});
  }
  if (avail.size() > 4 && avail[4] != 0) {
    return std::unexpected(error{error_code::malformed, "unsupported version", "framing.page"});
  }
  if (avail.size() < PAGE_HEADER_SIZE) {
    return std::unexpected(error{error_code::need_more_data, "short header", "framing.page"});
  }

  const std::size_t segments = avail[26];
  const std::size_t header_len = PAGE_HEADER_SIZE + segments;
  if (avail.size() < header_len) {
    return std::unexpected(error{error_code::need_more_data, "short lacing table", "framing.page"});
  }
  const auto lacing = avail.subspan(PAGE_HEADER_SIZE, segments);
  const std::size_t body_len = lacing_body_size(lacing);
  if (avail.size() - header_len < body_len) {
    return std::unexpected(error{error_code::need_more_data, "short body", "framing.page"});
  }

  const auto header = avail.first(header_len);
  const auto body = avail.subspan(header_len, body_len);
  const std::uint32_t stored = load_le32(header.data() + 22);
  if (page_checksum(header, body) != stored) {
    return std::unexpected(error{error_code::data_integrity, "crc mismatch", "framing.page"});
  }

  ParsedPage out;
  Page& p = out.page;
  p.version = header[4];
  p.flags = header[5];
  p.granule_position = static_cast<std::int64_t>(load_le64(header.data() + 6));
  p.serial_number = static_cast<std::int32_t>(load_le32(header.data() + 14));
  p.sequence_number = load_le32(header.data() + 18);
  p.checksum = stored;
  p.lacing.assign(lacing.begin(), lacing.end());
  p.body.assign(body.begin(), body.end());
  out.consumed = header_len + body_len;
  return out;
}

} // namespace oggmux::framing
