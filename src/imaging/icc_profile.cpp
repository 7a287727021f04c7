#include <fadegif/imaging/icc_profile.hpp>
#include <zlib.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <map>

namespace fadegif::imaging {

namespace {

constexpr std::array<std::uint8_t, 8> kPngSignature = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
constexpr char kIccMarker[] = "ICC_PROFILE";  // followed by NUL
constexpr std::size_t kIccHeaderLen = sizeof(kIccMarker) + 2;  // marker, NUL, seq, count
// Larger inflated iCCP payloads are treated as malformed.
constexpr std::size_t kMaxIccBytes = 4u << 20;

std::uint8_t byte_at(std::span<const std::byte> s, std::size_t i) {
  return std::to_integer<std::uint8_t>(s[i]);
}

std::uint32_t be32(std::span<const std::byte> s, std::size_t i) {
  return (static_cast<std::uint32_t>(byte_at(s, i)) << 24) |
         (static_cast<std::uint32_t>(byte_at(s, i + 1)) << 16) |
         (static_cast<std::uint32_t>(byte_at(s, i + 2)) << 8) |
         static_cast<std::uint32_t>(byte_at(s, i + 3));
}

std::vector<std::byte> from_jpeg(std::span<const std::byte> in) {
  std::map<std::uint8_t, std::vector<std::byte>> chunks;
  std::size_t pos = 2;  // past SOI
  while (pos + 4 <= in.size()) {
    if (byte_at(in, pos) != 0xFF) break;
    const std::uint8_t marker = byte_at(in, pos + 1);
    if (marker == 0xFF) {  // fill byte
      ++pos;
      continue;
    }
    if (marker == 0xDA || marker == 0xD9) break;  // SOS / EOI: no more headers
    const std::size_t len = (static_cast<std::size_t>(byte_at(in, pos + 2)) << 8) | byte_at(in, pos + 3);
    if (len < 2 || pos + 2 + len > in.size()) break;
    const std::size_t payload = pos + 4;
    const std::size_t payload_len = len - 2;
    if (marker == 0xE2 && payload_len > kIccHeaderLen &&
        std::memcmp(in.data() + payload, kIccMarker, sizeof(kIccMarker)) == 0) {
      const std::uint8_t seq = byte_at(in, payload + sizeof(kIccMarker));
      auto body = in.subspan(payload + kIccHeaderLen, payload_len - kIccHeaderLen);
      chunks[seq].assign(body.begin(), body.end());
    }
    pos += 2 + len;
  }

  std::vector<std::byte> profile;
  for (const auto& [seq, body] : chunks) {
    profile.insert(profile.end(), body.begin(), body.end());
  }
  return profile;
}

std::vector<std::byte> inflate_all(std::span<const std::byte> compressed) {
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK) return {};

  std::vector<std::byte> out;
  std::array<Bytef, 16384> buf{};
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(compressed.data()));
  zs.avail_in = static_cast<uInt>(compressed.size());

  int rc = Z_OK;
  while (rc == Z_OK) {
    zs.next_out = buf.data();
    zs.avail_out = static_cast<uInt>(buf.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) break;
    const std::size_t produced = buf.size() - zs.avail_out;
    if (out.size() + produced > kMaxIccBytes) {
      rc = Z_BUF_ERROR;
      break;
    }
    const auto* first = reinterpret_cast<const std::byte*>(buf.data());
    out.insert(out.end(), first, first + produced);
  }
  inflateEnd(&zs);
  if (rc != Z_STREAM_END) return {};
  return out;
}

std::vector<std::byte> from_png(std::span<const std::byte> in) {
  std::size_t pos = kPngSignature.size();
  while (pos + 12 <= in.size()) {
    const std::uint32_t len = be32(in, pos);
    if (pos + 12 + len > in.size()) break;
    const char* type = reinterpret_cast<const char*>(in.data() + pos + 4);
    const std::size_t data = pos + 8;
    if (std::memcmp(type, "IDAT", 4) == 0 || std::memcmp(type, "IEND", 4) == 0) break;
    if (std::memcmp(type, "iCCP", 4) == 0) {
      auto body = in.subspan(data, len);
      const auto name_end = std::find(body.begin(), body.end(), std::byte{0});
      const std::size_t name_len = static_cast<std::size_t>(name_end - body.begin());
      // name, NUL, compression method (0 = deflate), zlib stream
      if (name_len + 2 > body.size() || std::to_integer<int>(body[name_len + 1]) != 0) return {};
      return inflate_all(body.subspan(name_len + 2));
    }
    pos += 12 + len;
  }
  return {};
}

}  // namespace

std::vector<std::byte> extract_icc_profile(std::span<const std::byte> encoded) {
  if (encoded.size() >= 4 && byte_at(encoded, 0) == 0xFF && byte_at(encoded, 1) == 0xD8) {
    return from_jpeg(encoded);
  }
  if (encoded.size() >= kPngSignature.size() &&
      std::equal(kPngSignature.begin(), kPngSignature.end(), encoded.begin(),
                 [](std::uint8_t a, std::byte b) { return a == std::to_integer<std::uint8_t>(b); })) {
    return from_png(encoded);
  }
  return {};
}

}  // namespace fadegif::imaging
