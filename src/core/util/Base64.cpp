#include "Base64.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace filemeta {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::uint8_t kInvalid = 0xFF;

std::array<std::uint8_t, 256> reverse_table() {
  std::array<std::uint8_t, 256> map{};
  map.fill(kInvalid);
  for (std::size_t i = 0; i < 64; ++i) {
    map[static_cast<std::uint8_t>(kAlphabet[i])] = static_cast<std::uint8_t>(i);
  }
  return map;
}

} // namespace

std::string encodeBase64(const Bytes& data) {
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);
  std::size_t i = 0;
  for (; i + 3 <= data.size(); i += 3) {
    std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                           (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                           static_cast<std::uint32_t>(data[i + 2]);
    out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    out.push_back(kAlphabet[triple & 0x3F]);
  }
  const std::size_t rest = data.size() - i;
  if (rest == 0) return out;

  std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
  if (rest == 2) triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
  out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
  out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
  out.push_back(rest == 2 ? kAlphabet[(triple >> 6) & 0x3F] : '=');
  out.push_back('=');
  return out;
}

std::optional<Bytes> decodeBase64(const std::string& text) {
  static const std::array<std::uint8_t, 256> kReverse = reverse_table();

  std::string s;
  s.reserve(text.size());
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) s.push_back(c);
  }
  if (s.size() % 4 != 0) return std::nullopt;

  Bytes out;
  out.reserve(s.size() / 4 * 3);
  for (std::size_t i = 0; i < s.size(); i += 4) {
    const bool last = i + 4 == s.size();
    const int pad = (s[i + 3] == '=') + (s[i + 2] == '=');
    if (pad && !last) return std::nullopt;
    if (s[i + 2] == '=' && s[i + 3] != '=') return std::nullopt;

    std::uint32_t triple = 0;
    for (int k = 0; k < 4 - pad; ++k) {
      std::uint8_t v = kReverse[static_cast<std::uint8_t>(s[i + k])];
      if (v == kInvalid) return std::nullopt;
      triple |= static_cast<std::uint32_t>(v) << (18 - 6 * k);
    }
    out.push_back(static_cast<std::uint8_t>(triple >> 16));
    if (pad < 2) out.push_back(static_cast<std::uint8_t>(triple >> 8));
    if (pad < 1) out.push_back(static_cast<std::uint8_t>(triple));
  }
  return out;
}

} // namespace filemeta
