#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace sg {

// Byte length of the UTF-8 sequence starting with `lead`. Invalid lead bytes
// count as a single byte so malformed input still advances.
inline std::size_t utf8SequenceLength(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead >> 5) == 0x6) return 2;
  if ((lead >> 4) == 0xE) return 3;
  if ((lead >> 3) == 0x1E) return 4;
  return 1;
}

// Splits a string into one string per code point.
inline std::vector<std::string> splitCodePoints(const std::string& s) {
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < s.size()) {
    std::size_t n = utf8SequenceLength(static_cast<unsigned char>(s[i]));
    if (i + n > s.size()) n = s.size() - i;
    out.push_back(s.substr(i, n));
    i += n;
  }
  return out;
}

inline std::vector<std::uint32_t> decodeUtf8(const std::string& s) {
  std::vector<std::uint32_t> out;
  std::size_t i = 0;
  while (i < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    std::size_t n = utf8SequenceLength(c);
    if (i + n > s.size()) n = 1;
    std::uint32_t cp;
    switch (n) {
      case 2: cp = c & 0x1Fu; break;
      case 3: cp = c & 0x0Fu; break;
      case 4: cp = c & 0x07u; break;
      default: cp = c; break;
    }
    for (std::size_t k = 1; k < n; k++)
      cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3Fu);
    out.push_back(cp);
    i += n;
  }
  return out;
}

} // namespace sg
