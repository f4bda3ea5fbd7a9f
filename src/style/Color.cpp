#include "sg/style/Color.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

namespace sg {

namespace {

int channelByte(float v) {
  v = std::min(std::max(v, 0.0f), 1.0f);
  return static_cast<int>(std::lround(v * 255.0f));
}

int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parseHex(const std::string& s, Color& out) {
  // s excludes the leading '#'
  std::vector<int> d;
  d.reserve(s.size());
  for (char c : s) {
    int v = hexDigit(c);
    if (v < 0) return false;
    d.push_back(v);
  }

  int r, g, b, a = 255;
  if (d.size() == 3 || d.size() == 4) {
    r = d[0] * 17; g = d[1] * 17; b = d[2] * 17;
    if (d.size() == 4) a = d[3] * 17;
  } else if (d.size() == 6 || d.size() == 8) {
    r = d[0] * 16 + d[1]; g = d[2] * 16 + d[3]; b = d[4] * 16 + d[5];
    if (d.size() == 8) a = d[6] * 16 + d[7];
  } else {
    return false;
  }

  out = {r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f};
  return true;
}

// "rgb(" / "rgba(" argument list: comma separated numbers.
bool parseFunctional(const std::string& args, bool hasAlpha, Color& out) {
  std::vector<double> vals;
  std::size_t pos = 0;
  while (pos <= args.size()) {
    std::size_t comma = args.find(',', pos);
    std::string part = args.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
    const char* begin = part.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin) return false;
    while (*end && std::isspace(static_cast<unsigned char>(*end))) end++;
    if (*end != '\0') return false;
    vals.push_back(v);
    if (comma == std::string::npos) break;
    pos = comma + 1;
  }

  if (vals.size() != (hasAlpha ? 4u : 3u)) return false;
  auto ch = [](double v) {
    return static_cast<float>(std::min(std::max(v, 0.0), 255.0) / 255.0);
  };
  out.r = ch(vals[0]);
  out.g = ch(vals[1]);
  out.b = ch(vals[2]);
  out.a = hasAlpha ? static_cast<float>(std::min(std::max(vals[3], 0.0), 1.0)) : 1.0f;
  return true;
}

struct NamedColor {
  const char* name;
  unsigned rgb;
};

const NamedColor kNamedColors[] = {
  {"black", 0x000000}, {"white", 0xffffff}, {"red", 0xff0000},
  {"green", 0x008000}, {"lime", 0x00ff00}, {"blue", 0x0000ff},
  {"yellow", 0xffff00}, {"cyan", 0x00ffff}, {"magenta", 0xff00ff},
  {"gray", 0x808080}, {"grey", 0x808080}, {"orange", 0xffa500},
};

} // namespace

std::string Color::toCss() const {
  char buf[64];
  if (a >= 1.0f) {
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x",
                  channelByte(r), channelByte(g), channelByte(b));
  } else {
    std::snprintf(buf, sizeof(buf), "rgba(%d,%d,%d,%g)",
                  channelByte(r), channelByte(g), channelByte(b),
                  static_cast<double>(std::max(a, 0.0f)));
  }
  return buf;
}

bool parseCssColor(const std::string& text, Color& out) {
  std::string s;
  s.reserve(text.size());
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (s.empty()) return false;

  if (s[0] == '#') return parseHex(s.substr(1), out);

  if (s.size() > 5 && s.compare(0, 5, "rgba(") == 0 && s.back() == ')')
    return parseFunctional(s.substr(5, s.size() - 6), true, out);
  if (s.size() > 4 && s.compare(0, 4, "rgb(") == 0 && s.back() == ')')
    return parseFunctional(s.substr(4, s.size() - 5), false, out);

  if (s == "transparent") {
    out = Color::transparent();
    return true;
  }
  for (const auto& nc : kNamedColors) {
    if (s == nc.name) {
      out = {((nc.rgb >> 16) & 0xFF) / 255.0f,
             ((nc.rgb >> 8) & 0xFF) / 255.0f,
             (nc.rgb & 0xFF) / 255.0f,
             1.0f};
      return true;
    }
  }
  return false;
}

} // namespace sg
