#include "sg/text/LineBreaker.hpp"
#include "sg/text/Utf8.hpp"

namespace sg {

std::vector<std::string> splitLogicalLines(const std::string& content) {
  std::vector<std::string> lines;
  std::string cur;
  for (std::size_t i = 0; i < content.size(); i++) {
    char c = content[i];
    if (c == '\r') {
      lines.push_back(cur);
      cur.clear();
      if (i + 1 < content.size() && content[i + 1] == '\n') i++;
    } else if (c == '\n') {
      lines.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  lines.push_back(cur);
  return lines;
}

std::vector<std::string> splitOn(const std::string& s, char sep) {
  std::vector<std::string> out;
  std::size_t start = 0;
  for (;;) {
    std::size_t pos = s.find(sep, start);
    if (pos == std::string::npos) {
      out.push_back(s.substr(start));
      return out;
    }
    out.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

std::string joinUnits(const std::vector<std::string>& units, const std::string& sep) {
  std::string out;
  for (std::size_t i = 0; i < units.size(); i++) {
    if (i > 0) out += sep;
    out += units[i];
  }
  return out;
}

std::vector<std::string> breakUnits(const std::vector<std::string>& units,
                                    const std::string& separator,
                                    const MeasureFn& measure,
                                    double maxWidth,
                                    std::vector<std::string>& emitted) {
  std::vector<std::string> line;
  std::size_t n = 0;
  while (n < units.size()) {
    line.push_back(units[n]);
    if (measure(joinUnits(line, separator)) <= maxWidth) {
      n++;
      continue;
    }

    std::string unit = std::move(line.back());
    line.pop_back();
    if (!line.empty()) {
      // Flush what fits and retry the popped unit on a fresh line.
      emitted.push_back(joinUnits(line, separator));
    } else {
      std::vector<std::string> pieces = splitCodePoints(unit);
      if (pieces.size() <= 1) {
        emitted.push_back(unit);
      } else {
        std::vector<std::string> rest = breakUnits(pieces, "", measure, maxWidth, emitted);
        emitted.push_back(joinUnits(rest, ""));
      }
      n++;
    }
    line.clear();
  }
  return line;
}

std::vector<std::string> wrapLine(const std::string& line,
                                  const MeasureFn& measure,
                                  double maxWidth) {
  std::vector<std::string> out;
  std::vector<std::string> rest = breakUnits(splitOn(line, ' '), " ", measure, maxWidth, out);
  if (!rest.empty()) out.push_back(joinUnits(rest, " "));
  return out;
}

std::vector<std::string> wrapText(const std::string& content,
                                  const MeasureFn& measure,
                                  double maxWidth) {
  std::vector<std::string> out;
  for (const auto& logical : splitLogicalLines(content)) {
    std::vector<std::string> wrapped = wrapLine(logical, measure, maxWidth);
    out.insert(out.end(), wrapped.begin(), wrapped.end());
  }
  return out;
}

} // namespace sg
