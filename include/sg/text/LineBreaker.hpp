#pragma once
#include <functional>
#include <string>
#include <vector>

namespace sg {

// Rendered width of a candidate run under the caller's current font.
using MeasureFn = std::function<double(const std::string&)>;

// Split raw content into logical lines on "\r\n", "\n" or "\r".
std::vector<std::string> splitLogicalLines(const std::string& content);

// Split on every occurrence of `sep`; empty fields are kept.
std::vector<std::string> splitOn(const std::string& s, char sep);

std::string joinUnits(const std::vector<std::string>& units, const std::string& sep);

// Greedy line breaking over `units` joined by `separator`.
//
// Units are accumulated until the measured run exceeds maxWidth; the last
// unit is then popped and the run so far is appended to `emitted`, and the
// popped unit starts the next run. A unit too wide on its own is broken by
// code points (separator "") through the same function: its full fragments
// go to `emitted` followed by its residual fragment. A single code point
// wider than maxWidth is emitted on its own.
//
// Returns the residual run that has not been emitted yet.
std::vector<std::string> breakUnits(const std::vector<std::string>& units,
                                    const std::string& separator,
                                    const MeasureFn& measure,
                                    double maxWidth,
                                    std::vector<std::string>& emitted);

// Wrap one logical line (words split on ' ').
std::vector<std::string> wrapLine(const std::string& line,
                                  const MeasureFn& measure,
                                  double maxWidth);

// Wrap every logical line of `content`, top to bottom.
std::vector<std::string> wrapText(const std::string& content,
                                  const MeasureFn& measure,
                                  double maxWidth);

} // namespace sg
