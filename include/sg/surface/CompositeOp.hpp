#pragma once
#include <cstdint>
#include <string>

namespace sg {

// Porter-Duff operators using the canvas 2D names.
//
// The low four bits of each value encode the blend:
//   bit 0: source weight is backdrop alpha      (bit 1 inverts it)
//   bit 2: backdrop weight is source alpha      (bit 3 inverts it)
//   result = wS * source + wB * backdrop
enum class CompositeOp : std::uint8_t {
  SourceIn = 1,
  Copy = 2,
  SourceOut = 3,
  DestinationIn = 4,
  DestinationAtop = 7,
  Lighter = 10,
  DestinationOver = 11,
  DestinationOut = 12,
  SourceAtop = 13,
  SourceOver = 14,
  Xor = 15
};

inline const char* toString(CompositeOp op) {
  switch (op) {
    case CompositeOp::SourceIn: return "source-in";
    case CompositeOp::Copy: return "copy";
    case CompositeOp::SourceOut: return "source-out";
    case CompositeOp::DestinationIn: return "destination-in";
    case CompositeOp::DestinationAtop: return "destination-atop";
    case CompositeOp::Lighter: return "lighter";
    case CompositeOp::DestinationOver: return "destination-over";
    case CompositeOp::DestinationOut: return "destination-out";
    case CompositeOp::SourceAtop: return "source-atop";
    case CompositeOp::SourceOver: return "source-over";
    case CompositeOp::Xor: return "xor";
    default: return "unknown";
  }
}

inline bool parseCompositeOp(const std::string& s, CompositeOp& out) {
  static const CompositeOp all[] = {
    CompositeOp::SourceIn, CompositeOp::Copy, CompositeOp::SourceOut,
    CompositeOp::DestinationIn, CompositeOp::DestinationAtop, CompositeOp::Lighter,
    CompositeOp::DestinationOver, CompositeOp::DestinationOut, CompositeOp::SourceAtop,
    CompositeOp::SourceOver, CompositeOp::Xor
  };
  for (CompositeOp op : all) {
    if (s == toString(op)) { out = op; return true; }
  }
  return false;
}

// Operators that also modify backdrop pixels the source does not cover.
inline bool affectsUncovered(CompositeOp op) {
  switch (op) {
    case CompositeOp::SourceIn:
    case CompositeOp::Copy:
    case CompositeOp::SourceOut:
    case CompositeOp::DestinationIn:
    case CompositeOp::DestinationAtop:
      return true;
    default:
      return false;
  }
}

} // namespace sg
