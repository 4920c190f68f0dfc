#pragma once

#include <stdint.h>

/*
  InferredTool

  Best-effort conclusion about which tool is on the carriage.

  Integer projection (what the host sees as "current_tool"):
    -2 -> UNKNOWN   (sensor disagreement, invalid value, no bays configured)
    -1 -> UNMOUNTED (nothing held, every bay occupied)
    >=0 -> MOUNTED  (bay index of the tool being held)
*/

constexpr int CURRENT_TOOL_UNKNOWN   = -2;
constexpr int CURRENT_TOOL_UNMOUNTED = -1;

struct InferredTool {
  enum class Kind : uint8_t {
    UNKNOWN = 0,
    UNMOUNTED,
    MOUNTED,
  };

  Kind kind = Kind::UNKNOWN;
  int index = 0;   // only meaningful when kind == MOUNTED

  static InferredTool unknown() { return InferredTool(); }

  static InferredTool unmounted() {
    InferredTool t;
    t.kind = Kind::UNMOUNTED;
    return t;
  }

  static InferredTool mounted(int index) {
    InferredTool t;
    t.kind = Kind::MOUNTED;
    t.index = index;
    return t;
  }

  // Inverse of toInt(). Anything below -1 maps to UNKNOWN.
  static InferredTool fromInt(int value) {
    if (value >= 0) return mounted(value);
    if (value == CURRENT_TOOL_UNMOUNTED) return unmounted();
    return unknown();
  }

  bool isMounted() const { return kind == Kind::MOUNTED; }

  int toInt() const {
    switch (kind) {
      case Kind::MOUNTED:   return index;
      case Kind::UNMOUNTED: return CURRENT_TOOL_UNMOUNTED;
      default:              return CURRENT_TOOL_UNKNOWN;
    }
  }

  bool operator==(const InferredTool& other) const { return toInt() == other.toInt(); }
  bool operator!=(const InferredTool& other) const { return !(*this == other); }
};
