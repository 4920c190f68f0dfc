#pragma once

#include <stddef.h>
#include <stdint.h>

/*
  SensorStateStore

  Latest debounced value of every labeled sensor ("e", "t0", "t1", ...).

  - update() suppresses duplicate edges: storing the value a label already
    has is a no-op and reports UNCHANGED
  - unknown labels are accepted and stored as-is
  - values are NOT range checked here (inference flags anything not 0/1)

  Fixed capacity, no heap. A new label that does not fit (table full or label
  too long) is REJECTED and nothing is stored.
*/

class SensorStateStore {
public:
  // Configured pins, plus room for labels reported by anything else
  static constexpr uint8_t MAX_CONFIGURED = 16;
  static constexpr uint8_t SPARE_SLOTS = 8;
  static constexpr uint8_t MAX_SENSORS = MAX_CONFIGURED + SPARE_SLOTS;
  static constexpr size_t MAX_LABEL_LEN = 11;

  enum class UpdateResult : uint8_t {
    UNCHANGED = 0,
    CHANGED,
    REJECTED,
  };

  UpdateResult update(const char* label, int value);

  bool has(const char* label) const { return find_(label) >= 0; }

  // Stored value, or fallback when the label has never been seen
  int value(const char* label, int fallback = 0) const;

  uint8_t size() const { return _count; }

  void clear() { _count = 0; }

private:
  struct Entry {
    char label[MAX_LABEL_LEN + 1];
    int value;
  };

  int find_(const char* label) const;

  Entry _entries[MAX_SENSORS];
  uint8_t _count = 0;
};
