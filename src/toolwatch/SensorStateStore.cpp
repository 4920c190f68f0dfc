#include "toolwatch/SensorStateStore.h"

#include <string.h>

SensorStateStore::UpdateResult SensorStateStore::update(const char* label, int value) {
  if (!label) return UpdateResult::REJECTED;

  const int idx = find_(label);
  if (idx >= 0) {
    if (_entries[idx].value == value) return UpdateResult::UNCHANGED;
    _entries[idx].value = value;
    return UpdateResult::CHANGED;
  }

  // First sighting of this label
  const size_t len = strlen(label);
  if (len == 0 || len > MAX_LABEL_LEN) return UpdateResult::REJECTED;
  if (_count >= MAX_SENSORS) return UpdateResult::REJECTED;

  Entry& e = _entries[_count++];
  memcpy(e.label, label, len + 1);
  e.value = value;
  return UpdateResult::CHANGED;
}

int SensorStateStore::value(const char* label, int fallback) const {
  const int idx = find_(label);
  return (idx >= 0) ? _entries[idx].value : fallback;
}

int SensorStateStore::find_(const char* label) const {
  if (!label) return -1;
  for (uint8_t i = 0; i < _count; ++i) {
    if (strcmp(_entries[i].label, label) == 0) return (int)i;
  }
  return -1;
}
