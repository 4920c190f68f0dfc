#include "toolwatch/ToolWatchConfig.h"

#include <math.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "toolwatch/ToolInference.h"

static const char* const PIN_PREFIX = "pin_";
static constexpr float MAX_ASSIGN_DELAY_S = 3600.0f;

static void copyString(char* dst, size_t dst_len, const char* src) {
  memset(dst, 0, dst_len);
  if (src) strncpy(dst, src, dst_len - 1);
}

ToolWatchConfig::ToolWatchConfig(const char* name) {
  copyString(_name, sizeof(_name), name);
  copyString(_toolchanger, sizeof(_toolchanger), "toolchanger");
  memset(_error, 0, sizeof(_error));
}

void ToolWatchConfig::fail_(const char* fmt, ...) {
  if (_error[0] != '\0') return;   // keep the first error

  va_list args;
  va_start(args, fmt);
  vsnprintf(_error, sizeof(_error), fmt, args);
  va_end(args);
}

bool ToolWatchConfig::addSensor(const char* label, const char* pin) {
  if (!label || label[0] == '\0') {
    fail_("empty sensor label");
    return false;
  }
  if (strlen(label) >= LABEL_BYTES) {
    fail_("sensor label too long: %s", label);
    return false;
  }
  if (!pin || pin[0] == '\0') {
    fail_("pin_%s: missing pin", label);
    return false;
  }
  if (strlen(pin) >= PIN_BYTES) {
    fail_("pin_%s: pin description too long", label);
    return false;
  }
  for (uint8_t i = 0; i < _sensor_count; ++i) {
    if (strcmp(_sensors[i].label, label) == 0) {
      fail_("duplicate option pin_%s", label);
      return false;
    }
  }
  if (_sensor_count >= MAX_SENSORS) {
    fail_("too many pins (max %u)", (unsigned)MAX_SENSORS);
    return false;
  }

  Sensor& s = _sensors[_sensor_count++];
  copyString(s.label, sizeof(s.label), label);
  copyString(s.pin, sizeof(s.pin), pin);
  return true;
}

bool ToolWatchConfig::setOption(const char* key, const char* value) {
  if (!key) return false;

  const size_t prefix_len = strlen(PIN_PREFIX);
  if (strncmp(key, PIN_PREFIX, prefix_len) == 0) {
    return addSensor(key + prefix_len, value);
  }

  if (strcmp(key, "toolchanger") == 0) {
    if (!value || value[0] == '\0' || strlen(value) >= NAME_BYTES) {
      fail_("toolchanger: invalid name");
      return false;
    }
    setToolchangerName(value);
    return true;
  }

  const bool is_sync = (strcmp(key, "sync_toolchanger") == 0);
  if (is_sync || strcmp(key, "verbose") == 0) {
    bool b = false;
    if (!parseBool(value, b)) {
      fail_("%s: expected a boolean, got '%s'", key, value ? value : "");
      return false;
    }
    if (is_sync) {
      setSyncToolchanger(b);
    } else {
      setVerbose(b);
    }
    return true;
  }

  if (strcmp(key, "assign_delay") == 0) {
    float s = 0.0f;
    if (!parseSeconds(value, s)) {
      fail_("assign_delay: expected seconds, got '%s'", value ? value : "");
      return false;
    }
    setAssignDelaySeconds(s);
    return true;
  }

  fail_("unknown option '%s'", key);
  return false;
}

void ToolWatchConfig::setToolchangerName(const char* name) {
  copyString(_toolchanger, sizeof(_toolchanger), name);
}

void ToolWatchConfig::setAssignDelaySeconds(float seconds) {
  // Negative delays mean "immediate"
  if (!(seconds > 0.0f)) seconds = 0.0f;
  if (seconds > MAX_ASSIGN_DELAY_S) seconds = MAX_ASSIGN_DELAY_S;
  _assign_delay_ms = (uint32_t)(seconds * 1000.0f + 0.5f);
}

bool ToolWatchConfig::validate(char* err, size_t err_len) const {
  const char* msg = nullptr;
  if (_error[0] != '\0') {
    msg = _error;
  } else if (_sensor_count == 0) {
    msg = "no pins found. Add pin_<name>: <pin> options.";
  }

  if (!msg) return true;
  if (err && err_len > 0) copyString(err, err_len, msg);
  return false;
}

int ToolWatchConfig::toolCount() const {
  const char* labels[MAX_SENSORS];
  for (uint8_t i = 0; i < _sensor_count; ++i) labels[i] = _sensors[i].label;
  return inference::toolCount(labels, _sensor_count);
}

bool ToolWatchConfig::parseBool(const char* s, bool& out) {
  if (!s || s[0] == '\0') return false;

  if (strcmp(s, "true") == 0 || strcmp(s, "True") == 0) { out = true; return true; }
  if (strcmp(s, "false") == 0 || strcmp(s, "False") == 0) { out = false; return true; }

  // Integers: any non-zero value is "on"
  char* end = nullptr;
  const long v = strtol(s, &end, 10);
  if (end == s || *end != '\0') return false;
  out = (v != 0);
  return true;
}

bool ToolWatchConfig::parseSeconds(const char* s, float& out) {
  if (!s || s[0] == '\0') return false;

  char* end = nullptr;
  const double v = strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!isfinite(v)) return false;

  out = (float)v;
  return true;
}
