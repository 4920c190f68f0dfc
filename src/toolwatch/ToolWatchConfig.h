#pragma once

#include <stddef.h>
#include <stdint.h>

#include "toolwatch/SensorStateStore.h"

/*
===============================================================================
  ToolWatchConfig.h
===============================================================================

  PURPOSE
  -------
  Options of one tool watch instance, validated in one place.

  Option names (also accepted by setOption()):
    pin_<label>       sensor pin description, one per sensor (at least one)
    toolchanger       name of the tool-changer status object ("toolchanger")
    sync_toolchanger  send sync commands (default on)
    verbose           diagnostic messages (default off)
    assign_delay      recompute quiet period in seconds (default 0.0)

  Errors are sticky: the first bad option is kept and reported by validate().
===============================================================================
*/

class ToolWatchConfig {
public:
  static constexpr uint8_t MAX_SENSORS = SensorStateStore::MAX_CONFIGURED;
  static constexpr size_t LABEL_BYTES = SensorStateStore::MAX_LABEL_LEN + 1;
  static constexpr size_t PIN_BYTES = 16;
  static constexpr size_t NAME_BYTES = 24;
  static constexpr size_t ERROR_BYTES = 80;

  explicit ToolWatchConfig(const char* name = "default");

  bool addSensor(const char* label, const char* pin);

  // Generic "key: value" entry point using the option names above
  bool setOption(const char* key, const char* value);

  void setToolchangerName(const char* name);
  void setSyncToolchanger(bool enable) { _sync_toolchanger = enable; }
  void setVerbose(bool enable) { _verbose = enable; }
  void setAssignDelaySeconds(float seconds);

  // Returns false on any recorded option error or when no sensor is configured
  bool validate(char* err, size_t err_len) const;

  const char* name() const { return _name; }
  const char* toolchangerName() const { return _toolchanger; }
  bool syncToolchanger() const { return _sync_toolchanger; }
  bool verbose() const { return _verbose; }
  uint32_t assignDelayMs() const { return _assign_delay_ms; }

  uint8_t sensorCount() const { return _sensor_count; }
  const char* sensorLabel(uint8_t i) const { return (i < _sensor_count) ? _sensors[i].label : nullptr; }
  const char* sensorPin(uint8_t i) const { return (i < _sensor_count) ? _sensors[i].pin : nullptr; }

  // N: one greater than the highest configured bay index
  int toolCount() const;

  static bool parseBool(const char* s, bool& out);
  static bool parseSeconds(const char* s, float& out);

private:
  struct Sensor {
    char label[LABEL_BYTES];
    char pin[PIN_BYTES];
  };

  void fail_(const char* fmt, ...);

  char _name[NAME_BYTES];
  char _toolchanger[NAME_BYTES];
  bool _sync_toolchanger = true;
  bool _verbose = false;
  uint32_t _assign_delay_ms = 0;

  Sensor _sensors[MAX_SENSORS];
  uint8_t _sensor_count = 0;

  char _error[ERROR_BYTES];
};
