#include "toolwatch/ToolWatch.h"

#include <stdio.h>
#include <string.h>

#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#include <exception>
#define TOOLWATCH_HAS_EXCEPTIONS 1
#endif

ToolWatch::ToolWatch(const ToolWatchConfig& config,
                     CommandSink& commands,
                     const PrintStatusSource* print_status,
                     const ToolchangerStatusSource* toolchanger,
                     LogSink& log)
: _config(config),
  _log(&log, config.name(), config.verbose()),
  _scheduler(*this),
  _dispatcher(commands, print_status, toolchanger, _log)
{
}

bool ToolWatch::begin(uint32_t now_ms) {
  if (_ready) return true;

  // The config may have been filled in after construction
  _log.setVerbose(_config.verbose());

  char err[ToolWatchConfig::ERROR_BYTES];
  if (!_config.validate(err, sizeof(err))) {
    _log.error("config error: %s", err);
    return false;
  }

  // All configured sensors read 0 until their first edge arrives
  _sensors.clear();
  for (uint8_t i = 0; i < _config.sensorCount(); ++i) {
    if (_sensors.update(_config.sensorLabel(i), 0) == SensorStateStore::UpdateResult::REJECTED) {
      _log.error("config error: cannot track sensor '%s'", _config.sensorLabel(i));
      return false;
    }
  }
  _tool_count = _config.toolCount();

  logConfiguredPins_();

  _ready = true;
  _scheduler.schedule("startup", 0, now_ms);
  return true;
}

void ToolWatch::onSensorEdge(const char* label, int state, uint32_t now_ms) {
  if (!_ready) return;
  contain_(Step::PIN_CALLBACK, label, state, now_ms);
}

void ToolWatch::tick(uint32_t now_ms) {
  if (!_ready) return;

  // Fires onRecompute() when the quiet period is over
  _scheduler.tick(now_ms);

  if (_config.syncToolchanger()) {
    contain_(Step::TOOLCHANGER_SYNC, nullptr, 0, now_ms);
  }
}

void ToolWatch::onRecompute(const char* reason, uint32_t now_ms) {
  contain_(Step::COMPUTE_APPLY, reason, 0, now_ms);
}

/*=============================================================================
  CONTAINMENT
=============================================================================*/

void ToolWatch::contain_(Step step, const char* label, int state, uint32_t now_ms) {
#ifdef TOOLWATCH_HAS_EXCEPTIONS
  try {
    if (!runStep_(step, label, state, now_ms)) {
      reportFault_(step, label, nullptr);
    }
  } catch (const std::exception& e) {
    reportFault_(step, label, e.what());
  } catch (...) {
    reportFault_(step, label, "unknown exception");
  }
#else
  if (!runStep_(step, label, state, now_ms)) {
    reportFault_(step, label, nullptr);
  }
#endif
}

bool ToolWatch::runStep_(Step step, const char* label, int state, uint32_t now_ms) {
  switch (step) {
    case Step::PIN_CALLBACK:     return handleEdge_(label, state, now_ms);
    case Step::COMPUTE_APPLY:    return computeAndApply_(label, now_ms);
    case Step::TOOLCHANGER_SYNC: return _dispatcher.tick(now_ms);
  }
  return false;
}

void ToolWatch::reportFault_(Step step, const char* label, const char* what) {
  _faults++;

  const char* detail = what ? what : "step failed";
  switch (step) {
    case Step::PIN_CALLBACK:
      _log.error("ERROR in callback (%s): %s", label ? label : "?", detail);
      break;
    case Step::COMPUTE_APPLY:
      _log.error("ERROR in compute/apply: %s", detail);
      break;
    case Step::TOOLCHANGER_SYNC:
      _log.error("ERROR in toolchanger sync: %s", detail);
      break;
  }
}

/*=============================================================================
  STEPS
=============================================================================*/

bool ToolWatch::handleEdge_(const char* label, int state, uint32_t now_ms) {
  const SensorStateStore::UpdateResult r = _sensors.update(label, state);

  if (r == SensorStateStore::UpdateResult::UNCHANGED) return true;
  if (r == SensorStateStore::UpdateResult::REJECTED) return false;

  _log.info("%s -> %d (t=%lu ms)", label, state, (unsigned long)now_ms);
  _scheduler.schedule(label, _config.assignDelayMs(), now_ms);
  return true;
}

bool ToolWatch::computeAndApply_(const char* reason, uint32_t now_ms) {
  const inference::Result r = inference::computeCurrentTool(_sensors, _tool_count);
  _status.publish(r, reason, now_ms);

  const inference::Diagnostics& d = r.diag;
  if (d.has_counts) {
    _log.info("APPLY current_tool=%d (reason=%s N=%d ex=%d S=%d empties=%d bad=%d)",
              _status.read(), reason ? reason : "?", d.tool_count,
              d.engaged, d.occupied_sum, d.empties, d.invalid ? 1 : 0);
  } else {
    _log.info("APPLY current_tool=%d (reason=%s N=%d ex=- S=- empties=- bad=1)",
              _status.read(), reason ? reason : "?", d.tool_count);
  }

  if (!_config.syncToolchanger()) return true;
  return _dispatcher.request(r.tool, now_ms);
}

void ToolWatch::logConfiguredPins_() {
  if (!_log.verbose()) return;

  char list[ToolWatchLog::LINE_BYTES];
  size_t used = 0;
  list[0] = '\0';

  for (uint8_t i = 0; i < _config.sensorCount() && used < sizeof(list); ++i) {
    const int n = snprintf(list + used, sizeof(list) - used, "%s%s=%s",
                           (i == 0) ? "" : ", ",
                           _config.sensorLabel(i),
                           _config.sensorPin(i));
    if (n < 0) break;
    used += (size_t)n;
  }

  _log.info("configured %u pin(s): %s", (unsigned)_config.sensorCount(), list);
}
