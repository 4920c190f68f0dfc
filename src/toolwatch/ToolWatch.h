#pragma once

#include <stdint.h>

#include "toolwatch/HostInterfaces.h"
#include "toolwatch/RecomputeScheduler.h"
#include "toolwatch/SensorStateStore.h"
#include "toolwatch/StatusExporter.h"
#include "toolwatch/SyncDispatcher.h"
#include "toolwatch/ToolInference.h"
#include "toolwatch/ToolWatchConfig.h"
#include "toolwatch/ToolWatchLog.h"

/*
===============================================================================
  ToolWatch.h
===============================================================================

  PURPOSE
  -------
  One tool watch instance: sensors in, current_tool + sync commands out.

    sensor edge -> SensorStateStore -> RecomputeScheduler (re-armed)
    scheduler fire -> inference -> StatusExporter -> SyncDispatcher

  USAGE
  -----
  - Construct with the config and the host collaborators
  - begin(now_ms) once; false means the configuration is unusable and the
    instance stays inert
  - Feed debounced edges through onSensorEdge()
  - Call tick(now_ms) every loop() pass

  IMPORTANT
  ---------
  Every entry point is contained: a failing step is logged as
  "ERROR in <step>" and dropped. Nothing escapes into the caller's loop.

  The config must outlive the ToolWatch (it is referenced, not copied).
===============================================================================
*/

class ToolWatch : public SensorEdgeHandler, private RecomputeScheduler::Listener {
public:
  ToolWatch(const ToolWatchConfig& config,
            CommandSink& commands,
            const PrintStatusSource* print_status,
            const ToolchangerStatusSource* toolchanger,
            LogSink& log);

  bool begin(uint32_t now_ms);

  void onSensorEdge(const char* label, int state, uint32_t now_ms) override;

  // Runs a due recompute pass and a due sync retry poll
  void tick(uint32_t now_ms);

  bool isReady() const { return _ready; }

  // -2 unknown, -1 unmounted, >=0 mounted tool index
  int currentTool() const { return _status.read(); }
  int toolCount() const { return _tool_count; }

  const char* name() const { return _config.name(); }
  const StatusExporter& status() const { return _status; }
  const SensorStateStore& sensors() const { return _sensors; }
  const RecomputeScheduler& scheduler() const { return _scheduler; }
  const SyncDispatcher& dispatcher() const { return _dispatcher; }

  // Number of contained step failures since begin()
  uint32_t faultCount() const { return _faults; }

private:
  enum class Step : uint8_t {
    PIN_CALLBACK = 0,
    COMPUTE_APPLY,
    TOOLCHANGER_SYNC,
  };

  void onRecompute(const char* reason, uint32_t now_ms) override;

  void contain_(Step step, const char* label, int state, uint32_t now_ms);
  bool runStep_(Step step, const char* label, int state, uint32_t now_ms);
  void reportFault_(Step step, const char* label, const char* what);

  bool handleEdge_(const char* label, int state, uint32_t now_ms);
  bool computeAndApply_(const char* reason, uint32_t now_ms);
  void logConfiguredPins_();

  const ToolWatchConfig& _config;
  ToolWatchLog _log;

  SensorStateStore _sensors;
  RecomputeScheduler _scheduler;
  StatusExporter _status;
  SyncDispatcher _dispatcher;

  int _tool_count = 0;
  bool _ready = false;
  uint32_t _faults = 0;
};
