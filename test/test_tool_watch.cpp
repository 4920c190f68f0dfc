#include <gtest/gtest.h>

#include <stdio.h>

#include <memory>

#include "FakeHost.h"
#include "toolwatch/ToolWatch.h"

namespace {

class ToolWatchTest : public ::testing::Test {
protected:
  ToolWatchTest() : config_("dock") {
    config_.addSensor("e", "PA0");
    config_.addSensor("t0", "PB0");
    config_.addSensor("t1", "PB1");
    config_.addSensor("t2", "PB2");
  }

  ToolWatch& start(uint32_t now_ms = 0) {
    watch_.reset(new ToolWatch(config_, commands_, &status_, &status_, log_));
    EXPECT_TRUE(watch_->begin(now_ms));
    return *watch_;
  }

  void run(uint32_t from, uint32_t to) {
    for (uint32_t t = from; t < to; ++t) watch_->tick(t);
  }

  // Sets e/t0/t1/t2 in one burst at now_ms
  void apply(int e, int t0, int t1, int t2, uint32_t now_ms) {
    watch_->onSensorEdge("e", e, now_ms);
    watch_->onSensorEdge("t0", t0, now_ms);
    watch_->onSensorEdge("t1", t1, now_ms);
    watch_->onSensorEdge("t2", t2, now_ms);
  }

  ToolWatchConfig config_;
  FakeCommandSink commands_;
  FakeStatus status_;
  FakeLog log_;
  std::unique_ptr<ToolWatch> watch_;
};

// "e" plus t0.. until the config is full
void fillPinTable(ToolWatchConfig& c) {
  char label[8];
  char pin[8];
  c.addSensor("e", "PA0");
  for (int i = 1; i < ToolWatchConfig::MAX_SENSORS; ++i) {
    snprintf(label, sizeof(label), "t%d", i - 1);
    snprintf(pin, sizeof(pin), "PB%d", i);
    c.addSensor(label, pin);
  }
}

}  // namespace

TEST_F(ToolWatchTest, ZeroSensorsFailsAndStaysInert) {
  ToolWatchConfig empty("bare");
  ToolWatch w(empty, commands_, &status_, &status_, log_);

  EXPECT_FALSE(w.begin(0));
  EXPECT_FALSE(w.isReady());
  EXPECT_TRUE(log_.anyErrorContains("tool_watch bare: config error: no pins found"));

  w.onSensorEdge("e", 1, 1);
  for (uint32_t t = 0; t < 100; ++t) w.tick(t);

  EXPECT_EQ(w.currentTool(), CURRENT_TOOL_UNKNOWN);
  EXPECT_TRUE(commands_.lines.empty());
  EXPECT_EQ(w.status().getState().passes, 0u);
}

TEST_F(ToolWatchTest, StartupPassUnselectsWhenIdle) {
  ToolWatch& w = start();
  EXPECT_EQ(w.toolCount(), 3);
  EXPECT_EQ(w.currentTool(), CURRENT_TOOL_UNKNOWN);

  w.tick(0);

  EXPECT_EQ(w.currentTool(), CURRENT_TOOL_UNKNOWN);
  EXPECT_STREQ(w.status().getState().reason, "startup");
  ASSERT_EQ(commands_.lines.size(), 1u);
  EXPECT_EQ(commands_.lines[0], "UNSELECT_TOOL");
}

TEST_F(ToolWatchTest, ThreeBayWalkthrough) {
  ToolWatch& w = start();
  w.tick(0);
  EXPECT_EQ(w.currentTool(), -2);

  apply(1, 1, 0, 1, 10);
  w.tick(10);
  EXPECT_EQ(w.currentTool(), 1);

  apply(0, 1, 1, 1, 20);
  w.tick(20);
  EXPECT_EQ(w.currentTool(), -1);

  ASSERT_EQ(commands_.lines.size(), 3u);
  EXPECT_EQ(commands_.lines[1], "INITIALIZE_TOOLCHANGER T=1");
  EXPECT_EQ(commands_.lines[2], "UNSELECT_TOOL");
}

TEST_F(ToolWatchTest, DuplicateEdgeDoesNotRecompute) {
  ToolWatch& w = start();
  w.tick(0);
  const uint32_t passes = w.status().getState().passes;

  // Seeded at 0: a 0 edge is a duplicate
  w.onSensorEdge("t0", 0, 5);
  EXPECT_FALSE(w.scheduler().isPending());

  w.onSensorEdge("t0", 1, 10);
  w.tick(10);
  w.onSensorEdge("t0", 1, 20);
  run(20, 100);

  EXPECT_EQ(w.status().getState().passes, passes + 1);
}

TEST_F(ToolWatchTest, BurstWithinAssignDelayGivesOnePass) {
  config_.setAssignDelaySeconds(0.05f);
  ToolWatch& w = start();
  w.tick(0);
  const uint32_t passes = w.status().getState().passes;
  commands_.lines.clear();

  // Tool pick-up with contact bounce, edges 5 ms apart
  w.onSensorEdge("t0", 1, 100);
  w.onSensorEdge("t2", 1, 105);
  w.onSensorEdge("e", 1, 110);
  w.onSensorEdge("t1", 1, 115);
  w.onSensorEdge("t1", 0, 120);
  run(100, 169);
  EXPECT_EQ(w.status().getState().passes, passes);

  run(169, 400);
  EXPECT_EQ(w.status().getState().passes, passes + 1);
  EXPECT_EQ(w.currentTool(), 1);
  EXPECT_STREQ(w.status().getState().reason, "t1");

  ASSERT_EQ(commands_.lines.size(), 1u);
  EXPECT_EQ(commands_.lines[0], "INITIALIZE_TOOLCHANGER T=1");
}

TEST_F(ToolWatchTest, PrintingNeverUnselects) {
  status_.print_state = "printing";
  ToolWatch& w = start();
  w.tick(0);
  EXPECT_TRUE(commands_.lines.empty());

  apply(1, 0, 1, 1, 10);
  w.tick(10);
  ASSERT_EQ(commands_.lines.size(), 1u);
  EXPECT_EQ(commands_.lines[0], "INITIALIZE_TOOLCHANGER T=0");

  // Tool "disappears" mid-print: status follows, no command
  w.onSensorEdge("e", 0, 20);
  w.tick(20);
  EXPECT_EQ(w.currentTool(), CURRENT_TOOL_UNKNOWN);
  EXPECT_EQ(commands_.lines.size(), 1u);
}

TEST_F(ToolWatchTest, BusyToolchangerDefersUntilFree) {
  ToolWatch& w = start();
  w.tick(0);
  commands_.lines.clear();

  status_.toolchanger_status = "changing";
  apply(1, 1, 1, 0, 10);
  run(10, 500);
  EXPECT_EQ(w.currentTool(), 2);
  EXPECT_TRUE(commands_.lines.empty());
  EXPECT_TRUE(w.dispatcher().getState().has_pending);

  status_.toolchanger_status = "ready";
  run(500, 800);
  ASSERT_EQ(commands_.lines.size(), 1u);
  EXPECT_EQ(commands_.lines[0], "INITIALIZE_TOOLCHANGER T=2");
}

TEST_F(ToolWatchTest, SyncDisabledSendsNothing) {
  config_.setSyncToolchanger(false);
  ToolWatch& w = start();
  w.tick(0);
  apply(1, 0, 1, 1, 10);
  run(10, 300);

  EXPECT_EQ(w.currentTool(), 0);
  EXPECT_TRUE(commands_.lines.empty());
}

TEST_F(ToolWatchTest, ThrowingCommandSinkIsContained) {
  commands_.throw_on_run = true;
  ToolWatch& w = start();

  EXPECT_NO_THROW(w.tick(0));
  EXPECT_EQ(w.faultCount(), 1u);
  EXPECT_TRUE(log_.anyErrorContains("ERROR in compute/apply: gcode transport down"));

  // Status was still published before the dispatch failed
  EXPECT_EQ(w.status().getState().passes, 1u);

  // The loop keeps working afterwards
  commands_.throw_on_run = false;
  apply(1, 1, 0, 1, 10);
  EXPECT_NO_THROW(w.tick(10));
  EXPECT_EQ(w.currentTool(), 1);
  ASSERT_EQ(commands_.lines.size(), 1u);
}

TEST_F(ToolWatchTest, ThrowDuringRetryIsContained) {
  ToolWatch& w = start();
  w.tick(0);

  status_.toolchanger_status = "changing";
  apply(1, 1, 0, 1, 10);
  w.tick(10);

  commands_.throw_on_run = true;
  status_.toolchanger_status = "ready";
  EXPECT_NO_THROW(run(11, 300));
  EXPECT_TRUE(log_.anyErrorContains("ERROR in toolchanger sync"));
  EXPECT_EQ(w.faultCount(), 1u);
}

TEST_F(ToolWatchTest, RejectedLabelIsReportedNotFatal) {
  ToolWatch& w = start();
  w.tick(0);

  char label[8];
  for (int i = 0; i < 30; ++i) {
    snprintf(label, sizeof(label), "x%d", i);
    w.onSensorEdge(label, 1, 10);
  }

  EXPECT_GT(w.faultCount(), 0u);
  EXPECT_TRUE(log_.anyErrorContains("ERROR in callback (x"));
  EXPECT_EQ(w.sensors().size(), SensorStateStore::MAX_SENSORS + 0);
}

TEST_F(ToolWatchTest, FullPinTableStillAcceptsUnknownLabels) {
  ToolWatchConfig full("full");
  fillPinTable(full);

  ToolWatch w(full, commands_, &status_, &status_, log_);
  ASSERT_TRUE(w.begin(0));
  w.tick(0);

  w.onSensorEdge("filament", 1, 5);
  EXPECT_EQ(w.faultCount(), 0u);
  EXPECT_TRUE(w.sensors().has("filament"));
  EXPECT_EQ(w.toolCount(), ToolWatchConfig::MAX_SENSORS - 1);

  ToolWatchConfig over("over");
  fillPinTable(over);
  EXPECT_FALSE(over.addSensor("t99", "PC0"));
}

TEST_F(ToolWatchTest, VerboseLogsEdgesAndApply) {
  config_.setVerbose(true);
  ToolWatch& w = start();

  EXPECT_TRUE(log_.anyInfoContains("tool_watch dock: configured 4 pin(s): e=PA0, t0=PB0, t1=PB1, t2=PB2"));

  w.tick(0);
  EXPECT_TRUE(log_.anyInfoContains("APPLY current_tool=-2 (reason=startup N=3 ex=0 S=0 empties=3 bad=0)"));

  w.onSensorEdge("e", 1, 42);
  EXPECT_TRUE(log_.anyInfoContains("e -> 1 (t=42 ms)"));
  EXPECT_TRUE(log_.anyInfoContains("ASSIGN_TOOL -> UNSELECT_TOOL"));
}

TEST_F(ToolWatchTest, QuietWhenNotVerbose) {
  ToolWatch& w = start();
  w.tick(0);
  apply(1, 0, 1, 1, 10);
  w.tick(10);

  EXPECT_TRUE(log_.infos.empty());
  EXPECT_TRUE(log_.errors.empty());
}

TEST_F(ToolWatchTest, NoBaysConfiguredIsAlwaysUnknown) {
  ToolWatchConfig only_e("e_only");
  only_e.addSensor("e", "PA0");
  ToolWatch w(only_e, commands_, &status_, &status_, log_);
  ASSERT_TRUE(w.begin(0));

  w.onSensorEdge("e", 1, 1);
  for (uint32_t t = 0; t < 10; ++t) w.tick(t);

  EXPECT_EQ(w.toolCount(), 0);
  EXPECT_EQ(w.currentTool(), CURRENT_TOOL_UNKNOWN);
  EXPECT_FALSE(w.status().getState().diag.has_counts);
}
