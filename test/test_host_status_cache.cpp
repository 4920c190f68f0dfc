#include <gtest/gtest.h>

#include <string.h>

#include "FakeHost.h"
#include "comms/HostStatusCache.h"
#include "toolwatch/SyncDispatcher.h"

TEST(HostStatusCache, AbsentBeforeFirstFrame) {
  HostStatusCache c(3000);
  c.setNow(10000);

  EXPECT_FALSE(c.hasStatus());
  EXPECT_FALSE(c.fresh());
  EXPECT_EQ(c.printState(), nullptr);
  EXPECT_EQ(c.toolchangerStatus(), nullptr);
}

TEST(HostStatusCache, FreshFrameReportsBoth) {
  HostStatusCache c(3000);
  c.store("printing", "ready", 100);
  c.setNow(3100);

  EXPECT_TRUE(c.fresh());
  EXPECT_STREQ(c.printState(), "printing");
  EXPECT_STREQ(c.toolchangerStatus(), "ready");
}

TEST(HostStatusCache, StaleFrameKeepsPrintStateDropsToolchanger) {
  HostStatusCache c(3000);
  c.store("printing", "changing", 100);
  c.setNow(3101);

  EXPECT_FALSE(c.fresh());
  EXPECT_STREQ(c.printState(), "printing");
  EXPECT_EQ(c.toolchangerStatus(), nullptr);
}

TEST(HostStatusCache, MissingObjectsInFrameReadAbsent) {
  HostStatusCache c(3000);
  c.store("printing", "ready", 0);
  c.store(nullptr, nullptr, 50);

  EXPECT_TRUE(c.hasStatus());
  EXPECT_EQ(c.printState(), nullptr);
  EXPECT_EQ(c.toolchangerStatus(), nullptr);
}

TEST(HostStatusCache, LongStatusIsTruncated) {
  HostStatusCache c(3000);
  c.store("a_status_string_longer_than_the_buffer", nullptr, 0);
  EXPECT_EQ(strlen(c.printState()), HostStatusCache::STRING_BYTES - 1);
}

TEST(HostStatusCache, HostSilenceMidPrintNeverUnselects) {
  HostStatusCache c(3000);
  FakeCommandSink commands;
  FakeLog sink;
  ToolWatchLog log(&sink, "cache", false);
  SyncDispatcher d(commands, &c, &c, log);

  c.store("printing", "ready", 0);

  // Host goes quiet for longer than the timeout, then a sensor glitch
  c.setNow(10000);
  d.request(InferredTool::unknown(), 10000);

  EXPECT_TRUE(d.isPrinting());
  EXPECT_FALSE(d.isToolchangerBusy());
  EXPECT_TRUE(commands.lines.empty());
}
