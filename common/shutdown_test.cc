// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/shutdown.h"
#include <chrono>
#include <csignal>
#include <gtest/gtest.h>
#include <thread>

using namespace std::chrono_literals;
using ShutdownSignal = natsbasic::ShutdownSignal;

TEST(ShutdownTest, NotTriggered) {
  ShutdownSignal shutdown;
  ASSERT_TRUE(shutdown.Open().ok());
  EXPECT_FALSE(shutdown.IsTriggered());
  absl::StatusOr<bool> triggered = shutdown.WaitFor(10ms);
  ASSERT_TRUE(triggered.ok());
  EXPECT_FALSE(*triggered);
}

TEST(ShutdownTest, WaitBeforeOpenFails) {
  ShutdownSignal shutdown;
  EXPECT_FALSE(shutdown.Wait().ok());
  EXPECT_FALSE(shutdown.InstallSignalHandlers().ok());
}

TEST(ShutdownTest, TriggerDirectly) {
  ShutdownSignal shutdown;
  ASSERT_TRUE(shutdown.Open().ok());
  shutdown.Trigger();
  EXPECT_TRUE(shutdown.IsTriggered());
  EXPECT_EQ(0, shutdown.SignalNumber());
  ASSERT_TRUE(shutdown.Wait().ok());
}

TEST(ShutdownTest, TriggerFromThread) {
  ShutdownSignal shutdown;
  ASSERT_TRUE(shutdown.Open().ok());
  std::thread t([&shutdown]() {
    std::this_thread::sleep_for(20ms);
    shutdown.Trigger();
  });
  ASSERT_TRUE(shutdown.Wait().ok());
  EXPECT_TRUE(shutdown.IsTriggered());
  t.join();
}

TEST(ShutdownTest, FirstTriggerWins) {
  ShutdownSignal shutdown;
  ASSERT_TRUE(shutdown.Open().ok());
  shutdown.Trigger(SIGTERM);
  shutdown.Trigger(SIGINT);
  EXPECT_EQ(SIGTERM, shutdown.SignalNumber());
}

TEST(ShutdownTest, Sigterm) {
  ShutdownSignal shutdown;
  ASSERT_TRUE(shutdown.Open().ok());
  ASSERT_TRUE(shutdown.InstallSignalHandlers().ok());
  raise(SIGTERM);
  absl::StatusOr<bool> triggered = shutdown.WaitFor(1s);
  ASSERT_TRUE(triggered.ok());
  EXPECT_TRUE(*triggered);
  EXPECT_EQ(SIGTERM, shutdown.SignalNumber());
}

TEST(ShutdownTest, Sigint) {
  ShutdownSignal shutdown;
  ASSERT_TRUE(shutdown.Open().ok());
  ASSERT_TRUE(shutdown.InstallSignalHandlers().ok());
  raise(SIGINT);
  ASSERT_TRUE(shutdown.Wait().ok());
  EXPECT_EQ(SIGINT, shutdown.SignalNumber());
}

TEST(ShutdownTest, OnlyOneOwnerOfSignals) {
  ShutdownSignal first;
  ShutdownSignal second;
  ASSERT_TRUE(first.Open().ok());
  ASSERT_TRUE(second.Open().ok());
  ASSERT_TRUE(first.InstallSignalHandlers().ok());
  EXPECT_FALSE(second.InstallSignalHandlers().ok());
  first.RestoreSignalHandlers();
  EXPECT_TRUE(second.InstallSignalHandlers().ok());
}

TEST(ShutdownTest, SignalName) {
  EXPECT_EQ("SIGINT", natsbasic::SignalName(SIGINT));
  EXPECT_EQ("SIGTERM", natsbasic::SignalName(SIGTERM));
  EXPECT_EQ("signal 1", natsbasic::SignalName(1));
}
