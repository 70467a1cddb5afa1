// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __CLI_RUNNER_H
#define __CLI_RUNNER_H

#include "absl/status/status.h"
#include "cli/config.h"
#include "client/connection.h"
#include "common/shutdown.h"
#include "toolbelt/logging.h"
#include <atomic>
#include <cstdio>
#include <mutex>

namespace natsbasic {

constexpr char kAppName[] = "NATS-BASIC";

// The states a run goes through.  A publish run goes from kConnected
// straight to kClosed.  kClosed is entered exactly once, whether the run
// succeeds or fails.
enum class RunnerState {
  kIdle,
  kConnected,
  kSubscribed,
  kDraining,
  kClosed,
};

const char *RunnerStateName(RunnerState state);

// Runs one validated invocation: connect, then either publish one message
// and flush it, or subscribe and log every message until the shutdown
// signal is triggered.  All log output goes to the runner's logger, which
// is named after the mode.  SIGINT and SIGTERM are routed to the shutdown
// signal only while subscribed; a publish run leaves them alone.
//
// A Runner can only be run once.
class Runner {
public:
  Runner(InvocationConfig config, Connector connector);

  Runner(const Runner &) = delete;
  Runner &operator=(const Runner &) = delete;

  // Any error from the broker (connect, publish, flush, subscribe) is
  // returned.  Errors while draining are only logged.
  absl::Status Run(ShutdownSignal &shutdown);

  // Called for each message received after it has been logged.  Runs on
  // the broker client's delivery thread.  Set before calling Run.
  void SetMessageHandler(MessageCallback handler) {
    handler_ = std::move(handler);
  }

  toolbelt::Logger &GetLogger() { return logger_; }
  const std::string &LoggerName() const { return logger_name_; }
  const InvocationConfig &Config() const { return config_; }

  RunnerState State() const { return state_; }
  int64_t NumPublished() const { return num_published_; }
  int64_t NumReceived() const { return num_received_; }

private:
  absl::Status Publish(Connection &conn);
  absl::Status SubscribeAndWait(Connection &conn, ShutdownSignal &shutdown);
  void OnMessage(const Message &msg);
  void SetState(RunnerState state);
  void Log(toolbelt::LogLevel level, const char *fmt, ...)
      __attribute__((format(printf, 3, 4)));

  InvocationConfig config_;
  Connector connector_;
  std::string logger_name_;
  toolbelt::Logger logger_;
  // Lines are logged from the main thread and the delivery thread.
  std::mutex log_lock_;
  MessageCallback handler_;
  std::atomic<RunnerState> state_ = RunnerState::kIdle;
  std::atomic<int64_t> num_published_ = 0;
  std::atomic<int64_t> num_received_ = 0;
};

// Validates the flags and runs them.  Returns the process exit code: 0 on
// success and 1 on any failure.  Log output goes to log_stream and
// diagnostics (plus usage for bad flags) go to err_stream.  Nothing is
// connected if the flags are invalid.
int RunInvocation(const RawFlags &flags, const Connector &connector,
                  ShutdownSignal &shutdown, FILE *log_stream = stdout,
                  FILE *err_stream = stderr);

} // namespace natsbasic

#endif // __CLI_RUNNER_H
