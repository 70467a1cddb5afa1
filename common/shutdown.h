// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __COMMON_SHUTDOWN_H
#define __COMMON_SHUTDOWN_H

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "toolbelt/triggerfd.h"
#include <atomic>
#include <chrono>
#include <csignal>

namespace natsbasic {

// A ShutdownSignal is a one-shot cancellation token.  It is triggered
// either directly by calling Trigger or by one of the termination signals
// (SIGINT, SIGTERM) once InstallSignalHandlers has been called.  The
// owner blocks in Wait until that happens.
//
// Trigger only writes to an eventfd (or pipe) and stores the signal number
// so it is safe to call from a signal handler.
class ShutdownSignal {
public:
  ShutdownSignal() = default;
  ~ShutdownSignal();

  ShutdownSignal(const ShutdownSignal &) = delete;
  ShutdownSignal &operator=(const ShutdownSignal &) = delete;

  // Creates the underlying trigger fd.  Must be called before any other
  // function.
  absl::Status Open();

  // Route SIGINT and SIGTERM to this ShutdownSignal.  Only one
  // ShutdownSignal can own the signal handlers at a time.
  absl::Status InstallSignalHandlers();

  // Put back the signal dispositions that were in place before
  // InstallSignalHandlers.  Called by the destructor.
  void RestoreSignalHandlers();

  // Request shutdown.  The signal number is 0 if the trigger is not
  // the result of an OS signal.
  void Trigger(int sig = 0);

  bool IsTriggered() const { return triggered_; }
  int SignalNumber() const { return signal_number_; }

  // Blocks until the signal is triggered.  There is no timeout.
  absl::Status Wait();

  // Blocks for at most timeout.  Returns true if the signal was
  // triggered.
  absl::StatusOr<bool> WaitFor(std::chrono::nanoseconds timeout);

private:
  static void HandleSignal(int sig);
  absl::StatusOr<bool> Poll(int timeout_ms);

  toolbelt::TriggerFd trigger_fd_;
  bool open_ = false;
  bool handlers_installed_ = false;
  struct sigaction old_sigint_ = {};
  struct sigaction old_sigterm_ = {};
  std::atomic<bool> triggered_ = false;
  std::atomic<int> signal_number_ = 0;
};

// Returns "SIGINT", "SIGTERM" or "signal N".  For log messages.
std::string SignalName(int sig);

} // namespace natsbasic

#endif // __COMMON_SHUTDOWN_H
