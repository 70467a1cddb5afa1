// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/shutdown.h"
#include "absl/strings/str_format.h"
#include <cerrno>
#include <cstring>
#include <sys/poll.h>

namespace natsbasic {

// The ShutdownSignal that owns the SIGINT and SIGTERM handlers.
static std::atomic<ShutdownSignal *> g_shutdown_signal = nullptr;

ShutdownSignal::~ShutdownSignal() { RestoreSignalHandlers(); }

absl::Status ShutdownSignal::Open() {
  absl::StatusOr<toolbelt::TriggerFd> fd = toolbelt::TriggerFd::Create();
  if (!fd.ok()) {
    return absl::InternalError(
        absl::StrFormat("Failed to create shutdown trigger fd: %s",
                        fd.status().ToString()));
  }
  trigger_fd_ = std::move(*fd);
  open_ = true;
  return absl::OkStatus();
}

void ShutdownSignal::HandleSignal(int sig) {
  ShutdownSignal *signal = g_shutdown_signal.load();
  if (signal != nullptr) {
    signal->Trigger(sig);
  }
}

absl::Status ShutdownSignal::InstallSignalHandlers() {
  if (!open_) {
    return absl::FailedPreconditionError("Shutdown signal is not open");
  }
  ShutdownSignal *expected = nullptr;
  if (!g_shutdown_signal.compare_exchange_strong(expected, this)) {
    if (expected == this) {
      return absl::OkStatus();
    }
    return absl::FailedPreconditionError(
        "Signal handlers are already owned by another shutdown signal");
  }

  struct sigaction sa = {};
  sa.sa_handler = HandleSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  if (::sigaction(SIGINT, &sa, &old_sigint_) == -1) {
    g_shutdown_signal = nullptr;
    return absl::InternalError(absl::StrFormat(
        "Failed to install SIGINT handler: %s", strerror(errno)));
  }
  if (::sigaction(SIGTERM, &sa, &old_sigterm_) == -1) {
    ::sigaction(SIGINT, &old_sigint_, nullptr);
    g_shutdown_signal = nullptr;
    return absl::InternalError(absl::StrFormat(
        "Failed to install SIGTERM handler: %s", strerror(errno)));
  }
  handlers_installed_ = true;
  return absl::OkStatus();
}

void ShutdownSignal::RestoreSignalHandlers() {
  if (!handlers_installed_) {
    return;
  }
  ::sigaction(SIGINT, &old_sigint_, nullptr);
  ::sigaction(SIGTERM, &old_sigterm_, nullptr);
  handlers_installed_ = false;
  g_shutdown_signal = nullptr;
}

void ShutdownSignal::Trigger(int sig) {
  // Only the first trigger records its signal number.
  bool expected = false;
  if (!triggered_.compare_exchange_strong(expected, true)) {
    return;
  }
  signal_number_ = sig;
  if (open_) {
    trigger_fd_.Trigger();
  }
}

absl::StatusOr<bool> ShutdownSignal::Poll(int timeout_ms) {
  if (!open_) {
    return absl::FailedPreconditionError("Shutdown signal is not open");
  }
  struct pollfd fd = {.fd = trigger_fd_.GetPollFd().Fd(), .events = POLLIN};
  for (;;) {
    if (triggered_) {
      return true;
    }
    int e = ::poll(&fd, 1, timeout_ms);
    if (e == -1) {
      if (errno == EINTR) {
        // Interrupted by a signal.  If it was one of ours the trigger is
        // set and we return above.
        continue;
      }
      return absl::InternalError(absl::StrFormat(
          "Failed to wait for shutdown signal: %s", strerror(errno)));
    }
    if (e == 0) {
      return static_cast<bool>(triggered_);
    }
    if ((fd.revents & POLLIN) != 0) {
      return true;
    }
  }
}

absl::Status ShutdownSignal::Wait() {
  absl::StatusOr<bool> triggered = Poll(-1);
  if (!triggered.ok()) {
    return triggered.status();
  }
  return absl::OkStatus();
}

absl::StatusOr<bool>
ShutdownSignal::WaitFor(std::chrono::nanoseconds timeout) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
  return Poll(static_cast<int>(ms.count()));
}

std::string SignalName(int sig) {
  switch (sig) {
  case SIGINT:
    return "SIGINT";
  case SIGTERM:
    return "SIGTERM";
  case 0:
    return "shutdown request";
  default:
    return absl::StrFormat("signal %d", sig);
  }
}

} // namespace natsbasic
