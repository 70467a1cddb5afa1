// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "cli/runner.h"
#include "absl/flags/usage.h"
#include "absl/strings/str_format.h"
#include <stdarg.h>

namespace natsbasic {

const char *RunnerStateName(RunnerState state) {
  switch (state) {
  case RunnerState::kIdle:
    return "idle";
  case RunnerState::kConnected:
    return "connected";
  case RunnerState::kSubscribed:
    return "subscribed";
  case RunnerState::kDraining:
    return "draining";
  case RunnerState::kClosed:
    return "closed";
  }
  return "unknown";
}

Runner::Runner(InvocationConfig config, Connector connector)
    : config_(std::move(config)), connector_(std::move(connector)),
      logger_name_(
          absl::StrFormat("%s [%s]", kAppName, ModeName(config_.mode))),
      logger_(logger_name_) {
  logger_.SetLogLevel(config_.log_level);
}

void Runner::Log(toolbelt::LogLevel level, const char *fmt, ...) {
  char buffer[4096];
  va_list ap;
  va_start(ap, fmt);
  vsnprintf(buffer, sizeof(buffer), fmt, ap);
  va_end(ap);
  std::lock_guard<std::mutex> lock(log_lock_);
  logger_.Log(level, "%s", buffer);
}

void Runner::SetState(RunnerState state) {
  RunnerState old_state = state_.exchange(state);
  Log(toolbelt::LogLevel::kDebug, "State %s -> %s",
      RunnerStateName(old_state), RunnerStateName(state));
}

absl::Status Runner::Run(ShutdownSignal &shutdown) {
  if (State() != RunnerState::kIdle) {
    return absl::FailedPreconditionError("Runner has already been run");
  }
  Log(toolbelt::LogLevel::kInfo, "Connecting to NATS server at %s ...",
      config_.Url().c_str());
  absl::StatusOr<std::unique_ptr<Connection>> conn =
      connector_(config_.connection, logger_);
  if (!conn.ok()) {
    SetState(RunnerState::kClosed);
    return conn.status();
  }
  SetState(RunnerState::kConnected);
  std::string url = (*conn)->ConnectedUrl();
  Log(toolbelt::LogLevel::kInfo, "Connected to NATS server %s",
      url.empty() ? config_.Url().c_str() : url.c_str());

  absl::Status status;
  switch (config_.mode) {
  case Mode::kPublish:
    status = Publish(**conn);
    break;
  case Mode::kSubscribe:
    status = SubscribeAndWait(**conn, shutdown);
    break;
  }

  (*conn)->Close();
  conn->reset();
  SetState(RunnerState::kClosed);
  if (status.ok() && config_.mode == Mode::kSubscribe) {
    Log(toolbelt::LogLevel::kInfo, "Bye!");
  }
  return status;
}

absl::Status Runner::Publish(Connection &conn) {
  Log(toolbelt::LogLevel::kInfo, "Publishing to subject \"%s\" ...",
      config_.subject.c_str());
  num_published_++;
  if (absl::Status s = conn.Publish(config_.subject, config_.payload);
      !s.ok()) {
    return s;
  }
  // The publish only buffered the message.  Without the flush we could
  // exit before it has been sent.
  if (absl::Status s = conn.Flush(config_.flush_timeout); !s.ok()) {
    return s;
  }
  Log(toolbelt::LogLevel::kInfo,
      "Message published, subject: \"%s\", payload: \"%.*s\"",
      config_.subject.c_str(), static_cast<int>(config_.payload.size()),
      config_.payload.data());
  return absl::OkStatus();
}

absl::Status Runner::SubscribeAndWait(Connection &conn,
                                      ShutdownSignal &shutdown) {
  // Only a subscriber waits for a termination signal.
  if (absl::Status s = shutdown.InstallSignalHandlers(); !s.ok()) {
    return s;
  }
  Log(toolbelt::LogLevel::kInfo,
      "Subscribing to subject \"%s\", waiting for messages (Ctrl+C to "
      "quit) ...",
      config_.subject.c_str());
  absl::StatusOr<std::unique_ptr<Subscription>> sub = conn.Subscribe(
      config_.subject, [this](const Message &msg) { OnMessage(msg); });
  if (!sub.ok()) {
    return sub.status();
  }
  SetState(RunnerState::kSubscribed);

  absl::Status wait_status = shutdown.Wait();
  if (wait_status.ok()) {
    Log(toolbelt::LogLevel::kInfo, "Received %s, shutting down gracefully ...",
        SignalName(shutdown.SignalNumber()).c_str());
  } else {
    Log(toolbelt::LogLevel::kError, "%s, shutting down",
        wait_status.ToString().c_str());
  }

  SetState(RunnerState::kDraining);
  if (absl::Status s = (*sub)->Drain(config_.drain_timeout); !s.ok()) {
    Log(toolbelt::LogLevel::kWarning, "Error during drain: %s",
        s.ToString().c_str());
  }
  Log(toolbelt::LogLevel::kInfo, "Received %d message%s on \"%s\"",
      static_cast<int>((*sub)->NumDelivered()),
      (*sub)->NumDelivered() == 1 ? "" : "s", config_.subject.c_str());
  sub->reset();
  return wait_status;
}

void Runner::OnMessage(const Message &msg) {
  if (State() == RunnerState::kClosed) {
    return;
  }
  num_received_++;
  Log(toolbelt::LogLevel::kInfo, "Received on [%s]: %.*s",
      msg.subject.c_str(), static_cast<int>(msg.payload.size()),
      msg.payload.data());
  if (handler_) {
    handler_(msg);
  }
}

int RunInvocation(const RawFlags &flags, const Connector &connector,
                  ShutdownSignal &shutdown, FILE *log_stream,
                  FILE *err_stream) {
  absl::StatusOr<InvocationConfig> config = ValidateFlags(flags);
  if (!config.ok()) {
    std::string message(config.status().message());
    std::string usage(absl::ProgramUsageMessage());
    fprintf(err_stream, "Error: %s\n%s\n", message.c_str(), usage.c_str());
    return 1;
  }

  Runner runner(std::move(*config), connector);
  runner.GetLogger().SetOutputStream(log_stream);
  absl::Status s = runner.Run(shutdown);
  if (!s.ok()) {
    fprintf(err_stream, "Error: %s\n", s.ToString().c_str());
    return 1;
  }
  return 0;
}

} // namespace natsbasic
