// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "client/nats_connection.h"
#include "absl/strings/str_format.h"
#include <climits>

namespace natsbasic {

// How long Close waits for the library to report that the connection
// has closed.
static constexpr std::chrono::seconds kCloseTimeout(5);

// Drain timeout used when a subscription is destroyed without having been
// drained.
static constexpr std::chrono::milliseconds kImplicitDrainTimeout(1000);

absl::Status NatsError(natsStatus s, absl::string_view what) {
  if (s == NATS_OK) {
    return absl::OkStatus();
  }
  std::string message = absl::StrFormat("%s: %s", what, natsStatus_GetText(s));
  natsStatus last_status = NATS_OK;
  const char *last_error = nats_GetLastError(&last_status);
  if (last_error != nullptr && last_error[0] != '\0' &&
      message.find(last_error) == std::string::npos) {
    absl::StrAppendFormat(&message, " (%s)", last_error);
  }
  switch (s) {
  case NATS_TIMEOUT:
    return absl::DeadlineExceededError(message);
  case NATS_NO_SERVER:
  case NATS_IO_ERROR:
  case NATS_STALE_CONNECTION:
  case NATS_CONNECTION_CLOSED:
  case NATS_CONNECTION_DISCONNECTED:
    return absl::UnavailableError(message);
  case NATS_INVALID_ARG:
  case NATS_INVALID_SUBJECT:
  case NATS_INVALID_TIMEOUT:
  case NATS_MAX_PAYLOAD:
  case NATS_ADDRESS_MISSING:
    return absl::InvalidArgumentError(message);
  case NATS_CONNECTION_AUTH_FAILED:
  case NATS_NOT_PERMITTED:
    return absl::PermissionDeniedError(message);
  case NATS_SLOW_CONSUMER:
  case NATS_NO_MEMORY:
  case NATS_INSUFFICIENT_BUFFER:
    return absl::ResourceExhaustedError(message);
  case NATS_ILLEGAL_STATE:
  case NATS_INVALID_SUBSCRIPTION:
    return absl::FailedPreconditionError(message);
  default:
    return absl::InternalError(message);
  }
}

NatsSubscription::~NatsSubscription() {
  if (sub_ == nullptr) {
    return;
  }
  if (!drained_) {
    if (absl::Status s = Drain(kImplicitDrainTimeout); !s.ok()) {
      logger_.Log(toolbelt::LogLevel::kDebug, "Implicit drain of %s: %s",
                  subject_.c_str(), s.ToString().c_str());
    }
  }
  StopCallbacks();
  natsSubscription_Destroy(sub_);
}

void NatsSubscription::OnMessage(natsConnection *nc, natsSubscription *sub,
                                 natsMsg *msg, void *closure) {
  auto *self = reinterpret_cast<NatsSubscription *>(closure);
  const char *reply = natsMsg_GetReply(msg);
  const char *data = natsMsg_GetData(msg);
  int length = natsMsg_GetDataLength(msg);
  Message m = {
      .subject = natsMsg_GetSubject(msg),
      .reply = reply == nullptr ? "" : reply,
      .payload = data == nullptr || length <= 0
                     ? std::string()
                     : std::string(data, static_cast<size_t>(length)),
  };
  natsMsg_Destroy(msg);
  {
    std::lock_guard<std::mutex> lock(self->callback_lock_);
    if (self->stopped_) {
      return;
    }
    self->running_callbacks_++;
  }
  self->num_delivered_++;
  if (self->callback_) {
    self->callback_(m);
  }
  std::lock_guard<std::mutex> lock(self->callback_lock_);
  self->running_callbacks_--;
  self->callback_cv_.notify_all();
}

void NatsSubscription::StopCallbacks() {
  std::unique_lock<std::mutex> lock(callback_lock_);
  stopped_ = true;
  callback_cv_.wait(lock, [this] { return running_callbacks_ == 0; });
}

absl::Status NatsSubscription::Drain(std::chrono::milliseconds timeout) {
  if (drained_) {
    return absl::OkStatus();
  }
  drained_ = true;
  natsStatus s = natsSubscription_Drain(sub_);
  if (s != NATS_OK) {
    absl::Status status = NatsError(s, "Failed to drain subscription");
    natsSubscription_Unsubscribe(sub_);
    StopCallbacks();
    return status;
  }
  s = natsSubscription_WaitForDrainCompletion(sub_, timeout.count());
  if (s != NATS_OK) {
    absl::Status status =
        NatsError(s, "Failed waiting for subscription drain to complete");
    // Messages still queued are dropped.  A callback that is running
    // now is allowed to finish.
    natsSubscription_Unsubscribe(sub_);
    StopCallbacks();
    return status;
  }
  StopCallbacks();
  return NatsError(natsSubscription_DrainCompletionStatus(sub_),
                   "Subscription drain failed");
}

NatsConnection::~NatsConnection() { Close(); }

void NatsConnection::OnDisconnected(natsConnection *nc, void *closure) {
  auto *self = reinterpret_cast<NatsConnection *>(closure);
  if (self->closing_) {
    return;
  }
  self->logger_.Log(toolbelt::LogLevel::kWarning,
                    "Disconnected from NATS server");
}

void NatsConnection::OnReconnected(natsConnection *nc, void *closure) {
  auto *self = reinterpret_cast<NatsConnection *>(closure);
  char url[256];
  if (natsConnection_GetConnectedUrl(nc, url, sizeof(url)) != NATS_OK) {
    url[0] = '\0';
  }
  self->logger_.Log(toolbelt::LogLevel::kInfo,
                    "Reconnected to NATS server %s", url);
}

void NatsConnection::OnClosed(natsConnection *nc, void *closure) {
  auto *self = reinterpret_cast<NatsConnection *>(closure);
  self->logger_.Log(toolbelt::LogLevel::kDebug, "Connection closed");
  std::lock_guard<std::mutex> lock(self->closed_lock_);
  self->closed_ = true;
  self->closed_cv_.notify_all();
}

void NatsConnection::OnAsyncError(natsConnection *nc, natsSubscription *sub,
                                  natsStatus err, void *closure) {
  auto *self = reinterpret_cast<NatsConnection *>(closure);
  if (err == NATS_SLOW_CONSUMER) {
    self->logger_.Log(toolbelt::LogLevel::kWarning,
                      "Slow consumer, messages have been dropped");
    return;
  }
  self->logger_.Log(toolbelt::LogLevel::kError, "Asynchronous error: %s",
                    natsStatus_GetText(err));
}

absl::StatusOr<std::unique_ptr<Connection>>
NatsConnection::Connect(const ConnectionOptions &options,
                        toolbelt::Logger &logger) {
  natsOptions *opts = nullptr;
  natsStatus s = natsOptions_Create(&opts);
  if (s != NATS_OK) {
    return NatsError(s, "Failed to create connection options");
  }
  std::unique_ptr<natsOptions, void (*)(natsOptions *)> opts_holder(
      opts, natsOptions_Destroy);

  // The connection object exists before the library connects since it is
  // the closure for the event callbacks.
  std::unique_ptr<NatsConnection> conn(new NatsConnection(logger));

  s = natsOptions_SetURL(opts, options.Url().c_str());
  if (s == NATS_OK) {
    s = natsOptions_SetName(opts, options.Name().c_str());
  }
  if (s == NATS_OK) {
    s = natsOptions_SetTimeout(opts, options.ConnectTimeout().count());
  }
  if (s == NATS_OK && options.HasCredentials()) {
    s = natsOptions_SetUserInfo(opts, options.User().c_str(),
                                options.Password().c_str());
  }
  if (s == NATS_OK) {
    s = natsOptions_SetDisconnectedCB(opts, OnDisconnected, conn.get());
  }
  if (s == NATS_OK) {
    s = natsOptions_SetReconnectedCB(opts, OnReconnected, conn.get());
  }
  if (s == NATS_OK) {
    s = natsOptions_SetClosedCB(opts, OnClosed, conn.get());
  }
  if (s == NATS_OK) {
    s = natsOptions_SetErrorHandler(opts, OnAsyncError, conn.get());
  }
  if (s != NATS_OK) {
    return NatsError(s, absl::StrFormat("Invalid connection options for %s",
                                        options.Url()));
  }

  s = natsConnection_Connect(&conn->conn_, opts);
  if (s != NATS_OK) {
    conn->conn_ = nullptr;
    absl::Status status = NatsError(
        s, absl::StrFormat("Failed to connect to NATS at %s", options.Url()));
    if (absl::IsDeadlineExceeded(status)) {
      return absl::UnavailableError(status.message());
    }
    return status;
  }
  return std::unique_ptr<Connection>(std::move(conn));
}

absl::Status NatsConnection::Publish(const std::string &subject,
                                     const void *data, size_t length) {
  if (conn_ == nullptr) {
    return absl::FailedPreconditionError("Failed to publish: not connected");
  }
  if (length > static_cast<size_t>(INT_MAX)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Failed to publish: payload of %d bytes is too large",
                        length));
  }
  return NatsError(natsConnection_Publish(conn_, subject.c_str(), data,
                                          static_cast<int>(length)),
                   "Failed to publish");
}

absl::Status NatsConnection::Flush(std::chrono::milliseconds timeout) {
  if (conn_ == nullptr) {
    return absl::FailedPreconditionError("Failed to flush: not connected");
  }
  return NatsError(natsConnection_FlushTimeout(conn_, timeout.count()),
                   "Failed to flush");
}

absl::StatusOr<std::unique_ptr<Subscription>>
NatsConnection::Subscribe(const std::string &subject,
                          MessageCallback callback) {
  if (conn_ == nullptr) {
    return absl::FailedPreconditionError("Failed to subscribe: not connected");
  }
  // The subscription is the closure for the message handler so it
  // has to be at a fixed address before the library can call it.
  auto sub = std::make_unique<NatsSubscription>(subject, std::move(callback),
                                                logger_);
  natsStatus s = natsConnection_Subscribe(&sub->sub_, conn_, subject.c_str(),
                                          NatsSubscription::OnMessage,
                                          sub.get());
  if (s != NATS_OK) {
    sub->sub_ = nullptr;
    return NatsError(
        s, absl::StrFormat("Failed to subscribe to \"%s\"", subject));
  }
  return std::unique_ptr<Subscription>(std::move(sub));
}

std::string NatsConnection::ConnectedUrl() const {
  if (conn_ == nullptr) {
    return "";
  }
  char url[256];
  if (natsConnection_GetConnectedUrl(conn_, url, sizeof(url)) != NATS_OK) {
    return "";
  }
  return url;
}

void NatsConnection::Close() {
  if (conn_ == nullptr) {
    return;
  }
  closing_ = true;
  natsConnection_Close(conn_);

  // The closed callback is the last one the library makes for this
  // connection.  Wait for it so that no callback can see a deleted
  // connection.
  std::unique_lock<std::mutex> lock(closed_lock_);
  if (!closed_cv_.wait_for(lock, kCloseTimeout, [this] { return closed_; })) {
    logger_.Log(toolbelt::LogLevel::kWarning,
                "Timed out waiting for the connection to close");
  }
  lock.unlock();
  natsConnection_Destroy(conn_);
  conn_ = nullptr;
}

bool NatsConnection::IsClosed() const {
  return conn_ == nullptr || natsConnection_IsClosed(conn_);
}

} // namespace natsbasic
