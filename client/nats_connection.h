// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __CLIENT_NATS_CONNECTION_H
#define __CLIENT_NATS_CONNECTION_H

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "client/connection.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <nats/nats.h>
#include "toolbelt/logging.h"

namespace natsbasic {

// Converts a nats.c status into an absl::Status.  The message is prefixed
// by what and carries the library's last error text when there is one.
absl::Status NatsError(natsStatus s, absl::string_view what);

class NatsSubscription : public Subscription {
public:
  NatsSubscription(std::string subject, MessageCallback callback,
                   toolbelt::Logger &logger)
      : subject_(std::move(subject)), callback_(std::move(callback)),
        logger_(logger) {}
  ~NatsSubscription() override;

  NatsSubscription(const NatsSubscription &) = delete;
  NatsSubscription &operator=(const NatsSubscription &) = delete;

  const std::string &Subject() const override { return subject_; }
  absl::Status Drain(std::chrono::milliseconds timeout) override;
  int64_t NumDelivered() const override { return num_delivered_; }

private:
  friend class NatsConnection;

  // natsMsgHandler; closure is the NatsSubscription.
  static void OnMessage(natsConnection *nc, natsSubscription *sub,
                        natsMsg *msg, void *closure);

  // Stops any further callbacks and waits for one that is running to
  // return.  The library does not wait for a running callback when a
  // subscription is unsubscribed after a failed drain.
  void StopCallbacks();

  std::string subject_;
  MessageCallback callback_;
  toolbelt::Logger &logger_;
  natsSubscription *sub_ = nullptr;
  bool drained_ = false;
  std::atomic<int64_t> num_delivered_ = 0;

  std::mutex callback_lock_;
  std::condition_variable callback_cv_;
  bool stopped_ = false;
  int running_callbacks_ = 0;
};

// A Connection to a NATS server using the nats.c client library.
class NatsConnection : public Connection {
public:
  ~NatsConnection() override;

  NatsConnection(const NatsConnection &) = delete;
  NatsConnection &operator=(const NatsConnection &) = delete;

  // Connect to the server named in the options.  The library's default
  // reconnect behavior applies once connected; the initial connect is not
  // retried.
  static absl::StatusOr<std::unique_ptr<Connection>>
  Connect(const ConnectionOptions &options, toolbelt::Logger &logger);

  using Connection::Publish;
  absl::Status Publish(const std::string &subject, const void *data,
                       size_t length) override;
  absl::Status Flush(std::chrono::milliseconds timeout) override;
  absl::StatusOr<std::unique_ptr<Subscription>>
  Subscribe(const std::string &subject, MessageCallback callback) override;
  std::string ConnectedUrl() const override;
  void Close() override;
  bool IsClosed() const override;

private:
  explicit NatsConnection(toolbelt::Logger &logger) : logger_(logger) {}

  // Connection event handlers, installed in the natsOptions.  The closure
  // is the NatsConnection.
  static void OnDisconnected(natsConnection *nc, void *closure);
  static void OnReconnected(natsConnection *nc, void *closure);
  static void OnClosed(natsConnection *nc, void *closure);
  static void OnAsyncError(natsConnection *nc, natsSubscription *sub,
                           natsStatus err, void *closure);

  toolbelt::Logger &logger_;
  natsConnection *conn_ = nullptr;
  std::atomic<bool> closing_ = false;

  // Set by the closed callback.
  std::mutex closed_lock_;
  std::condition_variable closed_cv_;
  bool closed_ = false;
};

} // namespace natsbasic

#endif // __CLIENT_NATS_CONNECTION_H
