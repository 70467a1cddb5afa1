// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __CLIENT_CONNECTION_H
#define __CLIENT_CONNECTION_H

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "client/message.h"
#include "client/options.h"
#include "toolbelt/logging.h"
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace natsbasic {

// Called for every message that matches a subscription.  It is invoked on a
// thread owned by the broker client, never on the thread that subscribed.
// Calls for one subscription are made in arrival order and never overlap.
using MessageCallback = std::function<void(const Message &)>;

// An interest in a subject pattern.  Destroying a subscription that has
// not been drained unsubscribes it.
class Subscription {
public:
  virtual ~Subscription() = default;

  // The pattern passed to Subscribe.
  virtual const std::string &Subject() const = 0;

  // Stop accepting new messages, wait for the callbacks for the messages
  // already received to finish and then remove the interest from the
  // broker.  Waits at most timeout.  After this returns (successfully or
  // not) no more callbacks will be made.
  virtual absl::Status Drain(std::chrono::milliseconds timeout) = 0;

  // Number of messages passed to the callback so far.
  virtual int64_t NumDelivered() const = 0;
};

// A connection to the message broker.  A connection is safe to use from
// multiple threads.  The destructor closes the connection if it is still
// open.
class Connection {
public:
  virtual ~Connection() = default;

  // Fire-and-forget publish.  The message is buffered locally and this
  // returns before the broker has seen it.  Call Flush to make sure it
  // has been delivered to the broker.
  virtual absl::Status Publish(const std::string &subject, const void *data,
                               size_t length) = 0;
  absl::Status Publish(const std::string &subject,
                       const std::string &payload) {
    return Publish(subject, payload.data(), payload.size());
  }

  // Sends all buffered messages and waits for the broker to acknowledge
  // them.  Returns a DeadlineExceeded error if that doesn't happen within
  // the timeout.
  virtual absl::Status Flush(std::chrono::milliseconds timeout) = 0;

  // Register interest in a subject pattern, which may contain wildcards.
  virtual absl::StatusOr<std::unique_ptr<Subscription>>
  Subscribe(const std::string &subject, MessageCallback callback) = 0;

  // The URL of the broker we are connected to, if known.
  virtual std::string ConnectedUrl() const = 0;

  // Closes the connection.  Buffered messages that have not been flushed
  // may be lost.  Calling Close more than once has no effect.
  virtual void Close() = 0;
  virtual bool IsClosed() const = 0;
};

// Opens a connection.  Connection events (disconnects, reconnects,
// asynchronous errors) are logged to the logger, which must outlive the
// connection.
using Connector =
    std::function<absl::StatusOr<std::unique_ptr<Connection>>(
        const ConnectionOptions &options, toolbelt::Logger &logger)>;

} // namespace natsbasic

#endif // __CLIENT_CONNECTION_H
