// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __CLIENT_FAKE_CONNECTION_H
#define __CLIENT_FAKE_CONNECTION_H

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "client/connection.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace natsbasic {

class FakeBroker;

// A subscription on the FakeBroker.  Each subscription has its own
// delivery thread so callbacks are asynchronous and in order, as they are
// with a real broker client.  Drain delivers the queued messages until its
// timeout expires, then drops the rest and waits for the running callback
// to return.
class FakeSubscription : public Subscription {
public:
  FakeSubscription(FakeBroker &broker, std::string subject,
                   MessageCallback callback);
  ~FakeSubscription() override;

  const std::string &Subject() const override { return subject_; }
  absl::Status Drain(std::chrono::milliseconds timeout) override;
  int64_t NumDelivered() const override { return num_delivered_; }

private:
  friend class FakeBroker;

  void Enqueue(const Message &msg);
  void DeliveryThread();
  absl::Status Stop(std::chrono::milliseconds timeout);

  FakeBroker &broker_;
  std::string subject_;
  MessageCallback callback_;
  std::mutex lock_;
  std::condition_variable cv_;
  std::deque<Message> queue_;
  bool stopping_ = false;
  bool discard_ = false;
  bool finished_ = false;
  bool drained_ = false;
  std::atomic<int64_t> num_delivered_ = 0;
  std::thread thread_;
};

// A connection to the FakeBroker.  Published messages are held in the
// connection until Flush hands them to the broker.  Closing the
// connection discards them.
class FakeConnection : public Connection {
public:
  FakeConnection(FakeBroker &broker, std::string url)
      : broker_(broker), url_(std::move(url)) {}
  ~FakeConnection() override { Close(); }

  using Connection::Publish;
  absl::Status Publish(const std::string &subject, const void *data,
                       size_t length) override;
  absl::Status Flush(std::chrono::milliseconds timeout) override;
  absl::StatusOr<std::unique_ptr<Subscription>>
  Subscribe(const std::string &subject, MessageCallback callback) override;
  std::string ConnectedUrl() const override { return url_; }
  void Close() override;
  bool IsClosed() const override { return closed_; }

  size_t NumPending();

private:
  FakeBroker &broker_;
  std::string url_;
  std::mutex lock_;
  std::vector<Message> pending_;
  std::atomic<bool> closed_ = false;
};

// An in-process message broker with NATS subject matching for testing code
// that uses the Connection interface.  Failures can be injected for
// each operation.
class FakeBroker {
public:
  FakeBroker() = default;
  ~FakeBroker() = default;

  // A Connector that opens a FakeConnection to this broker.  The broker
  // must outlive the connections.
  Connector GetConnector();
  absl::StatusOr<std::unique_ptr<Connection>> Connect(const std::string &url);

  void FailConnect(absl::Status s) { Set(connect_error_, std::move(s)); }
  void FailPublish(absl::Status s) { Set(publish_error_, std::move(s)); }
  void FailFlush(absl::Status s) { Set(flush_error_, std::move(s)); }
  void FailSubscribe(absl::Status s) { Set(subscribe_error_, std::move(s)); }
  void FailDrain(absl::Status s) { Set(drain_error_, std::move(s)); }

  int NumConnectAttempts() const;
  size_t NumSubscriptions() const;

  // All messages that have been flushed to the broker, in order.
  std::vector<Message> Published() const;

  // Waits until there are at least n active subscriptions.  Returns false
  // on timeout.
  bool WaitForSubscriptions(size_t n, std::chrono::milliseconds timeout);

private:
  friend class FakeConnection;
  friend class FakeSubscription;

  void Set(absl::Status &field, absl::Status s);
  absl::Status Get(const absl::Status &field) const;

  void Deliver(const Message &msg);
  void AddSubscription(FakeSubscription *sub);
  void RemoveSubscription(FakeSubscription *sub);

  mutable std::mutex lock_;
  std::condition_variable cv_;
  std::vector<FakeSubscription *> subscriptions_;
  std::vector<Message> published_;
  int connect_attempts_ = 0;
  absl::Status connect_error_;
  absl::Status publish_error_;
  absl::Status flush_error_;
  absl::Status subscribe_error_;
  absl::Status drain_error_;
};

} // namespace natsbasic

#endif // __CLIENT_FAKE_CONNECTION_H
