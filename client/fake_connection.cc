// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "client/fake_connection.h"
#include "absl/strings/str_format.h"
#include "common/subject.h"

namespace natsbasic {

FakeSubscription::FakeSubscription(FakeBroker &broker, std::string subject,
                                   MessageCallback callback)
    : broker_(broker), subject_(std::move(subject)),
      callback_(std::move(callback)) {
  thread_ = std::thread([this]() { DeliveryThread(); });
}

// Drain timeout used when a subscription is destroyed without having been
// drained.
static constexpr std::chrono::milliseconds kImplicitDrainTimeout(1000);

FakeSubscription::~FakeSubscription() {
  if (!drained_) {
    // The only failure is a timeout, after which nothing is delivered.
    Stop(kImplicitDrainTimeout).IgnoreError();
  }
}

absl::Status FakeSubscription::Stop(std::chrono::milliseconds timeout) {
  drained_ = true;
  // No new messages once we are out of the broker.
  broker_.RemoveSubscription(this);
  absl::Status status;
  {
    std::unique_lock<std::mutex> lock(lock_);
    stopping_ = true;
    cv_.notify_all();
    // The delivery thread exits when it has emptied the queue.
    if (!cv_.wait_for(lock, timeout, [this]() { return finished_; })) {
      status = absl::DeadlineExceededError(absl::StrFormat(
          "Timed out draining subscription to \"%s\" with %d messages queued",
          subject_, queue_.size()));
      discard_ = true;
      queue_.clear();
      cv_.notify_all();
    }
  }
  // Waits for a callback that is still running.
  if (thread_.joinable()) {
    thread_.join();
  }
  return status;
}

absl::Status FakeSubscription::Drain(std::chrono::milliseconds timeout) {
  if (drained_) {
    return absl::OkStatus();
  }
  if (absl::Status s = Stop(timeout); !s.ok()) {
    return s;
  }
  return broker_.Get(broker_.drain_error_);
}

void FakeSubscription::Enqueue(const Message &msg) {
  std::lock_guard<std::mutex> lock(lock_);
  if (stopping_) {
    return;
  }
  queue_.push_back(msg);
  cv_.notify_all();
}

void FakeSubscription::DeliveryThread() {
  for (;;) {
    std::unique_lock<std::mutex> lock(lock_);
    cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
    if (discard_ || queue_.empty()) {
      finished_ = true;
      cv_.notify_all();
      return;
    }
    Message msg = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    num_delivered_++;
    if (callback_) {
      callback_(msg);
    }
  }
}

absl::Status FakeConnection::Publish(const std::string &subject,
                                     const void *data, size_t length) {
  if (closed_) {
    return absl::FailedPreconditionError("Failed to publish: not connected");
  }
  if (absl::Status s = broker_.Get(broker_.publish_error_); !s.ok()) {
    return s;
  }
  if (absl::Status s = ValidateSubject(subject, /*allow_wildcards=*/false);
      !s.ok()) {
    return s;
  }
  std::lock_guard<std::mutex> lock(lock_);
  pending_.push_back(
      {.subject = subject,
       .payload = std::string(reinterpret_cast<const char *>(data), length)});
  return absl::OkStatus();
}

absl::Status FakeConnection::Flush(std::chrono::milliseconds timeout) {
  if (closed_) {
    return absl::FailedPreconditionError("Failed to flush: not connected");
  }
  if (absl::Status s = broker_.Get(broker_.flush_error_); !s.ok()) {
    return s;
  }
  std::vector<Message> pending;
  {
    std::lock_guard<std::mutex> lock(lock_);
    pending.swap(pending_);
  }
  for (const Message &msg : pending) {
    broker_.Deliver(msg);
  }
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<Subscription>>
FakeConnection::Subscribe(const std::string &subject,
                          MessageCallback callback) {
  if (closed_) {
    return absl::FailedPreconditionError("Failed to subscribe: not connected");
  }
  if (absl::Status s = broker_.Get(broker_.subscribe_error_); !s.ok()) {
    return s;
  }
  if (absl::Status s = ValidateSubject(subject, /*allow_wildcards=*/true);
      !s.ok()) {
    return s;
  }
  auto sub =
      std::make_unique<FakeSubscription>(broker_, subject, std::move(callback));
  broker_.AddSubscription(sub.get());
  return std::unique_ptr<Subscription>(std::move(sub));
}

void FakeConnection::Close() {
  if (closed_.exchange(true)) {
    return;
  }
  // Anything not flushed is lost.
  std::lock_guard<std::mutex> lock(lock_);
  pending_.clear();
}

size_t FakeConnection::NumPending() {
  std::lock_guard<std::mutex> lock(lock_);
  return pending_.size();
}

Connector FakeBroker::GetConnector() {
  return [this](const ConnectionOptions &options, toolbelt::Logger &logger) {
    return Connect(options.Url());
  };
}

absl::StatusOr<std::unique_ptr<Connection>>
FakeBroker::Connect(const std::string &url) {
  std::lock_guard<std::mutex> lock(lock_);
  connect_attempts_++;
  if (!connect_error_.ok()) {
    return connect_error_;
  }
  return std::unique_ptr<Connection>(
      std::make_unique<FakeConnection>(*this, url));
}

void FakeBroker::Set(absl::Status &field, absl::Status s) {
  std::lock_guard<std::mutex> lock(lock_);
  field = std::move(s);
}

absl::Status FakeBroker::Get(const absl::Status &field) const {
  std::lock_guard<std::mutex> lock(lock_);
  return field;
}

int FakeBroker::NumConnectAttempts() const {
  std::lock_guard<std::mutex> lock(lock_);
  return connect_attempts_;
}

size_t FakeBroker::NumSubscriptions() const {
  std::lock_guard<std::mutex> lock(lock_);
  return subscriptions_.size();
}

std::vector<Message> FakeBroker::Published() const {
  std::lock_guard<std::mutex> lock(lock_);
  return published_;
}

bool FakeBroker::WaitForSubscriptions(size_t n,
                                      std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(lock_);
  return cv_.wait_for(lock, timeout,
                      [this, n]() { return subscriptions_.size() >= n; });
}

void FakeBroker::Deliver(const Message &msg) {
  std::lock_guard<std::mutex> lock(lock_);
  published_.push_back(msg);
  for (FakeSubscription *sub : subscriptions_) {
    if (SubjectMatches(sub->Subject(), msg.subject)) {
      sub->Enqueue(msg);
    }
  }
}

void FakeBroker::AddSubscription(FakeSubscription *sub) {
  std::lock_guard<std::mutex> lock(lock_);
  subscriptions_.push_back(sub);
  cv_.notify_all();
}

void FakeBroker::RemoveSubscription(FakeSubscription *sub) {
  std::lock_guard<std::mutex> lock(lock_);
  for (auto it = subscriptions_.begin(); it != subscriptions_.end(); ++it) {
    if (*it == sub) {
      subscriptions_.erase(it);
      break;
    }
  }
  cv_.notify_all();
}

} // namespace natsbasic
