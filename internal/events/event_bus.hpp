#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "jobhub/manager/v1.hpp"

namespace jobhub::events {

/*
  One subscriber's bounded delivery buffer.

  The publisher side never blocks: when the buffer is full the update is
  dropped for this subscriber and counted. Consumers block in Next() until
  an update arrives, the timeout elapses or the subscription is closed.
*/
class Subscription {
 public:
  Subscription(std::uint64_t id, std::size_t capacity);

  std::uint64_t id() const {
    return id_;
  }

  // nullopt on timeout, or once closed and drained.
  std::optional<jobhub::manager::v1::StatusUpdate> Next(std::chrono::milliseconds timeout);
  std::optional<jobhub::manager::v1::StatusUpdate> TryNext();

  bool          IsClosed() const;
  std::uint64_t dropped() const;
  std::size_t   pending() const;

 private:
  friend class EventBus;

  // Returns false when the update was dropped.
  bool Push(const jobhub::manager::v1::StatusUpdate& update);
  void Close();

  const std::uint64_t id_;
  const std::size_t   capacity_;

  mutable std::mutex                            mutex_;
  std::condition_variable                       cv_;
  std::deque<jobhub::manager::v1::StatusUpdate> buffer_;
  std::uint64_t                                 dropped_{0};
  bool                                          closed_{false};
};

/*
  Fan-out of StatusUpdates to every registered subscription.

  The subscriber list is copy-on-write behind an atomic shared_ptr, so
  Subscribe/Unsubscribe never wait for a publish in progress and a publish
  never waits for registry changes. Publishes are serialized among
  themselves so timestamps handed out are non-decreasing.
*/
class EventBus {
 public:
  explicit EventBus(std::size_t buffer_size);
  ~EventBus();

  EventBus(const EventBus&)            = delete;
  EventBus& operator=(const EventBus&) = delete;

  // After CloseAll() the returned subscription is already closed.
  std::shared_ptr<Subscription> Subscribe();
  void                          Unsubscribe(const std::shared_ptr<Subscription>& subscription);

  // Stamps the update's timestamp when unset (or earlier than the last one
  // handed out) and delivers a copy to every subscriber.
  void Publish(jobhub::manager::v1::StatusUpdate update);

  // Closes and removes every subscription; later Subscribe() calls get a
  // closed subscription.
  void CloseAll();

  std::size_t SubscriberCount() const;

  std::size_t buffer_size() const {
    return buffer_size_;
  }

 private:
  using SubscriberList = std::vector<std::shared_ptr<Subscription>>;

  const std::size_t buffer_size_;

  std::atomic<std::shared_ptr<const SubscriberList>> subscribers_;
  std::mutex                                         registry_mutex_;
  std::atomic<bool>                                  closed_{false};
  std::atomic<std::uint64_t>                         next_id_{1};

  std::mutex                            publish_mutex_;
  std::chrono::system_clock::time_point last_timestamp_{};
};

} // namespace jobhub::events
