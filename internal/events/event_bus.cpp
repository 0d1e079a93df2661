#include "event_bus.hpp"

#include <algorithm>
#include <iterator>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace jobhub::events {

using jobhub::manager::v1::StatusUpdate;

Subscription::Subscription(std::uint64_t id, std::size_t capacity) : id_(id), capacity_(std::max<std::size_t>(capacity, 1)) {
}

std::optional<StatusUpdate> Subscription::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [&] { return closed_ || !buffer_.empty(); })) {
    return std::nullopt;
  }
  if (buffer_.empty()) {
    return std::nullopt;
  }

  StatusUpdate update = std::move(buffer_.front());
  buffer_.pop_front();
  return update;
}

std::optional<StatusUpdate> Subscription::TryNext() {
  std::lock_guard lock(mutex_);
  if (buffer_.empty()) {
    return std::nullopt;
  }

  StatusUpdate update = std::move(buffer_.front());
  buffer_.pop_front();
  return update;
}

bool Subscription::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::uint64_t Subscription::dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

std::size_t Subscription::pending() const {
  std::lock_guard lock(mutex_);
  return buffer_.size();
}

bool Subscription::Push(const StatusUpdate& update) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      return false;
    }
    if (buffer_.size() >= capacity_) {
      ++dropped_;
      return false;
    }
    buffer_.push_back(update);
  }
  cv_.notify_one();
  return true;
}

void Subscription::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

EventBus::EventBus(std::size_t buffer_size)
    : buffer_size_(std::max<std::size_t>(buffer_size, 1)), subscribers_(std::make_shared<const SubscriberList>()) {
}

EventBus::~EventBus() {
  CloseAll();
}

std::shared_ptr<Subscription> EventBus::Subscribe() {
  auto subscription = std::make_shared<Subscription>(next_id_.fetch_add(1), buffer_size_);

  std::lock_guard lock(registry_mutex_);
  if (closed_.load()) {
    subscription->Close();
    return subscription;
  }

  auto next = std::make_shared<SubscriberList>(*subscribers_.load());
  next->push_back(subscription);
  subscribers_.store(std::move(next));

  JOBHUB_LOG_DEBUG("event subscriber added", {observability::IntField("subscription_id", static_cast<std::int64_t>(subscription->id()))});
  return subscription;
}

void EventBus::Unsubscribe(const std::shared_ptr<Subscription>& subscription) {
  if (!subscription) {
    return;
  }

  {
    std::lock_guard lock(registry_mutex_);
    auto            current = subscribers_.load();
    auto            next    = std::make_shared<SubscriberList>();
    next->reserve(current->size());
    std::copy_if(current->begin(), current->end(), std::back_inserter(*next), [&](const auto& s) { return s != subscription; });
    subscribers_.store(std::move(next));
  }

  subscription->Close();
  JOBHUB_LOG_DEBUG("event subscriber removed", {observability::IntField("subscription_id", static_cast<std::int64_t>(subscription->id())),
                                                observability::IntField("dropped", static_cast<std::int64_t>(subscription->dropped()))});
}

void EventBus::Publish(StatusUpdate update) {
  std::lock_guard publish_lock(publish_mutex_);

  auto timestamp = util::IsSet(update.timestamp()) ? util::FromProto(update.timestamp()) : util::Now();
  if (timestamp < last_timestamp_) {
    timestamp = last_timestamp_;
  }
  last_timestamp_             = timestamp;
  *update.mutable_timestamp() = util::ToProto(timestamp);

  const auto    subscribers = subscribers_.load();
  std::uint64_t dropped     = 0;
  for (const auto& subscription : *subscribers) {
    if (!subscription->Push(update) && !subscription->IsClosed()) {
      ++dropped;
    }
  }

  if (dropped > 0) {
    observability::Metrics::Instance().RecordDroppedEvents(dropped);
    JOBHUB_LOG_DEBUG("event dropped for slow subscribers",
                     {observability::StringField("job_id", update.job_id()), observability::IntField("subscribers", static_cast<std::int64_t>(dropped))});
  }
}

void EventBus::CloseAll() {
  std::shared_ptr<const SubscriberList> previous;
  {
    std::lock_guard lock(registry_mutex_);
    closed_.store(true);
    previous = subscribers_.exchange(std::make_shared<const SubscriberList>());
  }
  for (const auto& subscription : *previous) {
    subscription->Close();
  }
}

std::size_t EventBus::SubscriberCount() const {
  return subscribers_.load()->size();
}

} // namespace jobhub::events
