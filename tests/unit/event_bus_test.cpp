#include <assert.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/events/event_bus.hpp"
#include "internal/util/time.hpp"
#include "jobhub/manager/v1.hpp"

namespace {

using jobhub::events::EventBus;
using jobhub::manager::v1::StatusUpdate;
using jobhub::manager::v1::UPDATE_KIND_PROGRESS;

StatusUpdate Update(const std::string& job_id, const std::string& message) {
  StatusUpdate update;
  update.set_job_id(job_id);
  update.set_kind(UPDATE_KIND_PROGRESS);
  update.set_message(message);
  return update;
}

void TestFanOutToEverySubscriber() {
  EventBus bus(8);
  auto     a = bus.Subscribe();
  auto     b = bus.Subscribe();
  assert(bus.SubscriberCount() == 2);

  bus.Publish(Update("job", "one"));

  auto from_a = a->Next(std::chrono::milliseconds(100));
  auto from_b = b->Next(std::chrono::milliseconds(100));
  assert(from_a && from_a->message() == "one");
  assert(from_b && from_b->message() == "one");
  assert(jobhub::util::IsSet(from_a->timestamp()));
}

void TestFullBufferDropsWithoutBlocking() {
  EventBus bus(2);
  auto     slow = bus.Subscribe();
  auto     fast = bus.Subscribe();

  const auto started = std::chrono::steady_clock::now();
  for (int i = 0; i < 10; ++i) {
    bus.Publish(Update("job", std::to_string(i)));
    while (fast->TryNext()) {
    }
  }
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(1));

  assert(slow->pending() == 2);
  assert(slow->dropped() == 8);
  assert(fast->dropped() == 0);

  // the oldest updates are kept
  assert(slow->TryNext()->message() == "0");
  assert(slow->TryNext()->message() == "1");
  assert(!slow->TryNext());
}

void TestUnsubscribeStopsDelivery() {
  EventBus bus(4);
  auto     sub = bus.Subscribe();
  bus.Unsubscribe(sub);
  assert(bus.SubscriberCount() == 0);
  assert(sub->IsClosed());

  bus.Publish(Update("job", "ignored"));
  assert(!sub->TryNext());
}

void TestCloseAllEndsWaitingConsumers() {
  EventBus          bus(4);
  auto              sub = bus.Subscribe();
  std::atomic<bool> returned{false};

  std::thread consumer([&] {
    auto update = sub->Next(std::chrono::seconds(10));
    assert(!update.has_value());
    returned.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  bus.CloseAll();
  consumer.join();
  assert(returned.load());

  auto late = bus.Subscribe();
  assert(late->IsClosed());
}

void TestTimestampsNeverDecrease() {
  EventBus bus(1024);
  auto     sub = bus.Subscribe();

  std::vector<std::thread> publishers;
  for (int t = 0; t < 4; ++t) {
    publishers.emplace_back([&bus, t] {
      for (int i = 0; i < 100; ++i) {
        bus.Publish(Update("job-" + std::to_string(t), std::to_string(i)));
      }
    });
  }
  for (auto& publisher : publishers) {
    publisher.join();
  }

  jobhub::util::TimePoint last{};
  std::vector<int>        next_per_job(4, 0);
  std::size_t             received = 0;
  while (auto update = sub->TryNext()) {
    const auto stamp = jobhub::util::FromProto(update->timestamp());
    assert(stamp >= last);
    last = stamp;

    const int job = update->job_id().back() - '0';
    assert(std::stoi(update->message()) == next_per_job[job]);
    ++next_per_job[job];
    ++received;
  }
  assert(received == 400);
}

} // namespace

int main() {
  TestFanOutToEverySubscriber();
  TestFullBufferDropsWithoutBlocking();
  TestUnsubscribeStopsDelivery();
  TestCloseAllEndsWaitingConsumers();
  TestTimestampsNeverDecrease();

  std::cout << "jobhub_unit_event_bus: pass\n";
  return 0;
}
