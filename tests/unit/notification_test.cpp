#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/notify/notification_dispatcher.hpp"
#include "internal/notify/payloads.hpp"
#include "internal/notify/subscription_hub.hpp"

namespace {

using namespace ridedispatch::notify;

OutboundNotification Offer(const std::string& user_id, const std::string& ride_id) {
  OutboundNotification n;
  n.user_id = user_id;
  n.payload.set_type(kRideRequest);
  n.payload.set_ride_id(ride_id);
  return n;
}

class RecordingSink final : public NotificationSink {
 public:
  bool Push(const std::string& user_id, const ridedispatch::v1::DispatchNotification& payload) override {
    if (user_id == "unreachable") return false;
    if (user_id == "broken") throw std::runtime_error("device channel reset");

    std::lock_guard lock(mutex_);
    received_.push_back(user_id + "/" + payload.ride_id());
    return true;
  }

  std::vector<std::string> Received() const {
    std::lock_guard lock(mutex_);
    return received_;
  }

 private:
  mutable std::mutex       mutex_;
  std::vector<std::string> received_;
};

void TestQueueIsFifoAndDrainsAfterShutdown() {
  NotificationQueue queue;
  queue.Enqueue(Offer("d1", "r1"));
  queue.Enqueue(Offer("d2", "r1"));
  assert(queue.Pending() == 2);

  queue.Shutdown();
  auto first = queue.Dequeue();
  assert(first && first->user_id == "d1");
  assert(queue.TryDequeue()->user_id == "d2");
  assert(!queue.Dequeue().has_value());
}

void TestDispatcherDeliversAndCountsFailures() {
  auto queue = std::make_shared<NotificationQueue>();
  auto sink  = std::make_shared<RecordingSink>();

  NotificationDispatcher dispatcher(queue, sink);
  dispatcher.Start(3);

  for (int i = 0; i < 20; ++i) queue->Enqueue(Offer("d" + std::to_string(i % 4), "r" + std::to_string(i)));
  queue->Enqueue(Offer("unreachable", "r-x"));
  queue->Enqueue(Offer("broken", "r-y"));

  // Stop drains what is already queued
  dispatcher.Stop();

  assert(dispatcher.Delivered() == 20);
  assert(dispatcher.Failed() == 2);
  assert(sink->Received().size() == 20);
  assert(queue->Pending() == 0);
}

void TestHubFansOutToEveryStream() {
  SubscriptionHub hub;
  auto            phone  = hub.Subscribe("d1");
  auto            tablet = hub.Subscribe("d1");
  assert(hub.Subscribers("d1") == 2);

  assert(hub.Push("d1", Offer("d1", "r1").payload));
  assert(!hub.Push("nobody", Offer("nobody", "r1").payload));

  auto a = phone->Next(std::chrono::milliseconds(10));
  auto b = tablet->Next(std::chrono::milliseconds(10));
  assert(a && a->ride_id() == "r1");
  assert(b && b->ride_id() == "r1");
  assert(!phone->Next(std::chrono::milliseconds(1)).has_value());

  hub.Unsubscribe("d1", phone);
  assert(phone->Closed());
  assert(hub.Subscribers("d1") == 1);

  hub.Unsubscribe("d1", tablet);
  assert(hub.Subscribers("d1") == 0);
  assert(!hub.Push("d1", Offer("d1", "r2").payload));
}

void TestNextWakesOnPushAndClose() {
  SubscriptionHub hub;
  auto            stream = hub.Subscribe("rider-1");

  std::thread producer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    hub.Push("rider-1", Offer("rider-1", "r9").payload);
  });
  auto got = stream->Next(std::chrono::seconds(5));
  producer.join();
  assert(got && got->ride_id() == "r9");

  std::thread closer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    hub.CloseAll();
  });
  auto none = stream->Next(std::chrono::seconds(5));
  closer.join();
  assert(!none.has_value());
  assert(stream->Closed());
  assert(hub.Subscribers("rider-1") == 0);
}

void TestHubAsDispatcherSink() {
  auto queue = std::make_shared<NotificationQueue>();
  auto hub   = std::make_shared<SubscriptionHub>();
  auto inbox = hub->Subscribe("d1");

  NotificationDispatcher dispatcher(queue, hub);
  dispatcher.Start(1);
  queue->Enqueue(Offer("d1", "r1"));
  queue->Enqueue(Offer("offline-driver", "r1"));
  dispatcher.Stop();

  assert(dispatcher.Delivered() == 1);
  assert(dispatcher.Failed() == 1);
  assert(inbox->Next(std::chrono::milliseconds(10))->ride_id() == "r1");
}

void TestStoredOfferReplaysAsRideRequest() {
  ridedispatch::db::model::NotificationRecord offer;
  offer.driver_id             = "d1";
  offer.ride_id               = "r1";
  offer.request_class         = ridedispatch::model::RequestClass::kParcel;
  offer.pickup                = {22.72, 75.86};
  offer.destination           = {22.75, 75.86};
  offer.estimated_fare        = 70.0;
  offer.distance_to_pickup_km = 1.2;
  offer.broadcast_round       = 2;
  offer.notified_at_ms        = 1700000000000ULL;

  auto out = MakeRideRequest(offer);
  assert(out.user_id == "d1");
  assert(out.payload.type() == kRideRequest);
  assert(out.payload.broadcast_round() == 2);
  assert(out.payload.request_class() == ridedispatch::v1::REQUEST_CLASS_PARCEL);
  assert(out.payload.broadcast_time().seconds() == 1700000000);
  assert(out.payload.pickup().latitude() == 22.72);
}

} // namespace

int main() {
  TestQueueIsFifoAndDrainsAfterShutdown();
  TestDispatcherDeliversAndCountsFailures();
  TestHubFansOutToEveryStream();
  TestNextWakesOnPushAndClose();
  TestHubAsDispatcherSink();
  TestStoredOfferReplaysAsRideRequest();

  std::cout << "ride_dispatch_unit_notification: pass\n";
  return 0;
}
