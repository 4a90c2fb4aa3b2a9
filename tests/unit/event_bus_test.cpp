#include "internal/events/event_bus.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/util/json.hpp"

namespace {

using foreman::events::EventBus;
using namespace std::chrono_literals;

google::protobuf::Struct Payload(const std::string& agent_id) {
  google::protobuf::Struct payload;
  (*payload.mutable_fields())["agent_id"] = foreman::util::StringValue(agent_id);
  return payload;
}

void TestFiltersByNameAndPrefix() {
  EventBus bus;
  auto     exact  = bus.Subscribe({"agent:status"});
  auto     prefix = bus.Subscribe({"auto_pipeline:*"});
  auto     all    = bus.Subscribe();

  bus.Emit("agent:status", Payload("a"));
  bus.Emit("auto_pipeline:completed", Payload("b"));

  auto first = exact->Next(100ms);
  assert(first.has_value());
  assert(first->name() == "agent:status");
  assert(first->payload().fields().at("agent_id").string_value() == "a");
  assert(first->timestamp_ms() > 0);
  assert(!exact->Next(10ms).has_value());

  auto pipeline = prefix->Next(100ms);
  assert(pipeline.has_value());
  assert(pipeline->name() == "auto_pipeline:completed");

  assert(all->Next(100ms)->name() == "agent:status");
  assert(all->Next(100ms)->name() == "auto_pipeline:completed");
}

void TestSlowSubscriberDropsOldest() {
  EventBus bus(2);
  auto     sub = bus.Subscribe();
  bus.Emit("agent:output", Payload("1"));
  bus.Emit("agent:output", Payload("2"));
  bus.Emit("agent:output", Payload("3"));

  assert(sub->Dropped() == 1);
  assert(sub->Next(10ms)->payload().fields().at("agent_id").string_value() == "2");
  assert(sub->Next(10ms)->payload().fields().at("agent_id").string_value() == "3");
}

void TestCloseWakesWaiter() {
  EventBus    bus;
  auto        sub = bus.Subscribe();
  std::thread closer([&bus]() {
    std::this_thread::sleep_for(20ms);
    bus.CloseAll();
  });

  const auto next = sub->Next(5s);
  closer.join();
  assert(!next.has_value());
  assert(sub->Closed());
}

void TestUnsubscribeStopsDelivery() {
  EventBus bus;
  auto     sub = bus.Subscribe();
  assert(bus.SubscriberCount() == 1);
  bus.Unsubscribe(sub);
  assert(bus.SubscriberCount() == 0);

  bus.Emit("agent:status", Payload("a"));
  assert(!sub->Next(10ms).has_value());
}

} // namespace

int main() {
  TestFiltersByNameAndPrefix();
  TestSlowSubscriberDropsOldest();
  TestCloseWakesWaiter();
  TestUnsubscribeStopsDelivery();

  std::cout << "foreman_unit_event_bus: pass\n";
  return 0;
}
