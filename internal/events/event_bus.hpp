#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "event_sink.hpp"
#include "foreman/v1/notification.pb.h"

namespace foreman::events {

/*
  One subscriber's view of the bus.

  Holds at most `capacity` pending notifications; when full the oldest is
  dropped so a stalled consumer never slows down the emitters.
*/
class Subscription {
 public:
  Subscription(std::vector<std::string> names, size_t capacity);

  // Waits up to `timeout`. nullopt on timeout or once closed and drained.
  std::optional<foreman::v1::Notification> Next(std::chrono::milliseconds timeout);

  void Close();
  bool Closed() const;

  uint64_t Dropped() const;

  // Exact name, "prefix*" pattern, or no filters at all.
  bool Matches(std::string_view name) const;

 private:
  friend class EventBus;

  void Push(const foreman::v1::Notification& notification);

  std::vector<std::string> names_;
  size_t                   capacity_;

  mutable std::mutex                    mutex_;
  std::condition_variable               cv_;
  std::deque<foreman::v1::Notification> queue_;
  bool                                  closed_  = false;
  uint64_t                              dropped_ = 0;
};

class EventBus final : public EventSink {
 public:
  static constexpr size_t kDefaultQueueCapacity = 1024;

  explicit EventBus(size_t queue_capacity = kDefaultQueueCapacity);
  ~EventBus() override;

  void Emit(std::string_view name, google::protobuf::Struct payload) override;

  std::shared_ptr<Subscription> Subscribe(std::vector<std::string> names = {});
  void                          Unsubscribe(const std::shared_ptr<Subscription>& subscription);

  // Closes every subscription; used at shutdown to release streaming RPCs.
  void CloseAll();

  size_t SubscriberCount() const;

 private:
  size_t queue_capacity_;

  mutable std::mutex                         mutex_;
  std::vector<std::shared_ptr<Subscription>> subscriptions_;
};

} // namespace foreman::events
