#include "event_bus.hpp"

#include <algorithm>

#include "internal/util/time.hpp"

namespace foreman::events {

Subscription::Subscription(std::vector<std::string> names, size_t capacity) : names_(std::move(names)), capacity_(capacity == 0 ? 1 : capacity) {
}

std::optional<foreman::v1::Notification> Subscription::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) {
    return std::nullopt;
  }
  auto next = std::move(queue_.front());
  queue_.pop_front();
  return next;
}

void Subscription::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool Subscription::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

uint64_t Subscription::Dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

bool Subscription::Matches(std::string_view name) const {
  if (names_.empty()) {
    return true;
  }
  return std::any_of(names_.begin(), names_.end(), [&](const std::string& pattern) {
    if (!pattern.empty() && pattern.back() == '*') {
      return name.substr(0, pattern.size() - 1) == std::string_view(pattern).substr(0, pattern.size() - 1);
    }
    return name == pattern;
  });
}

void Subscription::Push(const foreman::v1::Notification& notification) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      return;
    }
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(notification);
  }
  cv_.notify_one();
}

EventBus::EventBus(size_t queue_capacity) : queue_capacity_(queue_capacity) {
}

EventBus::~EventBus() {
  CloseAll();
}

void EventBus::Emit(std::string_view name, google::protobuf::Struct payload) {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& subscription : subscriptions_) {
      if (subscription->Matches(name)) {
        targets.push_back(subscription);
      }
    }
  }
  if (targets.empty()) {
    return;
  }

  foreman::v1::Notification notification;
  notification.set_name(std::string(name));
  *notification.mutable_payload() = std::move(payload);
  notification.set_timestamp_ms(util::NowMillis());

  for (const auto& subscription : targets) {
    subscription->Push(notification);
  }
}

std::shared_ptr<Subscription> EventBus::Subscribe(std::vector<std::string> names) {
  auto subscription = std::make_shared<Subscription>(std::move(names), queue_capacity_);
  std::lock_guard lock(mutex_);
  subscriptions_.push_back(subscription);
  return subscription;
}

void EventBus::Unsubscribe(const std::shared_ptr<Subscription>& subscription) {
  if (!subscription) {
    return;
  }
  subscription->Close();
  std::lock_guard lock(mutex_);
  subscriptions_.erase(std::remove(subscriptions_.begin(), subscriptions_.end(), subscription), subscriptions_.end());
}

void EventBus::CloseAll() {
  std::vector<std::shared_ptr<Subscription>> all;
  {
    std::lock_guard lock(mutex_);
    all.swap(subscriptions_);
  }
  for (const auto& subscription : all) {
    subscription->Close();
  }
}

size_t EventBus::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscriptions_.size();
}

} // namespace foreman::events
