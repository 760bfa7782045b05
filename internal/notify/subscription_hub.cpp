#include "subscription_hub.hpp"

#include <algorithm>

namespace ridedispatch::notify {

std::optional<ridedispatch::v1::DispatchNotification> Subscription::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return closed_ || !pending_.empty(); });

  if (pending_.empty()) return std::nullopt;

  auto next = std::move(pending_.front());
  pending_.pop_front();
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

bool Subscription::Offer(const ridedispatch::v1::DispatchNotification& payload) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return false;
    pending_.push_back(payload);
  }
  cv_.notify_one();
  return true;
}

std::shared_ptr<Subscription> SubscriptionHub::Subscribe(const std::string& user_id) {
  auto subscription = std::make_shared<Subscription>();
  std::lock_guard lock(mutex_);
  subscriptions_[user_id].push_back(subscription);
  return subscription;
}

void SubscriptionHub::Unsubscribe(const std::string& user_id, const std::shared_ptr<Subscription>& subscription) {
  subscription->Close();

  std::lock_guard lock(mutex_);
  auto it = subscriptions_.find(user_id);
  if (it == subscriptions_.end()) return;

  auto& list = it->second;
  list.erase(std::remove(list.begin(), list.end(), subscription), list.end());
  if (list.empty()) subscriptions_.erase(it);
}

bool SubscriptionHub::Push(const std::string& user_id, const ridedispatch::v1::DispatchNotification& payload) {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard lock(mutex_);
    auto it = subscriptions_.find(user_id);
    if (it == subscriptions_.end()) return false;
    targets = it->second;
  }

  bool delivered = false;
  for (const auto& subscription : targets) {
    delivered = subscription->Offer(payload) || delivered;
  }
  return delivered;
}

size_t SubscriptionHub::Subscribers(const std::string& user_id) const {
  std::lock_guard lock(mutex_);
  auto it = subscriptions_.find(user_id);
  return it == subscriptions_.end() ? 0 : it->second.size();
}

void SubscriptionHub::CloseAll() {
  std::lock_guard lock(mutex_);
  for (auto& [user_id, list] : subscriptions_) {
    for (auto& subscription : list) subscription->Close();
  }
  subscriptions_.clear();
}

} // namespace ridedispatch::notify
