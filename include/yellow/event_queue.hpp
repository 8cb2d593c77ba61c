#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "yellow/events.hpp"

namespace yellow {

// Many producers (terminal input, background IO), one consumer: the
// control loop that owns all application state.
class EventQueue {
 public:
  void publish(Event ev) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      events_.push_back(std::move(ev));
    }
    cv_.notify_one();
  }

  std::optional<Event> consume_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!cv_.wait_for(lock, timeout, [this]() { return !events_.empty(); })) {
      return std::nullopt;
    }
    return pop_front_locked();
  }

  std::optional<Event> try_consume() {
    std::lock_guard<std::mutex> lock(mu_);
    if (events_.empty()) {
      return std::nullopt;
    }
    return pop_front_locked();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return events_.size();
  }

 private:
  Event pop_front_locked() {
    Event ev = std::move(events_.front());
    events_.pop_front();
    return ev;
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Event> events_;
};

}  // namespace yellow
