/**
 * @file broadcaster.cpp
 * @brief Rate-limited snapshot fan-out implementation
 */

#include "caption_suite/broadcaster.hpp"

#include <algorithm>
#include <exception>

#include "caption_suite/logging.hpp"

namespace caption_suite {

using Clock = std::chrono::steady_clock;

Broadcaster::Broadcaster(std::chrono::milliseconds min_interval)
    : min_interval_(min_interval) {
  thread_ = std::thread(&Broadcaster::run, this);
}

Broadcaster::~Broadcaster() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

uint64_t Broadcaster::subscribe(std::shared_ptr<ProgressObserver> observer) {
  uint64_t id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_id_++;
    subscribers_.push_back(
        Subscriber{id, std::move(observer), Clock::time_point{}, 0, true, {}});
  }
  cv_.notify_all();
  return id;
}

void Broadcaster::unsubscribe(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                    [id](const Subscriber &s) {
                                      return s.id == id;
                                    }),
                     subscribers_.end());
}

void Broadcaster::publish(const ProgressSnapshot &snapshot, bool immediate) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = snapshot;
    ++version_;
    if (immediate) {
      for (auto &s : subscribers_)
        s.immediate.emplace_back(version_, snapshot);
    }
  }
  cv_.notify_all();
}

std::size_t Broadcaster::observer_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

void Broadcaster::run() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (true) {
    auto now = Clock::now();

    /// Queued immediate snapshots go first, then the latest one when due
    std::vector<Delivery> deliveries;
    bool have_deadline = false;
    Clock::time_point next_due;

    for (auto &s : subscribers_) {
      if (!s.immediate.empty()) {
        auto &front = s.immediate.front();
        deliveries.push_back(
            Delivery{s.id, s.observer, std::move(front.second), front.first});
        s.immediate.pop_front();
        continue;
      }
      bool pending = s.initial_pending || s.seen_version < version_;
      if (!pending)
        continue;
      if (stopping_ || s.initial_pending ||
          now - s.last_push >= min_interval_) {
        deliveries.push_back(Delivery{s.id, s.observer, latest_, version_});
      } else {
        auto due = s.last_push + min_interval_;
        if (!have_deadline || due < next_due) {
          next_due = due;
          have_deadline = true;
        }
      }
    }

    if (!deliveries.empty()) {
      lock.unlock();

      /// Deliver outside the lock; a slow observer never blocks publish()
      std::vector<uint64_t> dropped;
      for (const auto &d : deliveries) {
        bool keep = false;
        try {
          keep = d.observer->deliver(d.snapshot);
        } catch (const std::exception &e) {
          LOG_WARN("[Broadcast] Observer {} failed: {}", d.id, e.what());
        } catch (...) {
          LOG_WARN("[Broadcast] Observer {} failed: unknown exception", d.id);
        }
        if (!keep)
          dropped.push_back(d.id);
      }

      lock.lock();
      auto pushed_at = Clock::now();
      for (auto &s : subscribers_) {
        for (const auto &d : deliveries) {
          if (d.id != s.id)
            continue;
          s.last_push = pushed_at;
          s.seen_version = std::max(s.seen_version, d.version);
          s.initial_pending = false;
        }
      }
      subscribers_.erase(
          std::remove_if(subscribers_.begin(), subscribers_.end(),
                         [&dropped](const Subscriber &s) {
                           return std::find(dropped.begin(), dropped.end(),
                                            s.id) != dropped.end();
                         }),
          subscribers_.end());
      continue;
    }

    if (stopping_)
      break;

    if (have_deadline) {
      cv_.wait_until(lock, next_due);
    } else {
      cv_.wait(lock);
    }
  }
}

} // namespace caption_suite
