/**
 * @file broadcaster.hpp
 * @brief Rate-limited fan-out of progress snapshots
 *
 * @details The Broadcaster owns one delivery thread:
 *
 *          - publish() only stores the latest snapshot and wakes the thread
 *
 *          - Each observer receives at most one push per min_interval; bursts
 *            coalesce into the newest snapshot
 *
 *          - Snapshots published with immediate = true (terminal stages) skip
 *            the interval and are queued per observer, so a later publish
 *            never replaces one that has not been delivered yet
 *
 *          - An observer that returns false or throws is dropped
 */

#ifndef CAPTION_SUITE_BROADCASTER_HPP
#define CAPTION_SUITE_BROADCASTER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "types.hpp"

namespace caption_suite {

/**
 * @class ProgressObserver
 * @brief Receiver of broadcast snapshots.
 */
class ProgressObserver {
public:
  virtual ~ProgressObserver() = default;

  /**
   * @brief Deliver one snapshot.
   * @return false if the observer is disconnected and must be dropped
   */
  virtual bool deliver(const ProgressSnapshot &snapshot) = 0;
};

/// Adapts a callable to ProgressObserver
class CallbackObserver : public ProgressObserver {
public:
  using Callback = std::function<bool(const ProgressSnapshot &)>;

  explicit CallbackObserver(Callback callback)
      : callback_(std::move(callback)) {}

  bool deliver(const ProgressSnapshot &snapshot) override {
    return callback_(snapshot);
  }

private:
  Callback callback_;
};

class Broadcaster {
public:
  /**
   * @brief Start the delivery thread.
   * @param min_interval Minimum spacing of two pushes to one observer
   */
  explicit Broadcaster(std::chrono::milliseconds min_interval);

  /**
   * @brief Flush pending pushes and join the delivery thread.
   */
  ~Broadcaster();

  Broadcaster(const Broadcaster &) = delete;
  Broadcaster &operator=(const Broadcaster &) = delete;

  /**
   * @brief Add an observer; it receives the current snapshot right away.
   * @return Subscription id for unsubscribe()
   */
  uint64_t subscribe(std::shared_ptr<ProgressObserver> observer);

  void unsubscribe(uint64_t id);

  /**
   * @brief Schedule a push of snapshot to every observer.
   * @param immediate Bypass the rate limit (terminal transitions)
   */
  void publish(const ProgressSnapshot &snapshot, bool immediate);

  std::size_t observer_count() const;

private:
  struct Subscriber {
    uint64_t id;
    std::shared_ptr<ProgressObserver> observer;
    std::chrono::steady_clock::time_point last_push;
    uint64_t seen_version; //< Version of the last snapshot delivered
    bool initial_pending;  //< Has not received anything yet
    std::deque<std::pair<uint64_t, ProgressSnapshot>> immediate; //< Undelivered
  };

  struct Delivery {
    uint64_t id;
    std::shared_ptr<ProgressObserver> observer;
    ProgressSnapshot snapshot;
    uint64_t version;
  };

  void run();

  const std::chrono::milliseconds min_interval_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  ProgressSnapshot latest_;
  uint64_t version_ = 0; //< Bumped on every publish
  std::vector<Subscriber> subscribers_;
  uint64_t next_id_ = 1;
  bool stopping_ = false;

  std::thread thread_;
};

} // namespace caption_suite

#endif // CAPTION_SUITE_BROADCASTER_HPP
