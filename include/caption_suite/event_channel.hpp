/**
 * @file event_channel.hpp
 * @brief Bounded worker -> aggregator event channel
 *
 * @details Enables many producers with a single consumer:
 *
 *          - Workers and the job supervisor (producers) push progress events
 *
 *          - The aggregator thread (consumer) applies them one at a time
 *
 *          - A full channel blocks producers instead of dropping events, so
 *            completions are never lost under a burst of token updates
 */

#ifndef CAPTION_SUITE_EVENT_CHANNEL_HPP
#define CAPTION_SUITE_EVENT_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

#include "types.hpp"

namespace caption_suite {

/**
 * @enum EventKind
 * @brief What a WorkerEvent reports.
 */
enum class EventKind : uint8_t {
  DevicePrepared, //< One more device finished loading
  TaskStarted,    //< Worker pulled a task
  Substage,       //< Substage change or progress increment
  TaskDone,       //< Caption persisted
  TaskFailed,     //< Task-level error captured
  TaskAbandoned,  //< Stop interrupted the task; it stays unprocessed
  WorkerExited,   //< Worker left its loop
  JobFatal,       //< Job-level error; every worker must stop
  RunFinished     //< Supervisor joined every worker and shut devices down
};

/**
 * @struct WorkerEvent
 * @brief A single progress event. Fields are used per EventKind.
 */
struct WorkerEvent {
  EventKind kind = EventKind::Substage;
  WorkerId worker = -1;                //< Reporting worker (-1 = supervisor)
  std::size_t task_index = 0;          //< Task the event refers to
  std::string video_name;              //< Task key
  Substage substage = Substage::Idle;  //< For Substage events
  double progress = 0;                 //< Substage or loading fraction
  int64_t tokens = 0;                  //< Tokens generated for the task
  double elapsed = 0;                  //< Task wall time in seconds
  std::string message;                 //< Error text or output path
};

/**
 * @class EventChannel
 * @brief Thread-safe bounded queue of WorkerEvents.
 *
 * @attention USAGE:
 *
 *   - Producers call push(); it blocks while the channel is full
 *
 *   - The aggregator thread calls pop() in a loop
 *
 *   - Call close() when the manager shuts down
 */
class EventChannel {
public:
  explicit EventChannel(std::size_t capacity);

  /**
   * @brief Push an event, waiting for room if the channel is full.
   * @return false if the channel was closed
   */
  bool push(WorkerEvent event);

  /**
   * @brief Pop an event (blocking).
   * @param event Output: the next event
   * @return true if an event was retrieved, false if closed and drained
   */
  bool pop(WorkerEvent &event);

  /**
   * @brief Stop accepting events and wake every waiter.
   */
  void close();

  std::size_t size() const;

private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<WorkerEvent> events_;
  bool closed_ = false;
};

} // namespace caption_suite

#endif // CAPTION_SUITE_EVENT_CHANNEL_HPP
