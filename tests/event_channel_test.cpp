#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "caption_suite/event_channel.hpp"

using namespace caption_suite;

namespace {

WorkerEvent event_for(std::size_t index) {
  WorkerEvent event;
  event.kind = EventKind::TaskStarted;
  event.task_index = index;
  return event;
}

} // namespace

TEST(EventChannelTest, DeliversInOrder) {
  EventChannel channel(16);
  for (std::size_t i = 0; i < 5; ++i)
    ASSERT_TRUE(channel.push(event_for(i)));
  EXPECT_EQ(channel.size(), 5u);

  WorkerEvent event;
  for (std::size_t i = 0; i < 5; ++i) {
    ASSERT_TRUE(channel.pop(event));
    EXPECT_EQ(event.task_index, i);
  }
  EXPECT_EQ(channel.size(), 0u);
}

TEST(EventChannelTest, CloseDrainsThenStops) {
  EventChannel channel(16);
  channel.push(event_for(1));
  channel.push(event_for(2));
  channel.close();

  EXPECT_FALSE(channel.push(event_for(3)));

  WorkerEvent event;
  ASSERT_TRUE(channel.pop(event));
  EXPECT_EQ(event.task_index, 1u);
  ASSERT_TRUE(channel.pop(event));
  EXPECT_EQ(event.task_index, 2u);
  EXPECT_FALSE(channel.pop(event));
}

TEST(EventChannelTest, FullChannelBlocksProducer) {
  EventChannel channel(1);
  ASSERT_TRUE(channel.push(event_for(0)));

  std::atomic<bool> pushed{false};
  std::thread producer([&]() {
    channel.push(event_for(1));
    pushed.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(pushed.load());

  WorkerEvent event;
  ASSERT_TRUE(channel.pop(event));
  producer.join();
  EXPECT_TRUE(pushed.load());

  ASSERT_TRUE(channel.pop(event));
  EXPECT_EQ(event.task_index, 1u);
}

TEST(EventChannelTest, CloseWakesBlockedConsumer) {
  EventChannel channel(4);
  std::atomic<bool> returned{false};
  std::thread consumer([&]() {
    WorkerEvent event;
    EXPECT_FALSE(channel.pop(event));
    returned.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  channel.close();
  consumer.join();
  EXPECT_TRUE(returned.load());
}
