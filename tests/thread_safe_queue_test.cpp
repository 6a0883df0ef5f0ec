// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for vclock::ThreadSafeQueue, the telemetry hand-off between the
// threads that mutate the clock and the ClockServer thread.
//
// Validates:
//   - FIFO order and try_pop() on an empty queue
//   - Move-only payloads
//   - Many producers, one polling consumer: nothing lost or duplicated
// =============================================================================

#include "vclock/concurrent/thread_safe_queue.hpp"
#include "vclock/events/clock_events.hpp"
#include "vclock/events/event.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <thread>
#include <vector>

// -----------------------------------------------------------------------------
// 1. Items come out in push order; an empty queue returns nullopt at once.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueTest, FifoOrderAndEmptyPop) {
  vclock::ThreadSafeQueue<vclock::Event> queue;
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(vclock::ClockResetEvent{1, 42});
  queue.push(vclock::ClockResetEvent{2, 42});
  EXPECT_EQ(queue.size(), 2u);

  auto first = queue.try_pop();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(std::get<vclock::ClockResetEvent>(*first).previous_tick, 1);

  auto second = queue.try_pop();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(std::get<vclock::ClockResetEvent>(*second).previous_tick, 2);

  EXPECT_FALSE(queue.try_pop().has_value());
  EXPECT_EQ(queue.size(), 0u);
}

// -----------------------------------------------------------------------------
// 2. Move-only payloads are supported.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueTest, MoveOnlyPayload) {
  vclock::ThreadSafeQueue<std::unique_ptr<int>> queue;
  queue.push(std::make_unique<int>(7));

  auto item = queue.try_pop();
  ASSERT_TRUE(item.has_value());
  ASSERT_NE(*item, nullptr);
  EXPECT_EQ(**item, 7);
}

// -----------------------------------------------------------------------------
// 3. Four producers, one polling consumer.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueTest, ConcurrentProducersPollingConsumer) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 500;
  constexpr int kTotal = kProducers * kPerProducer;

  vclock::ThreadSafeQueue<int> queue;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&queue, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.push(p * kPerProducer + i);
      }
    });
  }

  std::set<int> received;
  std::thread consumer([&queue, &received] {
    while (static_cast<int>(received.size()) < kTotal) {
      if (auto v = queue.try_pop()) {
        received.insert(*v);
      } else {
        std::this_thread::yield();
      }
    }
  });

  for (auto& t : producers) {
    t.join();
  }
  consumer.join();

  EXPECT_EQ(static_cast<int>(received.size()), kTotal);
  EXPECT_EQ(*received.begin(), 0);
  EXPECT_EQ(*received.rbegin(), kTotal - 1);
}
