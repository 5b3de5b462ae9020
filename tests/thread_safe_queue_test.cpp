// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for capital::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO ordering of inbound collaborator events
//   - try_pop() never blocks (the inbound loop and IPC drain rely on it)
//   - Blocking pop() wakes on push from another thread
//   - No loss or duplication under concurrent producers and consumers
// =============================================================================

#include "capital/concurrent/thread_safe_queue.hpp"
#include "capital/events/event.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  capital::ThreadSafeQueue<std::uint64_t> ids;
};

// -----------------------------------------------------------------------------
// 1. Fresh queue is empty with size 0.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(ids.empty());
  EXPECT_EQ(ids.size(), 0u);
}

// -----------------------------------------------------------------------------
// 2. Events come back in submission order.
// Why: a fill processed before the signal batch that produced its proposal
//      would be reported as a fill for an unknown proposal.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EventsKeepSubmissionOrder) {
  capital::ThreadSafeQueue<capital::Event> events;

  capital::SignalBatchEvent batch;
  batch.sequence_id = 1;
  capital::ProposalFilledEvent fill;
  fill.proposal_id = 7;
  fill.sequence_id = 2;
  capital::PositionClosedEvent close;
  close.position_id = 3;
  close.sequence_id = 3;

  events.push(batch);
  events.push(fill);
  events.push(close);
  EXPECT_EQ(events.size(), 3u);

  EXPECT_TRUE(std::holds_alternative<capital::SignalBatchEvent>(events.pop()));
  auto second = events.pop();
  ASSERT_TRUE(std::holds_alternative<capital::ProposalFilledEvent>(second));
  EXPECT_EQ(std::get<capital::ProposalFilledEvent>(second).proposal_id, 7u);
  EXPECT_TRUE(
      std::holds_alternative<capital::PositionClosedEvent>(events.pop()));
  EXPECT_TRUE(events.empty());
}

// -----------------------------------------------------------------------------
// 3. try_pop() on an empty queue returns nullopt; on a non-empty one returns
//    the front item.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopNeverBlocks) {
  EXPECT_FALSE(ids.try_pop().has_value());

  ids.push(11);
  ids.push(12);
  auto front = ids.try_pop();
  ASSERT_TRUE(front.has_value());
  EXPECT_EQ(*front, 11u);
  EXPECT_EQ(ids.size(), 1u);
}

// -----------------------------------------------------------------------------
// 4. Blocking pop() waits until a producer pushes.
// Why: exercises the condition_variable wakeup path.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<std::uint64_t> received{0};

  std::thread consumer([this, &received] { received.store(ids.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), 0u);

  ids.push(4242);
  consumer.join();

  EXPECT_EQ(received.load(), 4242u);
}

// -----------------------------------------------------------------------------
// 5. Four producers and four consumers: every id is popped exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersAndConsumers) {
  constexpr std::uint64_t kProducers = 4;
  constexpr std::uint64_t kConsumers = 4;
  constexpr std::uint64_t kPerProducer = 1000;
  constexpr std::uint64_t kTotal = kProducers * kPerProducer;

  std::vector<std::thread> producers;
  for (std::uint64_t p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (std::uint64_t i = 0; i < kPerProducer; ++i) {
        ids.push(p * kPerProducer + i);
      }
    });
  }

  std::atomic<std::uint64_t> consumed{0};
  std::vector<std::vector<std::uint64_t>> per_consumer(kConsumers);
  std::vector<std::thread> consumers;
  for (std::uint64_t c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &per_consumer] {
      while (consumed.load() < kTotal) {
        if (auto item = ids.try_pop()) {
          per_consumer[c].push_back(*item);
          consumed.fetch_add(1);
        } else {
          std::this_thread::yield();
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<std::uint64_t> all;
  for (const auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(all.size(), kTotal);
  for (std::uint64_t i = 0; i < kTotal; ++i) {
    EXPECT_EQ(all[i], i) << "missing or duplicate id at " << i;
  }
}
