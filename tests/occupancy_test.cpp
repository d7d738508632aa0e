// Carpark headers
#include "core/OccupancyStore.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <atomic>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

namespace carpark::test {

  using carpark::core::InputEvent;
  using carpark::core::OccupancyError;
  using carpark::core::OccupancyStore;

  TEST(OccupancyStoreTest, RejectsInvalidConstruction) {
    EXPECT_THROW(OccupancyStore("Lot", 0), std::invalid_argument);
    EXPECT_THROW(OccupancyStore("Lot", -3), std::invalid_argument);
    EXPECT_THROW(OccupancyStore("Lot", 5, 6), std::invalid_argument);
    EXPECT_THROW(OccupancyStore("Lot", 5, -1), std::invalid_argument);
    EXPECT_NO_THROW(OccupancyStore("Lot", 5, 5));
  }

  TEST(OccupancyStoreTest, EnterAndExitMoveByOneAndSnapshot) {
    const auto fixed = std::chrono::system_clock::time_point{ std::chrono::seconds{ 1'700'000'000 } };
    OccupancyStore store("Moondalup", 10, 3, [fixed] { return fixed; });

    auto in = store.enter();
    ASSERT_TRUE(in);
    EXPECT_EQ(in.error, OccupancyError::None);
    EXPECT_EQ(in.snapshot->location, "Moondalup");
    EXPECT_EQ(in.snapshot->capacity, 10);
    EXPECT_EQ(in.snapshot->occupied, 4);
    EXPECT_EQ(in.snapshot->available(), 6);
    EXPECT_EQ(in.snapshot->timestamp, fixed);
    EXPECT_FALSE(in.snapshot->temperature);

    auto out = store.exit();
    ASSERT_TRUE(out);
    EXPECT_EQ(out.snapshot->occupied, 3);
    EXPECT_EQ(store.occupied(), 3);
    EXPECT_EQ(store.available(), 7);
  }

  // capacity 2: enter, enter, enter(full), exit, exit, exit(empty)
  TEST(OccupancyStoreTest, BoundariesAreRejectedNotClamped) {
    OccupancyStore store("Lot", 2);

    EXPECT_TRUE(store.enter());
    EXPECT_TRUE(store.enter());
    EXPECT_EQ(store.occupied(), 2);

    auto full = store.enter();
    EXPECT_FALSE(full);
    EXPECT_FALSE(full.snapshot);
    EXPECT_EQ(full.error, OccupancyError::AtCapacity);
    EXPECT_EQ(store.occupied(), 2);

    EXPECT_TRUE(store.exit());
    EXPECT_TRUE(store.exit());
    EXPECT_EQ(store.occupied(), 0);

    auto empty = store.exit();
    EXPECT_FALSE(empty);
    EXPECT_EQ(empty.error, OccupancyError::AlreadyEmpty);
    EXPECT_EQ(store.occupied(), 0);
  }

  TEST(OccupancyStoreTest, RepeatedRejectionIsIdempotent) {
    OccupancyStore store("Lot", 1, 1);
    for (int i = 0; i < 5; ++i) {
      auto r = store.enter();
      EXPECT_EQ(r.error, OccupancyError::AtCapacity);
      EXPECT_EQ(store.occupied(), 1);
    }
    EXPECT_TRUE(store.exit());
    for (int i = 0; i < 5; ++i) {
      EXPECT_EQ(store.exit().error, OccupancyError::AlreadyEmpty);
      EXPECT_EQ(store.occupied(), 0);
    }
  }

  TEST(OccupancyStoreTest, ApplyDispatchesOnIntent) {
    OccupancyStore store("Lot", 3);
    EXPECT_EQ(store.apply(InputEvent::Enter).snapshot->occupied, 1);
    EXPECT_EQ(store.apply(InputEvent::Exit).snapshot->occupied, 0);
    EXPECT_EQ(store.apply(InputEvent::Exit).error, OccupancyError::AlreadyEmpty);
  }

  TEST(OccupancyStoreTest, InvariantHoldsOverRandomSequence) {
    OccupancyStore store("Lot", 7);
    std::mt19937 rng(42);
    std::bernoulli_distribution coin(0.5);

    int expected = 0;
    for (int i = 0; i < 5000; ++i) {
      const bool enter = coin(rng);
      auto r = enter ? store.enter() : store.exit();
      if (enter && expected < 7)
        ++expected;
      else if (!enter && expected > 0)
        --expected;
      else
        EXPECT_FALSE(r);

      ASSERT_EQ(store.occupied(), expected);
      ASSERT_GE(store.occupied(), 0);
      ASSERT_LE(store.occupied(), 7);
      ASSERT_EQ(store.occupied() + store.available(), 7);
    }
  }

  TEST(OccupancyStoreTest, ConcurrentTransitionsAreNeverLost) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    OccupancyStore store("Lot", kThreads * kPerThread);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
      threads.emplace_back([&] {
        for (int i = 0; i < kPerThread; ++i)
          EXPECT_TRUE(store.enter());
      });
    for (auto& t : threads)
      t.join();
    EXPECT_EQ(store.occupied(), kThreads * kPerThread);

    // mixed traffic at a boundary: every accepted exit must be matched by a decrement
    threads.clear();
    std::atomic<int> accepted{ 0 };
    for (int t = 0; t < kThreads; ++t)
      threads.emplace_back([&] {
        for (int i = 0; i < kPerThread * 2; ++i)
          if (store.exit())
            ++accepted;
      });
    for (auto& t : threads)
      t.join();
    EXPECT_EQ(accepted.load(), kThreads * kPerThread);
    EXPECT_EQ(store.occupied(), 0);
  }

} // namespace carpark::test
