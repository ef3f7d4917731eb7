#include "procgate/concurrency_gate.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace procgate {

TEST(ConcurrencyGateTest, AcquireAndReleaseTrackAvailability) {
  ConcurrencyGate gate(2);
  Context context;
  EXPECT_EQ(gate.capacity(), 2u);
  EXPECT_EQ(gate.available(), 2u);

  ASSERT_TRUE(gate.acquire(context).has_value());
  ASSERT_TRUE(gate.acquire(context).has_value());
  EXPECT_EQ(gate.available(), 0u);

  gate.release();
  EXPECT_EQ(gate.available(), 1u);
  gate.release();
  EXPECT_EQ(gate.available(), 2u);
}

TEST(ConcurrencyGateTest, ExtraReleaseDoesNotGrowCapacity) {
  ConcurrencyGate gate(1);
  gate.release();
  EXPECT_EQ(gate.available(), 1u);
}

TEST(ConcurrencyGateTest, SlotReleasesOnceOnDestructionOrEarly) {
  ConcurrencyGate gate(1);
  Context context;
  {
    auto slot = gate.acquire_slot(context);
    ASSERT_TRUE(slot.has_value());
    EXPECT_TRUE(slot->held());
    EXPECT_EQ(gate.available(), 0u);

    GateSlot moved = std::move(*slot);
    EXPECT_FALSE(slot->held());
    EXPECT_TRUE(moved.held());

    moved.release();
    EXPECT_FALSE(moved.held());
    EXPECT_EQ(gate.available(), 1u);
    moved.release();
    EXPECT_EQ(gate.available(), 1u);
  }
  EXPECT_EQ(gate.available(), 1u);

  {
    auto slot = gate.acquire_slot(context);
    ASSERT_TRUE(slot.has_value());
    EXPECT_EQ(gate.available(), 0u);
  }
  EXPECT_EQ(gate.available(), 1u);
}

TEST(ConcurrencyGateTest, WaiterIsAdmittedWhenSlotFrees) {
  ConcurrencyGate gate(1);
  Context context;
  ASSERT_TRUE(gate.acquire(context).has_value());

  std::atomic<bool> admitted{false};
  std::thread waiter([&] {
    auto result = gate.acquire(context);
    admitted = result.has_value();
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(admitted.load());
  gate.release();
  waiter.join();
  EXPECT_TRUE(admitted.load());
  EXPECT_EQ(gate.available(), 0u);
}

TEST(ConcurrencyGateTest, CancelWakesBlockedWaiters) {
  ConcurrencyGate gate(1);
  Context context;
  ASSERT_TRUE(gate.acquire(context).has_value());

  constexpr int kWaiters = 4;
  std::atomic<int> cancelled{0};
  std::vector<std::thread> waiters;
  for (int i = 0; i < kWaiters; ++i) {
    waiters.emplace_back([&] {
      auto result = gate.acquire(context);
      if (!result && result.error().code == errc::cancelled) {
        ++cancelled;
      }
    });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  context.cancel();
  gate.wake_all();
  for (auto& waiter : waiters) {
    waiter.join();
  }
  EXPECT_EQ(cancelled.load(), kWaiters);
  EXPECT_EQ(gate.available(), 0u);
}

TEST(ConcurrencyGateTest, CancelledContextIsRefusedEvenWithFreeSlots) {
  ConcurrencyGate gate(4);
  Context context;
  context.cancel();
  auto result = gate.acquire(context);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, failure::cancelled);
  EXPECT_EQ(gate.available(), 4u);
}

TEST(ConcurrencyGateTest, ZeroCapacityFailsInsteadOfBlocking) {
  ConcurrencyGate gate(0);
  auto result = gate.acquire(Context{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, errc::invalid_parallelism);
}

TEST(ConcurrencyGateTest, HeldSlotsNeverExceedCapacity) {
  constexpr std::size_t kCapacity = 3;
  constexpr int kThreads = 12;
  constexpr int kRounds = 50;
  ConcurrencyGate gate(kCapacity);
  Context context;
  std::atomic<int> inside{0};
  std::atomic<int> peak{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int round = 0; round < kRounds; ++round) {
        auto slot = gate.acquire_slot(context);
        ASSERT_TRUE(slot.has_value());
        int now = ++inside;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::yield();
        --inside;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_LE(peak.load(), static_cast<int>(kCapacity));
  EXPECT_EQ(gate.available(), kCapacity);
}

}  // namespace procgate
