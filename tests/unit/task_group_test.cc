#include "procgate/task_group.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

namespace procgate {
namespace {

Error callback_error(const char* context) {
  return Error{.code = make_error_code(errc::callback_failed), .context = context};
}

}  // namespace

TEST(TaskGroupTest, EmptyGroupWaitsImmediately) {
  TaskGroup group;
  EXPECT_TRUE(group.wait().has_value());
  EXPECT_EQ(group.outstanding(), 0u);
}

TEST(TaskGroupTest, WaitsForEveryUnit) {
  TaskGroup group;
  std::atomic<int> done{0};
  for (int i = 0; i < 8; ++i) {
    group.spawn([&done, i]() -> Result<void> {
      std::this_thread::sleep_for(std::chrono::milliseconds(i));
      ++done;
      return {};
    });
  }
  EXPECT_TRUE(group.wait().has_value());
  EXPECT_EQ(done.load(), 8);
  EXPECT_EQ(group.outstanding(), 0u);
}

TEST(TaskGroupTest, EarlyFailureDoesNotCancelSlowUnits) {
  TaskGroup group;
  std::atomic<bool> slow_finished{false};
  group.spawn([]() -> Result<void> { return callback_error("fast failure"); });
  group.spawn([&]() -> Result<void> {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    slow_finished = true;
    return {};
  });

  auto result = group.wait();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().context, "fast failure");
  EXPECT_TRUE(slow_finished.load());
}

TEST(TaskGroupTest, FirstFinishingFailureWins) {
  TaskGroup group;
  group.spawn([]() -> Result<void> {
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    return callback_error("late");
  });
  group.spawn([]() -> Result<void> { return callback_error("early"); });

  auto result = group.wait();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().context, "early");
}

TEST(TaskGroupTest, ConcurrentFailuresReportExactlyOne) {
  TaskGroup group;
  for (int i = 0; i < 16; ++i) {
    group.spawn([]() -> Result<void> { return callback_error("boom"); });
  }
  auto result = group.wait();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, failure::callback);
}

TEST(TaskGroupTest, ThrowingUnitBecomesCallbackError) {
  TaskGroup group;
  group.spawn([]() -> Result<void> { throw std::runtime_error("bad input"); });
  auto result = group.wait();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, errc::callback_failed);
  EXPECT_NE(result.error().context.find("bad input"), std::string::npos);
}

TEST(TaskGroupTest, WorkIsDestroyedBeforeWaitReturns) {
  auto token = std::make_shared<int>(1);
  std::weak_ptr<int> watch = token;
  TaskGroup group;
  group.spawn([token = std::move(token)]() -> Result<void> { return {}; });
  ASSERT_TRUE(group.wait().has_value());
  EXPECT_TRUE(watch.expired());
}

TEST(TaskGroupTest, ErrorPersistsAcrossWaits) {
  TaskGroup group;
  group.spawn([]() -> Result<void> { return callback_error("first"); });
  ASSERT_FALSE(group.wait().has_value());

  group.spawn([]() -> Result<void> { return {}; });
  auto again = group.wait();
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().context, "first");
}

TEST(TaskGroupTest, DestructorWaitsForUnits) {
  std::atomic<bool> finished{false};
  {
    TaskGroup group;
    group.spawn([&]() -> Result<void> {
      std::this_thread::sleep_for(std::chrono::milliseconds(30));
      finished = true;
      return {};
    });
  }
  EXPECT_TRUE(finished.load());
}

}  // namespace procgate
