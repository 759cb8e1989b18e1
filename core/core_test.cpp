#include "core/core.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class MockExecutor : public executor::Executor {
 public:
  MOCK_METHOD(std::string, Id, (), (const, override));
  MOCK_METHOD(proto::ExecutionOutcome, Execute,
              (const proto::ExecutionUnit&, const executor::LimitPolicy&,
               const std::atomic<bool>*),
              (override));
};

proto::ExecutionUnit Unit(const std::string& problem, int32_t index) {
  proto::ExecutionUnit unit;
  unit.set_problem_id(problem);
  unit.set_sample_index(index);
  unit.set_num_samples(10);
  return unit;
}

proto::ExecutionOutcome Outcome(const proto::ExecutionUnit& unit,
                                proto::OutcomeKind kind) {
  proto::ExecutionOutcome outcome;
  outcome.set_problem_id(unit.problem_id());
  outcome.set_sample_index(unit.sample_index());
  outcome.set_outcome_kind(kind);
  return outcome;
}

auto Passing() {
  return Invoke([](const proto::ExecutionUnit& unit,
                   const executor::LimitPolicy&, const std::atomic<bool>*) {
    return Outcome(unit, proto::PASSED);
  });
}

template <typename Predicate>
bool Eventually(Predicate predicate) {
  for (int i = 0; i < 500; i++) {
    if (predicate()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

/* Dispatch */

// NOLINTNEXTLINE
TEST(CoreTest, RunsEveryUnitOnce) {
  NiceMock<MockExecutor> executor;
  EXPECT_CALL(executor, Execute(_, _, _)).Times(30).WillRepeatedly(Passing());
  std::vector<proto::ExecutionUnit> units;
  for (const char* problem : {"c", "a", "b"}) {
    for (int i = 9; i >= 0; i--) units.push_back(Unit(problem, i));
  }
  std::vector<core::UnitResult> results =
      core::RunAll(&executor, units, executor::LimitPolicy(), 4);
  ASSERT_EQ(results.size(), 30u);
  for (size_t i = 1; i < results.size(); i++) {
    EXPECT_LT(results[i - 1].key, results[i].key);
  }
  EXPECT_EQ(results.front().key.ToString(), "a#0");
  EXPECT_EQ(results.back().key.ToString(), "c#9");
  for (const auto& result : results) {
    EXPECT_EQ(result.outcome.outcome_kind(), proto::PASSED);
    EXPECT_EQ(result.outcome.attempts(), 1);
  }
}

// NOLINTNEXTLINE
TEST(CoreTest, BoundedConcurrency) {
  NiceMock<MockExecutor> executor;
  std::atomic<int> running{0};
  std::atomic<int> max_running{0};
  ON_CALL(executor, Execute(_, _, _))
      .WillByDefault(Invoke([&](const proto::ExecutionUnit& unit,
                                const executor::LimitPolicy&,
                                const std::atomic<bool>*) {
        int now = ++running;
        int prev = max_running;
        while (now > prev && !max_running.compare_exchange_weak(prev, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        running--;
        return Outcome(unit, proto::PASSED);
      }));
  std::vector<proto::ExecutionUnit> units;
  for (int i = 0; i < 24; i++) units.push_back(Unit("p", i));
  auto results = core::RunAll(&executor, units, executor::LimitPolicy(), 3);
  EXPECT_EQ(results.size(), 24u);
  EXPECT_LE(max_running, 3);
  EXPECT_GE(max_running, 1);
}

// NOLINTNEXTLINE
TEST(CoreTest, RejectsDuplicates) {
  NiceMock<MockExecutor> executor;
  ON_CALL(executor, Execute(_, _, _)).WillByDefault(Passing());
  core::Core core(&executor, executor::LimitPolicy());
  core.SetNumCores(1);
  core.Start();
  EXPECT_TRUE(core.Enqueue(Unit("p", 0)));
  EXPECT_THROW(core.Enqueue(Unit("p", 0)), std::invalid_argument);  // NOLINT
  EXPECT_THROW(core.Enqueue(Unit("", 1)), std::invalid_argument);   // NOLINT
  EXPECT_THROW(core.Enqueue(Unit("p", -1)), std::invalid_argument);  // NOLINT
  core.Wait();
  EXPECT_EQ(core.Results().size(), 1u);
}

// NOLINTNEXTLINE
TEST(CoreTest, EnqueueBeforeStartFails) {
  NiceMock<MockExecutor> executor;
  core::Core core(&executor, executor::LimitPolicy());
  EXPECT_THROW(core.Enqueue(Unit("p", 0)), std::logic_error);  // NOLINT
}

// NOLINTNEXTLINE
TEST(CoreTest, BackpressureBlocksProducer) {
  NiceMock<MockExecutor> executor;
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  ON_CALL(executor, Execute(_, _, _))
      .WillByDefault(Invoke([released](const proto::ExecutionUnit& unit,
                                       const executor::LimitPolicy&,
                                       const std::atomic<bool>*) {
        released.wait();
        return Outcome(unit, proto::PASSED);
      }));
  core::Core core(&executor, executor::LimitPolicy());
  core.SetNumCores(1);
  core.SetMaxQueueSize(1);
  core.Start();

  std::atomic<int> enqueued{0};
  std::thread producer([&core, &enqueued]() {
    for (int i = 0; i < 5; i++) {
      core.Enqueue(Unit("p", i));
      enqueued++;
    }
  });
  // One unit running and one waiting in the queue.
  EXPECT_TRUE(Eventually([&enqueued]() { return enqueued == 2; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_EQ(enqueued, 2);
  EXPECT_EQ(core.RunningTasks().size(), 1u);

  release.set_value();
  producer.join();
  core.Wait();
  EXPECT_EQ(enqueued, 5);
  EXPECT_EQ(core.Results().size(), 5u);
}

/* Infrastructure errors */

// NOLINTNEXTLINE
TEST(CoreTest, InfraErrorIsRetried) {
  NiceMock<MockExecutor> executor;
  proto::ExecutionUnit unit = Unit("p", 0);
  EXPECT_CALL(executor, Execute(_, _, _))
      .WillOnce(Return(Outcome(unit, proto::INFRA_ERROR)))
      .WillOnce(Return(Outcome(unit, proto::FAILED)));
  std::vector<proto::ExecutionOutcome> published;
  core::Core core(&executor, executor::LimitPolicy());
  core.SetNumCores(1);
  core.SetResultCallback([&published](const proto::ExecutionOutcome& outcome) {
    published.push_back(outcome);
  });
  auto results = core.Run({unit});
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].outcome.outcome_kind(), proto::FAILED);
  EXPECT_EQ(results[0].outcome.attempts(), 2);
  ASSERT_EQ(published.size(), 1u);
  EXPECT_EQ(published[0].outcome_kind(), proto::FAILED);
}

// NOLINTNEXTLINE
TEST(CoreTest, InfraErrorRetriesAreBounded) {
  NiceMock<MockExecutor> executor;
  proto::ExecutionUnit unit = Unit("p", 0);
  EXPECT_CALL(executor, Execute(_, _, _))
      .Times(3)
      .WillRepeatedly(Return(Outcome(unit, proto::INFRA_ERROR)));
  core::Core core(&executor, executor::LimitPolicy());
  core.SetNumCores(2);
  core.SetMaxInfraRetries(2);
  auto results = core.Run({unit});
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].outcome.outcome_kind(), proto::INFRA_ERROR);
  EXPECT_EQ(results[0].outcome.attempts(), 3);
}

// NOLINTNEXTLINE
TEST(CoreTest, OtherKindsAreNotRetried) {
  NiceMock<MockExecutor> executor;
  proto::ExecutionUnit unit = Unit("p", 0);
  EXPECT_CALL(executor, Execute(_, _, _))
      .WillOnce(Return(Outcome(unit, proto::TIMED_OUT)));
  auto results = core::RunAll(&executor, {unit}, executor::LimitPolicy(), 1);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].outcome.outcome_kind(), proto::TIMED_OUT);
}

// NOLINTNEXTLINE
TEST(CoreTest, ExecutorExceptionIsIsolated) {
  NiceMock<MockExecutor> executor;
  EXPECT_CALL(executor, Execute(_, _, _))
      .WillRepeatedly(Invoke([](const proto::ExecutionUnit& unit,
                                const executor::LimitPolicy&,
                                const std::atomic<bool>*) {
        if (unit.sample_index() == 1) throw std::runtime_error("boom");
        return Outcome(unit, proto::PASSED);
      }));
  core::Core core(&executor, executor::LimitPolicy());
  core.SetNumCores(2);
  core.SetMaxInfraRetries(0);
  auto results = core.Run({Unit("p", 0), Unit("p", 1), Unit("p", 2)});
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].outcome.outcome_kind(), proto::PASSED);
  EXPECT_EQ(results[1].outcome.outcome_kind(), proto::INFRA_ERROR);
  EXPECT_EQ(results[1].outcome.error_message(), "boom");
  EXPECT_EQ(results[1].outcome.problem_id(), "p");
  EXPECT_EQ(results[1].outcome.sample_index(), 1);
  EXPECT_EQ(results[2].outcome.outcome_kind(), proto::PASSED);
}

/* Cancellation */

// NOLINTNEXTLINE
TEST(CoreTest, CancellationKeepsCompletedOutcomes) {
  NiceMock<MockExecutor> executor;
  ON_CALL(executor, Execute(_, _, _))
      .WillByDefault(Invoke([](const proto::ExecutionUnit& unit,
                               const executor::LimitPolicy&,
                               const std::atomic<bool>* cancelled) {
        if (unit.sample_index() < 2) return Outcome(unit, proto::PASSED);
        while (!*cancelled) {
          std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        proto::ExecutionOutcome outcome = Outcome(unit, proto::INFRA_ERROR);
        outcome.set_error_message("Execution cancelled");
        return outcome;
      }));
  std::atomic<int> published{0};
  core::Core core(&executor, executor::LimitPolicy());
  core.SetNumCores(2);
  core.SetMaxQueueSize(20);
  core.SetResultCallback(
      [&published](const proto::ExecutionOutcome&) { published++; });
  core.Start();
  for (int i = 0; i < 10; i++) core.Enqueue(Unit("p", i));
  EXPECT_TRUE(Eventually([&core, &published]() {
    return published == 2 && core.RunningTasks().size() == 2;
  }));

  core.Cancel();
  EXPECT_TRUE(core.Cancelled());
  EXPECT_FALSE(core.Enqueue(Unit("p", 10)));
  core.Wait();

  auto results = core.Results();
  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(results[0].outcome.outcome_kind(), proto::PASSED);
  EXPECT_EQ(results[1].outcome.outcome_kind(), proto::PASSED);
  EXPECT_EQ(results[2].outcome.outcome_kind(), proto::INFRA_ERROR);
  EXPECT_EQ(results[3].outcome.outcome_kind(), proto::INFRA_ERROR);
  EXPECT_EQ(results[3].outcome.attempts(), 1);
  EXPECT_EQ(published, 4);
  // 6 queued units plus the one offered after cancellation.
  EXPECT_EQ(core.NotRun().size(), 7u);
  EXPECT_TRUE(core.RunningTasks().empty());
}

// NOLINTNEXTLINE
TEST(CoreTest, CallbackFailureStopsRun) {
  NiceMock<MockExecutor> executor;
  ON_CALL(executor, Execute(_, _, _)).WillByDefault(Passing());
  core::Core core(&executor, executor::LimitPolicy());
  core.SetNumCores(1);
  core.SetResultCallback([](const proto::ExecutionOutcome&) {
    throw std::runtime_error("disk full");
  });
  core.Start();
  core.Enqueue(Unit("p", 0));
  EXPECT_THROW(core.Wait(), std::runtime_error);  // NOLINT
  EXPECT_TRUE(core.Cancelled());
}

}  // namespace
