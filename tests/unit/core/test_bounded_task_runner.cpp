/**
 * @file test_bounded_task_runner.cpp
 * @brief Unit tests for the bounded concurrent task runner
 */

#include "fixtures/test_fixtures.h"

#include <garage/transfer/adapters/thread_pool_adapter.h>
#include <garage/transfer/core/bounded_task_runner.h>

#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <future>
#include <system_error>
#include <thread>
#include <vector>

namespace garage::transfer::test {

namespace {

auto make_delete_items(std::size_t count) -> std::vector<work_item> {
    std::vector<work_item> items;
    items.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        items.emplace_back(delete_item{"key-" + std::to_string(i)});
    }
    return items;
}

/// Pool that refuses submissions once it has accepted max_accepted loops
class refusing_pool : public adapters::transfer_thread_pool_interface {
public:
    refusing_pool(std::size_t capacity, std::size_t max_accepted)
        : capacity_(capacity), max_accepted_(max_accepted) {}

    std::future<void> submit(std::function<void()> task) override {
        ++attempts;
        if (accepted.load() >= max_accepted_) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "thread limit reached");
        }
        ++accepted;
        return std::async(std::launch::async, std::move(task));
    }

    [[nodiscard]] size_t worker_count() const override { return capacity_; }

    std::atomic<std::size_t> attempts{0};
    std::atomic<std::size_t> accepted{0};

private:
    std::size_t capacity_;
    std::size_t max_accepted_;
};

/// Observer that throws for every event of one key
class throwing_observer : public progress_observer {
public:
    explicit throwing_observer(std::string key) : key_(std::move(key)) {}

    void on_event(const progress_event& event) override {
        if (event.key == key_) {
            throw std::runtime_error("display went away");
        }
    }

private:
    std::string key_;
};

}  // namespace

class BoundedTaskRunnerTest : public ::testing::Test {};

TEST_F(BoundedTaskRunnerTest, EmptyInputYieldsEmptyOutput) {
    bounded_task_runner runner;
    std::atomic<int> calls{0};

    auto outcomes = runner.run({}, 4, [&](const work_item&) -> result<uint64_t> {
        ++calls;
        return uint64_t{0};
    });

    ASSERT_TRUE(outcomes.has_value());
    EXPECT_TRUE(outcomes.value().empty());
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(BoundedTaskRunnerTest, ZeroLimitIsRejected) {
    bounded_task_runner runner;

    auto outcomes = runner.run(make_delete_items(3), 0,
                               [](const work_item&) -> result<uint64_t> { return uint64_t{0}; });

    ASSERT_FALSE(outcomes.has_value());
    EXPECT_EQ(outcomes.error().code, error_code::invalid_argument);
}

TEST_F(BoundedTaskRunnerTest, MissingOperationIsRejected) {
    bounded_task_runner runner;

    auto outcomes = runner.run(make_delete_items(3), 2, item_operation{});

    ASSERT_FALSE(outcomes.has_value());
    EXPECT_EQ(outcomes.error().code, error_code::invalid_argument);
}

TEST_F(BoundedTaskRunnerTest, OutcomesFollowInputOrder) {
    bounded_task_runner runner;

    auto outcomes = runner.run(make_delete_items(20), 4,
                               [](const work_item& item) -> result<uint64_t> {
                                   // Later keys finish first
                                   auto index = std::stoi(item_key(item).substr(4));
                                   std::this_thread::sleep_for(
                                       std::chrono::milliseconds(20 - index));
                                   return static_cast<uint64_t>(index);
                               });

    ASSERT_TRUE(outcomes.has_value());
    ASSERT_EQ(outcomes.value().size(), 20u);
    for (std::size_t i = 0; i < 20; ++i) {
        EXPECT_EQ(item_key(outcomes.value()[i].item), "key-" + std::to_string(i));
        EXPECT_EQ(outcomes.value()[i].bytes_transferred, i);
    }
}

TEST_F(BoundedTaskRunnerTest, FailedItemDoesNotStopOthers) {
    bounded_task_runner runner;

    auto outcomes = runner.run(make_delete_items(10), 3,
                               [](const work_item& item) -> result<uint64_t> {
                                   if (item_key(item) == "key-4") {
                                       return unexpected{error{error_code::request_failed,
                                                               "backend said no"}};
                                   }
                                   return uint64_t{1};
                               });

    ASSERT_TRUE(outcomes.has_value());
    ASSERT_EQ(outcomes.value().size(), 10u);

    std::size_t failed = 0;
    for (const auto& outcome : outcomes.value()) {
        if (!outcome.succeeded()) {
            ++failed;
            EXPECT_EQ(item_key(outcome.item), "key-4");
            EXPECT_EQ(outcome.failure->code, error_code::request_failed);
            EXPECT_EQ(outcome.failure->message, "backend said no");
        }
    }
    EXPECT_EQ(failed, 1u);
}

TEST_F(BoundedTaskRunnerTest, ExceptionBecomesFailureOutcome) {
    bounded_task_runner runner;

    auto outcomes = runner.run(make_delete_items(5), 2,
                               [](const work_item& item) -> result<uint64_t> {
                                   if (item_key(item) == "key-2") {
                                       throw std::runtime_error("disk on fire");
                                   }
                                   return uint64_t{0};
                               });

    ASSERT_TRUE(outcomes.has_value());
    ASSERT_EQ(outcomes.value().size(), 5u);
    const auto& failed = outcomes.value()[2];
    ASSERT_FALSE(failed.succeeded());
    EXPECT_EQ(failed.failure->code, error_code::item_transfer_failed);
    EXPECT_NE(failed.failure->message.find("disk on fire"), std::string::npos);

    for (std::size_t i = 0; i < 5; ++i) {
        if (i != 2) {
            EXPECT_TRUE(outcomes.value()[i].succeeded());
        }
    }
}

TEST_F(BoundedTaskRunnerTest, EmitsProgressEventsPerItem) {
    auto observer = std::make_shared<recording_observer>();
    bounded_task_runner runner(nullptr, observer);

    auto outcomes = runner.run(make_delete_items(4), 2,
                               [](const work_item& item) -> result<uint64_t> {
                                   if (item_key(item) == "key-3") {
                                       return unexpected{error{error_code::object_not_found,
                                                               "gone"}};
                                   }
                                   return uint64_t{7};
                               });

    ASSERT_TRUE(outcomes.has_value());
    EXPECT_EQ(observer->count(progress_event_kind::item_started), 4u);
    EXPECT_EQ(observer->count(progress_event_kind::item_completed), 3u);
    EXPECT_EQ(observer->count(progress_event_kind::item_failed), 1u);

    for (const auto& event : observer->events()) {
        EXPECT_EQ(event.operation, "delete");
        if (event.kind == progress_event_kind::item_failed) {
            EXPECT_EQ(event.key, "key-3");
            EXPECT_EQ(event.error_message, "gone");
        }
    }
}

TEST_F(BoundedTaskRunnerTest, UsesInjectedPool) {
    auto pool = std::make_shared<adapters::async_transfer_pool>(2);
    bounded_task_runner runner(pool);

    auto outcomes = runner.run(make_delete_items(6), 2,
                               [](const work_item&) -> result<uint64_t> { return uint64_t{1}; });

    ASSERT_TRUE(outcomes.has_value());
    EXPECT_EQ(outcomes.value().size(), 6u);
}

TEST_F(BoundedTaskRunnerTest, WorkersAreCappedByPoolCapacity) {
    auto pool = std::make_shared<refusing_pool>(2, 100);
    bounded_task_runner runner(pool);

    auto outcomes = runner.run(make_delete_items(10), 8,
                               [](const work_item&) -> result<uint64_t> { return uint64_t{1}; });

    ASSERT_TRUE(outcomes.has_value());
    EXPECT_EQ(outcomes.value().size(), 10u);
    EXPECT_EQ(pool->attempts.load(), 2u);
}

TEST_F(BoundedTaskRunnerTest, RefusedSubmissionStillCompletesEveryItem) {
    auto pool = std::make_shared<refusing_pool>(4, 1);
    bounded_task_runner runner(pool);

    auto outcomes = runner.run(make_delete_items(12), 4,
                               [](const work_item&) -> result<uint64_t> { return uint64_t{3}; });

    ASSERT_TRUE(outcomes.has_value());
    ASSERT_EQ(outcomes.value().size(), 12u);
    for (std::size_t i = 0; i < 12; ++i) {
        EXPECT_TRUE(outcomes.value()[i].succeeded());
        EXPECT_EQ(item_key(outcomes.value()[i].item), "key-" + std::to_string(i));
    }
    EXPECT_EQ(pool->accepted.load(), 1u);
    EXPECT_EQ(pool->attempts.load(), 2u);
}

TEST_F(BoundedTaskRunnerTest, PoolAcceptingNoWorkerIsAnError) {
    auto pool = std::make_shared<refusing_pool>(4, 0);
    bounded_task_runner runner(pool);
    std::atomic<int> calls{0};

    auto outcomes = runner.run(make_delete_items(3), 2, [&](const work_item&) -> result<uint64_t> {
        ++calls;
        return uint64_t{0};
    });

    ASSERT_FALSE(outcomes.has_value());
    EXPECT_EQ(outcomes.error().code, error_code::internal_error);
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(BoundedTaskRunnerTest, ThrowingObserverKeepsEveryOutcome) {
    bounded_task_runner runner(nullptr, std::make_shared<throwing_observer>("key-4"));

    auto outcomes = runner.run(make_delete_items(8), 3,
                               [](const work_item&) -> result<uint64_t> { return uint64_t{1}; });

    ASSERT_TRUE(outcomes.has_value());
    ASSERT_EQ(outcomes.value().size(), 8u);
    for (const auto& outcome : outcomes.value()) {
        EXPECT_TRUE(outcome.succeeded()) << item_key(outcome.item);
    }
}

}  // namespace garage::transfer::test
