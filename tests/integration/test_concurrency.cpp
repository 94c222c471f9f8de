/**
 * @file test_concurrency.cpp
 * @brief Concurrency ceiling and completeness of bounded transfers
 */

#include "fixtures/in_memory_gateway.h"
#include "fixtures/test_fixtures.h"

#include <garage/transfer/core/bounded_task_runner.h>
#include <garage/transfer/orchestrator/transfer_orchestrator.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace garage::transfer::test {

namespace {

/// Tracks how many operations are in flight and the highest value seen
class in_flight_meter {
public:
    void enter() {
        auto now = ++current_;
        auto seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
        }
    }

    void leave() { --current_; }

    [[nodiscard]] auto peak() const -> std::size_t { return peak_.load(); }

private:
    std::atomic<std::size_t> current_{0};
    std::atomic<std::size_t> peak_{0};
};

/// in_memory_gateway that measures concurrent uploads
class metered_gateway : public in_memory_gateway {
public:
    auto put_object(const std::string& bucket,
                    const std::string& key,
                    std::istream& source,
                    uint64_t size,
                    const byte_progress_callback& on_progress) -> result<uint64_t> override {
        meter.enter();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        auto stored = in_memory_gateway::put_object(bucket, key, source, size, on_progress);
        meter.leave();
        return stored;
    }

    in_flight_meter meter;
};

auto make_deletes(std::size_t count) -> std::vector<work_item> {
    std::vector<work_item> items;
    items.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        items.emplace_back(delete_item{"key-" + std::to_string(i)});
    }
    return items;
}

}  // namespace

TEST(ConcurrencyTest, NeverExceedsLimit) {
    for (std::size_t limit : {1u, 2u, 4u, 7u}) {
        in_flight_meter meter;
        bounded_task_runner runner;

        auto outcomes = runner.run(make_deletes(40), limit, [&](const work_item&) {
            meter.enter();
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            meter.leave();
            return result<uint64_t>{uint64_t{0}};
        });

        ASSERT_TRUE(outcomes.has_value());
        EXPECT_EQ(outcomes.value().size(), 40u);
        EXPECT_LE(meter.peak(), limit) << "limit " << limit;
        EXPECT_GE(meter.peak(), 1u);
    }
}

TEST(ConcurrencyTest, ReachesLimitWhenEnoughItemsQueue) {
    for (std::size_t limit : {2u, 4u, 8u}) {
        in_flight_meter meter;
        std::mutex mutex;
        std::condition_variable all_arrived;
        std::size_t arrived = 0;
        bounded_task_runner runner;

        // Each of the first `limit` operations waits until all of them are
        // in flight together; later ones pass straight through.
        auto outcomes = runner.run(make_deletes(limit * 3), limit, [&](const work_item&) {
            meter.enter();
            {
                std::unique_lock<std::mutex> lock(mutex);
                ++arrived;
                all_arrived.notify_all();
                all_arrived.wait_for(lock, std::chrono::seconds(5),
                                     [&]() { return arrived >= limit; });
            }
            meter.leave();
            return result<uint64_t>{uint64_t{0}};
        });

        ASSERT_TRUE(outcomes.has_value());
        EXPECT_EQ(outcomes.value().size(), limit * 3);
        EXPECT_EQ(meter.peak(), limit) << "limit " << limit;
    }
}

TEST(ConcurrencyTest, EveryItemRunsExactlyOnce) {
    for (std::size_t count : {1u, 3u, 17u, 100u}) {
        for (std::size_t limit : {1u, 5u, 32u, 200u}) {
            std::mutex mutex;
            std::multiset<std::string> seen;
            bounded_task_runner runner;

            auto outcomes = runner.run(make_deletes(count), limit,
                                       [&](const work_item& item) {
                                           std::lock_guard<std::mutex> lock(mutex);
                                           seen.insert(item_key(item));
                                           return result<uint64_t>{uint64_t{1}};
                                       });

            ASSERT_TRUE(outcomes.has_value());
            ASSERT_EQ(outcomes.value().size(), count);
            EXPECT_EQ(seen.size(), count);
            for (std::size_t i = 0; i < count; ++i) {
                auto key = "key-" + std::to_string(i);
                EXPECT_EQ(seen.count(key), 1u) << key;
                EXPECT_EQ(item_key(outcomes.value()[i].item), key);
            }
        }
    }
}

TEST(ConcurrencyTest, OneFailureAmongTen) {
    bounded_task_runner runner;
    auto outcomes = runner.run(make_deletes(10), 3, [](const work_item& item) -> result<uint64_t> {
        if (item_key(item) == "key-6") {
            return unexpected{error{error_code::access_denied, "Access denied"}};
        }
        if (item_key(item) == "key-2") {
            throw std::runtime_error("worker exploded");
        }
        return uint64_t{10};
    });

    ASSERT_TRUE(outcomes.has_value());
    std::size_t failed = 0;
    for (const auto& outcome : outcomes.value()) {
        if (!outcome.succeeded()) {
            ++failed;
        }
    }
    EXPECT_EQ(failed, 2u);
    EXPECT_EQ(outcomes.value()[6].failure->code, error_code::access_denied);
    ASSERT_TRUE(outcomes.value()[2].failure.has_value());
    EXPECT_NE(outcomes.value()[2].failure->message.find("worker exploded"), std::string::npos);
}

class OrchestratorConcurrencyTest : public TempDirectoryFixture {};

TEST_F(OrchestratorConcurrencyTest, UploadRespectsParallelism) {
    for (int i = 0; i < 30; ++i) {
        write_file("many/file-" + std::to_string(i) + ".txt", std::string(64, 'x'));
    }

    auto gateway = std::make_shared<metered_gateway>();
    transfer_orchestrator orchestrator(gateway);

    run_config config;
    config.bucket = "b";
    config.parallelism = 4;

    auto summary = orchestrator.upload(config, test_dir_ / "many", std::string("many"));
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().total, 30u);
    EXPECT_TRUE(summary.value().all_succeeded());
    EXPECT_EQ(summary.value().bytes_transferred, 30u * 64u);
    EXPECT_EQ(gateway->object_count("b"), 30u);
    EXPECT_EQ(gateway->put_calls.load(), 30u);
    EXPECT_LE(gateway->meter.peak(), 4u);
}

TEST_F(OrchestratorConcurrencyTest, RecursiveDeleteWithSlowGateway) {
    auto gateway = std::make_shared<in_memory_gateway>(7);
    for (int i = 0; i < 25; ++i) {
        gateway->put("b", "tmp/" + std::to_string(i), "x");
    }
    gateway->set_operation_delay(std::chrono::milliseconds(2));
    transfer_orchestrator orchestrator(gateway);

    run_config config;
    config.bucket = "b";
    config.parallelism = 6;
    config.recursive = true;
    config.confirmed = true;

    auto summary = orchestrator.remove(config, "tmp/");
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().succeeded, 25u);
    EXPECT_EQ(gateway->delete_calls.load(), 25u);
    EXPECT_EQ(gateway->object_count("b"), 0u);
}

}  // namespace garage::transfer::test
