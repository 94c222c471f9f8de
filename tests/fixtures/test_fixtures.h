/**
 * @file test_fixtures.h
 * @brief Shared fixtures for unit and integration tests
 */

#ifndef GARAGE_TRANSFER_TEST_FIXTURES_H
#define GARAGE_TRANSFER_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <garage/transfer/garage_transfer.h>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace garage::transfer::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("garage_transfer_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto write_file(const std::filesystem::path& relative, const std::string& content)
        -> std::filesystem::path {
        auto path = test_dir_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    auto create_binary_file(const std::filesystem::path& relative, std::size_t size)
        -> std::filesystem::path {
        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);

        std::string content(size, '\0');
        for (auto& byte : content) {
            byte = static_cast<char>(dis(gen));
        }
        return write_file(relative, content);
    }

    static auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream file(path, std::ios::binary);
        std::ostringstream content;
        content << file.rdbuf();
        return content.str();
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief Observer that records every progress event
 */
class recording_observer : public progress_observer {
public:
    void on_event(const progress_event& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    [[nodiscard]] auto events() const -> std::vector<progress_event> {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    [[nodiscard]] auto count(progress_event_kind kind) const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& event : events_) {
            if (event.kind == kind) {
                ++n;
            }
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<progress_event> events_;
};

}  // namespace garage::transfer::test

#endif  // GARAGE_TRANSFER_TEST_FIXTURES_H
