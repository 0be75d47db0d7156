/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_BLOB_TRANSFER_TEST_FIXTURES_H
#define KCENON_BLOB_TRANSFER_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/blob_transfer.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::blob_transfer::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("blob_transfer_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        container_dir_ = test_dir_ / "container";
        std::filesystem::create_directories(container_dir_);
        download_dir_ = test_dir_ / "downloads";
        std::filesystem::create_directories(download_dir_);
        store_dir_ = test_dir_ / "store";
        std::filesystem::create_directories(store_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size,
                          unsigned int seed = 42) -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(seed);
        std::uniform_int_distribution<> dis(0, 255);

        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }

        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::vector<char> {
        std::ifstream file(path, std::ios::binary);
        return std::vector<char>(std::istreambuf_iterator<char>(file),
                                 std::istreambuf_iterator<char>());
    }

    static auto files_equal(const std::filesystem::path& a, const std::filesystem::path& b)
        -> bool {
        if (!std::filesystem::exists(a) || !std::filesystem::exists(b)) {
            return false;
        }
        return read_file(a) == read_file(b);
    }

    static auto count_files(const std::filesystem::path& dir, const std::string& extension)
        -> std::size_t {
        std::size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.path().extension() == extension) {
                ++count;
            }
        }
        return count;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path container_dir_;
    std::filesystem::path download_dir_;
    std::filesystem::path store_dir_;
};

/**
 * @brief Manager on a local container with a JSON store in the temp directory
 */
class ManagerFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        monitor_ = std::make_shared<manual_reachability_monitor>();
        ASSERT_NO_FATAL_FAILURE(start_manager());
    }

    void TearDown() override {
        manager_.reset();
        client_.reset();
        TempDirectoryFixture::TearDown();
    }

    /**
     * @brief Build a fresh manager, client and store over the same directories
     */
    void start_manager(std::size_t max_concurrency = 4) {
        manager_.reset();

        auto client = local_storage_client::create("backup", container_dir_);
        ASSERT_TRUE(client.has_value()) << client.error().message;
        client_ = client.value();

        auto manager = transfer_manager::builder()
            .with_max_concurrency(max_concurrency)
            .with_worker_count(4)
            .with_store(std::make_shared<json_transfer_store>(json_store_config(store_dir_)))
            .with_reachability_monitor(monitor_)
            .build();
        ASSERT_TRUE(manager.has_value()) << manager.error().message;
        manager_.emplace(std::move(manager).value());

        ASSERT_TRUE(manager_->register_client(client_).has_value());
        auto started = manager_->start_managing();
        ASSERT_TRUE(started.has_value()) << started.error().message;
    }

    auto upload_request_for(const std::filesystem::path& source, const std::string& name)
        -> upload_request {
        upload_request request;
        request.restoration_id = "backup";
        request.source = source.string();
        request.destination = name;
        request.options.block_size = min_block_size;
        return request;
    }

    auto download_request_for(const std::string& name,
                              const std::filesystem::path& destination)
        -> download_request {
        download_request request;
        request.restoration_id = "backup";
        request.source = name;
        request.destination = destination.string();
        request.options.block_size = min_block_size;
        return request;
    }

    auto state_of(const transfer_id& id) -> std::optional<transfer_state> {
        auto snap = manager_->find(id);
        if (!snap) {
            return std::nullopt;
        }
        return snap->state;
    }

    auto wait_for_state(const transfer_id& id, transfer_state state,
                        std::chrono::milliseconds timeout = std::chrono::seconds(30))
        -> bool {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (state_of(id) == state) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return state_of(id) == state;
    }

    auto manager() -> transfer_manager& { return *manager_; }

    std::shared_ptr<manual_reachability_monitor> monitor_;
    std::shared_ptr<local_storage_client> client_;
    std::optional<transfer_manager> manager_;
};

}  // namespace kcenon::blob_transfer::test

#endif  // KCENON_BLOB_TRANSFER_TEST_FIXTURES_H
