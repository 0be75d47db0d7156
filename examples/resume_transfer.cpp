/**
 * @file resume_transfer.cpp
 * @brief Pause an upload, restart the manager and resume from the store
 *
 * This example demonstrates:
 * - Pausing a running upload at a given percentage
 * - Persisting transfers in a JSON store across manager instances
 * - Loading persisted transfers with start_managing()
 * - Resuming from the blocks already completed
 */

#include <kcenon/blob_transfer/blob_transfer.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::blob_transfer;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto create_test_file(const std::filesystem::path& path, size_t size) -> bool {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "Failed to create file: " << path << std::endl;
        return false;
    }

    std::vector<char> buffer(std::min(size, size_t{65536}));
    for (size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = static_cast<char>('a' + (i % 26));
    }

    size_t remaining = size;
    while (remaining > 0) {
        size_t to_write = std::min(remaining, buffer.size());
        file.write(buffer.data(), static_cast<std::streamsize>(to_write));
        remaining -= to_write;
    }
    return true;
}

auto build_manager(const std::filesystem::path& store_dir)
    -> result<transfer_manager> {
    json_store_config store_config;
    store_config.directory = store_dir;

    return transfer_manager::builder()
        .with_max_concurrency(2)
        .with_store(std::make_shared<json_transfer_store>(store_config))
        .with_reachability_monitor(std::make_shared<manual_reachability_monitor>())
        .build();
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Resume Transfer Example - Blob Transfer" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --work-dir <dir>        Scratch directory (default: ./resume_demo)" << std::endl;
    std::cout << "  --size <MB>             Test file size in MB (default: 64)" << std::endl;
    std::cout << "  --auto-pause <percent>  Pause at this percentage (default: 40)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::filesystem::path work_dir = "resume_demo";
    size_t size_mb = 64;
    double pause_at = 40.0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--work-dir" && i + 1 < argc) {
            work_dir = argv[++i];
        } else if (arg == "--size" && i + 1 < argc) {
            size_mb = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--auto-pause" && i + 1 < argc) {
            pause_at = std::stod(argv[++i]);
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    auto source = work_dir / "source.bin";
    auto container = work_dir / "container";
    auto store_dir = work_dir / "store";
    if (!create_test_file(source, size_mb * 1024 * 1024)) {
        return 1;
    }

    auto client = local_storage_client::create("resume-demo", container);
    if (!client) {
        std::cerr << "Failed to open container: " << client.error().message << std::endl;
        return 1;
    }

    transfer_id upload_id;

    // First session: start the upload and pause it part way
    {
        std::atomic<double> percent{0.0};
        auto manager_result = build_manager(store_dir);
        if (!manager_result) {
            std::cerr << "Failed to create manager: " << manager_result.error().message
                      << std::endl;
            return 1;
        }
        auto& manager = manager_result.value();
        if (auto registered = manager.register_client(client.value()); !registered) {
            std::cerr << registered.error().message << std::endl;
            return 1;
        }
        if (auto started = manager.start_managing(); !started) {
            std::cerr << started.error().message << std::endl;
            return 1;
        }

        blob_transfer_options options;
        options.block_size = 1024 * 1024;
        options.overwrite = true;

        upload_request request{"resume-demo", source.string(), "source.bin", options,
                               [&percent](const transfer_snapshot&,
                                          const transfer_progress& progress) {
                                   percent = progress.completion_percentage();
                               }};
        auto id = manager.upload(request);
        if (!id) {
            std::cerr << "Upload failed: " << id.error().message << std::endl;
            return 1;
        }
        upload_id = id.value();

        while (percent.load() < pause_at) {
            auto snapshot = manager.find(upload_id);
            if (!snapshot || snapshot->state == transfer_state::completed) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        if (auto paused = manager.pause(upload_id); !paused) {
            std::cerr << "Pause failed: " << paused.error().message << std::endl;
        }
        manager.wait_until_idle(std::chrono::seconds(30));

        auto progress = manager.progress(upload_id);
        if (progress) {
            std::cout << "Paused after " << progress->completed_blocks << "/"
                      << progress->total_blocks << " blocks ("
                      << format_bytes(progress->bytes_transferred) << ")" << std::endl;
        }

        if (auto stopped = manager.stop_managing(); !stopped) {
            std::cerr << "Store flush failed: " << stopped.error().message << std::endl;
            return 1;
        }
    }

    // Second session: a new manager loads the paused upload and resumes it
    auto manager_result = build_manager(store_dir);
    if (!manager_result) {
        std::cerr << "Failed to create manager: " << manager_result.error().message
                  << std::endl;
        return 1;
    }
    auto& manager = manager_result.value();
    if (auto registered = manager.register_client(client.value()); !registered) {
        std::cerr << registered.error().message << std::endl;
        return 1;
    }
    if (auto started = manager.start_managing(); !started) {
        std::cerr << "Loading persisted transfers failed: " << started.error().message
                  << std::endl;
        return 1;
    }

    auto restored = manager.find(upload_id);
    if (!restored) {
        std::cerr << "Upload was not restored from the store" << std::endl;
        return 1;
    }
    std::cout << "Restored upload in state " << to_string(restored->state) << " with "
              << format_bytes(restored->bytes_transferred) << " already sent" << std::endl;

    auto resumed = manager.resume(upload_id, [](const transfer_snapshot&,
                                                const transfer_progress& progress) {
        std::cout << "\r  " << std::fixed << std::setprecision(1)
                  << progress.completion_percentage() << "%" << std::flush;
    });
    if (!resumed) {
        std::cerr << "Resume failed: " << resumed.error().message << std::endl;
        return 1;
    }
    manager.wait_until_idle(std::chrono::minutes(5));
    std::cout << std::endl;

    auto finished = manager.find(upload_id);
    if (!finished || finished->state != transfer_state::completed) {
        std::cerr << "Upload did not complete" << std::endl;
        return 1;
    }
    std::cout << "Upload completed: " << client.value()->blob_path("source.bin") << std::endl;

    if (auto removed = manager.remove(upload_id); !removed) {
        std::cerr << "Remove failed: " << removed.error().message << std::endl;
        return 1;
    }
    return manager.stop_managing() ? 0 : 1;
}
