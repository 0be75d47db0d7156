/**
 * @file auto_reconnect.cpp
 * @brief Automatic pause and resume driven by network reachability
 *
 * This example demonstrates:
 * - Plugging a reachability monitor into the transfer manager
 * - Transfers pausing when the network becomes unreachable
 * - Transfers resuming when it comes back
 * - Watching the live host interfaces with interface_reachability_monitor
 */

#include <kcenon/blob_transfer/blob_transfer.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::blob_transfer;

namespace {

std::atomic<bool> running{true};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        running = false;
    }
}

/**
 * @brief Format duration to human-readable string
 */
auto format_duration(std::chrono::milliseconds ms) -> std::string {
    if (ms.count() >= 1000) {
        return std::to_string(ms.count() / 1000) + "." +
               std::to_string((ms.count() % 1000) / 100) + "s";
    }
    return std::to_string(ms.count()) + "ms";
}

auto create_test_file(const std::filesystem::path& path, size_t size) -> bool {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::vector<char> buffer(std::min(size, size_t{65536}), 'x');
    size_t remaining = size;
    while (remaining > 0) {
        size_t to_write = std::min(remaining, buffer.size());
        file.write(buffer.data(), static_cast<std::streamsize>(to_write));
        remaining -= to_write;
    }
    return true;
}

/**
 * @brief Prints blob state changes with a timestamp
 */
class state_printer : public transfer_observer {
public:
    state_printer() : start_(std::chrono::steady_clock::now()) {}

    void on_transfer_state_changed(const transfer_snapshot& snapshot,
                                   transfer_state state,
                                   const std::optional<transfer_progress>& progress) override {
        if (snapshot.kind != transfer_kind::blob) {
            return;
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
        std::cout << "[" << format_duration(elapsed) << "] " << snapshot.destination
                  << ": " << to_string(state);
        if (progress) {
            std::cout << " " << progress->completed_blocks << "/" << progress->total_blocks;
        }
        std::cout << std::endl;
    }

private:
    std::chrono::steady_clock::time_point start_;
};

void print_interfaces() {
    auto interfaces = interface_reachability_monitor::available_interfaces();
    std::cout << "Host interfaces (" << interfaces.size() << "):" << std::endl;
    for (const auto& iface : interfaces) {
        std::cout << "  " << iface.name << " " << iface.address
                  << (iface.is_up ? " up" : " down")
                  << (iface.is_wireless ? " wireless" : "")
                  << (iface.is_cellular ? " cellular" : "") << std::endl;
    }
    std::cout << "Classified as "
              << to_string(interface_reachability_monitor::classify(interfaces))
              << std::endl;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Auto Reconnect Example - Blob Transfer" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --work-dir <dir>       Scratch directory (default: ./reconnect_demo)" << std::endl;
    std::cout << "  --outage <ms>          Simulated outage duration (default: 2000)" << std::endl;
    std::cout << "  --interfaces           Only list host interfaces and exit" << std::endl;
    std::cout << "  --help                 Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::filesystem::path work_dir = "reconnect_demo";
    std::chrono::milliseconds outage{2000};

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--interfaces") {
            print_interfaces();
            return 0;
        } else if (arg == "--work-dir" && i + 1 < argc) {
            work_dir = argv[++i];
        } else if (arg == "--outage" && i + 1 < argc) {
            outage = std::chrono::milliseconds{std::stoi(argv[++i])};
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);

    std::vector<upload_request> requests;
    blob_transfer_options options;
    options.block_size = min_block_size;
    options.overwrite = true;
    for (int i = 0; i < 4; ++i) {
        auto name = "file_" + std::to_string(i) + ".bin";
        auto path = work_dir / "source" / name;
        if (!create_test_file(path, 8 * 1024 * 1024)) {
            std::cerr << "Failed to create " << path << std::endl;
            return 1;
        }
        requests.push_back({"reconnect-demo", path.string(), "batch/" + name, options, nullptr});
    }

    auto client = local_storage_client::create("reconnect-demo", work_dir / "container");
    if (!client) {
        std::cerr << "Failed to open container: " << client.error().message << std::endl;
        return 1;
    }

    auto network = std::make_shared<manual_reachability_monitor>();
    transfer_manager_config config;
    config.max_concurrency = 2;
    config.pause_on_unreachable = true;
    config.resume_on_reachable = true;

    auto manager_result = transfer_manager::builder()
                              .with_config(config)
                              .with_reachability_monitor(network)
                              .with_observer(std::make_shared<state_printer>())
                              .build();
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

    auto batch = manager.upload_multiple(requests);
    if (!batch) {
        std::cerr << "Batch upload failed: " << batch.error().message << std::endl;
        return 1;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    std::cout << "--- network lost ---" << std::endl;
    network->set_status(reachability_status::unreachable);

    std::this_thread::sleep_for(outage);
    std::cout << "--- network back ---" << std::endl;
    network->set_status(reachability_status::reachable_lan);

    while (running && !manager.wait_until_idle(std::chrono::milliseconds(200))) {
    }

    auto snapshot = manager.find(batch.value());
    std::cout << "Batch finished in state "
              << (snapshot ? to_string(snapshot->state) : "unknown") << std::endl;

    if (auto stopped = manager.stop_managing(); !stopped) {
        std::cerr << stopped.error().message << std::endl;
        return 1;
    }
    return snapshot && snapshot->state == transfer_state::completed ? 0 : 1;
}
