/**
 * @file upload_example.cpp
 * @brief Upload a file into a local container and download it back
 *
 * This example demonstrates:
 * - Registering a storage client under a restoration id
 * - Uploading a file as blocks with a progress handler
 * - Downloading the committed blob and verifying its checksum
 * - Observing state changes of every transfer entity
 */

#include <kcenon/blob_transfer/blob_transfer.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::blob_transfer;

namespace {

/**
 * @brief Format bytes into human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

/**
 * @brief Create a test file with pattern content
 * @param path File path to create
 * @param size File size in bytes
 */
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
        buffer[i] = static_cast<char>('A' + (i % 26));
    }

    size_t remaining = size;
    while (remaining > 0) {
        size_t to_write = std::min(remaining, buffer.size());
        file.write(buffer.data(), static_cast<std::streamsize>(to_write));
        remaining -= to_write;
    }

    std::cout << "Created test file: " << path << " (" << format_bytes(size) << ")" << std::endl;
    return true;
}

auto parse_size(const std::string& size_str) -> size_t {
    size_t pos = 0;
    double value = std::stod(size_str, &pos);

    if (pos < size_str.size()) {
        char suffix = static_cast<char>(std::toupper(size_str[pos]));
        switch (suffix) {
            case 'K': return static_cast<size_t>(value * 1024);
            case 'M': return static_cast<size_t>(value * 1024 * 1024);
            case 'G': return static_cast<size_t>(value * 1024 * 1024 * 1024);
            default: break;
        }
    }
    return static_cast<size_t>(value);
}

/**
 * @brief Prints blob state changes
 */
class console_observer : public transfer_observer {
public:
    void on_transfer_state_changed(const transfer_snapshot& snapshot,
                                   transfer_state state,
                                   const std::optional<transfer_progress>& progress) override {
        if (snapshot.kind == transfer_kind::block) {
            return;
        }
        std::cout << "[" << to_string(snapshot.type) << "] " << snapshot.destination
                  << " -> " << to_string(state);
        if (progress) {
            std::cout << " (" << progress->completed_blocks << "/" << progress->total_blocks
                      << " blocks)";
        }
        if (!snapshot.error_message.empty()) {
            std::cout << " error: " << snapshot.error_message;
        }
        std::cout << std::endl;
    }
};

void print_progress(const transfer_snapshot& snapshot, const transfer_progress& progress) {
    std::cout << "\r  " << snapshot.source << ": " << std::fixed << std::setprecision(1)
              << progress.completion_percentage() << "% ("
              << format_bytes(progress.bytes_transferred) << " / "
              << format_bytes(progress.total_bytes) << ")" << std::flush;
    if (progress.is_complete()) {
        std::cout << std::endl;
    }
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload Example - Blob Transfer" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file> <blob_name>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -r, --root <dir>        Container directory (default: ./container)" << std::endl;
    std::cout << "  -b, --block-size <size> Block size (default: 4M)" << std::endl;
    std::cout << "  -j, --concurrency <n>   Operations in flight (default: 4)" << std::endl;
    std::cout << "  -o, --overwrite         Overwrite an existing blob" << std::endl;
    std::cout << "  --create-test <size>    Create test file of specified size (e.g., 10M)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " myfile.bin backup.bin" << std::endl;
    std::cout << "  " << program << " --create-test 20M test.bin upload.bin" << std::endl;
}

int main(int argc, char* argv[]) {
    std::filesystem::path root = "container";
    std::string local_path;
    std::string blob_name;
    std::optional<size_t> create_test_size;
    blob_transfer_options options;
    std::size_t concurrency = 4;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-r" || arg == "--root") {
            if (++i >= argc) {
                std::cerr << "Error: --root requires an argument" << std::endl;
                return 1;
            }
            root = argv[i];
        } else if (arg == "-b" || arg == "--block-size") {
            if (++i >= argc) {
                std::cerr << "Error: --block-size requires an argument" << std::endl;
                return 1;
            }
            options.block_size = parse_size(argv[i]);
        } else if (arg == "-j" || arg == "--concurrency") {
            if (++i >= argc) {
                std::cerr << "Error: --concurrency requires an argument" << std::endl;
                return 1;
            }
            concurrency = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "-o" || arg == "--overwrite") {
            options.overwrite = true;
        } else if (arg == "--create-test") {
            if (++i >= argc) {
                std::cerr << "Error: --create-test requires a size argument" << std::endl;
                return 1;
            }
            create_test_size = parse_size(argv[i]);
        } else if (arg[0] != '-') {
            if (local_path.empty()) {
                local_path = arg;
            } else if (blob_name.empty()) {
                blob_name = arg;
            }
        }
    }

    if (local_path.empty() || blob_name.empty()) {
        std::cerr << "Error: Both local_file and blob_name are required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (create_test_size && !create_test_file(local_path, *create_test_size)) {
        return 1;
    }

    auto client = local_storage_client::create("example", root);
    if (!client) {
        std::cerr << "Failed to open container: " << client.error().message << std::endl;
        return 1;
    }

    auto manager_result = transfer_manager::builder()
                              .with_max_concurrency(concurrency)
                              .with_reachability_monitor(
                                  std::make_shared<manual_reachability_monitor>())
                              .with_observer(std::make_shared<console_observer>())
                              .build();
    if (!manager_result) {
        std::cerr << "Failed to create manager: " << manager_result.error().message
                  << std::endl;
        return 1;
    }
    auto& manager = manager_result.value();

    if (auto registered = manager.register_client(client.value()); !registered) {
        std::cerr << "Failed to register client: " << registered.error().message << std::endl;
        return 1;
    }
    if (auto started = manager.start_managing(); !started) {
        std::cerr << "Failed to start: " << started.error().message << std::endl;
        return 1;
    }

    auto start = std::chrono::steady_clock::now();

    std::cout << "Uploading " << local_path << " as " << blob_name << std::endl;
    upload_request upload{"example", local_path, blob_name, options, print_progress};
    auto upload_id = manager.upload(upload);
    if (!upload_id) {
        std::cerr << "Upload failed: " << upload_id.error().message << std::endl;
        return 1;
    }
    manager.wait_until_idle(std::chrono::minutes(10));

    auto uploaded = manager.find(upload_id.value());
    if (!uploaded || uploaded->state != transfer_state::completed) {
        std::cerr << "Upload did not complete" << std::endl;
        return 1;
    }

    auto download_path = local_path + ".downloaded";
    std::cout << "Downloading " << blob_name << " to " << download_path << std::endl;
    options.overwrite = true;
    download_request download{"example", blob_name, download_path, options, print_progress};
    auto download_id = manager.download(download);
    if (!download_id) {
        std::cerr << "Download failed: " << download_id.error().message << std::endl;
        return 1;
    }
    manager.wait_until_idle(std::chrono::minutes(10));

    auto downloaded = manager.find(download_id.value());
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!downloaded || downloaded->state != transfer_state::completed) {
        std::cerr << "Download did not complete";
        if (downloaded) {
            std::cerr << ": " << downloaded->error_message;
        }
        std::cerr << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << "Round trip of " << format_bytes(downloaded->total_bytes) << " in "
              << elapsed.count() << " ms, checksum verified" << std::endl;

    if (auto stopped = manager.stop_managing(); !stopped) {
        std::cerr << "Failed to flush store: " << stopped.error().message << std::endl;
        return 1;
    }
    return 0;
}
