/**
 * @file local_storage_client.cpp
 * @brief Filesystem-backed storage client implementation
 */

#include "kcenon/blob_transfer/client/local_storage_client.h"

#include "kcenon/blob_transfer/core/checksum.h"
#include "kcenon/blob_transfer/core/logging.h"
#include "kcenon/blob_transfer/core/transfer_entities.h"

#include <algorithm>
#include <array>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace kcenon::blob_transfer {

namespace {

constexpr std::size_t io_buffer_size = 64 * 1024;
const std::filesystem::path staging_dir = ".staging";
const std::filesystem::path meta_dir = ".meta";

auto format_crc(uint32_t crc) -> std::string {
    std::array<char, 9> buf{};
    std::snprintf(buf.data(), buf.size(), "%08x", crc);
    return std::string(buf.data(), 8);
}

auto read_text_file(const std::filesystem::path& path) -> std::optional<std::string> {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::string content;
    std::getline(file, content);
    return content;
}

auto write_text_file(const std::filesystem::path& path, const std::string& content)
    -> result<void> {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return unexpected(error{error_code::file_write_error,
                                "cannot write " + path.string()});
    }
    file << content << '\n';
    if (!file.good()) {
        return unexpected(error{error_code::file_write_error,
                                "cannot write " + path.string()});
    }
    return {};
}

/**
 * @brief Copy length bytes from in at in_offset to out at out_offset
 * @return Bytes copied, operation_cancelled when the flag is raised
 */
auto copy_range(std::istream& in, uint64_t in_offset,
                std::ostream& out, uint64_t out_offset,
                uint64_t length, const std::atomic<bool>& cancelled,
                uint32_t* crc = nullptr) -> result<uint64_t> {
    in.seekg(static_cast<std::streamoff>(in_offset));
    out.seekp(static_cast<std::streamoff>(out_offset));
    if (!in.good() || !out.good()) {
        return unexpected(error{error_code::file_read_error, "seek failed"});
    }

    std::vector<char> buffer(io_buffer_size);
    uint64_t copied = 0;
    while (copied < length) {
        if (cancelled.load(std::memory_order_acquire)) {
            return unexpected(error{error_code::operation_cancelled});
        }
        auto chunk = static_cast<std::size_t>(
            std::min<uint64_t>(buffer.size(), length - copied));
        in.read(buffer.data(), static_cast<std::streamsize>(chunk));
        if (static_cast<std::size_t>(in.gcount()) != chunk) {
            return unexpected(error{error_code::file_read_error, "short read"});
        }
        out.write(buffer.data(), static_cast<std::streamsize>(chunk));
        if (!out.good()) {
            return unexpected(error{error_code::file_write_error, "write failed"});
        }
        if (crc) {
            *crc = checksum::crc32_update(
                *crc, std::as_bytes(std::span<const char>(buffer.data(), chunk)));
        }
        copied += chunk;
    }
    out.flush();
    return copied;
}

auto validate_options(const blob_transfer_options& options) -> result<void> {
    if (options.block_size < min_block_size || options.block_size > max_block_size) {
        return unexpected(error{error_code::config_invalid_block_size,
                                "block size " + std::to_string(options.block_size) +
                                    " out of range"});
    }
    return {};
}

auto plan_blocks(uint64_t begin, uint64_t end, uint64_t block_size, uint32_t first_index)
    -> std::vector<block_range> {
    std::vector<block_range> blocks;
    uint32_t index = first_index;
    for (uint64_t offset = begin; offset < end; offset += block_size) {
        auto block_end = std::min(end, offset + block_size);
        blocks.push_back(block_range{offset, block_end, make_block_id(index++)});
    }
    return blocks;
}

// ============================================================================
// local_blob_uploader
// ============================================================================

class local_blob_uploader : public blob_uploader {
public:
    local_blob_uploader(std::filesystem::path source,
                        std::filesystem::path root,
                        std::string destination,
                        blob_transfer_options options,
                        uint64_t source_size)
        : source_(std::move(source)),
          root_(std::move(root)),
          destination_(std::move(destination)),
          options_(std::move(options)),
          source_size_(source_size) {}

    [[nodiscard]] auto block_list() const -> std::vector<block_range> override {
        return plan_blocks(0, source_size_, options_.block_size, 0);
    }

    [[nodiscard]] auto upload_block(const block_range& block,
                                    const std::atomic<bool>& cancelled)
        -> result<uint64_t> override {
        std::ifstream in(source_, std::ios::binary);
        if (!in) {
            return unexpected(error{error_code::file_not_found,
                                    "cannot open " + source_.string()});
        }

        auto staged = staging_path() / block.block_id;
        std::error_code ec;
        std::filesystem::create_directories(staged.parent_path(), ec);
        if (ec) {
            return unexpected(error{error_code::file_write_error, ec.message()});
        }

        std::ofstream out(staged, std::ios::binary | std::ios::trunc);
        if (!out) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot stage " + block.block_id});
        }

        uint32_t crc = 0;
        auto copied = copy_range(in, block.start, out, 0, block.length(), cancelled, &crc);
        if (!copied) {
            return copied;
        }
        out.close();

        auto crc_written = write_text_file(crc_path(block.block_id), format_crc(crc));
        if (!crc_written) {
            return unexpected(crc_written.error());
        }
        return copied.value();
    }

    [[nodiscard]] auto commit(const std::vector<std::string>& block_ids,
                              const std::atomic<bool>& cancelled)
        -> result<void> override {
        auto target = root_ / destination_;
        std::error_code ec;
        if (std::filesystem::exists(target, ec) && !options_.overwrite) {
            return unexpected(error{error_code::file_already_exists,
                                    "blob already exists: " + destination_});
        }
        std::filesystem::create_directories(target.parent_path(), ec);

        auto temp = target;
        temp += ".commit";
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out) {
                return unexpected(error{error_code::commit_failed,
                                        "cannot create " + temp.string()});
            }

            uint64_t offset = 0;
            for (const auto& id : block_ids) {
                auto staged = staging_path() / id;
                std::ifstream in(staged, std::ios::binary);
                if (!in) {
                    std::filesystem::remove(temp, ec);
                    return unexpected(error{error_code::block_not_found,
                                            "staged block missing: " + id});
                }
                auto size = std::filesystem::file_size(staged, ec);
                if (ec) {
                    std::filesystem::remove(temp, ec);
                    return unexpected(error{error_code::file_read_error,
                                            "cannot stat staged block " + id});
                }
                uint32_t crc = 0;
                auto copied = copy_range(in, 0, out, offset, size, cancelled, &crc);
                if (!copied) {
                    std::filesystem::remove(temp, ec);
                    return unexpected(copied.error());
                }
                auto expected = read_text_file(crc_path(id));
                if (!expected || *expected != format_crc(crc)) {
                    std::filesystem::remove(temp, ec);
                    return unexpected(error{error_code::checksum_mismatch,
                                            "staged block corrupted: " + id});
                }
                offset += size;
            }
        }

        std::filesystem::rename(temp, target, ec);
        if (ec) {
            return unexpected(error{error_code::commit_failed, ec.message()});
        }

        auto digest = checksum::sha256_file(target);
        if (!digest) {
            return unexpected(digest.error());
        }
        auto meta = root_ / meta_dir / destination_;
        meta += ".sha256";
        auto saved = write_text_file(meta, digest.value());
        if (!saved) {
            return saved;
        }

        std::filesystem::remove_all(staging_path(), ec);
        BT_LOG_DEBUG(log_category::client,
                     "Committed " + std::to_string(block_ids.size()) +
                         " block(s) to " + destination_);
        return {};
    }

    void set_progress(uint64_t bytes_transferred) override {
        progress_.store(bytes_transferred);
    }

private:
    [[nodiscard]] auto staging_path() const -> std::filesystem::path {
        return root_ / staging_dir / destination_;
    }

    [[nodiscard]] auto crc_path(const std::string& block_id) const
        -> std::filesystem::path {
        return staging_path() / (block_id + ".crc");
    }

    std::filesystem::path source_;
    std::filesystem::path root_;
    std::string destination_;
    blob_transfer_options options_;
    uint64_t source_size_;
    std::atomic<uint64_t> progress_{0};
};

// ============================================================================
// local_blob_downloader
// ============================================================================

class local_blob_downloader : public blob_downloader {
public:
    local_blob_downloader(std::filesystem::path blob,
                          std::filesystem::path checksum_file,
                          std::filesystem::path destination,
                          blob_transfer_options options)
        : blob_(std::move(blob)),
          checksum_file_(std::move(checksum_file)),
          destination_(std::move(destination)),
          options_(std::move(options)) {
        part_ = destination_;
        part_ += ".part";
    }

    [[nodiscard]] auto initial_download(const std::atomic<bool>& cancelled)
        -> result<download_probe> override {
        std::error_code ec;
        if (!std::filesystem::exists(blob_, ec)) {
            return unexpected(error{error_code::remote_not_found,
                                    "blob not found: " + blob_.filename().string()});
        }
        if (std::filesystem::exists(destination_, ec) && !options_.overwrite) {
            return unexpected(error{error_code::file_already_exists,
                                    "destination exists: " + destination_.string()});
        }

        auto size = std::filesystem::file_size(blob_, ec);
        if (ec) {
            return unexpected(error{error_code::request_failed, ec.message()});
        }
        set_total_size(size);

        download_probe probe;
        probe.object_size = size;
        probe.first_chunk = block_range{0, std::min<uint64_t>(size, options_.block_size),
                                        make_block_id(0)};
        probe.remaining_blocks =
            plan_blocks(probe.first_chunk.end, size, options_.block_size, 1);
        if (auto digest = read_text_file(checksum_file_)) {
            probe.checksum = *digest;
        }

        if (probe.first_chunk.length() > 0) {
            auto fetched = download_block(probe.first_chunk, cancelled);
            if (!fetched) {
                return unexpected(fetched.error());
            }
        } else {
            auto prepared = prepare_part_file();
            if (!prepared) {
                return unexpected(prepared.error());
            }
        }
        return probe;
    }

    [[nodiscard]] auto download_block(const block_range& block,
                                      const std::atomic<bool>& cancelled)
        -> result<uint64_t> override {
        auto prepared = prepare_part_file();
        if (!prepared) {
            return unexpected(prepared.error());
        }

        std::ifstream in(blob_, std::ios::binary);
        if (!in) {
            return unexpected(error{error_code::remote_not_found,
                                    "blob not found: " + blob_.filename().string()});
        }
        std::fstream out(part_, std::ios::binary | std::ios::in | std::ios::out);
        if (!out) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot open " + part_.string()});
        }
        return copy_range(in, block.start, out, block.start, block.length(), cancelled);
    }

    [[nodiscard]] auto complete(const std::atomic<bool>& cancelled)
        -> result<void> override {
        if (cancelled.load()) {
            return unexpected(error{error_code::operation_cancelled});
        }
        std::error_code ec;
        if (!std::filesystem::exists(part_, ec)) {
            return unexpected(error{error_code::file_not_found,
                                    "partial download missing: " + part_.string()});
        }
        if (std::filesystem::exists(destination_, ec)) {
            if (!options_.overwrite) {
                return unexpected(error{error_code::file_already_exists,
                                        "destination exists: " + destination_.string()});
            }
            std::filesystem::remove(destination_, ec);
        }
        std::filesystem::rename(part_, destination_, ec);
        if (ec) {
            return unexpected(error{error_code::file_write_error, ec.message()});
        }
        return {};
    }

    void set_progress(uint64_t bytes_transferred) override {
        progress_.store(bytes_transferred);
    }

    void set_total_size(uint64_t total_bytes) override {
        std::lock_guard lock(mutex_);
        total_size_ = total_bytes;
    }

private:
    auto prepare_part_file() -> result<void> {
        std::lock_guard lock(mutex_);
        std::error_code ec;
        if (!destination_.parent_path().empty()) {
            std::filesystem::create_directories(destination_.parent_path(), ec);
        }
        if (!std::filesystem::exists(part_, ec)) {
            std::ofstream create(part_, std::ios::binary);
            if (!create) {
                return unexpected(error{error_code::file_write_error,
                                        "cannot create " + part_.string()});
            }
        }
        if (std::filesystem::file_size(part_, ec) != total_size_) {
            std::filesystem::resize_file(part_, total_size_, ec);
            if (ec) {
                return unexpected(error{error_code::file_write_error, ec.message()});
            }
        }
        return {};
    }

    std::filesystem::path blob_;
    std::filesystem::path checksum_file_;
    std::filesystem::path destination_;
    std::filesystem::path part_;
    blob_transfer_options options_;
    std::mutex mutex_;
    uint64_t total_size_ = 0;
    std::atomic<uint64_t> progress_{0};
};

}  // namespace

// ============================================================================
// local_storage_client
// ============================================================================

auto local_storage_client::create(std::string restoration_id,
                                  const std::filesystem::path& container_root)
    -> result<std::shared_ptr<local_storage_client>> {
    if (restoration_id.empty()) {
        return unexpected(error{error_code::invalid_restoration_id});
    }
    std::error_code ec;
    std::filesystem::create_directories(container_root, ec);
    if (ec) {
        return unexpected(error{error_code::file_write_error,
                                "cannot create container " + container_root.string() +
                                    ": " + ec.message()});
    }
    return std::make_shared<local_storage_client>(std::move(restoration_id),
                                                  container_root);
}

local_storage_client::local_storage_client(std::string restoration_id,
                                           std::filesystem::path container_root)
    : restoration_id_(std::move(restoration_id)), root_(std::move(container_root)) {}

auto local_storage_client::endpoint() const -> std::string {
    return "file://" + root_.string();
}

auto local_storage_client::create_uploader(const std::string& source,
                                           const std::string& destination,
                                           const blob_transfer_options& options)
    -> result<std::shared_ptr<blob_uploader>> {
    auto valid = validate_options(options);
    if (!valid) {
        return unexpected(valid.error());
    }
    if (destination.empty()) {
        return unexpected(error{error_code::invalid_request, "empty blob name"});
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return unexpected(error{error_code::file_not_found, "source not found: " + source});
    }
    auto size = std::filesystem::file_size(source, ec);
    if (ec) {
        return unexpected(error{error_code::file_read_error, ec.message()});
    }

    return std::shared_ptr<blob_uploader>{
        std::make_shared<local_blob_uploader>(source, root_, destination, options, size)};
}

auto local_storage_client::create_downloader(const std::string& source,
                                             const std::string& destination,
                                             const blob_transfer_options& options)
    -> result<std::shared_ptr<blob_downloader>> {
    auto valid = validate_options(options);
    if (!valid) {
        return unexpected(valid.error());
    }
    if (source.empty() || destination.empty()) {
        return unexpected(error{error_code::invalid_request,
                                "download needs a blob name and a destination"});
    }

    auto checksum_file = root_ / meta_dir / source;
    checksum_file += ".sha256";
    return std::shared_ptr<blob_downloader>{std::make_shared<local_blob_downloader>(
        blob_path(source), checksum_file, destination, options)};
}

auto local_storage_client::blob_path(const std::string& name) const
    -> std::filesystem::path {
    return root_ / name;
}

auto local_storage_client::blob_exists(const std::string& name) const -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(blob_path(name), ec);
}

}  // namespace kcenon::blob_transfer
