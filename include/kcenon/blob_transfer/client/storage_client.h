/**
 * @file storage_client.h
 * @brief Storage client and per-blob transfer helper interfaces
 *
 * A storage_client is owned by the application and identified by a
 * restoration id. The transfer manager asks it for one helper per blob
 * (blob_uploader or blob_downloader); helpers perform the blocking network
 * calls issued by queued operations.
 */

#ifndef KCENON_BLOB_TRANSFER_CLIENT_STORAGE_CLIENT_H
#define KCENON_BLOB_TRANSFER_CLIENT_STORAGE_CLIENT_H

#include <kcenon/blob_transfer/core/transfer_types.h>
#include <kcenon/blob_transfer/core/types.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Result of the initial download call
 */
struct download_probe {
    uint64_t object_size = 0;          ///< Total object size in bytes
    block_range first_chunk;           ///< Range already fetched by the probe
    std::vector<block_range> remaining_blocks;  ///< Plan for the rest
    std::string checksum;              ///< Expected SHA-256 (hex), may be empty
};

/**
 * @brief Uploads one local file as one remote object
 */
class blob_uploader {
public:
    virtual ~blob_uploader() = default;

    /**
     * @brief Block plan for the source, known up front
     */
    [[nodiscard]] virtual auto block_list() const -> std::vector<block_range> = 0;

    /**
     * @brief Upload one block
     * @return Bytes uploaded
     */
    [[nodiscard]] virtual auto upload_block(const block_range& block,
                                            const std::atomic<bool>& cancelled)
        -> result<uint64_t> = 0;

    /**
     * @brief Commit the ordered block list, creating the remote object
     */
    [[nodiscard]] virtual auto commit(const std::vector<std::string>& block_ids,
                                      const std::atomic<bool>& cancelled)
        -> result<void> = 0;

    /**
     * @brief Seed with progress restored from the durable store
     */
    virtual void set_progress(uint64_t bytes_transferred) = 0;
};

/**
 * @brief Downloads one remote object into one local file
 */
class blob_downloader {
public:
    virtual ~blob_downloader() = default;

    /**
     * @brief Fetch the first chunk and discover the object size
     */
    [[nodiscard]] virtual auto initial_download(const std::atomic<bool>& cancelled)
        -> result<download_probe> = 0;

    /**
     * @brief Download one block into the destination
     * @return Bytes downloaded
     */
    [[nodiscard]] virtual auto download_block(const block_range& block,
                                              const std::atomic<bool>& cancelled)
        -> result<uint64_t> = 0;

    /**
     * @brief Finalize the destination once every block has landed
     */
    [[nodiscard]] virtual auto complete(const std::atomic<bool>& cancelled)
        -> result<void> = 0;

    virtual void set_progress(uint64_t bytes_transferred) = 0;
    virtual void set_total_size(uint64_t total_bytes) = 0;
};

/**
 * @brief Application-owned client bound to one restoration id
 */
class storage_client {
public:
    virtual ~storage_client() = default;

    /**
     * @brief Stable id binding persisted transfers to this client
     */
    [[nodiscard]] virtual auto restoration_id() const -> const std::string& = 0;

    /**
     * @brief Human-readable endpoint (masked in logs when configured)
     */
    [[nodiscard]] virtual auto endpoint() const -> std::string = 0;

    [[nodiscard]] virtual auto create_uploader(const std::string& source,
                                               const std::string& destination,
                                               const blob_transfer_options& options)
        -> result<std::shared_ptr<blob_uploader>> = 0;

    [[nodiscard]] virtual auto create_downloader(const std::string& source,
                                                 const std::string& destination,
                                                 const blob_transfer_options& options)
        -> result<std::shared_ptr<blob_downloader>> = 0;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CLIENT_STORAGE_CLIENT_H
