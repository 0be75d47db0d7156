/**
 * @file transfer_operations.h
 * @brief Queue operations performing the network work of blob transfers
 *
 * Operation types:
 * - block_upload_operation: Uploads one block of a blob
 * - block_download_operation: Downloads one block of a blob
 * - download_probe_operation: Initial download call discovering the size
 * - upload_commit_operation: Commits the block list once all blocks landed
 * - download_finalize_operation: Finalizes and verifies the local file
 *
 * Operations capture the helper and byte range at queue time and report back
 * to an operation_host, which owns the entities. They never touch entity
 * state directly.
 */

#ifndef KCENON_BLOB_TRANSFER_MANAGER_TRANSFER_OPERATIONS_H
#define KCENON_BLOB_TRANSFER_MANAGER_TRANSFER_OPERATIONS_H

#include "kcenon/blob_transfer/client/storage_client.h"
#include "kcenon/blob_transfer/core/operation_queue.h"
#include "kcenon/blob_transfer/core/types.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Stage names used for pool task tracking
 */
struct operation_stage {
    static constexpr const char* block_upload = "block_upload";
    static constexpr const char* block_download = "block_download";
    static constexpr const char* download_probe = "download_probe";
    static constexpr const char* upload_commit = "upload_commit";
    static constexpr const char* download_finalize = "download_finalize";
};

/**
 * @brief Receiver of operation reports
 *
 * Every callback identifies the reporting operation so the host can ignore
 * reports of operations it has already replaced or cancelled.
 */
class operation_host {
public:
    virtual ~operation_host() = default;

    /**
     * @brief An operation of the entity started executing
     */
    virtual void on_operation_started(const transfer_operation& op,
                                      const transfer_id& entity) = 0;

    /**
     * @brief A block operation finished
     * @param bytes Bytes moved by the block (0 unless succeeded)
     */
    virtual void on_block_finished(const transfer_operation& op,
                                   const transfer_id& block,
                                   const operation_outcome& outcome,
                                   uint64_t bytes) = 0;

    /**
     * @brief The initial download call finished
     * @param probe Set when the outcome succeeded
     */
    virtual void on_probe_finished(const transfer_operation& op,
                                   const transfer_id& block,
                                   const operation_outcome& outcome,
                                   const std::optional<download_probe>& probe) = 0;

    /**
     * @brief A commit or finalize operation finished
     */
    virtual void on_blob_finished(const transfer_operation& op,
                                  const transfer_id& blob,
                                  const operation_outcome& outcome) = 0;
};

/**
 * @brief Base class for operations bound to one transfer entity
 */
class entity_operation : public transfer_operation {
public:
    entity_operation(std::string stage, transfer_id entity,
                     std::weak_ptr<operation_host> host,
                     operation_priority priority = operation_priority::normal);

    [[nodiscard]] auto entity() const -> const transfer_id& { return entity_; }

protected:
    void on_started() override;

    /**
     * @brief Host if it is still alive
     */
    [[nodiscard]] auto host() const -> std::shared_ptr<operation_host> {
        return host_.lock();
    }

private:
    transfer_id entity_;
    std::weak_ptr<operation_host> host_;
};

/**
 * @brief Uploads one block of a blob
 */
class block_upload_operation : public entity_operation {
public:
    block_upload_operation(transfer_id block, block_range range,
                           std::shared_ptr<blob_uploader> uploader,
                           std::weak_ptr<operation_host> host);

protected:
    auto execute() -> result<void> override;
    void on_finished(const operation_outcome& outcome) override;

private:
    block_range range_;
    std::shared_ptr<blob_uploader> uploader_;
    uint64_t bytes_ = 0;
};

/**
 * @brief Downloads one block of a blob
 */
class block_download_operation : public entity_operation {
public:
    block_download_operation(transfer_id block, block_range range,
                             std::shared_ptr<blob_downloader> downloader,
                             std::weak_ptr<operation_host> host);

protected:
    auto execute() -> result<void> override;
    void on_finished(const operation_outcome& outcome) override;

private:
    block_range range_;
    std::shared_ptr<blob_downloader> downloader_;
    uint64_t bytes_ = 0;
};

/**
 * @brief Initial download call, run on the placeholder block
 *
 * Runs at high priority so a new download learns its size before the
 * blocks of other blobs are dispatched.
 */
class download_probe_operation : public entity_operation {
public:
    download_probe_operation(transfer_id block,
                             std::shared_ptr<blob_downloader> downloader,
                             std::weak_ptr<operation_host> host);

protected:
    auto execute() -> result<void> override;
    void on_finished(const operation_outcome& outcome) override;

private:
    std::shared_ptr<blob_downloader> downloader_;
    std::optional<download_probe> probe_;
};

/**
 * @brief Commits the ordered block list of an upload
 */
class upload_commit_operation : public entity_operation {
public:
    upload_commit_operation(transfer_id blob, std::vector<std::string> block_ids,
                            std::shared_ptr<blob_uploader> uploader,
                            std::weak_ptr<operation_host> host);

protected:
    auto execute() -> result<void> override;
    void on_finished(const operation_outcome& outcome) override;

private:
    std::vector<std::string> block_ids_;
    std::shared_ptr<blob_uploader> uploader_;
};

/**
 * @brief Finalizes a download and verifies its checksum
 */
class download_finalize_operation : public entity_operation {
public:
    /**
     * @param checksum Expected SHA-256 (hex); empty skips verification
     */
    download_finalize_operation(transfer_id blob, std::string destination,
                                std::string checksum,
                                std::shared_ptr<blob_downloader> downloader,
                                std::weak_ptr<operation_host> host);

protected:
    auto execute() -> result<void> override;
    void on_finished(const operation_outcome& outcome) override;

private:
    std::string destination_;
    std::string checksum_;
    std::shared_ptr<blob_downloader> downloader_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_MANAGER_TRANSFER_OPERATIONS_H
