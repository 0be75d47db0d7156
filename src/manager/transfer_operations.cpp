/**
 * @file transfer_operations.cpp
 * @brief Implementation of blob transfer queue operations
 */

#include "kcenon/blob_transfer/manager/transfer_operations.h"

#include "kcenon/blob_transfer/core/checksum.h"
#include "kcenon/blob_transfer/core/logging.h"

namespace kcenon::blob_transfer {

// ============================================================================
// entity_operation
// ============================================================================

entity_operation::entity_operation(std::string stage, transfer_id entity,
                                   std::weak_ptr<operation_host> host,
                                   operation_priority priority)
    : transfer_operation(stage, stage + ":" + entity.to_string(), priority),
      entity_(entity),
      host_(std::move(host)) {}

void entity_operation::on_started() {
    if (auto h = host()) {
        h->on_operation_started(*this, entity_);
    }
}

// ============================================================================
// block_upload_operation
// ============================================================================

block_upload_operation::block_upload_operation(transfer_id block, block_range range,
                                               std::shared_ptr<blob_uploader> uploader,
                                               std::weak_ptr<operation_host> host)
    : entity_operation(operation_stage::block_upload, block, std::move(host)),
      range_(std::move(range)),
      uploader_(std::move(uploader)) {}

auto block_upload_operation::execute() -> result<void> {
    auto uploaded = uploader_->upload_block(range_, cancel_flag());
    if (!uploaded) {
        return unexpected(uploaded.error());
    }
    bytes_ = uploaded.value();
    return {};
}

void block_upload_operation::on_finished(const operation_outcome& outcome) {
    if (auto h = host()) {
        h->on_block_finished(*this, entity(), outcome, outcome.succeeded() ? bytes_ : 0);
    }
}

// ============================================================================
// block_download_operation
// ============================================================================

block_download_operation::block_download_operation(
    transfer_id block, block_range range,
    std::shared_ptr<blob_downloader> downloader,
    std::weak_ptr<operation_host> host)
    : entity_operation(operation_stage::block_download, block, std::move(host)),
      range_(std::move(range)),
      downloader_(std::move(downloader)) {}

auto block_download_operation::execute() -> result<void> {
    auto downloaded = downloader_->download_block(range_, cancel_flag());
    if (!downloaded) {
        return unexpected(downloaded.error());
    }
    bytes_ = downloaded.value();
    return {};
}

void block_download_operation::on_finished(const operation_outcome& outcome) {
    if (auto h = host()) {
        h->on_block_finished(*this, entity(), outcome, outcome.succeeded() ? bytes_ : 0);
    }
}

// ============================================================================
// download_probe_operation
// ============================================================================

download_probe_operation::download_probe_operation(
    transfer_id block, std::shared_ptr<blob_downloader> downloader,
    std::weak_ptr<operation_host> host)
    : entity_operation(operation_stage::download_probe, block, std::move(host),
                       operation_priority::high),
      downloader_(std::move(downloader)) {}

auto download_probe_operation::execute() -> result<void> {
    auto probed = downloader_->initial_download(cancel_flag());
    if (!probed) {
        return unexpected(probed.error());
    }
    probe_ = std::move(probed.value());
    return {};
}

void download_probe_operation::on_finished(const operation_outcome& outcome) {
    if (auto h = host()) {
        h->on_probe_finished(*this, entity(), outcome,
                             outcome.succeeded() ? probe_ : std::nullopt);
    }
}

// ============================================================================
// upload_commit_operation
// ============================================================================

upload_commit_operation::upload_commit_operation(transfer_id blob,
                                                 std::vector<std::string> block_ids,
                                                 std::shared_ptr<blob_uploader> uploader,
                                                 std::weak_ptr<operation_host> host)
    : entity_operation(operation_stage::upload_commit, blob, std::move(host)),
      block_ids_(std::move(block_ids)),
      uploader_(std::move(uploader)) {}

auto upload_commit_operation::execute() -> result<void> {
    BT_LOG_DEBUG(log_category::queue,
                 "Committing " + std::to_string(block_ids_.size()) + " blocks for " +
                     entity().to_string());
    return uploader_->commit(block_ids_, cancel_flag());
}

void upload_commit_operation::on_finished(const operation_outcome& outcome) {
    if (auto h = host()) {
        h->on_blob_finished(*this, entity(), outcome);
    }
}

// ============================================================================
// download_finalize_operation
// ============================================================================

download_finalize_operation::download_finalize_operation(
    transfer_id blob, std::string destination, std::string checksum,
    std::shared_ptr<blob_downloader> downloader, std::weak_ptr<operation_host> host)
    : entity_operation(operation_stage::download_finalize, blob, std::move(host)),
      destination_(std::move(destination)),
      checksum_(std::move(checksum)),
      downloader_(std::move(downloader)) {}

auto download_finalize_operation::execute() -> result<void> {
    auto completed = downloader_->complete(cancel_flag());
    if (!completed) {
        return completed;
    }

    if (checksum_.empty()) {
        return {};
    }

    auto verified = checksum::verify_sha256(destination_, checksum_);
    if (!verified) {
        BT_LOG_ERROR(log_category::queue,
                     "Checksum verification failed for " + destination_ + ": " +
                         verified.error().message);
    }
    return verified;
}

void download_finalize_operation::on_finished(const operation_outcome& outcome) {
    if (auto h = host()) {
        h->on_blob_finished(*this, entity(), outcome);
    }
}

}  // namespace kcenon::blob_transfer
