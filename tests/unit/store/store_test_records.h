/**
 * @file store_test_records.h
 * @brief Record builders shared by the store tests
 */

#ifndef KCENON_BLOB_TRANSFER_TEST_STORE_TEST_RECORDS_H
#define KCENON_BLOB_TRANSFER_TEST_STORE_TEST_RECORDS_H

#include <kcenon/blob_transfer/core/transfer_entities.h>

#include <string>

namespace kcenon::blob_transfer::test {

inline auto make_multi(const std::string& restoration_id) -> multi_blob_transfer {
    multi_blob_transfer multi;
    multi.id = transfer_id::generate();
    multi.restoration_id = restoration_id;
    multi.type = transfer_type::download;
    multi.source = "photos/";
    multi.destination = "/tmp/photos/";
    return multi;
}

inline auto make_blob(const std::string& restoration_id,
                      const std::optional<transfer_id>& parent = std::nullopt)
    -> blob_transfer {
    blob_transfer blob;
    blob.id = transfer_id::generate();
    blob.restoration_id = restoration_id;
    blob.parent = parent;
    blob.type = transfer_type::upload;
    blob.source = "/home/user/report \"final\".pdf";
    blob.destination = "reports/report.pdf";
    blob.total_bytes_to_transfer = 300000;
    blob.bytes_transferred = 65536;
    blob.total_blocks = 5;
    blob.initial_call_complete = true;
    blob.options.block_size = 65536;
    blob.options.content_type = "application/pdf";
    blob.checksum = "abc123";
    return blob;
}

inline auto make_block(const blob_transfer& blob, uint32_t index) -> block_transfer {
    block_transfer block;
    block.id = transfer_id::generate();
    block.restoration_id = blob.restoration_id;
    block.parent = blob.id;
    block.index = index;
    block.block_id = make_block_id(index);
    block.start_range = uint64_t{index} * 65536;
    block.end_range = block.start_range + 65536;
    return block;
}

}  // namespace kcenon::blob_transfer::test

#endif  // KCENON_BLOB_TRANSFER_TEST_STORE_TEST_RECORDS_H
