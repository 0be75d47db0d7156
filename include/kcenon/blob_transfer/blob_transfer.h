/**
 * @file blob_transfer.h
 * @brief Main header for the blob_transfer library
 * @version 0.1.0
 *
 * This is the primary include file for the blob_transfer library.
 * Include this header to access all transfer manager functionality.
 *
 * @code
 * #include <kcenon/blob_transfer/blob_transfer.h>
 *
 * using namespace kcenon::blob_transfer;
 *
 * auto client = local_storage_client::create("backup", "/srv/container");
 *
 * auto manager = transfer_manager::builder()
 *     .with_store(std::make_shared<json_transfer_store>())
 *     .build();
 *
 * manager.value().register_client(client.value());
 * manager.value().start_managing();
 * @endcode
 */

#ifndef KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H
#define KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/blob_transfer/core/types.h"
#include "kcenon/blob_transfer/core/transfer_types.h"
#include "kcenon/blob_transfer/core/transfer_entities.h"
#include "kcenon/blob_transfer/core/checksum.h"
#include "kcenon/blob_transfer/core/logging.h"
#include "kcenon/blob_transfer/core/operation_queue.h"

// Clients
#include "kcenon/blob_transfer/client/storage_client.h"
#include "kcenon/blob_transfer/client/client_registry.h"
#include "kcenon/blob_transfer/client/local_storage_client.h"

// Durable store
#include "kcenon/blob_transfer/store/transfer_store.h"
#include "kcenon/blob_transfer/store/json_transfer_store.h"
#include "kcenon/blob_transfer/store/store_writer.h"

// Reachability
#include "kcenon/blob_transfer/reachability/reachability_monitor.h"

// Manager
#include "kcenon/blob_transfer/manager/manager_types.h"
#include "kcenon/blob_transfer/manager/transfer_observer.h"
#include "kcenon/blob_transfer/manager/transfer_manager.h"

// Adapters
#include "kcenon/blob_transfer/adapters/thread_pool_adapter.h"

namespace kcenon::blob_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H
