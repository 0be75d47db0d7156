/**
 * @file manager_types.h
 * @brief Configuration and request types for transfer_manager
 */

#ifndef KCENON_BLOB_TRANSFER_MANAGER_MANAGER_TYPES_H
#define KCENON_BLOB_TRANSFER_MANAGER_MANAGER_TYPES_H

#include <kcenon/blob_transfer/core/transfer_types.h>
#include <kcenon/blob_transfer/core/types.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace kcenon::blob_transfer {

/**
 * @brief Transfer manager configuration
 */
struct transfer_manager_config {
    std::size_t max_concurrency = 4;            ///< Operations in flight at once
    std::size_t worker_count = 0;               ///< Pool threads (0 = hardware)
    std::string pool_name = "blob_transfer_pool";
    bool pause_on_unreachable = true;           ///< pause_all() when the network drops
    bool resume_on_reachable = true;            ///< resume_all() when it returns
    bool persist_on_progress = true;            ///< Save every block completion

    /**
     * @return config_invalid_concurrency when max_concurrency is 0
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (max_concurrency == 0) {
            return unexpected(error(error_code::config_invalid_concurrency));
        }
        return {};
    }
};

/**
 * @brief Called after every progress change of a blob
 */
using progress_handler =
    std::function<void(const transfer_snapshot&, const transfer_progress&)>;

/**
 * @brief Upload of one local file to one remote object
 */
struct upload_request {
    std::string restoration_id;   ///< Client that performs the transfer
    std::string source;           ///< Local file
    std::string destination;      ///< Remote object name
    blob_transfer_options options;
    progress_handler on_progress;
};

/**
 * @brief Download of one remote object to one local file
 */
struct download_request {
    std::string restoration_id;
    std::string source;           ///< Remote object name
    std::string destination;      ///< Local file
    blob_transfer_options options;
    progress_handler on_progress;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_MANAGER_MANAGER_TYPES_H
