// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"
#include "types.h"

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::blob_transfer {

/**
 * @brief Log categories for blob transfer
 */
struct log_category {
    static constexpr std::string_view manager = "blob_transfer.manager";
    static constexpr std::string_view queue = "blob_transfer.queue";
    static constexpr std::string_view store = "blob_transfer.store";
    static constexpr std::string_view client = "blob_transfer.client";
    static constexpr std::string_view reachability = "blob_transfer.reachability";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

[[nodiscard]] auto log_level_to_string(log_level level) -> std::string_view;

/**
 * @brief Masking of local paths and remote endpoints in log output
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_endpoints = false;
    char mask_char = '*';
    std::size_t visible_chars = 4;

    static auto all_masked() -> masking_config { return {true, true, '*', 4}; }
    static auto none() -> masking_config { return {false, false, '*', 4}; }
};

class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    /**
     * @brief Mask every path and endpoint found in free text
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string;

    /**
     * @brief Keep the file name, mask the directories
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string;

    /**
     * @brief Keep the scheme and the first visible_chars of the host
     */
    [[nodiscard]] auto mask_endpoint(const std::string& endpoint) const
        -> std::string;

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) { config_ = config; }

private:
    masking_config config_;
};

/**
 * @brief Structured context attached to a transfer log line
 */
struct transfer_log_context {
    std::string transfer_id;
    std::string kind;
    std::string state;
    std::string restoration_id;
    std::optional<std::string> source;
    std::optional<std::string> destination;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> total_bytes;
    std::optional<uint32_t> block_index;
    std::optional<uint32_t> total_blocks;
    std::optional<int32_t> error_code;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string;
};

/**
 * @brief One emitted log record
 */
struct log_record {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    const char* file = nullptr;
    int line = 0;
    const char* function = nullptr;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string;
    [[nodiscard]] auto to_text(const sensitive_info_masker* masker = nullptr) const
        -> std::string;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,  ///< Timestamp, level, category and message on one line
    json   ///< One JSON object per line
};

/**
 * @brief Logger shared by every blob_transfer component
 *
 * Writes to logger_system when BLOB_TRANSFER_USE_LOGGER_SYSTEM is set,
 * otherwise to stderr. A callback can observe every record (tests use it to
 * assert on FATAL store corruption reports).
 */
class transfer_logger {
public:
    using log_callback = std::function<void(const log_record&)>;

    transfer_logger() = default;
    ~transfer_logger() = default;

    transfer_logger(const transfer_logger&) = delete;
    transfer_logger& operator=(const transfer_logger&) = delete;

    /**
     * @brief Initialize the backend
     *
     * Safe to call multiple times; called by transfer_manager::builder.
     */
    void initialize();
    void shutdown();
    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level);
    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format);
    [[nodiscard]] auto get_output_format() const -> log_output_format;

    void set_masking_config(masking_config config);
    [[nodiscard]] auto get_masking_config() const -> masking_config;

    /**
     * @brief Observe every record; pass nullptr to remove
     */
    void set_callback(log_callback callback);

    /**
     * @brief Suppress backend output; the callback still receives records
     */
    void set_console_output(bool enable) { console_output_.store(enable); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr);

    void flush();

private:
    void write(const log_record& record, const sensitive_info_masker& masker,
               log_output_format format);

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};

    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    std::unique_ptr<kcenon::logger::logger> logger_;
#endif
};

/**
 * @brief Global logger instance
 */
auto get_logger() -> transfer_logger&;

/**
 * @brief Log context for a transfer id, filled further by the caller
 */
[[nodiscard]] auto make_log_context(const transfer_id& id)
    -> transfer_log_context;

// Logging macros
#define BT_LOG(level, category, message) \
    kcenon::blob_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define BT_LOG_CTX(level, category, message, context) \
    kcenon::blob_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define BT_LOG_TRACE(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::trace, category, message)

#define BT_LOG_DEBUG(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::debug, category, message)

#define BT_LOG_INFO(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::info, category, message)

#define BT_LOG_WARN(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::warn, category, message)

#define BT_LOG_ERROR(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::error, category, message)

#define BT_LOG_FATAL(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::fatal, category, message)

#define BT_LOG_DEBUG_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::debug, category, message, ctx)

#define BT_LOG_INFO_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::info, category, message, ctx)

#define BT_LOG_WARN_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::warn, category, message, ctx)

#define BT_LOG_ERROR_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::error, category, message, ctx)

#define BT_LOG_FATAL_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::fatal, category, message, ctx)

}  // namespace kcenon::blob_transfer
