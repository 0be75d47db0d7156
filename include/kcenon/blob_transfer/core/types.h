/**
 * @file types.h
 * @brief Core type definitions for blob_transfer
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_TYPES_H
#define KCENON_BLOB_TRANSFER_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kcenon::blob_transfer {

/**
 * @brief Error codes for blob transfer operations (-800 to -899)
 *
 * Error code ranges:
 * - -800 to -809: Registration Errors
 * - -810 to -819: Transfer Errors
 * - -820 to -829: Client Errors
 * - -830 to -839: Network Errors
 * - -840 to -849: Store Errors
 * - -850 to -859: Operation Errors
 * - -860 to -869: Configuration Errors
 * - -870 to -879: File I/O Errors
 * - -890 to -899: Internal Errors
 */
enum class error_code : int32_t {
    success = 0,

    // Registration Errors (-800 to -809)
    duplicate_restoration_id = -800,
    invalid_restoration_id = -801,

    // Transfer Errors (-810 to -819)
    transfer_not_found = -810,
    invalid_state_transition = -811,
    transfer_cancelled = -812,
    transfer_not_resumable = -813,
    unsupported_transfer_kind = -814,
    invalid_request = -815,

    // Client Errors (-820 to -829)
    no_client_registered = -820,
    helper_construction_failed = -821,
    block_not_found = -822,
    commit_failed = -823,
    checksum_mismatch = -824,

    // Network Errors (-830 to -839)
    connection_failed = -830,
    connection_lost = -831,
    request_failed = -832,
    remote_not_found = -833,

    // Store Errors (-840 to -849)
    store_error = -840,
    store_corrupted = -841,
    store_record_invalid = -842,

    // Operation Errors (-850 to -859)
    operation_cancelled = -850,
    dependency_failed = -851,
    invalid_dependency = -852,
    queue_stopped = -853,

    // Configuration Errors (-860 to -869)
    config_invalid = -860,
    config_invalid_concurrency = -861,
    config_invalid_block_size = -862,

    // File I/O Errors (-870 to -879)
    file_not_found = -870,
    file_read_error = -871,
    file_write_error = -872,
    file_already_exists = -873,

    // Internal Errors (-890 to -899)
    internal_error = -890,
    not_initialized = -891,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) noexcept
    -> std::string_view {
    switch (code) {
        case error_code::success:
            return "success";

        case error_code::duplicate_restoration_id:
            return "a client with this restoration id is already registered";
        case error_code::invalid_restoration_id:
            return "invalid restoration id";

        case error_code::transfer_not_found:
            return "transfer not found";
        case error_code::invalid_state_transition:
            return "invalid transfer state transition";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::transfer_not_resumable:
            return "transfer is not resumable";
        case error_code::unsupported_transfer_kind:
            return "operation not supported for this transfer kind";
        case error_code::invalid_request:
            return "invalid transfer request";

        case error_code::no_client_registered:
            return "no client registered for restoration id";
        case error_code::helper_construction_failed:
            return "failed to construct transfer helper";
        case error_code::block_not_found:
            return "block not found";
        case error_code::commit_failed:
            return "block list commit failed";
        case error_code::checksum_mismatch:
            return "checksum verification failed";

        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::request_failed:
            return "request failed";
        case error_code::remote_not_found:
            return "remote object not found";

        case error_code::store_error:
            return "durable store error";
        case error_code::store_corrupted:
            return "durable store corrupted";
        case error_code::store_record_invalid:
            return "invalid durable store record";

        case error_code::operation_cancelled:
            return "operation cancelled";
        case error_code::dependency_failed:
            return "operation dependency did not succeed";
        case error_code::invalid_dependency:
            return "operation dependency was never queued";
        case error_code::queue_stopped:
            return "operation queue stopped";

        case error_code::config_invalid:
            return "invalid configuration";
        case error_code::config_invalid_concurrency:
            return "max concurrency must be at least 1";
        case error_code::config_invalid_block_size:
            return "block size out of valid range";

        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::file_already_exists:
            return "file already exists";

        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";

        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code is in network error range
 */
[[nodiscard]] constexpr auto is_network_error(error_code code) noexcept
    -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -830 && value >= -839;
}

/**
 * @brief Check if error code is in store error range
 */
[[nodiscard]] constexpr auto is_store_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -840 && value >= -849;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Unique identifier for a transfer entity (16-byte UUID)
 */
struct transfer_id {
    std::array<uint8_t, 16> bytes{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};

    constexpr transfer_id() noexcept = default;

    explicit constexpr transfer_id(const std::array<uint8_t, 16>& b) noexcept
        : bytes(b) {}

    /**
     * @brief Generate a new random transfer ID
     */
    [[nodiscard]] static auto generate() -> transfer_id;

    /**
     * @brief Convert to string representation (UUID format)
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Parse from UUID string
     */
    [[nodiscard]] static auto from_string(std::string_view str)
        -> std::optional<transfer_id>;

    /**
     * @brief Check if the transfer ID is null (all zeros)
     */
    [[nodiscard]] constexpr auto is_null() const noexcept -> bool {
        for (const auto& b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr auto operator==(const transfer_id& other) const
        noexcept -> bool = default;

    [[nodiscard]] constexpr auto operator<(const transfer_id& other) const
        noexcept -> bool {
        return bytes < other.bytes;
    }
};

}  // namespace kcenon::blob_transfer

// Hash support for transfer_id
template <>
struct std::hash<kcenon::blob_transfer::transfer_id> {
    auto operator()(const kcenon::blob_transfer::transfer_id& id) const noexcept
        -> std::size_t {
        std::size_t seed = 0;
        for (auto b : id.bytes) {
            seed = seed * 31 + b;
        }
        return seed;
    }
};

#endif  // KCENON_BLOB_TRANSFER_CORE_TYPES_H
