/**
 * @file reachability_monitor.h
 * @brief Network reachability monitors driving automatic pause and resume
 */

#ifndef KCENON_BLOB_TRANSFER_REACHABILITY_REACHABILITY_MONITOR_H
#define KCENON_BLOB_TRANSFER_REACHABILITY_REACHABILITY_MONITOR_H

#include <kcenon/blob_transfer/config/feature_flags.h>
#include <kcenon/blob_transfer/core/types.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Network reachability as seen by the transfer manager
 */
enum class reachability_status : uint8_t {
    unknown,        ///< Not determined yet
    unreachable,    ///< No usable interface
    reachable_lan,  ///< Wired or wireless local network
    reachable_wan   ///< Cellular / wide-area link only
};

[[nodiscard]] constexpr auto to_string(reachability_status status) noexcept
    -> std::string_view {
    switch (status) {
        case reachability_status::unknown: return "unknown";
        case reachability_status::unreachable: return "unreachable";
        case reachability_status::reachable_lan: return "reachable_lan";
        case reachability_status::reachable_wan: return "reachable_wan";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto is_reachable(reachability_status status) noexcept -> bool {
    return status == reachability_status::reachable_lan ||
           status == reachability_status::reachable_wan;
}

/**
 * @brief Source of reachability changes
 *
 * The callback is invoked on the monitor's own thread (interface monitor)
 * or on the thread that changed the status (manual monitor).
 */
class reachability_monitor {
public:
    using status_callback = std::function<void(reachability_status)>;

    virtual ~reachability_monitor() = default;

    [[nodiscard]] virtual auto start_listening() -> result<void> = 0;
    virtual void stop_listening() = 0;
    [[nodiscard]] virtual auto is_listening() const -> bool = 0;

    /**
     * @brief Replace the status callback; pass nullptr to remove it
     */
    virtual void on_status_changed(status_callback callback) = 0;

    [[nodiscard]] virtual auto status() const -> reachability_status = 0;
};

/**
 * @brief Application-driven monitor
 *
 * set_status() emits only when the status changes and the monitor is
 * listening.
 */
class manual_reachability_monitor : public reachability_monitor {
public:
    explicit manual_reachability_monitor(
        reachability_status initial = reachability_status::reachable_lan);

    [[nodiscard]] auto start_listening() -> result<void> override;
    void stop_listening() override;
    [[nodiscard]] auto is_listening() const -> bool override;
    void on_status_changed(status_callback callback) override;
    [[nodiscard]] auto status() const -> reachability_status override;

    void set_status(reachability_status status);

private:
    mutable std::mutex mutex_;
    std::mutex callback_mutex_;
    status_callback callback_;
    reachability_status status_;
    bool listening_ = false;
};

/**
 * @brief Network interface as reported by the operating system
 */
struct network_interface {
    std::string name;
    std::string address;
    bool is_up = false;
    bool is_wireless = false;
    bool is_cellular = false;
};

/**
 * @brief Configuration for interface_reachability_monitor
 */
struct interface_monitor_config {
    std::chrono::milliseconds poll_interval{2000};
};

/**
 * @brief Monitor polling the host's network interfaces
 */
class interface_reachability_monitor : public reachability_monitor {
public:
    explicit interface_reachability_monitor(
        interface_monitor_config config = interface_monitor_config{});
    ~interface_reachability_monitor() override;

    interface_reachability_monitor(const interface_reachability_monitor&) = delete;
    interface_reachability_monitor& operator=(const interface_reachability_monitor&) = delete;

    /**
     * @return not_initialized on platforms without interface enumeration
     */
    [[nodiscard]] auto start_listening() -> result<void> override;
    void stop_listening() override;
    [[nodiscard]] auto is_listening() const -> bool override;
    void on_status_changed(status_callback callback) override;
    [[nodiscard]] auto status() const -> reachability_status override;

    /**
     * @brief Non-loopback IPv4 interfaces of the host
     */
    [[nodiscard]] static auto available_interfaces() -> std::vector<network_interface>;

    /**
     * @brief Reachability implied by a set of interfaces
     *
     * Any up non-cellular interface means reachable_lan; only cellular ones
     * mean reachable_wan; none up means unreachable.
     */
    [[nodiscard]] static auto classify(const std::vector<network_interface>& interfaces)
        -> reachability_status;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_REACHABILITY_REACHABILITY_MONITOR_H
