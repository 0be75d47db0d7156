/**
 * @file reachability_monitor.cpp
 * @brief Reachability monitor implementations
 */

#include "kcenon/blob_transfer/reachability/reachability_monitor.h"

#include "kcenon/blob_transfer/core/logging.h"

#include <atomic>
#include <condition_variable>
#include <thread>

#if BLOB_TRANSFER_HAS_INTERFACE_MONITOR
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#endif

namespace kcenon::blob_transfer {

// ============================================================================
// manual_reachability_monitor
// ============================================================================

manual_reachability_monitor::manual_reachability_monitor(reachability_status initial)
    : status_(initial) {}

auto manual_reachability_monitor::start_listening() -> result<void> {
    std::lock_guard lock(mutex_);
    listening_ = true;
    return {};
}

void manual_reachability_monitor::stop_listening() {
    std::lock_guard lock(mutex_);
    listening_ = false;
}

auto manual_reachability_monitor::is_listening() const -> bool {
    std::lock_guard lock(mutex_);
    return listening_;
}

void manual_reachability_monitor::on_status_changed(status_callback callback) {
    std::lock_guard lock(callback_mutex_);
    callback_ = std::move(callback);
}

auto manual_reachability_monitor::status() const -> reachability_status {
    std::lock_guard lock(mutex_);
    return status_;
}

void manual_reachability_monitor::set_status(reachability_status status) {
    {
        std::lock_guard lock(mutex_);
        if (status_ == status) {
            return;
        }
        status_ = status;
        if (!listening_) {
            return;
        }
    }

    BT_LOG_INFO(log_category::reachability,
                "Reachability changed: " + std::string(to_string(status)));

    std::lock_guard lock(callback_mutex_);
    if (callback_) {
        callback_(status);
    }
}

// ============================================================================
// interface_reachability_monitor
// ============================================================================

struct interface_reachability_monitor::impl {
    interface_monitor_config config;

    status_callback callback;
    std::mutex callback_mutex;

    std::atomic<bool> monitoring{false};
    std::atomic<reachability_status> current{reachability_status::unknown};
    std::thread monitor_thread;
    std::condition_variable monitor_cv;
    std::mutex monitor_mutex;

    explicit impl(interface_monitor_config cfg) : config(cfg) {}

    ~impl() { stop_monitoring(); }

    void stop_monitoring() {
        if (monitoring.exchange(false)) {
            monitor_cv.notify_all();
            if (monitor_thread.joinable()) {
                monitor_thread.join();
            }
        }
    }

    void emit(reachability_status status) {
        std::lock_guard lock(callback_mutex);
        if (callback) {
            callback(status);
        }
    }

    void poll() {
        auto next = classify(available_interfaces());
        auto previous = current.exchange(next);
        if (previous != next) {
            BT_LOG_INFO(log_category::reachability,
                        "Reachability changed: " + std::string(to_string(previous)) +
                            " -> " + std::string(to_string(next)));
            emit(next);
        }
    }
};

interface_reachability_monitor::interface_reachability_monitor(
    interface_monitor_config config)
    : impl_(std::make_unique<impl>(config)) {}

interface_reachability_monitor::~interface_reachability_monitor() = default;

auto interface_reachability_monitor::start_listening() -> result<void> {
#if BLOB_TRANSFER_HAS_INTERFACE_MONITOR
    if (impl_->monitoring.exchange(true)) {
        return {};
    }

    BT_LOG_INFO(log_category::reachability, "Starting network monitoring");

    // Initial status is reported silently
    impl_->current = classify(available_interfaces());

    impl_->monitor_thread = std::thread([this]() {
        for (;;) {
            {
                std::unique_lock lock(impl_->monitor_mutex);
                impl_->monitor_cv.wait_for(lock, impl_->config.poll_interval,
                                           [this] { return !impl_->monitoring.load(); });
            }
            if (!impl_->monitoring) {
                return;
            }
            impl_->poll();
        }
    });
    return {};
#else
    return unexpected(error(error_code::not_initialized,
                            "interface enumeration unavailable on this platform"));
#endif
}

void interface_reachability_monitor::stop_listening() {
    impl_->stop_monitoring();
}

auto interface_reachability_monitor::is_listening() const -> bool {
    return impl_->monitoring.load();
}

void interface_reachability_monitor::on_status_changed(status_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->callback = std::move(callback);
}

auto interface_reachability_monitor::status() const -> reachability_status {
    return impl_->current.load();
}

auto interface_reachability_monitor::available_interfaces()
    -> std::vector<network_interface> {
    std::vector<network_interface> interfaces;

#if BLOB_TRANSFER_HAS_INTERFACE_MONITOR
    struct ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) != 0) {
        BT_LOG_WARN(log_category::reachability, "getifaddrs failed");
        return interfaces;
    }

    for (struct ifaddrs* addr = addrs; addr != nullptr; addr = addr->ifa_next) {
        if (addr->ifa_addr == nullptr || addr->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        network_interface iface;
        iface.name = addr->ifa_name;
        iface.is_up = (addr->ifa_flags & IFF_UP) != 0 &&
                      (addr->ifa_flags & IFF_RUNNING) != 0;

        auto* sin = reinterpret_cast<struct sockaddr_in*>(addr->ifa_addr);
        char ip_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &sin->sin_addr, ip_str, sizeof(ip_str));
        iface.address = ip_str;

        if ((addr->ifa_flags & IFF_LOOPBACK) != 0 || iface.address == "127.0.0.1") {
            continue;
        }

#ifdef __APPLE__
        iface.is_wireless = iface.name.find("awdl") == 0;
        iface.is_cellular = iface.name.find("pdp_ip") == 0;
#else
        iface.is_wireless = iface.name.find("wlan") == 0 || iface.name.find("wlp") == 0;
        iface.is_cellular = iface.name.find("wwan") == 0 ||
                            iface.name.find("rmnet") == 0 ||
                            iface.name.find("ccmni") == 0;
#endif

        interfaces.push_back(iface);
    }

    freeifaddrs(addrs);
#endif

    return interfaces;
}

auto interface_reachability_monitor::classify(
    const std::vector<network_interface>& interfaces) -> reachability_status {
    bool any_cellular = false;
    for (const auto& iface : interfaces) {
        if (!iface.is_up) {
            continue;
        }
        if (!iface.is_cellular) {
            return reachability_status::reachable_lan;
        }
        any_cellular = true;
    }
    return any_cellular ? reachability_status::reachable_wan
                        : reachability_status::unreachable;
}

}  // namespace kcenon::blob_transfer
