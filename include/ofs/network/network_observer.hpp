#pragma once

/**
 * @file network_observer.hpp
 * @brief Tracks connectivity and turns it into sync cycles
 *
 * WHAT IT DOES:
 * - Holds the current NetworkStatus, pushed by the platform or polled
 * - Emits NetworkStatusChangedEvent on every online/offline transition
 * - After coming back online waits sync.reconnect_delay, then triggers a sync
 * - With sync.auto_sync, triggers a sync every sync.auto_sync_interval while
 *   online and work is pending
 *
 * Timers run on a Boost.Asio io_context driven by one background thread
 * started by start(). Sync triggers run on that thread.
 *
 * EXAMPLE:
 * NetworkObserver observer(bus, config.sync, config.network);
 * observer.set_sync_trigger([&] { orchestrator.sync_pending_operations(); });
 * observer.start();
 * observer.update_status(NetworkStatus{false});   // went offline
 */

#include "ofs/core/config.hpp"
#include "ofs/events/event_bus.hpp"
#include "ofs/network/status.hpp"

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>

namespace ofs::network {

namespace asio = boost::asio;

/// Active connectivity check; returns the observed status
using ConnectivityProbe = std::function<NetworkStatus()>;

class NetworkObserver {
public:
    NetworkObserver(events::EventBus& bus, SyncConfig sync, NetworkConfig network, NetworkStatus initial = {});
    ~NetworkObserver();

    NetworkObserver(const NetworkObserver&) = delete;
    NetworkObserver& operator=(const NetworkObserver&) = delete;

    void set_sync_trigger(std::function<void()> trigger);

    /// Gate for periodic syncs; defaults to "always pending"
    void set_work_pending(std::function<bool()> check);

    /// Polled every network.polling_interval when network.enable_polling is set
    void set_probe(ConnectivityProbe probe);

    /// No-op when already running or once stop() has been called
    void start();
    void stop();
    bool running() const { return running_.load(); }

    /**
     * @brief Record a new status reported by the platform
     *
     * Emits NetworkStatusChangedEvent when `online` flips.
     */
    void update_status(NetworkStatus status);

    /**
     * @brief Run the probe once and apply its result
     *
     * RETURNS: Online state after the probe; the current state when no probe is set
     */
    bool probe_now();

    bool is_online() const;
    NetworkStatus status() const;

private:
    void schedule_reconnect_sync();
    void arm_auto_sync();
    void arm_poll();
    void trigger_sync(const char* reason);

    events::EventBus& bus_;
    const SyncConfig sync_;
    const NetworkConfig network_;

    mutable std::mutex mutex_;
    NetworkStatus status_;
    std::function<void()> sync_trigger_;
    std::function<bool()> work_pending_;
    ConnectivityProbe probe_;

    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    asio::steady_timer reconnect_timer_;
    asio::steady_timer auto_sync_timer_;
    asio::steady_timer poll_timer_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace ofs::network
