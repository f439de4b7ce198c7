#include "ofs/network/network_observer.hpp"

#include "ofs/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>

namespace ofs::network {

NetworkObserver::NetworkObserver(events::EventBus& bus, SyncConfig sync, NetworkConfig network, NetworkStatus initial)
    : bus_(bus),
      sync_(std::move(sync)),
      network_(std::move(network)),
      status_(std::move(initial)),
      work_pending_([]() { return true; }),
      work_(asio::make_work_guard(io_)),
      reconnect_timer_(io_),
      auto_sync_timer_(io_),
      poll_timer_(io_) {}

NetworkObserver::~NetworkObserver() {
    stop();
}

void NetworkObserver::set_sync_trigger(std::function<void()> trigger) {
    std::lock_guard lock(mutex_);
    sync_trigger_ = std::move(trigger);
}

void NetworkObserver::set_work_pending(std::function<bool()> check) {
    std::lock_guard lock(mutex_);
    work_pending_ = std::move(check);
}

void NetworkObserver::set_probe(ConnectivityProbe probe) {
    std::lock_guard lock(mutex_);
    probe_ = std::move(probe);
}

void NetworkObserver::start() {
    if (io_.stopped()) {
        spdlog::warn("Network observer cannot be restarted after stop()");
        return;
    }
    if (running_.exchange(true)) {
        return;
    }

    asio::post(io_, [this]() {
        if (sync_.auto_sync) {
            arm_auto_sync();
        }
        if (network_.enable_polling) {
            arm_poll();
        }
    });

    thread_ = std::thread([this]() {
        spdlog::debug("Network observer loop started");
        io_.run();
        spdlog::debug("Network observer loop exited");
    });
    spdlog::info("Network observer started ({})", is_online() ? "online" : "offline");
}

void NetworkObserver::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    work_.reset();
    io_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::info("Network observer stopped");
}

void NetworkObserver::update_status(NetworkStatus status) {
    bool was_online = false;
    {
        std::lock_guard lock(mutex_);
        was_online = status_.online;
        status_ = status;
    }

    if (was_online == status.online) {
        return;
    }

    events::NetworkStatusChangedEvent event{status, was_online};
    if (event.came_online()) {
        spdlog::info("Network connected ({}, {})", status.connection_type, to_string(status.quality()));
    } else {
        spdlog::warn("Network disconnected");
    }
    bus_.emit(event);

    if (event.came_online() && sync_.sync_on_reconnect) {
        asio::post(io_, [this]() { schedule_reconnect_sync(); });
    } else if (event.went_offline()) {
        asio::post(io_, [this]() { reconnect_timer_.cancel(); });
    }
}

bool NetworkObserver::probe_now() {
    ConnectivityProbe probe;
    {
        std::lock_guard lock(mutex_);
        probe = probe_;
    }
    if (!probe) {
        return is_online();
    }

    NetworkStatus observed;
    try {
        observed = probe();
    } catch (const std::exception& e) {
        spdlog::warn("Connectivity probe failed: {}", e.what());
        observed = status();
        observed.online = false;
    }
    update_status(observed);
    return observed.online;
}

bool NetworkObserver::is_online() const {
    std::lock_guard lock(mutex_);
    return status_.online;
}

NetworkStatus NetworkObserver::status() const {
    std::lock_guard lock(mutex_);
    return status_;
}

void NetworkObserver::schedule_reconnect_sync() {
    reconnect_timer_.expires_after(sync_.reconnect_delay);
    reconnect_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            spdlog::warn("Reconnect timer failed: {}", ec.message());
            return;
        }
        if (is_online()) {
            trigger_sync("reconnect");
        }
    });
}

void NetworkObserver::arm_auto_sync() {
    auto_sync_timer_.expires_after(sync_.auto_sync_interval);
    auto_sync_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }

        std::function<bool()> work_pending;
        bool online = false;
        {
            std::lock_guard lock(mutex_);
            work_pending = work_pending_;
            online = status_.online;
        }
        if (online && work_pending && work_pending()) {
            trigger_sync("interval");
        }
        arm_auto_sync();
    });
}

void NetworkObserver::arm_poll() {
    poll_timer_.expires_after(network_.polling_interval);
    poll_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        probe_now();
        arm_poll();
    });
}

void NetworkObserver::trigger_sync(const char* reason) {
    std::function<void()> trigger;
    {
        std::lock_guard lock(mutex_);
        trigger = sync_trigger_;
    }
    if (!trigger) {
        return;
    }

    spdlog::debug("Triggering sync ({})", reason);
    try {
        trigger();
    } catch (const std::exception& e) {
        spdlog::error("Sync trigger threw: {}", e.what());
    }
}

} // namespace ofs::network
