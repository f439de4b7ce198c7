#pragma once

#include <cstdint>
#include <string>

namespace ofs::network {

enum class NetworkQuality {
    Offline,
    Poor,
    Moderate,
    Good
};

const char* to_string(NetworkQuality quality) noexcept;

/**
 * @brief Snapshot of connectivity as reported by the platform or a probe
 *
 * downlink_mbps and rtt_ms are 0 when the platform does not report them.
 */
struct NetworkStatus {
    bool online = true;
    std::string connection_type = "unknown";   ///< wifi, cellular, ethernet, ...
    std::string effective_type = "unknown";    ///< slow-2g, 2g, 3g, 4g
    double downlink_mbps = 0.0;
    std::uint32_t rtt_ms = 0;

    NetworkQuality quality() const;

    // A connection is stable when its round trip stays under 500 ms
    bool is_stable() const { return online && rtt_ms < 500; }
};

} // namespace ofs::network
