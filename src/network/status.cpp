#include "ofs/network/status.hpp"

namespace ofs::network {

const char* to_string(NetworkQuality quality) noexcept {
    switch (quality) {
        case NetworkQuality::Offline: return "offline";
        case NetworkQuality::Poor: return "poor";
        case NetworkQuality::Moderate: return "moderate";
        case NetworkQuality::Good: return "good";
    }
    return "offline";
}

NetworkQuality NetworkStatus::quality() const {
    if (!online) {
        return NetworkQuality::Offline;
    }
    bool slow_type = effective_type == "2g" || effective_type == "slow-2g";
    bool slow_link = downlink_mbps > 0.0 && downlink_mbps < 1.0;
    if (slow_type || slow_link || rtt_ms > 1000) {
        return NetworkQuality::Poor;
    }
    if (effective_type == "3g" || !is_stable()) {
        return NetworkQuality::Moderate;
    }
    return NetworkQuality::Good;
}

} // namespace ofs::network
