#include "ofs/core/ids.hpp"

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace ofs {

std::string generate_id(const std::string& prefix) {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    std::uint64_t value = 0;
    {
        std::lock_guard lock(mutex);
        value = engine();
    }

    std::ostringstream oss;
    if (!prefix.empty()) {
        oss << prefix << "-";
    }
    oss << std::hex << std::setw(sizeof(value) * 2) << std::setfill('0') << value;
    return oss.str();
}

} // namespace ofs
