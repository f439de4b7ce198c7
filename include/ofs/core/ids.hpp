#pragma once

#include <string>

namespace ofs {

/**
 * @brief Random identifier such as "op-3f9a0c1e5b7d2a64"
 *
 * 64 random bits rendered as hex, prefixed with the record kind.
 */
std::string generate_id(const std::string& prefix);

} // namespace ofs
