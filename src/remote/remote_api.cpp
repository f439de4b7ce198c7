#include "ofs/remote/remote_api.hpp"

namespace ofs::remote {

const char* to_string(MutationMethod method) noexcept {
    switch (method) {
        case MutationMethod::Post: return "POST";
        case MutationMethod::Put: return "PUT";
        case MutationMethod::Delete: return "DELETE";
    }
    return "POST";
}

} // namespace ofs::remote
