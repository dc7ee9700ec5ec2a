#include "runtime/container_runtime.hpp"

namespace boxrun::runtime {

const char* ToString(RuntimeError::Kind kind) {
    switch (kind) {
        case RuntimeError::Kind::kUnreachable: return "unreachable";
        case RuntimeError::Kind::kNotFound: return "not_found";
        case RuntimeError::Kind::kApi: return "api";
        case RuntimeError::Kind::kTimeout: return "timeout";
    }
    return "unknown";
}

}  // namespace boxrun::runtime
