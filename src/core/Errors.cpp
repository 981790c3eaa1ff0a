#include "chunkswarm/Errors.hpp"

namespace chunkswarm {

const char* error_kind_to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Transport:
            return "transport";
        case ErrorKind::Planning:
            return "planning";
    }
    return "unknown";
}

}  // namespace chunkswarm
