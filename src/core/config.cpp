#include "core/config.hpp"

namespace tc {

const char* fov_mode_name(FovMode mode) {
    switch (mode) {
    case FovMode::Lines: return "lines";
    case FovMode::Buffered: return "buffered";
    }
    return "unknown";
}

} // namespace tc
