#include "linerpc/session.hpp"

namespace linerpc {

const char* to_string(SessionState s) {
    switch (s) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initializing:  return "initializing";
        case SessionState::Ready:         return "ready";
    }
    return "unknown";
}

} // namespace linerpc
