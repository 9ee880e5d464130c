#include "core/stream_types.hpp"

namespace voicestream {
namespace core {

const char* const kAutoDetectLanguage = "auto";

std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::CONNECTING: return "connecting";
        case SessionState::STREAMING: return "streaming";
        case SessionState::RECONNECTING: return "reconnecting";
        case SessionState::COMPLETED: return "completed";
        case SessionState::FAILED: return "failed";
    }
    return "unknown";
}

} // namespace core
} // namespace voicestream
