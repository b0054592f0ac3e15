#include "sandbox_runner.h"

namespace runcage {

bool egress_allowed(NetworkPolicy policy, const std::optional<std::string>& target_url) {
    switch (policy) {
        case NetworkPolicy::NONE: return false;
        case NetworkPolicy::TARGET_ONLY: return target_url.has_value() && !target_url->empty();
        case NetworkPolicy::ALLOW: return true;
    }
    return false;
}

std::string to_string(ExitKind kind) {
    switch (kind) {
        case ExitKind::EXITED: return "exited";
        case ExitKind::SIGNALED: return "signaled";
        case ExitKind::DEADLINE_EXCEEDED: return "deadline_exceeded";
        case ExitKind::CANCELLED: return "cancelled";
    }
    return "unknown";
}

RawOutput ExitOutcome::raw_output() const {
    RawOutput raw;
    raw.stdout_data = stdout_data;
    raw.stdout_truncated = stdout_truncated;
    raw.files = files;
    return raw;
}

} // namespace runcage
