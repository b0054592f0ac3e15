#include "types.h"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace runcage {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::TABULAR: return "tabular";
        case OutputFormat::DOCUMENT: return "document";
        case OutputFormat::MARKUP: return "markup";
    }
    return "unknown";
}

std::string to_string(JobState state) {
    switch (state) {
        case JobState::QUEUED: return "queued";
        case JobState::STARTING: return "starting";
        case JobState::RUNNING: return "running";
        case JobState::COLLECTING: return "collecting";
        case JobState::TERMINAL: return "terminal";
    }
    return "unknown";
}

std::string to_string(NetworkPolicy policy) {
    switch (policy) {
        case NetworkPolicy::NONE: return "none";
        case NetworkPolicy::TARGET_ONLY: return "target-only";
        case NetworkPolicy::ALLOW: return "allow";
    }
    return "unknown";
}

std::string to_string(SubmissionErrorKind kind) {
    switch (kind) {
        case SubmissionErrorKind::VALIDATION: return "ValidationError";
        case SubmissionErrorKind::BACKPRESSURE: return "Backpressure";
        case SubmissionErrorKind::QUOTA_EXCEEDED: return "QuotaExceeded";
    }
    return "unknown";
}

std::optional<OutputFormat> parse_output_format(const std::string& name) {
    std::string key = lowercase(name);
    if (key == "csv" || key == "tabular") return OutputFormat::TABULAR;
    if (key == "json" || key == "document") return OutputFormat::DOCUMENT;
    if (key == "xml" || key == "markup") return OutputFormat::MARKUP;
    return std::nullopt;
}

std::optional<NetworkPolicy> parse_network_policy(const std::string& name) {
    std::string key = lowercase(name);
    if (key == "none") return NetworkPolicy::NONE;
    if (key == "target-only" || key == "target_only") return NetworkPolicy::TARGET_ONLY;
    if (key == "allow") return NetworkPolicy::ALLOW;
    return std::nullopt;
}

std::string format_extension(OutputFormat format) {
    switch (format) {
        case OutputFormat::TABULAR: return "csv";
        case OutputFormat::DOCUMENT: return "json";
        case OutputFormat::MARKUP: return "xml";
    }
    return "txt";
}

bool is_forward_transition(JobState from, JobState to) {
    return static_cast<int>(to) > static_cast<int>(from);
}

long ResourceProfile::cpu_time_limit_seconds() const {
    // A job may use its whole share for the whole wall-clock budget, plus one
    // second so RLIMIT_CPU never fires before the wall-clock deadline.
    double seconds = cpu_share * std::chrono::duration<double>(wall_clock_timeout).count();
    return static_cast<long>(std::ceil(seconds)) + 1;
}

} // namespace runcage
