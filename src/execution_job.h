#pragma once

#include <string>
#include <chrono>
#include <optional>
#include "types.h"

namespace runcage {

// One request to run a script. The caller fills the request part; the
// Dispatcher fills the rest at admission and nothing changes it afterwards.
struct ExecutionJob {
    std::string id;                          // Empty: the engine assigns one
    std::string tenant_id;
    std::string script;
    OutputFormat format = OutputFormat::TABULAR;
    std::optional<std::string> target_url;   // Custom target URL override
    ResourceOverrides overrides;

    // Set at admission
    ResourceProfile profile;
    bool network_access = false;
    std::string script_sha256;
    std::chrono::system_clock::time_point submitted_at;
};

} // namespace runcage
