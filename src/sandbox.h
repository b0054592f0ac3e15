#pragma once

#include <string>
#include <memory>
#include <optional>
#include <sys/types.h>
#include "sandbox_runner.h"
#include "constants.h"

namespace runcage {

// Sandbox configuration (host side, shared by every job)
struct SandboxConfig {
    std::string interpreter = "python3";          // Name on PATH or absolute path
    std::string work_root = "/tmp";               // Parent of per-job working directories
    bool use_namespaces = true;                   // User/mount/IPC/UTS (+net) namespaces and jail
    bool use_cgroups = true;                      // cgroup v2 limits when delegated to us
    std::string cgroup_root = "/sys/fs/cgroup/runcage";
    bool use_seccomp = true;                      // Syscall denylist
    std::optional<std::string> extra_readonly_path;  // Extra host directory visible in the jail
};

// What the host actually supports; missing features degrade isolation
struct SandboxCapabilities {
    bool user_namespaces = false;
    bool cgroups = false;
    bool seccomp = false;
    bool pidfd = false;
};

// Linux process sandbox: fork + namespaces + chroot jail + rlimits + cgroup v2
// + seccomp, one private working directory per job.
class Sandbox : public SandboxRunner {
public:
    explicit Sandbox(const SandboxConfig& config = SandboxConfig{});
    ~Sandbox() override;

    std::unique_ptr<SandboxHandle> start(const SandboxRequest& request) override;
    ExitOutcome wait(SandboxHandle& handle,
                     Clock::time_point deadline,
                     const CancelToken& cancel) override;
    void destroy(SandboxHandle& handle) noexcept override;

    const SandboxConfig& config() const;

    // Probe the host once (forks short-lived children)
    static SandboxCapabilities probe_capabilities();

    // Script filename for an interpreter ("script.py" for python3, ...)
    static std::string script_filename(const std::string& interpreter);

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace runcage
