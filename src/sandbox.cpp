#include "sandbox.h"
#include "file_utils.h"
#include <sys/wait.h>
#include <sys/resource.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <poll.h>
#include <unistd.h>
#include <sched.h>
#include <signal.h>
#include <seccomp.h>
#include <fcntl.h>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <chrono>
#include <thread>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>
#include <algorithm>
#include <vector>
#include <iterator>

namespace runcage {

namespace fs = std::filesystem;

namespace {

const char* const SANDBOX_PATH = "/usr/local/bin:/usr/bin:/bin";
const char* const JAIL_WORKDIR = "/work";

// Host directories bind-mounted read-only into the jail
const char* const SYSTEM_DIRS[] = {"/bin", "/sbin", "/lib", "/lib32", "/lib64", "/usr"};

// /etc entries needed by libc, DNS and TLS. Nothing holding credentials.
const char* const SAFE_ETC_ENTRIES[] = {
    "ld.so.cache", "ld.so.conf", "ld.so.conf.d", "nsswitch.conf", "resolv.conf",
    "hosts", "passwd", "group", "localtime", "ssl", "ca-certificates",
    "alternatives", "protocols", "services", "gai.conf", "host.conf", "mime.types"
};

const char* const DEVICES[] = {"/dev/null", "/dev/zero", "/dev/random", "/dev/urandom"};

// Syscalls a script never needs. Everything else stays allowed.
const int DENIED_SYSCALLS[] = {
    SCMP_SYS(ptrace), SCMP_SYS(process_vm_readv), SCMP_SYS(process_vm_writev),
    SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root), SCMP_SYS(chroot),
    SCMP_SYS(setns), SCMP_SYS(unshare),
    SCMP_SYS(reboot), SCMP_SYS(kexec_load), SCMP_SYS(kexec_file_load),
    SCMP_SYS(init_module), SCMP_SYS(finit_module), SCMP_SYS(delete_module),
    SCMP_SYS(swapon), SCMP_SYS(swapoff), SCMP_SYS(acct),
    SCMP_SYS(bpf), SCMP_SYS(perf_event_open), SCMP_SYS(userfaultfd),
    SCMP_SYS(keyctl), SCMP_SYS(add_key), SCMP_SYS(request_key),
    SCMP_SYS(open_by_handle_at), SCMP_SYS(name_to_handle_at),
    SCMP_SYS(settimeofday), SCMP_SYS(clock_settime), SCMP_SYS(adjtimex),
    SCMP_SYS(sethostname), SCMP_SYS(setdomainname),
    // Leaving the process group would escape the group kill
    SCMP_SYS(setsid), SCMP_SYS(setpgid)
};

const int DENIED_SOCKET_FAMILIES[] = {AF_INET, AF_INET6, AF_PACKET};

// One filesystem operation of the jail setup
struct MountStep {
    enum Kind { TMPFS, MKDIR, TOUCH, BIND_RO, BIND_RW };

    Kind kind;
    std::string source;
    std::string target;
    std::string options;              // tmpfs data
    unsigned long locked_flags = 0;   // Flags a read-only remount must keep
};

// Everything the child needs, computed before fork. The child only reads it.
struct ChildPlan {
    pid_t parent_pid = -1;
    std::string work_dir;
    std::string jail_root;            // Empty: no jail
    std::vector<MountStep> mounts;
    int unshare_flags = 0;
    bool map_user = false;
    std::string uid_map;
    std::string gid_map;

    std::string exec_path;
    std::vector<std::string> argv;
    std::vector<std::string> env_host;
    std::vector<std::string> env_jail;

    ResourceProfile profile;
    int cgroup_procs_fd = -1;
    bool seccomp = true;
    bool network_access = false;

    std::vector<char*> argv_ptrs;
    std::vector<char*> env_host_ptrs;
    std::vector<char*> env_jail_ptrs;

    // Freeze the strings into execve() arrays
    void finalize() {
        auto pointers = [](std::vector<std::string>& strings, std::vector<char*>& out) {
            out.clear();
            for (auto& s : strings) {
                out.push_back(s.data());
            }
            out.push_back(nullptr);
        };
        pointers(argv, argv_ptrs);
        pointers(env_host, env_host_ptrs);
        pointers(env_jail, env_jail_ptrs);
    }
};

// cgroup v2 group of one job. The child joins by writing "0" to procs_fd.
class Cgroup {
public:
    explicit Cgroup(std::string path) : path_(std::move(path)) {}
    ~Cgroup() { remove(); }

    Cgroup(const Cgroup&) = delete;
    Cgroup& operator=(const Cgroup&) = delete;

    bool create(const ResourceProfile& profile, std::string& error) {
        if (mkdir(path_.c_str(), 0755) != 0) {
            error = "mkdir " + path_ + ": " + std::strerror(errno);
            return false;
        }
        created_ = true;

        long long quota = std::llround(profile.cpu_share * DEFAULT_CPU_PERIOD_US);
        if (!write_control("memory.max", std::to_string(profile.memory_limit_bytes)) ||
            !write_control("pids.max", std::to_string(profile.max_processes)) ||
            !write_control("cpu.max", std::to_string(quota) + " " +
                                      std::to_string(DEFAULT_CPU_PERIOD_US))) {
            error = "cannot write limits under " + path_;
            return false;
        }

        // Swap accounting is optional; without it memory.max alone applies
        std::error_code ec;
        if (fs::exists(path_ + "/memory.swap.max", ec) && !write_control("memory.swap.max", "0")) {
            error = "cannot disable swap under " + path_;
            return false;
        }

        procs_fd_ = open((path_ + "/cgroup.procs").c_str(), O_WRONLY | O_CLOEXEC);
        if (procs_fd_ < 0) {
            error = "open cgroup.procs: " + std::string(std::strerror(errno));
            return false;
        }
        return true;
    }

    int procs_fd() const { return procs_fd_; }

    void close_procs_fd() {
        if (procs_fd_ >= 0) {
            close(procs_fd_);
            procs_fd_ = -1;
        }
    }

    void kill_all() {
        if (!created_) {
            return;
        }
        if (write_control("cgroup.kill", "1")) {
            return;
        }
        // Kernels before 5.14 have no cgroup.kill
        std::istringstream procs(read_control("cgroup.procs"));
        pid_t pid;
        while (procs >> pid) {
            ::kill(pid, SIGKILL);
        }
    }

    bool remove() {
        close_procs_fd();
        if (!created_) {
            return true;
        }
        // rmdir fails with EBUSY until the last member is gone
        for (int attempt = 0; attempt < 50; ++attempt) {
            if (rmdir(path_.c_str()) == 0 || errno == ENOENT) {
                created_ = false;
                return true;
            }
            if (errno != EBUSY) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

    size_t peak_memory() const {
        std::string value = read_control("memory.peak");
        return value.empty() ? 0 : static_cast<size_t>(std::strtoull(value.c_str(), nullptr, 10));
    }

    bool oom_killed() const {
        std::istringstream events(read_control("memory.events"));
        std::string key;
        unsigned long long count = 0;
        while (events >> key >> count) {
            if (key == "oom_kill") {
                return count > 0;
            }
        }
        return false;
    }

    // cgroup.events reports "populated 0" once every member has exited
    bool populated() const {
        std::istringstream events(read_control("cgroup.events"));
        std::string key;
        int value = 0;
        while (events >> key >> value) {
            if (key == "populated") {
                return value != 0;
            }
        }
        return false;
    }

    const std::string& path() const { return path_; }

private:
    bool write_control(const std::string& name, const std::string& value) const {
        std::ofstream control(path_ + "/" + name);
        if (!control) {
            return false;
        }
        control << value;
        control.close();
        return !control.fail();
    }

    std::string read_control(const std::string& name) const {
        std::ifstream control(path_ + "/" + name);
        std::stringstream content;
        content << control.rdbuf();
        return content.str();
    }

    std::string path_;
    bool created_ = false;
    int procs_fd_ = -1;
};

// Process state of one job
struct ProcessHandle : SandboxHandle {
    pid_t pid = -1;
    int pidfd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;

    std::string work_dir;
    std::string jail_root;
    std::string script_name;
    std::string output_name;
    std::unique_ptr<Cgroup> cgroup;

    bool reaped = false;
    int wait_status = 0;
    struct rusage usage{};

    std::string stdout_buffer;
    std::string stderr_buffer;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

ProcessHandle& as_process(SandboxHandle& handle) {
    auto* process = dynamic_cast<ProcessHandle*>(&handle);
    if (!process) {
        throw std::invalid_argument("Sandbox handle was not issued by this runner");
    }
    return *process;
}

// Pipe with both ends closed on destruction unless released
struct Pipe {
    int read_fd = -1;
    int write_fd = -1;

    Pipe() {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0) {
            throw SandboxUnavailableError(std::string("pipe: ") + std::strerror(errno));
        }
        read_fd = fds[0];
        write_fd = fds[1];
    }

    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int release_read() {
        int fd = read_fd;
        read_fd = -1;
        return fd;
    }

    void close_read() {
        if (read_fd >= 0) {
            close(read_fd);
            read_fd = -1;
        }
    }

    void close_write() {
        if (write_fd >= 0) {
            close(write_fd);
            write_fd = -1;
        }
    }
};

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Mount flags a bind mount of `path` inherits and may not drop on remount
unsigned long locked_mount_flags(const std::string& path) {
    struct statvfs info;
    if (statvfs(path.c_str(), &info) != 0) {
        return 0;
    }
    unsigned long flags = 0;
    if (info.f_flag & ST_NOSUID) flags |= MS_NOSUID;
    if (info.f_flag & ST_NODEV) flags |= MS_NODEV;
    if (info.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    if (info.f_flag & ST_NOATIME) flags |= MS_NOATIME;
    if (info.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
    if (info.f_flag & ST_RELATIME) flags |= MS_RELATIME;
    return flags;
}

std::optional<std::string> resolve_executable(const std::string& name) {
    std::error_code ec;
    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) != 0) {
            return std::nullopt;
        }
        auto canonical = fs::canonical(name, ec);
        return ec ? name : canonical.string();
    }

    const char* path_env = std::getenv("PATH");
    std::istringstream search(path_env ? path_env : SANDBOX_PATH);
    std::string dir;
    while (std::getline(search, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        fs::path candidate = fs::path(dir) / name;
        if (access(candidate.c_str(), X_OK) == 0) {
            auto canonical = fs::canonical(candidate, ec);
            return ec ? candidate.string() : canonical.string();
        }
    }
    return std::nullopt;
}

bool under_system_dir(const std::string& path) {
    for (const char* dir : SYSTEM_DIRS) {
        std::string prefix = std::string(dir) + "/";
        if (path.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

// --- Child side. Runs between fork() and execve(): no exceptions, no logging. ---

void report(int status_fd, char level, const char* what, int err) {
    char message[512];
    int length = std::snprintf(message, sizeof(message), "%c%s: %s\n",
                               level, what, std::strerror(err));
    if (length > 0) {
        size_t size = std::min(static_cast<size_t>(length), sizeof(message) - 1);
        [[maybe_unused]] ssize_t written = write(status_fd, message, size);
    }
}

[[noreturn]] void child_fail(int status_fd, const char* what, int err) {
    report(status_fd, 'E', what, err);
    _exit(127);
}

bool write_proc_file(const char* path, const std::string& content) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    ssize_t written = write(fd, content.data(), content.size());
    int saved = errno;
    close(fd);
    errno = saved;
    return written == static_cast<ssize_t>(content.size());
}

bool write_id_maps(const ChildPlan& plan) {
    // Older kernels have no setgroups file
    if (!write_proc_file("/proc/self/setgroups", "deny") && errno != ENOENT) {
        return false;
    }
    return write_proc_file("/proc/self/uid_map", plan.uid_map) &&
           write_proc_file("/proc/self/gid_map", plan.gid_map);
}

bool apply_mount(const MountStep& step) {
    const char* source = step.source.c_str();
    const char* target = step.target.c_str();
    switch (step.kind) {
        case MountStep::TMPFS:
            return mount("tmpfs", target, "tmpfs", MS_NOSUID | MS_NODEV, step.options.c_str()) == 0;
        case MountStep::MKDIR:
            return mkdir(target, 0755) == 0 || errno == EEXIST;
        case MountStep::TOUCH: {
            int fd = open(target, O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
            if (fd < 0) {
                return false;
            }
            close(fd);
            return true;
        }
        case MountStep::BIND_RW:
            return mount(source, target, nullptr, MS_BIND | MS_REC, nullptr) == 0;
        case MountStep::BIND_RO:
            if (mount(source, target, nullptr, MS_BIND | MS_REC, nullptr) != 0) {
                return false;
            }
            return mount(nullptr, target, nullptr,
                         MS_BIND | MS_REMOUNT | MS_RDONLY | step.locked_flags, nullptr) == 0;
    }
    return false;
}

// Build the jail and chroot into it. Returns false (host view kept) when a
// step fails before the chroot.
bool enter_jail(const ChildPlan& plan, int status_fd) {
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        report(status_fd, 'W', "make mounts private", errno);
        return false;
    }
    for (const auto& step : plan.mounts) {
        if (!apply_mount(step)) {
            report(status_fd, 'W', step.target.c_str(), errno);
            return false;
        }
    }
    if (chroot(plan.jail_root.c_str()) != 0) {
        report(status_fd, 'W', "chroot", errno);
        return false;
    }
    if (chdir(JAIL_WORKDIR) != 0) {
        child_fail(status_fd, "chdir into jail", errno);
    }
    return true;
}

bool set_limit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit limit;
    limit.rlim_cur = soft;
    limit.rlim_max = hard;
    return setrlimit(resource, &limit) == 0;
}

void apply_resource_limits(const ChildPlan& plan, bool in_cgroup, int status_fd) {
    const auto& profile = plan.profile;
    rlim_t cpu = static_cast<rlim_t>(profile.cpu_time_limit_seconds());

    // SIGXCPU at the soft limit, SIGKILL one second later
    if (!set_limit(RLIMIT_CPU, cpu, cpu + 1)) {
        child_fail(status_fd, "RLIMIT_CPU", errno);
    }
    // One byte of headroom lets the collector tell "exactly at the ceiling"
    // from "over it"
    rlim_t file_size = static_cast<rlim_t>(profile.max_output_bytes) + 1;
    if (!set_limit(RLIMIT_FSIZE, file_size, file_size)) {
        child_fail(status_fd, "RLIMIT_FSIZE", errno);
    }
    if (!set_limit(RLIMIT_CORE, 0, 0)) {
        child_fail(status_fd, "RLIMIT_CORE", errno);
    }
    if (!set_limit(RLIMIT_NOFILE, MAX_OPEN_FILES, MAX_OPEN_FILES)) {
        child_fail(status_fd, "RLIMIT_NOFILE", errno);
    }

    // The cgroup limits memory and process count precisely; rlimits are the
    // fallback when the job could not join one
    if (!in_cgroup) {
        if (!set_limit(RLIMIT_AS, profile.memory_limit_bytes, profile.memory_limit_bytes)) {
            child_fail(status_fd, "RLIMIT_AS", errno);
        }
        if (!set_limit(RLIMIT_NPROC, profile.max_processes, profile.max_processes)) {
            child_fail(status_fd, "RLIMIT_NPROC", errno);
        }
    }
}

void close_inherited_fds(int keep_fd) {
#ifdef SYS_close_range
    bool low_closed = keep_fd <= 3 || syscall(SYS_close_range, 3U, keep_fd - 1U, 0U) == 0;
    if (low_closed && syscall(SYS_close_range, keep_fd + 1U, ~0U, 0U) == 0) {
        return;
    }
#endif
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) {
        max_fd = 65536;
    }
    for (int fd = 3; fd < max_fd; ++fd) {
        if (fd != keep_fd) {
            close(fd);
        }
    }
}

int install_seccomp(bool network_access) {
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) {
        return -ENOMEM;
    }

    int rc = 0;
    for (int syscall_nr : DENIED_SYSCALLS) {
        // Negative numbers are syscalls this architecture does not have
        if (syscall_nr < 0) {
            continue;
        }
        rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), syscall_nr, 0);
        if (rc != 0) {
            seccomp_release(ctx);
            return rc;
        }
    }

    if (!network_access) {
        for (int family : DENIED_SOCKET_FAMILIES) {
            rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                                  SCMP_A0(SCMP_CMP_EQ, static_cast<scmp_datum_t>(family)));
            if (rc != 0) {
                seccomp_release(ctx);
                return rc;
            }
        }
    }

    rc = seccomp_load(ctx);
    seccomp_release(ctx);
    return rc;
}

[[noreturn]] void run_child(const ChildPlan& plan, int stdout_fd, int stderr_fd, int status_fd) {
    // Own process group, so one kill reaches every descendant
    setpgid(0, 0);
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0) {
        child_fail(status_fd, "PR_SET_PDEATHSIG", errno);
    }
    if (getppid() != plan.parent_pid) {
        _exit(127);
    }

    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0 ||
        dup2(devnull, STDIN_FILENO) < 0 ||
        dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(stderr_fd, STDERR_FILENO) < 0) {
        child_fail(status_fd, "redirect stdio", errno);
    }

    bool in_cgroup = false;
    if (plan.cgroup_procs_fd >= 0) {
        in_cgroup = write(plan.cgroup_procs_fd, "0", 1) == 1;
        if (!in_cgroup) {
            report(status_fd, 'W', "join cgroup", errno);
        }
    }

    bool jailed = false;
    if (plan.unshare_flags != 0) {
        if (unshare(plan.unshare_flags) != 0) {
            report(status_fd, 'W', "unshare namespaces", errno);
        } else if (plan.map_user && !write_id_maps(plan)) {
            report(status_fd, 'W', "write uid/gid map", errno);
        } else if (!plan.jail_root.empty()) {
            jailed = enter_jail(plan, status_fd);
        }
    }
    if (!jailed && chdir(plan.work_dir.c_str()) != 0) {
        child_fail(status_fd, "chdir", errno);
    }

    close_inherited_fds(status_fd);
    apply_resource_limits(plan, in_cgroup, status_fd);

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        child_fail(status_fd, "PR_SET_NO_NEW_PRIVS", errno);
    }
    if (plan.seccomp) {
        int rc = install_seccomp(plan.network_access);
        if (rc != 0) {
            child_fail(status_fd, "install seccomp filter", -rc);
        }
    }

    char* const* envp = jailed ? plan.env_jail_ptrs.data() : plan.env_host_ptrs.data();
    execve(plan.exec_path.c_str(), plan.argv_ptrs.data(), envp);
    child_fail(status_fd, "execve", errno);
}

// --- Parent side helpers ---

// Read what is available without blocking. Returns false once the writer
// side is closed (fd is closed and set to -1).
bool drain_pipe(int& fd, std::string& buffer, size_t limit, bool& truncated) {
    char chunk[PIPE_BUFFER_SIZE];
    // Bounded so a chatty script cannot starve the deadline check
    for (int round = 0; round < 256; ++round) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            size_t room = limit > buffer.size() ? limit - buffer.size() : 0;
            size_t keep = std::min(room, static_cast<size_t>(n));
            if (keep < static_cast<size_t>(n)) {
                truncated = true;
            }
            buffer.append(chunk, keep);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        close_fd(fd);
        return false;
    }
    return true;
}

std::string read_until_eof(int fd) {
    std::string content;
    char buffer[PIPE_BUFFER_SIZE];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            content.append(buffer, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    return content;
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
        throw SandboxUnavailableError(std::string("fcntl: ") + std::strerror(errno));
    }
}

void record_exit(ProcessHandle& handle, int status, const struct rusage& usage) {
    handle.reaped = true;
    handle.alive = false;
    handle.wait_status = status;
    handle.usage = usage;
}

bool try_reap(ProcessHandle& handle) {
    int status = 0;
    struct rusage usage{};
    pid_t result = wait4(handle.pid, &status, WNOHANG, &usage);
    if (result == handle.pid) {
        record_exit(handle, status, usage);
        return true;
    }
    if (result < 0 && errno != EINTR) {
        throw std::runtime_error("wait4 on pid " + std::to_string(handle.pid) + ": " +
                                 std::strerror(errno));
    }
    return false;
}

void reap_blocking(ProcessHandle& handle) {
    int status = 0;
    struct rusage usage{};
    while (true) {
        pid_t result = wait4(handle.pid, &status, 0, &usage);
        if (result == handle.pid) {
            record_exit(handle, status, usage);
            return;
        }
        if (result < 0 && errno == EINTR) {
            continue;
        }
        // Already reaped elsewhere; nothing left to wait for
        handle.reaped = true;
        handle.alive = false;
        return;
    }
}

void kill_group(ProcessHandle& handle) {
    if (handle.pid > 0) {
        ::kill(-handle.pid, SIGKILL);
        if (!handle.reaped) {
            ::kill(handle.pid, SIGKILL);
        }
    }
    if (handle.cgroup) {
        handle.cgroup->kill_all();
    }
}

// Block until nothing in the job's process group (or cgroup) is left running.
// Returns false when members survive the bound.
bool wait_group_gone(const ProcessHandle& handle, std::chrono::milliseconds bound) {
    auto deadline = Clock::now() + bound;
    while (true) {
        bool alive = false;
        if (handle.pid > 0 && (::kill(-handle.pid, 0) == 0 || errno != ESRCH)) {
            alive = true;
        }
        if (handle.cgroup && handle.cgroup->populated()) {
            alive = true;
        }
        if (!alive) {
            return true;
        }
        if (Clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

std::map<std::string, FileContent> collect_artifacts(const ProcessHandle& handle) {
    std::map<std::string, FileContent> files;
    size_t budget = handle.limits.max_output_bytes;

    // The declared output file gets the whole budget
    fs::path output_path = fs::path(handle.work_dir) / handle.output_name;
    std::error_code ec;
    auto status = fs::symlink_status(output_path, ec);
    if (!ec && fs::exists(status)) {
        try {
            // Opened relative to the workspace with O_NOFOLLOW; the existence
            // check above is only there to keep the log quiet
            files[handle.output_name] = FileUtils::read_file_in_directory(
                handle.work_dir, handle.output_name, budget);
        } catch (const std::runtime_error& e) {
            std::cerr << "[Sandbox] Ignoring output file: " << e.what() << std::endl;
        }
    }

    auto others = FileUtils::read_directory_files(
        handle.work_dir, budget, {handle.script_name, handle.output_name});
    files.insert(others.begin(), others.end());
    return files;
}

std::string detect_limit(const ProcessHandle& handle, const ExitOutcome& outcome) {
    if (handle.cgroup && handle.cgroup->oom_killed()) {
        return "memory";
    }
    if (outcome.kind != ExitKind::SIGNALED) {
        return "";
    }
    if (outcome.signal == SIGXCPU ||
        (outcome.signal == SIGKILL &&
         outcome.usage.cpu_seconds >= handle.limits.cpu_time_limit_seconds())) {
        return "cpu time";
    }
    if (outcome.signal == SIGXFSZ) {
        return "file size";
    }
    return "";
}

double seconds(const struct timeval& tv) {
    return tv.tv_sec + tv.tv_usec / 1e6;
}

} // namespace

class Sandbox::Impl {
public:
    SandboxConfig config_;
    SandboxCapabilities capabilities_;
    std::optional<std::string> interpreter_path_;
    std::string script_name_;
    bool cgroups_enabled_ = false;

    explicit Impl(const SandboxConfig& config) : config_(config) {
        capabilities_ = probe_capabilities();
        script_name_ = script_filename(config_.interpreter);

        interpreter_path_ = resolve_executable(config_.interpreter);
        if (!interpreter_path_) {
            std::cerr << "[Sandbox] Interpreter not found: " << config_.interpreter << std::endl;
        }

        if (config_.use_cgroups) {
            cgroups_enabled_ = prepare_cgroup_root();
        }

        std::cout << "[Sandbox] Ready (interpreter: " << interpreter_path_.value_or("none")
                  << ", user namespaces: " << (namespaces_usable() ? "yes" : "no")
                  << ", cgroups: " << (cgroups_enabled_ ? "yes" : "no")
                  << ", seccomp: " << (config_.use_seccomp ? "yes" : "no")
                  << ", pidfd: " << (capabilities_.pidfd ? "yes" : "no") << ")" << std::endl;
    }

    bool namespaces_usable() const {
        return config_.use_namespaces && (capabilities_.user_namespaces || geteuid() == 0);
    }

    // Create our subtree and hand the memory/pids/cpu controllers down to it
    bool prepare_cgroup_root() {
        if (!capabilities_.cgroups) {
            std::cerr << "[Sandbox] cgroup v2 not mounted; relying on rlimits" << std::endl;
            return false;
        }

        std::error_code ec;
        fs::path root(config_.cgroup_root);
        fs::create_directories(root, ec);
        if (ec) {
            std::cerr << "[Sandbox] Cannot create " << root << ": " << ec.message()
                      << "; relying on rlimits" << std::endl;
            return false;
        }

        for (const auto& dir : {root.parent_path(), root}) {
            std::ofstream control(dir / "cgroup.subtree_control");
            control << "+memory +pids +cpu";
            control.close();
        }

        std::ifstream enabled(root / "cgroup.subtree_control");
        std::string controllers((std::istreambuf_iterator<char>(enabled)),
                                std::istreambuf_iterator<char>());
        if (controllers.find("memory") == std::string::npos ||
            controllers.find("pids") == std::string::npos) {
            std::cerr << "[Sandbox] Controllers not delegated to " << root
                      << "; relying on rlimits" << std::endl;
            return false;
        }
        return true;
    }

    std::vector<MountStep> jail_mounts(const std::string& jail_root,
                                       const std::string& work_dir) const {
        std::vector<MountStep> steps;
        std::error_code ec;

        auto add_dir_chain = [&](const std::string& path) {
            fs::path current(jail_root);
            for (const auto& part : fs::path(path).relative_path()) {
                current /= part;
                steps.push_back({MountStep::MKDIR, "", current.string(), ""});
            }
        };

        steps.push_back({MountStep::TMPFS, "", jail_root,
                         "size=" + std::to_string(TMPFS_SIZE_LIMIT) + ",mode=0755"});

        for (const char* dir : SYSTEM_DIRS) {
            if (!fs::is_directory(dir, ec)) {
                continue;
            }
            steps.push_back({MountStep::MKDIR, "", jail_root + dir, ""});
            steps.push_back({MountStep::BIND_RO, dir, jail_root + dir, "", locked_mount_flags(dir)});
        }

        steps.push_back({MountStep::MKDIR, "", jail_root + "/etc", ""});
        steps.push_back({MountStep::TMPFS, "", jail_root + "/etc", "size=4m,mode=0755"});
        for (const char* entry : SAFE_ETC_ENTRIES) {
            std::string source = std::string("/etc/") + entry;
            std::string target = jail_root + source;
            auto status = fs::status(source, ec);
            if (ec || !fs::exists(status)) {
                continue;
            }
            auto kind = fs::is_directory(status) ? MountStep::MKDIR : MountStep::TOUCH;
            steps.push_back({kind, "", target, ""});
            steps.push_back({MountStep::BIND_RO, source, target, "", locked_mount_flags(source)});
        }

        steps.push_back({MountStep::MKDIR, "", jail_root + "/dev", ""});
        for (const char* device : DEVICES) {
            if (!fs::exists(device, ec)) {
                continue;
            }
            steps.push_back({MountStep::TOUCH, "", jail_root + device, ""});
            steps.push_back({MountStep::BIND_RW, device, jail_root + device, ""});
        }

        steps.push_back({MountStep::MKDIR, "", jail_root + "/tmp", ""});
        steps.push_back({MountStep::TMPFS, "", jail_root + "/tmp",
                         "size=" + std::to_string(TMPFS_SIZE_LIMIT) + ",mode=1777"});

        steps.push_back({MountStep::MKDIR, "", jail_root + JAIL_WORKDIR, ""});
        steps.push_back({MountStep::BIND_RW, work_dir, jail_root + JAIL_WORKDIR, ""});

        // Interpreters installed outside the system directories
        std::vector<std::string> extra;
        if (interpreter_path_ && !under_system_dir(*interpreter_path_)) {
            extra.push_back(fs::path(*interpreter_path_).parent_path().string());
        }
        if (config_.extra_readonly_path) {
            extra.push_back(*config_.extra_readonly_path);
        }
        for (const auto& path : extra) {
            if (!fs::is_directory(path, ec)) {
                continue;
            }
            add_dir_chain(path);
            steps.push_back({MountStep::BIND_RO, path, jail_root + path, "", locked_mount_flags(path)});
        }
        return steps;
    }

    ChildPlan build_plan(const ProcessHandle& handle, const SandboxRequest& request) const {
        ChildPlan plan;
        plan.parent_pid = getpid();
        plan.work_dir = handle.work_dir;
        plan.profile = request.profile;
        plan.seccomp = config_.use_seccomp;
        plan.network_access = request.network_access;
        plan.cgroup_procs_fd = handle.cgroup ? handle.cgroup->procs_fd() : -1;

        plan.exec_path = *interpreter_path_;
        plan.argv = {*interpreter_path_, handle.script_name};

        // Clean environment: nothing is inherited from the host
        std::vector<std::string> common = {
            std::string("PATH=") + SANDBOX_PATH,
            "LANG=C.UTF-8",
            "OUTPUT_FORMAT=" + format_extension(request.format),
            "OUTPUT_FILE=" + handle.output_name,
        };
        if (request.target_url) {
            common.push_back("TARGET_URL=" + *request.target_url);
        }
        plan.env_host = common;
        plan.env_host.push_back("HOME=" + handle.work_dir);
        plan.env_host.push_back("TMPDIR=" + handle.work_dir);
        plan.env_jail = common;
        plan.env_jail.push_back(std::string("HOME=") + JAIL_WORKDIR);
        plan.env_jail.push_back("TMPDIR=/tmp");

        if (namespaces_usable()) {
            plan.unshare_flags = CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWUTS;
            if (geteuid() != 0) {
                // Identity mapping: the script keeps our uid and loses every
                // capability at execve
                plan.unshare_flags |= CLONE_NEWUSER;
                plan.map_user = true;
                plan.uid_map = std::to_string(getuid()) + " " + std::to_string(getuid()) + " 1\n";
                plan.gid_map = std::to_string(getgid()) + " " + std::to_string(getgid()) + " 1\n";
            }
            if (!request.network_access) {
                plan.unshare_flags |= CLONE_NEWNET;
            }
            if (!handle.jail_root.empty()) {
                plan.jail_root = handle.jail_root;
                plan.mounts = jail_mounts(handle.jail_root, handle.work_dir);
            }
        }

        plan.finalize();
        return plan;
    }

    void launch(ProcessHandle& handle, const SandboxRequest& request) {
        if (!interpreter_path_) {
            throw SandboxUnavailableError("interpreter not found: " + config_.interpreter);
        }

        std::string name = "runcage-" + FileUtils::random_hex(8);
        handle.script_name = script_name_;
        handle.output_name = OutputCollector::output_filename(request.format);
        handle.work_dir = (fs::path(config_.work_root) / name).string();

        try {
            FileUtils::create_private_directory(handle.work_dir);
            FileUtils::write_file((fs::path(handle.work_dir) / handle.script_name).string(),
                                  request.script,
                                  fs::perms::owner_read | fs::perms::owner_write);
            if (namespaces_usable()) {
                handle.jail_root = handle.work_dir + ".root";
                FileUtils::create_private_directory(handle.jail_root);
            }
        } catch (const std::exception& e) {
            throw SandboxUnavailableError(std::string("working directory: ") + e.what());
        }

        if (cgroups_enabled_) {
            auto cgroup = std::make_unique<Cgroup>(config_.cgroup_root + "/" + name);
            std::string error;
            if (cgroup->create(request.profile, error)) {
                handle.cgroup = std::move(cgroup);
            } else {
                std::cerr << "[Sandbox] Job " << request.job_id << " runs without cgroup: "
                          << error << std::endl;
            }
        }

        ChildPlan plan = build_plan(handle, request);

        Pipe out;
        Pipe err;
        Pipe status;

        pid_t pid = fork();
        if (pid < 0) {
            throw SandboxUnavailableError(std::string("fork: ") + std::strerror(errno));
        }
        if (pid == 0) {
            run_child(plan, out.write_fd, err.write_fd, status.write_fd);
        }

        // Same call in the parent closes the race with the child's setpgid
        setpgid(pid, pid);

        handle.pid = pid;
        handle.id = std::to_string(pid);
        handle.alive = true;
        handle.started_at = Clock::now();

        out.close_write();
        err.close_write();
        status.close_write();
        if (handle.cgroup) {
            handle.cgroup->close_procs_fd();
        }

        // The status pipe closes at execve; anything written before is a
        // setup report from the child
        std::istringstream reports(read_until_eof(status.read_fd));
        std::string line;
        while (std::getline(reports, line)) {
            if (line.empty()) {
                continue;
            }
            if (line[0] == 'E') {
                throw SandboxUnavailableError(line.substr(1));
            }
            std::cerr << "[Sandbox] Job " << request.job_id << " degraded isolation: "
                      << line.substr(1) << std::endl;
        }

#ifdef SYS_pidfd_open
        handle.pidfd = static_cast<int>(syscall(SYS_pidfd_open, pid, 0));
#endif
        handle.stdout_fd = out.release_read();
        handle.stderr_fd = err.release_read();
        set_nonblocking(handle.stdout_fd);
        set_nonblocking(handle.stderr_fd);

        std::cout << "[Sandbox] Job " << request.job_id << " started as pid " << pid
                  << (handle.jail_root.empty() ? "" : " (jailed)")
                  << (handle.cgroup ? " (cgroup)" : "")
                  << (request.network_access ? " with network" : " without network")
                  << std::endl;
    }

    ExitOutcome wait(ProcessHandle& handle, Clock::time_point deadline, const CancelToken& cancel) {
        if (handle.pid <= 0) {
            throw std::logic_error("wait on a sandbox that never started");
        }

        ExitOutcome outcome;
        size_t stdout_limit = handle.limits.max_output_bytes;
        bool exited = handle.reaped;

        while (!exited) {
            if (cancel.is_cancelled()) {
                kill_group(handle);
                outcome.kind = ExitKind::CANCELLED;
                break;
            }
            auto now = Clock::now();
            if (now >= deadline) {
                kill_group(handle);
                outcome.kind = ExitKind::DEADLINE_EXCEEDED;
                break;
            }

            std::vector<pollfd> fds;
            for (int fd : {handle.stdout_fd, handle.stderr_fd, handle.pidfd, cancel.fd()}) {
                if (fd >= 0) {
                    fds.push_back({fd, POLLIN, 0});
                }
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            long long timeout_ms = std::min<long long>(remaining.count() + 1, 60000);
            if (handle.pidfd < 0 || cancel.fd() < 0) {
                timeout_ms = std::min<long long>(timeout_ms, FALLBACK_POLL_INTERVAL_MS);
            }

            if (poll(fds.data(), fds.size(), static_cast<int>(timeout_ms)) < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::runtime_error(std::string("poll: ") + std::strerror(errno));
            }

            if (handle.stdout_fd >= 0) {
                drain_pipe(handle.stdout_fd, handle.stdout_buffer, stdout_limit, handle.stdout_truncated);
            }
            if (handle.stderr_fd >= 0) {
                drain_pipe(handle.stderr_fd, handle.stderr_buffer, MAX_DIAGNOSTIC_SIZE,
                           handle.stderr_truncated);
            }
            exited = try_reap(handle);
        }

        if (exited) {
            // Background children must not touch the workspace while it is read
            kill_group(handle);
            if (!wait_group_gone(handle, std::chrono::milliseconds(GROUP_DRAIN_TIMEOUT_MS))) {
                std::cerr << "[Sandbox] Group of pid " << handle.pid
                          << " still has members after kill" << std::endl;
            }

            // Whatever is still buffered in the pipes belongs to this run
            if (handle.stdout_fd >= 0) {
                drain_pipe(handle.stdout_fd, handle.stdout_buffer, stdout_limit, handle.stdout_truncated);
            }
            if (handle.stderr_fd >= 0) {
                drain_pipe(handle.stderr_fd, handle.stderr_buffer, MAX_DIAGNOSTIC_SIZE,
                           handle.stderr_truncated);
            }

            if (WIFSIGNALED(handle.wait_status)) {
                outcome.kind = ExitKind::SIGNALED;
                outcome.signal = WTERMSIG(handle.wait_status);
            } else {
                outcome.kind = ExitKind::EXITED;
                outcome.exit_code = WEXITSTATUS(handle.wait_status);
            }

            outcome.usage.cpu_seconds = seconds(handle.usage.ru_utime) + seconds(handle.usage.ru_stime);
            outcome.usage.peak_memory_bytes = static_cast<size_t>(handle.usage.ru_maxrss) * 1024;
            if (handle.cgroup) {
                outcome.usage.peak_memory_bytes =
                    std::max(outcome.usage.peak_memory_bytes, handle.cgroup->peak_memory());
            }
            outcome.limit_exceeded = detect_limit(handle, outcome);
            outcome.files = collect_artifacts(handle);
        }

        outcome.stdout_data = handle.stdout_buffer;
        outcome.stdout_truncated = handle.stdout_truncated;
        outcome.stderr_data = handle.stderr_buffer;
        outcome.stderr_truncated = handle.stderr_truncated;
        outcome.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - handle.started_at);
        return outcome;
    }

    void destroy(ProcessHandle& handle) {
        if (handle.pid > 0) {
            kill_group(handle);
            if (!handle.reaped) {
                reap_blocking(handle);
            }
        } else if (handle.cgroup) {
            handle.cgroup->kill_all();
        }

        if (handle.cgroup) {
            if (!handle.cgroup->remove()) {
                std::cerr << "[Sandbox] Failed to remove cgroup " << handle.cgroup->path() << std::endl;
            }
            handle.cgroup.reset();
        }

        close_fd(handle.stdout_fd);
        close_fd(handle.stderr_fd);
        close_fd(handle.pidfd);

        for (const auto* dir : {&handle.work_dir, &handle.jail_root}) {
            if (!dir->empty() && !FileUtils::remove_directory(*dir)) {
                std::cerr << "[Sandbox] Failed to remove " << *dir << std::endl;
            }
        }
    }
};

Sandbox::Sandbox(const SandboxConfig& config) : impl(std::make_unique<Impl>(config)) {}

Sandbox::~Sandbox() = default;

std::unique_ptr<SandboxHandle> Sandbox::start(const SandboxRequest& request) {
    auto handle = std::make_unique<ProcessHandle>();
    handle->limits = request.profile;
    handle->started_at = Clock::now();

    try {
        impl->launch(*handle, request);
    } catch (const SandboxUnavailableError&) {
        destroy(*handle);
        throw;
    } catch (const std::exception& e) {
        destroy(*handle);
        throw SandboxUnavailableError(e.what());
    }
    return handle;
}

ExitOutcome Sandbox::wait(SandboxHandle& handle, Clock::time_point deadline, const CancelToken& cancel) {
    return impl->wait(as_process(handle), deadline, cancel);
}

void Sandbox::destroy(SandboxHandle& handle) noexcept {
    if (handle.destroyed) {
        return;
    }
    auto* process = dynamic_cast<ProcessHandle*>(&handle);
    if (process) {
        try {
            impl->destroy(*process);
        } catch (const std::exception& e) {
            std::cerr << "[Sandbox] Cleanup of " << handle.id << " failed: " << e.what() << std::endl;
        }
    }
    handle.alive = false;
    handle.destroyed = true;
}

const SandboxConfig& Sandbox::config() const {
    return impl->config_;
}

SandboxCapabilities Sandbox::probe_capabilities() {
    SandboxCapabilities caps;

    // Try an unprivileged user namespace in a throwaway child
    pid_t pid = fork();
    if (pid == 0) {
        _exit(unshare(CLONE_NEWUSER) == 0 ? 0 : 1);
    } else if (pid > 0) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        caps.user_namespaces = WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }

    caps.cgroups = access("/sys/fs/cgroup/cgroup.controllers", R_OK) == 0;
    caps.seccomp = prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;

#ifdef SYS_pidfd_open
    int pidfd = static_cast<int>(syscall(SYS_pidfd_open, getpid(), 0));
    if (pidfd >= 0) {
        caps.pidfd = true;
        close(pidfd);
    }
#endif
    return caps;
}

std::string Sandbox::script_filename(const std::string& interpreter) {
    std::string name = fs::path(interpreter).filename().string();
    if (name.rfind("python", 0) == 0) return "script.py";
    if (name == "node" || name == "nodejs") return "script.js";
    if (name == "sh" || name == "bash" || name == "dash") return "script.sh";
    if (name == "ruby") return "script.rb";
    if (name == "perl") return "script.pl";
    return "script";
}

} // namespace runcage
