#pragma once

#include <cstddef>  // for size_t

namespace runcage {

// Memory limits
constexpr size_t DEFAULT_MEMORY_LIMIT_BYTES = 256 * 1024 * 1024;  // 256MB
constexpr size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;              // 10MB max output
constexpr size_t MAX_SCRIPT_SIZE = 100 * 1000;                   // 100KB max script text
constexpr size_t TMPFS_SIZE_LIMIT = 64 * 1024 * 1024;            // 64MB jail /tmp
constexpr size_t MAX_DIAGNOSTIC_SIZE = 64 * 1024;                // 64KB of stderr kept

// Time limits
constexpr double DEFAULT_CPU_SHARE = 1.0;                         // One full core
constexpr size_t DEFAULT_CPU_PERIOD_US = 100 * 1000;             // cgroup cpu.max period
constexpr int DEFAULT_TIMEOUT_SECONDS = 300;                      // 5 minutes
constexpr int HARD_TIMEOUT_CEILING_SECONDS = 600;                 // No tenant may exceed 10 minutes
constexpr int JOB_RETENTION_SECONDS = 60;                         // Keep terminal records for 1 minute
constexpr int ENFORCEMENT_SLACK_MS = 500;                         // Kill + reap budget after deadline
constexpr int GROUP_DRAIN_TIMEOUT_MS = 1000;                      // Wait for leftover members before collecting

// Premium tier profile
constexpr double PREMIUM_CPU_SHARE = 2.0;
constexpr size_t PREMIUM_MEMORY_LIMIT_BYTES = 512 * 1024 * 1024;  // 512MB
constexpr int PREMIUM_TIMEOUT_SECONDS = 600;

// Process limits
constexpr int MAX_PROCESSES_PER_JOB = 32;                        // Max threads/processes
constexpr int MAX_OPEN_FILES = 256;                              // Max file descriptors

// Dispatcher
constexpr int DEFAULT_POOL_SIZE = 4;                             // Concurrent sandboxes
constexpr size_t DEFAULT_QUEUE_CAPACITY = 256;                   // Ready queue bound

// Tenant quota
constexpr int MAX_ACTIVE_JOBS_PER_TENANT = 4;                    // Queued + running
constexpr int MAX_JOBS_PER_HOUR = 60;                            // Hourly submission limit
constexpr int PREMIUM_ACTIVE_JOBS_PER_TENANT = 16;
constexpr int PREMIUM_JOBS_PER_HOUR = 600;
constexpr double CPU_SECONDS_PER_MINUTE = 0.0;                   // 0 disables the CPU budget
constexpr int QUOTA_CLEANUP_MINUTES = 60;                        // Forget idle tenants

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr int FALLBACK_POLL_INTERVAL_MS = 100;                   // Used when pidfd is unavailable

} // namespace runcage
