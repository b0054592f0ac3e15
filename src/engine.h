#pragma once

#include <string>
#include <memory>
#include <optional>
#include "types.h"
#include "engine_config.h"
#include "dispatcher.h"
#include "event_stream.h"
#include "profile_resolver.h"
#include "tenant_quota.h"
#include "persistence.h"
#include "sandbox_runner.h"

namespace runcage {

// Narrow submit/poll/cancel surface over one independent engine instance.
// Owns the sandbox runner, tenant accounting and the dispatcher; nothing is
// global, so tests can build as many engines as they like.
class ExecutionEngine {
public:
    // Production engine with the Linux sandbox
    explicit ExecutionEngine(const EngineConfig& config);

    // Engine over any runner (tests use a fake one). A null sink falls back
    // to config.events_log, if set.
    ExecutionEngine(const EngineConfig& config,
                    std::shared_ptr<SandboxRunner> runner,
                    std::shared_ptr<PersistenceSink> sink = nullptr);

    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    std::string submit(const std::string& script_text,
                       const std::string& tenant_id,
                       OutputFormat format,
                       const std::optional<ResourceOverrides>& overrides = std::nullopt);

    // Full request (caller-chosen id, target URL). A caller-chosen id only has
    // to be free among records still held, see Dispatcher::submit.
    std::string submit(ExecutionJob job);

    std::optional<JobStatus> get_status(const std::string& job_id) const;
    bool cancel(const std::string& job_id);

    // nullopt for unknown or purged jobs
    std::optional<EventStream> stream_events(const std::string& job_id) const;

    TenantQuota::QuotaInfo quota_info(const std::string& tenant_id);

    size_t queued_count() const { return dispatcher_->queued_count(); }
    size_t active_count() const { return dispatcher_->active_count(); }

    void shutdown();

    const EngineConfig& config() const { return config_; }

private:
    void apply_tenants();

    EngineConfig config_;
    std::shared_ptr<SandboxRunner> runner_;
    std::shared_ptr<PersistenceSink> sink_;
    StaticProfileResolver resolver_;
    TenantQuota quota_;
    std::unique_ptr<Dispatcher> dispatcher_;
};

} // namespace runcage
