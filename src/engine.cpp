#include "engine.h"
#include "sandbox.h"
#include <iostream>

namespace runcage {

namespace {

std::shared_ptr<PersistenceSink> open_sink(const EngineConfig& config,
                                           std::shared_ptr<PersistenceSink> sink) {
    if (sink || !config.events_log) {
        return sink;
    }
    std::cout << "[Engine] Recording events to " << *config.events_log << std::endl;
    return std::make_shared<JsonLinesSink>(*config.events_log);
}

} // namespace

ExecutionEngine::ExecutionEngine(const EngineConfig& config)
    : ExecutionEngine(config, std::make_shared<Sandbox>(config.sandbox)) {}

ExecutionEngine::ExecutionEngine(const EngineConfig& config,
                                 std::shared_ptr<SandboxRunner> runner,
                                 std::shared_ptr<PersistenceSink> sink)
    : config_(config),
      runner_(std::move(runner)),
      sink_(open_sink(config, std::move(sink))),
      resolver_(config.default_profile, config.hard_ceiling),
      quota_(config.tenant_limits) {
    config_.validate();
    if (!runner_) {
        throw std::invalid_argument("ExecutionEngine requires a sandbox runner");
    }

    resolver_.set_premium_profile(config_.premium_profile);
    apply_tenants();

    dispatcher_ = std::make_unique<Dispatcher>(config_.dispatcher, *runner_, resolver_, quota_, sink_);

    std::cout << "[Engine] Ready: pool " << config_.dispatcher.pool_size
              << ", default timeout " << config_.default_profile.wall_clock_timeout.count() / 1000 << "s"
              << ", hard ceiling " << config_.hard_ceiling.count() / 1000 << "s"
              << ", " << config_.tenants.size() << " configured tenants" << std::endl;
}

ExecutionEngine::~ExecutionEngine() {
    shutdown();
}

void ExecutionEngine::apply_tenants() {
    for (const auto& entry : config_.tenants) {
        const std::string& tenant_id = entry.first;
        const TenantConfig& tenant = entry.second;

        resolver_.set_premium(tenant_id, tenant.premium);
        quota_.set_premium(tenant_id, tenant.premium);
        if (tenant.profile) {
            resolver_.set_tenant_profile(tenant_id, *tenant.profile);
        }
        if (tenant.limits) {
            quota_.set_tenant_limits(tenant_id, *tenant.limits);
        }
    }
}

std::string ExecutionEngine::submit(const std::string& script_text,
                                    const std::string& tenant_id,
                                    OutputFormat format,
                                    const std::optional<ResourceOverrides>& overrides) {
    ExecutionJob job;
    job.tenant_id = tenant_id;
    job.script = script_text;
    job.format = format;
    if (overrides) {
        job.overrides = *overrides;
    }
    return dispatcher_->submit(std::move(job));
}

std::string ExecutionEngine::submit(ExecutionJob job) {
    return dispatcher_->submit(std::move(job));
}

std::optional<JobStatus> ExecutionEngine::get_status(const std::string& job_id) const {
    return dispatcher_->status(job_id);
}

bool ExecutionEngine::cancel(const std::string& job_id) {
    return dispatcher_->cancel(job_id);
}

std::optional<EventStream> ExecutionEngine::stream_events(const std::string& job_id) const {
    auto log = dispatcher_->events(job_id);
    if (!log) {
        return std::nullopt;
    }
    return EventStream(log);
}

TenantQuota::QuotaInfo ExecutionEngine::quota_info(const std::string& tenant_id) {
    return quota_.check_quota(tenant_id);
}

void ExecutionEngine::shutdown() {
    if (dispatcher_) {
        dispatcher_->shutdown();
    }
}

} // namespace runcage
