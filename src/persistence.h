#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <json/json.h>
#include "event_stream.h"
#include "execution_result.h"

namespace runcage {

// Collaborator that stores lifecycle events and terminal results. The engine
// calls it once per event and once per result and never retries; a sink that
// needs durability retries on its own.
class PersistenceSink {
public:
    virtual ~PersistenceSink() = default;

    virtual void record_event(const LifecycleEvent& event) = 0;
    virtual void record_result(const std::string& job_id,
                               const std::string& tenant_id,
                               const std::string& script_sha256,
                               const ExecutionResult& result) = 0;
};

// Appends one JSON object per line to a file
class JsonLinesSink : public PersistenceSink {
public:
    // Throws std::runtime_error if the file cannot be opened for appending
    explicit JsonLinesSink(const std::string& path);

    void record_event(const LifecycleEvent& event) override;
    void record_result(const std::string& job_id,
                       const std::string& tenant_id,
                       const std::string& script_sha256,
                       const ExecutionResult& result) override;

private:
    void write_line(const Json::Value& value);

    std::string path_;
    std::mutex mutex_;
    std::ofstream out_;
    Json::StreamWriterBuilder writer_;
};

} // namespace runcage
