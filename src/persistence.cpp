#include "persistence.h"
#include <stdexcept>

namespace runcage {

JsonLinesSink::JsonLinesSink(const std::string& path) : path_(path) {
    out_.open(path, std::ios::out | std::ios::app);
    if (!out_) {
        throw std::runtime_error("Cannot open event log for appending: " + path);
    }
    writer_["indentation"] = "";
}

void JsonLinesSink::record_event(const LifecycleEvent& event) {
    Json::Value line;
    line["type"] = "event";
    line["event"] = to_json(event);
    write_line(line);
}

void JsonLinesSink::record_result(const std::string& job_id,
                                  const std::string& tenant_id,
                                  const std::string& script_sha256,
                                  const ExecutionResult& result) {
    Json::Value line;
    line["type"] = "result";
    line["job_id"] = job_id;
    line["tenant_id"] = tenant_id;
    line["script_sha256"] = script_sha256;
    line["result"] = to_json(result);
    write_line(line);
}

void JsonLinesSink::write_line(const Json::Value& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << Json::writeString(writer_, value) << '\n';
    out_.flush();
    if (!out_) {
        out_.clear();
        throw std::runtime_error("Failed to write event log: " + path_);
    }
}

} // namespace runcage
