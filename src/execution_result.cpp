#include "execution_result.h"
#include <sstream>
#include <iomanip>

namespace runcage {

namespace {

// Lambda-overload helper for std::visit
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string format_seconds(std::chrono::milliseconds duration) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << duration.count() / 1000.0 << "s";
    return out.str();
}

Json::Value usage_json(const UsageStats& usage) {
    Json::Value json;
    json["cpu_seconds"] = usage.cpu_seconds;
    json["peak_memory_bytes"] = static_cast<Json::UInt64>(usage.peak_memory_bytes);
    return json;
}

Json::Value pairs_json(const std::vector<std::pair<std::string, std::string>>& pairs) {
    // Arrays of [name, value] keep the source order
    Json::Value json(Json::arrayValue);
    for (const auto& [name, value] : pairs) {
        Json::Value pair(Json::arrayValue);
        pair.append(name);
        pair.append(value);
        json.append(pair);
    }
    return json;
}

} // namespace

std::string to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::SANDBOX_UNAVAILABLE: return "SandboxUnavailable";
        case FailureKind::SCRIPT_ERROR: return "ScriptError";
        case FailureKind::INTERNAL_ERROR: return "InternalError";
    }
    return "unknown";
}

std::string result_kind(const ExecutionResult& result) {
    return std::visit(overloaded{
        [](const SuccessResult&) { return std::string("success"); },
        [](const PartialOutputResult&) { return std::string("partial_output"); },
        [](const FailureResult&) { return std::string("failure"); },
        [](const TimedOutResult&) { return std::string("timed_out"); },
        [](const CancelledResult&) { return std::string("cancelled"); },
    }, result);
}

std::string describe(const ExecutionResult& result) {
    return std::visit(overloaded{
        [](const SuccessResult& r) {
            return "Completed in " + format_seconds(r.duration) + " with " +
                   std::to_string(r.output.record_count()) + " " + to_string(r.output.format) +
                   " record(s) from " + r.output.source;
        },
        [](const PartialOutputResult& r) {
            return "Script succeeded but output is " + to_string(r.reason) + ": " + r.message;
        },
        [](const FailureResult& r) {
            std::string text = to_string(r.kind) + ": " + r.message;
            if (r.exit_code) {
                text += " (exit code " + std::to_string(*r.exit_code) + ")";
            }
            return text;
        },
        [](const TimedOutResult& r) {
            return "Timed out after " + format_seconds(r.duration) + "; output discarded";
        },
        [](const CancelledResult&) {
            return std::string("Cancelled before completion");
        },
    }, result);
}

Json::Value to_json(const CollectedOutput& output) {
    Json::Value json;
    json["format"] = to_string(output.format);
    json["source"] = output.source;
    json["record_count"] = static_cast<Json::UInt64>(output.record_count());

    if (const auto* table = std::get_if<TabularOutput>(&output.data)) {
        Json::Value columns(Json::arrayValue);
        for (const auto& column : table->columns) {
            columns.append(column);
        }
        Json::Value rows(Json::arrayValue);
        for (const auto& row : table->rows) {
            Json::Value values(Json::arrayValue);
            for (const auto& value : row) {
                values.append(value);
            }
            rows.append(values);
        }
        json["columns"] = columns;
        json["rows"] = rows;
    } else if (const auto* document = std::get_if<DocumentOutput>(&output.data)) {
        json["document"] = document->root;
    } else if (const auto* markup = std::get_if<MarkupOutput>(&output.data)) {
        json["root"] = markup->root_tag;
        Json::Value records(Json::arrayValue);
        for (const auto& record : markup->records) {
            Json::Value item;
            item["tag"] = record.tag;
            item["attributes"] = pairs_json(record.attributes);
            item["fields"] = pairs_json(record.fields);
            records.append(item);
        }
        json["records"] = records;
    }
    return json;
}

Json::Value to_json(const ExecutionResult& result) {
    Json::Value json;
    json["kind"] = result_kind(result);
    json["message"] = describe(result);

    std::visit(overloaded{
        [&json](const SuccessResult& r) {
            json["duration_ms"] = static_cast<Json::Int64>(r.duration.count());
            json["usage"] = usage_json(r.usage);
            json["output"] = to_json(r.output);
        },
        [&json](const PartialOutputResult& r) {
            json["duration_ms"] = static_cast<Json::Int64>(r.duration.count());
            json["usage"] = usage_json(r.usage);
            json["reason"] = to_string(r.reason);
            json["output"] = r.output;
        },
        [&json](const FailureResult& r) {
            json["failure_kind"] = to_string(r.kind);
            json["exit_code"] = r.exit_code ? Json::Value(*r.exit_code) : Json::Value();
            json["diagnostics"] = r.diagnostics;
            json["usage"] = usage_json(r.usage);
        },
        [&json](const TimedOutResult& r) {
            json["duration_ms"] = static_cast<Json::Int64>(r.duration.count());
        },
        [](const CancelledResult&) {},
    }, result);

    return json;
}

} // namespace runcage
