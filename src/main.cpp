/*
 * runcage - Sandboxed script execution engine
 * Runs one script through an engine instance and reports its terminal result
 */

#include "engine.h"
#include "engine_config.h"
#include "file_utils.h"
#include <json/json.h>
#include <iostream>
#include <string>
#include <cstdlib>
#include <csignal>
#include <signal.h>

using namespace runcage;

namespace {

volatile sig_atomic_t interrupted = 0;

void on_interrupt(int) {
    interrupted = 1;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <script>\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>        Engine configuration (JSON)\n"
              << "  --tenant <id>          Tenant the job runs for (default: cli)\n"
              << "  --format <fmt>         csv, json or xml (default: csv)\n"
              << "  --url <url>            Target URL passed to the script\n"
              << "  --timeout <seconds>    Wall-clock timeout override\n"
              << "  --memory-mb <mb>       Memory ceiling override\n"
              << "  --interpreter <name>   Interpreter for the script (default: python3)\n"
              << "  --work-root <dir>      Parent directory for job working directories\n"
              << "  --help                 Show this message\n"
              << "\n"
              << "Exit status: 0 success, 2 partial output, 1 failure, 124 timed out, 130 cancelled"
              << std::endl;
}

int exit_code_for(const ExecutionResult& result) {
    if (std::holds_alternative<SuccessResult>(result)) return 0;
    if (std::holds_alternative<PartialOutputResult>(result)) return 2;
    if (std::holds_alternative<TimedOutResult>(result)) return 124;
    if (std::holds_alternative<CancelledResult>(result)) return 130;
    return 1;
}

bool parse_positive(const std::string& text, long& out) {
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || value <= 0) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string tenant_id = "cli";
    std::string format_name = "csv";
    std::optional<std::string> target_url;
    std::optional<long> timeout_seconds;
    std::optional<long> memory_mb;
    std::optional<std::string> interpreter;
    std::optional<std::string> work_root;
    std::string script_path;

    // Parse command line
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        long number = 0;

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && has_value) {
            config_file = argv[++i];
        } else if (arg == "--tenant" && has_value) {
            tenant_id = argv[++i];
        } else if (arg == "--format" && has_value) {
            format_name = argv[++i];
        } else if (arg == "--url" && has_value) {
            target_url = argv[++i];
        } else if (arg == "--timeout" && has_value) {
            if (!parse_positive(argv[++i], number)) {
                std::cerr << "--timeout expects a positive number of seconds" << std::endl;
                return 1;
            }
            timeout_seconds = number;
        } else if (arg == "--memory-mb" && has_value) {
            if (!parse_positive(argv[++i], number)) {
                std::cerr << "--memory-mb expects a positive number" << std::endl;
                return 1;
            }
            memory_mb = number;
        } else if (arg == "--interpreter" && has_value) {
            interpreter = argv[++i];
        } else if (arg == "--work-root" && has_value) {
            work_root = argv[++i];
        } else if (!arg.empty() && arg[0] != '-' && script_path.empty()) {
            script_path = arg;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (script_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto format = parse_output_format(format_name);
    if (!format) {
        std::cerr << "Unknown output format: " << format_name << std::endl;
        return 1;
    }

    EngineConfig config;
    try {
        if (!config_file.empty()) {
            config = EngineConfig::from_file(config_file);
        }
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    if (interpreter) config.sandbox.interpreter = *interpreter;
    if (work_root) config.sandbox.work_root = *work_root;
    // A single CLI run needs one slot
    config.dispatcher.pool_size = 1;

    ExecutionJob job;
    job.tenant_id = tenant_id;
    job.format = *format;
    job.target_url = target_url;
    if (timeout_seconds) {
        job.overrides.wall_clock_timeout = std::chrono::seconds(*timeout_seconds);
    }
    if (memory_mb) {
        job.overrides.memory_limit_bytes = static_cast<size_t>(*memory_mb) * 1024 * 1024;
    }

    try {
        FileContent script = FileUtils::read_file_bounded(script_path, config.dispatcher.max_script_bytes);
        if (script.truncated) {
            std::cerr << "Script exceeds " << config.dispatcher.max_script_bytes << " bytes" << std::endl;
            return 1;
        }
        job.script = script.data;
    } catch (const std::exception& e) {
        std::cerr << "Cannot read script: " << e.what() << std::endl;
        return 1;
    }

    struct sigaction action{};
    action.sa_handler = on_interrupt;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::cout << "runcage - sandboxed script execution" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    int status_code = 1;
    try {
        ExecutionEngine engine(config);

        std::string job_id;
        try {
            job_id = engine.submit(std::move(job));
        } catch (const SubmissionError& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }

        auto stream = engine.stream_events(job_id);
        bool cancel_sent = false;
        Json::StreamWriterBuilder compact;
        compact["indentation"] = "";

        while (stream && !stream->finished()) {
            if (interrupted && !cancel_sent) {
                cancel_sent = true;
                std::cout << "Interrupted, cancelling job " << job_id << std::endl;
                engine.cancel(job_id);
            }
            auto event = stream->next_for(std::chrono::milliseconds(200));
            if (event) {
                std::cout << "[Event] " << Json::writeString(compact, to_json(*event)) << std::endl;
            }
        }

        auto status = engine.get_status(job_id);
        if (!status || !status->result) {
            std::cerr << "Job " << job_id << " has no result" << std::endl;
            return 1;
        }

        std::cout << "------------------------------------------------" << std::endl;
        Json::StreamWriterBuilder pretty;
        std::cout << Json::writeString(pretty, to_json(*status)) << std::endl;
        std::cout << describe(*status->result) << std::endl;

        status_code = exit_code_for(*status->result);
        engine.shutdown();
    } catch (const std::exception& e) {
        std::cerr << "Engine error: " << e.what() << std::endl;
        return 1;
    }

    return status_code;
}
