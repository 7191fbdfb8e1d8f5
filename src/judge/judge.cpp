#include "judge/judge.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "judge/sanitizer.hpp"
#include "language/language.hpp"

namespace sandbox {
using namespace std;

void to_json(nlohmann::json &j, const execution_result &result) {
    j = {{"success", result.success},
         {"output", result.output},
         {"error", nullptr},
         {"execution_time_ms", result.execution_time_ms},
         {"memory_usage_mb", nullptr},
         {"status", get_display_message(result.status)}};
    if (result.error) j["error"] = *result.error;
    if (result.memory_usage_mb) j["memory_usage_mb"] = *result.memory_usage_mb;
}

judge::judge(const sandbox_config &config, const sandbox_capabilities &capabilities)
    : config(config), strategy(make_executor(config, capabilities)) {}

judge::judge(const sandbox_config &config, unique_ptr<executor> &&strategy)
    : config(config), strategy(move(strategy)) {}

string judge::strategy_name() const {
    return strategy->name();
}

const sandbox_config &judge::get_config() const {
    return config;
}

execution_result judge::reject(sandbox::status stat, const string &message) const {
    execution_result result;
    result.success = false;
    result.status = stat;
    result.error = truncate_utf8(message, config.max_output_chars);
    result.execution_time_ms = 0;
    return result;
}

execution_result judge::normalize(const raw_run_outcome &outcome) const {
    execution_result result;
    result.output = trim_copy(truncate_utf8(outcome.stdout_data, config.max_output_chars));
    result.execution_time_ms = outcome.elapsed_ms;
    if (outcome.memory_mb > 0) result.memory_usage_mb = outcome.memory_mb;

    string stderr_text = trim_copy(truncate_utf8(outcome.stderr_data, config.max_output_chars));

    if (outcome.timed_out) {
        result.status = status::TIME_LIMIT_EXCEEDED;
        result.error = fmt::format("Time limit exceeded: execution exceeded the {}s limit", config.timeout_seconds);
    } else if (outcome.memory_exceeded) {
        result.status = status::MEMORY_LIMIT_EXCEEDED;
        result.error = fmt::format("Memory limit exceeded: execution exceeded the {}MB limit", config.memory_limit_mb);
    } else if (outcome.exit_code == 0) {
        result.status = status::COMPLETED;
        result.success = true;
        if (!stderr_text.empty()) result.error = stderr_text;
    } else {
        result.status = status::RUNTIME_ERROR;
        if (!stderr_text.empty())
            result.error = stderr_text;
        else
            result.error = fmt::format("Process exited with code {}", outcome.exit_code);
    }
    return result;
}

execution_result judge::execute(const execution_request &request) {
    auto lang = parse_language(request.language);
    if (!lang)
        return reject(status::UNSUPPORTED_LANGUAGE, fmt::format("Unsupported language: {}. Supported languages: {}", request.language, supported_language_list()));

    try {
        sanitize_result check = sanitize(request.code, *lang, config.max_source_bytes);
        if (!check.ok)
            return reject(status::SECURITY_VIOLATION, "Security violation: " + check.finding->message);

        DLOG(INFO) << "executing " << to_string(*lang) << " code with " << strategy->name() << " executor";
        return normalize(strategy->run(request.code, *lang, request.stdin_data));
    } catch (compilation_error &ex) {
        execution_result result;
        result.status = status::COMPILATION_ERROR;
        string log = trim_copy(ex.error_log);
        result.error = truncate_utf8("Compilation error:\n" + (log.empty() ? string(ex.what()) : log), config.max_output_chars);
        result.execution_time_ms = ex.elapsed_ms;
        return result;
    } catch (infrastructure_error &ex) {
        LOG(ERROR) << "execution environment failure: " << ex;
        return reject(status::SYSTEM_ERROR, fmt::format("Execution environment error: {}", ex.what()));
    } catch (exception &ex) {
        LOG(ERROR) << "unexpected failure while executing code: " << boost::diagnostic_information(ex);
        return reject(status::SYSTEM_ERROR, fmt::format("Internal error: {}", ex.what()));
    }
}

}  // namespace sandbox
