#include "application/execution/ExecutorSupport.hpp"
#include <chrono>
#include <ctime>
#include <iostream>

namespace polyglot::application::execution {

using domain::ProcessOutcome;
using json = nlohmann::json;

std::string CurrentTimestampUtc() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm gmt{};
    gmtime_r(&tt, &gmt);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &gmt);
    return buffer;
}

std::string DescribeCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

domain::ProcessRequest MakeRequest(std::vector<std::string> argv, const ExecutionSettings& settings,
                                   const std::string& workingDirectory) {
    domain::ProcessRequest request;
    request.argv = std::move(argv);
    request.workingDirectory = workingDirectory;
    request.timeout = settings.timeout;
    return request;
}

json FailureDetails(const ProcessOutcome& outcome) {
    switch (outcome.kind) {
        case ProcessOutcome::Kind::TimedOut:
            return {{"reason", "timeout"}, {"code", -1}, {"output", outcome.output}};
        case ProcessOutcome::Kind::LaunchFailed:
            return {{"reason", "launch_failed"}, {"code", -1}, {"output", outcome.error}};
        case ProcessOutcome::Kind::ToolAbsent:
            return {{"reason", "tool_absent"}, {"code", -1}, {"output", outcome.error}};
        case ProcessOutcome::Kind::Completed:
            break;
    }
    return {{"code", outcome.exitCode}, {"output", outcome.output}};
}

json UnitDetails(const ProcessOutcome& outcome) {
    if (outcome.succeeded()) {
        return {{"ok", true}, {"output", outcome.output}};
    }
    json j = FailureDetails(outcome);
    j["ok"] = false;
    return j;
}

domain::ExecutionResult TranspileFailure(const std::string& executor, const domain::transpile::TranspileResult& result) {
    json details = {{"reason", "transpile_failed"}};
    if (result.error) {
        details["error"] = result.error->code;
        details["output"] = result.error->message;
    }
    std::cerr << "[" << executor << "] Transpile failed: " << details.value("error", std::string("unknown")) << std::endl;
    return domain::ExecutionResult::Failure(executor, details);
}

domain::ExecutionResult ExceptionFailure(const std::string& executor, const std::exception& e) {
    std::cerr << "[" << executor << "] Execution error: " << e.what() << std::endl;
    return domain::ExecutionResult::Failure(executor, {{"code", -1}, {"output", e.what()}});
}

} // namespace polyglot::application::execution
