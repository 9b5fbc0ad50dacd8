/**
 * @file ExecutionResult.hpp
 * @brief Tagged outcome of running a document through its executor.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace polyglot::domain {

/**
 * @struct ExecutionResult
 * @brief ok plus a target-specific details payload.
 *
 * Failures carry {code, output} or {reason} in details; mocked runs carry
 * "mock": true.
 */
struct ExecutionResult {
    bool ok = false;
    std::string executor;          ///< "docker", "terraform", ... "noop"
    nlohmann::json details = nlohmann::json::object();

    static ExecutionResult Success(const std::string& executor, nlohmann::json details) {
        return ExecutionResult{true, executor, std::move(details)};
    }

    static ExecutionResult Failure(const std::string& executor, nlohmann::json details) {
        return ExecutionResult{false, executor, std::move(details)};
    }

    nlohmann::json toJson() const {
        nlohmann::json j = details;
        j["ok"] = ok;
        j["executor"] = executor;
        return j;
    }

    /** @brief JSON text; bytes that are not UTF-8 (raw tool output) become U+FFFD. */
    std::string serialize(int indent = -1) const {
        return toJson().dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
    }
};

} // namespace polyglot::domain
