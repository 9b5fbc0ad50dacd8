/**
 * @file ProcessRunner.hpp
 * @brief Interface for launching external tools as child processes.
 */

#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace polyglot::domain {

/**
 * @struct ProcessRequest
 * @brief One child process invocation. argv[0] is looked up on PATH.
 */
struct ProcessRequest {
    std::vector<std::string> argv;
    std::string workingDirectory;                  ///< Empty: inherit.
    std::optional<std::string> standardInput;      ///< Piped then closed; nullopt: /dev/null.
    std::map<std::string, std::string> environment; ///< Added to the inherited environment.
    std::chrono::milliseconds timeout{300000};
};

/**
 * @struct ProcessOutcome
 * @brief Result of a run. Output holds stdout and stderr interleaved.
 */
struct ProcessOutcome {
    enum class Kind {
        ToolAbsent,
        Completed,
        TimedOut,
        LaunchFailed
    };

    Kind kind = Kind::LaunchFailed;
    int exitCode = -1;
    std::string output;
    std::string error;    ///< Launch failure description.

    bool succeeded() const { return kind == Kind::Completed && exitCode == 0; }
};

/**
 * @class ProcessRunner
 * @brief Abstract interface so executors can be exercised without real tools.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /** @brief Absolute path of the tool on PATH, or nullopt. */
    virtual std::optional<std::string> findExecutable(const std::string& tool) = 0;

    /**
     * @brief Runs the request to completion or timeout.
     * Never throws; failures are reported through ProcessOutcome::kind.
     */
    virtual ProcessOutcome run(const ProcessRequest& request) = 0;
};

} // namespace polyglot::domain
