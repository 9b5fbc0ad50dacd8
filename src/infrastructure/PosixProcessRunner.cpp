/**
 * @file PosixProcessRunner.cpp
 * @brief Implementation of PosixProcessRunner.
 */

#include "infrastructure/PosixProcessRunner.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace polyglot::infrastructure {

namespace fs = std::filesystem;
using domain::ProcessOutcome;
using domain::ProcessRequest;
using Clock = std::chrono::steady_clock;

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool isExecutableFile(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        const auto eq = entry.find('=');
        const std::string key = entry.substr(0, eq);
        if (overrides.count(key)) continue;
        env.push_back(std::move(entry));
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> toCharArray(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

int remainingMs(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

ProcessOutcome launchFailure(const std::string& message) {
    ProcessOutcome outcome;
    outcome.kind = ProcessOutcome::Kind::LaunchFailed;
    outcome.exitCode = -1;
    outcome.error = message;
    return outcome;
}

} // namespace

PosixProcessRunner::PosixProcessRunner() {
    // Writes to a child that exited early must fail with EPIPE, not kill us.
    std::signal(SIGPIPE, SIG_IGN);
}

std::optional<std::string> PosixProcessRunner::findExecutable(const std::string& tool) {
    if (tool.empty()) return std::nullopt;
    if (tool.find('/') != std::string::npos) {
        if (isExecutableFile(tool)) return tool;
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    const std::string searchPath = (pathEnv && *pathEnv) ? pathEnv : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= searchPath.size()) {
        size_t end = searchPath.find(':', start);
        if (end == std::string::npos) end = searchPath.size();
        const std::string dir = searchPath.substr(start, end - start);
        const fs::path candidate = fs::path(dir.empty() ? "." : dir) / tool;
        if (isExecutableFile(candidate)) return candidate.string();
        start = end + 1;
    }
    return std::nullopt;
}

ProcessOutcome PosixProcessRunner::run(const ProcessRequest& request) {
    if (request.argv.empty()) {
        return launchFailure("empty command");
    }

    const auto resolved = findExecutable(request.argv.front());
    if (!resolved) {
        ProcessOutcome outcome;
        outcome.kind = ProcessOutcome::Kind::ToolAbsent;
        outcome.error = request.argv.front() + " not found on PATH";
        return outcome;
    }

    int outPipe[2] = {-1, -1};
    int inPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};

    auto closeAll = [&]() {
        for (int* p : std::initializer_list<int*>{outPipe, inPipe, errPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };

    if (::pipe(outPipe) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0 ||
        (request.standardInput && ::pipe(inPipe) != 0)) {
        const std::string reason = std::strerror(errno);
        closeAll();
        return launchFailure("pipe failed: " + reason);
    }

    // Everything the child touches is prepared before fork.
    std::vector<std::string> argvStrings = request.argv;
    std::vector<char*> argv = toCharArray(argvStrings);
    std::vector<std::string> envStrings = buildEnvironment(request.environment);
    std::vector<char*> envp = toCharArray(envStrings);
    const std::string program = *resolved;
    const std::string workDir = request.workingDirectory;

    const pid_t pid = ::fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        closeAll();
        return launchFailure("fork failed: " + reason);
    }

    if (pid == 0) {
        ::setpgid(0, 0);

        auto fail = [&](int err) {
            ssize_t ignored = ::write(errPipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        };

        int stdinFd = request.standardInput ? inPipe[0] : ::open("/dev/null", O_RDONLY);
        if (stdinFd < 0 || ::dup2(stdinFd, STDIN_FILENO) < 0) fail(errno);
        if (::dup2(outPipe[1], STDOUT_FILENO) < 0) fail(errno);
        if (::dup2(outPipe[1], STDERR_FILENO) < 0) fail(errno);

        ::close(outPipe[0]);
        ::close(outPipe[1]);
        if (request.standardInput) {
            ::close(inPipe[0]);
            ::close(inPipe[1]);
        } else {
            ::close(stdinFd);
        }
        ::close(errPipe[0]);

        if (!workDir.empty() && ::chdir(workDir.c_str()) != 0) fail(errno);

        ::execve(program.c_str(), argv.data(), envp.data());
        fail(errno);
    }

    ::setpgid(pid, pid);
    closeFd(outPipe[1]);
    closeFd(inPipe[0]);
    closeFd(errPipe[1]);

    // errPipe closes on successful exec (O_CLOEXEC); an int means exec or setup failed.
    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(errPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(errPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        closeAll();
        return launchFailure("failed to start " + request.argv.front() + ": " + std::strerror(childErrno));
    }

    ProcessOutcome outcome;
    const auto deadline = Clock::now() + request.timeout;
    const std::string& input = request.standardInput ? *request.standardInput : std::string();
    size_t written = 0;
    bool timedOut = false;

    if (inPipe[1] >= 0) {
        ::fcntl(inPipe[1], F_SETFL, ::fcntl(inPipe[1], F_GETFL) | O_NONBLOCK);
        if (input.empty()) closeFd(inPipe[1]);
    }

    char buffer[4096];
    while (outPipe[0] >= 0) {
        pollfd fds[2];
        nfds_t count = 0;
        fds[count++] = pollfd{outPipe[0], POLLIN, 0};
        if (inPipe[1] >= 0) fds[count++] = pollfd{inPipe[1], POLLOUT, 0};

        const int waitMs = remainingMs(deadline);
        if (waitMs == 0) {
            timedOut = true;
            break;
        }

        const int ready = ::poll(fds, count, waitMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[ProcessRunner] poll failed: " << std::strerror(errno) << std::endl;
            timedOut = true;
            break;
        }
        if (ready == 0) continue;

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            const ssize_t r = ::read(outPipe[0], buffer, sizeof(buffer));
            if (r > 0) {
                outcome.output.append(buffer, static_cast<size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                closeFd(outPipe[0]);
            }
        }

        if (count > 1 && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP))) {
            const ssize_t w = ::write(inPipe[1], input.data() + written, input.size() - written);
            if (w > 0) written += static_cast<size_t>(w);
            if ((w < 0 && errno != EAGAIN && errno != EINTR) || written >= input.size()) {
                closeFd(inPipe[1]);
            }
        }
    }
    closeFd(inPipe[1]);

    int status = 0;
    while (!timedOut) {
        const pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0 && errno != EINTR) {
            closeAll();
            return launchFailure(std::string("waitpid failed: ") + std::strerror(errno));
        }
        if (remainingMs(deadline) == 0) {
            timedOut = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (timedOut) {
        std::cerr << "[ProcessRunner] Timeout after " << request.timeout.count()
                  << " ms, killing " << request.argv.front() << std::endl;
        ::kill(-pid, SIGKILL);
        ::waitpid(pid, &status, 0);
        closeAll();
        outcome.kind = ProcessOutcome::Kind::TimedOut;
        outcome.exitCode = -1;
        return outcome;
    }

    closeAll();
    outcome.kind = ProcessOutcome::Kind::Completed;
    outcome.exitCode = decodeStatus(status);
    return outcome;
}

} // namespace polyglot::infrastructure
