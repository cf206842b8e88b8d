#include "runtime/execution_engine.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <exception>
#include <fcntl.h>
#include <iomanip>
#include <map>
#include <optional>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/resource.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/config/execution_id.hpp"
#include "core/logging/logger.hpp"
#include "policy/shell_words.hpp"

extern char** environ;

namespace skillbox::runtime {

using core::errors::ErrorCategory;
using core::errors::SandboxError;
using policy::PermissionRule;
using policy::PermissionSet;
using protocol::EnvOverrides;
using protocol::ErrorKind;
using protocol::ExecutionConstraints;
using protocol::ExecutionResult;
namespace codes = core::errors::codes;

namespace {

constexpr const char* kShellPath = "/bin/sh";
constexpr int kPollIntervalMs = 50;
constexpr std::uint64_t kBytesPerMegabyte = 1024ULL * 1024ULL;

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_s = 0.0;
};

enum class SpawnStage : int {
    ChangeDirectory = 1,
    RedirectOutput = 2,
    Exec = 3
};

// Sent by the child over the report pipe when it fails before exec.
struct SpawnFailure {
    SpawnStage stage = SpawnStage::Exec;
    int error_number = 0;
};

std::string describe(const SpawnStage stage) {
    switch (stage) {
        case SpawnStage::ChangeDirectory:
            return "enter working directory";
        case SpawnStage::RedirectOutput:
            return "redirect output";
        case SpawnStage::Exec:
            return "start shell";
        default:
            return "spawn process";
    }
}

std::string errno_message(const int error_number) {
    return std::error_code(error_number, std::generic_category()).message();
}

std::string format_seconds(const double seconds) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << seconds << "s";
    return out.str();
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(int& fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        is_open = false;
        close_fd(fd);
        return;
    }
}

// The child leads its own process group, so this reaches every descendant
// that did not leave the group.
void kill_process_group(const pid_t pgid) {
    static_cast<void>(kill(-pgid, SIGKILL));
}

void report_spawn_failure(const int fd, const SpawnStage stage) {
    SpawnFailure failure;
    failure.stage = stage;
    failure.error_number = errno;
    static_cast<void>(write(fd, &failure, sizeof(failure)));
    _exit(127);
}

core::errors::Result<ProcessCapture> run_supervised(
    const std::string& command, const std::filesystem::path& cwd,
    const std::vector<std::string>& environment,
    const ExecutionConstraints& constraints, const std::string& tag) {
    // Everything the child touches is prepared before fork.
    std::vector<char*> envp;
    envp.reserve(environment.size() + 1);
    for (const auto& entry : environment) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    const std::string cwd_text = cwd.string();
    char* const argv[] = {const_cast<char*>("sh"), const_cast<char*>("-c"),
                          const_cast<char*>(command.c_str()), nullptr};

    bool limit_memory = false;
    rlimit memory_limit{};
    if (constraints.max_memory_mb.has_value()) {
#ifdef RLIMIT_AS
        const std::uint64_t mb = constraints.max_memory_mb.value();
        if (mb > 0 && mb <= static_cast<std::uint64_t>(RLIM_INFINITY) / kBytesPerMegabyte) {
            memory_limit.rlim_cur = static_cast<rlim_t>(mb * kBytesPerMegabyte);
            memory_limit.rlim_max = memory_limit.rlim_cur;
            limit_memory = true;
        }
#else
        LOG_DEBUG(tag + "Memory limits are not supported on this platform; ignoring.");
#endif
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int report_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        pipe2(report_pipe, O_CLOEXEC) != 0) {
        const int saved = errno;
        for (int* fds : {stdout_pipe, stderr_pipe, report_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return SandboxError{ErrorCategory::Internal,
                            "Failed to create process pipes: " + errno_message(saved),
                            codes::kPipeCreationFailed};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        const int saved = errno;
        for (int* fds : {stdout_pipe, stderr_pipe, report_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return SandboxError{ErrorCategory::Execution,
                            "Failed to fork process: " + errno_message(saved),
                            codes::kForkFailed};
    }

    if (pid == 0) {
        // Only async-signal-safe calls from here on.
        static_cast<void>(setpgid(0, 0));
#ifdef RLIMIT_AS
        if (limit_memory) {
            static_cast<void>(setrlimit(RLIMIT_AS, &memory_limit));
        }
#endif
        if (chdir(cwd_text.c_str()) != 0) {
            report_spawn_failure(report_pipe[1], SpawnStage::ChangeDirectory);
        }
        const int dev_null = open("/dev/null", O_RDONLY);
        if (dev_null >= 0) {
            static_cast<void>(dup2(dev_null, STDIN_FILENO));
            if (dev_null != STDIN_FILENO) {
                static_cast<void>(close(dev_null));
            }
        }
        if (dup2(stdout_pipe[1], STDOUT_FILENO) < 0 ||
            dup2(stderr_pipe[1], STDERR_FILENO) < 0) {
            report_spawn_failure(report_pipe[1], SpawnStage::RedirectOutput);
        }
        execve(kShellPath, argv, envp.data());
        report_spawn_failure(report_pipe[1], SpawnStage::Exec);
    }

    // Also set from the parent so the group exists before any kill.
    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(report_pipe[1]);

    SpawnFailure failure;
    ssize_t report_bytes = 0;
    do {
        report_bytes = read(report_pipe[0], &failure, sizeof(failure));
    } while (report_bytes < 0 && errno == EINTR);
    close_fd(report_pipe[0]);

    if (report_bytes == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        return SandboxError{ErrorCategory::Execution,
                            "Failed to " + describe(failure.stage) + " (" +
                                cwd_text + "): " + errno_message(failure.error_number),
                            codes::kSpawnFailed};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    const bool has_deadline = constraints.max_execution_time_s > 0;
    const auto deadline =
        started + std::chrono::seconds(constraints.max_execution_time_s);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool status_known = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        if (!capture.timed_out && has_deadline && now >= deadline) {
            // The shell was already reaped, so its group id may belong to someone
            // else. Whatever still holds the pipes left the group; stop reading.
            if (child_exited) {
                break;
            }
            capture.timed_out = true;
            kill_process_group(pid);
        }
        if (capture.timed_out && child_exited) {
            break;
        }

        int wait_ms = kPollIntervalMs;
        if (has_deadline && !capture.timed_out) {
            const auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
                    .count();
            wait_ms = static_cast<int>(std::clamp<std::int64_t>(
                remaining, 1, static_cast<std::int64_t>(kPollIntervalMs)));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
        static_cast<void>(poll(fds, nfds, wait_ms));

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (child_exited) {
            continue;
        }

        // Peek without reaping so the group id stays reserved while we kill it.
        siginfo_t info{};
        const int rc = waitid(P_PID, static_cast<id_t>(pid), &info,
                              WEXITED | WNOHANG | WNOWAIT);
        if (rc == 0 && info.si_pid == pid) {
            kill_process_group(pid);
            pid_t waited = -1;
            do {
                waited = waitpid(pid, &status, 0);
            } while (waited < 0 && errno == EINTR);
            child_exited = true;
            status_known = (waited == pid);
        } else if (rc < 0 && errno != EINTR) {
            child_exited = true;
        }
    }

    close_fd(stdout_pipe[0]);
    close_fd(stderr_pipe[0]);

    if (!status_known) {
        capture.exit_code = -1;
    } else if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_s = std::chrono::duration<double>(ended - started).count();
    return capture;
}

}  // namespace

ExecutionEngine::ExecutionEngine(PermissionSet rules, SandboxIdentity identity)
    : rules_(std::move(rules)), identity_(std::move(identity)) {}

bool ExecutionEngine::rule_matches(const PermissionRule& rule,
                                   const std::vector<std::string>& words) {
    if (!rule.grants_execution()) {
        return false;
    }
    // Bare `Bash` grants every command.
    if (!rule.scope_command.has_value()) {
        return true;
    }

    const auto& scope = rule.scope_words;
    if (scope.empty()) {
        return false;
    }

    if (!rule.wildcard_args) {
        return words == scope;
    }

    if (scope.size() == 1) {
        const std::string& base = scope.front();
        if (words.front() == base) {
            return true;
        }
        if (!base.empty() && base.back() == '*') {
            const std::string prefix = base.substr(0, base.size() - 1);
            return words.front().compare(0, prefix.size(), prefix) == 0;
        }
        return false;
    }

    return words.size() >= scope.size() &&
           std::equal(scope.begin(), scope.end(), words.begin());
}

bool ExecutionEngine::is_allowed(const PermissionSet& rules,
                                 const std::string& command) {
    auto split = policy::split_shell_words(command);
    if (core::errors::is_error(split)) {
        return false;
    }
    const auto& words = core::errors::get_value(split);
    if (words.empty() || words.front().empty()) {
        return false;
    }

    for (const auto& rule : rules.rules()) {
        if (rule_matches(rule, words)) {
            return true;
        }
    }
    return false;
}

bool ExecutionEngine::is_allowed(const std::string& command) const {
    return is_allowed(rules_, command);
}

std::filesystem::path ExecutionEngine::resolve_working_directory(
    const ExecutionConstraints& constraints) const {
    if (!constraints.working_directory.has_value()) {
        return identity_.root;
    }
    const auto& requested = constraints.working_directory.value();
    if (requested.is_relative()) {
        return identity_.root / requested;
    }
    return requested;
}

std::vector<std::string> ExecutionEngine::build_environment(
    const EnvOverrides& overrides) const {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string text(*entry);
        const auto eq = text.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        merged[text.substr(0, eq)] = text.substr(eq + 1);
    }

    for (const auto& [key, value] : overrides) {
        if (key.empty() || key.find('=') != std::string::npos) {
            LOG_WARN("[" + identity_.name + "] Ignoring invalid environment key: '" +
                     key + "'");
            continue;
        }
        merged[key] = value;
    }

    merged[kSandboxNameEnv] = identity_.name;
    merged[kSandboxRootEnv] = identity_.root.string();
    merged[kScriptsDirEnv] = identity_.scripts_dir.string();

    std::vector<std::string> environment;
    environment.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        environment.push_back(key + "=" + value);
    }
    return environment;
}

ExecutionResult ExecutionEngine::execute(const std::string& command,
                                         const ExecutionConstraints& constraints,
                                         const EnvOverrides& env) const {
    ExecutionResult result;
    result.command = command;

    try {
        const std::string tag =
            "[" + identity_.name + "/" + core::config::generate_execution_id() + "] ";
        if (!is_allowed(command)) {
            LOG_WARN(tag + "Execution blocked: permission denied for '" + command + "'");
            result.error_kind = ErrorKind::PermissionDenied;
            result.error_message =
                "Command not allowed: " + command + ". Check the sandbox's allowed tools.";
            return result;
        }

        const auto cwd = resolve_working_directory(constraints);
        LOG_INFO(tag + "Execution started: command='" + command + "' cwd=" +
                 cwd.string());

        if (constraints.network_access) {
            LOG_DEBUG(tag + "Network access requested; the sandbox does not enforce it.");
        }

        const auto started = std::chrono::steady_clock::now();
        auto capture_result =
            run_supervised(command, cwd, build_environment(env), constraints, tag);
        if (core::errors::is_error(capture_result)) {
            const auto& err = core::errors::get_error(capture_result);
            LOG_ERROR(tag + "Execution failed [" + err.code + "]: " + err.message);
            result.error_kind = ErrorKind::ExecutionError;
            result.error_message = "Execution failed: " + err.message;
            result.execution_time_s = std::chrono::duration<double>(
                                          std::chrono::steady_clock::now() - started)
                                          .count();
            return result;
        }

        auto& capture = std::get<ProcessCapture>(capture_result);
        result.execution_time_s = capture.duration_s;

        if (capture.timed_out) {
            LOG_ERROR(tag + "Execution timeout: limit=" +
                      std::to_string(constraints.max_execution_time_s) + "s elapsed=" +
                      format_seconds(capture.duration_s));
            result.exit_code = -1;
            result.error_kind = ErrorKind::Timeout;
            result.error_message = "Command timed out after " +
                                   std::to_string(constraints.max_execution_time_s) +
                                   " seconds";
            return result;
        }

        result.exit_code = capture.exit_code;
        result.stdout_text = std::move(capture.stdout_text);
        result.stderr_text = std::move(capture.stderr_text);
        result.success = (result.exit_code == 0);
        if (!result.success) {
            result.error_message =
                "Command failed with exit code " + std::to_string(result.exit_code);
        }

        LOG_INFO(tag + "Execution completed: exit_code=" +
                 std::to_string(result.exit_code) +
                 " time=" + format_seconds(result.execution_time_s));
        return result;
    } catch (const std::exception& e) {
        result.success = false;
        result.exit_code = -1;
        result.stdout_text.clear();
        result.stderr_text.clear();
        result.error_kind = ErrorKind::ExecutionError;
        result.error_message = std::string("Execution failed: ") + e.what();
        return result;
    }
}

}  // namespace skillbox::runtime
