#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/execution_id.hpp"
#include "core/errors/sandbox_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/permission_grammar.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/execution_engine.hpp"

namespace {

using skillbox::core::errors::get_value;
using skillbox::core::errors::is_error;
using skillbox::policy::PermissionGrammar;
using skillbox::policy::PermissionSet;
using skillbox::protocol::ErrorKind;
using skillbox::protocol::ExecutionConstraints;
using skillbox::runtime::ExecutionEngine;
using skillbox::runtime::SandboxIdentity;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_execution_engine_" + skillbox::core::config::generate_execution_id());
        std::filesystem::create_directories(root_ / "scripts");
        root_ = std::filesystem::canonical(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

PermissionSet rules_for(const std::string& spec) {
    auto parsed = PermissionGrammar::parse(spec);
    EXPECT_FALSE(is_error(parsed)) << spec;
    if (is_error(parsed)) {
        return PermissionSet{};
    }
    return get_value(parsed);
}

ExecutionEngine make_engine(const TempWorkspace& workspace, const std::string& spec) {
    return ExecutionEngine(rules_for(spec), SandboxIdentity{"demo-skill", workspace.root(),
                                                           workspace.root() / "scripts"});
}

ExecutionConstraints quick_constraints() {
    ExecutionConstraints constraints;
    constraints.max_execution_time_s = 10;
    return constraints;
}

// A process counts as gone once /proc has no entry or only a zombie is left.
bool process_gone(const std::string& pid) {
    std::ifstream in("/proc/" + pid + "/stat");
    if (!in.is_open()) {
        return true;
    }
    std::string stat;
    std::getline(in, stat);
    const auto paren = stat.rfind(')');
    return paren == std::string::npos || paren + 2 >= stat.size() ||
           stat[paren + 2] == 'Z';
}

std::string read_trimmed(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::string value;
    std::getline(in, value);
    return value;
}

TEST(CommandMatchingTest, WildcardMatchesExactBaseCommandOnly) {
    const auto rules = rules_for("Bash(python:*),Read,Write");
    EXPECT_TRUE(ExecutionEngine::is_allowed(rules, "python script.py arg"));
    EXPECT_TRUE(ExecutionEngine::is_allowed(rules, "python"));
    EXPECT_FALSE(ExecutionEngine::is_allowed(rules, "python3 x"));
    EXPECT_FALSE(ExecutionEngine::is_allowed(rules, "cat notes.txt"));
}

TEST(CommandMatchingTest, ScopedSubcommandRequiresLeadingWords) {
    const auto rules = rules_for("Bash(git status:*)");
    EXPECT_TRUE(ExecutionEngine::is_allowed(rules, "git status"));
    EXPECT_TRUE(ExecutionEngine::is_allowed(rules, "git status --short"));
    EXPECT_FALSE(ExecutionEngine::is_allowed(rules, "git commit -m x"));
    EXPECT_FALSE(ExecutionEngine::is_allowed(rules, "git"));
}

TEST(CommandMatchingTest, EmptySpecDeniesEverything) {
    const auto rules = rules_for("");
    for (const std::string command : {"ls", "python a.py", "echo hi", ""}) {
        EXPECT_FALSE(ExecutionEngine::is_allowed(rules, command)) << command;
    }
}

TEST(CommandMatchingTest, StarSuffixMatchesByPrefix) {
    const auto rules = rules_for("Bash(python*:*)");
    EXPECT_TRUE(ExecutionEngine::is_allowed(rules, "python3 x"));
    EXPECT_TRUE(ExecutionEngine::is_allowed(rules, "python3.12 -V"));
    EXPECT_FALSE(ExecutionEngine::is_allowed(rules, "pip install x"));
}

TEST(CommandMatchingTest, ExactScopeAllowsNoExtraArguments) {
    const auto rules = rules_for("Bash(ls)");
    EXPECT_TRUE(ExecutionEngine::is_allowed(rules, "ls"));
    EXPECT_FALSE(ExecutionEngine::is_allowed(rules, "ls -la"));
}

TEST(CommandMatchingTest, BareExecutableToolAllowsAnyCommand) {
    const auto rules = rules_for("bash");
    EXPECT_TRUE(ExecutionEngine::is_allowed(rules, "anything --goes"));
    EXPECT_FALSE(ExecutionEngine::is_allowed(rules, "   "));
}

TEST(CommandMatchingTest, NonExecutableToolsNeverGrantCommands) {
    const auto rules = rules_for("Read,Write(scripts)");
    EXPECT_FALSE(ExecutionEngine::is_allowed(rules, "Read"));
    EXPECT_FALSE(ExecutionEngine::is_allowed(rules, "cat scripts"));
}

TEST(CommandMatchingTest, QuotedBaseCommandIsUnquoted) {
    const auto rules = rules_for("Bash(python:*)");
    EXPECT_TRUE(ExecutionEngine::is_allowed(rules, "'python' -c \"print(1)\""));
}

TEST(CommandMatchingTest, UnbalancedQuotesAreDenied) {
    const auto rules = rules_for("Bash");
    EXPECT_FALSE(ExecutionEngine::is_allowed(rules, "echo 'unterminated"));
}

TEST(ExecutionEngineTest, CapturesStdoutOnSuccess) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash(echo:*)");

    const auto result = engine.execute("echo hello", quick_constraints());
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_TRUE(result.stderr_text.empty());
    EXPECT_EQ(result.command, "echo hello");
    EXPECT_FALSE(result.error_kind.has_value());
    EXPECT_FALSE(result.error_message.has_value());
    EXPECT_GE(result.execution_time_s, 0.0);
}

TEST(ExecutionEngineTest, ReportsNonZeroExitWithStderr) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash");

    const auto result = engine.execute("echo broken 1>&2; exit 3", quick_constraints());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stderr_text, "broken\n");
    EXPECT_FALSE(result.error_kind.has_value());
    ASSERT_TRUE(result.error_message.has_value());
    EXPECT_EQ(result.error_message.value(), "Command failed with exit code 3");
}

TEST(ExecutionEngineTest, RunsThroughTheShell) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash(echo:*)");

    const auto result = engine.execute("echo hello | tr a-z A-Z", quick_constraints());
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, "HELLO\n");
}

TEST(ExecutionEngineTest, SignalledChildReportsShellStyleExitCode) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash");

    const auto result = engine.execute("kill -9 $$", quick_constraints());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 137);
}

TEST(ExecutionEngineTest, DrainsLargeOutputWithoutBlocking) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash");

    const auto result =
        engine.execute("head -c 300000 /dev/zero | tr '\\000' a", quick_constraints());
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text.size(), 300000u);
    EXPECT_EQ(result.stdout_text.find_first_not_of('a'), std::string::npos);
}

TEST(ExecutionEngineTest, DeniedCommandNeverSpawns) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash(python:*),Read,Write");
    const auto sentinel = workspace.root() / "sentinel";

    const auto result = engine.execute("touch " + sentinel.string(), quick_constraints());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, -1);
    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(result.error_kind.value(), ErrorKind::PermissionDenied);
    ASSERT_TRUE(result.error_message.has_value());
    EXPECT_NE(result.error_message->find("Command not allowed"), std::string::npos);
    EXPECT_EQ(result.execution_time_s, 0.0);
    EXPECT_FALSE(std::filesystem::exists(sentinel));
}

TEST(ExecutionEngineTest, TimeoutKillsWholeProcessGroup) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash");
    const auto pid_file = workspace.root() / "child.pid";

    ExecutionConstraints constraints;
    constraints.max_execution_time_s = 1;

    const auto started = std::chrono::steady_clock::now();
    const auto result = engine.execute(
        "sleep 30 & echo $! > " + pid_file.string() + "; sleep 10", constraints);
    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, -1);
    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(result.error_kind.value(), ErrorKind::Timeout);
    EXPECT_EQ(result.error_message.value(), "Command timed out after 1 seconds");
    EXPECT_TRUE(result.stdout_text.empty());
    EXPECT_TRUE(result.stderr_text.empty());
    EXPECT_GE(elapsed, 0.9);
    EXPECT_LT(elapsed, 5.0);

    const std::string background_pid = read_trimmed(pid_file);
    ASSERT_FALSE(background_pid.empty());
    bool gone = process_gone(background_pid);
    for (int i = 0; i < 40 && !gone; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        gone = process_gone(background_pid);
    }
    EXPECT_TRUE(gone) << "background pid " << background_pid << " survived";
}

TEST(ExecutionEngineTest, BackgroundChildDoesNotHoldResultOpen) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash");

    const auto started = std::chrono::steady_clock::now();
    const auto result = engine.execute("sleep 30 & echo done", quick_constraints());
    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, "done\n");
    EXPECT_LT(elapsed, 5.0);
}

TEST(ExecutionEngineTest, DetachedDescendantDoesNotTurnExitIntoTimeout) {
    if (!std::filesystem::exists("/usr/bin/setsid") && !std::filesystem::exists("/bin/setsid")) {
        GTEST_SKIP() << "setsid is not installed";
    }
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash");

    ExecutionConstraints constraints;
    constraints.max_execution_time_s = 1;

    const auto started = std::chrono::steady_clock::now();
    const auto result = engine.execute("setsid sleep 3 & echo started", constraints);
    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "started\n");
    EXPECT_FALSE(result.error_kind.has_value());
    EXPECT_LT(elapsed, 2.5);
}

TEST(ExecutionEngineTest, DeniedCommandDoesNotLogStart) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash(python:*)");
    auto& logger = skillbox::core::logging::Logger::get();
    const auto previous = logger.level();
    logger.set_level(skillbox::core::logging::LogLevel::DEBUG);

    testing::internal::CaptureStdout();
    const auto result = engine.execute("rm -rf scripts", quick_constraints());
    const std::string output = testing::internal::GetCapturedStdout();
    logger.set_level(previous);

    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(result.error_kind.value(), ErrorKind::PermissionDenied);
    EXPECT_NE(output.find("permission denied"), std::string::npos);
    EXPECT_EQ(output.find("Execution started"), std::string::npos);
}

TEST(ExecutionEngineTest, ZeroTimeoutDisablesTimer) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash(echo:*)");

    ExecutionConstraints constraints;
    constraints.max_execution_time_s = 0;
    const auto result = engine.execute("echo untimed", constraints);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, "untimed\n");
}

TEST(ExecutionEngineTest, InjectsSandboxEnvironment) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash(echo:*)");

    const auto result = engine.execute("echo \"$SKILL_NAME|$SKILL_DIR|$SCRIPTS_DIR\"",
                                       quick_constraints());
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, "demo-skill|" + workspace.root().string() + "|" +
                                      (workspace.root() / "scripts").string() + "\n");
}

TEST(ExecutionEngineTest, CallerCannotSpoofSandboxVariables) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash(echo:*)");

    const auto result =
        engine.execute("echo \"$SKILL_NAME:$EXTRA\"", quick_constraints(),
                       {{"SKILL_NAME", "impostor"}, {"EXTRA", "custom value"}});
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, "demo-skill:custom value\n");
}

TEST(ExecutionEngineTest, InheritsAmbientEnvironment) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash");
    const auto environment = engine.build_environment({});

    bool has_path = false;
    for (const auto& entry : environment) {
        has_path = has_path || entry.rfind("PATH=", 0) == 0;
    }
    EXPECT_TRUE(has_path);
}

TEST(ExecutionEngineTest, SkipsInvalidEnvironmentKeys) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash");
    const auto environment = engine.build_environment({{"BAD=KEY", "x"}, {"", "y"}});

    for (const auto& entry : environment) {
        EXPECT_NE(entry.rfind("BAD=KEY", 0), 0u);
        EXPECT_NE(entry.front(), '=');
    }
}

TEST(ExecutionEngineTest, DefaultsWorkingDirectoryToRoot) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash(pwd)");

    const auto result = engine.execute("pwd", quick_constraints());
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, workspace.root().string() + "\n");
}

TEST(ExecutionEngineTest, RelativeWorkingDirectoryResolvesAgainstRoot) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash(pwd:*)");

    auto constraints = quick_constraints();
    constraints.working_directory = std::filesystem::path("scripts");
    const auto result = engine.execute("pwd -P", constraints);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, (workspace.root() / "scripts").string() + "\n");
}

TEST(ExecutionEngineTest, MissingWorkingDirectoryIsExecutionError) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash(pwd)");

    auto constraints = quick_constraints();
    constraints.working_directory = std::filesystem::path("no-such-dir");
    const auto result = engine.execute("pwd", constraints);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, -1);
    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(result.error_kind.value(), ErrorKind::ExecutionError);
    ASSERT_TRUE(result.error_message.has_value());
    EXPECT_EQ(result.error_message->rfind("Execution failed: ", 0), 0u);
}

TEST(ExecutionEngineTest, AppliesMemoryLimitToChild) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash(ulimit:*)");

    auto constraints = quick_constraints();
    constraints.max_memory_mb = 256;
    const auto result = engine.execute("ulimit -v", constraints);
    ASSERT_TRUE(result.success) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "262144\n");
}

TEST(ExecutionEngineTest, ConcurrentExecutionsStayIndependent) {
    TempWorkspace workspace;
    const auto engine = make_engine(workspace, "Bash(echo:*)");

    std::vector<std::string> outputs(4);
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < outputs.size(); ++i) {
        workers.emplace_back([&engine, &outputs, i]() {
            const auto result =
                engine.execute("echo worker-" + std::to_string(i), quick_constraints());
            outputs[i] = result.stdout_text;
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (std::size_t i = 0; i < outputs.size(); ++i) {
        EXPECT_EQ(outputs[i], "worker-" + std::to_string(i) + "\n");
    }
}

}  // namespace
