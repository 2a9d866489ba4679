#include <filesystem>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/local_executor.hpp"

using namespace std;
using namespace verifier;
namespace fs = std::filesystem;

/**
 * 在本机直接运行 /bin/sh 的执行器测试
 * 测试环境通常没有 root 权限，因此不使用 cgroup，命名空间隔离失败只记录警告。
 */
class LocalExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.sandbox_dir = fs::temp_directory_path() / ("verifier-sandbox-" + generate_uuid());
        options.use_cgroup = false;
        options.require_isolation = false;
        fs::create_directories(options.sandbox_dir);
    }

    void TearDown() override {
        error_code ec;
        fs::remove_all(options.sandbox_dir, ec);
    }

    execution_request make_request(const string &test_command) {
        execution_request request;
        request.task_id = "task-1";
        request.subtask_id = "subtask-1";
        request.agent_role = "Python Agent";
        request.artifacts = {{"main.py", "def add(a, b):\n    return a + b\n", artifact_type::SOURCE},
                             {"tests/test_main.py", "from main import add\n", artifact_type::TEST}};
        request.test_command = test_command;
        request.config = build_config(runtime::PYTHON);
        request.config.security.read_only_filesystem = false;
        request.config.security.drop_capabilities.clear();
        request.config.security.seccomp = seccomp_profile::UNCONFINED;
        return request;
    }

    size_t sandbox_count() const {
        return (size_t)distance(fs::directory_iterator(options.sandbox_dir), fs::directory_iterator());
    }

    local_executor_options options;
};

static bool has_log(const execution_result &result, log_stream stream, const string &content) {
    for (auto &log : result.logs)
        if (log.stream == stream && log.content == content) return true;
    return false;
}

TEST_F(LocalExecutorTest, RunsCommandsAndParsesOutputTest) {
    local_sandbox_executor executor(options);
    execution_request request = make_request(
        "test -f tests/test_main.py && printf 'tests/test_main.py::test_add PASSED\\n'");
    request.lint_command = "echo './main.py:1:1: F401 os imported but unused'";
    request.security_scan_command = "true";

    execution_result result = executor.execute(request, cancellation_token());
    EXPECT_EQ(result.status, execution_status::SUCCESS);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.sandbox_id.rfind("sbx_", 0), 0u);
    EXPECT_GE(result.end_time, result.start_time);
    EXPECT_EQ(result.test_framework, "pytest");

    ASSERT_EQ(result.test_results.size(), 1u);
    EXPECT_EQ(result.test_results[0].name, "test_add");
    EXPECT_EQ(result.test_results[0].status, test_status::PASSED);

    ASSERT_EQ(result.lint_violations.size(), 1u);
    EXPECT_EQ(result.lint_violations[0].rule, "F401");
    EXPECT_EQ(result.lint_violations[0].file, "main.py");
    EXPECT_TRUE(has_log(result, log_stream::STDOUT, "tests/test_main.py::test_add PASSED"));
    EXPECT_FALSE(result.output_truncated);

    EXPECT_EQ(sandbox_count(), 0u);
}

TEST_F(LocalExecutorTest, EnvironmentIsNotInheritedTest) {
    setenv("VERIFIER_LEAK_CHECK", "leaked", 1);
    local_sandbox_executor executor(options);
    execution_request request = make_request("echo \"[$VERIFIER_LEAK_CHECK][$GREETING][$PYTHONUNBUFFERED]\"");
    request.config.environment["GREETING"] = "hello";

    execution_result result = executor.execute(request, cancellation_token());
    unsetenv("VERIFIER_LEAK_CHECK");
    EXPECT_TRUE(has_log(result, log_stream::STDOUT, "[][hello][1]"));
}

TEST_F(LocalExecutorTest, UnparsedFailureBecomesSyntheticTestTest) {
    local_sandbox_executor executor(options);
    execution_request request = make_request("echo 'first' >&2; echo 'ImportError: no module' >&2; exit 3");

    execution_result result = executor.execute(request, cancellation_token());
    EXPECT_EQ(result.status, execution_status::FAILURE);
    EXPECT_EQ(result.exit_code, 3);
    ASSERT_EQ(result.test_results.size(), 1u);
    EXPECT_EQ(result.test_results[0].name, request.test_command);
    EXPECT_EQ(result.test_results[0].status, test_status::FAILED);
    EXPECT_EQ(result.test_results[0].error_message, "Test command exited with code 3: first\nImportError: no module");
    EXPECT_TRUE(has_log(result, log_stream::STDERR, "ImportError: no module"));
}

TEST_F(LocalExecutorTest, OutputIsTruncatedTest) {
    local_sandbox_executor executor(options);
    execution_request request = make_request("head -c 5000 /dev/zero | tr '\\000' 'a'; echo");
    request.config.limits.max_output_bytes = 1024;

    execution_result result = executor.execute(request, cancellation_token());
    EXPECT_TRUE(result.output_truncated);
    ASSERT_FALSE(result.logs.empty());
    EXPECT_EQ(result.logs.back().stream, log_stream::STDERR);
    EXPECT_EQ(result.logs.back().content, "[output truncated: 3977 bytes dropped]");

    size_t captured = 0;
    for (auto &log : result.logs)
        if (log.stream == log_stream::STDOUT) captured += log.content.size();
    EXPECT_EQ(captured, 1024u);
}

TEST_F(LocalExecutorTest, TimeoutKillsCommandTest) {
    local_sandbox_executor executor(options);
    execution_request request = make_request("sleep 10");
    request.config.limits.timeout_seconds = 1;

    elapsed_time timer;
    execution_result result = executor.execute(request, cancellation_token());
    EXPECT_EQ(result.status, execution_status::TIMEOUT);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 5000);
    EXPECT_EQ(sandbox_count(), 0u);
}

TEST_F(LocalExecutorTest, CancellationStopsCommandTest) {
    local_sandbox_executor executor(options);
    execution_request request = make_request("sleep 10");
    cancellation_token token;

    thread canceller([token] {
        this_thread::sleep_for(chrono::milliseconds(200));
        token.cancel();
    });
    elapsed_time timer;
    execution_result result = executor.execute(request, token);
    canceller.join();

    EXPECT_EQ(result.status, execution_status::ERROR);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 5000);
}

TEST_F(LocalExecutorTest, MissingToolIsSandboxErrorTest) {
    local_sandbox_executor executor(options);
    execution_request request = make_request("true");
    request.lint_command = "verifier-no-such-linter .";

    EXPECT_THROW(executor.execute(request, cancellation_token()), sandbox_error);
    EXPECT_EQ(sandbox_count(), 0u);
}

TEST_F(LocalExecutorTest, MalformedScannerReportIsSandboxErrorTest) {
    local_sandbox_executor executor(options);
    execution_request request = make_request("true");
    request.security_scan_command = "echo 'bandit: error: unrecognized arguments'";

    EXPECT_THROW(executor.execute(request, cancellation_token()), sandbox_error);
}

TEST_F(LocalExecutorTest, RejectsUnsupportedNetworkModeTest) {
    local_sandbox_executor executor(options);
    execution_request request = make_request("true");
    request.config.network.mode = network_mode::RESTRICTED;
    request.config.network.allowed_hosts = {"pypi.org"};

    EXPECT_THROW(executor.execute(request, cancellation_token()), sandbox_error);
}

TEST_F(LocalExecutorTest, RejectsEscapingArtifactTest) {
    local_sandbox_executor executor(options);
    execution_request request = make_request("true");
    request.artifacts.push_back({"../escape.py", "x = 1\n", artifact_type::SOURCE});

    EXPECT_THROW(executor.execute(request, cancellation_token()), invalid_request);
    EXPECT_FALSE(fs::exists(options.sandbox_dir.parent_path() / "escape.py"));
}

TEST_F(LocalExecutorTest, KeepSandboxTest) {
    options.keep_sandbox = true;
    local_sandbox_executor executor(options);
    execution_result result = executor.execute(make_request("true"), cancellation_token());

    fs::path work_dir = options.sandbox_dir / result.sandbox_id;
    EXPECT_TRUE(fs::exists(work_dir / "main.py"));
    EXPECT_TRUE(fs::exists(work_dir / "tests" / "test_main.py"));
}

TEST_F(LocalExecutorTest, PatternScanFindingsAreMergedTest) {
    local_sandbox_executor executor(options);
    execution_request request = make_request("true");
    request.artifacts.push_back({"config.py", "api_key = \"abc123\"\n", artifact_type::SOURCE});

    execution_result result = executor.execute(request, cancellation_token());
    ASSERT_EQ(result.security_findings.size(), 1u);
    EXPECT_EQ(result.security_findings[0].type, "HARDCODED_SECRET");
    EXPECT_EQ(result.status, execution_status::FAILURE);
}
