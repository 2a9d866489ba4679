#include "sandbox/local_executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/pattern_scanner.hpp"
#include "sandbox/process.hpp"
#include "sandbox/report_parser.hpp"

namespace verifier {
using namespace std;
namespace fs = std::filesystem;

static const int SANDBOX_NPROC = 512;

// 合成测试结果中附带的 stderr 行数
static const size_t TAIL_LINES = 5;

local_executor_options local_executor_options::from_globals() {
    local_executor_options options;
    options.sandbox_dir = SANDBOX_DIR;
    options.use_cgroup = USE_CGROUP;
    options.require_isolation = REQUIRE_ISOLATION;
    options.keep_sandbox = KEEP_SANDBOX;
    return options;
}

local_sandbox_executor::local_sandbox_executor()
    : options(local_executor_options::from_globals()) {}

local_sandbox_executor::local_sandbox_executor(local_executor_options options)
    : options(move(options)) {}

enum class step {
    LINT,
    SECURITY_SCAN,
    TEST
};

static const char *step_name(step s) {
    switch (s) {
        case step::LINT: return "lint";
        case step::SECURITY_SCAN: return "security-scan";
        case step::TEST: return "test";
    }
    throw internal_error("unknown sandbox step");
}

static map<string, string> build_environment(const local_executor_options &options, const sandbox_config &config, const fs::path &work_dir) {
    map<string, string> env;
    env["PATH"] = options.default_path;
    env["HOME"] = work_dir.string();
    env["TMPDIR"] = (work_dir / ".tmp").string();
    env["LANG"] = "C.UTF-8";
    switch (config.runtime) {
        case runtime::PYTHON:
            env["PYTHONDONTWRITEBYTECODE"] = "1";
            env["PYTHONUNBUFFERED"] = "1";
            break;
        case runtime::NODE:
        case runtime::TYPESCRIPT:
            // 非交互模式，输出不带颜色控制符以便解析
            env["CI"] = "true";
            env["FORCE_COLOR"] = "0";
            env["NO_COLOR"] = "1";
            break;
    }
    for (auto &[key, value] : config.environment)
        env[key] = value;
    return env;
}

static string tail_lines(const string &output, size_t count) {
    vector<string> lines;
    size_t end = output.size();
    while (end > 0 && output[end - 1] == '\n') --end;
    while (end > 0 && lines.size() < count) {
        size_t begin = output.rfind('\n', end - 1);
        begin = begin == string::npos ? 0 : begin + 1;
        lines.insert(lines.begin(), output.substr(begin, end - begin));
        end = begin == 0 ? 0 : begin - 1;
    }
    return boost::algorithm::join(lines, "\n");
}

static void parse_lint(runtime rt, const process_result &pr, const fs::path &work_dir, execution_result &result) {
    vector<lint_violation> violations;
    switch (rt) {
        case runtime::PYTHON:
            violations = parsers::parse_flake8_output(pr.stdout_data);
            break;
        case runtime::NODE:
        case runtime::TYPESCRIPT:
            violations = parsers::parse_eslint_output(pr.stdout_data, work_dir.string());
            break;
    }
    result.lint_violations.insert(result.lint_violations.end(), violations.begin(), violations.end());
}

static void parse_security_scan(runtime rt, const process_result &pr, execution_result &result) {
    vector<security_finding> findings;
    switch (rt) {
        case runtime::PYTHON:
            findings = parsers::parse_bandit_output(pr.stdout_data);
            break;
        case runtime::NODE:
        case runtime::TYPESCRIPT:
            findings = parsers::parse_npm_audit_output(pr.stdout_data);
            break;
    }
    result.security_findings.insert(result.security_findings.end(), findings.begin(), findings.end());
}

static void parse_tests(runtime rt, const string &command, const process_result &pr, execution_result &result) {
    vector<test_result> tests;
    switch (rt) {
        case runtime::PYTHON:
            result.test_framework = "pytest";
            tests = parsers::parse_pytest_output(pr.stdout_data);
            result.coverage = parsers::parse_coverage_total(pr.stdout_data);
            break;
        case runtime::NODE:
        case runtime::TYPESCRIPT:
            // jest 的用例结果输出在 stderr
            result.test_framework = "jest";
            tests = parsers::parse_jest_output(pr.stderr_data + "\n" + pr.stdout_data);
            if (tests.empty()) {
                tests = parsers::parse_tap_output(pr.stdout_data);
                if (!tests.empty()) result.test_framework = "tap";
            }
            break;
    }

    if (tests.empty() && pr.exit_code != 0) {
        test_result synthetic;
        synthetic.name = command;
        synthetic.status = test_status::FAILED;
        synthetic.duration_ms = pr.wall_time_ms;
        string tail = tail_lines(pr.stderr_data.empty() ? pr.stdout_data : pr.stderr_data, TAIL_LINES);
        synthetic.error_message = tail.empty()
                                      ? fmt::format("Test command exited with code {}", pr.exit_code)
                                      : fmt::format("Test command exited with code {}: {}", pr.exit_code, tail);
        tests.push_back(synthetic);
    }
    result.test_results.insert(result.test_results.end(), tests.begin(), tests.end());
}

execution_result local_sandbox_executor::execute(const execution_request &request, const cancellation_token &token) {
    const sandbox_config &config = request.config;
    if (config.network.mode != network_mode::NONE)
        throw sandbox_error(fmt::format("network mode {} requires an egress proxy, which the local sandbox does not provide",
                                        get_display_message(config.network.mode)));

    execution_result result;
    result.sandbox_id = "sbx_" + generate_uuid();
    result.status = execution_status::RUNNING;
    result.start_time = current_time_millis();
    elapsed_time wall;

    LOG(INFO) << "Sandbox " << result.sandbox_id << " started for task " << request.task_id << ", subtask " << request.subtask_id;

    fs::path work_dir = options.sandbox_dir / result.sandbox_id;
    try {
        fs::create_directories(work_dir / ".tmp");
    } catch (fs::filesystem_error &ex) {
        throw sandbox_error(fmt::format("unable to create sandbox directory {}: {}", work_dir.string(), ex.what()));
    }
    defer {
        if (options.keep_sandbox) {
            LOG(INFO) << "Keeping sandbox directory " << work_dir;
            return;
        }
        error_code ec;
        fs::remove_all(work_dir, ec);
        if (ec) LOG(WARNING) << "Unable to remove sandbox directory " << work_dir << ": " << ec.message();
    };

    for (auto &artifact : request.artifacts) {
        try {
            write_file_content(work_dir / assert_safe_path(artifact.filename), artifact.content);
        } catch (invalid_argument &ex) {
            throw invalid_request(ex.what());
        } catch (system_error &ex) {
            throw sandbox_error(fmt::format("unable to write artifact {}: {}", artifact.filename, ex.what()));
        }
    }

    pattern_scan_result scan = scan_artifacts(request.artifacts);
    result.security_findings = move(scan.findings);
    result.lint_violations = move(scan.lint_violations);

    bool block_inet = config.network.mode == network_mode::NONE;
    seccomp_filter filter = build_seccomp_filter(config.security.seccomp, block_inet);

    output_budget budget;
    budget.remaining = config.limits.max_output_bytes;
    auto deadline = chrono::steady_clock::now() + chrono::seconds(config.limits.timeout_seconds);
    map<string, string> env = build_environment(options, config, work_dir);

    bool timed_out = false, cancelled = false, crashed = false;
    int test_exit_code = -1;

    const pair<step, const string *> steps[] = {
        {step::LINT, &request.lint_command},
        {step::SECURITY_SCAN, &request.security_scan_command},
        {step::TEST, &request.test_command}};

    for (auto &[s, command] : steps) {
        if (command->empty()) continue;
        if (token.is_cancelled()) {
            cancelled = true;
            break;
        }

        process_options opt;
        opt.argv = {"/bin/sh", "-c", *command};
        opt.work_dir = work_dir;
        opt.env = env;
        opt.use_cgroup = options.use_cgroup;
        if (options.use_cgroup)
            opt.limits.cgroup_name = fmt::format("verifier_{}_{}", result.sandbox_id, step_name(s));
        opt.limits.memory_limit_bytes = (int64_t)config.limits.memory_mb * 1024 * 1024;
        opt.limits.cpu_cores = config.limits.cpu_cores;
        opt.limits.cpu_time_limit = config.limits.timeout_seconds;
        opt.limits.file_limit_bytes = (int64_t)config.limits.max_output_bytes;
        opt.limits.nproc = SANDBOX_NPROC;
        opt.isolate_network = block_inet;
        opt.read_only_filesystem = config.security.read_only_filesystem;
        opt.no_new_privileges = config.security.no_new_privileges;
        opt.drop_capabilities = !config.security.drop_capabilities.empty();
        opt.require_isolation = options.require_isolation;
        opt.deadline = deadline;

        DLOG(INFO) << "Sandbox " << result.sandbox_id << " running " << step_name(s) << ": " << *command;
        process_result pr = run_guarded(opt, filter, budget, token);

        result.logs.insert(result.logs.end(), pr.logs.begin(), pr.logs.end());
        result.resources.peak_memory_mb = max(result.resources.peak_memory_mb, pr.peak_memory_mb);
        result.resources.cpu_time_ms += pr.cpu_time_ms;

        if (pr.term_signal == SIGSYS) {
            security_finding finding;
            finding.severity = severity::HIGH;
            finding.type = "SANDBOX_POLICY_VIOLATION";
            finding.file = "";
            finding.message = fmt::format("The {} command was killed for invoking a forbidden system call", step_name(s));
            finding.remediation = "Remove code that performs privileged operations such as mounting, tracing or loading kernel modules";
            result.security_findings.push_back(finding);
        }

        if (pr.timed_out) {
            timed_out = true;
            if (s == step::TEST) test_exit_code = pr.exit_code;
            break;
        }
        if (pr.cancelled) {
            cancelled = true;
            break;
        }
        if (pr.exit_code == E_CANNOT_EXECUTE || pr.exit_code == E_COMMAND_NOT_FOUND)
            throw sandbox_error(fmt::format("{} tool is not available: '{}' exited with code {}: {}",
                                            step_name(s), *command, pr.exit_code, tail_lines(pr.stderr_data, 1)));

        bool signaled = pr.term_signal != 0 && pr.term_signal != SIGSYS;
        if (pr.oom) crashed = true;

        switch (s) {
            case step::LINT:
                if (signaled && !pr.oom)
                    throw sandbox_error(fmt::format("lint tool crashed with signal {}", pr.term_signal));
                parse_lint(config.runtime, pr, work_dir, result);
                break;
            case step::SECURITY_SCAN:
                if (signaled && !pr.oom)
                    throw sandbox_error(fmt::format("security scanner crashed with signal {}", pr.term_signal));
                parse_security_scan(config.runtime, pr, result);
                break;
            case step::TEST:
                test_exit_code = pr.exit_code;
                if (signaled) crashed = true;
                parse_tests(config.runtime, *command, pr, result);
                break;
        }
    }

    if (budget.dropped > 0) {
        result.output_truncated = true;
        result.logs.push_back({current_time_millis(), log_stream::STDERR, fmt::format("[output truncated: {} bytes dropped]", budget.dropped)});
        LOG(WARNING) << "Sandbox " << result.sandbox_id << " output truncated, " << budget.dropped << " bytes dropped";
    }

    result.exit_code = test_exit_code;
    if (timed_out) {
        result.status = execution_status::TIMEOUT;
    } else if (cancelled || crashed) {
        result.status = execution_status::ERROR;
    } else {
        auto is_error = [](const lint_violation &v) { return v.severity == lint_severity::ERROR; };
        bool failed = (!request.test_command.empty() && test_exit_code != 0) ||
                      any_of(result.test_results.begin(), result.test_results.end(), is_failing) ||
                      any_of(result.security_findings.begin(), result.security_findings.end(), is_blocking) ||
                      any_of(result.lint_violations.begin(), result.lint_violations.end(), is_error);
        result.status = failed ? execution_status::FAILURE : execution_status::SUCCESS;
    }

    result.end_time = current_time_millis();
    result.duration_ms = wall.duration<chrono::milliseconds>().count();
    LOG(INFO) << "Sandbox " << result.sandbox_id << " finished with status " << get_display_message(result.status)
              << " in " << result.duration_ms << "ms";
    return result;
}

}  // namespace verifier
