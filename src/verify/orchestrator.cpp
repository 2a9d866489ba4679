#include "verify/orchestrator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <chrono>
#include <future>
#include <iterator>
#include <optional>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/pattern_scanner.hpp"
#include "verify/retry_policy.hpp"
#include "verify/router.hpp"

namespace verifier {
using namespace std;

static const char *PASS_STDOUT = "Verification complete. See detailed report.";
static const char *FAIL_STDERR = "Failures detected. Review required.";
static const char *SANDBOX_TEST_NAME = "sandbox execution";
static const char *SANDBOX_SUITE_NAME = "sandbox";

struct verification_orchestrator::run_state {
    mutable mutex mut;
    verification_report report;

    /**
     * @brief 静态分析阶段得到的沙箱执行结果，测试阶段复用
     */
    optional<execution_result> execution;

    /**
     * @brief 协作方不可用时的错误描述
     */
    string fatal_error;

    /**
     * @brief 本次验证发起的协作方调用线程
     */
    vector<thread> guards;

    ~run_state() {
        for (auto &guard : guards) {
            if (guard.joinable()) guard.join();
        }
    }

    /**
     * @brief 在独立线程中调用协作方
     * 超时后调用仍在后台运行，run_state 析构时等待所有调用返回，
     * 因此 run_verification 返回后不会再有线程访问协作方。
     */
    template <typename T, typename Function>
    future<T> launch_guarded(Function fn) {
        packaged_task<T()> task(move(fn));
        future<T> result = task.get_future();
        guards.emplace_back(move(task));
        return result;
    }

    verification_report snapshot() const {
        scoped_lock lock(mut);
        return report;
    }

    template <typename Function>
    void commit(Function f) {
        scoped_lock lock(mut);
        f(report);
    }
};

orchestrator_options orchestrator_options::from_globals() {
    orchestrator_options options;
    options.dependency_vetting_sla_ms = DEPENDENCY_VETTING_SLA_MS;
    options.static_analysis_sla_ms = STATIC_ANALYSIS_SLA_MS;
    options.test_execution_sla_ms = TEST_EXECUTION_SLA_MS;
    options.contract_validation_sla_ms = CONTRACT_VALIDATION_SLA_MS;
    options.finalization_sla_ms = FINALIZATION_SLA_MS;
    return options;
}

verification_orchestrator::verification_orchestrator(sandbox_executor &executor,
                                                     dependency_vetter &vetter,
                                                     contract_validator &validator)
    : verification_orchestrator(executor, vetter, validator, orchestrator_options::from_globals()) {}

verification_orchestrator::verification_orchestrator(sandbox_executor &executor,
                                                     dependency_vetter &vetter,
                                                     contract_validator &validator,
                                                     orchestrator_options options)
    : executor(executor), vetter(vetter), validator(validator), options(move(options)) {}

void verification_orchestrator::on_repair_request(repair_listener listener) {
    repair_listeners.push_back(move(listener));
}

void verification_orchestrator::add_monitor(unique_ptr<monitor> &&m) {
    monitors.push_back(move(m));
}

void verification_orchestrator::call_monitor(const function<void(monitor &)> &callback) {
    for (auto &m : monitors) {
        try {
            callback(*m);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Monitor has crashed when reporting verification progress, " << ex.what();
        }
    }
}

void verification_orchestrator::fire_repair_request(agent_role target, const string &suggestion) {
    for (auto &listener : repair_listeners) {
        try {
            listener(target, suggestion);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Repair request listener has crashed, " << ex.what();
        }
    }
}

static void check_sla(const char *phase, const elapsed_time &elapsed, int sla_ms) {
    auto ms = elapsed.duration<chrono::milliseconds>().count();
    if (ms > sla_ms)
        LOG(WARNING) << fmt::format("Phase {} took {}ms, exceeding its {}ms SLA", phase, ms, sla_ms);
}

static void set_phase_status(verification_report &report, verification_phase phase, scan_status status) {
    switch (phase) {
        case verification_phase::DEPENDENCIES:
            report.dependencies.status = status;
            break;
        case verification_phase::STATIC_ANALYSIS:
            report.static_analysis.status = status;
            break;
        case verification_phase::TEST_EXECUTION:
            report.test_execution.status = status;
            break;
        case verification_phase::CONTRACT_VALIDATION:
            report.contract_validation.status = status;
            break;
        case verification_phase::FINALIZING:
            break;
    }
}

void verification_orchestrator::run_dependencies(run_state &state, const task_schema &task) {
    auto vetting = state.launch_guarded<vector<dependency_vet>>(
        [&vetter = vetter, artifacts = task.submit.artifacts, constraints = task.constraints] {
            return vetter.vet(artifacts, constraints);
        });

    dependency_vet_result data;
    if (vetting.wait_for(chrono::milliseconds(options.dependency_vetting_sla_ms)) == future_status::timeout) {
        LOG(WARNING) << "Dependency vetter for task " << task.meta.task_id << " did not respond within "
                     << options.dependency_vetting_sla_ms << "ms";
        data.timed_out = true;
    } else {
        data = summarize_dependencies(vetting.get());
    }

    state.commit([&](verification_report &report) {
        report.dependencies.passed = !data.timed_out && data.banned_count == 0;
        report.dependencies.data = move(data);
        report.dependencies.status = scan_status::COMPLETED;
    });
}

static execution_result timeout_result(const execution_request &request, int64_t started_at, int64_t waited_ms) {
    execution_result result;
    result.status = execution_status::TIMEOUT;
    result.start_time = started_at;
    result.end_time = current_time_millis();
    result.duration_ms = waited_ms;
    result.logs.push_back({result.end_time, log_stream::STDERR,
                           fmt::format("Sandbox execution exceeded the {}s time limit and was terminated", request.config.limits.timeout_seconds)});
    return result;
}

void verification_orchestrator::run_static_analysis(run_state &state, const task_schema &task, const execution_request &request, const cancellation_token &token) {
    cancellation_token sandbox_token = token.child();
    int64_t guard_ms = (int64_t)request.config.limits.timeout_seconds * 1000 + options.static_analysis_sla_ms;
    int64_t started_at = current_time_millis();

    auto execution = state.launch_guarded<execution_result>(
        [&executor = executor, request, sandbox_token] {
            return executor.execute(request, sandbox_token);
        });

    execution_result result;
    if (execution.wait_for(chrono::milliseconds(guard_ms)) == future_status::timeout) {
        LOG(WARNING) << "Sandbox for task " << request.task_id << " did not return within " << guard_ms << "ms, cancelling";
        sandbox_token.cancel();
        // 给沙箱销毁进程组留出时间，结果仍然记为超时
        execution.wait_for(chrono::milliseconds(options.static_analysis_sla_ms));
        result = timeout_result(request, started_at, guard_ms);
    } else {
        result = execution.get();
    }

    vector<security_finding> findings = result.security_findings;
    for (auto &finding : scan_banned_patterns(request.artifacts, task.constraints.banned_patterns))
        findings.push_back(finding);
    static_analysis_result data = summarize_static_analysis(result.lint_violations, move(findings));
    bool passed = data.critical_issues == 0 &&
                  result.status != execution_status::TIMEOUT &&
                  result.status != execution_status::ERROR;

    state.execution = move(result);
    state.commit([&](verification_report &report) {
        report.sandbox_id = state.execution->sandbox_id;
        report.static_analysis.passed = passed;
        report.static_analysis.data = move(data);
        report.static_analysis.status = scan_status::COMPLETED;
    });
}

void verification_orchestrator::run_test_execution(run_state &state, const execution_request &request) {
    if (!state.execution) throw internal_error("test phase started without a sandbox execution");
    const execution_result &execution = *state.execution;

    vector<test_suite_result> suites = group_test_suites(execution.test_framework, execution.test_results);
    if (execution.status == execution_status::TIMEOUT || execution.status == execution_status::ERROR) {
        test_result synthetic;
        synthetic.name = SANDBOX_TEST_NAME;
        synthetic.status = test_status::ERROR;
        synthetic.duration_ms = execution.duration_ms;
        if (execution.status == execution_status::TIMEOUT)
            synthetic.error_message = fmt::format("Execution exceeded the {}s time limit", request.config.limits.timeout_seconds);
        else
            synthetic.error_message = fmt::format("Sandbox execution terminated abnormally with exit code {}", execution.exit_code);
        suites.push_back(summarize_tests(SANDBOX_SUITE_NAME, execution.test_framework, {synthetic}));
    }

    test_execution_result data = summarize_test_execution(move(suites), execution.coverage);
    if (data.duration_ms == 0) data.duration_ms = execution.duration_ms;

    state.commit([&](verification_report &report) {
        report.test_execution.passed = data.failed == 0 && data.errors == 0;
        report.test_execution.data = move(data);
        report.test_execution.status = scan_status::COMPLETED;
    });
}

void verification_orchestrator::run_contract_validation(run_state &state, const task_schema &task) {
    auto validation = state.launch_guarded<contract_validation_result>(
        [&validator = validator, contract = task.contract, artifacts = task.submit.artifacts] {
            return validator.validate(contract, artifacts);
        });

    contract_validation_result data;
    if (validation.wait_for(chrono::milliseconds(options.contract_validation_sla_ms)) == future_status::timeout) {
        LOG(WARNING) << "Contract validator for task " << task.meta.task_id << " did not respond within "
                     << options.contract_validation_sla_ms << "ms";
        data.spec_url = task.contract.spec_url;
        data.passed = false;
        data.timed_out = true;
    } else {
        data = validation.get();
    }

    state.commit([&](verification_report &report) {
        report.contract_validation.passed = !data.timed_out && data.violations.empty();
        report.contract_validation.data = move(data);
        report.contract_validation.status = scan_status::COMPLETED;
    });
}

void verification_orchestrator::finalize(run_state &state, const task_schema &task) {
    verifier_output output = compose_output(state.snapshot(), task,
                                            state.execution ? &*state.execution : nullptr,
                                            state.fatal_error);
    state.commit([&](verification_report &report) {
        report.output = move(output);
        report.completed_at = current_time_millis();
        if (report.status != scan_status::FAILED)
            report.status = scan_status::COMPLETED;
    });
}

verification_report verification_orchestrator::run_verification(const task_schema &task) {
    return run_verification(task, cancellation_token());
}

verification_report verification_orchestrator::run_verification(const task_schema &task, const cancellation_token &token) {
    execution_request request = build_request(task.meta.task_id, task.submit.subtask_id, task.submit.agent_role,
                                              task.submit.artifacts, task.submit.runtime);
    if (options.customize_config) options.customize_config(request.config);
    validate_request(request);

    run_state state;
    state.report = create_empty_report(task.meta.task_id);
    state.report.status = scan_status::RUNNING;
    const string report_id = state.report.report_id;
    LOG(INFO) << fmt::format("Verification {} started: task {}, subtask {}, iteration {}/{}",
                             report_id, task.meta.task_id, task.submit.subtask_id, task.meta.iteration, task.meta.max_repair_budget);
    call_monitor([&](monitor &m) { m.start_verification(state.snapshot()); });

    const verification_phase phases[] = {
        verification_phase::DEPENDENCIES,
        verification_phase::STATIC_ANALYSIS,
        verification_phase::TEST_EXECUTION,
        verification_phase::CONTRACT_VALIDATION};
    for (size_t i = 0; i < size(phases); ++i) {
        verification_phase phase = phases[i];
        if (token.is_cancelled()) {
            LOG(WARNING) << "Verification " << report_id << " cancelled before phase " << get_display_message(phase);
            throw verification_cancelled(fmt::format("verification of task {} cancelled", task.meta.task_id));
        }

        call_monitor([&](monitor &m) { m.phase_started(state.snapshot(), phase); });
        state.commit([&](verification_report &report) { set_phase_status(report, phase, scan_status::RUNNING); });

        elapsed_time elapsed;
        int sla_ms = 0;
        try {
            switch (phase) {
                case verification_phase::DEPENDENCIES:
                    sla_ms = options.dependency_vetting_sla_ms;
                    run_dependencies(state, task);
                    break;
                case verification_phase::STATIC_ANALYSIS:
                    sla_ms = request.config.limits.timeout_seconds * 1000 + options.static_analysis_sla_ms;
                    run_static_analysis(state, task, request, token);
                    break;
                case verification_phase::TEST_EXECUTION:
                    sla_ms = options.test_execution_sla_ms;
                    run_test_execution(state, request);
                    break;
                case verification_phase::CONTRACT_VALIDATION:
                    sla_ms = options.contract_validation_sla_ms;
                    run_contract_validation(state, task);
                    break;
                case verification_phase::FINALIZING:
                    break;
            }
        } catch (verification_cancelled &) {
            throw;
        } catch (invalid_request &) {
            throw;
        } catch (std::exception &ex) {
            state.fatal_error = fmt::format("{} phase failed: {}", get_display_message(phase), ex.what());
            LOG(ERROR) << "Verification " << report_id << ": " << state.fatal_error;
            state.commit([&](verification_report &report) {
                for (size_t j = i; j < size(phases); ++j) {
                    set_phase_status(report, phases[j], scan_status::FAILED);
                }
                report.status = scan_status::FAILED;
            });
        }
        check_sla(get_display_message(phase), elapsed, sla_ms);
        call_monitor([&](monitor &m) { m.phase_completed(state.snapshot(), phase); });

        if (!state.fatal_error.empty()) break;
    }

    // 进入 finalizing 之后不再响应取消
    call_monitor([&](monitor &m) { m.phase_started(state.snapshot(), verification_phase::FINALIZING); });
    elapsed_time elapsed;
    finalize(state, task);
    check_sla(get_display_message(verification_phase::FINALIZING), elapsed, options.finalization_sla_ms);

    verification_report report = state.snapshot();
    call_monitor([&](monitor &m) { m.phase_completed(report, verification_phase::FINALIZING); });

    if (report.output.verdict == verdict::FAIL)
        fire_repair_request(*report.output.target_agent, report.output.repair_suggestion);

    call_monitor([&](monitor &m) { m.end_verification(report); });
    return report;
}

struct diagnosis {
    failure_category category;
    verifier::severity severity;
    string feedback;
    string repair;
};

static string location(const string &file, optional<int> line) {
    if (file.empty()) return "sandbox";
    return line ? fmt::format("{}:{}", file, *line) : file;
}

static diagnosis diagnose_security(const verification_report &report) {
    diagnosis d{failure_category::SECURITY, severity::HIGH, "", ""};
    auto &analysis = report.static_analysis.data;
    auto &findings = analysis.security_findings;

    auto first = find_if(findings.begin(), findings.end(), is_blocking);
    if (first == findings.end()) throw internal_error("security failure without a blocking finding");
    for (auto &finding : findings)
        if (is_blocking(finding)) d.severity = max(d.severity, finding.severity);

    d.feedback = fmt::format("Security scan found {} critical issues. {} at {}: {}",
                             analysis.critical_issues, first->type, location(first->file, first->line), first->message);
    if (report.dependencies.data.banned_count > 0)
        d.feedback += fmt::format(" Dependency vetting also found {} banned dependencies.", report.dependencies.data.banned_count);
    d.repair = first->remediation ? *first->remediation
                                  : fmt::format("Fix the {} issue at {}.", first->type, location(first->file, first->line));
    return d;
}

static diagnosis diagnose_contract(const verification_report &report) {
    diagnosis d{failure_category::CONTRACT, severity::LOW, "", ""};
    auto &data = report.contract_validation.data;
    auto &violations = data.violations;
    if (violations.empty()) {
        d.severity = severity::HIGH;
        d.feedback = data.timed_out
                         ? fmt::format("Contract validation did not finish in time, the implementation was not checked against {}.", data.spec_url)
                         : "Contract validation failed without reporting a violation.";
        d.repair = "Resubmit so the implementation can be validated against the shared contract.";
        return d;
    }
    for (auto &violation : violations) d.severity = max(d.severity, violation.severity);

    auto &first = violations.front();
    d.feedback = fmt::format("Contract validation failed: {} violations found. {} {} ({}): expected {}, got {}.",
                             violations.size(), first.method, first.endpoint, get_display_message(first.type), first.expected, first.actual);
    if (first.type == violation_type::MISSING_ENDPOINT)
        d.repair = fmt::format("Implement {} {} as declared in the shared contract.", first.method, first.endpoint);
    else
        d.repair = fmt::format("Change {} {} to match the shared contract: {}.", first.method, first.endpoint, first.expected);
    return d;
}

/**
 * @brief 测试失败一律按 HIGH 处理，由 Planner Agent 重新规划
 */
static diagnosis diagnose_logic(const verification_report &report, const execution_result *execution) {
    auto &data = report.test_execution.data;
    bool aborted = execution && (execution->status == execution_status::TIMEOUT || execution->status == execution_status::ERROR);
    diagnosis d{failure_category::LOGIC, severity::HIGH, "", ""};

    const test_result *first = nullptr, *synthetic = nullptr;
    for (auto &suite : data.suites) {
        for (auto &test : suite.tests) {
            if (!is_failing(test)) continue;
            if (!first) first = &test;
            if (!synthetic && suite.name == SANDBOX_SUITE_NAME && test.name == SANDBOX_TEST_NAME) synthetic = &test;
        }
    }
    // 执行异常终止时优先报告合成的测试结果
    if (aborted && synthetic) first = synthetic;

    if (!first) {
        d.feedback = "Test execution failed.";
        d.repair = "Run the test suite locally and fix the failures.";
        return d;
    }

    d.feedback = fmt::format("Test execution failed: {} tests failed. {} failed", data.failed + data.errors, first->name);
    if (first->error_message) d.feedback += ": " + *first->error_message;

    if (execution && execution->status == execution_status::TIMEOUT)
        d.repair = "Look for infinite loops or blocking calls and make the tests finish within the time limit.";
    else if (aborted)
        d.repair = "Find the crash or excessive memory use that terminated the tests and fix it.";
    else if (first->file.empty())
        d.repair = fmt::format("Fix the behaviour checked by {}.", first->name);
    else
        d.repair = fmt::format("Fix the behaviour checked by {} in {}.", first->name, first->file);
    return d;
}

static diagnosis diagnose_dependencies(const verification_report &report) {
    diagnosis d{failure_category::SYNTAX, severity::LOW, "", ""};
    auto &deps = report.dependencies.data;
    if (deps.timed_out) {
        d.feedback = "Dependency vetting did not finish in time, the declared dependencies are unverified.";
        d.repair = "Declare only the dependencies the code imports, then resubmit.";
        return d;
    }

    auto &list = deps.dependencies;
    auto dep = find_if(list.begin(), list.end(), [](const dependency_vet &v) { return v.status == dependency_status::BANNED; });
    if (dep == list.end()) {
        d.feedback = "Dependency vetting failed.";
        d.repair = "Review the dependency manifests against the dependency policy.";
        return d;
    }
    d.feedback = fmt::format("Dependency vetting found {} banned dependencies. {} in {}: {}",
                             deps.banned_count, dep->name, dep->source, dep->reason.value_or("banned"));
    d.repair = fmt::format("Remove {} from {} or replace it with an allowed dependency.", dep->name, dep->source);
    return d;
}

static diagnosis diagnose_syntax(const verification_report &report) {
    if (!report.dependencies.passed) return diagnose_dependencies(report);

    diagnosis d{failure_category::SYNTAX, severity::LOW, "", ""};
    auto &analysis = report.static_analysis.data;
    d.feedback = fmt::format("Static analysis found {} issues.", analysis.total_issues);
    d.repair = "Run auto-fix for linting issues.";

    auto &lint = analysis.lint_violations;
    auto first = find_if(lint.begin(), lint.end(), [](const lint_violation &v) { return v.severity == lint_severity::ERROR; });
    if (first == lint.end()) first = lint.begin();
    if (first != lint.end()) {
        d.feedback += fmt::format(" {} at {}:{}:{}: {}", first->rule, first->file, first->line, first->column, first->message);
        if (first->suggestion) d.repair = *first->suggestion;
        return d;
    }

    auto &findings = analysis.security_findings;
    if (!findings.empty()) {
        auto &finding = findings.front();
        d.feedback += fmt::format(" {} at {}: {}", finding.type, location(finding.file, finding.line), finding.message);
        if (finding.remediation) d.repair = *finding.remediation;
    }
    return d;
}

static execution_logs_summary summarize_logs(const verification_report &report, const execution_result *execution, bool failed) {
    execution_logs_summary summary;
    vector<string> out, err;
    if (execution) {
        for (auto &log : execution->logs)
            (log.stream == log_stream::STDOUT ? out : err).push_back(log.content);
    }
    summary.stdout_text = out.empty() ? PASS_STDOUT : boost::algorithm::join(out, "\n");
    summary.stderr_text = err.empty() ? (failed ? FAIL_STDERR : "") : boost::algorithm::join(err, "\n");

    if (execution && execution->exit_code > 0)
        summary.exit_code = execution->exit_code;
    else
        summary.exit_code = failed ? E_VERIFICATION_FAILED : E_SUCCESS;

    summary.execution_time_ms = execution ? execution->duration_ms : current_time_millis() - report.started_at;
    return summary;
}

verifier_output compose_output(const verification_report &report,
                               const task_schema &task,
                               const execution_result *execution,
                               const string &fatal_error) {
    verifier_output output;
    output.iteration_count = task.meta.iteration;
    output.budget_remaining = max(0, task.meta.max_repair_budget - task.meta.iteration);

    bool all_passed = fatal_error.empty() &&
                      report.dependencies.passed &&
                      report.static_analysis.passed &&
                      report.test_execution.passed &&
                      report.contract_validation.passed;
    output.execution_logs = summarize_logs(report, execution, !all_passed);

    if (all_passed) {
        output.verdict = verdict::PASS;
        output.category = failure_category::NONE;
        output.feedback_to_agent = "All verification phases passed.";
        output.retry_recommended = false;
        return output;
    }

    diagnosis d;
    if (!fatal_error.empty()) {
        // 协作方不可用时无法确认代码可以运行，按设计层面的问题升级
        d = {failure_category::LOGIC, severity::HIGH,
             fmt::format("Verification could not be completed: {}", fatal_error),
             "Make sure the artifacts can be installed and executed in the sandbox, then resubmit."};
    } else if (!report.static_analysis.passed && report.static_analysis.data.critical_issues > 0) {
        d = diagnose_security(report);
    } else if (!report.contract_validation.passed) {
        d = diagnose_contract(report);
    } else if (!report.test_execution.passed) {
        d = diagnose_logic(report, execution);
    } else {
        // 其余情况：未通过的依赖审查或静态检查问题
        d = diagnose_syntax(report);
    }

    output.verdict = verdict::FAIL;
    output.category = d.category;
    output.feedback_to_agent = d.feedback;
    output.repair_suggestion = d.repair;
    output.target_agent = route(d.category, d.severity, task.submit.runtime);
    output.retry_recommended = should_retry(task.meta.iteration, task.meta.max_repair_budget, d.category);
    return output;
}

}  // namespace verifier
