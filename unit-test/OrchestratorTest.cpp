#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/mock_collaborators.hpp"
#include "verify/orchestrator.hpp"

using namespace std;
using namespace verifier;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class OrchestratorTest : public ::testing::Test {
protected:
    NiceMock<mock::sandbox_executor> executor;
    NiceMock<mock::dependency_vetter> vetter;
    NiceMock<mock::contract_validator> validator;

    void SetUp() override {
        ON_CALL(executor, execute(_, _)).WillByDefault(Return(mock::passing_execution()));
        ON_CALL(vetter, vet(_, _)).WillByDefault(Return(vector<dependency_vet>{mock::approved_dependency("requests", "2.31.0")}));
        ON_CALL(validator, validate(_, _)).WillByDefault(Return(mock::passing_contract()));
    }

    static orchestrator_options fast_options() {
        orchestrator_options options;
        options.dependency_vetting_sla_ms = 1000;
        options.static_analysis_sla_ms = 500;
        options.test_execution_sla_ms = 1000;
        options.contract_validation_sla_ms = 1000;
        options.finalization_sla_ms = 500;
        return options;
    }

    verification_report run(const task_schema &task) {
        verification_orchestrator orchestrator(executor, vetter, validator, fast_options());
        return orchestrator.run_verification(task);
    }
};

TEST_F(OrchestratorTest, AllPhasesPassTest) {
    verification_report report = run(mock::python_task());

    EXPECT_EQ(report.status, scan_status::COMPLETED);
    EXPECT_TRUE(report.completed_at.has_value());
    EXPECT_EQ(report.sandbox_id, "sbx_mock");
    EXPECT_EQ(report.task_id, "task-1");

    EXPECT_EQ(report.dependencies.status, scan_status::COMPLETED);
    EXPECT_EQ(report.static_analysis.status, scan_status::COMPLETED);
    EXPECT_EQ(report.test_execution.status, scan_status::COMPLETED);
    EXPECT_EQ(report.contract_validation.status, scan_status::COMPLETED);
    EXPECT_TRUE(report.dependencies.passed);
    EXPECT_TRUE(report.static_analysis.passed);
    EXPECT_TRUE(report.test_execution.passed);
    EXPECT_TRUE(report.contract_validation.passed);

    EXPECT_EQ(report.output.verdict, verdict::PASS);
    EXPECT_EQ(report.output.category, failure_category::NONE);
    EXPECT_FALSE(report.output.target_agent.has_value());
    EXPECT_FALSE(report.output.retry_recommended);
    EXPECT_EQ(report.output.iteration_count, 1);
    EXPECT_EQ(report.output.budget_remaining, 4);

    EXPECT_EQ(report.test_execution.data.total, 2);
    EXPECT_EQ(report.test_execution.data.passed, 2);
    ASSERT_EQ(report.test_execution.data.suites.size(), 1u);
    EXPECT_EQ(report.test_execution.data.suites[0].name, "tests/test_main.py");
    EXPECT_EQ(report.test_execution.data.suites[0].framework, "pytest");
    EXPECT_EQ(report.output.execution_logs.stdout_text, "2 passed in 0.12s");
    EXPECT_EQ(report.output.execution_logs.stderr_text, "");
    EXPECT_EQ(report.output.execution_logs.exit_code, 0);
    EXPECT_EQ(report.output.execution_logs.execution_time_ms, 1200);
}

TEST_F(OrchestratorTest, CriticalFindingOutranksFailedTestTest) {
    execution_result result = mock::passing_execution();
    result.status = execution_status::FAILURE;
    result.exit_code = 1;
    result.test_results.push_back(mock::failed_test("test_div", "ZeroDivisionError"));
    security_finding finding;
    finding.severity = severity::CRITICAL;
    finding.type = "HARDCODED_SECRET";
    finding.file = "app/main.py";
    finding.line = 3;
    finding.message = "Possible hardcoded secret";
    finding.remediation = "Load the secret from an environment variable";
    result.security_findings.push_back(finding);
    ON_CALL(executor, execute(_, _)).WillByDefault(Return(result));

    verification_report report = run(mock::python_task());

    EXPECT_FALSE(report.static_analysis.passed);
    EXPECT_EQ(report.static_analysis.data.critical_issues, 1);
    EXPECT_FALSE(report.test_execution.passed);
    EXPECT_EQ(report.output.verdict, verdict::FAIL);
    EXPECT_EQ(report.output.category, failure_category::SECURITY);
    EXPECT_EQ(report.output.target_agent, agent_role::SECOPS_AGENT);
    EXPECT_EQ(report.output.repair_suggestion, "Load the secret from an environment variable");
    EXPECT_NE(report.output.feedback_to_agent.find("HARDCODED_SECRET at app/main.py:3"), string::npos);
    EXPECT_EQ(report.output.execution_logs.exit_code, 1);
}

TEST_F(OrchestratorTest, ContractViolationRoutesToNegotiatorTest) {
    contract_validation_result contract = mock::passing_contract();
    contract.total_endpoints = 2;
    contract.validated = 1;
    contract_violation violation;
    violation.endpoint = "/users";
    violation.method = "POST";
    violation.type = violation_type::MISSING_ENDPOINT;
    violation.expected = "POST /users is implemented";
    violation.actual = "No matching route handler found";
    violation.severity = severity::HIGH;
    contract.violations.push_back(violation);
    contract.passed = false;
    ON_CALL(validator, validate(_, _)).WillByDefault(Return(contract));

    verification_report report = run(mock::python_task());

    EXPECT_TRUE(report.static_analysis.passed);
    EXPECT_TRUE(report.test_execution.passed);
    EXPECT_FALSE(report.contract_validation.passed);
    EXPECT_EQ(report.output.verdict, verdict::FAIL);
    EXPECT_EQ(report.output.category, failure_category::CONTRACT);
    EXPECT_EQ(report.output.target_agent, agent_role::CONTRACT_NEGOTIATOR);
    EXPECT_EQ(report.output.repair_suggestion, "Implement POST /users as declared in the shared contract.");
    EXPECT_TRUE(report.output.retry_recommended);
    EXPECT_EQ(report.output.execution_logs.stderr_text, "Failures detected. Review required.");
    EXPECT_EQ(report.output.execution_logs.exit_code, 1);
}

TEST_F(OrchestratorTest, RetryStopsWhenBudgetIsExhaustedTest) {
    execution_result result = mock::passing_execution();
    result.status = execution_status::FAILURE;
    result.exit_code = 1;
    result.test_results.push_back(mock::failed_test("test_div", "ZeroDivisionError"));
    ON_CALL(executor, execute(_, _)).WillByDefault(Return(result));

    task_schema task = mock::python_task();
    task.meta.iteration = 4;
    verification_report report = run(task);
    EXPECT_TRUE(report.output.retry_recommended);
    EXPECT_EQ(report.output.budget_remaining, 1);
    EXPECT_EQ(report.output.iteration_count, 4);

    task.meta.iteration = 5;
    report = run(task);
    EXPECT_FALSE(report.output.retry_recommended);
    EXPECT_EQ(report.output.budget_remaining, 0);

    task.meta.iteration = 7;
    report = run(task);
    EXPECT_FALSE(report.output.retry_recommended);
    EXPECT_EQ(report.output.budget_remaining, 0);
}

TEST_F(OrchestratorTest, SandboxTimeoutIsLogicFailureTest) {
    execution_result result = mock::passing_execution();
    result.status = execution_status::TIMEOUT;
    result.exit_code = -1;
    result.test_results.clear();
    result.logs.clear();
    ON_CALL(executor, execute(_, _)).WillByDefault(Return(result));

    verification_report report = run(mock::python_task());

    EXPECT_EQ(report.static_analysis.status, scan_status::COMPLETED);
    EXPECT_FALSE(report.static_analysis.passed);
    EXPECT_EQ(report.test_execution.status, scan_status::COMPLETED);
    EXPECT_FALSE(report.test_execution.passed);
    ASSERT_EQ(report.test_execution.data.suites.size(), 1u);
    EXPECT_EQ(report.test_execution.data.suites[0].name, "sandbox");
    ASSERT_EQ(report.test_execution.data.suites[0].tests.size(), 1u);
    EXPECT_EQ(report.test_execution.data.suites[0].tests[0].status, test_status::ERROR);
    EXPECT_EQ(report.test_execution.data.errors, 1);

    EXPECT_EQ(report.output.verdict, verdict::FAIL);
    EXPECT_EQ(report.output.category, failure_category::LOGIC);
    EXPECT_EQ(report.output.target_agent, agent_role::PLANNER_AGENT);
    EXPECT_NE(report.output.repair_suggestion.find("infinite loops"), string::npos);
    EXPECT_NE(report.output.feedback_to_agent.find("30s time limit"), string::npos);
}

TEST_F(OrchestratorTest, FailedTestRoutesToPlannerTest) {
    execution_result result = mock::passing_execution();
    result.status = execution_status::FAILURE;
    result.exit_code = 1;
    result.test_results.push_back(mock::failed_test("test_div", "ZeroDivisionError: division by zero"));
    ON_CALL(executor, execute(_, _)).WillByDefault(Return(result));

    verification_report report = run(mock::python_task());
    EXPECT_EQ(report.output.category, failure_category::LOGIC);
    EXPECT_EQ(report.output.target_agent, agent_role::PLANNER_AGENT);
    EXPECT_EQ(report.output.feedback_to_agent,
              "Test execution failed: 1 tests failed. test_div failed: ZeroDivisionError: division by zero");
    EXPECT_EQ(report.output.repair_suggestion, "Fix the behaviour checked by test_div in tests/test_main.py.");

    task_schema task = mock::python_task();
    task.submit.runtime = runtime::TYPESCRIPT;
    task.submit.artifacts = {{"src/index.ts", "export const add = (a: number, b: number) => a + b;\n", artifact_type::SOURCE}};
    report = run(task);
    EXPECT_EQ(report.output.target_agent, agent_role::PLANNER_AGENT);
}

TEST_F(OrchestratorTest, TestsAreGroupedIntoSuitesByFileTest) {
    execution_result result = mock::passing_execution();
    result.status = execution_status::FAILURE;
    result.exit_code = 1;
    result.coverage = 87.5;
    test_result other = mock::failed_test("test_parse", "ValueError");
    other.file = "tests/test_parser.py";
    result.test_results.push_back(other);
    result.test_results.push_back(mock::passed_test("test_mul"));
    ON_CALL(executor, execute(_, _)).WillByDefault(Return(result));

    verification_report report = run(mock::python_task());
    auto &data = report.test_execution.data;
    ASSERT_EQ(data.suites.size(), 2u);
    EXPECT_EQ(data.suites[0].name, "tests/test_main.py");
    EXPECT_EQ(data.suites[0].total, 3);
    EXPECT_EQ(data.suites[0].failed, 0);
    EXPECT_EQ(data.suites[1].name, "tests/test_parser.py");
    EXPECT_EQ(data.suites[1].total, 1);
    EXPECT_EQ(data.suites[1].failed, 1);
    EXPECT_EQ(data.total, 4);
    EXPECT_EQ(data.passed, 3);
    EXPECT_EQ(data.failed, 1);
    ASSERT_TRUE(data.overall_coverage.has_value());
    EXPECT_DOUBLE_EQ(*data.overall_coverage, 87.5);
    EXPECT_FALSE(report.test_execution.passed);
    EXPECT_EQ(report.output.repair_suggestion, "Fix the behaviour checked by test_parse in tests/test_parser.py.");
}

TEST_F(OrchestratorTest, BannedDependencyAloneFallsBackToSyntaxTest) {
    dependency_vet banned = mock::approved_dependency("leftpad", "1.0.0");
    banned.status = dependency_status::BANNED;
    banned.reason = "Dependency is banned by policy";
    ON_CALL(vetter, vet(_, _)).WillByDefault(Return(vector<dependency_vet>{banned}));

    verification_report report = run(mock::python_task());

    EXPECT_FALSE(report.dependencies.passed);
    EXPECT_EQ(report.dependencies.data.banned_count, 1);
    EXPECT_TRUE(report.static_analysis.passed);
    EXPECT_EQ(report.output.verdict, verdict::FAIL);
    EXPECT_EQ(report.output.category, failure_category::SYNTAX);
    EXPECT_EQ(report.output.target_agent, agent_role::AUTO_LINTER_AGENT);
    EXPECT_EQ(report.output.repair_suggestion, "Remove leftpad from requirements.txt or replace it with an allowed dependency.");
}

TEST_F(OrchestratorTest, ContractViolationOutranksBannedDependencyTest) {
    dependency_vet banned = mock::approved_dependency("leftpad", "1.0.0");
    banned.status = dependency_status::BANNED;
    ON_CALL(vetter, vet(_, _)).WillByDefault(Return(vector<dependency_vet>{banned}));

    contract_validation_result contract = mock::passing_contract();
    contract_violation violation;
    violation.endpoint = "/token";
    violation.method = "POST";
    violation.type = violation_type::SCHEMA_MISMATCH;
    violation.expected = "expires_in is a number";
    violation.actual = "expires_in is a string";
    violation.severity = severity::HIGH;
    contract.violations.push_back(violation);
    contract.passed = false;
    ON_CALL(validator, validate(_, _)).WillByDefault(Return(contract));

    verification_report report = run(mock::python_task());

    EXPECT_FALSE(report.dependencies.passed);
    EXPECT_FALSE(report.contract_validation.passed);
    EXPECT_EQ(report.output.category, failure_category::CONTRACT);
    EXPECT_EQ(report.output.target_agent, agent_role::CONTRACT_NEGOTIATOR);
    EXPECT_EQ(report.output.repair_suggestion, "Change POST /token to match the shared contract: expires_in is a number.");
}

TEST_F(OrchestratorTest, BannedPatternFailsStaticAnalysisTest) {
    task_schema task = mock::python_task();
    task.constraints.banned_patterns = {"pickle.loads"};
    task.submit.artifacts[0].content = "import pickle\n\ndef load(data):\n    return pickle.loads(data)\n";

    verification_report report = run(task);

    EXPECT_FALSE(report.static_analysis.passed);
    EXPECT_EQ(report.static_analysis.data.critical_issues, 1);
    ASSERT_EQ(report.static_analysis.data.security_findings.size(), 1u);
    EXPECT_EQ(report.static_analysis.data.security_findings[0].type, "BANNED_PATTERN");
    EXPECT_EQ(report.static_analysis.data.security_findings[0].line, 4);
    EXPECT_EQ(report.output.category, failure_category::SECURITY);
}

TEST_F(OrchestratorTest, UnavailableVetterFailsAllPhasesTest) {
    ON_CALL(vetter, vet(_, _)).WillByDefault(Throw(sandbox_error("connection refused")));
    EXPECT_CALL(executor, execute(_, _)).Times(0);
    EXPECT_CALL(validator, validate(_, _)).Times(0);

    verification_report report = run(mock::python_task());

    EXPECT_EQ(report.status, scan_status::FAILED);
    EXPECT_EQ(report.dependencies.status, scan_status::FAILED);
    EXPECT_EQ(report.static_analysis.status, scan_status::FAILED);
    EXPECT_EQ(report.test_execution.status, scan_status::FAILED);
    EXPECT_EQ(report.contract_validation.status, scan_status::FAILED);
    EXPECT_TRUE(report.completed_at.has_value());

    EXPECT_EQ(report.output.verdict, verdict::FAIL);
    EXPECT_EQ(report.output.category, failure_category::LOGIC);
    EXPECT_EQ(report.output.target_agent, agent_role::PLANNER_AGENT);
    EXPECT_NE(report.output.feedback_to_agent.find("dependencies phase failed: connection refused"), string::npos);
}

TEST_F(OrchestratorTest, UnavailableSandboxKeepsEarlierPhasesTest) {
    ON_CALL(executor, execute(_, _)).WillByDefault(Throw(sandbox_error("sandbox image missing")));
    EXPECT_CALL(validator, validate(_, _)).Times(0);

    verification_report report = run(mock::python_task());

    EXPECT_EQ(report.status, scan_status::FAILED);
    EXPECT_EQ(report.dependencies.status, scan_status::COMPLETED);
    EXPECT_TRUE(report.dependencies.passed);
    EXPECT_EQ(report.static_analysis.status, scan_status::FAILED);
    EXPECT_EQ(report.test_execution.status, scan_status::FAILED);
    EXPECT_EQ(report.contract_validation.status, scan_status::FAILED);
    EXPECT_EQ(report.output.category, failure_category::LOGIC);
    EXPECT_NE(report.output.feedback_to_agent.find("linting phase failed"), string::npos);
}

TEST_F(OrchestratorTest, SlowVetterCompletesPhaseAsFailedTest) {
    ON_CALL(vetter, vet(_, _)).WillByDefault(Invoke([](const vector<code_artifact> &, const security_constraints &) {
        this_thread::sleep_for(chrono::milliseconds(300));
        return vector<dependency_vet>{};
    }));
    EXPECT_CALL(executor, execute(_, _)).Times(1);
    EXPECT_CALL(validator, validate(_, _)).Times(1);
    orchestrator_options options = fast_options();
    options.dependency_vetting_sla_ms = 50;
    verification_orchestrator orchestrator(executor, vetter, validator, options);

    verification_report report = orchestrator.run_verification(mock::python_task());
    EXPECT_EQ(report.status, scan_status::COMPLETED);
    EXPECT_EQ(report.dependencies.status, scan_status::COMPLETED);
    EXPECT_FALSE(report.dependencies.passed);
    EXPECT_TRUE(report.dependencies.data.timed_out);
    EXPECT_EQ(report.static_analysis.status, scan_status::COMPLETED);
    EXPECT_EQ(report.test_execution.status, scan_status::COMPLETED);
    EXPECT_EQ(report.contract_validation.status, scan_status::COMPLETED);
    EXPECT_TRUE(report.contract_validation.passed);

    EXPECT_EQ(report.output.verdict, verdict::FAIL);
    EXPECT_EQ(report.output.category, failure_category::SYNTAX);
    EXPECT_NE(report.output.feedback_to_agent.find("Dependency vetting did not finish in time"), string::npos);
}

TEST_F(OrchestratorTest, SlowValidatorCompletesPhaseAsFailedTest) {
    ON_CALL(validator, validate(_, _)).WillByDefault(Invoke([](const shared_contract &, const vector<code_artifact> &) {
        this_thread::sleep_for(chrono::milliseconds(300));
        return mock::passing_contract();
    }));
    orchestrator_options options = fast_options();
    options.contract_validation_sla_ms = 50;
    verification_orchestrator orchestrator(executor, vetter, validator, options);

    task_schema task = mock::python_task();
    task.contract.spec_url = "file:///srv/contracts/openapi.json";
    verification_report report = orchestrator.run_verification(task);
    EXPECT_EQ(report.status, scan_status::COMPLETED);
    EXPECT_EQ(report.contract_validation.status, scan_status::COMPLETED);
    EXPECT_FALSE(report.contract_validation.passed);
    EXPECT_TRUE(report.contract_validation.data.timed_out);
    EXPECT_EQ(report.contract_validation.data.spec_url, "file:///srv/contracts/openapi.json");

    EXPECT_EQ(report.output.category, failure_category::CONTRACT);
    EXPECT_EQ(report.output.target_agent, agent_role::CONTRACT_NEGOTIATOR);
    EXPECT_NE(report.output.feedback_to_agent.find("not checked against file:///srv/contracts/openapi.json"), string::npos);
}

/**
 * 超时后仍在运行的审查器，返回前会读取自己的成员
 */
struct slow_vetter : public dependency_vetter {
    vector<dependency_vet> dependencies{mock::approved_dependency("requests", "2.31.0")};
    atomic<bool> finished{false};

    vector<dependency_vet> vet(const vector<code_artifact> &, const security_constraints &) override {
        this_thread::sleep_for(chrono::milliseconds(200));
        finished = true;
        return dependencies;
    }
};

TEST_F(OrchestratorTest, RunWaitsForTimedOutCollaboratorTest) {
    auto slow = make_unique<slow_vetter>();
    orchestrator_options options = fast_options();
    options.dependency_vetting_sla_ms = 50;

    verification_report report;
    {
        verification_orchestrator orchestrator(executor, *slow, validator, options);
        report = orchestrator.run_verification(mock::python_task());
        EXPECT_TRUE(slow->finished);
    }
    slow.reset();

    EXPECT_TRUE(report.dependencies.data.timed_out);
    EXPECT_TRUE(report.dependencies.data.dependencies.empty());
}

TEST_F(OrchestratorTest, HungSandboxIsCancelledTest) {
    ON_CALL(executor, execute(_, _)).WillByDefault(Invoke([](const execution_request &, const cancellation_token &token) {
        auto deadline = chrono::steady_clock::now() + chrono::seconds(20);
        while (!token.is_cancelled() && chrono::steady_clock::now() < deadline)
            this_thread::sleep_for(chrono::milliseconds(10));
        return mock::passing_execution();
    }));
    orchestrator_options options = fast_options();
    options.static_analysis_sla_ms = 200;
    options.customize_config = [](sandbox_config &config) { config.limits.timeout_seconds = 5; };
    verification_orchestrator orchestrator(executor, vetter, validator, options);

    verification_report report = orchestrator.run_verification(mock::python_task());

    EXPECT_EQ(report.static_analysis.status, scan_status::COMPLETED);
    EXPECT_FALSE(report.static_analysis.passed);
    EXPECT_FALSE(report.test_execution.passed);
    EXPECT_EQ(report.output.category, failure_category::LOGIC);
    EXPECT_EQ(report.output.target_agent, agent_role::PLANNER_AGENT);
    EXPECT_NE(report.output.feedback_to_agent.find("5s time limit"), string::npos);
}

TEST_F(OrchestratorTest, InvalidTaskProducesNoReportTest) {
    EXPECT_CALL(vetter, vet(_, _)).Times(0);
    EXPECT_CALL(executor, execute(_, _)).Times(0);

    verification_orchestrator orchestrator(executor, vetter, validator, fast_options());

    task_schema empty = mock::python_task();
    empty.submit.artifacts.clear();
    EXPECT_THROW(orchestrator.run_verification(empty), invalid_request);

    task_schema escaping = mock::python_task();
    escaping.submit.artifacts[0].filename = "../outside.py";
    EXPECT_THROW(orchestrator.run_verification(escaping), invalid_request);

    orchestrator_options options = fast_options();
    options.customize_config = [](sandbox_config &config) { config.limits.memory_mb = 1; };
    verification_orchestrator strict(executor, vetter, validator, options);
    EXPECT_THROW(strict.run_verification(mock::python_task()), invalid_request);
}

TEST_F(OrchestratorTest, CustomizedConfigReachesSandboxTest) {
    execution_request captured;
    EXPECT_CALL(executor, execute(_, _)).WillOnce(Invoke([&](const execution_request &request, const cancellation_token &) {
        captured = request;
        return mock::passing_execution();
    }));
    orchestrator_options options = fast_options();
    options.customize_config = [](sandbox_config &config) {
        config.limits.timeout_seconds = 60;
        config.environment["APP_ENV"] = "test";
    };
    verification_orchestrator orchestrator(executor, vetter, validator, options);
    orchestrator.run_verification(mock::python_task());

    EXPECT_EQ(captured.task_id, "task-1");
    EXPECT_EQ(captured.subtask_id, "subtask-1");
    EXPECT_EQ(captured.test_command, "pytest --tb=short -v");
    EXPECT_EQ(captured.config.limits.timeout_seconds, 60);
    EXPECT_EQ(captured.config.limits.memory_mb, 512);
    EXPECT_EQ(captured.config.environment.at("APP_ENV"), "test");
}

TEST_F(OrchestratorTest, CancelledRunThrowsTest) {
    EXPECT_CALL(vetter, vet(_, _)).Times(0);
    verification_orchestrator orchestrator(executor, vetter, validator, fast_options());

    cancellation_token token;
    token.cancel();
    EXPECT_THROW(orchestrator.run_verification(mock::python_task(), token), verification_cancelled);
}

TEST_F(OrchestratorTest, RepairListenerFiresOncePerFailureTest) {
    execution_result result = mock::passing_execution();
    result.status = execution_status::FAILURE;
    result.test_results.push_back(mock::failed_test("test_div", "ZeroDivisionError"));

    verification_orchestrator orchestrator(executor, vetter, validator, fast_options());
    vector<pair<agent_role, string>> requests;
    orchestrator.on_repair_request([&](agent_role target, const string &suggestion) {
        requests.push_back({target, suggestion});
    });
    orchestrator.on_repair_request([](agent_role, const string &) {
        throw runtime_error("listener crashed");
    });

    orchestrator.run_verification(mock::python_task());
    EXPECT_TRUE(requests.empty());

    ON_CALL(executor, execute(_, _)).WillByDefault(Return(result));
    verification_report report = orchestrator.run_verification(mock::python_task());
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].first, agent_role::PLANNER_AGENT);
    EXPECT_EQ(requests[0].second, report.output.repair_suggestion);
}

TEST_F(OrchestratorTest, MonitorSeesPhasesInOrderTest) {
    auto m = make_unique<NiceMock<mock::monitor>>();
    {
        InSequence seq;
        EXPECT_CALL(*m, start_verification(_)).WillOnce(Invoke([](const verification_report &report) {
            EXPECT_EQ(report.status, scan_status::RUNNING);
            EXPECT_EQ(report.dependencies.status, scan_status::PENDING);
        }));
        EXPECT_CALL(*m, phase_started(_, verification_phase::DEPENDENCIES));
        EXPECT_CALL(*m, phase_completed(_, verification_phase::DEPENDENCIES)).WillOnce(Invoke([](const verification_report &report, verification_phase) {
            EXPECT_EQ(report.dependencies.status, scan_status::COMPLETED);
            EXPECT_EQ(report.static_analysis.status, scan_status::PENDING);
        }));
        EXPECT_CALL(*m, phase_started(_, verification_phase::STATIC_ANALYSIS));
        EXPECT_CALL(*m, phase_completed(_, verification_phase::STATIC_ANALYSIS));
        EXPECT_CALL(*m, phase_started(_, verification_phase::TEST_EXECUTION));
        EXPECT_CALL(*m, phase_completed(_, verification_phase::TEST_EXECUTION));
        EXPECT_CALL(*m, phase_started(_, verification_phase::CONTRACT_VALIDATION));
        EXPECT_CALL(*m, phase_completed(_, verification_phase::CONTRACT_VALIDATION));
        EXPECT_CALL(*m, phase_started(_, verification_phase::FINALIZING));
        EXPECT_CALL(*m, phase_completed(_, verification_phase::FINALIZING));
        EXPECT_CALL(*m, end_verification(_)).WillOnce(Invoke([](const verification_report &report) {
            EXPECT_EQ(report.status, scan_status::COMPLETED);
            EXPECT_EQ(report.output.verdict, verdict::PASS);
        }));
    }

    verification_orchestrator orchestrator(executor, vetter, validator, fast_options());
    orchestrator.add_monitor(move(m));
    orchestrator.run_verification(mock::python_task());
}

TEST_F(OrchestratorTest, ReportsAreIndependentTest) {
    verification_orchestrator orchestrator(executor, vetter, validator, fast_options());
    verification_report first = orchestrator.run_verification(mock::python_task("task-1"));
    verification_report second = orchestrator.run_verification(mock::python_task("task-2"));
    EXPECT_NE(first.report_id, second.report_id);
    EXPECT_EQ(first.task_id, "task-1");
    EXPECT_EQ(second.task_id, "task-2");
}

TEST(ComposeOutputTest, LintErrorsAloneAreSyntaxFailureTest) {
    verification_report report = create_empty_report("task-1");
    report.dependencies.passed = true;
    report.test_execution.passed = true;
    report.contract_validation.passed = true;
    report.static_analysis.passed = false;
    lint_violation violation;
    violation.rule = "E999";
    violation.severity = lint_severity::ERROR;
    violation.file = "app/main.py";
    violation.line = 2;
    violation.column = 5;
    violation.message = "SyntaxError: invalid syntax";
    violation.suggestion = "autopep8 --in-place --select=E999 app/main.py";
    report.static_analysis.data.lint_violations.push_back(violation);
    report.static_analysis.data.total_issues = 1;

    task_schema task = mock::python_task();
    task.meta.iteration = 4;
    verifier_output output = compose_output(report, task, nullptr, "");

    EXPECT_EQ(output.verdict, verdict::FAIL);
    EXPECT_EQ(output.category, failure_category::SYNTAX);
    EXPECT_EQ(output.target_agent, agent_role::AUTO_LINTER_AGENT);
    EXPECT_EQ(output.repair_suggestion, "autopep8 --in-place --select=E999 app/main.py");
    EXPECT_TRUE(output.retry_recommended);
    EXPECT_EQ(output.execution_logs.stdout_text, "Verification complete. See detailed report.");
    EXPECT_EQ(output.execution_logs.exit_code, 1);
}
