#pragma once

#include <string>
#include <vector>
#include "gmock/gmock.h"
#include "monitor/monitor.hpp"
#include "sandbox/executor.hpp"
#include "verify/contract_validator.hpp"
#include "verify/dependency_vetter.hpp"
#include "verify/task.hpp"

/**
 * 测试用的协作方
 * 用法：
 * 1. NiceMock<mock::sandbox_executor> executor; 默认返回全部通过的执行结果
 * 2. ON_CALL(executor, execute).WillByDefault(Return(your result));
 * 3. verification_orchestrator orchestrator(executor, vetter, validator, fast_options());
 */
namespace verifier::mock {

struct sandbox_executor : public verifier::sandbox_executor {
    MOCK_METHOD(execution_result, execute, (const execution_request &request, const cancellation_token &token), (override));
};

struct dependency_vetter : public verifier::dependency_vetter {
    MOCK_METHOD(std::vector<dependency_vet>, vet, (const std::vector<code_artifact> &artifacts, const security_constraints &constraints), (override));
};

struct contract_validator : public verifier::contract_validator {
    MOCK_METHOD(contract_validation_result, validate, (const shared_contract &contract, const std::vector<code_artifact> &artifacts), (override));
};

struct monitor : public verifier::monitor {
    MOCK_METHOD(void, start_verification, (const verification_report &report), (override));
    MOCK_METHOD(void, phase_started, (const verification_report &report, verification_phase phase), (override));
    MOCK_METHOD(void, phase_completed, (const verification_report &report, verification_phase phase), (override));
    MOCK_METHOD(void, end_verification, (const verification_report &report), (override));
};

/**
 * @brief 一个 Python 子任务，包含源代码、测试与依赖清单
 */
inline task_schema python_task(const std::string &task_id = "task-1") {
    task_schema task;
    task.meta.task_id = task_id;
    task.meta.project_id = "project-1";
    task.meta.iteration = 1;
    task.meta.max_repair_budget = 5;
    task.submit.subtask_id = "subtask-1";
    task.submit.agent_role = "Python Agent";
    task.submit.runtime = runtime::PYTHON;
    task.submit.artifacts = {
        {"app/main.py", "def add(a, b):\n    return a + b\n", artifact_type::SOURCE},
        {"tests/test_main.py", "from app.main import add\n\ndef test_add():\n    assert add(1, 2) == 3\n", artifact_type::TEST},
        {"requirements.txt", "requests==2.31.0\n", artifact_type::REQUIREMENTS}};
    return task;
}

inline test_result passed_test(const std::string &name) {
    test_result test;
    test.name = name;
    test.file = "tests/test_main.py";
    test.status = test_status::PASSED;
    test.duration_ms = 5;
    return test;
}

inline test_result failed_test(const std::string &name, const std::string &message) {
    test_result test = passed_test(name);
    test.status = test_status::FAILED;
    test.error_message = message;
    return test;
}

/**
 * @brief 所有命令正常结束、所有测试通过的执行结果
 */
inline execution_result passing_execution() {
    execution_result result;
    result.sandbox_id = "sbx_mock";
    result.status = execution_status::SUCCESS;
    result.exit_code = 0;
    result.start_time = 1700000000000;
    result.end_time = 1700000001200;
    result.duration_ms = 1200;
    result.test_framework = "pytest";
    result.test_results = {passed_test("test_add"), passed_test("test_sub")};
    result.logs.push_back({1700000001000, log_stream::STDOUT, "2 passed in 0.12s"});
    return result;
}

inline contract_validation_result passing_contract() {
    contract_validation_result result;
    result.validator = "mock";
    result.passed = true;
    return result;
}

inline dependency_vet approved_dependency(const std::string &name, const std::string &version) {
    dependency_vet vet;
    vet.name = name;
    vet.version = version;
    vet.status = dependency_status::APPROVED;
    vet.source = "requirements.txt";
    return vet;
}

}  // namespace verifier::mock
