#pragma once

#include <nlohmann/json.hpp>
#include "common/status.hpp"
#include "sandbox/config.hpp"
#include "sandbox/request.hpp"
#include "sandbox/result.hpp"
#include "verify/dependency_vetter.hpp"
#include "verify/findings.hpp"
#include "verify/report.hpp"
#include "verify/task.hpp"
#include "verify/verdict.hpp"

/**
 * 验证报告、任务与配置文件的 JSON 格式
 * 键名均为 snake_case，枚举值使用 get_display_message 的结果。
 */
namespace verifier {

void to_json(nlohmann::json &j, const runtime &value);
void from_json(const nlohmann::json &j, runtime &value);
void to_json(nlohmann::json &j, const execution_status &value);
void from_json(const nlohmann::json &j, execution_status &value);
void to_json(nlohmann::json &j, const scan_status &value);
void from_json(const nlohmann::json &j, scan_status &value);
void to_json(nlohmann::json &j, const verdict &value);
void from_json(const nlohmann::json &j, verdict &value);
void to_json(nlohmann::json &j, const failure_category &value);
void from_json(const nlohmann::json &j, failure_category &value);
void to_json(nlohmann::json &j, const severity &value);
void from_json(const nlohmann::json &j, severity &value);
void to_json(nlohmann::json &j, const test_status &value);
void from_json(const nlohmann::json &j, test_status &value);
void to_json(nlohmann::json &j, const lint_severity &value);
void from_json(const nlohmann::json &j, lint_severity &value);
void to_json(nlohmann::json &j, const dependency_status &value);
void from_json(const nlohmann::json &j, dependency_status &value);
void to_json(nlohmann::json &j, const violation_type &value);
void from_json(const nlohmann::json &j, violation_type &value);
void to_json(nlohmann::json &j, const artifact_type &value);
void from_json(const nlohmann::json &j, artifact_type &value);
void to_json(nlohmann::json &j, const network_mode &value);
void from_json(const nlohmann::json &j, network_mode &value);
void to_json(nlohmann::json &j, const seccomp_profile &value);
void from_json(const nlohmann::json &j, seccomp_profile &value);
void to_json(nlohmann::json &j, const log_stream &value);
void from_json(const nlohmann::json &j, log_stream &value);
void to_json(nlohmann::json &j, const agent_role &value);
void from_json(const nlohmann::json &j, agent_role &value);

void to_json(nlohmann::json &j, const code_artifact &artifact);
void from_json(const nlohmann::json &j, code_artifact &artifact);
void to_json(nlohmann::json &j, const sandbox_config &config);
void to_json(nlohmann::json &j, const execution_request &request);

void to_json(nlohmann::json &j, const execution_log &log);
void to_json(nlohmann::json &j, const test_result &result);
void to_json(nlohmann::json &j, const security_finding &finding);
void to_json(nlohmann::json &j, const lint_violation &violation);
void to_json(nlohmann::json &j, const execution_result &result);
void to_json(nlohmann::json &j, const verdict_mapping &mapping);

void to_json(nlohmann::json &j, const dependency_vet &vet);
void to_json(nlohmann::json &j, const contract_violation &violation);
void to_json(nlohmann::json &j, const contract_validation_result &result);
void to_json(nlohmann::json &j, const test_suite_result &result);
void to_json(nlohmann::json &j, const test_execution_result &result);
void to_json(nlohmann::json &j, const static_analysis_result &result);
void to_json(nlohmann::json &j, const dependency_vet_result &result);

template <typename T>
void to_json(nlohmann::json &j, const phase_result<T> &phase) {
    j = {{"status", phase.status}, {"passed", phase.passed}, {"data", phase.data}};
}

void to_json(nlohmann::json &j, const verifier_output &output);
void to_json(nlohmann::json &j, const verification_report &report);

void from_json(const nlohmann::json &j, api_endpoint &endpoint);
void from_json(const nlohmann::json &j, advisory &value);
void from_json(const nlohmann::json &j, dependency_policy &policy);

/**
 * @brief 解析外部任务编排系统提交的验证任务
 * submission 中 runtime 与 language 二选一，language 接受 py、js、tsx 等别名。
 * @throw invalid_request 若任务缺少必需字段或者字段类型错误
 */
task_schema parse_task(const nlohmann::json &j);

/**
 * @brief 将配置文件中的 sandbox 对象逐字段覆盖到 config 上
 * overrides 的格式与 sandbox_config 的 JSON 格式相同，所有字段均可省略。
 * 调用方需要在覆盖之后调用 validate_config。
 */
void apply_sandbox_overrides(sandbox_config &config, const nlohmann::json &overrides);

/**
 * @brief 读取配置文件中的 phase_sla 与 max_concurrent_sandboxes 到 config.hpp 的全局配置
 */
void apply_global_config(const nlohmann::json &config);

}  // namespace verifier
