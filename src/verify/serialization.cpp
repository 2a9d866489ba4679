#include "verify/serialization.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace verifier {
using namespace std;
using namespace nlohmann;

#define VERIFIER_ENUM_JSON(EnumT)                                    \
    void to_json(json &j, const EnumT &value) {                      \
        j = get_display_message(value);                              \
    }                                                                \
    void from_json(const json &j, EnumT &value) {                    \
        value = parse_display_message<EnumT>(j.get<string>());       \
    }

VERIFIER_ENUM_JSON(runtime)
VERIFIER_ENUM_JSON(execution_status)
VERIFIER_ENUM_JSON(scan_status)
VERIFIER_ENUM_JSON(verdict)
VERIFIER_ENUM_JSON(failure_category)
VERIFIER_ENUM_JSON(severity)
VERIFIER_ENUM_JSON(test_status)
VERIFIER_ENUM_JSON(lint_severity)
VERIFIER_ENUM_JSON(dependency_status)
VERIFIER_ENUM_JSON(violation_type)
VERIFIER_ENUM_JSON(artifact_type)
VERIFIER_ENUM_JSON(network_mode)
VERIFIER_ENUM_JSON(seccomp_profile)
VERIFIER_ENUM_JSON(log_stream)
VERIFIER_ENUM_JSON(agent_role)

#undef VERIFIER_ENUM_JSON

/**
 * @brief 可选字段不存在时输出 null
 */
template <typename T>
static json optional_json(const optional<T> &value) {
    return value ? json(*value) : json(nullptr);
}

void to_json(json &j, const code_artifact &artifact) {
    j = {{"filename", artifact.filename},
         {"content", artifact.content},
         {"type", artifact.type}};
}

void from_json(const json &j, code_artifact &artifact) {
    j.at("filename").get_to(artifact.filename);
    j.at("content").get_to(artifact.content);
    artifact.type = artifact_type::SOURCE;
    assign_optional(j, artifact.type, "type");
}

void to_json(json &j, const sandbox_config &config) {
    j = {{"runtime", config.runtime},
         {"limits", {{"memory_mb", config.limits.memory_mb},
                     {"cpu_cores", config.limits.cpu_cores},
                     {"timeout_seconds", config.limits.timeout_seconds},
                     {"max_output_bytes", config.limits.max_output_bytes}}},
         {"network", {{"mode", config.network.mode},
                      {"allowed_hosts", config.network.allowed_hosts},
                      {"block_exfiltration", config.network.block_exfiltration}}},
         {"security", {{"read_only_filesystem", config.security.read_only_filesystem},
                       {"no_new_privileges", config.security.no_new_privileges},
                       {"drop_capabilities", config.security.drop_capabilities},
                       {"seccomp_profile", config.security.seccomp}}},
         {"environment", config.environment}};
}

void apply_sandbox_overrides(sandbox_config &config, const json &overrides) {
    assign_optional(overrides, config.limits.memory_mb, "limits", "memory_mb");
    assign_optional(overrides, config.limits.cpu_cores, "limits", "cpu_cores");
    assign_optional(overrides, config.limits.timeout_seconds, "limits", "timeout_seconds");
    assign_optional(overrides, config.limits.max_output_bytes, "limits", "max_output_bytes");
    assign_optional(overrides, config.network.mode, "network", "mode");
    assign_optional(overrides, config.network.allowed_hosts, "network", "allowed_hosts");
    assign_optional(overrides, config.network.block_exfiltration, "network", "block_exfiltration");
    assign_optional(overrides, config.security.read_only_filesystem, "security", "read_only_filesystem");
    assign_optional(overrides, config.security.no_new_privileges, "security", "no_new_privileges");
    assign_optional(overrides, config.security.drop_capabilities, "security", "drop_capabilities");
    assign_optional(overrides, config.security.seccomp, "security", "seccomp_profile");

    // 环境变量逐个合并，而不是整体替换
    if (const json *env = find_path(overrides, "environment"); env && env->is_object()) {
        for (auto &[key, value] : env->items())
            config.environment[key] = value.get<string>();
    }
}

void to_json(json &j, const execution_request &request) {
    j = {{"task_id", request.task_id},
         {"subtask_id", request.subtask_id},
         {"agent_role", request.agent_role},
         {"artifacts", request.artifacts},
         {"test_command", request.test_command},
         {"lint_command", request.lint_command},
         {"security_scan_command", request.security_scan_command},
         {"config", request.config}};
}

void to_json(json &j, const execution_log &log) {
    j = {{"timestamp", log.timestamp},
         {"stream", log.stream},
         {"content", log.content}};
}

void to_json(json &j, const test_result &result) {
    j = {{"name", result.name},
         {"file", result.file},
         {"status", result.status},
         {"duration_ms", result.duration_ms},
         {"error_message", optional_json(result.error_message)},
         {"stack_trace", optional_json(result.stack_trace)},
         {"coverage", optional_json(result.coverage)}};
}

void to_json(json &j, const security_finding &finding) {
    j = {{"severity", finding.severity},
         {"type", finding.type},
         {"file", finding.file},
         {"line", optional_json(finding.line)},
         {"message", finding.message},
         {"cwe", optional_json(finding.cwe)},
         {"remediation", optional_json(finding.remediation)}};
}

void to_json(json &j, const lint_violation &violation) {
    j = {{"rule", violation.rule},
         {"severity", violation.severity},
         {"file", violation.file},
         {"line", violation.line},
         {"column", violation.column},
         {"message", violation.message},
         {"fixable", violation.fixable},
         {"suggestion", optional_json(violation.suggestion)}};
}

void to_json(json &j, const execution_result &result) {
    j = {{"sandbox_id", result.sandbox_id},
         {"status", result.status},
         {"exit_code", result.exit_code},
         {"start_time", result.start_time},
         {"end_time", result.end_time},
         {"duration_ms", result.duration_ms},
         {"logs", result.logs},
         {"test_results", result.test_results},
         {"security_findings", result.security_findings},
         {"lint_violations", result.lint_violations},
         {"resource_usage", {{"peak_memory_mb", result.resources.peak_memory_mb},
                             {"cpu_time_ms", result.resources.cpu_time_ms}}},
         {"output_truncated", result.output_truncated},
         {"test_framework", result.test_framework},
         {"coverage", optional_json(result.coverage)}};
}

void to_json(json &j, const verdict_mapping &mapping) {
    j = {{"verdict", mapping.verdict}, {"category", mapping.category}};
}

void to_json(json &j, const dependency_vet &vet) {
    json vulnerability = nullptr;
    if (vet.vulnerability) {
        vulnerability = {{"cve", vet.vulnerability->cve},
                         {"severity", vet.vulnerability->severity},
                         {"description", vet.vulnerability->description},
                         {"fixed_version", optional_json(vet.vulnerability->fixed_version)}};
    }
    j = {{"name", vet.name},
         {"version", vet.version},
         {"status", vet.status},
         {"source", vet.source},
         {"vulnerability", vulnerability},
         {"reason", optional_json(vet.reason)}};
}

void to_json(json &j, const contract_violation &violation) {
    j = {{"endpoint", violation.endpoint},
         {"method", violation.method},
         {"type", violation.type},
         {"expected", violation.expected},
         {"actual", violation.actual},
         {"severity", violation.severity}};
}

void to_json(json &j, const contract_validation_result &result) {
    j = {{"validator", result.validator},
         {"spec_url", result.spec_url},
         {"total_endpoints", result.total_endpoints},
         {"validated", result.validated},
         {"violations", result.violations},
         {"passed", result.passed},
         {"timed_out", result.timed_out}};
}

void to_json(json &j, const test_suite_result &result) {
    j = {{"name", result.name},
         {"framework", result.framework},
         {"total", result.total},
         {"passed", result.passed},
         {"failed", result.failed},
         {"skipped", result.skipped},
         {"errors", result.errors},
         {"duration_ms", result.duration_ms},
         {"tests", result.tests}};
}

void to_json(json &j, const test_execution_result &result) {
    j = {{"suites", result.suites},
         {"total", result.total},
         {"passed", result.passed},
         {"failed", result.failed},
         {"skipped", result.skipped},
         {"errors", result.errors},
         {"duration_ms", result.duration_ms},
         {"overall_coverage", optional_json(result.overall_coverage)}};
}

void to_json(json &j, const static_analysis_result &result) {
    j = {{"lint_violations", result.lint_violations},
         {"security_findings", result.security_findings},
         {"total_issues", result.total_issues},
         {"critical_issues", result.critical_issues}};
}

void to_json(json &j, const dependency_vet_result &result) {
    j = {{"dependencies", result.dependencies},
         {"banned_count", result.banned_count},
         {"unpinned_count", result.unpinned_count},
         {"timed_out", result.timed_out}};
}

void to_json(json &j, const verifier_output &output) {
    j = {{"verdict", output.verdict},
         {"category", output.category},
         {"execution_logs", {{"stdout", output.execution_logs.stdout_text},
                             {"stderr", output.execution_logs.stderr_text},
                             {"exit_code", output.execution_logs.exit_code},
                             {"execution_time_ms", output.execution_logs.execution_time_ms}}},
         {"feedback_to_agent", output.feedback_to_agent},
         {"repair_suggestion", output.repair_suggestion},
         {"retry_recommended", output.retry_recommended},
         {"target_agent", optional_json(output.target_agent)},
         {"iteration_count", output.iteration_count},
         {"budget_remaining", output.budget_remaining}};
}

void to_json(json &j, const verification_report &report) {
    j = {{"report_id", report.report_id},
         {"task_id", report.task_id},
         {"sandbox_id", report.sandbox_id},
         {"started_at", report.started_at},
         {"completed_at", optional_json(report.completed_at)},
         {"status", report.status},
         {"dependencies", report.dependencies},
         {"static_analysis", report.static_analysis},
         {"test_execution", report.test_execution},
         {"contract_validation", report.contract_validation},
         {"verifier_output", report.output}};
}

void from_json(const json &j, api_endpoint &endpoint) {
    j.at("path").get_to(endpoint.path);
    endpoint.method = get_value_def<string>(j, "GET", "method");
}

void from_json(const json &j, advisory &value) {
    j.at("name").get_to(value.name);
    j.at("below_version").get_to(value.below_version);
    j.at("cve").get_to(value.cve);
    value.severity = get_value_def(j, severity::HIGH, "severity");
    value.description = get_value_def<string>(j, "", "description");
    if (exists(j, "fixed_version"))
        value.fixed_version = j.at("fixed_version").get<string>();
}

void from_json(const json &j, dependency_policy &policy) {
    assign_optional(j, policy.banned, "banned");
    assign_optional(j, policy.advisories, "advisories");
}

static task_schema parse_task_fields(const json &j) {
    task_schema task;

    const json &meta = j.at("meta");
    meta.at("task_id").get_to(task.meta.task_id);
    task.meta.project_id = get_value_def<string>(meta, "", "project_id");
    assign_optional(meta, task.meta.iteration, "iteration");
    assign_optional(meta, task.meta.max_repair_budget, "max_repair_budget");

    task.contract.spec_url = get_value_def<string>(j, "", "shared_contract", "spec_url");
    assign_optional(j, task.contract.endpoints, "shared_contract", "endpoints");

    assign_optional(j, task.constraints.allowed_dependencies, "security_constraints", "allowed_dependencies");
    assign_optional(j, task.constraints.banned_patterns, "security_constraints", "banned_patterns");

    const json &submit = j.at("submission");
    submit.at("subtask_id").get_to(task.submit.subtask_id);
    task.submit.agent_role = get_value_def<string>(submit, "", "agent_role");
    if (exists(submit, "runtime"))
        task.submit.runtime = parse_runtime(submit.at("runtime").get<string>());
    else if (exists(submit, "language"))
        task.submit.runtime = runtime_from_language(submit.at("language").get<string>());
    else
        throw invalid_request("submission declares neither runtime nor language");
    submit.at("artifacts").get_to(task.submit.artifacts);
    return task;
}

task_schema parse_task(const json &j) {
    try {
        return parse_task_fields(j);
    } catch (json::exception &ex) {
        throw invalid_request(fmt::format("malformed task: {}", ex.what()));
    } catch (out_of_range &ex) {
        throw invalid_request(fmt::format("malformed task: {}", ex.what()));
    } catch (invalid_argument &ex) {
        throw invalid_request(fmt::format("malformed task: {}", ex.what()));
    }
}

void apply_global_config(const json &config) {
    assign_optional(config, DEPENDENCY_VETTING_SLA_MS, "phase_sla", "dependencies");
    assign_optional(config, STATIC_ANALYSIS_SLA_MS, "phase_sla", "linting");
    assign_optional(config, TEST_EXECUTION_SLA_MS, "phase_sla", "tests");
    assign_optional(config, CONTRACT_VALIDATION_SLA_MS, "phase_sla", "contract");
    assign_optional(config, FINALIZATION_SLA_MS, "phase_sla", "finalizing");
    assign_optional(config, MAX_CONCURRENT_SANDBOXES, "max_concurrent_sandboxes");
}

}  // namespace verifier
