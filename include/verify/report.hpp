#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "common/status.hpp"
#include "verify/findings.hpp"

namespace verifier {

/**
 * @brief 一个验证阶段的结果
 * 阶段只会从 PENDING 整体地提交为 COMPLETED（或者协作方失败时的 FAILED），
 * 读者不会看到写了一半的阶段。
 */
template <typename T>
struct phase_result {
    scan_status status = scan_status::PENDING;
    bool passed = false;
    T data;
};

struct execution_logs_summary {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    int64_t execution_time_ms = 0;
};

/**
 * @brief 验证的最终判定
 * 当且仅当 verdict 为 FAIL 时 target_agent 有值。
 */
struct verifier_output {
    verifier::verdict verdict = verifier::verdict::PASS;
    failure_category category = failure_category::NONE;
    execution_logs_summary execution_logs;
    std::string feedback_to_agent;
    std::string repair_suggestion;
    bool retry_recommended = false;
    std::optional<agent_role> target_agent;
    int iteration_count = 1;
    int budget_remaining = 0;
};

/**
 * @brief 一次验证的完整报告
 * 每次 run_verification 创建一份新的报告，所有阶段初始为 PENDING，
 * 只有编排器可以修改报告，其他人只能读取快照。
 * 报告在 finalizing 之后为 COMPLETED，协作方不可用时为 FAILED，之后不再修改。
 */
struct verification_report {
    std::string report_id;
    std::string task_id;
    std::string sandbox_id;

    /**
     * @brief UNIX 毫秒时间戳
     */
    int64_t started_at = 0;
    std::optional<int64_t> completed_at;

    scan_status status = scan_status::PENDING;

    phase_result<dependency_vet_result> dependencies;
    phase_result<static_analysis_result> static_analysis;
    phase_result<test_execution_result> test_execution;
    phase_result<contract_validation_result> contract_validation;

    verifier_output output;
};

/**
 * @brief 生成报告编号 report_<36 进制毫秒时间戳>_<8 位随机串>
 */
std::string generate_report_id();

/**
 * @brief 创建所有阶段均为 PENDING 的报告
 */
verification_report create_empty_report(const std::string &task_id);

}  // namespace verifier
