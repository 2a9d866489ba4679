#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace verifier {

struct execution_log {
    int64_t timestamp = 0;
    log_stream stream = log_stream::STDOUT;
    std::string content;
};

struct test_result {
    std::string name;
    std::string file;
    test_status status = test_status::PASSED;
    int64_t duration_ms = 0;
    std::optional<std::string> error_message;
    std::optional<std::string> stack_trace;
    std::optional<double> coverage;
};

struct security_finding {
    verifier::severity severity = verifier::severity::LOW;

    /**
     * @brief 发现的类型，如 HARDCODED_SECRET、B602、vulnerable_dependency
     */
    std::string type;

    std::string file;
    std::optional<int> line;
    std::string message;

    /**
     * @brief CWE 或 CVE 编号
     */
    std::optional<std::string> cwe;

    std::optional<std::string> remediation;
};

struct lint_violation {
    std::string rule;
    lint_severity severity = lint_severity::WARNING;
    std::string file;
    int line = 0;
    int column = 0;
    std::string message;
    bool fixable = false;
    std::optional<std::string> suggestion;
};

struct resource_usage {
    double peak_memory_mb = 0;
    int64_t cpu_time_ms = 0;
};

/**
 * @brief 沙箱对一个 execution_request 的执行结果
 * 每个请求由沙箱执行器产生恰好一次，之后不再修改。
 */
struct execution_result {
    std::string sandbox_id;
    execution_status status = execution_status::PENDING;
    int exit_code = -1;
    int64_t start_time = 0;
    int64_t end_time = 0;
    int64_t duration_ms = 0;

    std::vector<execution_log> logs;
    std::vector<test_result> test_results;
    std::vector<security_finding> security_findings;
    std::vector<lint_violation> lint_violations;
    resource_usage resources;

    /**
     * @brief 捕获的输出是否因为超过 max_output_bytes 被截断
     */
    bool output_truncated = false;

    /**
     * @brief 测试框架名称，如 pytest、jest、tap
     */
    std::string test_framework;

    /**
     * @brief 测试运行器报告的总体覆盖率（百分比）
     */
    std::optional<double> coverage;
};

/**
 * @brief 高危或严重的安全发现会阻断静态分析阶段
 */
bool is_blocking(const security_finding &finding);

bool is_failing(const test_result &result);

}  // namespace verifier
