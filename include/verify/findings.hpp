#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "sandbox/result.hpp"

namespace verifier {

struct vulnerability_info {
    std::string cve;
    verifier::severity severity = verifier::severity::LOW;
    std::string description;
    std::optional<std::string> fixed_version;
};

/**
 * @brief 一个依赖的审查结果
 */
struct dependency_vet {
    std::string name;

    /**
     * @brief 声明的版本约束，未声明时为空
     */
    std::string version;

    dependency_status status = dependency_status::APPROVED;

    /**
     * @brief 声明该依赖的清单文件，如 requirements.txt、package.json
     */
    std::string source;

    std::optional<vulnerability_info> vulnerability;
    std::optional<std::string> reason;
};

struct contract_violation {
    std::string endpoint;
    std::string method;
    violation_type type = violation_type::MISSING_ENDPOINT;
    std::string expected;
    std::string actual;
    verifier::severity severity = verifier::severity::HIGH;
};

struct contract_validation_result {
    std::string validator;
    std::string spec_url;
    int total_endpoints = 0;
    int validated = 0;
    std::vector<contract_violation> violations;
    bool passed = true;

    /**
     * @brief 校验器没有在时限内返回，此时 violations 不完整
     */
    bool timed_out = false;
};

/**
 * @brief 一个测试套件的统计，套件按测试文件划分
 */
struct test_suite_result {
    std::string name;
    std::string framework;
    int total = 0;
    int passed = 0;
    int failed = 0;
    int skipped = 0;
    int errors = 0;
    int64_t duration_ms = 0;
    std::vector<test_result> tests;
};

/**
 * @brief 测试执行阶段的数据，从沙箱执行结果中汇总得到
 * 各计数为所有套件之和
 */
struct test_execution_result {
    std::vector<test_suite_result> suites;
    int total = 0;
    int passed = 0;
    int failed = 0;
    int skipped = 0;
    int errors = 0;
    int64_t duration_ms = 0;
    std::optional<double> overall_coverage;
};

/**
 * @brief 静态分析阶段的数据
 * critical_issues 为 high 与 critical 级别的安全发现数量
 */
struct static_analysis_result {
    std::vector<lint_violation> lint_violations;
    std::vector<security_finding> security_findings;
    int total_issues = 0;
    int critical_issues = 0;
};

struct dependency_vet_result {
    std::vector<dependency_vet> dependencies;
    int banned_count = 0;
    int unpinned_count = 0;

    /**
     * @brief 审查器没有在时限内返回
     */
    bool timed_out = false;
};

/**
 * @brief 根据测试结果列表统计各状态的数量与总时长
 */
test_suite_result summarize_tests(const std::string &name, const std::string &framework, std::vector<test_result> tests);

/**
 * @brief 按测试文件把测试结果划分为套件，套件按文件首次出现的顺序排列
 * 没有文件信息的测试归入以测试框架命名的套件
 */
std::vector<test_suite_result> group_test_suites(const std::string &framework, std::vector<test_result> tests);

/**
 * @brief 汇总所有套件的计数
 */
test_execution_result summarize_test_execution(std::vector<test_suite_result> suites, std::optional<double> overall_coverage);

/**
 * @brief 合并静态检查与安全发现，并统计问题数量
 */
static_analysis_result summarize_static_analysis(std::vector<lint_violation> lint_violations,
                                                 std::vector<security_finding> security_findings);

dependency_vet_result summarize_dependencies(std::vector<dependency_vet> dependencies);

}  // namespace verifier
