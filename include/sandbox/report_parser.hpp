#pragma once

#include <optional>
#include <string>
#include <vector>
#include "sandbox/result.hpp"

/**
 * 将外部工具的输出解析为结构化的发现
 * 工具本身被视为黑盒，这里只识别它们的标准输出格式，
 * 无法识别的行会被忽略。
 */
namespace verifier::parsers {

/**
 * @brief 解析 pytest -v 的输出
 * 识别 "path::name STATUS" 行，以及简短摘要中的 "FAILED path::name - message" 行，
 * 收集阶段的错误（"ERROR path - message"）作为 error 状态的测试。
 */
std::vector<test_result> parse_pytest_output(const std::string &output);

/**
 * @brief 解析 pytest-cov 输出的 "TOTAL ... NN%" 行
 */
std::optional<double> parse_coverage_total(const std::string &output);

/**
 * @brief 解析 TAP 格式（"ok 1 - name"、"not ok 2 - name"）的测试输出
 */
std::vector<test_result> parse_tap_output(const std::string &output);

/**
 * @brief 解析 jest 默认 reporter 的输出（"✓ name (3 ms)"、"✕ name"）
 */
std::vector<test_result> parse_jest_output(const std::string &output);

/**
 * @brief 解析 flake8 或 pylint 的 "file:line:col: CODE message" 输出
 * pylint 的 E/F 类消息以及 flake8 的 E9/F63/F7/F82（语法错误、未定义名称）为 error，
 * 其余为 warning。
 */
std::vector<lint_violation> parse_flake8_output(const std::string &output);

/**
 * @brief 解析 eslint 默认的 stylish 格式输出
 * @param base_dir eslint 输出绝对路径，从中去除该前缀得到相对路径
 */
std::vector<lint_violation> parse_eslint_output(const std::string &output, const std::string &base_dir);

/**
 * @brief 解析 bandit -f json 的输出
 * @throw sandbox_error 若输出非空且不是 bandit 报告
 */
std::vector<security_finding> parse_bandit_output(const std::string &output);

/**
 * @brief 解析 npm audit --json 的输出（兼容 npm 6 的 advisories 与 npm 7+ 的 vulnerabilities）
 * npm audit 在缺少 lockfile 等情况下输出 {"error": ...}，此时没有发现。
 * @throw sandbox_error 若输出非空且不是 JSON
 */
std::vector<security_finding> parse_npm_audit_output(const std::string &output);

/**
 * @brief 去除工具输出路径中的 "./" 或者 base_dir 前缀
 */
std::string normalize_path(const std::string &file, const std::string &base_dir = "");

}  // namespace verifier::parsers
