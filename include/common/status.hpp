#pragma once

#include <string>

namespace verifier {

/**
 * @brief 沙箱中受测代码使用的运行时
 */
enum class runtime {
    PYTHON = 0,
    NODE = 1,
    TYPESCRIPT = 2
};

/**
 * @brief 沙箱执行一个 execution_request 的结果状态
 */
enum class execution_status {
    PENDING = 0,
    RUNNING = 1,

    /**
     * @brief 所有命令正常结束，没有失败的测试和阻断性的发现
     */
    SUCCESS = 2,

    /**
     * @brief 命令正常结束，但测试失败或者发现了问题
     */
    FAILURE = 3,

    /**
     * @brief 超过了墙钟时间限制（或 CPU 时间限制），沙箱已被强制终止
     */
    TIMEOUT = 4,

    /**
     * @brief 受测程序因信号崩溃，或被 OOM 杀死
     */
    ERROR = 5
};

/**
 * @brief 验证报告以及每个验证阶段的状态
 * FAILED 是终止状态，只在协作方（沙箱、扫描器）不可用时出现
 */
enum class scan_status {
    PENDING = 0,
    RUNNING = 1,
    COMPLETED = 2,
    FAILED = 3
};

enum class verdict {
    PASS = 0,
    FAIL = 1
};

/**
 * @brief FAIL 判定的失败类型，用于路由修复请求
 */
enum class failure_category {
    NONE = 0,
    SYNTAX = 1,
    LOGIC = 2,
    SECURITY = 3,
    CONTRACT = 4
};

/**
 * @brief 安全发现、合约违例以及路由时使用的严重程度
 * 数值越大越严重，可以直接比较
 */
enum class severity {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2,
    CRITICAL = 3
};

enum class test_status {
    PASSED = 0,
    FAILED = 1,
    SKIPPED = 2,
    ERROR = 3
};

enum class lint_severity {
    WARNING = 0,
    ERROR = 1
};

enum class dependency_status {
    APPROVED = 0,
    BANNED = 1,
    UNPINNED = 2,
    OUTDATED = 3
};

enum class violation_type {
    MISSING_ENDPOINT = 0,
    SCHEMA_MISMATCH = 1,
    WRONG_STATUS_CODE = 2,
    MISSING_FIELD = 3
};

enum class artifact_type {
    SOURCE = 0,
    TEST = 1,
    CONFIG = 2,
    REQUIREMENTS = 3
};

enum class network_mode {
    NONE = 0,
    RESTRICTED = 1,
    BUILD_ONLY = 2
};

enum class seccomp_profile {
    STRICT = 0,
    DEFAULT = 1,
    UNCONFINED = 2
};

enum class log_stream {
    STDOUT = 0,
    STDERR = 1
};

/**
 * @brief 修复请求的接收方
 */
enum class agent_role {
    PYTHON_AGENT = 0,
    JAVASCRIPT_AGENT = 1,
    TYPESCRIPT_AGENT = 2,
    PLANNER_AGENT = 3,
    SECOPS_AGENT = 4,
    CONTRACT_NEGOTIATOR = 5,
    AUTO_LINTER_AGENT = 6
};

const char *get_display_message(runtime);
const char *get_display_message(execution_status);
const char *get_display_message(scan_status);
const char *get_display_message(verdict);
const char *get_display_message(failure_category);
const char *get_display_message(severity);
const char *get_display_message(test_status);
const char *get_display_message(lint_severity);
const char *get_display_message(dependency_status);
const char *get_display_message(violation_type);
const char *get_display_message(artifact_type);
const char *get_display_message(network_mode);
const char *get_display_message(seccomp_profile);
const char *get_display_message(log_stream);
const char *get_display_message(agent_role);

/**
 * @brief 将 get_display_message 的结果反向解析为枚举值
 * @throw std::out_of_range 若 text 不对应任何枚举值
 */
template <typename EnumT>
EnumT parse_display_message(const std::string &text);

}  // namespace verifier
