#pragma once

#include <string>
#include <vector>
#include "common/status.hpp"
#include "sandbox/config.hpp"

namespace verifier {

/**
 * @brief 一个提交给沙箱的文件
 */
struct code_artifact {
    std::string filename;
    std::string content;
    artifact_type type = artifact_type::SOURCE;
};

/**
 * @brief 沙箱执行请求
 * task_id 与 subtask_id 由调用方提供，在一次编排中唯一。
 */
struct execution_request {
    std::string task_id;
    std::string subtask_id;

    /**
     * @brief 发起请求的 agent 角色，为自由文本
     */
    std::string agent_role;

    std::vector<code_artifact> artifacts;

    std::string test_command;
    std::string lint_command;
    std::string security_scan_command;

    sandbox_config config;
};

/**
 * @brief 一个运行时对应的测试、静态检查、安全扫描命令
 */
struct runtime_commands {
    std::string test;
    std::string lint;
    std::string security_scan;
};

/**
 * @brief 查询运行时对应的固定命令表
 */
const runtime_commands &get_runtime_commands(runtime rt);

/**
 * @brief 将 "python"、"node"、"typescript" 解析为运行时
 * @throw invalid_request 若运行时不受支持
 */
runtime parse_runtime(const std::string &name);

/**
 * @brief 将代码语言（如 py、js、tsx）映射到运行时
 * @throw invalid_request 若语言不受支持
 */
runtime runtime_from_language(const std::string &language);

/**
 * @brief 打包执行请求
 * 命令来自固定的运行时命令表，沙箱配置为 build_config(rt) 的默认值。
 * 相同输入总是得到相同的请求。不检查 artifact 的内容。
 * @throw invalid_request 若 artifacts 为空
 */
execution_request build_request(const std::string &task_id,
                                 const std::string &subtask_id,
                                 const std::string &agent_role,
                                 std::vector<code_artifact> artifacts,
                                 runtime rt);

/**
 * @brief 启动沙箱之前的准入检查
 * 检查标识符长度、artifact 数量、文件名与内容大小、命令长度以及沙箱配置范围。
 * @throw invalid_request 若请求不合法
 */
void validate_request(const execution_request &request);

}  // namespace verifier
