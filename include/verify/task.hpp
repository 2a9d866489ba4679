#pragma once

#include <string>
#include <vector>
#include "common/status.hpp"
#include "sandbox/request.hpp"

namespace verifier {

struct task_meta {
    std::string task_id;
    std::string project_id;

    /**
     * @brief 当前是第几次修复迭代，从 1 开始
     */
    int iteration = 1;

    int max_repair_budget = 5;
};

/**
 * @brief 合约中声明的接口
 */
struct api_endpoint {
    std::string path;

    /**
     * @brief 大写的 HTTP 方法，如 GET、POST
     */
    std::string method;
};

struct shared_contract {
    /**
     * @brief OpenAPI 文档的位置，可以是本地路径或者 file:// URL，为空表示没有合约文档
     */
    std::string spec_url;

    /**
     * @brief 直接在任务中声明的接口，没有合约文档时使用
     */
    std::vector<api_endpoint> endpoints;
};

struct security_constraints {
    /**
     * @brief 允许使用的依赖，为空表示不限制
     */
    std::vector<std::string> allowed_dependencies;

    /**
     * @brief 源代码中禁止出现的字面量
     */
    std::vector<std::string> banned_patterns;
};

/**
 * @brief 一个子任务提交的待验证代码
 */
struct submission {
    std::string subtask_id;
    std::string agent_role;
    verifier::runtime runtime = verifier::runtime::PYTHON;
    std::vector<code_artifact> artifacts;
};

/**
 * @brief 验证请求，由外部的任务编排系统提供
 */
struct task_schema {
    task_meta meta;
    shared_contract contract;
    security_constraints constraints;
    submission submit;
};

}  // namespace verifier
