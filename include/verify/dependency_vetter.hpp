#pragma once

#include <optional>
#include <string>
#include <vector>
#include "sandbox/request.hpp"
#include "verify/findings.hpp"
#include "verify/task.hpp"

namespace verifier {

/**
 * @brief 依赖审查器
 * 检查 artifact 中的依赖清单，对每个依赖给出 APPROVED、BANNED、UNPINNED 或 OUTDATED 的结论。
 */
struct dependency_vetter {
    virtual ~dependency_vetter();

    /**
     * @param artifacts 提交的所有 artifact，审查器自行识别其中的依赖清单
     * @param constraints 任务的安全约束，包括允许使用的依赖列表
     * @return 每个声明的依赖一条审查结果，按清单中的出现顺序
     * @throw sandbox_error 若审查器不可用
     */
    virtual std::vector<dependency_vet> vet(const std::vector<code_artifact> &artifacts,
                                            const security_constraints &constraints) = 0;
};

/**
 * @brief 已知漏洞的公告，version 低于 below_version 的依赖受影响
 */
struct advisory {
    std::string name;
    std::string below_version;
    std::string cve;
    verifier::severity severity = verifier::severity::HIGH;
    std::string description;
    std::optional<std::string> fixed_version;
};

/**
 * @brief 部署方的依赖策略，来自配置文件的 dependency_policy 节
 */
struct dependency_policy {
    std::vector<std::string> banned;
    std::vector<advisory> advisories;
};

/**
 * @brief 解析 requirements*.txt 与 package.json 的依赖审查器
 * 1. 在 banned 列表中，或者任务限定了 allowed_dependencies 而依赖不在其中：BANNED
 * 2. 声明的版本受某个公告影响：OUTDATED，并附带漏洞信息
 * 3. 没有固定到确切版本（没有版本、>=、~=、^、~、*、latest、x 范围等）：UNPINNED
 * 4. 否则 APPROVED
 * Python 包名按 PEP 503 规范化后比较（大小写不敏感，-、_、. 等价）。
 */
struct manifest_dependency_vetter : public dependency_vetter {
    manifest_dependency_vetter();
    explicit manifest_dependency_vetter(dependency_policy policy);

    std::vector<dependency_vet> vet(const std::vector<code_artifact> &artifacts,
                                    const security_constraints &constraints) override;

private:
    dependency_policy policy;
};

/**
 * @brief 比较两个点分版本号，忽略非数字的后缀
 * @return 负数、0、正数分别表示 a 小于、等于、大于 b
 */
int compare_versions(const std::string &a, const std::string &b);

}  // namespace verifier
