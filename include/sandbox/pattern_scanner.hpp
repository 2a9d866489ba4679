#pragma once

#include <string>
#include <vector>
#include "sandbox/request.hpp"
#include "sandbox/result.hpp"

namespace verifier {

struct pattern_scan_result {
    std::vector<security_finding> findings;
    std::vector<lint_violation> lint_violations;
};

/**
 * @brief 内置的模式扫描，与外部的静态检查、安全扫描工具一起运行
 * 对源代码与测试代码：
 * 1. eval( 调用：high 级别 DANGEROUS_FUNCTION (CWE-95)
 * 2. os.system( 或 subprocess.call( 调用：medium 级别 SHELL_INJECTION (CWE-78)
 * 3. 形如 api_key = "..." 的硬编码凭据：critical 级别 HARDCODED_SECRET (CWE-798)
 * 4. 超过 120 个字符的行：max-line-length 警告
 * 对依赖清单：
 * 5. 使用 >=、^、*、~ 声明的依赖：low 级别 UNPINNED_DEPENDENCY
 *
 * 配置文件不参与扫描。
 */
pattern_scan_result scan_artifacts(const std::vector<code_artifact> &artifacts);

/**
 * @brief 在源代码与测试代码中查找任务禁止出现的字面量
 * 每个匹配产生一个 high 级别的 BANNED_PATTERN 发现
 */
std::vector<security_finding> scan_banned_patterns(const std::vector<code_artifact> &artifacts,
                                                   const std::vector<std::string> &banned_patterns);

}  // namespace verifier
