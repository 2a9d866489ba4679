#pragma once

#include "common/status.hpp"
#include "sandbox/result.hpp"

namespace verifier {

struct verdict_mapping {
    verifier::verdict verdict = verifier::verdict::PASS;
    failure_category category = failure_category::NONE;
};

bool operator==(const verdict_mapping &a, const verdict_mapping &b);

/**
 * @brief 根据沙箱执行结果给出判定
 * 按顺序匹配，第一条满足的规则生效：
 * 1. 存在 high 或 critical 级别的安全发现：FAIL/SECURITY
 * 2. 存在 error 级别的静态检查问题：FAIL/SYNTAX
 * 3. 存在失败或出错的测试：FAIL/LOGIC
 * 4. 执行超时或崩溃：FAIL/LOGIC
 * 5. 否则 PASS/NONE
 * 纯函数，同一个结果总是得到同样的判定。
 */
verdict_mapping map_to_verdict(const execution_result &result);

}  // namespace verifier
