#pragma once

#include "common/status.hpp"

namespace verifier {

/**
 * @brief 是否建议继续自动修复
 * 修复次数用完（iteration >= max_budget）时不再重试。
 * SECURITY 类失败只能使用一半的预算（向下取整），之后需要人工或者 Planner 介入。
 */
bool should_retry(int iteration, int max_budget, failure_category category);

}  // namespace verifier
