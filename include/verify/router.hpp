#pragma once

#include "common/status.hpp"

namespace verifier {

/**
 * @brief 根据失败类型与严重程度选择修复请求的接收方
 * SYNTAX 交给 Auto-Linter Agent，SECURITY 交给 SecOps Agent，CONTRACT 交给 Contract Negotiator。
 * LOGIC 类失败在 high 及以上时升级给 Planner Agent（通常是设计层面的问题），
 * 否则交给运行时对应的编码 agent。
 * NONE 不是失败，按 LOGIC 处理以保证函数是全的。
 */
agent_role route(failure_category category, verifier::severity severity, verifier::runtime runtime);

/**
 * @brief 同上，编码 agent 默认为 Python Agent
 */
agent_role route(failure_category category, verifier::severity severity);

/**
 * @brief 运行时对应的编码 agent
 */
agent_role coding_agent(verifier::runtime runtime);

}  // namespace verifier
