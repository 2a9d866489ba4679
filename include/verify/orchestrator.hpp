#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "monitor/monitor.hpp"
#include "sandbox/executor.hpp"
#include "verify/contract_validator.hpp"
#include "verify/dependency_vetter.hpp"
#include "verify/report.hpp"
#include "verify/task.hpp"

namespace verifier {

/**
 * @brief 各阶段的时间约定与沙箱配置的定制
 */
struct orchestrator_options {
    int dependency_vetting_sla_ms;

    /**
     * @brief 在沙箱 timeout_seconds 之上为创建、销毁沙箱额外等待的时间
     */
    int static_analysis_sla_ms;

    int test_execution_sla_ms;
    int contract_validation_sla_ms;
    int finalization_sla_ms;

    /**
     * @brief 修改 build_request 生成的默认沙箱配置，修改后仍需通过 validate_config
     */
    std::function<void(sandbox_config &)> customize_config;

    /**
     * @brief 从 config.hpp 中的全局配置读取时间约定
     */
    static orchestrator_options from_globals();
};

/**
 * @brief 验证编排器
 * 按 dependencies -> linting -> tests -> contract -> finalizing 的顺序运行验证阶段，
 * 即使前面的阶段已经失败，也会运行所有阶段以得到完整的报告，最终由 finalizing 给出判定。
 *
 * 沙箱只在静态分析阶段执行一次，测试阶段复用同一个执行结果。
 * 每次调用协作方都有超时保护：
 * 1. 沙箱执行超过 timeout_seconds 加上额外时间时，取消沙箱并视为执行超时
 * 2. 依赖审查器或合约校验器超时时，该阶段以 COMPLETED、未通过结束，后续阶段照常运行
 * 协作方抛出异常视为不可用，当前阶段和之后的阶段标记为 FAILED，报告以 FAIL/LOGIC 结束。
 *
 * 阶段结果在超时的时刻确定，但 run_verification 会等待所有已发起的协作方调用返回后才返回，
 * 此后调用方可以销毁协作方。编排器可以被多个线程同时调用，
 * 此时协作方也必须是线程安全的。on_repair_request 与 add_monitor 必须在开始验证之前调用。
 */
struct verification_orchestrator {
    typedef std::function<void(agent_role target_agent, const std::string &repair_suggestion)> repair_listener;

    verification_orchestrator(sandbox_executor &executor,
                              dependency_vetter &vetter,
                              contract_validator &validator);

    verification_orchestrator(sandbox_executor &executor,
                              dependency_vetter &vetter,
                              contract_validator &validator,
                              orchestrator_options options);

    /**
     * @brief 运行一次完整的验证，每次调用都产生一份新的报告
     * @return 状态为 COMPLETED 或 FAILED 的报告，不会是 PENDING
     * @throw invalid_request 若任务不合法，此时不会产生报告
     */
    verification_report run_verification(const task_schema &task);

    /**
     * @brief 运行一次可以取消的验证
     * 每个阶段开始前检查取消令牌，正在执行的沙箱会被尽快终止。
     * 进入 finalizing 之后不再响应取消。
     * @throw verification_cancelled 若验证在 finalizing 之前被取消
     */
    verification_report run_verification(const task_schema &task, const cancellation_token &token);

    /**
     * @brief 注册修复请求的回调函数
     * 每个 FAIL 判定的报告恰好触发一次，参数为接收修复请求的 agent 与修复建议
     */
    void on_repair_request(repair_listener listener);

    void add_monitor(std::unique_ptr<monitor> &&m);

private:
    struct run_state;

    void call_monitor(const std::function<void(monitor &)> &callback);
    void fire_repair_request(agent_role target, const std::string &suggestion);

    void run_dependencies(run_state &state, const task_schema &task);
    void run_static_analysis(run_state &state, const task_schema &task, const execution_request &request, const cancellation_token &token);
    void run_test_execution(run_state &state, const execution_request &request);
    void run_contract_validation(run_state &state, const task_schema &task);
    void finalize(run_state &state, const task_schema &task);

    sandbox_executor &executor;
    dependency_vetter &vetter;
    contract_validator &validator;
    orchestrator_options options;

    std::vector<repair_listener> repair_listeners;
    std::vector<std::unique_ptr<monitor>> monitors;
};

/**
 * @brief 根据四个阶段的结果生成最终判定
 * 失败类型的优先级：
 * 1. SECURITY：静态分析未通过且存在 high 或 critical 级别的安全发现
 * 2. CONTRACT：合约校验未通过
 * 3. LOGIC：测试执行未通过，路由时的严重程度为 HIGH
 * 4. SYNTAX：其余情况，包括禁用的依赖与依赖审查超时
 * 反馈与修复建议来自所选类型中的第一个问题。
 * @param execution 沙箱的执行结果，用于汇总输出日志，沙箱没有执行时为空
 * @param fatal_error 协作方不可用时的错误描述，为空表示所有阶段正常完成
 */
verifier_output compose_output(const verification_report &report,
                               const task_schema &task,
                               const execution_result *execution,
                               const std::string &fatal_error);

}  // namespace verifier
