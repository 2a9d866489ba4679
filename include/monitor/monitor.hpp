#pragma once

#include <string>
#include "verify/report.hpp"

namespace verifier {

/**
 * @brief 验证阶段
 */
enum class verification_phase {
    DEPENDENCIES = 0,
    STATIC_ANALYSIS = 1,
    TEST_EXECUTION = 2,
    CONTRACT_VALIDATION = 3,
    FINALIZING = 4
};

const char *get_display_message(verification_phase phase);

/**
 * @brief 执行监控行为
 * 所有回调都收到报告的快照，监控器不能修改报告。
 * 回调抛出的异常会被记录并忽略，不会影响验证。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报已经开始一次验证，此时所有阶段均为 PENDING
     */
    virtual void start_verification(const verification_report &report);

    /**
     * @brief 监控上报已经开始某个验证阶段
     */
    virtual void phase_started(const verification_report &report, verification_phase phase);

    /**
     * @brief 监控上报某个验证阶段已经提交结果
     * @param report 提交该阶段之后的报告快照
     */
    virtual void phase_completed(const verification_report &report, verification_phase phase);

    /**
     * @brief 监控上报已经完成一次验证
     * @param report 最终的报告，状态为 COMPLETED 或 FAILED
     */
    virtual void end_verification(const verification_report &report);
};

}  // namespace verifier
