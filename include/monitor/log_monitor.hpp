#pragma once

#include "monitor/monitor.hpp"

namespace verifier {

/**
 * @brief 将验证进度写入 glog 日志
 */
struct log_monitor : public monitor {
    void start_verification(const verification_report &report) override;
    void phase_started(const verification_report &report, verification_phase phase) override;
    void phase_completed(const verification_report &report, verification_phase phase) override;
    void end_verification(const verification_report &report) override;
};

}  // namespace verifier
