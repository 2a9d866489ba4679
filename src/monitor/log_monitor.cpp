#include "monitor/log_monitor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>

namespace verifier {
using namespace std;

template <typename T>
static pair<scan_status, bool> phase_state(const phase_result<T> &phase) {
    return {phase.status, phase.passed};
}

static pair<scan_status, bool> phase_state(const verification_report &report, verification_phase phase) {
    switch (phase) {
        case verification_phase::DEPENDENCIES: return phase_state(report.dependencies);
        case verification_phase::STATIC_ANALYSIS: return phase_state(report.static_analysis);
        case verification_phase::TEST_EXECUTION: return phase_state(report.test_execution);
        case verification_phase::CONTRACT_VALIDATION: return phase_state(report.contract_validation);
        case verification_phase::FINALIZING: return {report.status, report.output.verdict == verdict::PASS};
    }
    return {scan_status::PENDING, false};
}

void log_monitor::start_verification(const verification_report &report) {
    LOG(INFO) << "Verification " << report.report_id << " started for task " << report.task_id;
}

void log_monitor::phase_started(const verification_report &report, verification_phase phase) {
    DLOG(INFO) << "Verification " << report.report_id << " entering phase " << get_display_message(phase);
}

void log_monitor::phase_completed(const verification_report &report, verification_phase phase) {
    auto [status, passed] = phase_state(report, phase);
    LOG(INFO) << fmt::format("Verification {} phase {} {}: {}",
                             report.report_id, get_display_message(phase), get_display_message(status), passed ? "passed" : "not passed");
}

void log_monitor::end_verification(const verification_report &report) {
    const verifier_output &output = report.output;
    if (output.verdict == verdict::PASS) {
        LOG(INFO) << "Verification " << report.report_id << " finished: PASS";
    } else {
        LOG(WARNING) << fmt::format("Verification {} finished: FAIL/{}, routed to {}, retry {}",
                                    report.report_id, get_display_message(output.category),
                                    output.target_agent ? get_display_message(*output.target_agent) : "nobody",
                                    output.retry_recommended ? "recommended" : "not recommended");
    }
}

}  // namespace verifier
