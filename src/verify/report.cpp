#include "verify/report.hpp"
#include <fmt/core.h>
#include "common/utils.hpp"

namespace verifier {
using namespace std;

string generate_report_id() {
    return fmt::format("report_{}_{}", to_base36(current_time_millis()), generate_uuid().substr(0, 8));
}

verification_report create_empty_report(const string &task_id) {
    verification_report report;
    report.report_id = generate_report_id();
    report.task_id = task_id;
    report.started_at = current_time_millis();
    report.status = scan_status::PENDING;
    return report;
}

}  // namespace verifier
