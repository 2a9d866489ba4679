#include "monitor/monitor.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace verifier {
using namespace std;

// clang-format off
static const unordered_map<verification_phase, const char *> verification_phase_string = boost::assign::map_list_of
    (verification_phase::DEPENDENCIES, "dependencies")
    (verification_phase::STATIC_ANALYSIS, "linting")
    (verification_phase::TEST_EXECUTION, "tests")
    (verification_phase::CONTRACT_VALIDATION, "contract")
    (verification_phase::FINALIZING, "finalizing");
// clang-format on

const char *get_display_message(verification_phase phase) {
    return verification_phase_string.at(phase);
}

monitor::~monitor() {}

void monitor::start_verification(const verification_report &) {}

void monitor::phase_started(const verification_report &, verification_phase) {}

void monitor::phase_completed(const verification_report &, verification_phase) {}

void monitor::end_verification(const verification_report &) {}

}  // namespace verifier
