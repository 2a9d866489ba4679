#include "sandbox/result.hpp"

namespace verifier {

bool is_blocking(const security_finding &finding) {
    return finding.severity >= severity::HIGH;
}

bool is_failing(const test_result &result) {
    return result.status == test_status::FAILED || result.status == test_status::ERROR;
}

}  // namespace verifier
