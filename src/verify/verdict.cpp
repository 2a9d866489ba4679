#include "verify/verdict.hpp"
#include <algorithm>

namespace verifier {
using namespace std;

bool operator==(const verdict_mapping &a, const verdict_mapping &b) {
    return a.verdict == b.verdict && a.category == b.category;
}

verdict_mapping map_to_verdict(const execution_result &result) {
    auto &findings = result.security_findings;
    if (any_of(findings.begin(), findings.end(), is_blocking))
        return {verdict::FAIL, failure_category::SECURITY};

    auto &lint = result.lint_violations;
    if (any_of(lint.begin(), lint.end(), [](const lint_violation &v) { return v.severity == lint_severity::ERROR; }))
        return {verdict::FAIL, failure_category::SYNTAX};

    auto &tests = result.test_results;
    if (any_of(tests.begin(), tests.end(), is_failing))
        return {verdict::FAIL, failure_category::LOGIC};

    if (result.status == execution_status::TIMEOUT || result.status == execution_status::ERROR)
        return {verdict::FAIL, failure_category::LOGIC};

    return {verdict::PASS, failure_category::NONE};
}

}  // namespace verifier
