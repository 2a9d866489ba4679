#include "verify/findings.hpp"
#include <algorithm>
#include <map>

namespace verifier {
using namespace std;

test_suite_result summarize_tests(const string &name, const string &framework, vector<test_result> tests) {
    test_suite_result suite;
    suite.name = name;
    suite.framework = framework;
    for (auto &test : tests) {
        ++suite.total;
        suite.duration_ms += test.duration_ms;
        switch (test.status) {
            case test_status::PASSED: ++suite.passed; break;
            case test_status::FAILED: ++suite.failed; break;
            case test_status::SKIPPED: ++suite.skipped; break;
            case test_status::ERROR: ++suite.errors; break;
        }
    }
    suite.tests = move(tests);
    return suite;
}

vector<test_suite_result> group_test_suites(const string &framework, vector<test_result> tests) {
    vector<string> names;
    map<string, vector<test_result>> grouped;
    for (auto &test : tests) {
        string name = test.file.empty() ? framework : test.file;
        auto it = grouped.find(name);
        if (it == grouped.end()) {
            names.push_back(name);
            it = grouped.emplace(name, vector<test_result>()).first;
        }
        it->second.push_back(move(test));
    }

    vector<test_suite_result> suites;
    for (auto &name : names)
        suites.push_back(summarize_tests(name, framework, move(grouped[name])));
    return suites;
}

test_execution_result summarize_test_execution(vector<test_suite_result> suites, optional<double> overall_coverage) {
    test_execution_result result;
    for (auto &suite : suites) {
        result.total += suite.total;
        result.passed += suite.passed;
        result.failed += suite.failed;
        result.skipped += suite.skipped;
        result.errors += suite.errors;
        result.duration_ms += suite.duration_ms;
    }
    result.suites = move(suites);
    result.overall_coverage = overall_coverage;
    return result;
}

static_analysis_result summarize_static_analysis(vector<lint_violation> lint_violations,
                                                 vector<security_finding> security_findings) {
    static_analysis_result analysis;
    analysis.total_issues = (int)(lint_violations.size() + security_findings.size());
    analysis.critical_issues = (int)count_if(security_findings.begin(), security_findings.end(), is_blocking);
    analysis.lint_violations = move(lint_violations);
    analysis.security_findings = move(security_findings);
    return analysis;
}

dependency_vet_result summarize_dependencies(vector<dependency_vet> dependencies) {
    dependency_vet_result result;
    for (auto &dep : dependencies) {
        if (dep.status == dependency_status::BANNED) ++result.banned_count;
        if (dep.status == dependency_status::UNPINNED) ++result.unpinned_count;
    }
    result.dependencies = move(dependencies);
    return result;
}

}  // namespace verifier
