#include "sandbox/pattern_scanner.hpp"
#include <fmt/core.h>
#include <regex>
#include <sstream>

namespace verifier {
using namespace std;

static const size_t MAX_LINE_LENGTH = 120;

static bool is_code(const code_artifact &artifact) {
    return artifact.type == artifact_type::SOURCE || artifact.type == artifact_type::TEST;
}

template <typename Callback>
static void for_each_line(const string &content, Callback callback) {
    istringstream ss(content);
    string line;
    int line_no = 0;
    while (getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        callback(++line_no, line);
    }
}

static void scan_code(const code_artifact &artifact, pattern_scan_result &result) {
    static const regex secret(R"((api_key|password|secret)\s*=\s*['"][^'"]+['"])", regex::icase);

    for_each_line(artifact.content, [&](int line_no, const string &line) {
        if (line.find("eval(") != string::npos) {
            security_finding finding;
            finding.severity = severity::HIGH;
            finding.type = "DANGEROUS_FUNCTION";
            finding.file = artifact.filename;
            finding.line = line_no;
            finding.message = "Use of eval() can execute arbitrary code";
            finding.cwe = "CWE-95";
            finding.remediation = "Parse the input explicitly (e.g. ast.literal_eval or JSON.parse) instead of evaluating it";
            result.findings.push_back(finding);
        }

        if (line.find("os.system(") != string::npos || line.find("subprocess.call(") != string::npos) {
            security_finding finding;
            finding.severity = severity::MEDIUM;
            finding.type = "SHELL_INJECTION";
            finding.file = artifact.filename;
            finding.line = line_no;
            finding.message = "Shell command execution may allow command injection";
            finding.cwe = "CWE-78";
            finding.remediation = "Use subprocess.run with an argument list and shell=False";
            result.findings.push_back(finding);
        }

        smatch m;
        if (regex_search(line, m, secret)) {
            security_finding finding;
            finding.severity = severity::CRITICAL;
            finding.type = "HARDCODED_SECRET";
            finding.file = artifact.filename;
            finding.line = line_no;
            finding.message = fmt::format("Hardcoded credential assigned to '{}'", m[1].str());
            finding.cwe = "CWE-798";
            finding.remediation = "Read credentials from environment variables or a secret manager";
            result.findings.push_back(finding);
        }

        if (line.size() > MAX_LINE_LENGTH) {
            lint_violation violation;
            violation.rule = "max-line-length";
            violation.severity = lint_severity::WARNING;
            violation.file = artifact.filename;
            violation.line = line_no;
            violation.column = (int)MAX_LINE_LENGTH + 1;
            violation.message = fmt::format("Line too long ({} > {} characters)", line.size(), MAX_LINE_LENGTH);
            violation.fixable = true;
            violation.suggestion = "Break the line into multiple lines";
            result.lint_violations.push_back(violation);
        }
    });
}

static void scan_requirements(const code_artifact &artifact, pattern_scan_result &result) {
    for_each_line(artifact.content, [&](int line_no, const string &line) {
        if (line.empty() || line[0] == '#') return;
        if (line.find(">=") == string::npos && line.find_first_of("^*~") == string::npos)
            return;

        security_finding finding;
        finding.severity = severity::LOW;
        finding.type = "UNPINNED_DEPENDENCY";
        finding.file = artifact.filename;
        finding.line = line_no;
        finding.message = fmt::format("Dependency is not pinned to an exact version: {}", line);
        finding.remediation = "Pin the dependency with an exact version (==)";
        result.findings.push_back(finding);
    });
}

pattern_scan_result scan_artifacts(const vector<code_artifact> &artifacts) {
    pattern_scan_result result;
    for (auto &artifact : artifacts) {
        if (is_code(artifact))
            scan_code(artifact, result);
        else if (artifact.type == artifact_type::REQUIREMENTS)
            scan_requirements(artifact, result);
    }
    return result;
}

vector<security_finding> scan_banned_patterns(const vector<code_artifact> &artifacts,
                                              const vector<string> &banned_patterns) {
    vector<security_finding> findings;
    for (auto &artifact : artifacts) {
        if (!is_code(artifact)) continue;
        for_each_line(artifact.content, [&](int line_no, const string &line) {
            for (auto &pattern : banned_patterns) {
                if (pattern.empty() || line.find(pattern) == string::npos) continue;
                security_finding finding;
                finding.severity = severity::HIGH;
                finding.type = "BANNED_PATTERN";
                finding.file = artifact.filename;
                finding.line = line_no;
                finding.message = fmt::format("Banned pattern '{}' is used", pattern);
                finding.remediation = fmt::format("Remove '{}' as required by the task security constraints", pattern);
                findings.push_back(finding);
            }
        });
    }
    return findings;
}

}  // namespace verifier
