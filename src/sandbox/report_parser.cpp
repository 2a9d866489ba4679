#include "sandbox/report_parser.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <boost/lexical_cast.hpp>
#include <map>
#include <nlohmann/json.hpp>
#include <regex>
#include <sstream>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace verifier::parsers {
using namespace std;
using namespace nlohmann;

// clang-format off
static const map<string, test_status> pytest_status = boost::assign::map_list_of
    ("PASSED", test_status::PASSED)
    ("XPASS", test_status::PASSED)
    ("FAILED", test_status::FAILED)
    ("SKIPPED", test_status::SKIPPED)
    ("XFAIL", test_status::SKIPPED)
    ("ERROR", test_status::ERROR);

static const map<string, severity> bandit_severity = boost::assign::map_list_of
    ("LOW", severity::LOW)
    ("MEDIUM", severity::MEDIUM)
    ("HIGH", severity::HIGH)
    ("UNDEFINED", severity::LOW);

static const map<string, severity> npm_severity = boost::assign::map_list_of
    ("info", severity::LOW)
    ("low", severity::LOW)
    ("moderate", severity::MEDIUM)
    ("high", severity::HIGH)
    ("critical", severity::CRITICAL);
// clang-format on

static vector<string> split_lines(const string &output) {
    vector<string> lines;
    istringstream ss(output);
    string line;
    while (getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

string normalize_path(const string &file, const string &base_dir) {
    string result = file;
    if (!base_dir.empty()) {
        string prefix = boost::algorithm::ends_with(base_dir, "/") ? base_dir : base_dir + "/";
        if (boost::algorithm::starts_with(result, prefix))
            result = result.substr(prefix.size());
    }
    while (boost::algorithm::starts_with(result, "./"))
        result = result.substr(2);
    return result;
}

vector<test_result> parse_pytest_output(const string &output) {
    static const regex verbose_line(R"(^(\S+?\.py)::(\S+)\s+(PASSED|FAILED|SKIPPED|ERROR|XFAIL|XPASS)\b.*$)");
    static const regex summary_line(R"(^(FAILED|ERROR) (\S+?\.py)::(\S+?)(?: - (.*))?$)");
    static const regex collection_error(R"(^ERROR (\S+?\.py)(?: - (.*))?$)");

    vector<test_result> results;
    auto find = [&results](const string &file, const string &name) -> test_result * {
        for (auto &result : results)
            if (result.file == file && result.name == name) return &result;
        return nullptr;
    };

    for (auto &line : split_lines(output)) {
        smatch m;
        if (regex_match(line, m, verbose_line)) {
            string file = normalize_path(m[1].str()), name = m[2].str();
            test_status status = pytest_status.at(m[3].str());
            // 测试失败且 teardown 出错时 pytest 会输出两行，保留更严重的状态
            if (auto *existing = find(file, name)) {
                if (status != test_status::PASSED) existing->status = status;
                continue;
            }
            test_result result;
            result.file = file;
            result.name = name;
            result.status = status;
            results.push_back(result);
        } else if (regex_match(line, m, summary_line)) {
            string file = normalize_path(m[2].str()), name = m[3].str();
            test_result *result = find(file, name);
            if (!result) {
                results.push_back(test_result{name, file, m[1].str() == "FAILED" ? test_status::FAILED : test_status::ERROR});
                result = &results.back();
            }
            if (m[4].matched) result->error_message = m[4].str();
        } else if (regex_match(line, m, collection_error)) {
            string file = normalize_path(m[1].str());
            test_result result;
            result.name = file;
            result.file = file;
            result.status = test_status::ERROR;
            if (m[2].matched) result.error_message = m[2].str();
            results.push_back(result);
        }
    }
    return results;
}

optional<double> parse_coverage_total(const string &output) {
    static const regex total_line(R"(^TOTAL\s+.*?(\d+(?:\.\d+)?)%\s*$)");
    optional<double> coverage;
    for (auto &line : split_lines(output)) {
        smatch m;
        if (regex_match(line, m, total_line))
            coverage = boost::lexical_cast<double>(m[1].str());
    }
    return coverage;
}

vector<test_result> parse_tap_output(const string &output) {
    static const regex test_line(R"(^(not ok|ok)\s+\d+\s*(?:-\s*)?(.*?)(?:\s+#\s*(SKIP|skip|TODO|todo)\b.*)?$)");
    vector<test_result> results;
    for (auto &line : split_lines(output)) {
        smatch m;
        if (!regex_match(line, m, test_line)) continue;
        test_result result;
        result.name = m[2].str();
        if (m[3].matched)
            result.status = test_status::SKIPPED;
        else
            result.status = m[1].str() == "ok" ? test_status::PASSED : test_status::FAILED;
        results.push_back(result);
    }
    return results;
}

vector<test_result> parse_jest_output(const string &output) {
    static const regex file_line(R"(^\s*(PASS|FAIL)\s+(\S+).*$)");
    static const regex passed_line(R"(^\s*(?:✓|✔|√)\s+(.*?)(?:\s+\((\d+)\s*ms\))?\s*$)");
    static const regex failed_line(R"(^\s*(?:✕|✗|×)\s+(.*?)(?:\s+\((\d+)\s*ms\))?\s*$)");
    static const regex skipped_line(R"(^\s*○\s+(?:skipped\s+)?(.*?)\s*$)");

    vector<test_result> results;
    string current_file;
    for (auto &line : split_lines(output)) {
        smatch m;
        test_result result;
        if (regex_match(line, m, file_line)) {
            current_file = normalize_path(m[2].str());
            continue;
        } else if (regex_match(line, m, passed_line)) {
            result.status = test_status::PASSED;
        } else if (regex_match(line, m, failed_line)) {
            result.status = test_status::FAILED;
        } else if (regex_match(line, m, skipped_line)) {
            result.status = test_status::SKIPPED;
        } else {
            continue;
        }
        result.name = m[1].str();
        result.file = current_file;
        if (m.size() > 2 && m[2].matched)
            result.duration_ms = boost::lexical_cast<int64_t>(m[2].str());
        results.push_back(result);
    }
    return results;
}

static bool is_flake8_error(const string &code) {
    // pylint 的消息编号为一个字母加四位数字，E 为错误，F 为致命错误
    if (code.size() == 5)
        return code[0] == 'E' || code[0] == 'F';
    // flake8 推荐在 CI 中阻断的选择：语法错误、无效比较、语句错误、未定义名称
    for (const char *prefix : {"E9", "F63", "F7", "F82"})
        if (boost::algorithm::starts_with(code, prefix)) return true;
    return false;
}

static bool is_flake8_fixable(const string &code) {
    // autopep8 可以自动修复的空白与缩进类问题
    if (code.size() != 4) return false;
    for (const char *prefix : {"E1", "E2", "E3", "W2", "W3"})
        if (boost::algorithm::starts_with(code, prefix)) return true;
    return false;
}

vector<lint_violation> parse_flake8_output(const string &output) {
    static const regex violation_line(R"(^(.+?):(\d+):(\d+):\s+([A-Z]+\d+):?\s+(.*)$)");
    vector<lint_violation> violations;
    for (auto &line : split_lines(output)) {
        smatch m;
        if (!regex_match(line, m, violation_line)) continue;
        lint_violation violation;
        violation.file = normalize_path(m[1].str());
        violation.line = boost::lexical_cast<int>(m[2].str());
        violation.column = boost::lexical_cast<int>(m[3].str());
        violation.rule = m[4].str();
        violation.message = m[5].str();
        violation.severity = is_flake8_error(violation.rule) ? lint_severity::ERROR : lint_severity::WARNING;
        violation.fixable = is_flake8_fixable(violation.rule);
        if (violation.fixable)
            violation.suggestion = fmt::format("autopep8 --in-place --select={} {}", violation.rule, violation.file);
        violations.push_back(violation);
    }
    return violations;
}

vector<lint_violation> parse_eslint_output(const string &output, const string &base_dir) {
    static const regex ruled_line(R"(^\s+(\d+):(\d+)\s+(error|warning)\s+(.*?)\s{2,}(\S+)\s*$)");
    static const regex unruled_line(R"(^\s+(\d+):(\d+)\s+(error|warning)\s+(.*?)\s*$)");

    vector<lint_violation> violations;
    string current_file;
    for (auto &line : split_lines(output)) {
        if (line.empty()) continue;
        smatch m;
        bool ruled = regex_match(line, m, ruled_line);
        if (!ruled && !regex_match(line, m, unruled_line)) {
            if (!isspace((unsigned char)line[0]) && !boost::algorithm::starts_with(line, "✖"))
                current_file = normalize_path(line, base_dir);
            continue;
        }
        lint_violation violation;
        violation.file = current_file;
        violation.line = boost::lexical_cast<int>(m[1].str());
        violation.column = boost::lexical_cast<int>(m[2].str());
        violation.severity = m[3].str() == "error" ? lint_severity::ERROR : lint_severity::WARNING;
        violation.message = m[4].str();
        // 解析错误没有规则名
        violation.rule = ruled ? m[5].str() : "parsing-error";
        violations.push_back(violation);
    }
    return violations;
}

static json parse_json_report(const string &output, const char *tool) {
    size_t begin = output.find('{');
    if (begin == string::npos) {
        if (!boost::algorithm::trim_copy(output).empty())
            throw sandbox_error(fmt::format("{} produced no JSON report", tool));
        return json();
    }
    try {
        return json::parse(output.substr(begin));
    } catch (json::exception &ex) {
        throw sandbox_error(fmt::format("{} report is malformed: {}", tool, ex.what()));
    }
}

vector<security_finding> parse_bandit_output(const string &output) {
    json report = parse_json_report(output, "bandit");
    vector<security_finding> findings;
    if (report.is_null()) return findings;
    if (!report.is_object() || !report.count("results"))
        throw sandbox_error("bandit report has no results");

    for (auto &item : report.at("results")) {
        security_finding finding;
        string level = get_value_def(item, string("LOW"), "issue_severity");
        finding.severity = bandit_severity.count(level) ? bandit_severity.at(level) : severity::LOW;
        finding.type = get_value_def(item, get_value_def(item, string("bandit"), "test_id"), "test_name");
        finding.file = normalize_path(get_value_def(item, string(), "filename"));
        if (exists(item, "line_number")) finding.line = item.at("line_number").get<int>();
        finding.message = get_value_def(item, string(), "issue_text");
        if (exists(item, "issue_cwe", "id"))
            finding.cwe = fmt::format("CWE-{}", item.at("issue_cwe").at("id").get<int>());
        if (exists(item, "more_info"))
            finding.remediation = "See " + item.at("more_info").get<string>();
        findings.push_back(finding);
    }
    return findings;
}

static severity parse_npm_severity(const string &level) {
    return npm_severity.count(level) ? npm_severity.at(level) : severity::LOW;
}

vector<security_finding> parse_npm_audit_output(const string &output) {
    json report = parse_json_report(output, "npm audit");
    vector<security_finding> findings;
    if (report.is_null()) return findings;

    if (exists(report, "error")) {
        LOG(WARNING) << "npm audit reported an error: " << report.at("error").dump();
        return findings;
    }

    if (exists(report, "vulnerabilities")) {  // npm 7+
        for (auto &[name, vuln] : report.at("vulnerabilities").items()) {
            security_finding finding;
            finding.severity = parse_npm_severity(get_value_def(vuln, string("low"), "severity"));
            finding.type = "vulnerable_dependency";
            finding.file = "package.json";

            vector<string> titles, transitive;
            for (auto &via : get_value_def(vuln, json::array(), "via")) {
                if (via.is_string()) {
                    transitive.push_back(via.get<string>());
                } else if (via.is_object()) {
                    titles.push_back(get_value_def(via, string(), "title"));
                    if (!finding.cwe && exists(via, "cwe") && !via.at("cwe").empty())
                        finding.cwe = via.at("cwe").at(0).get<string>();
                }
            }
            if (!titles.empty())
                finding.message = fmt::format("{}: {}", name, boost::algorithm::join(titles, "; "));
            else
                finding.message = fmt::format("{} is vulnerable through {}", name, boost::algorithm::join(transitive, ", "));

            json fix = get_value_def(vuln, json(), "fixAvailable");
            if (fix.is_boolean() && fix.get<bool>())
                finding.remediation = "Run npm audit fix";
            else if (fix.is_object())
                finding.remediation = fmt::format("Upgrade {} to {}", get_value_def(fix, name, "name"), get_value_def(fix, string("a patched version"), "version"));
            findings.push_back(finding);
        }
    } else if (exists(report, "advisories")) {  // npm 6
        for (auto &[id, advisory] : report.at("advisories").items()) {
            security_finding finding;
            finding.severity = parse_npm_severity(get_value_def(advisory, string("low"), "severity"));
            finding.type = "vulnerable_dependency";
            finding.file = "package.json";
            finding.message = fmt::format("{}: {}", get_value_def(advisory, id, "module_name"), get_value_def(advisory, string(), "title"));
            if (exists(advisory, "cwe")) finding.cwe = advisory.at("cwe").get<string>();
            if (exists(advisory, "recommendation")) finding.remediation = advisory.at("recommendation").get<string>();
            findings.push_back(finding);
        }
    }
    return findings;
}

}  // namespace verifier::parsers
