#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace verifier {
using namespace std;

// clang-format off
static const unordered_map<runtime, const char *> runtime_string = boost::assign::map_list_of
    (runtime::PYTHON, "python")
    (runtime::NODE, "node")
    (runtime::TYPESCRIPT, "typescript");

static const unordered_map<execution_status, const char *> execution_status_string = boost::assign::map_list_of
    (execution_status::PENDING, "pending")
    (execution_status::RUNNING, "running")
    (execution_status::SUCCESS, "success")
    (execution_status::FAILURE, "failure")
    (execution_status::TIMEOUT, "timeout")
    (execution_status::ERROR, "error");

static const unordered_map<scan_status, const char *> scan_status_string = boost::assign::map_list_of
    (scan_status::PENDING, "PENDING")
    (scan_status::RUNNING, "RUNNING")
    (scan_status::COMPLETED, "COMPLETED")
    (scan_status::FAILED, "FAILED");

static const unordered_map<verdict, const char *> verdict_string = boost::assign::map_list_of
    (verdict::PASS, "PASS")
    (verdict::FAIL, "FAIL");

static const unordered_map<failure_category, const char *> failure_category_string = boost::assign::map_list_of
    (failure_category::NONE, "NONE")
    (failure_category::SYNTAX, "SYNTAX")
    (failure_category::LOGIC, "LOGIC")
    (failure_category::SECURITY, "SECURITY")
    (failure_category::CONTRACT, "CONTRACT");

static const unordered_map<severity, const char *> severity_string = boost::assign::map_list_of
    (severity::LOW, "low")
    (severity::MEDIUM, "medium")
    (severity::HIGH, "high")
    (severity::CRITICAL, "critical");

static const unordered_map<test_status, const char *> test_status_string = boost::assign::map_list_of
    (test_status::PASSED, "passed")
    (test_status::FAILED, "failed")
    (test_status::SKIPPED, "skipped")
    (test_status::ERROR, "error");

static const unordered_map<lint_severity, const char *> lint_severity_string = boost::assign::map_list_of
    (lint_severity::WARNING, "warning")
    (lint_severity::ERROR, "error");

static const unordered_map<dependency_status, const char *> dependency_status_string = boost::assign::map_list_of
    (dependency_status::APPROVED, "APPROVED")
    (dependency_status::BANNED, "BANNED")
    (dependency_status::UNPINNED, "UNPINNED")
    (dependency_status::OUTDATED, "OUTDATED");

static const unordered_map<violation_type, const char *> violation_type_string = boost::assign::map_list_of
    (violation_type::MISSING_ENDPOINT, "missing_endpoint")
    (violation_type::SCHEMA_MISMATCH, "schema_mismatch")
    (violation_type::WRONG_STATUS_CODE, "wrong_status_code")
    (violation_type::MISSING_FIELD, "missing_field");

static const unordered_map<artifact_type, const char *> artifact_type_string = boost::assign::map_list_of
    (artifact_type::SOURCE, "source")
    (artifact_type::TEST, "test")
    (artifact_type::CONFIG, "config")
    (artifact_type::REQUIREMENTS, "requirements");

static const unordered_map<network_mode, const char *> network_mode_string = boost::assign::map_list_of
    (network_mode::NONE, "none")
    (network_mode::RESTRICTED, "restricted")
    (network_mode::BUILD_ONLY, "build-only");

static const unordered_map<seccomp_profile, const char *> seccomp_profile_string = boost::assign::map_list_of
    (seccomp_profile::STRICT, "strict")
    (seccomp_profile::DEFAULT, "default")
    (seccomp_profile::UNCONFINED, "unconfined");

static const unordered_map<log_stream, const char *> log_stream_string = boost::assign::map_list_of
    (log_stream::STDOUT, "stdout")
    (log_stream::STDERR, "stderr");

static const unordered_map<agent_role, const char *> agent_role_string = boost::assign::map_list_of
    (agent_role::PYTHON_AGENT, "Python Agent")
    (agent_role::JAVASCRIPT_AGENT, "JavaScript Agent")
    (agent_role::TYPESCRIPT_AGENT, "TypeScript Agent")
    (agent_role::PLANNER_AGENT, "Planner Agent")
    (agent_role::SECOPS_AGENT, "SecOps Agent")
    (agent_role::CONTRACT_NEGOTIATOR, "Contract Negotiator")
    (agent_role::AUTO_LINTER_AGENT, "Auto-Linter Agent");
// clang-format on

const char *get_display_message(runtime value) { return runtime_string.at(value); }
const char *get_display_message(execution_status value) { return execution_status_string.at(value); }
const char *get_display_message(scan_status value) { return scan_status_string.at(value); }
const char *get_display_message(verdict value) { return verdict_string.at(value); }
const char *get_display_message(failure_category value) { return failure_category_string.at(value); }
const char *get_display_message(severity value) { return severity_string.at(value); }
const char *get_display_message(test_status value) { return test_status_string.at(value); }
const char *get_display_message(lint_severity value) { return lint_severity_string.at(value); }
const char *get_display_message(dependency_status value) { return dependency_status_string.at(value); }
const char *get_display_message(violation_type value) { return violation_type_string.at(value); }
const char *get_display_message(artifact_type value) { return artifact_type_string.at(value); }
const char *get_display_message(network_mode value) { return network_mode_string.at(value); }
const char *get_display_message(seccomp_profile value) { return seccomp_profile_string.at(value); }
const char *get_display_message(log_stream value) { return log_stream_string.at(value); }
const char *get_display_message(agent_role value) { return agent_role_string.at(value); }

template <typename EnumT>
static EnumT reverse_lookup(const unordered_map<EnumT, const char *> &table, const string &text) {
    for (auto &[value, display] : table)
        if (text == display) return value;
    throw out_of_range("Unrecognized value " + text);
}

template <>
runtime parse_display_message<runtime>(const string &text) { return reverse_lookup(runtime_string, text); }
template <>
execution_status parse_display_message<execution_status>(const string &text) { return reverse_lookup(execution_status_string, text); }
template <>
scan_status parse_display_message<scan_status>(const string &text) { return reverse_lookup(scan_status_string, text); }
template <>
verdict parse_display_message<verdict>(const string &text) { return reverse_lookup(verdict_string, text); }
template <>
failure_category parse_display_message<failure_category>(const string &text) { return reverse_lookup(failure_category_string, text); }
template <>
severity parse_display_message<severity>(const string &text) { return reverse_lookup(severity_string, text); }
template <>
test_status parse_display_message<test_status>(const string &text) { return reverse_lookup(test_status_string, text); }
template <>
lint_severity parse_display_message<lint_severity>(const string &text) { return reverse_lookup(lint_severity_string, text); }
template <>
dependency_status parse_display_message<dependency_status>(const string &text) { return reverse_lookup(dependency_status_string, text); }
template <>
violation_type parse_display_message<violation_type>(const string &text) { return reverse_lookup(violation_type_string, text); }
template <>
artifact_type parse_display_message<artifact_type>(const string &text) { return reverse_lookup(artifact_type_string, text); }
template <>
network_mode parse_display_message<network_mode>(const string &text) { return reverse_lookup(network_mode_string, text); }
template <>
seccomp_profile parse_display_message<seccomp_profile>(const string &text) { return reverse_lookup(seccomp_profile_string, text); }
template <>
log_stream parse_display_message<log_stream>(const string &text) { return reverse_lookup(log_stream_string, text); }
template <>
agent_role parse_display_message<agent_role>(const string &text) { return reverse_lookup(agent_role_string, text); }

}  // namespace verifier
