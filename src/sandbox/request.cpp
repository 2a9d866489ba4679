#include "sandbox/request.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace verifier {
using namespace std;

static const size_t MAX_ID_LENGTH = 100;
static const size_t MAX_AGENT_ROLE_LENGTH = 50;
static const size_t MAX_ARTIFACTS = 50;
static const size_t MAX_ARTIFACT_SIZE = 1000000;
static const size_t MAX_COMMAND_LENGTH = 500;

// clang-format off
static const unordered_map<runtime, runtime_commands> command_table = boost::assign::map_list_of
    (runtime::PYTHON, runtime_commands{
        "pytest --tb=short -v",
        "flake8 . && pylint *.py",
        "bandit -r . -f json"})
    (runtime::NODE, runtime_commands{
        "npm test",
        "eslint . --ext .ts,.tsx,.js,.jsx",
        "npm audit --json"})
    (runtime::TYPESCRIPT, runtime_commands{
        "npm test",
        "eslint . --ext .ts,.tsx,.js,.jsx",
        "npm audit --json"});

static const unordered_map<string, runtime> language_table = boost::assign::map_list_of
    ("python", runtime::PYTHON)
    ("py", runtime::PYTHON)
    ("node", runtime::NODE)
    ("javascript", runtime::NODE)
    ("js", runtime::NODE)
    ("jsx", runtime::NODE)
    ("typescript", runtime::TYPESCRIPT)
    ("ts", runtime::TYPESCRIPT)
    ("tsx", runtime::TYPESCRIPT);
// clang-format on

const runtime_commands &get_runtime_commands(runtime rt) {
    return command_table.at(rt);
}

runtime parse_runtime(const string &name) {
    try {
        return parse_display_message<runtime>(name);
    } catch (out_of_range &) {
        throw invalid_request("unsupported runtime " + name);
    }
}

runtime runtime_from_language(const string &language) {
    auto it = language_table.find(boost::algorithm::to_lower_copy(language));
    if (it == language_table.end())
        throw invalid_request("unsupported language " + language);
    return it->second;
}

execution_request build_request(const string &task_id,
                                const string &subtask_id,
                                const string &agent_role,
                                vector<code_artifact> artifacts,
                                runtime rt) {
    if (artifacts.empty())
        throw invalid_request("at least one artifact is required");

    const runtime_commands &commands = get_runtime_commands(rt);
    execution_request request;
    request.task_id = task_id;
    request.subtask_id = subtask_id;
    request.agent_role = agent_role;
    request.artifacts = move(artifacts);
    request.test_command = commands.test;
    request.lint_command = commands.lint;
    request.security_scan_command = commands.security_scan;
    request.config = build_config(rt);
    return request;
}

void validate_request(const execution_request &request) {
    if (request.task_id.empty() || request.task_id.size() > MAX_ID_LENGTH)
        throw invalid_request(fmt::format("task id must have 1-{} characters", MAX_ID_LENGTH));
    if (request.subtask_id.empty() || request.subtask_id.size() > MAX_ID_LENGTH)
        throw invalid_request(fmt::format("subtask id must have 1-{} characters", MAX_ID_LENGTH));
    if (request.agent_role.size() > MAX_AGENT_ROLE_LENGTH)
        throw invalid_request(fmt::format("agent role must have at most {} characters", MAX_AGENT_ROLE_LENGTH));
    if (request.artifacts.empty())
        throw invalid_request("at least one artifact is required");
    if (request.artifacts.size() > MAX_ARTIFACTS)
        throw invalid_request(fmt::format("at most {} artifacts are allowed, got {}", MAX_ARTIFACTS, request.artifacts.size()));

    for (auto &artifact : request.artifacts) {
        if (!is_safe_path(artifact.filename))
            throw invalid_request(fmt::format("artifact filename '{}' is not a safe relative path", artifact.filename));
        if (artifact.content.size() > MAX_ARTIFACT_SIZE)
            throw invalid_request(fmt::format("artifact {} exceeds {} characters", artifact.filename, MAX_ARTIFACT_SIZE));
    }

    for (auto *command : {&request.test_command, &request.lint_command, &request.security_scan_command})
        if (command->size() > MAX_COMMAND_LENGTH)
            throw invalid_request(fmt::format("command exceeds {} characters", MAX_COMMAND_LENGTH));

    validate_config(request.config);
}

}  // namespace verifier
