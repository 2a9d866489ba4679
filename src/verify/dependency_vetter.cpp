#include "verify/dependency_vetter.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <regex>
#include <sstream>
#include "common/exceptions.hpp"

namespace verifier {
using namespace std;
using namespace nlohmann;

dependency_vetter::~dependency_vetter() {}

manifest_dependency_vetter::manifest_dependency_vetter() {}

manifest_dependency_vetter::manifest_dependency_vetter(dependency_policy policy)
    : policy(move(policy)) {}

static string normalize_name(const string &name) {
    static const regex separators("[-_.]+");
    return regex_replace(boost::algorithm::to_lower_copy(name), separators, "-");
}

static vector<int> version_components(const string &version) {
    vector<int> components;
    static const regex number_run(R"(\d+(\.\d+)*)");
    smatch m;
    if (!regex_search(version, m, number_run)) return components;
    vector<string> parts;
    string matched = m[0].str();
    boost::algorithm::split(parts, matched, boost::is_any_of("."));
    for (auto &part : parts) components.push_back(stoi(part.substr(0, 9)));
    return components;
}

int compare_versions(const string &a, const string &b) {
    vector<int> va = version_components(a), vb = version_components(b);
    for (size_t i = 0; i < max(va.size(), vb.size()); ++i) {
        int x = i < va.size() ? va[i] : 0;
        int y = i < vb.size() ? vb[i] : 0;
        if (x != y) return x < y ? -1 : 1;
    }
    return 0;
}

struct declared_dependency {
    string name;
    string version;
    bool pinned;
    string source;
};

static bool is_requirements(const code_artifact &artifact, const string &basename) {
    if (basename == "package.json") return false;
    return artifact.type == artifact_type::REQUIREMENTS ||
           (boost::algorithm::starts_with(basename, "requirements") && boost::algorithm::ends_with(basename, ".txt"));
}

static void parse_requirements(const code_artifact &artifact, vector<declared_dependency> &deps) {
    static const regex requirement(R"(^([A-Za-z0-9][A-Za-z0-9._-]*)\s*(\[[^\]]*\])?\s*(.*)$)");
    static const regex exact(R"(^===?\s*[0-9][0-9A-Za-z.+!-]*$)");

    istringstream ss(artifact.content);
    string line;
    while (getline(ss, line)) {
        size_t comment = line.find('#');
        if (comment != string::npos) line = line.substr(0, comment);
        size_t marker = line.find(';');  // 环境标记
        if (marker != string::npos) line = line.substr(0, marker);
        boost::algorithm::trim(line);
        // -r、-e、--index-url 等 pip 选项不是依赖
        if (line.empty() || line[0] == '-') continue;

        smatch m;
        if (!regex_match(line, m, requirement)) {
            LOG(WARNING) << "Unrecognized requirement line in " << artifact.filename << ": " << line;
            continue;
        }

        declared_dependency dep;
        dep.name = m[1].str();
        dep.version = boost::algorithm::trim_copy(m[3].str());
        dep.pinned = regex_match(dep.version, exact);
        if (dep.pinned) dep.version = boost::algorithm::trim_left_copy_if(dep.version, boost::is_any_of("= "));
        dep.source = artifact.filename;
        deps.push_back(dep);
    }
}

static void parse_package_json(const code_artifact &artifact, vector<declared_dependency> &deps) {
    static const regex exact(R"(^=?v?\d+\.\d+\.\d+(-[0-9A-Za-z.-]+)?(\+[0-9A-Za-z.-]+)?$)");

    json manifest;
    try {
        manifest = json::parse(artifact.content);
    } catch (json::exception &ex) {
        throw sandbox_error(fmt::format("{} is not valid JSON: {}", artifact.filename, ex.what()));
    }
    if (!manifest.is_object())
        throw sandbox_error(fmt::format("{} is not a JSON object", artifact.filename));

    for (const char *section : {"dependencies", "devDependencies"}) {
        if (!manifest.count(section) || !manifest.at(section).is_object()) continue;
        for (auto &[name, spec] : manifest.at(section).items()) {
            declared_dependency dep;
            dep.name = name;
            dep.version = spec.is_string() ? spec.get<string>() : spec.dump();
            dep.pinned = regex_match(dep.version, exact);
            if (dep.pinned) dep.version = boost::algorithm::trim_left_copy_if(dep.version, boost::is_any_of("=v"));
            dep.source = artifact.filename;
            deps.push_back(dep);
        }
    }
}

static bool contains_name(const vector<string> &names, const string &name) {
    string normalized = normalize_name(name);
    return any_of(names.begin(), names.end(), [&](const string &n) { return normalize_name(n) == normalized; });
}

vector<dependency_vet> manifest_dependency_vetter::vet(const vector<code_artifact> &artifacts,
                                                       const security_constraints &constraints) {
    vector<declared_dependency> declared;
    for (auto &artifact : artifacts) {
        string basename = filesystem::path(artifact.filename).filename().string();
        if (basename == "package.json")
            parse_package_json(artifact, declared);
        else if (is_requirements(artifact, basename))
            parse_requirements(artifact, declared);
    }

    vector<dependency_vet> result;
    for (auto &dep : declared) {
        dependency_vet vet;
        vet.name = dep.name;
        vet.version = dep.version;
        vet.source = dep.source;

        for (auto &adv : policy.advisories) {
            if (normalize_name(adv.name) != normalize_name(dep.name)) continue;
            // 没有声明版本时无法判断是否受影响
            if (version_components(dep.version).empty()) continue;
            if (compare_versions(dep.version, adv.below_version) >= 0) continue;
            vet.vulnerability = vulnerability_info{adv.cve, adv.severity, adv.description, adv.fixed_version};
            break;
        }

        if (contains_name(policy.banned, dep.name)) {
            vet.status = dependency_status::BANNED;
            vet.reason = "Dependency is banned by policy";
        } else if (!constraints.allowed_dependencies.empty() && !contains_name(constraints.allowed_dependencies, dep.name)) {
            vet.status = dependency_status::BANNED;
            vet.reason = "Dependency is not in the task's allowed dependency list";
        } else if (vet.vulnerability) {
            vet.status = dependency_status::OUTDATED;
            vet.reason = vet.vulnerability->fixed_version
                             ? fmt::format("Affected by {}, upgrade to {}", vet.vulnerability->cve, *vet.vulnerability->fixed_version)
                             : fmt::format("Affected by {}", vet.vulnerability->cve);
        } else if (!dep.pinned) {
            vet.status = dependency_status::UNPINNED;
            vet.reason = dep.version.empty() ? string("No version specified") : fmt::format("Version '{}' is not pinned to an exact release", dep.version);
        } else {
            vet.status = dependency_status::APPROVED;
        }

        DLOG(INFO) << "Dependency " << vet.name << " " << vet.version << ": " << get_display_message(vet.status);
        result.push_back(vet);
    }
    return result;
}

}  // namespace verifier
