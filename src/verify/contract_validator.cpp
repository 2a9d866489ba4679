#include "verify/contract_validator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <nlohmann/json.hpp>
#include <regex>
#include <set>
#include <sstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace verifier {
using namespace std;
using namespace nlohmann;

static const char *VALIDATOR_NAME = "route-scanner";

static const char *HTTP_METHODS[] = {"get", "post", "put", "delete", "patch", "head", "options"};

contract_validator::~contract_validator() {}

string normalize_route(const string &path) {
    static const regex param(R"(\{[^}/]*\}|<[^>/]*>|:[A-Za-z_][A-Za-z0-9_]*)");
    string result = regex_replace(path, param, "{}");
    while (result.size() > 1 && result.back() == '/') result.pop_back();
    if (result.empty() || result[0] != '/') result = "/" + result;
    return result;
}

vector<api_endpoint> parse_openapi_endpoints(const string &document) {
    json spec;
    try {
        spec = json::parse(document);
    } catch (json::exception &ex) {
        throw sandbox_error(fmt::format("contract document is not valid JSON: {}", ex.what()));
    }
    if (!spec.is_object() || !spec.count("paths") || !spec.at("paths").is_object())
        throw sandbox_error("contract document has no paths object");

    vector<api_endpoint> endpoints;
    for (auto &[path, item] : spec.at("paths").items()) {
        if (!item.is_object()) continue;
        for (const char *method : HTTP_METHODS)
            if (item.count(method))
                endpoints.push_back({path, boost::algorithm::to_upper_copy(string(method))});
    }
    return endpoints;
}

static string load_contract_document(const string &spec_url) {
    string path = spec_url;
    if (boost::algorithm::starts_with(path, "file://")) {
        path = path.substr(7);
    } else if (path.find("://") != string::npos) {
        throw sandbox_error(fmt::format("unable to fetch contract document {}: only local files are supported", spec_url));
    }
    try {
        return read_file_content(path);
    } catch (system_error &ex) {
        throw sandbox_error(fmt::format("unable to read contract document {}: {}", spec_url, ex.what()));
    }
}

typedef pair<string, string> route_key;  // (method, normalized path)

static void add_flask_route(const smatch &m, set<route_key> &routes) {
    string path = normalize_route(m[1].str());
    if (!m[2].matched) {
        routes.insert({"GET", path});
        return;
    }
    static const regex method_literal(R"(['"]([A-Za-z]+)['"])");
    string methods = m[2].str();
    for (sregex_iterator it(methods.begin(), methods.end(), method_literal), end; it != end; ++it)
        routes.insert({boost::algorithm::to_upper_copy((*it)[1].str()), path});
}

static set<route_key> scan_routes(const vector<code_artifact> &artifacts) {
    static const regex decorator(R"(^\s*@\w+(?:\.\w+)*\.(get|post|put|delete|patch|head|options)\(\s*['"]([^'"]+)['"])");
    static const regex flask_route(R"(^\s*@\w+(?:\.\w+)*\.route\(\s*['"]([^'"]+)['"](?:.*methods\s*=\s*[\[\(]([^\]\)]*)[\]\)])?)");
    static const regex express(R"(^\s*(?:app|router|api|server|\w+Router)\.(get|post|put|delete|patch|head|options)\(\s*['"`]([^'"`]+)['"`])");

    set<route_key> routes;
    for (auto &artifact : artifacts) {
        if (artifact.type != artifact_type::SOURCE) continue;
        istringstream ss(artifact.content);
        string line;
        while (getline(ss, line)) {
            smatch m;
            if (regex_search(line, m, decorator) || regex_search(line, m, express)) {
                routes.insert({boost::algorithm::to_upper_copy(m[1].str()), normalize_route(m[2].str())});
            } else if (regex_search(line, m, flask_route)) {
                add_flask_route(m, routes);
            }
        }
    }
    return routes;
}

contract_validation_result route_contract_validator::validate(const shared_contract &contract,
                                                              const vector<code_artifact> &artifacts) {
    contract_validation_result result;
    result.validator = VALIDATOR_NAME;
    result.spec_url = contract.spec_url;

    vector<api_endpoint> endpoints;
    if (!contract.spec_url.empty())
        endpoints = parse_openapi_endpoints(load_contract_document(contract.spec_url));
    for (auto &endpoint : contract.endpoints) {
        api_endpoint declared{endpoint.path, boost::algorithm::to_upper_copy(endpoint.method)};
        bool duplicate = any_of(endpoints.begin(), endpoints.end(), [&](const api_endpoint &e) {
            return e.method == declared.method && normalize_route(e.path) == normalize_route(declared.path);
        });
        if (!duplicate) endpoints.push_back(declared);
    }

    set<route_key> routes = scan_routes(artifacts);
    result.total_endpoints = (int)endpoints.size();
    for (auto &endpoint : endpoints) {
        if (routes.count({endpoint.method, normalize_route(endpoint.path)})) {
            ++result.validated;
            continue;
        }
        contract_violation violation;
        violation.endpoint = endpoint.path;
        violation.method = endpoint.method;
        violation.type = violation_type::MISSING_ENDPOINT;
        violation.expected = fmt::format("{} {} is implemented", endpoint.method, endpoint.path);
        violation.actual = "No matching route handler found";
        violation.severity = severity::HIGH;
        result.violations.push_back(violation);
    }
    result.passed = result.violations.empty();

    LOG(INFO) << fmt::format("Contract validation: {}/{} endpoints implemented", result.validated, result.total_endpoints);
    return result;
}

}  // namespace verifier
