#include "sandbox/config.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"

namespace verifier {
using namespace std;

bool operator==(const resource_limits &a, const resource_limits &b) {
    return a.memory_mb == b.memory_mb && a.cpu_cores == b.cpu_cores &&
           a.timeout_seconds == b.timeout_seconds && a.max_output_bytes == b.max_output_bytes;
}

bool operator==(const network_policy &a, const network_policy &b) {
    return a.mode == b.mode && a.allowed_hosts == b.allowed_hosts && a.block_exfiltration == b.block_exfiltration;
}

bool operator==(const security_policy &a, const security_policy &b) {
    return a.read_only_filesystem == b.read_only_filesystem && a.no_new_privileges == b.no_new_privileges &&
           a.drop_capabilities == b.drop_capabilities && a.seccomp == b.seccomp;
}

bool operator==(const sandbox_config &a, const sandbox_config &b) {
    return a.runtime == b.runtime && a.limits == b.limits && a.network == b.network &&
           a.security == b.security && a.environment == b.environment;
}

sandbox_config build_config(verifier::runtime rt) {
    sandbox_config config;
    config.runtime = rt;
    config.limits = resource_limits{512, 0.5, 30, 1 << 20};
    config.network = network_policy{network_mode::NONE, {}, true};
    config.security = security_policy{true, true, {"ALL"}, seccomp_profile::STRICT};
    return config;
}

void validate_config(const sandbox_config &config) {
    const auto &limits = config.limits;
    if (limits.memory_mb < 64 || limits.memory_mb > 4096)
        throw invalid_request(fmt::format("memory limit {} MB is out of range [64, 4096]", limits.memory_mb));
    if (limits.cpu_cores < 0.1 || limits.cpu_cores > 4)
        throw invalid_request(fmt::format("cpu limit {} cores is out of range [0.1, 4]", limits.cpu_cores));
    if (limits.timeout_seconds < 5 || limits.timeout_seconds > 300)
        throw invalid_request(fmt::format("timeout {}s is out of range [5, 300]", limits.timeout_seconds));
    if (limits.max_output_bytes < 1024 || limits.max_output_bytes > (16u << 20))
        throw invalid_request(fmt::format("output limit {} bytes is out of range [1KiB, 16MiB]", limits.max_output_bytes));
    if (config.network.mode == network_mode::RESTRICTED && config.network.allowed_hosts.empty())
        throw invalid_request("restricted network mode requires allowed hosts");
    for (auto &[key, value] : config.environment)
        if (key.empty() || key.find('=') != string::npos)
            throw invalid_request("malformed environment variable name " + key);
}

}  // namespace verifier
