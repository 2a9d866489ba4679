#pragma once

#include <map>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace verifier {

struct resource_limits {
    int memory_mb = 512;
    double cpu_cores = 0.5;
    int timeout_seconds = 30;
    size_t max_output_bytes = 1 << 20;
};

struct network_policy {
    network_mode mode = network_mode::NONE;
    std::vector<std::string> allowed_hosts;
    bool block_exfiltration = true;
};

struct security_policy {
    bool read_only_filesystem = true;
    bool no_new_privileges = true;
    std::vector<std::string> drop_capabilities = {"ALL"};
    seccomp_profile seccomp = seccomp_profile::STRICT;
};

/**
 * @brief 沙箱的隔离策略
 * 默认策略禁止网络访问、只读文件系统、禁止提权、丢弃所有 capability、严格的 seccomp，
 * 任何放宽都必须显式地修改对应字段并通过 validate_config 检查。
 */
struct sandbox_config {
    verifier::runtime runtime = verifier::runtime::PYTHON;
    resource_limits limits;
    network_policy network;
    security_policy security;
    std::map<std::string, std::string> environment;
};

bool operator==(const resource_limits &a, const resource_limits &b);
bool operator==(const network_policy &a, const network_policy &b);
bool operator==(const security_policy &a, const security_policy &b);
bool operator==(const sandbox_config &a, const sandbox_config &b);

/**
 * @brief 根据运行时构造最严格的默认沙箱配置
 * 纯函数，相同的运行时总是得到相同的配置。
 * 不支持的运行时应由调用方在此之前拒绝（见 parse_runtime）。
 */
sandbox_config build_config(verifier::runtime rt);

/**
 * @brief 检查显式放宽后的沙箱配置是否在允许的范围内
 * 内存 64-4096 MB，CPU 0.1-4 核，超时 5-300 秒，输出上限 1 KiB-16 MiB，
 * restricted 网络模式必须指定允许访问的主机。
 * @throw invalid_request 若配置超出范围
 */
void validate_config(const sandbox_config &config);

}  // namespace verifier
