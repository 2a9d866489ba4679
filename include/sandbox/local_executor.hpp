#pragma once

#include <filesystem>
#include "sandbox/executor.hpp"

namespace verifier {

struct local_executor_options {
    /**
     * @brief 临时目录的根目录
     */
    std::filesystem::path sandbox_dir;

    bool use_cgroup = false;
    bool require_isolation = true;
    bool keep_sandbox = false;

    /**
     * @brief 没有在 sandbox_config.environment 中指定 PATH 时使用的 PATH
     */
    std::string default_path = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

    /**
     * @brief 从 SANDBOX_DIR、USE_CGROUP、REQUIRE_ISOLATION、KEEP_SANDBOX 读取默认值
     */
    static local_executor_options from_globals();
};

/**
 * @brief 在本机以受限子进程运行 artifact 的沙箱执行器
 * 每次执行：
 * 1. 创建临时目录 sandbox_dir/sbx_<uuid>，写入所有 artifact
 * 2. 运行内置的模式扫描
 * 3. 依次以 /bin/sh -c 运行静态检查、安全扫描、测试命令，
 *    三条命令共享输出配额与墙钟截止时间
 * 4. 按运行时选择解析器，将输出解析为结构化的发现
 * 5. 删除临时目录
 *
 * 每条命令都在新的进程组、网络与挂载命名空间中运行，见 run_guarded。
 * 不支持 restricted 与 build-only 网络模式，因为本机没有出口代理。
 */
struct local_sandbox_executor : public sandbox_executor {
    local_sandbox_executor();
    explicit local_sandbox_executor(local_executor_options options);

    execution_result execute(const execution_request &request, const cancellation_token &token) override;

private:
    local_executor_options options;
};

}  // namespace verifier
