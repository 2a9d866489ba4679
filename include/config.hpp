#pragma once

#include <filesystem>

namespace verifier {

enum error_codes {
    E_SUCCESS = 0,
    E_VERIFICATION_FAILED = 1,
    E_INTERNAL_ERROR = 2,

    /**
     * @brief 沙箱子进程在 exec 之前配置隔离环境失败
     */
    E_SANDBOX_SETUP = 120,

    /**
     * @brief /bin/sh 约定的返回码：命令存在但无法执行
     */
    E_CANNOT_EXECUTE = 126,

    /**
     * @brief /bin/sh 约定的返回码：命令不存在
     */
    E_COMMAND_NOT_FOUND = 127
};

/**
 * @brief 沙箱临时目录的根目录
 * 每次执行都会在这里创建一个以 sandbox id 命名的目录，执行结束后删除。
 * 
 * SANDBOX_DIR
 * ├── sbx_0f8c... // 随机生成的 sandbox id
 * │   ├── main.py // 受测代码
 * │   ├── test_main.py // 测试代码
 * │   └── requirements.txt
 * └── ...
 * @defaultValue 系统临时目录下的 verifier 文件夹
 */
extern std::filesystem::path SANDBOX_DIR;

/**
 * @brief 是否使用 cgroup 限制沙箱的内存与 CPU，并统计资源使用
 * 需要 root 权限。关闭时内存通过 RLIMIT_AS 限制，资源使用通过 rusage 统计。
 */
extern bool USE_CGROUP;

/**
 * @brief 无法创建网络、挂载命名空间时是否视为沙箱错误
 * 关闭后隔离失败只会记录警告，仅用于开发环境。
 */
extern bool REQUIRE_ISOLATION;

/**
 * @brief 是否保留沙箱临时目录以便检查
 */
extern bool KEEP_SANDBOX;

/**
 * @brief 各验证阶段的时间约定（毫秒）
 * 静态分析阶段的约定是在沙箱自身的 timeout_seconds 之上额外允许的时间，
 * 用于创建与销毁沙箱。
 */
extern int DEPENDENCY_VETTING_SLA_MS;
extern int STATIC_ANALYSIS_SLA_MS;
extern int TEST_EXECUTION_SLA_MS;
extern int CONTRACT_VALIDATION_SLA_MS;
extern int FINALIZATION_SLA_MS;

/**
 * @brief 最多同时运行的沙箱数量（即验证 worker 数量）
 */
extern int MAX_CONCURRENT_SANDBOXES;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，验证系统将不再检查程序是否在特权模式下执行，
 * 并且输出更详细的日志。
 */
extern bool DEBUG;

}  // namespace verifier
