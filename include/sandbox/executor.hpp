#pragma once

#include "common/cancellation.hpp"
#include "sandbox/request.hpp"
#include "sandbox/result.hpp"

namespace verifier {

/**
 * @brief 沙箱执行器
 * 在隔离的执行环境中按照请求附带的 sandbox_config 运行 artifact：
 * 1. 严格执行资源限制与安全策略
 * 2. 捕获 stdout/stderr，总量不超过 max_output_bytes，超出部分截断并附加标记
 * 3. 超过 timeout_seconds 时强制终止沙箱并返回 timeout 状态
 * 4. 网络模式为 none 时保证没有任何网络出口
 * 5. 只读文件系统时保证只有本次执行的临时目录可写
 * 
 * 每个请求恰好返回一个 execution_result。
 */
struct sandbox_executor {
    virtual ~sandbox_executor();

    /**
     * @brief 执行请求，阻塞直到得到结果
     * @param request 执行请求
     * @param token 取消令牌，取消时执行器应尽快销毁隔离环境并返回
     * @return 执行结果
     * @throw sandbox_error 若无法创建隔离环境或扫描工具不可用
     */
    virtual execution_result execute(const execution_request &request, const cancellation_token &token) = 0;
};

}  // namespace verifier
