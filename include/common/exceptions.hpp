#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace verifier {

struct verifier_exception : std::exception {
    verifier_exception();
    explicit verifier_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const verifier_exception &ex);

    template <typename T>
    verifier_exception operator<<(const T &t) const {
        return verifier_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示验证系统的内部错误
 * 一般是程序缺陷或者不应该出现的状态
 */
struct internal_error : public verifier_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示协作方（沙箱执行器、依赖审查器、合约校验器）不可用
 * 比如无法创建隔离环境、扫描工具不存在、工具在受测代码控制范围之外崩溃。
 * 该错误对当前验证是致命的，验证报告会以 LOGIC 失败结束。
 */
struct sandbox_error : public verifier_exception {
    sandbox_error();
    explicit sandbox_error(const std::string &message);
};

/**
 * @brief 表示调用方违反了调用约定
 * 比如空的 artifact 列表、不支持的运行时、超出范围的沙箱配置。
 * 这不是验证失败，不会产生验证报告。
 */
struct invalid_request : public verifier_exception {
    invalid_request();
    explicit invalid_request(const std::string &message);
};

/**
 * @brief 验证在进入 finalizing 阶段前被取消
 */
struct verification_cancelled : public verifier_exception {
    verification_cancelled();
    explicit verification_cancelled(const std::string &message);
};

}  // namespace verifier
