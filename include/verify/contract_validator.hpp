#pragma once

#include <string>
#include <vector>
#include "sandbox/request.hpp"
#include "verify/findings.hpp"
#include "verify/task.hpp"

namespace verifier {

/**
 * @brief 合约校验器
 * 检查提交的代码是否实现了共享合约中声明的接口。
 */
struct contract_validator {
    virtual ~contract_validator();

    /**
     * @param contract 任务的共享合约，包括合约文档位置与直接声明的接口
     * @param artifacts 提交的所有 artifact
     * @throw sandbox_error 若合约文档无法读取或者校验器不可用
     */
    virtual contract_validation_result validate(const shared_contract &contract,
                                                const std::vector<code_artifact> &artifacts) = 0;
};

/**
 * @brief 通过扫描路由声明来校验接口是否存在的合约校验器
 * 合约文档为 OpenAPI JSON，只支持本地路径与 file:// URL。
 * 能够识别的路由声明：
 * 1. FastAPI：@app.get("/items/{id}")
 * 2. Flask：@app.route("/items/<int:id>", methods=["GET", "POST"])
 * 3. Express：app.post('/items/:id', ...)、router.get(...)
 * 路径参数的写法不同但位置相同的路由视为同一个接口。
 * 缺少的接口记为 high 级别的 missing_endpoint 违例。
 */
struct route_contract_validator : public contract_validator {
    contract_validation_result validate(const shared_contract &contract,
                                        const std::vector<code_artifact> &artifacts) override;
};

/**
 * @brief 从 OpenAPI JSON 文档中读取所有接口
 * @throw sandbox_error 若文档不是合法的 OpenAPI JSON
 */
std::vector<api_endpoint> parse_openapi_endpoints(const std::string &document);

/**
 * @brief 规范化路由路径：{id}、<int:id>、:id 统一为 {}，去除末尾的 /
 */
std::string normalize_route(const std::string &path);

}  // namespace verifier
