#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace verifier {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 生成随机 uuid 的字符串形式
 */
std::string generate_uuid();

/**
 * @brief 将非负整数转换为 36 进制字符串（0-9a-z）
 */
std::string to_base36(uint64_t value);

/**
 * @brief 当前时间的 UNIX 毫秒时间戳
 */
int64_t current_time_millis();

/**
 * @brief 将毫秒时间戳格式化为 ISO 8601 的 UTC 时间，如 2024-01-01T00:00:00.000Z
 */
std::string format_timestamp(int64_t millis);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace verifier
