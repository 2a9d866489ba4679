#pragma once

#include <filesystem>
#include <string>

namespace verifier {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 若文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将内容写入文件，必要时创建父文件夹
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会离开所在的目录
 * 这里用于确保将 artifact 写入沙箱的临时目录时不会出现目录遍历攻击：
 * 如果拿到的文件名是绝对路径或者包含 ".." 路径段，那么可能覆盖沙箱之外的文件。
 * @param subpath 被检查的文件名
 * @return subpath 本身
 * @throw std::invalid_argument 若 subpath 不安全
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 判断 subpath 是否可以安全地拼接到某个目录下
 */
bool is_safe_path(const std::string &subpath);

}  // namespace verifier
