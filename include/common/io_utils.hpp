#pragma once

#include <filesystem>
#include <string>

namespace assessor {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw internal_error 若文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，已有的文件会被覆盖
 * @throw internal_error 若文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 生成一个随机的 uuid 字符串，用于命名临时文件和临时文件夹
 */
std::string random_uuid();

}  // namespace assessor
