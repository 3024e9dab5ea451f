#pragma once

#include <filesystem>
#include <string>

namespace codeeval {

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw std::system_error 文件无法创建或者写入不完整
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 路径是否以 .gz 结尾，决定读写时是否需要经过 gzip 压缩
 */
bool is_gzip_path(const std::filesystem::path &path);

}  // namespace codeeval
