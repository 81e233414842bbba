#pragma once

#include <filesystem>
#include <string>

namespace oibox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 覆盖写入文本文件，文件权限为 0600
 * 如果 path 已经是一个符号链接则拒绝写入，避免通过预先放置的链接写到沙箱外
 * @param path 文本文件路径，必须是 path_guard 解析过的路径
 * @param content 要写入的内容
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

}  // namespace oibox
