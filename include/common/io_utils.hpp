#pragma once

#include <filesystem>
#include <string>

namespace runner {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 计算字符串末尾被截断的 UTF-8 多字节序列的长度
 * 容器输出按帧切分，一个字符可能被拆到两帧中，这些字节需要留到下一次输出时再发送
 * @return 末尾不完整序列的字节数（0 到 3）
 */
size_t utf8_incomplete_tail(const std::string &string);

/**
 * @brief 规范化调用方提交的相对路径
 * 项目文件最后会被写入容器内的工作目录，如果文件名是绝对路径或者包含 ".."，
 * 文件就有可能被写到工作目录之外。
 * 去掉 "." 路径分量，拒绝绝对路径、".."、空分量、反斜杠和 NUL 字节。
 * @param subpath 调用方提交的文件名
 * @return 规范化后的路径，如 "src/main.py"
 * @throw validation_error 路径不安全
 */
std::string normalize_relative_path(const std::string &subpath);

}  // namespace runner
