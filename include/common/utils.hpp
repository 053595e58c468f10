#pragma once

#include <chrono>
#include <string>

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 将字符串转义为 POSIX shell 的单引号字面量
 * @code{.cpp}
 *     shell_quote("it's") == "'it'\\''s'"
 * @endcode
 */
std::string shell_quote(const std::string &value);

/**
 * @brief 计算字符串的 MD5，返回 32 位小写十六进制串
 */
std::string md5_hex(const std::string &content);

/**
 * @brief 生成一个随机的十六进制串，用于临时文件名
 */
std::string random_token();

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};
