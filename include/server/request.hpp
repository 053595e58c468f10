#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "language/profile.hpp"
#include "program.hpp"

namespace runner::server {

/**
 * @brief 请求中的一个文件
 */
struct request_file {
    /**
     * @brief 相对路径，JSON 中为 name 或 path
     */
    std::string name;

    std::string content;

    /**
     * @brief 内容的编码，空或 "utf8" 表示原样，"base64" 表示二进制文件
     */
    std::string encoding;
};

void from_json(const nlohmann::json &j, request_file &file);

/**
 * @brief POST /api/execution/start 和 /api/execution/run 的请求体
 * @code{.json}
 * {
 *     "sessionId": "s1",
 *     "language": "javascript",
 *     "files": [
 *         { "name": "main.js", "content": "console.log(require('foo')())" },
 *         { "name": "lib/util.js", "content": "..." }
 *     ],
 *     "mainFile": "main.js",
 *     "dependencies": { "lodash": "^4.17.21" },
 *     "projectId": "p1",
 *     "customLibraries": [{ "fileName": "foo-1.0.0.tgz" }]
 * }
 * @endcode
 * 只有一个文件时可以只提供 code
 */
struct execution_request {
    std::string session_id;
    std::string language;
    std::optional<std::string> code;
    std::vector<request_file> files;
    std::string main_file;
    std::string entry_point;
    std::string project_id;
    std::map<std::string, std::string> dependencies;
    std::vector<library_ref> libraries;
};

void from_json(const nlohmann::json &j, execution_request &request);

/**
 * @brief 解析请求体
 * @throw validation_error 请求体不是合法的 JSON 或缺少字段
 */
execution_request parse_execution_request(const std::string &body);

execution_request parse_execution_request(const nlohmann::json &j);

/**
 * @brief 解码 base64，忽略空白字符
 * @throw validation_error 内容不是合法的 base64
 */
std::string decode_base64(const std::string &text);

/**
 * @brief 根据请求构造项目
 * 1. 检查所有路径，拒绝绝对路径、".."、重复的文件；
 * 2. 只提供 code 时，代码保存为语言的默认入口文件（Java 为 public class 的类名加 .java）；
 * 3. 入口文件依次取 mainFile、默认入口文件、第一个源文件；
 * 4. 引用自定义库时必须提供 projectId。
 * @throw validation_error 请求不合法
 */
project build_project(const execution_request &request, const language_profile &profile);

}  // namespace runner::server
