#pragma once

#include <map>
#include <string>
#include <vector>

namespace runner {

/**
 * @brief 项目中的一个文件
 */
struct project_file {
    /**
     * @brief 相对于工作目录的 POSIX 路径，已经过 normalize_relative_path 检查
     * 比如 path="src/utils.py"，那么文件将被写入 <workspace>/src/utils.py
     */
    std::string path;

    /**
     * @brief 文件的原始字节
     */
    std::string content;
};

/**
 * @brief 调用方引用的一个自定义库
 * 库文件本身由外部上传，这里只记录文件名，通过 library_store 按项目 id 查找
 */
struct library_ref {
    std::string file_name;
};

/**
 * @brief 一次提交的全部内容
 */
struct project {
    std::vector<project_file> files;

    /**
     * @brief 入口文件，必须是 files 中的一个
     */
    std::string entry_file;

    /**
     * @brief 显式指定的入口
     * 对于 Java，entry_point 为应用程序主类。若空，从入口文件中查找 public class，找不到则为 Main
     * 其他语言忽略此项
     */
    std::string entry_point;

    /**
     * @brief 依赖包名到版本的映射，版本为 "*" 表示不限制版本
     * 对于 Java，包名为 groupId:artifactId
     */
    std::map<std::string, std::string> dependencies;

    /**
     * @brief 自定义库所属的项目 id
     */
    std::string project_id;

    std::vector<library_ref> libraries;

    /**
     * @brief 查找路径为 path 的文件
     * @return 找不到时返回 nullptr
     */
    const project_file *find(const std::string &path) const;
};

}  // namespace runner
