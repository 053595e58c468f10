#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "language/profile.hpp"
#include "program.hpp"

namespace runner::sandbox {

/**
 * @brief 按照语言的库文件规则推断库的类型
 * @return 没有规则匹配时返回 UNKNOWN
 */
library_kind infer_library_kind(const language_profile &profile, const std::string &file_name);

/**
 * @brief 已经取得内容的自定义库
 */
struct library_blob {
    std::string file_name;
    std::string content;
    library_kind kind;
};

/**
 * @class library_store
 * @brief 根据项目 id 和文件名查找自定义库的内容
 * 库文件的上传和持久化由外部系统负责，这里只读取
 */
struct library_store {
    virtual ~library_store();

    /**
     * @brief 获取库文件
     * @return 库不存在时返回空
     * @throw network_error 无法访问存储
     */
    virtual std::optional<std::string> fetch(const std::string &project_id, const std::string &file_name) = 0;
};

/**
 * @brief 从本地目录 root/<project id>/<file name> 读取库文件
 */
struct local_library_store : public library_store {
    std::filesystem::path root;

    explicit local_library_store(const std::filesystem::path &root);

    std::optional<std::string> fetch(const std::string &project_id, const std::string &file_name) override;
};

/**
 * @brief 通过 HTTP 从 base_url/<project id>/<file name> 下载库文件
 */
struct remote_library_store : public library_store {
    std::string base_url;

    explicit remote_library_store(const std::string &base_url);

    std::optional<std::string> fetch(const std::string &project_id, const std::string &file_name) override;
};

/**
 * @brief 上传时文件名可能被加上了压缩后缀，依次尝试 name、name.gz、name.tar.gz
 */
std::vector<std::string> library_candidates(const std::string &file_name);

/**
 * @brief 取得项目引用的所有自定义库
 * 找不到的库和无法识别类型的库会被跳过并记录警告
 */
std::vector<library_blob> resolve_libraries(library_store &store, const language_profile &profile,
                                            const project &proj);

/**
 * @brief npm 包归档的默认包名：去掉扩展名和版本号后缀，比如 "foo-1.2.3.tgz" -> "foo"
 */
std::string npm_fallback_name(const std::string &file_name);

/**
 * @brief 生成将暂存目录中的库合并进工作目录的 shell 脚本
 * 脚本在工作目录中执行，任何一个库合并失败时以非零状态退出
 * @param staging_root 暂存目录
 */
std::string merge_script(const language_profile &profile, const std::vector<library_blob> &libraries,
                         const std::string &staging_root);

/**
 * @brief 合并后工作目录中可以直接链接的库文件名（用于 C++ 的 -l 参数）
 */
std::vector<std::string> linkable_libraries(const std::vector<library_blob> &libraries);

}  // namespace runner::sandbox
