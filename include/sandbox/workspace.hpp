#pragma once

#include <functional>
#include <string>
#include <vector>
#include "common/config.hpp"
#include "docker/engine.hpp"
#include "program.hpp"
#include "sandbox/library.hpp"
#include "sandbox/provisioner.hpp"

namespace runner::sandbox {

/**
 * @brief 将项目文件和自定义库写入容器
 * 所有文件都打包成 tar 归档通过容器引擎的 archive 接口上传，
 * 文件内容按字节原样写入，不经过 shell。
 */
struct workspace_builder {
    workspace_builder(docker::engine &docker, const configuration &config);

    /**
     * @brief 生成写入 root 目录的归档
     * 归档从容器根目录解压，包含 root 本身以及 files 中路径隐含的所有中间目录，
     * 所有条目都属于配置的沙箱用户。
     * @param root 容器内的绝对路径，比如 /sandbox/project
     */
    std::string build_archive(const std::string &root, const std::vector<project_file> &files) const;

    /**
     * @brief 创建工作目录并写入文件
     * @throw workspace_write_error 上传失败
     */
    void materialize(const container_handle &handle, const std::vector<project_file> &files);

    /**
     * @brief 将自定义库写入暂存目录
     * @throw workspace_write_error 上传失败
     */
    void stage_libraries(const container_handle &handle, const std::vector<library_blob> &libraries);

    /**
     * @brief 在工作目录中执行合并脚本，把暂存的库放到语言约定的位置
     * 是否成功只看脚本的退出状态
     * @throw workspace_write_error 合并脚本失败
     */
    void merge_libraries(const container_handle &handle, const language_profile &profile,
                         const std::vector<library_blob> &libraries,
                         const std::function<bool()> &cancelled = {});

    /**
     * @brief 在工作目录中以沙箱用户执行命令的参数
     */
    docker::exec_options sandbox_exec(const std::string &command) const;

private:
    docker::engine &docker;
    const configuration &config;

    void upload(const container_handle &handle, const std::string &root, const std::vector<project_file> &files);
};

}  // namespace runner::sandbox
