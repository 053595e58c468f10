#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/config.hpp"
#include "common/exceptions.hpp"
#include "docker/engine.hpp"
#include "language/profile.hpp"
#include "program.hpp"
#include "sandbox/provisioner.hpp"

namespace runner::sandbox {

/**
 * @brief 需要安装的依赖
 */
struct dependency_manifest {
    package_manager manager;

    /**
     * @brief 需要额外写入工作目录的清单文件，比如由依赖表生成的 package.json
     */
    std::vector<project_file> generated;

    /**
     * @brief 依赖集合的内容，相同内容的依赖共享缓存
     */
    std::string identity;

    /**
     * @brief 安装完成后需要缓存的产物目录（相对于工作目录）
     */
    std::vector<std::string> artifacts;
};

/**
 * @brief C++ 项目中 find_package 引用的包名（跳过 Threads、Boost 等系统包）
 */
std::vector<std::string> cmake_packages(const std::string &cmake_lists);

/**
 * @brief 检查项目是否需要安装依赖
 * 该函数没有副作用：
 * 1. JavaScript：package.json 或依赖表，二者都有时依赖表合并进 package.json；
 * 2. Python：requirements.txt 或依赖表（"*" 表示不限版本，否则为 name==version）；
 * 3. C++：conanfile.txt/conanfile.py，或由 CMakeLists.txt 的 find_package 和依赖表生成 conanfile.txt；
 * 4. Java：pom.xml，或由 groupId:artifactId 形式的依赖表生成 pom.xml。
 * @return 不需要安装时返回空
 * @throw validation_error 清单格式错误
 */
std::optional<dependency_manifest> detect_manifest(const language_profile &profile, const project &proj);

/**
 * @brief 缓存键，由语言名和依赖内容的 MD5 组成
 */
std::string cache_key(const language_profile &profile, const dependency_manifest &manifest);

/**
 * @brief 根据包管理器的输出判断失败原因
 */
dependency_install_error::failure_kind classify_install_log(const std::string &log);

/**
 * @brief 取日志的末尾部分，至多 limit 字节
 */
std::string log_excerpt(const std::string &log, size_t limit = 1000);

/**
 * @brief 包管理器的安装命令
 */
std::string install_command(const language_profile &profile, const dependency_manifest &manifest);

struct install_result {
    bool from_cache;
    std::string log;
};

/**
 * @brief 在沙箱容器中安装依赖，使用按语言划分的缓存卷
 * 缓存只写一次：安装成功后产物先复制到临时目录，再重命名为缓存目录。
 * 同一个缓存键的首次安装在进程内通过互斥锁串行化，等待锁的时间计入安装超时，
 * 等待期间会响应取消。
 */
struct dependency_installer {
    dependency_installer(docker::engine &docker, const configuration &config);

    /**
     * @brief 安装依赖
     * 缓存命中时直接复制缓存的产物；否则执行安装，网络类错误按配置重试
     * @throw dependency_install_error 安装失败
     * @throw timeout_error 安装超时
     * @throw operation_cancelled 被取消
     */
    install_result install(const container_handle &handle, const language_profile &profile,
                           const dependency_manifest &manifest,
                           const std::function<bool()> &cancelled = {});

    /**
     * @brief 包管理器的超时时间
     */
    std::chrono::seconds install_timeout(package_manager manager) const;

private:
    docker::engine &docker;
    const configuration &config;

    std::mutex locks_mutex;
    std::map<std::string, std::weak_ptr<std::timed_mutex>> locks;

    std::shared_ptr<std::timed_mutex> key_lock(const std::string &key);

    /**
     * @brief 等待缓存键的锁
     * @throw timeout_error 等待超过 timeout
     * @throw operation_cancelled 等待时被取消
     */
    std::unique_lock<std::timed_mutex> acquire_key(std::timed_mutex &lock, const std::string &key,
                                                   std::chrono::milliseconds timeout,
                                                   const std::function<bool()> &cancelled);

    docker::exec_options sandbox_exec(const std::string &command) const;

    bool restore_cache(const container_handle &handle, const std::string &key,
                       const std::function<bool()> &cancelled);
    void populate_cache(const container_handle &handle, const std::string &key,
                        const dependency_manifest &manifest, const std::function<bool()> &cancelled);
};

}  // namespace runner::sandbox
