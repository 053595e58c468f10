#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/retry.hpp"

namespace runner {

/**
 * @brief 沙箱容器的资源与布局配置
 */
struct container_config {
    /**
     * @brief 容器名前缀，容器名为前缀加上 session id
     */
    std::string name_prefix = "nexusquest-project-";

    /**
     * @brief 标记本服务创建的容器的 label 键，值为 session id
     * 服务启动时会删除所有带有这个 label 的残留容器
     */
    std::string label = "code-runner.session";

    /**
     * @brief 容器内的工作目录，每个容器只有一个会话，所以路径是固定的
     * 固定路径使得缓存的依赖（比如 conan 生成的文件中的绝对路径）可以在会话之间复用
     */
    std::string workspace_root = "/sandbox/project";

    /**
     * @brief 容器内存放自定义库的暂存目录，在依赖安装完成后合并进工作目录
     */
    std::string staging_root = "/sandbox/staging";

    /**
     * @brief 依赖缓存卷在容器内的挂载点
     */
    std::string cache_root = "/dependencies";

    /**
     * @brief 依赖缓存卷名，{} 将被替换为语言名
     */
    std::string cache_volume = "{}-dependencies";

    bool mount_dependency_cache = true;

    /**
     * @brief 运行用户程序的 uid 和 gid，写入的文件也属于该用户
     */
    unsigned uid = 1001;
    unsigned gid = 1001;

    int64_t memory_bytes = 1LL << 30;

    /**
     * @brief CPU 配额，单位为 1e-9 个核心
     */
    int64_t nano_cpus = 1000000000;

    int64_t pids_limit = 512;

    std::string tmpfs_options = "rw,exec,nosuid,size=50m";

    /**
     * @brief 需要网络时使用的 DNS 服务器
     */
    std::vector<std::string> dns = {"8.8.8.8", "8.8.4.4"};
};

void from_json(const nlohmann::json &j, container_config &config);

struct timeout_config {
    std::chrono::seconds execution{300};
    std::chrono::seconds npm{120};
    std::chrono::seconds pip{120};
    std::chrono::seconds maven{180};
    std::chrono::seconds conan{300};

    /**
     * @brief 合并自定义库、检查缓存等辅助脚本的超时
     */
    std::chrono::seconds helper{120};

    /**
     * @brief 会话终止后，删除容器之前等待调用方读取最后输出的时间
     */
    std::chrono::milliseconds grace{1000};

    /**
     * @brief 停止容器时等待进程退出的时间
     */
    std::chrono::seconds stop{1};

    /**
     * @brief 输出流空闲时发送心跳注释的间隔
     */
    std::chrono::seconds heartbeat{15};
};

void from_json(const nlohmann::json &j, timeout_config &config);

void from_json(const nlohmann::json &j, retry_policy &policy);

struct retry_config {
    /**
     * @brief 容器创建、启动以及 exec 连接的重试策略
     */
    retry_policy engine;

    /**
     * @brief 网络类依赖安装失败的重试策略
     */
    retry_policy install{2, std::chrono::milliseconds(2000), 2.0};
};

void from_json(const nlohmann::json &j, retry_config &config);

struct server_config {
    std::string address = "0.0.0.0";

    unsigned short port = 9876;

    /**
     * @brief 允许跨域访问的来源，"*" 表示任意来源
     */
    std::vector<std::string> allowed_origins = {"http://localhost:5173", "http://localhost:3000"};

    size_t max_body_bytes = 16 << 20;
};

void from_json(const nlohmann::json &j, server_config &config);

/**
 * @brief 运行系统的完整配置，可以从 --config 指定的 JSON 文件加载
 * @code{.json}
 * {
 *     "container": { "memory_bytes": 536870912, "dns": ["1.1.1.1"] },
 *     "timeouts": { "execution": 60, "grace_ms": 500 },
 *     "retry": { "engine": { "attempts": 5, "interval_ms": 200 } },
 *     "images": { "python": "python:3.12-slim" },
 *     "server": { "port": 9876, "allowed_origins": ["*"] }
 * }
 * @endcode
 */
struct configuration {
    container_config container;
    timeout_config timeouts;
    retry_config retry;
    server_config server;

    /**
     * @brief 覆盖语言表中的默认镜像，键为语言名
     */
    std::map<std::string, std::string> images;

    /**
     * @brief 每个会话中尚未被读取的输出的最大字节数，超出的输出将被丢弃
     */
    size_t max_pending_output = 8 << 20;
};

void from_json(const nlohmann::json &j, configuration &config);

}  // namespace runner
