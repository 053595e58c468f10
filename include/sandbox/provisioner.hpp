#pragma once

#include <functional>
#include <string>
#include "common/config.hpp"
#include "docker/engine.hpp"
#include "language/profile.hpp"

namespace runner::sandbox {

/**
 * @brief 一个已经启动的沙箱容器
 */
struct container_handle {
    std::string id;
    std::string name;
    std::string session_id;
    std::string language;
};

/**
 * @brief 负责沙箱容器的创建、启动和删除
 */
struct provisioner {
    provisioner(docker::engine &docker, const configuration &config);

    /**
     * @brief 容器名，由前缀和 session id 组成
     */
    std::string container_name(const std::string &session_id) const;

    /**
     * @brief 生成容器的创建参数
     * 网络默认禁用，只有需要安装依赖时才允许访问外网并设置 DNS
     */
    docker::container_spec make_spec(const language_profile &profile, const std::string &session_id,
                                     bool needs_network) const;

    /**
     * @brief 创建并启动沙箱容器
     * 创建前会删除同名的旧容器；创建和启动在遇到暂时性错误时重试；
     * 启动失败时已经创建的容器会被删除。
     * @param cancelled 返回真时放弃创建
     * @throw provision_error 镜像不存在、容器引擎不可达或者重试次数用尽
     * @throw operation_cancelled 被取消
     */
    container_handle provision(const language_profile &profile, const std::string &session_id,
                               bool needs_network, const std::function<bool()> &cancelled = {});

    /**
     * @brief 停止并删除容器
     * 容器已经停止（304）或者不存在（404）都视为成功，其他错误记录日志后忽略
     * @return 容器是否已经确认不存在
     */
    bool teardown(const container_handle &handle) noexcept;

    /**
     * @brief 删除上次运行遗留的、带有本服务 label 的容器
     * @return 删除的容器数量
     */
    size_t prune_stale();

private:
    docker::engine &docker;
    const configuration &config;

    void remove_existing(const std::string &name);
};

}  // namespace runner::sandbox
