#pragma once

#include <string>
#include "docker/engine.hpp"

namespace runner::docker {

/**
 * @brief 通过 unix socket 访问 Docker Engine HTTP API 的容器引擎实现
 * 普通请求使用 libcurl；exec 通过 Boost.Beast 发送升级请求，输入输出在劫持（hijack）后的原始连接上传输
 */
struct docker_engine : public engine {
    struct response {
        long status;
        std::string body;
    };

    /**
     * @param socket_path Docker daemon 的 unix socket，比如 /var/run/docker.sock
     * @param api_version API 版本前缀，比如 v1.41
     */
    docker_engine(const std::string &socket_path, const std::string &api_version);

    bool ping() override;
    std::string create_container(const container_spec &spec) override;
    void start_container(const std::string &id) override;
    void stop_container(const std::string &id, int timeout_seconds) override;
    void remove_container(const std::string &id, bool force) override;
    std::vector<container_info> list_containers(const std::string &label) override;
    void put_archive(const std::string &id, const std::string &path, const std::string &archive) override;
    std::unique_ptr<exec_stream> exec(const std::string &id, const exec_options &options) override;

    /**
     * @brief 发送一个 HTTP 请求
     * @param path 不包括版本前缀的路径，比如 /containers/json
     * @throw network_error 无法连接到 Docker daemon
     */
    response request(const std::string &method, const std::string &path,
                     const std::string &body = "",
                     const std::string &content_type = "application/json",
                     long timeout_seconds = 60);

private:
    std::string socket_path;
    std::string api_version;
};

/**
 * @brief 对查询参数做百分号编码
 */
std::string url_encode(const std::string &value);

}  // namespace runner::docker
