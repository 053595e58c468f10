#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include "common/config.hpp"
#include "common/exceptions.hpp"
#include "docker/engine.hpp"
#include "language/profile.hpp"
#include "session/manager.hpp"

namespace runner::server {

using http_request = boost::beast::http::request<boost::beast::http::string_body>;
using http_response = boost::beast::http::response<boost::beast::http::string_body>;

/**
 * @brief 异常类别对应的 HTTP 状态码
 * validation 为 400，not_found 为 404，unsupported 为 422，其他为 500
 */
unsigned status_of(const runner_exception &ex);

/**
 * @brief 代码执行服务的 HTTP 接口
 * 每个连接在单独的线程中同步处理。
 * POST /api/execution/start      开始会话
 * GET  /api/execution/stream/:id 以 server-sent events 推送会话输出
 * POST /api/execution/input      发送一行输入
 * POST /api/execution/stop       停止会话
 * POST /api/execution/run        运行到结束后一次性返回输出
 * GET  /api/execution/sessions/:id
 * GET  /api/execution/languages
 * GET  /health
 */
struct http_server {
    http_server(session::session_manager &manager, docker::engine &docker, const language_table &languages,
                const configuration &config);

    /**
     * @brief 处理除输出流以外的所有请求
     * 错误按照 status_of 转换为 {success: false, error, kind}
     */
    http_response handle(const http_request &req);

    /**
     * @brief 监听端口直到 stop 被调用
     */
    void run();

    /**
     * @brief 让 run 在下一次检查时返回，可以在信号处理函数中调用
     */
    void stop();

private:
    session::session_manager &manager;
    docker::engine &docker;
    const language_table &languages;
    const configuration &config;
    std::atomic<bool> stopping{false};

    void serve(boost::asio::ip::tcp::socket socket);

    void stream(boost::asio::ip::tcp::socket &socket, const http_request &req, const std::string &session_id);

    http_response route(const http_request &req);
    http_response start(const http_request &req);
    http_response input(const http_request &req);
    http_response stop_session(const http_request &req);
    http_response run_to_end(const http_request &req);
    http_response session_info(const http_request &req, const std::string &session_id);
    http_response list_languages(const http_request &req);
    http_response health(const http_request &req);

    http_response json_response(const http_request &req, unsigned status, const nlohmann::json &body) const;
    http_response error_response(const http_request &req, unsigned status, const std::string &message,
                                 const std::string &kind) const;

    template <typename Response>
    void set_cors(const http_request &req, Response &res) const;
};

}  // namespace runner::server
