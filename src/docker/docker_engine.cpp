#include "docker/docker_engine.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/throw_exception.hpp>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>
#include "common/defer.hpp"
#include "config.hpp"

namespace runner::docker {
using namespace std;
using namespace nlohmann;
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using unix_socket = net::local::stream_protocol::socket;

string url_encode(const string &value) {
    CURL *curl = curl_easy_init();
    if (!curl)
        throw network_error("unable to initialize curl");
    defer { curl_easy_cleanup(curl); };

    char *escaped = curl_easy_escape(curl, value.c_str(), (int)value.size());
    if (!escaped)
        throw internal_error("unable to escape " + value);
    string result(escaped);
    curl_free(escaped);
    return result;
}

static size_t append_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

// Docker 的错误响应体为 {"message": "..."}
static string error_message(const docker_engine::response &res) {
    json j = json::parse(res.body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.count("message") && j.at("message").is_string())
        return j.at("message").get<string>();
    return res.body;
}

[[noreturn]] static void fail(const docker_engine::response &res, const string &what) {
    throw engine_error(res.status, fmt::format("{}: HTTP {} {}", what, res.status, error_message(res)));
}

docker_engine::docker_engine(const string &socket_path, const string &api_version)
    : socket_path(socket_path), api_version(api_version) {}

docker_engine::response docker_engine::request(const string &method, const string &path,
                                               const string &body, const string &content_type,
                                               long timeout_seconds) {
    CURL *curl = curl_easy_init();
    if (!curl)
        throw network_error("unable to initialize curl");
    defer { curl_easy_cleanup(curl); };

    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, ("Content-Type: " + content_type).c_str());
    defer { curl_slist_free_all(headers); };

    response res{0, ""};
    string url = "http://localhost/" + api_version + path;
    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, socket_path.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    if (method == "POST" || method == "PUT") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body.size());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &res.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_VERBOSE, DEBUG ? 1L : 0L);

    CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK)
        BOOST_THROW_EXCEPTION(network_error(fmt::format("{} {} via {}: {}", method, path, socket_path, curl_easy_strerror(code))));
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &res.status);
    DLOG(INFO) << "docker: " << method << " " << path << " -> " << res.status;
    return res;
}

bool docker_engine::ping() {
    try {
        auto res = request("GET", "/_ping", "", "text/plain", 5);
        return res.status == 200;
    } catch (const network_error &ex) {
        LOG(WARNING) << "docker: ping failed: " << ex.what();
        return false;
    }
}

string docker_engine::create_container(const container_spec &spec) {
    json body = spec;
    auto res = request("POST", "/containers/create?name=" + url_encode(spec.name), body.dump());
    if (res.status != 201)
        fail(res, "create container " + spec.name);
    return json::parse(res.body).at("Id").get<string>();
}

void docker_engine::start_container(const string &id) {
    auto res = request("POST", "/containers/" + id + "/start");
    if (res.status != 204 && res.status != 304)
        fail(res, "start container " + id);
}

void docker_engine::stop_container(const string &id, int timeout_seconds) {
    auto res = request("POST", fmt::format("/containers/{}/stop?t={}", id, timeout_seconds), "",
                       "application/json", timeout_seconds + 30);
    if (res.status != 204)
        fail(res, "stop container " + id);
}

void docker_engine::remove_container(const string &id, bool force) {
    auto res = request("DELETE", fmt::format("/containers/{}?force={}&v=false", url_encode(id), force ? "true" : "false"));
    if (res.status != 204)
        fail(res, "remove container " + id);
}

vector<container_info> docker_engine::list_containers(const string &label) {
    json filters = {{"label", json::array({label})}};
    auto res = request("GET", "/containers/json?all=true&filters=" + url_encode(filters.dump()));
    if (res.status != 200)
        fail(res, "list containers");

    vector<container_info> containers;
    for (auto &item : json::parse(res.body)) {
        container_info info;
        item.at("Id").get_to(info.id);
        if (item.count("Names") && !item.at("Names").empty()) {
            info.name = item.at("Names").at(0).get<string>();
            if (!info.name.empty() && info.name.front() == '/') info.name.erase(0, 1);
        }
        if (item.count("State"))
            item.at("State").get_to(info.state);
        if (item.count("Labels") && item.at("Labels").is_object())
            item.at("Labels").get_to(info.labels);
        containers.push_back(move(info));
    }
    return containers;
}

void docker_engine::put_archive(const string &id, const string &path, const string &archive) {
    auto res = request("PUT", fmt::format("/containers/{}/archive?path={}", id, url_encode(path)),
                       archive, "application/x-tar", 120);
    if (res.status != 200)
        fail(res, "upload archive to " + id + ":" + path);
}

/**
 * @brief 劫持后的 exec 连接
 * 读写和关闭都在 mut 下进行，读取前先在锁外 poll 等待数据
 */
struct docker_exec_stream : public exec_stream {
    docker_exec_stream(docker_engine &docker, const string &exec_id)
        : docker(docker), socket(ioc), exec_id(exec_id) {}

    ~docker_exec_stream() override {
        close();
    }

    /**
     * @brief 连接 Docker daemon 并发送 exec start 请求，把连接升级为原始的输入输出流
     * @throw network_error 无法连接或者等待响应超时
     * @throw engine_error daemon 拒绝启动 exec
     */
    void start(const string &socket_path, const string &api_version) {
        boost::system::error_code ec;
        socket.connect(net::local::stream_protocol::endpoint(socket_path), ec);
        if (ec)
            BOOST_THROW_EXCEPTION(network_error(fmt::format("connect {}: {}", socket_path, ec.message())));

        http::request<http::string_body> req{http::verb::post,
                                             fmt::format("/{}/exec/{}/start", api_version, exec_id), 11};
        req.set(http::field::host, "docker");
        req.set(http::field::content_type, "application/json");
        req.set(http::field::connection, "Upgrade");
        req.set(http::field::upgrade, "tcp");
        req.body() = json{{"Detach", false}, {"Tty", false}}.dump();
        req.prepare_payload();

        // 只解析响应头，头之后的数据已经属于输出流
        beast::flat_buffer buffer;
        http::response_parser<http::empty_body> parser;
        bool done = false;
        http::async_write(socket, req, [&](boost::system::error_code write_ec, size_t) {
            if (write_ec) {
                ec = write_ec;
                done = true;
                return;
            }
            http::async_read_header(socket, buffer, parser, [&](boost::system::error_code read_ec, size_t) {
                ec = read_ec;
                done = true;
            });
        });
        ioc.run_for(chrono::seconds(30));
        if (!done) {
            socket.close(ec);
            throw network_error("timed out waiting for exec " + exec_id + " start response");
        }
        if (ec)
            throw network_error(fmt::format("start exec {}: {}", exec_id, ec.message()));

        pending = beast::buffers_to_string(buffer.data());
        auto status = parser.get().result_int();
        if (status != 101 && status != 200) {
            string message = pending;
            close();
            throw engine_error(status, fmt::format("start exec {}: HTTP {} {}", exec_id, status, message));
        }
    }

    read_status read(string &chunk, chrono::milliseconds timeout) override {
        if (!pending.empty()) {
            chunk = move(pending);
            pending.clear();
            return read_status::DATA;
        }
        int fd = native_handle();
        if (fd < 0) return read_status::END;

        pollfd pfd{fd, POLLIN, 0};
        int ready = poll(&pfd, 1, (int)timeout.count());
        if (ready < 0) {
            if (errno == EINTR) return read_status::TIMEOUT;
            throw stream_error(fmt::format("poll exec {}: {}", exec_id, strerror(errno)));
        }
        if (ready == 0) return read_status::TIMEOUT;

        lock_guard<mutex> guard(mut);
        if (!socket.is_open()) return read_status::END;
        char buffer[65536];
        boost::system::error_code ec;
        size_t n = socket.read_some(net::buffer(buffer), ec);
        if (ec == net::error::eof) return read_status::END;
        if (ec == net::error::interrupted || ec == net::error::would_block) return read_status::TIMEOUT;
        if (ec == net::error::connection_reset) {
            LOG(WARNING) << "docker: exec " << exec_id << " connection reset";
            return read_status::END;
        }
        if (ec)
            throw stream_error(fmt::format("read exec {}: {}", exec_id, ec.message()));
        chunk.assign(buffer, n);
        return read_status::DATA;
    }

    void write(const string &data) override {
        lock_guard<mutex> guard(mut);
        if (!socket.is_open())
            throw stream_error("exec " + exec_id + " is closed");
        boost::system::error_code ec;
        net::write(socket, net::buffer(data), ec);
        if (ec)
            throw stream_error(fmt::format("write exec {}: {}", exec_id, ec.message()));
    }

    void close_input() override {
        lock_guard<mutex> guard(mut);
        boost::system::error_code ec;
        if (socket.is_open()) socket.shutdown(unix_socket::shutdown_send, ec);
        if (ec)
            LOG(WARNING) << "docker: unable to close stdin of exec " << exec_id << ": " << ec.message();
    }

    void close() override {
        lock_guard<mutex> guard(mut);
        boost::system::error_code ec;
        if (socket.is_open()) socket.close(ec);
    }

    int exit_code() override {
        // 输出流结束后 daemon 可能还没有更新 exec 的状态
        for (int attempt = 0; attempt < 20; ++attempt) {
            try {
                auto res = docker.request("GET", "/exec/" + exec_id + "/json");
                if (res.status != 200) {
                    LOG(WARNING) << "docker: inspect exec " << exec_id << " returned " << res.status;
                    return -1;
                }
                json j = json::parse(res.body);
                if (!j.at("Running").get<bool>() && !j.at("ExitCode").is_null())
                    return j.at("ExitCode").get<int>();
            } catch (const runner_exception &ex) {
                LOG(WARNING) << "docker: inspect exec " << exec_id << " failed: " << ex.what();
                return -1;
            }
            this_thread::sleep_for(chrono::milliseconds(50));
        }
        return -1;
    }

private:
    docker_engine &docker;
    net::io_context ioc;
    mutex mut;
    unix_socket socket;
    string exec_id;
    string pending;

    int native_handle() {
        lock_guard<mutex> guard(mut);
        return socket.is_open() ? socket.native_handle() : -1;
    }
};

unique_ptr<exec_stream> docker_engine::exec(const string &id, const exec_options &options) {
    json body = options;
    auto res = request("POST", "/containers/" + id + "/exec", body.dump());
    if (res.status != 201)
        fail(res, "create exec in " + id);
    string exec_id = json::parse(res.body).at("Id").get<string>();

    auto stream = make_unique<docker_exec_stream>(*this, exec_id);
    stream->start(socket_path, api_version);
    return stream;
}

}  // namespace runner::docker
