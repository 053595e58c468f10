#include "server/http_server.hpp"
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <boost/algorithm/string.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include <thread>
#include "common/defer.hpp"
#include "common/messages.hpp"
#include "common/utils.hpp"
#include "server/request.hpp"

namespace runner::server {
using namespace std;
using namespace nlohmann;
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

static const string execution_prefix = "/api/execution/";

unsigned status_of(const runner_exception &ex) {
    string kind = ex.kind();
    if (kind == "validation") return 400;
    if (kind == "not_found") return 404;
    if (kind == "unsupported") return 422;
    return 500;
}

http_server::http_server(session::session_manager &manager, docker::engine &docker, const language_table &languages,
                         const configuration &config)
    : manager(manager), docker(docker), languages(languages), config(config) {}

template <typename Response>
void http_server::set_cors(const http_request &req, Response &res) const {
    auto &origins = config.server.allowed_origins;
    string origin(req[http::field::origin]);
    if (find(origins.begin(), origins.end(), "*") != origins.end()) {
        res.set(http::field::access_control_allow_origin, "*");
    } else if (!origin.empty() && find(origins.begin(), origins.end(), origin) != origins.end()) {
        res.set(http::field::access_control_allow_origin, origin);
        res.set(http::field::vary, "Origin");
    }
}

http_response http_server::json_response(const http_request &req, unsigned status, const json &body) const {
    http_response res{static_cast<http::status>(status), req.version()};
    res.set(http::field::server, "code-runner");
    res.set(http::field::content_type, "application/json");
    set_cors(req, res);
    res.keep_alive(req.keep_alive());
    res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

http_response http_server::error_response(const http_request &req, unsigned status, const string &message,
                                          const string &kind) const {
    return json_response(req, status, {{"success", false}, {"error", message}, {"kind", kind}});
}

static json parse_body(const http_request &req) {
    try {
        return json::parse(req.body());
    } catch (const json::exception &ex) {
        throw validation_error(string("malformed request: ") + ex.what());
    }
}

static string string_field(const json &j, const char *key) {
    if (!j.is_object() || !j.count(key) || !j.at(key).is_string())
        throw validation_error(string(key) + " is required");
    return j.at(key).get<string>();
}

http_response http_server::handle(const http_request &req) {
    try {
        return route(req);
    } catch (const runner_exception &ex) {
        unsigned status = status_of(ex);
        if (status == 500)
            LOG(ERROR) << req.method_string() << " " << req.target() << " failed: " << ex;
        return error_response(req, status, ex.what(), ex.kind());
    } catch (const std::exception &ex) {
        LOG(ERROR) << req.method_string() << " " << req.target() << " crashed: " << boost::diagnostic_information(ex);
        return error_response(req, 500, ex.what(), "internal");
    }
}

http_response http_server::route(const http_request &req) {
    string target(req.target());
    target = target.substr(0, target.find('?'));

    if (req.method() == http::verb::options) {
        http_response res{http::status::no_content, req.version()};
        set_cors(req, res);
        res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
        res.set(http::field::access_control_max_age, "600");
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        return res;
    }

    if (req.method() == http::verb::get) {
        if (target == "/health")
            return health(req);
        if (target == execution_prefix + "languages")
            return list_languages(req);
        if (boost::starts_with(target, execution_prefix + "sessions/"))
            return session_info(req, target.substr(execution_prefix.size() + 9));
    } else if (req.method() == http::verb::post) {
        if (target == execution_prefix + "start")
            return start(req);
        if (target == execution_prefix + "input")
            return input(req);
        if (target == execution_prefix + "stop")
            return stop_session(req);
        if (target == execution_prefix + "run")
            return run_to_end(req);
    }
    return error_response(req, 404, fmt::format("no route for {} {}", string(req.method_string()), target), "not_found");
}

http_response http_server::start(const http_request &req) {
    auto request = parse_execution_request(req.body());
    auto &profile = languages.at(request.language);
    auto proj = build_project(request, profile);
    manager.start(request.session_id, request.language, move(proj));
    return json_response(req, 200, {{"success", true}, {"sessionId", request.session_id}});
}

http_response http_server::input(const http_request &req) {
    json j = parse_body(req);
    string session_id = string_field(j, "sessionId");
    string text = string_field(j, "input");
    manager.send_input(session_id, text);
    return json_response(req, 200, {{"success", true}});
}

http_response http_server::stop_session(const http_request &req) {
    json j = parse_body(req);
    manager.stop(string_field(j, "sessionId"));
    return json_response(req, 200, {{"success", true}});
}

http_response http_server::run_to_end(const http_request &req) {
    json j = parse_body(req);
    if (!j.is_object()) throw validation_error("request body must be a JSON object");
    if (!j.count("language")) j["language"] = "python";
    if (!j.count("sessionId")) j["sessionId"] = "run-" + random_token();
    string input;
    if (j.count("input") && j.at("input").is_string()) input = j.at("input").get<string>();

    auto request = parse_execution_request(j);
    auto &profile = languages.at(request.language);
    auto proj = build_project(request, profile);

    elapsed_time timer;
    auto session = manager.start(request.session_id, request.language, move(proj));
    if (!session->output.subscribe())
        throw internal_error("session " + request.session_id + " already has a subscriber");
    defer { session->output.unsubscribe(); };

    if (!input.empty()) {
        if (input.back() == '\n') input.pop_back();
        session->input.send(input);
    }
    session->input.finish();

    string out, err, error;
    optional<int> exit_code;
    while (!session->output.drained()) {
        auto event = session->output.next(chrono::seconds(1));
        if (!event) continue;
        switch (event->type) {
            case message::output_type::STDOUT:
                out += event->data;
                break;
            case message::output_type::STDERR:
                err += event->data;
                break;
            case message::output_type::END:
                exit_code = event->exit_code;
                break;
            case message::output_type::ERROR:
                error = event->data;
                break;
        }
        if (event->terminal()) break;
    }
    session->wake();

    json body = {{"success", error.empty()},
                 {"stdout", out},
                 {"stderr", err},
                 {"executionTime", timer.duration<chrono::milliseconds>().count()}};
    if (exit_code) body["exitCode"] = *exit_code;
    if (!error.empty()) {
        body["error"] = error;
        body["kind"] = "execution";
    }
    return json_response(req, error.empty() ? 200 : 500, body);
}

http_response http_server::session_info(const http_request &req, const string &session_id) {
    auto session = manager.find(session_id);
    if (!session) throw session_not_found_error(session_id);
    return json_response(req, 200,
                         {{"sessionId", session->id},
                          {"language", session->language},
                          {"state", get_display_message(session->state())},
                          {"createdAt", fmt::format("{:%Y-%m-%dT%H:%M:%SZ}",
                                                    fmt::gmtime(chrono::system_clock::to_time_t(session->created_at)))}});
}

http_response http_server::list_languages(const http_request &req) {
    json list = json::array();
    for (auto &name : languages.names()) {
        auto &profile = languages.at(name);
        list.push_back({{"name", profile.name},
                        {"image", profile.image},
                        {"entryFile", profile.entry_file},
                        {"extensions", profile.source_extensions},
                        {"packageManager", get_display_message(profile.manager)}});
    }
    return json_response(req, 200, {{"success", true}, {"languages", list}});
}

http_response http_server::health(const http_request &req) {
    bool reachable = false;
    try {
        reachable = docker.ping();
    } catch (const runner_exception &ex) {
        LOG(WARNING) << "Container engine is unreachable: " << ex.what();
    }
    return json_response(req, reachable ? 200 : 503,
                         {{"success", reachable},
                          {"engine", reachable ? "reachable" : "unreachable"},
                          {"sessions", manager.registry().size()}});
}

void http_server::stream(tcp::socket &socket, const http_request &req, const string &session_id) {
    boost::system::error_code ec;
    auto reject = [&](unsigned status, const string &message, const string &kind) {
        auto res = error_response(req, status, message, kind);
        res.keep_alive(false);
        http::write(socket, res, ec);
    };

    auto session = manager.find(session_id);
    if (!session) return reject(404, "session not found: " + session_id, "not_found");
    if (!session->output.subscribe())
        return reject(400, "session " + session_id + " already has a subscriber", "validation");
    defer { session->output.unsubscribe(); };

    http::response<http::empty_body> res{http::status::ok, req.version()};
    res.set(http::field::server, "code-runner");
    res.set(http::field::content_type, "text/event-stream");
    res.set(http::field::cache_control, "no-cache");
    res.set("X-Accel-Buffering", "no");
    set_cors(req, res);
    res.keep_alive(false);
    res.chunked(true);
    http::response_serializer<http::empty_body> serializer{res};
    http::write_header(socket, serializer, ec);
    if (ec) return;

    auto heartbeat = chrono::duration_cast<chrono::milliseconds>(config.timeouts.heartbeat);
    auto last_write = chrono::steady_clock::now();
    bool disconnected = false, terminated = false;
    while (!session->output.drained()) {
        auto event = session->output.next(min(heartbeat, chrono::milliseconds(1000)));
        if (event) {
            net::write(socket, http::make_chunk(net::buffer(message::to_sse(*event))), ec);
            last_write = chrono::steady_clock::now();
            if (ec) {
                disconnected = true;
                break;
            }
            if (event->terminal()) {
                terminated = true;
                break;
            }
        } else if (chrono::steady_clock::now() - last_write >= heartbeat) {
            net::write(socket, http::make_chunk(net::buffer(string(": heartbeat\n\n"))), ec);
            last_write = chrono::steady_clock::now();
            if (ec) {
                disconnected = true;
                break;
            }
        }
    }

    if (disconnected) {
        LOG(INFO) << "Subscriber of session " << session_id << " disconnected: " << ec.message();
        if (!session->output.finished() && manager.find(session_id) == session)
            manager.stop(session_id);
        return;
    }
    // 订阅者已经读到终止事件，不需要再等待
    if (terminated) session->wake();
    net::write(socket, http::make_chunk_last(), ec);
}

void http_server::serve(tcp::socket socket) {
    boost::system::error_code ec;
    beast::flat_buffer buffer;
    while (!stopping) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(config.server.max_body_bytes);
        http::read(socket, buffer, parser, ec);
        if (ec == http::error::end_of_stream) break;
        if (ec == http::error::body_limit) {
            http_request req;
            auto res = error_response(req, 413, "request body too large", "validation");
            res.keep_alive(false);
            http::write(socket, res, ec);
            break;
        }
        if (ec) {
            DLOG(INFO) << "Unable to read request: " << ec.message();
            break;
        }

        http_request req = parser.release();
        string target(req.target());
        if (req.method() == http::verb::get && boost::starts_with(target, execution_prefix + "stream/")) {
            string session_id = target.substr(execution_prefix.size() + 7);
            stream(socket, req, session_id.substr(0, session_id.find('?')));
            break;
        }

        auto res = handle(req);
        DLOG(INFO) << req.method_string() << " " << target << " " << res.result_int();
        http::write(socket, res, ec);
        if (ec || !res.keep_alive()) break;
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

void http_server::run() {
    net::io_context ioc{1};
    tcp::endpoint endpoint{net::ip::make_address(config.server.address), config.server.port};
    tcp::acceptor acceptor{ioc, endpoint};
    LOG(INFO) << "Listening on " << endpoint;

    while (!stopping) {
        // 每 500ms 检查一次是否需要退出
        pollfd fd{acceptor.native_handle(), POLLIN, 0};
        int ready = ::poll(&fd, 1, 500);
        if (ready <= 0) continue;

        tcp::socket socket{ioc};
        boost::system::error_code ec;
        acceptor.accept(socket, ec);
        if (ec) {
            LOG(WARNING) << "Unable to accept connection: " << ec.message();
            continue;
        }
        thread(&http_server::serve, this, move(socket)).detach();
    }
    LOG(INFO) << "Stopped listening on " << endpoint;
}

void http_server::stop() {
    stopping = true;
}

}  // namespace runner::server
