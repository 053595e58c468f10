#include <regex>
#include "common/utils.hpp"
#include "server/http_server.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"
#include "test/fake_engine.hpp"

using namespace std;
using namespace runner;
using namespace runner::server;
using namespace nlohmann;
namespace http = boost::beast::http;

class HttpServerTest : public ::testing::Test {
protected:
    test::fake_engine docker;
    language_table languages;
    configuration config;
    unique_ptr<session::session_manager> manager;
    unique_ptr<http_server> server;

    void SetUp() override {
        config.timeouts.grace = chrono::milliseconds(50);
        config.timeouts.helper = chrono::seconds(5);
        config.retry.engine = {3, chrono::milliseconds(1), 1.0};
        manager = make_unique<session::session_manager>(docker, nullptr, languages, config);
        server = make_unique<http_server>(*manager, docker, languages, config);
    }

    void TearDown() override {
        EXPECT_TRUE(manager->shutdown(chrono::seconds(10)));
        server.reset();
        manager.reset();
    }

    void on_program(function<test::scripted_exec()> program) {
        docker.set_handler([program](const string &command, const docker::exec_options &options) {
            if (options.attach_stdin) return program();
            return test::fake_engine::default_exec(command);
        });
    }

    http_response get(const string &target, const string &origin = "") {
        http_request req{http::verb::get, target, 11};
        if (!origin.empty()) req.set(http::field::origin, origin);
        return server->handle(req);
    }

    http_response post(const string &target, const string &body) {
        http_request req{http::verb::post, target, 11};
        req.set(http::field::content_type, "application/json");
        req.body() = body;
        req.prepare_payload();
        return server->handle(req);
    }

    static json body_of(const http_response &res) {
        return json::parse(res.body());
    }
};

TEST_F(HttpServerTest, StatusMappingTest) {
    EXPECT_EQ(status_of(validation_error("x")), 400);
    EXPECT_EQ(status_of(session_not_found_error("x")), 404);
    EXPECT_EQ(status_of(unsupported_language_error("x")), 422);
    EXPECT_EQ(status_of(provision_error("x")), 500);
    EXPECT_EQ(status_of(internal_error("x")), 500);
}

TEST_F(HttpServerTest, HealthTest) {
    auto res = get("/health");
    EXPECT_EQ(res.result_int(), 200);
    EXPECT_JSON_EQ(body_of(res), json({{"success", true}, {"engine", "reachable"}, {"sessions", 0}}));

    docker.reachable = false;
    res = get("/health");
    EXPECT_EQ(res.result_int(), 503);
    EXPECT_EQ(body_of(res)["engine"], "unreachable");
}

TEST_F(HttpServerTest, LanguagesTest) {
    auto res = get("/api/execution/languages");
    ASSERT_EQ(res.result_int(), 200);
    auto list = body_of(res)["languages"];
    ASSERT_EQ(list.size(), 5);
    vector<string> names;
    for (auto &language : list) names.push_back(language["name"].get<string>());
    EXPECT_EQ(names, (vector<string>{"cpp", "go", "java", "javascript", "python"}));
}

TEST_F(HttpServerTest, UnknownRouteTest) {
    auto res = get("/api/execution/nothing");
    EXPECT_EQ(res.result_int(), 404);
    EXPECT_EQ(body_of(res)["kind"], "not_found");
    EXPECT_EQ(body_of(res)["success"], false);
}

TEST_F(HttpServerTest, CorsTest) {
    http_request req{http::verb::options, "/api/execution/start", 11};
    req.set(http::field::origin, "http://localhost:5173");
    auto res = server->handle(req);
    EXPECT_EQ(res.result_int(), 204);
    EXPECT_EQ(string(res[http::field::access_control_allow_origin]), "http://localhost:5173");
    EXPECT_NE(string(res[http::field::access_control_allow_methods]).find("POST"), string::npos);

    res = get("/health", "http://evil.example");
    EXPECT_TRUE(res[http::field::access_control_allow_origin].empty());
}

TEST_F(HttpServerTest, StartTest) {
    on_program([] {
        test::scripted_exec script;
        script.hang = true;
        return script;
    });
    auto res = post("/api/execution/start", R"j({"sessionId": "s1", "language": "python", "code": "input()"})j");
    ASSERT_EQ(res.result_int(), 200);
    EXPECT_JSON_EQ(body_of(res), json({{"success", true}, {"sessionId", "s1"}}));

    res = get("/api/execution/sessions/s1");
    ASSERT_EQ(res.result_int(), 200);
    auto info = body_of(res);
    EXPECT_EQ(info["sessionId"], "s1");
    EXPECT_EQ(info["language"], "python");
    EXPECT_TRUE(regex_match(info["createdAt"].get<string>(), regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)")));

    res = post("/api/execution/input", R"({"sessionId": "s1", "input": "42"})");
    EXPECT_EQ(res.result_int(), 200);

    res = post("/api/execution/stop", R"({"sessionId": "s1"})");
    EXPECT_EQ(res.result_int(), 200);
    ASSERT_TRUE(wait_until([&] { return manager->active() == 0; }));
    EXPECT_EQ(get("/api/execution/sessions/s1").result_int(), 404);
}

TEST_F(HttpServerTest, StartValidationTest) {
    auto res = post("/api/execution/start", "{");
    EXPECT_EQ(res.result_int(), 400);
    EXPECT_EQ(body_of(res)["kind"], "validation");

    res = post("/api/execution/start", R"({"sessionId": "s1", "language": "cobol", "code": "x"})");
    EXPECT_EQ(res.result_int(), 422);
    EXPECT_EQ(body_of(res)["kind"], "unsupported");

    res = post("/api/execution/start", R"({"language": "python", "code": "x"})");
    EXPECT_EQ(res.result_int(), 400);

    res = post("/api/execution/start", R"({"sessionId": "s1", "language": "python", "files": [{"name": "../x.py", "content": ""}]})");
    EXPECT_EQ(res.result_int(), 400);
    EXPECT_EQ(docker.created(), 0);
}

TEST_F(HttpServerTest, InputUnknownSessionTest) {
    auto res = post("/api/execution/input", R"({"sessionId": "nope", "input": "1"})");
    EXPECT_EQ(res.result_int(), 404);
    EXPECT_EQ(body_of(res)["kind"], "not_found");

    res = post("/api/execution/input", R"({"sessionId": "nope"})");
    EXPECT_EQ(res.result_int(), 400);
}

TEST_F(HttpServerTest, StopUnknownSessionTest) {
    auto res = post("/api/execution/stop", R"({"sessionId": "nope"})");
    EXPECT_EQ(res.result_int(), 200);
    EXPECT_EQ(body_of(res)["success"], true);
}

TEST_F(HttpServerTest, RunTest) {
    on_program([] { return test::stdout_exec("hi\n", 0); });
    auto res = post("/api/execution/run", R"j({"code": "print('hi')"})j");
    ASSERT_EQ(res.result_int(), 200);
    auto body = body_of(res);
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["stdout"], "hi\n");
    EXPECT_EQ(body["stderr"], "");
    EXPECT_EQ(body["exitCode"], 0);
    EXPECT_TRUE(body["executionTime"].is_number());
    ASSERT_TRUE(wait_until([&] { return manager->active() == 0 && docker.live() == 0; }));
}

TEST_F(HttpServerTest, RunWithInputTest) {
    on_program([] {
        test::scripted_exec script;
        script.echo_inputs = 1;
        return script;
    });
    auto res = post("/api/execution/run", R"j({"language": "python", "code": "print(input())", "input": "5\n"})j");
    ASSERT_EQ(res.result_int(), 200);
    EXPECT_EQ(body_of(res)["stdout"], "5\n");
}

TEST_F(HttpServerTest, RunReadsToEofTest) {
    on_program([] {
        test::scripted_exec script;
        script.until_eof = true;
        return script;
    });
    config.timeouts.execution = chrono::seconds(5);
    elapsed_time timer;
    auto res = post("/api/execution/run", R"j({"language": "python", "code": "import sys; print(sys.stdin.read(), end='')", "input": "1\n2"})j");
    ASSERT_EQ(res.result_int(), 200);
    EXPECT_EQ(body_of(res)["stdout"], "1\n2\n");
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 4000);
}

TEST_F(HttpServerTest, RunWithoutInputGetsEofTest) {
    on_program([] {
        test::scripted_exec script;
        script.until_eof = true;
        return script;
    });
    config.timeouts.execution = chrono::seconds(5);
    auto res = post("/api/execution/run", R"j({"language": "python", "code": "import sys; sys.stdin.read()"})j");
    ASSERT_EQ(res.result_int(), 200);
    EXPECT_EQ(body_of(res)["success"], true);
    EXPECT_EQ(body_of(res)["exitCode"], 0);
}

TEST_F(HttpServerTest, RunFailureTest) {
    docker.fail_creates(404, 1);
    auto res = post("/api/execution/run", R"j({"language": "python", "code": "print(1)"})j");
    EXPECT_EQ(res.result_int(), 500);
    auto body = body_of(res);
    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["kind"], "execution");
    EXPECT_FALSE(body["error"].get<string>().empty());
    EXPECT_EQ(body.count("exitCode"), 0);
}
