#include <nlohmann/json.hpp>
#include "common/config.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runner;
using namespace nlohmann;

TEST(ConfigTest, DefaultsTest) {
    configuration config;
    EXPECT_EQ(config.container.name_prefix, "nexusquest-project-");
    EXPECT_EQ(config.container.workspace_root, "/sandbox/project");
    EXPECT_EQ(config.timeouts.execution, chrono::seconds(300));
    EXPECT_EQ(config.timeouts.npm, chrono::seconds(120));
    EXPECT_EQ(config.timeouts.maven, chrono::seconds(180));
    EXPECT_EQ(config.timeouts.conan, chrono::seconds(300));
    EXPECT_EQ(config.timeouts.grace, chrono::milliseconds(1000));
    EXPECT_EQ(config.retry.engine.attempts, 3);
    EXPECT_EQ(config.retry.engine.interval, chrono::milliseconds(500));
    EXPECT_EQ(config.retry.install.attempts, 2);
}

TEST(ConfigTest, ParseTest) {
    json j = json::parse(R"({
        "container": { "memory_bytes": 536870912, "dns": ["1.1.1.1"], "mount_dependency_cache": false },
        "timeouts": { "execution": 60, "grace_ms": 250 },
        "retry": { "engine": { "attempts": 5, "interval_ms": 100, "backoff": 1.5 } },
        "images": { "python": "python:3.12-slim" },
        "server": { "port": 8080, "allowed_origins": ["*"] }
    })");
    configuration config = j.get<configuration>();
    EXPECT_EQ(config.container.memory_bytes, 536870912);
    EXPECT_EQ(config.container.dns, vector<string>{"1.1.1.1"});
    EXPECT_FALSE(config.container.mount_dependency_cache);
    EXPECT_EQ(config.timeouts.execution, chrono::seconds(60));
    EXPECT_EQ(config.timeouts.grace, chrono::milliseconds(250));
    EXPECT_EQ(config.timeouts.npm, chrono::seconds(120));
    EXPECT_EQ(config.retry.engine.attempts, 5);
    EXPECT_EQ(config.retry.engine.interval, chrono::milliseconds(100));
    EXPECT_DOUBLE_EQ(config.retry.engine.backoff, 1.5);
    EXPECT_EQ(config.images.at("python"), "python:3.12-slim");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.server.allowed_origins, vector<string>{"*"});
}

TEST(ConfigTest, InvalidRetryTest) {
    json j = json::parse(R"({ "retry": { "install": { "attempts": 0 } } })");
    EXPECT_THROW(j.get<configuration>(), invalid_argument);
}
