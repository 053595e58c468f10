#include "docker/docker_engine.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runner;
using namespace runner::docker;

TEST(DockerEngineTest, UrlEncodeTest) {
    EXPECT_EQ(url_encode("nexusquest-project-a_b.1~"), "nexusquest-project-a_b.1~");
    EXPECT_EQ(url_encode("/sandbox/my dir"), "%2Fsandbox%2Fmy%20dir");
    EXPECT_EQ(url_encode(R"({"label":["a=b"]})"), "%7B%22label%22%3A%5B%22a%3Db%22%5D%7D");
}

TEST(DockerEngineTest, UnreachableSocketTest) {
    docker_engine docker("/nonexistent/docker.sock", "v1.41");
    EXPECT_FALSE(docker.ping());
    EXPECT_THROW(docker.create_container(container_spec{}), network_error);

    exec_options options;
    options.cmd = {"true"};
    EXPECT_THROW(docker.exec("missing", options), network_error);
    EXPECT_TRUE(is_transient(network_error("connection refused")));
}
