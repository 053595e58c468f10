#include <chrono>
#include "common/exceptions.hpp"
#include "common/retry.hpp"
#include "docker/engine.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runner;

static const retry_policy fast{3, chrono::milliseconds(1), 2.0};

TEST(RetryTest, SucceedsAfterTransientFailuresTest) {
    int calls = 0;
    int result = retry(fast, "flaky", [&] {
        if (++calls < 3) throw engine_error(500, "server error");
        return 42;
    }, docker::is_transient);
    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, GivesUpAfterAttemptsTest) {
    int calls = 0;
    EXPECT_THROW(retry(fast, "always failing", [&] {
        ++calls;
        throw network_error("connection refused");
    }, docker::is_transient), network_error);
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, PermanentErrorNotRetriedTest) {
    int calls = 0;
    try {
        retry(fast, "missing image", [&] {
            ++calls;
            throw engine_error(404, "no such image");
        }, docker::is_transient);
        FAIL() << "expected engine_error";
    } catch (const engine_error &ex) {
        EXPECT_EQ(ex.status, 404);
    }
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, BackoffTest) {
    retry_policy policy{3, chrono::milliseconds(20), 2.0};
    auto begin = chrono::steady_clock::now();
    EXPECT_THROW(retry(policy, "slow", [] { throw engine_error(409, "conflict"); }, docker::is_transient), engine_error);
    // 20ms + 40ms
    EXPECT_GE(chrono::steady_clock::now() - begin, chrono::milliseconds(60));
}

TEST(RetryTest, TransientClassificationTest) {
    EXPECT_TRUE(docker::is_transient(network_error("reset")));
    EXPECT_TRUE(docker::is_transient(engine_error(409, "conflict")));
    EXPECT_TRUE(docker::is_transient(engine_error(503, "unavailable")));
    EXPECT_FALSE(docker::is_transient(engine_error(404, "not found")));
    EXPECT_FALSE(docker::is_transient(engine_error(400, "bad request")));
    EXPECT_FALSE(docker::is_transient(validation_error("bad")));
}
