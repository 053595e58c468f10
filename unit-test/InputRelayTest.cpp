#include <thread>
#include "common/exceptions.hpp"
#include "session/session.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runner;
using namespace runner::session;

TEST(InputRelayTest, BufferBeforeAttachTest) {
    input_relay relay("s1");
    relay.send("1");
    relay.send("2");
    EXPECT_EQ(relay.pending(), 2);

    vector<string> written;
    relay.attach([&](const string &line) { written.push_back(line); });
    EXPECT_EQ(relay.pending(), 0);
    relay.send("3");
    EXPECT_EQ(written, (vector<string>{"1\n", "2\n", "3\n"}));
}

TEST(InputRelayTest, ClosedTest) {
    input_relay relay("s1");
    relay.send("buffered");
    relay.close();
    EXPECT_EQ(relay.pending(), 0);
    EXPECT_THROW(relay.send("late"), session_not_found_error);

    bool called = false;
    relay.attach([&](const string &) { called = true; });
    EXPECT_FALSE(called);
}

TEST(InputRelayTest, WriteFailureClosesTest) {
    input_relay relay("s1");
    relay.attach([](const string &) { throw stream_error("broken pipe"); });
    EXPECT_THROW(relay.send("x"), session_not_found_error);
    EXPECT_THROW(relay.send("y"), session_not_found_error);
}

TEST(InputRelayTest, ConcurrentSendsKeepLinesTest) {
    input_relay relay("s1");
    mutex mut;
    vector<string> written;
    relay.attach([&](const string &line) {
        lock_guard<mutex> guard(mut);
        written.push_back(line);
    });

    vector<thread> senders;
    for (int t = 0; t < 4; ++t)
        senders.emplace_back([&relay, t] {
            for (int i = 0; i < 50; ++i) relay.send(to_string(t));
        });
    for (auto &sender : senders) sender.join();

    ASSERT_EQ(written.size(), 200);
    for (auto &line : written) {
        EXPECT_EQ(line.size(), 2);
        EXPECT_EQ(line.back(), '\n');
    }
}

TEST(InputRelayTest, SequentialOrderTest) {
    input_relay relay("s1");
    string stream;
    relay.attach([&](const string &line) { stream += line; });
    for (int i = 0; i < 10; ++i) relay.send(to_string(i));
    EXPECT_EQ(stream, "0\n1\n2\n3\n4\n5\n6\n7\n8\n9\n");
}

TEST(InputRelayTest, FinishAfterAttachTest) {
    input_relay relay("s1");
    string stream;
    int eofs = 0;
    relay.attach([&](const string &line) { stream += line; }, [&] { ++eofs; });
    relay.send("last");
    relay.finish();
    relay.finish();
    EXPECT_EQ(stream, "last\n");
    EXPECT_EQ(eofs, 1);
    EXPECT_THROW(relay.send("late"), session_not_found_error);
}

TEST(InputRelayTest, FinishBeforeAttachTest) {
    input_relay relay("s1");
    relay.send("5");
    relay.finish();
    EXPECT_THROW(relay.send("6"), session_not_found_error);

    string stream;
    int eofs = 0;
    relay.attach([&](const string &line) {
        EXPECT_EQ(eofs, 0);
        stream += line;
    }, [&] { ++eofs; });
    EXPECT_EQ(stream, "5\n");
    EXPECT_EQ(eofs, 1);
}
