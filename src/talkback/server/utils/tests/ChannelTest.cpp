#include "talkback/server/utils/CancelToken.h"
#include "talkback/server/utils/Channel.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace talkback::server::utils;
using namespace std::chrono_literals;

TEST(ChannelTests, FifoAcrossThreads) {
    Channel<int> ch;
    std::thread producer([&ch]() {
        for (int i = 0; i < 100; ++i) ch.push(i);
        ch.close();
    });

    int expected = 0;
    int v = 0;
    while (ch.pop(v)) {
        EXPECT_EQ(v, expected);
        ++expected;
    }
    producer.join();
    EXPECT_EQ(expected, 100);
}

TEST(ChannelTests, CloseRejectsPushButDrainsQueue) {
    Channel<std::string> ch;
    EXPECT_TRUE(ch.push("a"));
    ch.close();
    EXPECT_FALSE(ch.push("b"));
    EXPECT_TRUE(ch.isClosed());

    std::string s;
    EXPECT_TRUE(ch.pop(s));
    EXPECT_EQ(s, "a");
    EXPECT_FALSE(ch.pop(s));
}

TEST(ChannelTests, CapacityAndTimeout) {
    Channel<int> ch(1);
    EXPECT_TRUE(ch.push(1));
    EXPECT_FALSE(ch.push(2));
    EXPECT_EQ(ch.size(), 1u);

    int v = 0;
    EXPECT_EQ(ch.popFor(v, 10ms), Channel<int>::PopStatus::Ok);
    EXPECT_EQ(ch.popFor(v, 10ms), Channel<int>::PopStatus::Timeout);
    ch.close();
    EXPECT_EQ(ch.popFor(v, 10ms), Channel<int>::PopStatus::Closed);
}

TEST(CancelTokenTests, CallbacksRunOnce) {
    CancelToken token;
    CancelToken copy = token;
    std::atomic<int> calls{0};
    token.onCancel([&calls]() { ++calls; });

    EXPECT_FALSE(copy.isCancelled());
    copy.cancel();
    copy.cancel();
    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(calls.load(), 1);

    // 取消之后注册：立即执行
    token.onCancel([&calls]() { ++calls; });
    EXPECT_EQ(calls.load(), 2);
}

TEST(CancelTokenTests, WakesBlockedChannel) {
    CancelToken token;
    Channel<int> ch;
    token.onCancel([&ch]() { ch.close(); });

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });
    int v = 0;
    EXPECT_FALSE(ch.pop(v));
    canceller.join();
}
