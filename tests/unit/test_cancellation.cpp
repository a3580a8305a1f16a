#include <gtest/gtest.h>
#include "foundry/cancellation.hpp"
#include <thread>

using namespace foundry;
using namespace std::chrono_literals;

TEST(CancelToken, StartsClear) {
    CancelToken token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_FALSE(token.wait_for(1ms));
}

TEST(CancelToken, CopiesShareState) {
    CancelToken token;
    CancelToken copy = token;
    copy.cancel();
    EXPECT_TRUE(token.is_cancelled());
    token.cancel();
    EXPECT_TRUE(copy.is_cancelled());
}

TEST(CancelToken, WakesWaiter) {
    CancelToken token;
    auto start = std::chrono::steady_clock::now();
    std::thread t([token]() mutable {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });
    EXPECT_TRUE(token.wait_for(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
    t.join();
}
