#include <gtest/gtest.h>

#include <ReconnectPolicy.hpp>

TEST(ReconnectPolicy, FirstAttemptIsImmediateThenPaced) {
    ReconnectPolicy p(5000);
    EXPECT_TRUE(p.shouldAttempt(100));
    p.onAttempt(100);
    EXPECT_FALSE(p.shouldAttempt(4000));
    EXPECT_TRUE(p.shouldAttempt(5100));
    p.onAttempt(5100);
    EXPECT_EQ(p.attempts(), 2u);
}

TEST(ReconnectPolicy, NeverAttemptsWhileConnected) {
    ReconnectPolicy p(1000);
    p.onAttempt(0);
    p.onConnected();
    EXPECT_TRUE(p.connected());
    EXPECT_FALSE(p.shouldAttempt(100000));
    EXPECT_EQ(p.attempts(), 0u);
}

TEST(ReconnectPolicy, BackoffHasAFloor) {
    ReconnectPolicy p(10);
    EXPECT_EQ(p.backoff(), 250u);
    p.setBackoff(2000);
    EXPECT_EQ(p.backoff(), 2000u);
}

TEST(ReconnectPolicy, ThirtySecondOutageThenReconnect) {
    ReconnectPolicy p(5000);
    p.onAttempt(0);
    p.onConnected();
    EXPECT_EQ(p.reconnects(), 0u);
    EXPECT_EQ(p.outageMs(1000), 0u);

    p.onDisconnected(10000);
    EXPECT_FALSE(p.connected());
    EXPECT_TRUE(p.shouldAttempt(10000));

    uint32_t attempts = 0;
    for (uint32_t now = 10000; now < 40000; now += 100) {
        if (p.shouldAttempt(now)) {
            p.onAttempt(now);
            ++attempts;
        }
    }
    EXPECT_EQ(attempts, 6u);
    EXPECT_EQ(p.outageMs(40000), 30000u);

    p.onConnected();
    EXPECT_EQ(p.reconnects(), 1u);
    EXPECT_EQ(p.outageMs(40000), 0u);
}

TEST(ReconnectPolicy, PacingSurvivesMillisWrap) {
    ReconnectPolicy p(1000);
    const uint32_t nearWrap = 0xFFFFFF00u;
    p.onAttempt(nearWrap);
    EXPECT_FALSE(p.shouldAttempt(nearWrap + 500));
    EXPECT_TRUE(p.shouldAttempt(nearWrap + 1000));   // wrapped past zero
}
