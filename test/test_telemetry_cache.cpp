#include <gtest/gtest.h>

#include <AnomalyDetector.hpp>
#include <TelemetryCache.hpp>

namespace {

TelemetrySample sample(uint8_t channel, float power, bool relayKnown = false, bool relayOn = false) {
    TelemetrySample s;
    s.channel    = channel;
    s.voltage    = 230.0f;
    s.current    = power / 230.0f;
    s.power      = power;
    s.relayKnown = relayKnown;
    s.relayOn    = relayOn;
    return s;
}

class NoPeaks : public PeakBaseline {
public:
    float todayPeakPower(uint8_t) const override   { return 0.0f; }
    float todayPeakVoltage(uint8_t) const override { return 0.0f; }
};

} // namespace

TEST(TelemetryCache, LatestRespectsTtl) {
    TelemetryCache cache(5000);
    ASSERT_TRUE(cache.store(sample(1, 100.0f), 1000));

    TelemetrySample out;
    EXPECT_TRUE(cache.latest(1, 6000, out));
    EXPECT_FALSE(cache.latest(1, 6001, out));
    EXPECT_TRUE(cache.lastKnown(1, out));
    EXPECT_FLOAT_EQ(out.power, 100.0f);
    EXPECT_EQ(cache.ageMs(1, 6001), 5001u);
    EXPECT_EQ(cache.ageMs(2, 6001), UINT32_MAX);
}

TEST(TelemetryCache, RejectsUnknownChannel) {
    TelemetryCache cache;
    EXPECT_FALSE(cache.store(sample(0, 10.0f), 0));
    EXPECT_FALSE(cache.store(sample(3, 10.0f), 0));
    EXPECT_FALSE(cache.storeRelayStatus(3, true, CommandIssuer::Manual, 0));
}

TEST(TelemetryCache, DuplicateMessagesAreIdempotent) {
    TelemetryCache cache;
    ASSERT_TRUE(cache.store(sample(2, 55.0f), 100));
    ASSERT_TRUE(cache.store(sample(2, 55.0f), 100));
    TelemetrySample out;
    ASSERT_TRUE(cache.latest(2, 200, out));
    EXPECT_FLOAT_EQ(out.power, 55.0f);
}

TEST(TelemetryCache, TelemetryWithoutRelayStateInheritsStatus) {
    TelemetryCache cache;
    ASSERT_TRUE(cache.storeRelayStatus(1, true, CommandIssuer::Auto, 0));
    ASSERT_TRUE(cache.store(sample(1, 80.0f), 10));

    TelemetrySample out;
    ASSERT_TRUE(cache.latest(1, 20, out));
    EXPECT_TRUE(out.relayKnown);
    EXPECT_TRUE(out.relayOn);

    // A status update flips the cached flag without refreshing its age.
    ASSERT_TRUE(cache.storeRelayStatus(1, false, CommandIssuer::Safety, 4000));
    ASSERT_TRUE(cache.lastKnown(1, out));
    EXPECT_FALSE(out.relayOn);
    EXPECT_EQ(cache.ageMs(1, 4000), 3990u);
}

TEST(TelemetryCache, ExplicitRelayStateWins) {
    TelemetryCache cache;
    ASSERT_TRUE(cache.storeRelayStatus(2, true, CommandIssuer::Manual, 0));
    ASSERT_TRUE(cache.store(sample(2, 80.0f, true, false), 10));
    TelemetrySample out;
    ASSERT_TRUE(cache.latest(2, 20, out));
    EXPECT_FALSE(out.relayOn);
}

TEST(TelemetryCache, SilenceKeepsStatusAndForcesNothing) {
    TelemetryCache cache(5000);
    AnomalyDetector detector;
    NoPeaks peaks;

    // Heavy but known-good load just before the link drops.
    ASSERT_TRUE(cache.storeRelayStatus(1, true, CommandIssuer::Manual, 0));
    ASSERT_TRUE(cache.store(sample(1, 150.0f, true, true), 0));

    DetectorReport report;
    for (uint32_t now = 15000; now <= 30000; now += 15000) {
        detector.evaluate(cache, peaks, now, report);
        EXPECT_EQ(report.commandCount, 0u);
        EXPECT_EQ(report.eventCount, 0u);
        EXPECT_EQ(report.freshChannels, 0u);

        bool on = false;
        CommandIssuer issuer = CommandIssuer::Safety;
        ASSERT_TRUE(cache.relayStatus(1, on, issuer));
        EXPECT_TRUE(on);
        EXPECT_EQ(issuer, CommandIssuer::Manual);
    }

    // Link back: only what arrives from now on counts.
    ASSERT_TRUE(cache.store(sample(1, 150.0f, true, true), 30500));
    detector.evaluate(cache, peaks, 31000, report);
    EXPECT_EQ(report.freshChannels, 1u);
    EXPECT_EQ(report.commandCount, 0u);
}
