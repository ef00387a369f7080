#include <gtest/gtest.h>
#include <string.h>

#include <AnomalyDetector.hpp>

namespace {

class FixedBaseline : public PeakBaseline {
public:
    float power[LOAD_CHANNEL_COUNT]   = {0.0f, 0.0f};
    float voltage[LOAD_CHANNEL_COUNT] = {0.0f, 0.0f};

    float todayPeakPower(uint8_t ch) const override   { return power[ch - 1]; }
    float todayPeakVoltage(uint8_t ch) const override { return voltage[ch - 1]; }
};

TelemetrySample onSample(uint8_t channel, float power, float voltage = 230.0f) {
    TelemetrySample s;
    s.channel    = channel;
    s.voltage    = voltage;
    s.current    = power / voltage;
    s.power      = power;
    s.relayKnown = true;
    s.relayOn    = true;
    return s;
}

// 2024-03-10 12:00:00 UTC
const uint32_t NOON = 1710072000UL;

} // namespace

class AnomalyDetectorTest : public ::testing::Test {
protected:
    TelemetryCache  cache;
    FixedBaseline   peaks;
    AnomalyDetector detector;
    DetectorReport  report;
};

TEST_F(AnomalyDetectorTest, DynamicPowerTripsNearTodaysPeak) {
    DailyPeakTracker tracker;
    tracker.begin(NOON);

    // Samples land between two detector ticks; only the last is cached.
    // The last voltage stays under 95 % of the 230 V peak.
    const float sequence[] = {100.0f, 110.0f, 120.0f, 109.0f};
    const float volts[]    = {230.0f, 230.0f, 230.0f, 218.0f};
    uint32_t now = 0;
    for (uint8_t k = 0; k < 4; ++k) {
        now += 1000;
        const TelemetrySample s = onSample(1, sequence[k], volts[k]);
        ASSERT_TRUE(cache.store(s, now));
        tracker.observe(1, s.power, s.voltage, NOON + now / 1000);
    }
    ASSERT_FLOAT_EQ(tracker.todayPeakPower(1), 120.0f);

    detector.evaluate(cache, tracker, now + 500, report);

    ASSERT_EQ(report.commandCount, 1u);
    EXPECT_EQ(report.commands[0].channel, 1);
    EXPECT_FALSE(report.commands[0].relayOn);
    EXPECT_EQ(report.commands[0].issuer, CommandIssuer::Safety);
    EXPECT_STREQ(report.commands[0].reason, "dynamic_power 109.0 > 108.0");

    ASSERT_EQ(report.eventCount, 1u);
    const AnomalyEvent& ev = report.events[0];
    EXPECT_EQ(ev.type, AnomalyType::DynamicPower);
    EXPECT_EQ(ev.severity, Severity::Warning);
    EXPECT_EQ(ev.action, TriggeredAction::RelayOff);
    EXPECT_EQ(ev.target, 1);
    EXPECT_FLOAT_EQ(ev.threshold, 108.0f);
}

TEST_F(AnomalyDetectorTest, BelowDynamicThresholdIsQuiet) {
    peaks.power[0] = 120.0f;
    ASSERT_TRUE(cache.store(onSample(1, 100.0f), 0));
    detector.evaluate(cache, peaks, 100, report);
    EXPECT_EQ(report.commandCount, 0u);
    EXPECT_EQ(report.eventCount, 0u);
    EXPECT_EQ(report.freshChannels, 1u);
}

TEST_F(AnomalyDetectorTest, SmallBaselineDoesNotArmDynamicRules) {
    peaks.power[0]   = 3.0f;      // below minPeakPowerW
    peaks.voltage[0] = 20.0f;     // below minPeakVoltageV
    ASSERT_TRUE(cache.store(onSample(1, 4.0f, 30.0f), 0));
    detector.evaluate(cache, peaks, 100, report);
    EXPECT_EQ(report.commandCount, 0u);
}

TEST_F(AnomalyDetectorTest, FixedCeilingIsCriticalAndWinsOverDynamic) {
    peaks.power[1] = 130.0f;
    ASSERT_TRUE(cache.store(onSample(2, 125.0f), 0));   // > 120 W ceiling
    detector.evaluate(cache, peaks, 100, report);

    ASSERT_EQ(report.eventCount, 1u);
    EXPECT_EQ(report.events[0].type, AnomalyType::FixedPowerCeiling);
    EXPECT_EQ(report.events[0].severity, Severity::Critical);
    EXPECT_EQ(report.events[0].channel, 2);
    ASSERT_EQ(report.commandCount, 1u);
    EXPECT_EQ(report.commands[0].channel, 2);
}

TEST_F(AnomalyDetectorTest, EachViolatedMetricRaisesItsOwnEvent) {
    peaks.voltage[0] = 240.0f;
    ASSERT_TRUE(cache.store(onSample(1, 250.0f, 235.0f), 0));  // > 200 W and > 228 V
    detector.evaluate(cache, peaks, 100, report);

    ASSERT_EQ(report.eventCount, 2u);
    EXPECT_EQ(report.events[0].type, AnomalyType::FixedPowerCeiling);
    EXPECT_EQ(report.events[0].severity, Severity::Critical);
    EXPECT_EQ(report.events[1].type, AnomalyType::DynamicVoltage);
    EXPECT_EQ(report.events[1].severity, Severity::Warning);
    EXPECT_EQ(report.events[1].target, 1);

    ASSERT_EQ(report.commandCount, 1u);
    EXPECT_EQ(report.commands[0].channel, 1);
    EXPECT_STREQ(report.commands[0].reason, "fixed_power 250.0 > 200.0");
}

TEST_F(AnomalyDetectorTest, ThresholdUpdateMovesFixedCeiling) {
    ASSERT_TRUE(detector.setFixedCeiling(2, 150.0f));
    EXPECT_FALSE(detector.setFixedCeiling(2, 0.0f));
    EXPECT_FALSE(detector.setFixedCeiling(3, 150.0f));

    ASSERT_TRUE(cache.store(onSample(2, 125.0f), 0));
    detector.evaluate(cache, peaks, 100, report);
    EXPECT_EQ(report.commandCount, 0u);
}

TEST_F(AnomalyDetectorTest, DynamicVoltageWarning) {
    peaks.voltage[0] = 240.0f;
    ASSERT_TRUE(cache.store(onSample(1, 50.0f, 235.0f), 0));   // > 228
    detector.evaluate(cache, peaks, 100, report);
    ASSERT_EQ(report.eventCount, 1u);
    EXPECT_EQ(report.events[0].type, AnomalyType::DynamicVoltage);
    EXPECT_EQ(report.events[0].severity, Severity::Warning);
    EXPECT_NE(strstr(report.events[0].message, "voltage"), nullptr);
}

TEST_F(AnomalyDetectorTest, InactiveChannelIsSkipped) {
    TelemetrySample s = onSample(1, 500.0f);
    s.relayOn = false;
    ASSERT_TRUE(cache.store(s, 0));
    detector.evaluate(cache, peaks, 100, report);
    EXPECT_EQ(report.commandCount, 0u);
    EXPECT_EQ(report.eventCount, 1u);   // still counts toward the system cap
    EXPECT_EQ(report.events[0].type, AnomalyType::SystemOverload);
    EXPECT_EQ(report.events[0].action, TriggeredAction::None);
}

TEST_F(AnomalyDetectorTest, StaleSnapshotIsIgnored) {
    ASSERT_TRUE(cache.store(onSample(1, 900.0f), 0));
    detector.evaluate(cache, peaks, DEFAULT_CACHE_TTL_MS + 1, report);
    EXPECT_EQ(report.freshChannels, 0u);
    EXPECT_EQ(report.commandCount, 0u);
    EXPECT_EQ(report.eventCount, 0u);
}

TEST_F(AnomalyDetectorTest, SystemOverloadShedsBiggestLoad) {
    ThresholdConfig cfg;
    cfg.fixedPowerCeilingW[0] = 500.0f;
    cfg.fixedPowerCeilingW[1] = 500.0f;
    cfg.systemPowerCapW       = 300.0f;
    detector.configure(cfg);

    ASSERT_TRUE(cache.store(onSample(1, 190.0f), 0));
    ASSERT_TRUE(cache.store(onSample(2, 140.0f), 0));
    detector.evaluate(cache, peaks, 100, report);

    EXPECT_FLOAT_EQ(report.aggregatePowerW, 330.0f);
    ASSERT_EQ(report.eventCount, 1u);
    const AnomalyEvent& ev = report.events[0];
    EXPECT_EQ(ev.channel, 0);
    EXPECT_EQ(ev.type, AnomalyType::SystemOverload);
    EXPECT_EQ(ev.severity, Severity::Critical);
    EXPECT_EQ(ev.target, 1);
    ASSERT_EQ(report.commandCount, 1u);
    EXPECT_EQ(report.commands[0].channel, 1);
}

TEST_F(AnomalyDetectorTest, OverloadDoesNotDoubleSwitchSameChannel) {
    ThresholdConfig cfg;
    cfg.systemPowerCapW = 300.0f;
    detector.configure(cfg);

    ASSERT_TRUE(cache.store(onSample(1, 250.0f), 0));   // over its 200 W ceiling
    ASSERT_TRUE(cache.store(onSample(2, 100.0f), 0));
    detector.evaluate(cache, peaks, 100, report);

    ASSERT_EQ(report.commandCount, 2u);
    EXPECT_EQ(report.commands[0].channel, 1);
    EXPECT_EQ(report.commands[1].channel, 2);
    ASSERT_EQ(report.eventCount, 2u);
    EXPECT_EQ(report.events[1].type, AnomalyType::SystemOverload);
    EXPECT_EQ(report.events[1].target, 2);
}

TEST_F(AnomalyDetectorTest, InvalidConfigFallsBackToDefaults) {
    ThresholdConfig cfg;
    cfg.fixedPowerCeilingW[0] = -1.0f;
    cfg.dynamicPowerRatio     = 0.0f;
    detector.configure(cfg);
    EXPECT_FLOAT_EQ(detector.config().fixedPowerCeilingW[0], DEFAULT_CH1_FIXED_POWER);
    EXPECT_FLOAT_EQ(detector.config().dynamicPowerRatio, DEFAULT_DYN_POWER_RATIO);
}
