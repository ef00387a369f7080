#include <gtest/gtest.h>
#include <string.h>

#include <RelayControlLoop.hpp>

namespace {

ControlInputs climate(float tempC) {
    ControlInputs in;
    in.env.temperatureC = tempC;
    in.env.humidity     = 40.0f;
    in.env.valid        = true;
    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        in.load[i].voltage = 230.0f;
    }
    return in;
}

ControlCommand manual(uint8_t channel, bool on) {
    ControlCommand cmd;
    cmd.channel = channel;
    cmd.relayOn = on;
    cmd.issuer  = CommandIssuer::Manual;
    return cmd;
}

ControlCommand safetyOff(uint8_t channel, const char* reason) {
    ControlCommand cmd;
    cmd.channel = channel;
    cmd.relayOn = false;
    cmd.issuer  = CommandIssuer::Safety;
    copyReason(cmd.reason, sizeof(cmd.reason), reason);
    return cmd;
}

} // namespace

class RelayControlLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        ControlLoopConfig cfg;
        cfg.autoThresholdC        = 30.0f;
        cfg.limits[0].maxPowerW   = 1000.0f;
        cfg.limits[0].maxVoltageV = 250.0f;
        cfg.limits[1].maxPowerW   = 500.0f;
        cfg.limits[1].maxVoltageV = 250.0f;
        loop.configure(cfg);
    }

    OperatingMode tick(OperatingMode mode, const ControlInputs& in) {
        return loop.tick(mode, inbox, in, out);
    }

    RelayControlLoop loop;
    CommandInbox     inbox;
    TickResult       out;
};

TEST_F(RelayControlLoopTest, AutoRuleIsEdgeTriggeredWithOffBeforeOn) {
    OperatingMode mode = OperatingMode::Auto;

    // First reading establishes "cold": fan OFF, heater ON.
    mode = tick(mode, climate(25.0f));
    ASSERT_EQ(out.transitionCount, 2);
    EXPECT_EQ(out.transitions[0].channel, CHANNEL_FAN);
    EXPECT_FALSE(out.transitions[0].relayOn);
    EXPECT_EQ(out.transitions[1].channel, CHANNEL_HEATER);
    EXPECT_TRUE(out.transitions[1].relayOn);
    EXPECT_EQ(out.climate, Climate::Cold);

    // 25 -> 25: nothing.
    mode = tick(mode, climate(25.0f));
    EXPECT_EQ(out.transitionCount, 0);

    // 25 -> 31: heater OFF, then fan ON.
    mode = tick(mode, climate(31.0f));
    ASSERT_EQ(out.transitionCount, 2);
    EXPECT_EQ(out.transitions[0].channel, CHANNEL_HEATER);
    EXPECT_FALSE(out.transitions[0].relayOn);
    EXPECT_EQ(out.transitions[0].issuer, CommandIssuer::Auto);
    EXPECT_EQ(out.transitions[1].channel, CHANNEL_FAN);
    EXPECT_TRUE(out.transitions[1].relayOn);
    EXPECT_EQ(out.transitions[1].issuer, CommandIssuer::Auto);

    EXPECT_FALSE(loop.relayOn(CHANNEL_HEATER));
    EXPECT_TRUE(loop.relayOn(CHANNEL_FAN));
    EXPECT_EQ(mode, OperatingMode::Auto);
}

TEST_F(RelayControlLoopTest, ThresholdItselfCountsAsHot) {
    tick(OperatingMode::Auto, climate(30.0f));
    EXPECT_EQ(out.climate, Climate::Hot);
    EXPECT_TRUE(loop.relayOn(CHANNEL_FAN));
}

TEST_F(RelayControlLoopTest, InvalidEnvironmentHoldsClassification) {
    tick(OperatingMode::Auto, climate(25.0f));
    ControlInputs in = climate(35.0f);
    in.env.valid = false;
    tick(OperatingMode::Auto, in);
    EXPECT_EQ(out.transitionCount, 0);
    EXPECT_EQ(loop.lastClimate(), Climate::Cold);
    EXPECT_STREQ(climateName(out.climate), "cold");
    EXPECT_TRUE(loop.relayOn(CHANNEL_HEATER));
}

TEST_F(RelayControlLoopTest, ClimateNamesForLogging) {
    EXPECT_STREQ(climateName(loop.lastClimate()), "unknown");
    tick(OperatingMode::Auto, climate(31.0f));
    EXPECT_STREQ(climateName(out.climate), "hot");
}

TEST_F(RelayControlLoopTest, ManualCommandIgnoredInAuto) {
    tick(OperatingMode::Auto, climate(25.0f));
    ASSERT_TRUE(inbox.submit(manual(CHANNEL_FAN, true)));
    tick(OperatingMode::Auto, climate(25.0f));
    EXPECT_EQ(out.transitionCount, 0);
    EXPECT_EQ(out.ignoredManual, 1);
    EXPECT_FALSE(loop.relayOn(CHANNEL_FAN));
}

TEST_F(RelayControlLoopTest, SwitchToManualSuspendsRuleAndHonoursOperator) {
    OperatingMode mode = tick(OperatingMode::Auto, climate(25.0f));

    inbox.requestMode(OperatingMode::Manual);
    mode = tick(mode, climate(35.0f));
    EXPECT_EQ(mode, OperatingMode::Manual);
    EXPECT_TRUE(out.modeChanged);
    EXPECT_EQ(out.transitionCount, 0);
    EXPECT_TRUE(loop.relayOn(CHANNEL_HEATER));
    EXPECT_FALSE(loop.relayOn(CHANNEL_FAN));

    ASSERT_TRUE(inbox.submit(manual(CHANNEL_FAN, true)));
    mode = tick(mode, climate(20.0f));
    ASSERT_EQ(out.transitionCount, 1);
    EXPECT_EQ(out.transitions[0].channel, CHANNEL_FAN);
    EXPECT_TRUE(out.transitions[0].relayOn);
    EXPECT_TRUE(out.transitions[0].changed);
    EXPECT_EQ(out.transitions[0].issuer, CommandIssuer::Manual);
    EXPECT_TRUE(loop.relayOn(CHANNEL_FAN));
    EXPECT_TRUE(loop.relayOn(CHANNEL_HEATER));
}

TEST_F(RelayControlLoopTest, LatestManualCommandWins) {
    ASSERT_TRUE(inbox.submit(manual(CHANNEL_HEATER, true)));
    ASSERT_TRUE(inbox.submit(manual(CHANNEL_HEATER, false)));
    ASSERT_TRUE(inbox.submit(manual(CHANNEL_HEATER, true)));
    tick(OperatingMode::Manual, climate(25.0f));
    ASSERT_EQ(out.transitionCount, 1);
    EXPECT_TRUE(loop.relayOn(CHANNEL_HEATER));
    EXPECT_EQ(inbox.overwritten(), 2u);
}

TEST_F(RelayControlLoopTest, SwitchBackToAutoReArmsEdgeDetection) {
    OperatingMode mode = tick(OperatingMode::Auto, climate(25.0f));   // cold, heater ON

    inbox.requestMode(OperatingMode::Manual);
    mode = tick(mode, climate(25.0f));
    ASSERT_TRUE(inbox.submit(manual(CHANNEL_HEATER, false)));
    mode = tick(mode, climate(25.0f));
    ASSERT_FALSE(loop.relayOn(CHANNEL_HEATER));

    // Still cold, but the rule must re-evaluate instead of assuming no change.
    inbox.requestMode(OperatingMode::Auto);
    mode = tick(mode, climate(25.0f));
    EXPECT_EQ(mode, OperatingMode::Auto);
    EXPECT_TRUE(out.modeChanged);
    ASSERT_EQ(out.transitionCount, 2);
    EXPECT_EQ(out.transitions[0].channel, CHANNEL_FAN);
    EXPECT_FALSE(out.transitions[0].relayOn);
    EXPECT_EQ(out.transitions[1].channel, CHANNEL_HEATER);
    EXPECT_TRUE(out.transitions[1].relayOn);
    EXPECT_TRUE(loop.relayOn(CHANNEL_HEATER));
}

TEST_F(RelayControlLoopTest, RequestingCurrentModeDoesNotReArm) {
    OperatingMode mode = tick(OperatingMode::Auto, climate(25.0f));
    inbox.requestMode(OperatingMode::Auto);
    tick(mode, climate(25.0f));
    EXPECT_FALSE(out.modeChanged);
    EXPECT_EQ(out.transitionCount, 0);
}

TEST_F(RelayControlLoopTest, SafetyTripImmediateInEitherMode) {
    const OperatingMode modes[] = {OperatingMode::Manual, OperatingMode::Auto};
    for (OperatingMode mode : modes) {
        loop.reset();
        inbox.clear();
        if (mode == OperatingMode::Manual) {
            ASSERT_TRUE(inbox.submit(manual(CHANNEL_HEATER, true)));
        }
        tick(mode, climate(25.0f));
        ASSERT_TRUE(loop.relayOn(CHANNEL_HEATER));

        ControlInputs in = climate(25.0f);
        in.load[0].power = 1000.0f + 0.5f;
        tick(mode, in);

        EXPECT_FALSE(loop.relayOn(CHANNEL_HEATER));
        EXPECT_TRUE(loop.tripped(CHANNEL_HEATER));
        ASSERT_GE(out.transitionCount, 1);
        const RelayTransition& t = out.transitions[out.transitionCount - 1];
        EXPECT_EQ(t.channel, CHANNEL_HEATER);
        EXPECT_FALSE(t.relayOn);
        EXPECT_EQ(t.issuer, CommandIssuer::Safety);
        ASSERT_EQ(out.eventCount, 1);
        EXPECT_EQ(out.events[0].type, AnomalyType::SafetyPowerCeiling);
        EXPECT_EQ(out.events[0].severity, Severity::Critical);
        EXPECT_EQ(out.events[0].action, TriggeredAction::RelayOff);
        EXPECT_EQ(out.events[0].channel, CHANNEL_HEATER);
    }
}

TEST_F(RelayControlLoopTest, CeilingIsStrictlyGreaterThan) {
    ASSERT_TRUE(inbox.submit(manual(CHANNEL_FAN, true)));
    tick(OperatingMode::Manual, climate(25.0f));

    ControlInputs in = climate(25.0f);
    in.load[1].power = 500.0f;
    tick(OperatingMode::Manual, in);
    EXPECT_TRUE(loop.relayOn(CHANNEL_FAN));
    EXPECT_EQ(out.eventCount, 0);
}

TEST_F(RelayControlLoopTest, OverVoltageTripsToo) {
    ASSERT_TRUE(inbox.submit(manual(CHANNEL_FAN, true)));
    tick(OperatingMode::Manual, climate(25.0f));

    ControlInputs in = climate(25.0f);
    in.load[1].voltage = 260.0f;
    tick(OperatingMode::Manual, in);
    EXPECT_FALSE(loop.relayOn(CHANNEL_FAN));
    ASSERT_EQ(out.eventCount, 1);
    EXPECT_EQ(out.events[0].type, AnomalyType::SafetyVoltageCeiling);
}

TEST_F(RelayControlLoopTest, ReArmAcceptedThenTripsAgainWithoutCooldown) {
    ControlInputs hot = climate(25.0f);
    hot.load[0].power = 1500.0f;

    ASSERT_TRUE(inbox.submit(manual(CHANNEL_HEATER, true)));
    tick(OperatingMode::Manual, climate(25.0f));
    tick(OperatingMode::Manual, hot);
    ASSERT_FALSE(loop.relayOn(CHANNEL_HEATER));

    // Relay OFF: load reads zero, latch clears.
    tick(OperatingMode::Manual, climate(25.0f));
    EXPECT_FALSE(loop.tripped(CHANNEL_HEATER));

    ASSERT_TRUE(inbox.submit(manual(CHANNEL_HEATER, true)));
    tick(OperatingMode::Manual, climate(25.0f));
    EXPECT_TRUE(loop.relayOn(CHANNEL_HEATER));

    tick(OperatingMode::Manual, hot);
    EXPECT_FALSE(loop.relayOn(CHANNEL_HEATER));
    EXPECT_EQ(out.eventCount, 1);
}

TEST_F(RelayControlLoopTest, LoadOnOffRelayStillForcesOffAndAlertsOnce) {
    // Power above the ceiling with the relay logically OFF: stuck contact.
    ControlInputs in = climate(25.0f);
    in.load[0].power = 1000.0f + 0.5f;
    tick(OperatingMode::Manual, in);

    EXPECT_TRUE(loop.tripped(CHANNEL_HEATER));
    EXPECT_FALSE(loop.relayOn(CHANNEL_HEATER));
    ASSERT_EQ(out.transitionCount, 1);
    EXPECT_EQ(out.transitions[0].channel, CHANNEL_HEATER);
    EXPECT_FALSE(out.transitions[0].relayOn);
    EXPECT_FALSE(out.transitions[0].changed);
    EXPECT_EQ(out.transitions[0].issuer, CommandIssuer::Safety);
    ASSERT_EQ(out.eventCount, 1);
    EXPECT_EQ(out.events[0].type, AnomalyType::SafetyPowerCeiling);

    // Still over on the next window: OFF re-asserted, no second alert.
    tick(OperatingMode::Manual, in);
    ASSERT_EQ(out.transitionCount, 1);
    EXPECT_EQ(out.transitions[0].issuer, CommandIssuer::Safety);
    EXPECT_EQ(out.eventCount, 0);

    // Back under the ceiling, then over again: a new trip, a new alert.
    tick(OperatingMode::Manual, climate(25.0f));
    EXPECT_FALSE(loop.tripped(CHANNEL_HEATER));
    EXPECT_EQ(out.transitionCount, 0);
    tick(OperatingMode::Manual, in);
    EXPECT_EQ(out.eventCount, 1);
}

TEST_F(RelayControlLoopTest, ReArmWhileStillOverAlertsAgain) {
    ControlInputs in = climate(25.0f);
    in.load[1].power = 900.0f;
    tick(OperatingMode::Manual, in);
    ASSERT_EQ(out.eventCount, 1);

    ASSERT_TRUE(inbox.submit(manual(CHANNEL_FAN, true)));
    tick(OperatingMode::Manual, in);
    EXPECT_FALSE(loop.relayOn(CHANNEL_FAN));
    ASSERT_EQ(out.transitionCount, 2);
    EXPECT_TRUE(out.transitions[0].relayOn);
    EXPECT_EQ(out.transitions[1].issuer, CommandIssuer::Safety);
    EXPECT_EQ(out.eventCount, 1);
}

TEST_F(RelayControlLoopTest, DetectorSafetyBeatsManualInSameTick) {
    ASSERT_TRUE(inbox.submit(manual(CHANNEL_HEATER, true)));
    ASSERT_TRUE(inbox.submit(safetyOff(CHANNEL_HEATER, "dynamic_power 109.0 > 108.0")));
    tick(OperatingMode::Manual, climate(25.0f));

    EXPECT_FALSE(loop.relayOn(CHANNEL_HEATER));
    ASSERT_EQ(out.transitionCount, 2);
    EXPECT_EQ(out.transitions[1].issuer, CommandIssuer::Safety);
    EXPECT_STREQ(out.transitions[1].reason, "dynamic_power 109.0 > 108.0");
}

TEST_F(RelayControlLoopTest, DetectorSafetyAppliesInAutoAndBeatsRuleEdge) {
    ASSERT_TRUE(inbox.submit(safetyOff(CHANNEL_HEATER, "fixed_power")));
    tick(OperatingMode::Auto, climate(25.0f));
    // Edge turned the heater ON, detector command then forced it OFF.
    EXPECT_FALSE(loop.relayOn(CHANNEL_HEATER));
    ASSERT_EQ(out.transitionCount, 3);
    EXPECT_EQ(out.transitions[2].issuer, CommandIssuer::Safety);
}
