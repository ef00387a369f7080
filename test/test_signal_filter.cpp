#include <gtest/gtest.h>
#include <math.h>

#include <SignalFilter.hpp>

TEST(EmaFilter, StartsAtZeroAndMovesByAlpha) {
    EmaFilter f(0.35f);
    EXPECT_FLOAT_EQ(f.value(), 0.0f);
    EXPECT_NEAR(f.update(100.0f), 35.0f, 1e-4);
    EXPECT_NEAR(f.update(100.0f), 57.75f, 1e-4);
}

TEST(EmaFilter, DistanceShrinksGeometricallyForConstantInput) {
    const float alpha = 0.35f;
    const float input = 230.0f;
    EmaFilter f(alpha);
    f.reset(10.0f);

    float prevDistance = fabsf(input - f.value());
    for (int n = 0; n < 20; ++n) {
        f.update(input);
        const float distance = fabsf(input - f.value());
        EXPECT_NEAR(distance, prevDistance * (1.0f - alpha), 1e-3f);
        prevDistance = distance;
    }
}

TEST(EmaFilter, InvalidAlphaFallsBackToDefault) {
    EmaFilter f(0.0f);
    EXPECT_FLOAT_EQ(f.alpha(), DEFAULT_EMA_ALPHA);
    f.setAlpha(1.5f);
    EXPECT_FLOAT_EQ(f.alpha(), DEFAULT_EMA_ALPHA);
    f.setAlpha(NAN);
    EXPECT_FLOAT_EQ(f.alpha(), DEFAULT_EMA_ALPHA);
    f.setAlpha(1.0f);
    EXPECT_FLOAT_EQ(f.alpha(), 1.0f);
}

class SignalConditionerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConditionerConfig cfg;
        cfg.emaAlpha      = 0.35f;
        cfg.maxVoltageV   = 300.0f;
        cfg.currentNoiseA = 0.05f;
        cond.configure(cfg);
    }

    SignalConditioner cond;
};

TEST_F(SignalConditionerTest, CurrentBelowNoiseFloorIsExactlyZero) {
    for (int n = 0; n < 10; ++n) {
        ASSERT_TRUE(cond.push(230.0f, 2.0f));
    }
    ASSERT_GT(cond.reading().current, 1.0f);

    const float noisy[] = {0.0f, 0.01f, 0.049f, 0.03f};
    for (float i : noisy) {
        ASSERT_TRUE(cond.push(230.0f, i));
        EXPECT_EQ(cond.reading().current, 0.0f);
        EXPECT_EQ(cond.reading().power, 0.0f);
    }
}

TEST_F(SignalConditionerTest, VoltageIsClampedBeforeFiltering) {
    ASSERT_TRUE(cond.push(5000.0f, 1.0f));
    EXPECT_NEAR(cond.reading().voltage, 0.35f * 300.0f, 1e-3);
}

TEST_F(SignalConditionerTest, PowerIsProductOfFilteredValues) {
    ASSERT_TRUE(cond.push(230.0f, 1.0f));
    ASSERT_TRUE(cond.push(232.0f, 1.2f));
    const LoadReading& r = cond.reading();
    EXPECT_FLOAT_EQ(r.power, r.voltage * r.current);
}

TEST_F(SignalConditionerTest, SensorFaultKeepsLastGoodReading) {
    ASSERT_TRUE(cond.push(230.0f, 1.0f));
    const LoadReading before = cond.reading();

    EXPECT_FALSE(cond.push(NAN, 1.0f));
    EXPECT_FALSE(cond.push(230.0f, INFINITY));
    EXPECT_FALSE(cond.push(-1.0f, 1.0f));

    EXPECT_FLOAT_EQ(cond.reading().voltage, before.voltage);
    EXPECT_FLOAT_EQ(cond.reading().current, before.current);
    EXPECT_FLOAT_EQ(cond.reading().power, before.power);
}

TEST_F(SignalConditionerTest, SingleSpikeDecaysInsteadOfLatching) {
    for (int n = 0; n < 40; ++n) cond.push(100.0f, 1.0f);
    cond.push(290.0f, 1.0f);
    const float spiked = cond.reading().voltage;
    EXPECT_LT(spiked, 290.0f);

    for (int n = 0; n < 10; ++n) cond.push(100.0f, 1.0f);
    EXPECT_LT(cond.reading().voltage, 102.0f);
    EXPECT_GT(spiked, cond.reading().voltage);
}
