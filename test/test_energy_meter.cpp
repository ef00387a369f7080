#include <gtest/gtest.h>
#include <math.h>

#include <EnergyMeter.hpp>

TEST(EnergyMeter, IntegratesPowerOverTime) {
    EnergyMeter m;
    // 1 kW for one hour in one-second steps.
    for (int s = 0; s < 3600; ++s) {
        m.accumulate(1, 1000.0f, 1000);
    }
    EXPECT_NEAR(m.energyKWh(1), 1.0f, 1e-4f);
    EXPECT_NEAR(m.cost(1), DEFAULT_TARIFF, 1e-4f);
    EXPECT_FLOAT_EQ(m.energyKWh(2), 0.0f);
}

TEST(EnergyMeter, IgnoresGapsAndBadInput) {
    EnergyMeter m;
    m.accumulate(1, 500.0f, 0);
    m.accumulate(1, 500.0f, EnergyMeter::MAX_STEP_MS + 1);
    m.accumulate(1, -10.0f, 1000);
    m.accumulate(1, NAN, 1000);
    m.accumulate(3, 500.0f, 1000);
    EXPECT_FLOAT_EQ(m.energyKWh(1), 0.0f);
}

TEST(EnergyMeter, TariffAndReset) {
    EnergyMeter m;
    m.setTariff(0.25f);
    m.accumulate(2, 2000.0f, 60000);     // 2 kW for a minute
    EXPECT_NEAR(m.energyKWh(2), 2.0f / 60.0f, 1e-5f);
    EXPECT_NEAR(m.cost(2), 0.25f * 2.0f / 60.0f, 1e-5f);

    m.setTariff(-1.0f);
    EXPECT_FLOAT_EQ(m.tariff(), DEFAULT_TARIFF);

    m.reset(2);
    EXPECT_FLOAT_EQ(m.energyKWh(2), 0.0f);
}
