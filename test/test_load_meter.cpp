#include <gtest/gtest.h>
#include <math.h>

#include <LoadMeter.hpp>

namespace {

// Scripted sine waveforms on a 12-bit converter.
class FakeSampleSource : public SampleSource {
public:
    struct Wave {
        float offsetV = 2048.0f;
        float ampV    = 0.0f;
        float offsetI = 1900.0f;
        float ampI    = 0.0f;
    };

    Wave     wave[LOAD_CHANNEL_COUNT];
    uint16_t samplesPerCycle = 40;
    uint32_t slot            = 0;
    uint32_t waits           = 0;
    uint32_t lastPeriodUs    = 0;
    int      failChannel     = 0;       // read() fails for this channel
    int32_t  forcedVoltage   = -1;      // >= 0 overrides channel 1 voltage

    bool read(uint8_t channel, int32_t& v, int32_t& i) override {
        if (channel == failChannel) return false;
        const Wave& w = wave[channel - 1];
        const double phase = 2.0 * M_PI * (slot % samplesPerCycle) / samplesPerCycle;
        v = static_cast<int32_t>(lround(w.offsetV + w.ampV * sin(phase)));
        i = static_cast<int32_t>(lround(w.offsetI + w.ampI * sin(phase)));
        if (channel == 1 && forcedVoltage >= 0) v = forcedVoltage;
        return true;
    }

    void waitNextSample(uint32_t periodUs) override {
        lastPeriodUs = periodUs;
        ++waits;
        ++slot;
    }

    int32_t fullScale() const override { return 4095; }
};

MeterConfig testConfig() {
    MeterConfig cfg;
    cfg.lineHz             = 50;
    cfg.samplesPerCycle    = 40;
    cfg.cyclesPerWindow    = 3;
    cfg.calibrationSamples = 400;
    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        cfg.voltageScale[i] = 0.25f;
        cfg.currentScale[i] = 0.005f;
    }
    cfg.conditioner.emaAlpha      = 0.35f;
    cfg.conditioner.maxVoltageV   = 300.0f;
    cfg.conditioner.currentNoiseA = 0.05f;
    return cfg;
}

} // namespace

class LoadMeterTest : public ::testing::Test {
protected:
    LoadMeterTest() : meter(source) {}

    void SetUp() override {
        meter.configure(testConfig());
    }

    void energize() {
        source.wave[0].ampV = 1300.0f;   // ~229.8 V RMS
        source.wave[0].ampI = 400.0f;    // ~1.414 A RMS
        source.wave[1].ampV = 1300.0f;
        source.wave[1].ampI = 200.0f;    // ~0.707 A RMS
    }

    FakeSampleSource source;
    LoadMeter        meter;
};

TEST_F(LoadMeterTest, WindowGeometryFollowsLineFrequency) {
    EXPECT_EQ(meter.samplesPerWindow(), 120u);
    EXPECT_EQ(meter.samplePeriodUs(), 500u);
}

TEST_F(LoadMeterTest, CalibrationAveragesZeroOffsets) {
    ASSERT_TRUE(meter.calibrate());
    EXPECT_TRUE(meter.isCalibrated());
    EXPECT_EQ(source.waits, 400u);
    EXPECT_NEAR(meter.calibration(1).voltageOffset, 2048.0f, 0.01f);
    EXPECT_NEAR(meter.calibration(1).currentOffset, 1900.0f, 0.01f);
    EXPECT_NEAR(meter.calibration(2).voltageOffset, 2048.0f, 0.01f);
}

TEST_F(LoadMeterTest, CalibrationFailsForSilentChannel) {
    source.failChannel = 2;
    EXPECT_FALSE(meter.calibrate());
    EXPECT_TRUE(meter.calibration(1).valid);
    EXPECT_FALSE(meter.calibration(2).valid);
    EXPECT_FALSE(meter.isCalibrated());
}

TEST_F(LoadMeterTest, RmsOverWholeCyclesMatchesSineAmplitude) {
    ASSERT_TRUE(meter.calibrate());
    energize();

    ASSERT_TRUE(meter.measure());
    EXPECT_NEAR(meter.rawVoltage(1), 1300.0f / sqrtf(2.0f) * 0.25f, 0.3f);
    EXPECT_NEAR(meter.rawCurrent(1), 400.0f / sqrtf(2.0f) * 0.005f, 0.005f);
    EXPECT_NEAR(meter.rawCurrent(2), 200.0f / sqrtf(2.0f) * 0.005f, 0.005f);

    // First window: EMA from zero.
    EXPECT_NEAR(meter.reading(1).voltage, 0.35f * meter.rawVoltage(1), 1e-3f);
}

TEST_F(LoadMeterTest, FilteredReadingConvergesAndPowerIsProduct) {
    ASSERT_TRUE(meter.calibrate());
    energize();
    for (int n = 0; n < 30; ++n) {
        ASSERT_TRUE(meter.measure());
    }
    const LoadReading& r = meter.reading(1);
    EXPECT_NEAR(r.voltage, 229.8f, 0.5f);
    EXPECT_NEAR(r.current, 1.414f, 0.01f);
    EXPECT_FLOAT_EQ(r.power, r.voltage * r.current);
}

TEST_F(LoadMeterTest, ResidualNoiseReadsAsZeroCurrent) {
    ASSERT_TRUE(meter.calibrate());
    source.wave[0].ampV = 1300.0f;
    source.wave[0].ampI = 5.0f;       // ~0.018 A, under the floor
    ASSERT_TRUE(meter.measure());
    EXPECT_GT(meter.rawCurrent(1), 0.0f);
    EXPECT_EQ(meter.reading(1).current, 0.0f);
    EXPECT_EQ(meter.reading(1).power, 0.0f);
}

TEST_F(LoadMeterTest, ConverterErrorDiscardsOnlyThatChannel) {
    ASSERT_TRUE(meter.calibrate());
    energize();
    ASSERT_TRUE(meter.measure());
    const LoadReading before = meter.reading(2);

    source.failChannel = 2;
    EXPECT_FALSE(meter.measure());
    EXPECT_TRUE(meter.windowOk(1));
    EXPECT_FALSE(meter.windowOk(2));
    EXPECT_EQ(meter.faultCount(2), 1u);
    EXPECT_EQ(meter.faultCount(1), 0u);
    EXPECT_FLOAT_EQ(meter.reading(2).voltage, before.voltage);
    EXPECT_FLOAT_EQ(meter.reading(2).current, before.current);
}

TEST_F(LoadMeterTest, OutOfRangeCountIsASensorFault) {
    ASSERT_TRUE(meter.calibrate());
    source.forcedVoltage = 5000;
    EXPECT_FALSE(meter.measure());
    EXPECT_FALSE(meter.windowOk(1));
    EXPECT_TRUE(meter.windowOk(2));
}
