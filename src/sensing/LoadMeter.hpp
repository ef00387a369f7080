/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef LOAD_METER_H
#define LOAD_METER_H

#include <ControlTypes.hpp>
#include <SampleSource.hpp>
#include <SignalFilter.hpp>

// ============================================================================
// LoadMeter : RMS voltage / current / power for every load channel
// ============================================================================
//
// calibrate():
//   - Loads MUST be OFF. Averages calibrationSamples raw readings per channel
//     to get the DC zero offset of each input. Offsets stay fixed afterwards;
//     a biased calibration is not detected.
//
// measure():
//   - Samples all channels for cyclesPerWindow whole AC cycles
//     (lineHz * samplesPerCycle slots per second).
//   - Per channel: sum((raw - offset)^2) -> sqrt(mean) -> * scale.
//   - The RMS pair is fed through that channel's SignalConditioner.
//   - A converter error or out-of-range count discards the window for that
//     channel (sensor fault, last good reading kept).
//
// The call blocks for the whole window; it is the pacing of the control loop.
// ============================================================================

struct MeterConfig {
    uint16_t lineHz             = DEFAULT_AC_FREQUENCY;
    uint16_t samplesPerCycle    = DEFAULT_SAMPLES_PER_CYCLE;
    uint16_t cyclesPerWindow    = DEFAULT_CYCLES_PER_WINDOW;
    uint16_t calibrationSamples = DEFAULT_CALIB_SAMPLES;
    float    voltageScale[LOAD_CHANNEL_COUNT] = {DEFAULT_VOLT_SCALE, DEFAULT_VOLT_SCALE};
    float    currentScale[LOAD_CHANNEL_COUNT] = {DEFAULT_CURR_SCALE, DEFAULT_CURR_SCALE};
    ConditionerConfig conditioner;
};

struct ChannelCalibration {
    float voltageOffset = 0.0f;   // raw counts
    float currentOffset = 0.0f;   // raw counts
    bool  valid         = false;
};

class LoadMeter {
public:
    explicit LoadMeter(SampleSource& source);

    void configure(const MeterConfig& cfg);
    const MeterConfig& config() const { return _cfg; }

    bool calibrate();
    bool isCalibrated() const;

    // One measurement window. Returns true when every channel produced a
    // valid window; see windowOk() for per-channel status.
    bool measure();

    bool               windowOk(uint8_t channel) const;
    const LoadReading& reading(uint8_t channel) const;
    float              rawVoltage(uint8_t channel) const;
    float              rawCurrent(uint8_t channel) const;
    const ChannelCalibration& calibration(uint8_t channel) const;
    uint32_t           faultCount(uint8_t channel) const;

    uint32_t samplesPerWindow() const;
    uint32_t samplePeriodUs() const;

private:
    struct ChannelState {
        ChannelCalibration cal;
        SignalConditioner  conditioner;
        float              rawVoltage = 0.0f;
        float              rawCurrent = 0.0f;
        bool               windowOk   = false;
        uint32_t           faults     = 0;
    };

    static uint8_t index_(uint8_t channel);

    SampleSource& _source;
    MeterConfig   _cfg;
    ChannelState  _ch[LOAD_CHANNEL_COUNT];
};

#endif // LOAD_METER_H
