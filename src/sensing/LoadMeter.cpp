#include <LoadMeter.hpp>
#include <math.h>

LoadMeter::LoadMeter(SampleSource& source)
    : _source(source)
{
    configure(MeterConfig());
}

uint8_t LoadMeter::index_(uint8_t channel) {
    if (!isValidChannel(channel)) return 0;
    return static_cast<uint8_t>(channel - 1);
}

// ============================================================================
// configure()
//   - Zero or non-finite values fall back to defaults.
// ============================================================================

void LoadMeter::configure(const MeterConfig& cfg) {
    _cfg = cfg;
    if (_cfg.lineHz == 0)             _cfg.lineHz = DEFAULT_AC_FREQUENCY;
    if (_cfg.samplesPerCycle == 0)    _cfg.samplesPerCycle = DEFAULT_SAMPLES_PER_CYCLE;
    if (_cfg.cyclesPerWindow == 0)    _cfg.cyclesPerWindow = DEFAULT_CYCLES_PER_WINDOW;
    if (_cfg.calibrationSamples == 0) _cfg.calibrationSamples = DEFAULT_CALIB_SAMPLES;

    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        if (!isfinite(_cfg.voltageScale[i]) || _cfg.voltageScale[i] <= 0.0f) {
            _cfg.voltageScale[i] = DEFAULT_VOLT_SCALE;
        }
        if (!isfinite(_cfg.currentScale[i]) || _cfg.currentScale[i] <= 0.0f) {
            _cfg.currentScale[i] = DEFAULT_CURR_SCALE;
        }
        _ch[i].conditioner.configure(_cfg.conditioner);
    }
    _cfg.conditioner = _ch[0].conditioner.config();
}

uint32_t LoadMeter::samplesPerWindow() const {
    return static_cast<uint32_t>(_cfg.samplesPerCycle) * _cfg.cyclesPerWindow;
}

uint32_t LoadMeter::samplePeriodUs() const {
    const uint32_t slotsPerSecond =
        static_cast<uint32_t>(_cfg.lineHz) * _cfg.samplesPerCycle;
    return 1000000UL / slotsPerSecond;
}

// ============================================================================
// calibrate()
//   - Average raw counts per channel with the loads OFF.
//   - A channel with no valid sample gets the converter midpoint and the
//     call returns false.
// ============================================================================

bool LoadMeter::calibrate() {
    double   sumV[LOAD_CHANNEL_COUNT]  = {0};
    double   sumI[LOAD_CHANNEL_COUNT]  = {0};
    uint32_t count[LOAD_CHANNEL_COUNT] = {0};

    const int32_t  fullScale = _source.fullScale();
    const uint32_t period    = samplePeriodUs();

    for (uint32_t n = 0; n < _cfg.calibrationSamples; ++n) {
        for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
            int32_t v = 0;
            int32_t c = 0;
            if (!_source.read(i + 1, v, c)) continue;
            if (v < 0 || v > fullScale || c < 0 || c > fullScale) continue;
            sumV[i] += v;
            sumI[i] += c;
            count[i]++;
        }
        _source.waitNextSample(period);
    }

    bool ok = true;
    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        ChannelCalibration& cal = _ch[i].cal;
        if (count[i] == 0) {
            cal.voltageOffset = fullScale / 2.0f;
            cal.currentOffset = fullScale / 2.0f;
            cal.valid = false;
            ok = false;
            continue;
        }
        cal.voltageOffset = static_cast<float>(sumV[i] / count[i]);
        cal.currentOffset = static_cast<float>(sumI[i] / count[i]);
        cal.valid = true;
        _ch[i].conditioner.reset();
    }
    return ok;
}

bool LoadMeter::isCalibrated() const {
    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        if (!_ch[i].cal.valid) return false;
    }
    return true;
}

// ============================================================================
// measure()
// ============================================================================

bool LoadMeter::measure() {
    double sqV[LOAD_CHANNEL_COUNT]   = {0};
    double sqI[LOAD_CHANNEL_COUNT]   = {0};
    bool   fault[LOAD_CHANNEL_COUNT] = {false};

    const int32_t  fullScale = _source.fullScale();
    const uint32_t total     = samplesPerWindow();
    const uint32_t period    = samplePeriodUs();

    for (uint32_t n = 0; n < total; ++n) {
        for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
            if (fault[i]) continue;
            int32_t v = 0;
            int32_t c = 0;
            if (!_source.read(i + 1, v, c) ||
                v < 0 || v > fullScale || c < 0 || c > fullScale) {
                fault[i] = true;
                continue;
            }
            const double dv = v - _ch[i].cal.voltageOffset;
            const double dc = c - _ch[i].cal.currentOffset;
            sqV[i] += dv * dv;
            sqI[i] += dc * dc;
        }
        _source.waitNextSample(period);
    }

    bool allOk = true;
    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        ChannelState& ch = _ch[i];
        ch.windowOk = false;

        if (!fault[i]) {
            const float rmsV = static_cast<float>(sqrt(sqV[i] / total)) * _cfg.voltageScale[i];
            const float rmsI = static_cast<float>(sqrt(sqI[i] / total)) * _cfg.currentScale[i];
            if (ch.conditioner.push(rmsV, rmsI)) {
                ch.rawVoltage = rmsV;
                ch.rawCurrent = rmsI;
                ch.windowOk   = true;
            }
        }

        if (!ch.windowOk) {
            ch.faults++;
            allOk = false;
        }
    }
    return allOk;
}

// ============================================================================
// Accessors
// ============================================================================

bool LoadMeter::windowOk(uint8_t channel) const {
    return isValidChannel(channel) && _ch[index_(channel)].windowOk;
}

const LoadReading& LoadMeter::reading(uint8_t channel) const {
    return _ch[index_(channel)].conditioner.reading();
}

float LoadMeter::rawVoltage(uint8_t channel) const {
    return _ch[index_(channel)].rawVoltage;
}

float LoadMeter::rawCurrent(uint8_t channel) const {
    return _ch[index_(channel)].rawCurrent;
}

const ChannelCalibration& LoadMeter::calibration(uint8_t channel) const {
    return _ch[index_(channel)].cal;
}

uint32_t LoadMeter::faultCount(uint8_t channel) const {
    return _ch[index_(channel)].faults;
}
