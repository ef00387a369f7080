/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SIGNAL_FILTER_H
#define SIGNAL_FILTER_H

#include <math.h>
#include <ConfigNVS.hpp>

// ============================================================================
// Per-channel conditioning of raw RMS figures
// ============================================================================
//
//   raw V  -> clamp to maxVoltageV        -> EMA -> filtered V
//   raw I  -> below noise floor ? 0 (hard) : EMA -> filtered I
//   filtered P = filtered V * filtered I  (not filtered separately)
//
// EMA: filtered = (1 - alpha) * previous + alpha * raw, starting from 0.
// A non-finite or negative raw figure is a sensor fault: the window is
// discarded and the last good reading is kept.
// ============================================================================

class EmaFilter {
public:
    explicit EmaFilter(float alpha = DEFAULT_EMA_ALPHA);

    // Alpha outside (0, 1] falls back to DEFAULT_EMA_ALPHA.
    void  setAlpha(float alpha);
    float update(float raw);
    void  reset(float value = 0.0f);

    float value() const { return _value; }
    float alpha() const { return _alpha; }

private:
    float _alpha;
    float _value;
};

struct ConditionerConfig {
    float emaAlpha       = DEFAULT_EMA_ALPHA;
    float maxVoltageV    = DEFAULT_MAX_VOLTAGE;
    float currentNoiseA  = DEFAULT_CURRENT_NOISE;
};

struct LoadReading {
    float voltage = 0.0f;
    float current = 0.0f;
    float power   = 0.0f;
};

class SignalConditioner {
public:
    SignalConditioner();
    explicit SignalConditioner(const ConditionerConfig& cfg);

    void configure(const ConditionerConfig& cfg);

    // Feed one window of raw RMS figures. Returns false on a sensor fault.
    bool push(float rawVoltage, float rawCurrent);

    const LoadReading& reading() const { return _reading; }
    const ConditionerConfig& config() const { return _cfg; }

    void reset();

private:
    ConditionerConfig _cfg;
    EmaFilter         _voltage;
    EmaFilter         _current;
    LoadReading       _reading;
};

#endif // SIGNAL_FILTER_H
