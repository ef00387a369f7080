#include <SignalFilter.hpp>

// ============================================================================
// EmaFilter
// ============================================================================

EmaFilter::EmaFilter(float alpha)
    : _alpha(DEFAULT_EMA_ALPHA),
      _value(0.0f)
{
    setAlpha(alpha);
}

void EmaFilter::setAlpha(float alpha) {
    if (!isfinite(alpha) || alpha <= 0.0f || alpha > 1.0f) {
        alpha = DEFAULT_EMA_ALPHA;
    }
    _alpha = alpha;
}

float EmaFilter::update(float raw) {
    _value = (1.0f - _alpha) * _value + _alpha * raw;
    return _value;
}

void EmaFilter::reset(float value) {
    _value = value;
}

// ============================================================================
// SignalConditioner
// ============================================================================

SignalConditioner::SignalConditioner()
{
    configure(ConditionerConfig());
}

SignalConditioner::SignalConditioner(const ConditionerConfig& cfg)
{
    configure(cfg);
}

void SignalConditioner::configure(const ConditionerConfig& cfg) {
    _cfg = cfg;
    if (!isfinite(_cfg.maxVoltageV) || _cfg.maxVoltageV <= 0.0f) {
        _cfg.maxVoltageV = DEFAULT_MAX_VOLTAGE;
    }
    if (!isfinite(_cfg.currentNoiseA) || _cfg.currentNoiseA < 0.0f) {
        _cfg.currentNoiseA = DEFAULT_CURRENT_NOISE;
    }
    _voltage.setAlpha(_cfg.emaAlpha);
    _current.setAlpha(_cfg.emaAlpha);
    _cfg.emaAlpha = _voltage.alpha();
}

bool SignalConditioner::push(float rawVoltage, float rawCurrent) {
    if (!isfinite(rawVoltage) || !isfinite(rawCurrent) ||
        rawVoltage < 0.0f || rawCurrent < 0.0f) {
        return false;
    }

    if (rawVoltage > _cfg.maxVoltageV) {
        rawVoltage = _cfg.maxVoltageV;
    }

    const float v = _voltage.update(rawVoltage);

    float i;
    if (rawCurrent < _cfg.currentNoiseA) {
        _current.reset(0.0f);
        i = 0.0f;
    } else {
        i = _current.update(rawCurrent);
    }

    _reading.voltage = v;
    _reading.current = i;
    _reading.power   = v * i;
    return true;
}

void SignalConditioner::reset() {
    _voltage.reset(0.0f);
    _current.reset(0.0f);
    _reading = LoadReading();
}
