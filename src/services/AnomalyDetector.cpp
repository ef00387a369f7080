#include <AnomalyDetector.hpp>
#include <math.h>
#include <stdio.h>

void DetectorReport::clear() {
    commandCount    = 0;
    eventCount      = 0;
    freshChannels   = 0;
    aggregatePowerW = 0.0f;
}

AnomalyDetector::AnomalyDetector()
{
    configure(ThresholdConfig());
}

AnomalyDetector::AnomalyDetector(const ThresholdConfig& cfg)
{
    configure(cfg);
}

void AnomalyDetector::configure(const ThresholdConfig& cfg) {
    ThresholdConfig def;
    _cfg = cfg;
    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        if (!isfinite(_cfg.fixedPowerCeilingW[i]) || _cfg.fixedPowerCeilingW[i] <= 0.0f) {
            _cfg.fixedPowerCeilingW[i] = def.fixedPowerCeilingW[i];
        }
    }
    if (!isfinite(_cfg.dynamicPowerRatio) || _cfg.dynamicPowerRatio <= 0.0f) {
        _cfg.dynamicPowerRatio = def.dynamicPowerRatio;
    }
    if (!isfinite(_cfg.dynamicVoltageRatio) || _cfg.dynamicVoltageRatio <= 0.0f) {
        _cfg.dynamicVoltageRatio = def.dynamicVoltageRatio;
    }
    if (!isfinite(_cfg.systemPowerCapW) || _cfg.systemPowerCapW <= 0.0f) {
        _cfg.systemPowerCapW = def.systemPowerCapW;
    }
    if (!isfinite(_cfg.minPeakPowerW) || _cfg.minPeakPowerW < 0.0f) {
        _cfg.minPeakPowerW = def.minPeakPowerW;
    }
    if (!isfinite(_cfg.minPeakVoltageV) || _cfg.minPeakVoltageV < 0.0f) {
        _cfg.minPeakVoltageV = def.minPeakVoltageV;
    }
}

bool AnomalyDetector::setFixedCeiling(uint8_t channel, float powerW) {
    if (!isValidChannel(channel)) return false;
    if (!isfinite(powerW) || powerW <= 0.0f) return false;
    _cfg.fixedPowerCeilingW[channel - 1] = powerW;
    return true;
}

bool AnomalyDetector::isActive_(const TelemetrySample& s) {
    if (s.relayKnown) return s.relayOn;
    return s.power > 0.0f;
}

void AnomalyDetector::addOff_(uint8_t channel, const AnomalyEvent& why, DetectorReport& out) {
    if (out.commandCount >= DETECTOR_MAX_COMMANDS) return;
    ControlCommand& cmd = out.commands[out.commandCount++];
    cmd = ControlCommand();
    cmd.channel = channel;
    cmd.relayOn = false;
    cmd.issuer  = CommandIssuer::Safety;
    snprintf(cmd.reason, sizeof(cmd.reason), "%s %.1f > %.1f",
             anomalyTypeName(why.type), why.value, why.threshold);
}

// ============================================================================
// evaluate()
// ============================================================================

void AnomalyDetector::evaluate(const TelemetryCache& cache,
                               const PeakBaseline& peaks,
                               uint32_t nowMs,
                               DetectorReport& out) const {
    out.clear();

    TelemetrySample fresh[LOAD_CHANNEL_COUNT];
    bool            hasFresh[LOAD_CHANNEL_COUNT] = {false};
    bool            switchedOff[LOAD_CHANNEL_COUNT] = {false};

    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        const uint8_t ch = i + 1;
        if (!cache.latest(ch, nowMs, fresh[i])) continue;

        const TelemetrySample& s = fresh[i];
        if (!isfinite(s.power) || !isfinite(s.voltage)) continue;

        hasFresh[i] = true;
        out.freshChannels++;
        out.aggregatePowerW += s.power;

        if (!isActive_(s)) continue;

        const float peakP = peaks.todayPeakPower(ch);
        const float peakV = peaks.todayPeakVoltage(ch);

        // One event per violated metric, one OFF per channel.
        AnomalyEvent hits[2];
        uint8_t      hitCount = 0;

        if (s.power > _cfg.fixedPowerCeilingW[i]) {
            AnomalyEvent& ev = hits[hitCount++];
            ev.type      = AnomalyType::FixedPowerCeiling;
            ev.severity  = Severity::Critical;
            ev.value     = s.power;
            ev.threshold = _cfg.fixedPowerCeilingW[i];
        } else if (peakP >= _cfg.minPeakPowerW &&
                   s.power > _cfg.dynamicPowerRatio * peakP) {
            AnomalyEvent& ev = hits[hitCount++];
            ev.type      = AnomalyType::DynamicPower;
            ev.severity  = Severity::Warning;
            ev.value     = s.power;
            ev.threshold = _cfg.dynamicPowerRatio * peakP;
        }

        if (peakV >= _cfg.minPeakVoltageV &&
            s.voltage > _cfg.dynamicVoltageRatio * peakV) {
            AnomalyEvent& ev = hits[hitCount++];
            ev.type      = AnomalyType::DynamicVoltage;
            ev.severity  = Severity::Warning;
            ev.value     = s.voltage;
            ev.threshold = _cfg.dynamicVoltageRatio * peakV;
        }

        if (hitCount == 0) continue;

        for (uint8_t h = 0; h < hitCount; ++h) {
            AnomalyEvent& ev = hits[h];
            ev.channel = ch;
            ev.action  = TriggeredAction::RelayOff;
            ev.target  = ch;
            if (ev.severity == Severity::Critical) {
                snprintf(ev.message, sizeof(ev.message),
                         "Load %u %s %.1f exceeded critical limit %.1f",
                         (unsigned)ch, anomalyMetricName(ev.type), ev.value, ev.threshold);
            } else {
                snprintf(ev.message, sizeof(ev.message),
                         "Load %u %s %.1f approaching today's peak (> %.1f)",
                         (unsigned)ch, anomalyMetricName(ev.type), ev.value, ev.threshold);
            }
            if (out.eventCount < DETECTOR_MAX_EVENTS) {
                out.events[out.eventCount++] = ev;
            }
        }

        addOff_(ch, hits[0], out);
        switchedOff[i] = true;
    }

    if (out.freshChannels == 0 || out.aggregatePowerW <= _cfg.systemPowerCapW) {
        return;
    }

    // System overload: shed the biggest active load still ON.
    int8_t victim = -1;
    int8_t biggestOff = -1;
    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        if (!hasFresh[i] || !isActive_(fresh[i])) continue;
        if (switchedOff[i]) {
            if (biggestOff < 0 || fresh[i].power > fresh[biggestOff].power) biggestOff = i;
            continue;
        }
        if (victim < 0 || fresh[i].power > fresh[victim].power) victim = i;
    }

    AnomalyEvent sys;
    sys.channel   = 0;
    sys.type      = AnomalyType::SystemOverload;
    sys.severity  = Severity::Critical;
    sys.value     = out.aggregatePowerW;
    sys.threshold = _cfg.systemPowerCapW;

    if (victim >= 0) {
        sys.action = TriggeredAction::RelayOff;
        sys.target = static_cast<uint8_t>(victim + 1);
        addOff_(sys.target, sys, out);
    } else if (biggestOff >= 0) {
        sys.action = TriggeredAction::RelayOff;
        sys.target = static_cast<uint8_t>(biggestOff + 1);
    }

    snprintf(sys.message, sizeof(sys.message),
             "System power %.1f W exceeded cap %.1f W",
             sys.value, sys.threshold);

    if (out.eventCount < DETECTOR_MAX_EVENTS) {
        out.events[out.eventCount++] = sys;
    }
}
