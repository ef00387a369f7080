#include <RelayControlLoop.hpp>
#include <math.h>
#include <stdio.h>

void TickResult::clear() {
    transitionCount = 0;
    eventCount      = 0;
    modeChanged     = false;
    ignoredManual   = 0;
    climate         = Climate::Unknown;
}

RelayControlLoop::RelayControlLoop()
{
    reset();
}

RelayControlLoop::RelayControlLoop(const ControlLoopConfig& cfg)
{
    reset();
    configure(cfg);
}

void RelayControlLoop::configure(const ControlLoopConfig& cfg) {
    _cfg = cfg;
    if (!isfinite(_cfg.autoThresholdC)) {
        _cfg.autoThresholdC = DEFAULT_AUTO_TEMP_THRESHOLD;
    }
}

void RelayControlLoop::reset() {
    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        _relay[i]   = false;
        _tripped[i] = false;
    }
    _lastClimate = Climate::Unknown;
}

bool RelayControlLoop::relayOn(uint8_t channel) const {
    return isValidChannel(channel) && _relay[channel - 1];
}

bool RelayControlLoop::tripped(uint8_t channel) const {
    return isValidChannel(channel) && _tripped[channel - 1];
}

// ============================================================================
// tick()
// ============================================================================

OperatingMode RelayControlLoop::tick(OperatingMode mode,
                                     CommandInbox& inbox,
                                     const ControlInputs& in,
                                     TickResult& out) {
    out.clear();

    // 1) Mode
    OperatingMode requested;
    if (inbox.takeMode(requested) && requested != mode) {
        mode = requested;
        out.modeChanged = true;
        if (mode == OperatingMode::Auto) {
            _lastClimate = Climate::Unknown;
        }
    }

    // 2) Manual commands
    for (uint8_t ch = 1; ch <= LOAD_CHANNEL_COUNT; ++ch) {
        ControlCommand cmd;
        if (!inbox.takeManual(ch, cmd)) continue;
        if (mode != OperatingMode::Manual) {
            out.ignoredManual++;
            continue;
        }
        applyCommand_(ch, cmd.relayOn, CommandIssuer::Manual,
                      cmd.reason[0] ? cmd.reason : "operator", out);
    }

    // 3) Temperature rule
    if (mode == OperatingMode::Auto) {
        runAutoRule_(in.env, out);
    }
    out.climate = _lastClimate;

    // 4) Detector safety commands
    for (uint8_t ch = 1; ch <= LOAD_CHANNEL_COUNT; ++ch) {
        ControlCommand cmd;
        if (!inbox.takeSafety(ch, cmd)) continue;
        applyCommand_(ch, false, CommandIssuer::Safety,
                      cmd.reason[0] ? cmd.reason : "anomaly detector", out);
    }

    // 5) Fixed ceilings, last so they win
    runSafetyCheck_(in, out);

    return mode;
}

void RelayControlLoop::runAutoRule_(const EnvironmentReading& env, TickResult& out) {
    if (!env.valid || !isfinite(env.temperatureC)) return;

    const Climate now = (env.temperatureC >= _cfg.autoThresholdC) ? Climate::Hot
                                                                  : Climate::Cold;
    if (now == _lastClimate) return;
    _lastClimate = now;

    char reason[REASON_MAX_LEN];
    snprintf(reason, sizeof(reason), "temp %.1fC %s %.1fC",
             env.temperatureC,
             (now == Climate::Hot) ? ">=" : "<",
             _cfg.autoThresholdC);

    // Active load goes OFF before the other comes ON.
    if (now == Climate::Hot) {
        applyCommand_(CHANNEL_HEATER, false, CommandIssuer::Auto, reason, out);
        applyCommand_(CHANNEL_FAN,    true,  CommandIssuer::Auto, reason, out);
    } else {
        applyCommand_(CHANNEL_FAN,    false, CommandIssuer::Auto, reason, out);
        applyCommand_(CHANNEL_HEATER, true,  CommandIssuer::Auto, reason, out);
    }
}

void RelayControlLoop::runSafetyCheck_(const ControlInputs& in, TickResult& out) {
    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        const uint8_t       ch  = i + 1;
        const LoadReading&  r   = in.load[i];
        const SafetyLimits& lim = _cfg.limits[i];

        AnomalyType type  = AnomalyType::SafetyPowerCeiling;
        float       value = 0.0f;
        float       limit = 0.0f;
        bool        over  = false;

        if (isfinite(r.power) && r.power > lim.maxPowerW) {
            type  = AnomalyType::SafetyPowerCeiling;
            value = r.power;
            limit = lim.maxPowerW;
            over  = true;
        } else if (isfinite(r.voltage) && r.voltage > lim.maxVoltageV) {
            type  = AnomalyType::SafetyVoltageCeiling;
            value = r.voltage;
            limit = lim.maxVoltageV;
            over  = true;
        }

        const bool wasTripped = _tripped[i];
        const bool wasOn      = _relay[i];
        _tripped[i] = over;
        if (!over) continue;

        // OFF is re-asserted every window while over the limit, including
        // when the relay is already OFF (stuck contact, lost write).
        char reason[REASON_MAX_LEN];
        snprintf(reason, sizeof(reason), "%s %.1f > %.1f",
                 anomalyMetricName(type), value, limit);
        applyCommand_(ch, false, CommandIssuer::Safety, reason, out);

        // One event per trip: on the rising edge, or when a re-armed relay trips again.
        if ((!wasTripped || wasOn) && out.eventCount < TICK_MAX_EVENTS) {
            AnomalyEvent& ev = out.events[out.eventCount++];
            ev = AnomalyEvent();
            ev.channel   = ch;
            ev.type      = type;
            ev.severity  = Severity::Critical;
            ev.action    = TriggeredAction::RelayOff;
            ev.target    = ch;
            ev.value     = value;
            ev.threshold = limit;
            snprintf(ev.message, sizeof(ev.message),
                     "Load %u %s %.1f exceeded safety limit %.1f",
                     (unsigned)ch, anomalyMetricName(type), value, limit);
        }
    }
}

void RelayControlLoop::applyCommand_(uint8_t channel,
                                     bool on,
                                     CommandIssuer issuer,
                                     const char* reason,
                                     TickResult& out) {
    if (!isValidChannel(channel)) return;

    const bool changed = (_relay[channel - 1] != on);
    _relay[channel - 1] = on;

    if (out.transitionCount >= TICK_MAX_TRANSITIONS) return;
    RelayTransition& t = out.transitions[out.transitionCount++];
    t.channel = channel;
    t.relayOn = on;
    t.changed = changed;
    t.issuer  = issuer;
    copyReason(t.reason, sizeof(t.reason), reason);
}
