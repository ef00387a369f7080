/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef RELAY_CONTROL_LOOP_H
#define RELAY_CONTROL_LOOP_H

#include <ControlTypes.hpp>
#include <CommandInbox.hpp>
#include <SignalFilter.hpp>

/**
 * @file RelayControlLoop.hpp
 * @brief Relay arbitration state machine, advanced one tick per measurement window.
 *
 * The loop owns the logical relay state of every channel. The operating mode
 * is NOT stored here: the caller passes the current mode in and gets the
 * (possibly changed) mode back, so each tick can be tested in isolation.
 *
 * Tick order (later steps win within the same tick):
 *   1. Pending mode change. Switching to AUTO resets the last classification
 *      to Unknown so the temperature rule re-evaluates fresh.
 *   2. Manual commands (latest per channel). Applied only in MANUAL mode,
 *      dropped and counted in AUTO mode.
 *   3. AUTO rule, edge triggered on the hot/cold classification:
 *        hot  (T >= threshold): heater OFF, then fan ON
 *        cold (T <  threshold): fan OFF, then heater ON
 *      Nothing happens while the classification is unchanged or the
 *      environment reading is invalid.
 *   4. Safety OFF commands from the anomaly detector (any mode).
 *   5. Firmware safety check against the fixed per-channel ceilings
 *      (strictly greater than). A channel that is ON and over its ceiling
 *      is forced OFF and an AnomalyEvent is raised. No cooldown: a later ON
 *      is accepted and trips again on the next tick if still unsafe.
 *
 * Every applied command is reported as a RelayTransition carrying its issuer,
 * whether or not the relay actually changed state.
 */

#define TICK_MAX_TRANSITIONS   (LOAD_CHANNEL_COUNT * 4)
#define TICK_MAX_EVENTS        LOAD_CHANNEL_COUNT

struct ControlLoopConfig {
    float        autoThresholdC = DEFAULT_AUTO_TEMP_THRESHOLD;
    SafetyLimits limits[LOAD_CHANNEL_COUNT];

    ControlLoopConfig() {
        limits[0].maxPowerW   = DEFAULT_CH1_SAFE_POWER;
        limits[0].maxVoltageV = DEFAULT_SAFE_VOLTAGE;
        limits[1].maxPowerW   = DEFAULT_CH2_SAFE_POWER;
        limits[1].maxVoltageV = DEFAULT_SAFE_VOLTAGE;
    }
};

struct ControlInputs {
    EnvironmentReading env;
    LoadReading        load[LOAD_CHANNEL_COUNT];
};

struct RelayTransition {
    uint8_t       channel = 0;
    bool          relayOn = false;
    bool          changed = false;
    CommandIssuer issuer  = CommandIssuer::Manual;
    char          reason[REASON_MAX_LEN] = {0};
};

struct TickResult {
    RelayTransition transitions[TICK_MAX_TRANSITIONS];
    uint8_t         transitionCount = 0;
    AnomalyEvent    events[TICK_MAX_EVENTS];
    uint8_t         eventCount      = 0;
    bool            modeChanged     = false;
    uint8_t         ignoredManual   = 0;
    Climate         climate         = Climate::Unknown;

    void clear();
};

class RelayControlLoop {
public:
    RelayControlLoop();
    explicit RelayControlLoop(const ControlLoopConfig& cfg);

    // Takes effect from the next tick.
    void configure(const ControlLoopConfig& cfg);
    const ControlLoopConfig& config() const { return _cfg; }

    OperatingMode tick(OperatingMode mode,
                       CommandInbox& inbox,
                       const ControlInputs& in,
                       TickResult& out);

    bool    relayOn(uint8_t channel) const;
    bool    tripped(uint8_t channel) const;
    Climate lastClimate() const { return _lastClimate; }

    // Back to power-on state: every relay OFF, classification Unknown.
    void reset();

private:
    void applyCommand_(uint8_t channel,
                       bool on,
                       CommandIssuer issuer,
                       const char* reason,
                       TickResult& out);
    void runAutoRule_(const EnvironmentReading& env, TickResult& out);
    void runSafetyCheck_(const ControlInputs& in, TickResult& out);

    ControlLoopConfig _cfg;
    bool              _relay[LOAD_CHANNEL_COUNT];
    bool              _tripped[LOAD_CHANNEL_COUNT];
    Climate           _lastClimate;
};

#endif // RELAY_CONTROL_LOOP_H
