/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CONTROL_TYPES_H
#define CONTROL_TYPES_H

#include <stdint.h>
#include <stddef.h>
#include <ConfigNVS.hpp>

/**
 * @file ControlTypes.hpp
 * @brief Plain value types shared by acquisition, control, bus and detector.
 *
 * Nothing in here touches hardware; the portable core and both firmware
 * images include it. Channels are numbered 1..LOAD_CHANNEL_COUNT on the wire
 * and in every struct below (index = channel - 1).
 *
 *   Channel 1 : heater / bulb load
 *   Channel 2 : fan load
 */

#define LOAD_CHANNEL_COUNT     2
#define CHANNEL_HEATER         1
#define CHANNEL_FAN            2
#define REASON_MAX_LEN         64
#define ANOMALY_MESSAGE_LEN    96

enum class OperatingMode : uint8_t {
    Auto   = 0,
    Manual = 1
};

// Authority that caused a relay change. Never dropped downstream.
enum class CommandIssuer : uint8_t {
    Manual = 0,
    Auto   = 1,
    Safety = 2
};

enum class Climate : uint8_t {
    Unknown = 0,
    Cold    = 1,
    Hot     = 2
};

enum class Severity : uint8_t {
    Info     = 0,
    Warning  = 1,
    Critical = 2
};

enum class AnomalyType : uint8_t {
    SafetyPowerCeiling   = 0,   // firmware-side fixed power limit
    SafetyVoltageCeiling = 1,   // firmware-side fixed voltage limit
    FixedPowerCeiling    = 2,   // detector per-device absolute limit
    DynamicPower         = 3,   // detector, relative to today's peak power
    DynamicVoltage       = 4,   // detector, relative to today's peak voltage
    SystemOverload       = 5    // detector, aggregate across channels
};

enum class TriggeredAction : uint8_t {
    None     = 0,
    RelayOff = 1
};

struct ControlCommand {
    uint8_t       channel = 0;                    // 1..LOAD_CHANNEL_COUNT
    bool          relayOn = false;
    CommandIssuer issuer  = CommandIssuer::Manual;
    char          reason[REASON_MAX_LEN] = {0};
};

// Immutable telemetry snapshot, one per channel per measurement window.
struct TelemetrySample {
    uint8_t  channel     = 0;
    float    voltage     = 0.0f;   // V RMS
    float    current     = 0.0f;   // A RMS
    float    power       = 0.0f;   // W
    bool     relayOn     = false;
    bool     relayKnown  = false;  // false when the payload carried no relay_state
    float    energyKWh   = 0.0f;
    float    cost        = 0.0f;
    uint64_t timestampMs = 0;
};

struct EnvironmentReading {
    float temperatureC = 0.0f;
    float humidity     = 0.0f;
    bool  valid        = false;
};

// Detector thresholds. Externally configured, read-only during a tick.
struct ThresholdConfig {
    float fixedPowerCeilingW[LOAD_CHANNEL_COUNT] = {DEFAULT_CH1_FIXED_POWER,
                                                     DEFAULT_CH2_FIXED_POWER};
    float dynamicPowerRatio   = DEFAULT_DYN_POWER_RATIO;
    float dynamicVoltageRatio = DEFAULT_DYN_VOLT_RATIO;
    float systemPowerCapW     = DEFAULT_SYSTEM_POWER_CAP;
    float minPeakPowerW       = DEFAULT_MIN_PEAK_POWER;  // below this the power baseline is ignored
    float minPeakVoltageV     = DEFAULT_MIN_PEAK_VOLT;   // below this the voltage baseline is ignored
};

// Firmware-side absolute limits (never mode dependent).
struct SafetyLimits {
    float maxPowerW   = DEFAULT_CH1_SAFE_POWER;
    float maxVoltageV = DEFAULT_SAFE_VOLTAGE;
};

struct AnomalyEvent {
    uint8_t         channel  = 0;        // 0 = system-level
    AnomalyType     type     = AnomalyType::FixedPowerCeiling;
    Severity        severity = Severity::Warning;
    TriggeredAction action   = TriggeredAction::None;
    uint8_t         target   = 0;        // channel switched off by the action
    float           value    = 0.0f;
    float           threshold = 0.0f;
    char            message[ANOMALY_MESSAGE_LEN] = {0};
};

inline bool isValidChannel(uint8_t channel) {
    return channel >= 1 && channel <= LOAD_CHANNEL_COUNT;
}

const char* modeName(OperatingMode mode);
const char* issuerName(CommandIssuer issuer);
const char* severityName(Severity severity);
const char* anomalyTypeName(AnomalyType type);
const char* anomalyMetricName(AnomalyType type);
const char* climateName(Climate climate);

// Case-insensitive. Return false and leave @p out untouched when unknown.
bool parseMode(const char* text, OperatingMode& out);
bool parseIssuer(const char* text, CommandIssuer& out);

// Bounded copy that always terminates @p dst.
void copyReason(char* dst, size_t dstLen, const char* src);

#endif // CONTROL_TYPES_H
