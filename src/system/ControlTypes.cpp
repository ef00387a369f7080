#include <ControlTypes.hpp>
#include <ctype.h>
#include <string.h>

namespace {

bool equalsIgnoreCase_(const char* a, const char* b) {
    if (!a || !b) return false;
    while (*a && *b) {
        if (tolower(static_cast<unsigned char>(*a)) !=
            tolower(static_cast<unsigned char>(*b))) {
            return false;
        }
        ++a;
        ++b;
    }
    return *a == '\0' && *b == '\0';
}

} // namespace

const char* modeName(OperatingMode mode) {
    return (mode == OperatingMode::Manual) ? "manual" : "auto";
}

const char* issuerName(CommandIssuer issuer) {
    switch (issuer) {
        case CommandIssuer::Manual: return "manual";
        case CommandIssuer::Auto:   return "auto";
        case CommandIssuer::Safety: return "safety";
    }
    return "manual";
}

const char* severityName(Severity severity) {
    switch (severity) {
        case Severity::Info:     return "info";
        case Severity::Warning:  return "warning";
        case Severity::Critical: return "critical";
    }
    return "info";
}

const char* anomalyTypeName(AnomalyType type) {
    switch (type) {
        case AnomalyType::SafetyPowerCeiling:   return "safety_power";
        case AnomalyType::SafetyVoltageCeiling: return "safety_voltage";
        case AnomalyType::FixedPowerCeiling:    return "fixed_power";
        case AnomalyType::DynamicPower:         return "dynamic_power";
        case AnomalyType::DynamicVoltage:       return "dynamic_voltage";
        case AnomalyType::SystemOverload:       return "system_overload";
    }
    return "unknown";
}

const char* anomalyMetricName(AnomalyType type) {
    switch (type) {
        case AnomalyType::SafetyVoltageCeiling:
        case AnomalyType::DynamicVoltage:
            return "voltage";
        default:
            return "power";
    }
}

const char* climateName(Climate climate) {
    switch (climate) {
        case Climate::Cold: return "cold";
        case Climate::Hot:  return "hot";
        default:            return "unknown";
    }
}

bool parseMode(const char* text, OperatingMode& out) {
    if (equalsIgnoreCase_(text, "auto")) {
        out = OperatingMode::Auto;
        return true;
    }
    if (equalsIgnoreCase_(text, "manual")) {
        out = OperatingMode::Manual;
        return true;
    }
    return false;
}

bool parseIssuer(const char* text, CommandIssuer& out) {
    if (equalsIgnoreCase_(text, "manual")) { out = CommandIssuer::Manual; return true; }
    if (equalsIgnoreCase_(text, "auto"))   { out = CommandIssuer::Auto;   return true; }
    if (equalsIgnoreCase_(text, "safety")) { out = CommandIssuer::Safety; return true; }
    return false;
}

void copyReason(char* dst, size_t dstLen, const char* src) {
    if (!dst || dstLen == 0) return;
    if (!src) {
        dst[0] = '\0';
        return;
    }
    strncpy(dst, src, dstLen - 1);
    dst[dstLen - 1] = '\0';
}
