#include <BusCodec.hpp>
#include <ArduinoJson.h>
#include <ctype.h>
#include <math.h>
#include <string.h>

namespace {

const char* const kStateFields[] = { "relay_state", "state", "relay", "on" };

bool equalsIgnoreCase_(const char* a, const char* b) {
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

bool readSwitch_(JsonVariantConst v, bool& out) {
    if (v.is<bool>()) {
        out = v.as<bool>();
        return true;
    }
    if (v.is<long>()) {
        const long n = v.as<long>();
        if (n != 0 && n != 1) return false;
        out = (n == 1);
        return true;
    }
    if (v.is<const char*>()) {
        const char* s = v.as<const char*>();
        if (!s) return false;
        if (equalsIgnoreCase_(s, "on") || equalsIgnoreCase_(s, "true") ||
            strcmp(s, "1") == 0) {
            out = true;
            return true;
        }
        if (equalsIgnoreCase_(s, "off") || equalsIgnoreCase_(s, "false") ||
            strcmp(s, "0") == 0) {
            out = false;
            return true;
        }
    }
    return false;
}

// First state field present wins; a present-but-invalid value is an error.
bool readRelayState_(const JsonDocument& doc, bool& out, bool& present) {
    present = false;
    for (const char* key : kStateFields) {
        JsonVariantConst v = doc[key];
        if (v.isNull()) continue;
        present = true;
        return readSwitch_(v, out);
    }
    return false;
}

bool readNumber_(const JsonDocument& doc, const char* key, float& out) {
    JsonVariantConst v = doc[key];
    if (!v.is<float>()) return false;
    const float f = v.as<float>();
    if (!isfinite(f)) return false;
    out = f;
    return true;
}

bool parse_(const char* payload, size_t len, JsonDocument& doc) {
    if (!payload || len == 0) return false;
    DeserializationError err = deserializeJson(doc, payload, len);
    if (err) return false;
    return doc.is<JsonObject>();
}

size_t write_(const JsonDocument& doc, char* out, size_t outLen) {
    if (!out || outLen == 0) return 0;
    if (measureJson(doc) >= outLen) return 0;
    return serializeJson(doc, out, outLen);
}

} // namespace

double BusCodec::roundTo(double v, uint8_t decimals) {
    double scale = 1.0;
    for (uint8_t i = 0; i < decimals; ++i) scale *= 10.0;
    return round(v * scale) / scale;
}

// ============================================================================
// Encoders
// ============================================================================

size_t BusCodec::encodeTelemetry(const TelemetrySample& s, char* out, size_t outLen) {
    StaticJsonDocument<BUS_JSON_CAPACITY> doc;
    doc["voltage"]     = roundTo(s.voltage, 1);
    doc["current"]     = roundTo(s.current, 3);
    doc["power"]       = roundTo(s.power, 1);
    doc["relay_state"] = s.relayOn;
    doc["energy"]      = roundTo(s.energyKWh, 3);
    doc["cost"]        = roundTo(s.cost, 3);
    return write_(doc, out, outLen);
}

size_t BusCodec::encodeRelayStatus(bool relayOn,
                                   CommandIssuer issuer,
                                   const char* reason,
                                   char* out,
                                   size_t outLen) {
    StaticJsonDocument<BUS_JSON_CAPACITY> doc;
    doc["relay_state"] = relayOn;
    doc["issuer"]      = issuerName(issuer);
    doc["reason"]      = reason ? reason : "";
    return write_(doc, out, outLen);
}

size_t BusCodec::encodeRelayControl(const ControlCommand& cmd, char* out, size_t outLen) {
    StaticJsonDocument<BUS_JSON_CAPACITY> doc;
    doc["relay_state"] = cmd.relayOn;
    doc["issuer"]      = issuerName(cmd.issuer);
    if (cmd.reason[0]) doc["reason"] = cmd.reason;
    return write_(doc, out, outLen);
}

size_t BusCodec::encodeMode(OperatingMode mode, char* out, size_t outLen) {
    StaticJsonDocument<BUS_JSON_CAPACITY> doc;
    doc["mode"] = modeName(mode);
    return write_(doc, out, outLen);
}

size_t BusCodec::encodeEnvironment(const EnvironmentReading& env, char* out, size_t outLen) {
    if (!env.valid) return 0;
    StaticJsonDocument<BUS_JSON_CAPACITY> doc;
    doc["temperature"] = roundTo(env.temperatureC, 1);
    doc["humidity"]    = roundTo(env.humidity, 1);
    return write_(doc, out, outLen);
}

size_t BusCodec::encodeThreshold(float powerW, char* out, size_t outLen) {
    StaticJsonDocument<BUS_JSON_CAPACITY> doc;
    doc["power_threshold"] = roundTo(powerW, 1);
    return write_(doc, out, outLen);
}

size_t BusCodec::encodeAnomaly(const AnomalyEvent& ev, char* out, size_t outLen) {
    StaticJsonDocument<BUS_JSON_CAPACITY> doc;
    if (ev.channel == 0) {
        doc["channel"] = static_cast<const char*>(nullptr);
    } else {
        doc["channel"] = ev.channel;
    }
    doc["type"]            = anomalyTypeName(ev.type);
    doc["severity"]        = severityName(ev.severity);
    doc["metric"]          = anomalyMetricName(ev.type);
    doc["value"]           = roundTo(ev.value, 1);
    doc["threshold_value"] = roundTo(ev.threshold, 1);
    doc["message"]         = ev.message;
    doc["action"]          = (ev.action == TriggeredAction::RelayOff) ? "relay_off" : "none";
    doc["target"]          = ev.target;
    return write_(doc, out, outLen);
}

// ============================================================================
// Decoders
// ============================================================================

bool BusCodec::decodeRelayControl(uint8_t channel,
                                  const char* payload,
                                  size_t len,
                                  ControlCommand& out) {
    if (!isValidChannel(channel)) return false;

    StaticJsonDocument<BUS_JSON_CAPACITY> doc;
    if (!parse_(payload, len, doc)) return false;

    bool on = false;
    bool present = false;
    if (!readRelayState_(doc, on, present)) return false;

    CommandIssuer issuer = CommandIssuer::Manual;
    JsonVariantConst iss = static_cast<const JsonDocument&>(doc)["issuer"];
    if (!iss.isNull()) {
        if (!iss.is<const char*>() || !parseIssuer(iss.as<const char*>(), issuer)) {
            return false;
        }
        if (issuer == CommandIssuer::Auto) return false;
    }
    if (issuer == CommandIssuer::Safety && on) return false;

    ControlCommand cmd;
    cmd.channel = channel;
    cmd.relayOn = on;
    cmd.issuer  = issuer;
    JsonVariantConst reason = static_cast<const JsonDocument&>(doc)["reason"];
    if (reason.is<const char*>()) {
        copyReason(cmd.reason, sizeof(cmd.reason), reason.as<const char*>());
    }
    out = cmd;
    return true;
}

bool BusCodec::decodeRelayStatus(const char* payload,
                                 size_t len,
                                 bool& relayOn,
                                 CommandIssuer& issuer) {
    StaticJsonDocument<BUS_JSON_CAPACITY> doc;
    if (!parse_(payload, len, doc)) return false;

    bool on = false;
    bool present = false;
    if (!readRelayState_(doc, on, present)) return false;

    CommandIssuer who = CommandIssuer::Manual;
    JsonVariantConst iss = static_cast<const JsonDocument&>(doc)["issuer"];
    if (iss.is<const char*>() && !parseIssuer(iss.as<const char*>(), who)) {
        who = CommandIssuer::Manual;
    }

    relayOn = on;
    issuer  = who;
    return true;
}

bool BusCodec::decodeMode(const char* payload, size_t len, OperatingMode& out) {
    StaticJsonDocument<BUS_JSON_CAPACITY> doc;
    if (!parse_(payload, len, doc)) return false;

    JsonVariantConst v = static_cast<const JsonDocument&>(doc)["mode"];
    if (!v.is<const char*>()) return false;
    return parseMode(v.as<const char*>(), out);
}

bool BusCodec::decodeTelemetry(uint8_t channel,
                               const char* payload,
                               size_t len,
                               TelemetrySample& out) {
    if (!isValidChannel(channel)) return false;

    StaticJsonDocument<BUS_JSON_CAPACITY> doc;
    if (!parse_(payload, len, doc)) return false;

    TelemetrySample s;
    s.channel = channel;
    if (!readNumber_(doc, "voltage", s.voltage)) return false;
    if (!readNumber_(doc, "current", s.current)) return false;
    if (!readNumber_(doc, "power",   s.power))   return false;

    bool present = false;
    bool on = false;
    if (readRelayState_(doc, on, present)) {
        s.relayOn    = on;
        s.relayKnown = true;
    } else if (present) {
        return false;
    }

    // Optional extensions
    if (!readNumber_(doc, "energy", s.energyKWh)) s.energyKWh = 0.0f;
    if (!readNumber_(doc, "cost",   s.cost))      s.cost      = 0.0f;

    out = s;
    return true;
}

bool BusCodec::decodeEnvironment(const char* payload, size_t len, EnvironmentReading& out) {
    StaticJsonDocument<BUS_JSON_CAPACITY> doc;
    if (!parse_(payload, len, doc)) return false;

    EnvironmentReading env;
    if (!readNumber_(doc, "temperature", env.temperatureC)) return false;
    if (!readNumber_(doc, "humidity", env.humidity)) return false;
    env.valid = true;
    out = env;
    return true;
}

bool BusCodec::decodeThreshold(const char* payload, size_t len, float& powerW) {
    StaticJsonDocument<BUS_JSON_CAPACITY> doc;
    if (!parse_(payload, len, doc)) return false;

    float w = 0.0f;
    if (!readNumber_(doc, "power_threshold", w)) return false;
    if (w <= 0.0f) return false;
    powerW = w;
    return true;
}
