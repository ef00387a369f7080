/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef BUS_CODEC_H
#define BUS_CODEC_H

#include <stddef.h>
#include <stdint.h>
#include <ControlTypes.hpp>

/**
 * @file BusCodec.hpp
 * @brief JSON payloads exchanged on the bus (ArduinoJson v6).
 *
 * Every payload is a complete state snapshot, never a delta.
 *
 * Outbound shapes:
 *   telemetry     {voltage(1dp), current(3dp), power(1dp), relay_state,
 *                  energy(kWh,3dp), cost(3dp)}
 *   relay status  {relay_state, issuer, reason}
 *   relay control {relay_state, issuer[, reason]}
 *   mode          {mode: "auto"|"manual"}
 *   environment   {temperature(1dp), humidity(1dp)}
 *   threshold     {power_threshold}
 *   alert         {channel|null, type, severity, metric, value,
 *                  threshold_value, message, action, target}
 *
 * Inbound relay payloads are normalized here, before anything reaches the
 * control loop. Accepted state fields: relay_state, state, relay, on.
 * Accepted values: true/false, 1/0, "ON"/"OFF", "true"/"false", "1"/"0"
 * (strings case-insensitive). Decoders return false on anything else and
 * leave the output untouched.
 */

#define BUS_JSON_CAPACITY      512
#define BUS_PAYLOAD_MAX        384

class BusCodec {
public:
    // ---- Encoders: bytes written, 0 when the buffer is too small ----
    static size_t encodeTelemetry(const TelemetrySample& s, char* out, size_t outLen);
    static size_t encodeRelayStatus(bool relayOn,
                                    CommandIssuer issuer,
                                    const char* reason,
                                    char* out,
                                    size_t outLen);
    static size_t encodeRelayControl(const ControlCommand& cmd, char* out, size_t outLen);
    static size_t encodeMode(OperatingMode mode, char* out, size_t outLen);
    static size_t encodeEnvironment(const EnvironmentReading& env, char* out, size_t outLen);
    static size_t encodeThreshold(float powerW, char* out, size_t outLen);
    static size_t encodeAnomaly(const AnomalyEvent& ev, char* out, size_t outLen);

    // ---- Decoders ----
    static bool decodeRelayControl(uint8_t channel,
                                   const char* payload,
                                   size_t len,
                                   ControlCommand& out);
    static bool decodeRelayStatus(const char* payload,
                                  size_t len,
                                  bool& relayOn,
                                  CommandIssuer& issuer);
    static bool decodeMode(const char* payload, size_t len, OperatingMode& out);
    static bool decodeTelemetry(uint8_t channel,
                                const char* payload,
                                size_t len,
                                TelemetrySample& out);
    static bool decodeEnvironment(const char* payload, size_t len, EnvironmentReading& out);
    static bool decodeThreshold(const char* payload, size_t len, float& powerW);

    // Round half away from zero to @p decimals places.
    static double roundTo(double v, uint8_t decimals);
};

#endif // BUS_CODEC_H
