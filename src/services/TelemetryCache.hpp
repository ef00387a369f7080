/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef TELEMETRY_CACHE_H
#define TELEMETRY_CACHE_H

#include <ControlTypes.hpp>

/*
 * TelemetryCache
 *
 * Last received telemetry and relay status per channel, as seen by a bus
 * subscriber. Every message replaces the previous snapshot (duplicates are
 * harmless, drops only make the data older).
 *
 *   latest()     : snapshot younger than the TTL, else nothing
 *   lastKnown()  : snapshot of any age (display / hold-last-value)
 *
 * Telemetry that carries no relay_state inherits the last relay status seen
 * on the status topic, and a status message updates the cached sample's
 * relay flag without refreshing its age.
 */
class TelemetryCache {
public:
    explicit TelemetryCache(uint32_t ttlMs = DEFAULT_CACHE_TTL_MS);

    void     setTtl(uint32_t ttlMs);
    uint32_t ttl() const { return _ttlMs; }

    bool store(const TelemetrySample& sample, uint32_t nowMs);
    bool storeRelayStatus(uint8_t channel, bool relayOn, CommandIssuer issuer, uint32_t nowMs);

    bool latest(uint8_t channel, uint32_t nowMs, TelemetrySample& out) const;
    bool lastKnown(uint8_t channel, TelemetrySample& out) const;
    bool relayStatus(uint8_t channel, bool& relayOn, CommandIssuer& issuer) const;

    // UINT32_MAX when nothing was ever received.
    uint32_t ageMs(uint8_t channel, uint32_t nowMs) const;

    void clear();

private:
    struct Entry {
        TelemetrySample sample;
        bool            hasSample    = false;
        uint32_t        sampleAtMs   = 0;
        bool            hasStatus    = false;
        bool            statusOn     = false;
        CommandIssuer   statusIssuer = CommandIssuer::Manual;
        uint32_t        statusAtMs   = 0;
    };

    uint32_t _ttlMs;
    Entry    _entries[LOAD_CHANNEL_COUNT];
};

#endif // TELEMETRY_CACHE_H
