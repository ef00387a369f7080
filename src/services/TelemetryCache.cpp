#include <TelemetryCache.hpp>

TelemetryCache::TelemetryCache(uint32_t ttlMs)
    : _ttlMs(ttlMs)
{
    if (_ttlMs == 0) _ttlMs = DEFAULT_CACHE_TTL_MS;
}

void TelemetryCache::setTtl(uint32_t ttlMs) {
    _ttlMs = (ttlMs == 0) ? DEFAULT_CACHE_TTL_MS : ttlMs;
}

bool TelemetryCache::store(const TelemetrySample& sample, uint32_t nowMs) {
    if (!isValidChannel(sample.channel)) return false;
    Entry& e = _entries[sample.channel - 1];

    e.sample = sample;
    if (!sample.relayKnown && e.hasStatus) {
        e.sample.relayOn    = e.statusOn;
        e.sample.relayKnown = true;
    }
    e.hasSample  = true;
    e.sampleAtMs = nowMs;
    return true;
}

bool TelemetryCache::storeRelayStatus(uint8_t channel,
                                      bool relayOn,
                                      CommandIssuer issuer,
                                      uint32_t nowMs) {
    if (!isValidChannel(channel)) return false;
    Entry& e = _entries[channel - 1];

    e.hasStatus    = true;
    e.statusOn     = relayOn;
    e.statusIssuer = issuer;
    e.statusAtMs   = nowMs;

    if (e.hasSample) {
        e.sample.relayOn    = relayOn;
        e.sample.relayKnown = true;
    }
    return true;
}

bool TelemetryCache::latest(uint8_t channel, uint32_t nowMs, TelemetrySample& out) const {
    if (!isValidChannel(channel)) return false;
    const Entry& e = _entries[channel - 1];
    if (!e.hasSample) return false;
    if ((uint32_t)(nowMs - e.sampleAtMs) > _ttlMs) return false;
    out = e.sample;
    return true;
}

bool TelemetryCache::lastKnown(uint8_t channel, TelemetrySample& out) const {
    if (!isValidChannel(channel)) return false;
    const Entry& e = _entries[channel - 1];
    if (!e.hasSample) return false;
    out = e.sample;
    return true;
}

bool TelemetryCache::relayStatus(uint8_t channel, bool& relayOn, CommandIssuer& issuer) const {
    if (!isValidChannel(channel)) return false;
    const Entry& e = _entries[channel - 1];
    if (!e.hasStatus) return false;
    relayOn = e.statusOn;
    issuer  = e.statusIssuer;
    return true;
}

uint32_t TelemetryCache::ageMs(uint8_t channel, uint32_t nowMs) const {
    if (!isValidChannel(channel)) return UINT32_MAX;
    const Entry& e = _entries[channel - 1];
    if (!e.hasSample) return UINT32_MAX;
    return nowMs - e.sampleAtMs;
}

void TelemetryCache::clear() {
    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        _entries[i] = Entry();
    }
}
