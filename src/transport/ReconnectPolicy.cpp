#include <ReconnectPolicy.hpp>

#define RECONNECT_MIN_BACKOFF_MS   250

ReconnectPolicy::ReconnectPolicy(uint32_t backoffMs)
    : _backoffMs(DEFAULT_MQTT_RETRY_MS),
      _connected(false),
      _everConnected(false),
      _attempted(false),
      _lastAttemptMs(0),
      _lostAtMs(0),
      _attempts(0),
      _reconnects(0)
{
    setBackoff(backoffMs);
}

void ReconnectPolicy::setBackoff(uint32_t backoffMs) {
    if (backoffMs < RECONNECT_MIN_BACKOFF_MS) backoffMs = RECONNECT_MIN_BACKOFF_MS;
    _backoffMs = backoffMs;
}

bool ReconnectPolicy::shouldAttempt(uint32_t nowMs) const {
    if (_connected) return false;
    if (!_attempted) return true;
    return (uint32_t)(nowMs - _lastAttemptMs) >= _backoffMs;
}

void ReconnectPolicy::onAttempt(uint32_t nowMs) {
    _attempted     = true;
    _lastAttemptMs = nowMs;
    _attempts++;
}

void ReconnectPolicy::onConnected() {
    if (_everConnected && !_connected) _reconnects++;
    _connected     = true;
    _everConnected = true;
    _attempted     = false;
    _attempts      = 0;
}

void ReconnectPolicy::onDisconnected(uint32_t nowMs) {
    if (!_connected) return;
    _connected = false;
    _attempted = false;
    _attempts  = 0;
    _lostAtMs  = nowMs;
}

uint32_t ReconnectPolicy::outageMs(uint32_t nowMs) const {
    if (_connected || !_everConnected) return 0;
    return nowMs - _lostAtMs;
}
