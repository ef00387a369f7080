/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef RECONNECT_POLICY_H
#define RECONNECT_POLICY_H

#include <stdint.h>
#include <ConfigNVS.hpp>

/*
 * ReconnectPolicy
 *
 * Fixed-backoff retry pacing for one bus link. The first attempt after a loss
 * is immediate, then one attempt every backoffMs until connected. Times are
 * millis() values; all arithmetic is wrap-safe.
 *
 * Nothing is buffered or replayed: after a reconnect traffic resumes from now.
 */
class ReconnectPolicy {
public:
    explicit ReconnectPolicy(uint32_t backoffMs = DEFAULT_MQTT_RETRY_MS);

    void     setBackoff(uint32_t backoffMs);
    uint32_t backoff() const { return _backoffMs; }

    bool shouldAttempt(uint32_t nowMs) const;
    void onAttempt(uint32_t nowMs);
    void onConnected();
    void onDisconnected(uint32_t nowMs);

    bool     connected() const      { return _connected; }
    uint32_t attempts() const       { return _attempts; }   // since the last loss
    uint32_t reconnects() const     { return _reconnects; }
    uint32_t outageMs(uint32_t nowMs) const;

private:
    uint32_t _backoffMs;
    bool     _connected;
    bool     _everConnected;
    bool     _attempted;
    uint32_t _lastAttemptMs;
    uint32_t _lostAtMs;
    uint32_t _attempts;
    uint32_t _reconnects;
};

#endif // RECONNECT_POLICY_H
