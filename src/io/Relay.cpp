#include <Relay.hpp>

Relay::Relay(uint8_t pin, const char* name)
: _pin(pin),
  _name(name),
  _state(false),
  _mutex(nullptr)
{
}

void Relay::begin() {
    _mutex = xSemaphoreCreateMutex();

    // Level first, then direction: no glitch on the coil.
    write_(false);
    pinMode(_pin, OUTPUT);
    write_(false);
    _state = false;

    DEBUG_PRINTF("[Relay] %s on GPIO%u initialized OFF\n", _name, _pin);
}

bool Relay::set(bool on) {
    if (!lock()) {
        DEBUG_PRINTF("[Relay] %s busy, %s deferred\n", _name, on ? "ON" : "OFF");
        return false;
    }

    const bool changed = (_state != on);
    write_(on);
    _state = on;
    unlock();

    if (changed) DEBUG_PRINTF("[Relay] %s -> %s\n", _name, on ? "ON" : "OFF");
    return true;
}

bool Relay::isOn() const {
    bool current = _state;
    if (lock()) {
        current = _state;
        unlock();
    }
    return current;
}
