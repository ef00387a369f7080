/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef RELAY_H
#define RELAY_H

#include <Config.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/semphr.h>
#include <Utils.hpp>

/*
 * Relay
 *
 * One load relay on a GPIO. RELAY_ACTIVE_LOW selects the coil polarity.
 * begin() forces OFF before anything else can drive the pin.
 *
 * set() returns false only when the mutex could not be taken; the caller
 * keeps its own logical state and retries on the next tick.
 */
class Relay {
public:
    Relay(uint8_t pin, const char* name);

    void begin();
    bool set(bool on);
    bool isOn() const;
    const char* name() const { return _name; }

private:
    inline bool lock() const {
        if (_mutex == nullptr) return false;
        return (xSemaphoreTake(_mutex, pdMS_TO_TICKS(10)) == pdTRUE);
    }

    inline void unlock() const {
        if (_mutex) {
            xSemaphoreGive(_mutex);
        }
    }

    inline void write_(bool on) {
        digitalWrite(_pin, (on != RELAY_ACTIVE_LOW) ? HIGH : LOW);
    }

    uint8_t     _pin;
    const char* _name;
    bool        _state;
    mutable SemaphoreHandle_t _mutex;
};

#endif // RELAY_H
