/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef ENERGY_METER_H
#define ENERGY_METER_H

#include <stdint.h>
#include <ControlTypes.hpp>

// Cumulative energy per channel, integrated from filtered power.
class EnergyMeter {
public:
    // Gaps longer than this are not integrated (stalled loop, clock jump).
    static constexpr uint32_t MAX_STEP_MS = 60000;

    EnergyMeter();

    void setTariff(float costPerKWh);
    float tariff() const { return _tariff; }

    // Integrate @p powerW over @p dtMs for @p channel (rectangle rule).
    void accumulate(uint8_t channel, float powerW, uint32_t dtMs);

    float energyKWh(uint8_t channel) const;
    float cost(uint8_t channel) const;

    void reset(uint8_t channel);
    void resetAll();

private:
    double _energyWh[LOAD_CHANNEL_COUNT];
    float  _tariff;
};

#endif // ENERGY_METER_H
