#include <EnergyMeter.hpp>
#include <math.h>

EnergyMeter::EnergyMeter()
    : _tariff(DEFAULT_TARIFF)
{
    resetAll();
}

void EnergyMeter::setTariff(float costPerKWh) {
    if (!isfinite(costPerKWh) || costPerKWh < 0.0f) {
        costPerKWh = DEFAULT_TARIFF;
    }
    _tariff = costPerKWh;
}

void EnergyMeter::accumulate(uint8_t channel, float powerW, uint32_t dtMs) {
    if (!isValidChannel(channel)) return;
    if (!isfinite(powerW) || powerW <= 0.0f) return;
    if (dtMs == 0 || dtMs > MAX_STEP_MS) return;

    _energyWh[channel - 1] += static_cast<double>(powerW) * dtMs / 3600000.0;
}

float EnergyMeter::energyKWh(uint8_t channel) const {
    if (!isValidChannel(channel)) return 0.0f;
    return static_cast<float>(_energyWh[channel - 1] / 1000.0);
}

float EnergyMeter::cost(uint8_t channel) const {
    return energyKWh(channel) * _tariff;
}

void EnergyMeter::reset(uint8_t channel) {
    if (!isValidChannel(channel)) return;
    _energyWh[channel - 1] = 0.0;
}

void EnergyMeter::resetAll() {
    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        _energyWh[i] = 0.0;
    }
}
