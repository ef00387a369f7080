#include <AdcSampleSource.hpp>

AdcSampleSource::AdcSampleSource()
: _nextSlotUs(0),
  _armed(false)
{
}

void AdcSampleSource::begin() {
    analogReadResolution(ADC_RESOLUTION_BITS);
    analogSetAttenuation(ADC_11db);

    pinMode(CH1_VOLTAGE_ADC_PIN, INPUT);
    pinMode(CH1_CURRENT_ADC_PIN, INPUT);
    pinMode(CH2_VOLTAGE_ADC_PIN, INPUT);
    pinMode(CH2_CURRENT_ADC_PIN, INPUT);

    DEBUG_PRINTF("[ADC] CH1 V=GPIO%d I=GPIO%d | CH2 V=GPIO%d I=GPIO%d | %d bits\n",
                 CH1_VOLTAGE_ADC_PIN, CH1_CURRENT_ADC_PIN,
                 CH2_VOLTAGE_ADC_PIN, CH2_CURRENT_ADC_PIN,
                 ADC_RESOLUTION_BITS);
}

bool AdcSampleSource::read(uint8_t channel, int32_t& voltageRaw, int32_t& currentRaw) {
    int32_t v = 0;
    int32_t i = 0;
    if (channel == 1) {
        v = analogRead(CH1_VOLTAGE_ADC_PIN);
        i = analogRead(CH1_CURRENT_ADC_PIN);
    } else if (channel == 2) {
        v = analogRead(CH2_VOLTAGE_ADC_PIN);
        i = analogRead(CH2_CURRENT_ADC_PIN);
    } else {
        return false;
    }

    if (!inRange_(v) || !inRange_(i)) return false;
    voltageRaw = v;
    currentRaw = i;
    return true;
}

void AdcSampleSource::waitNextSample(uint32_t periodUs) {
    const uint32_t now = micros();
    if (!_armed) {
        _nextSlotUs = now + periodUs;
        _armed = true;
        return;
    }

    // Too far behind (task was preempted for a whole slot): resync.
    if ((int32_t)(now - _nextSlotUs) > (int32_t)periodUs) {
        _nextSlotUs = now + periodUs;
        return;
    }

    while ((int32_t)(micros() - _nextSlotUs) < 0) {
        // busy wait, sub-millisecond slots
    }
    _nextSlotUs += periodUs;
}
