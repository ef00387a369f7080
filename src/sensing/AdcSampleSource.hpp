/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef ADC_SAMPLE_SOURCE_H
#define ADC_SAMPLE_SOURCE_H

#include <Config.hpp>
#include <SampleSource.hpp>
#include <Utils.hpp>

/**
 * @brief ESP32 ADC1 implementation of SampleSource.
 *
 * Both channels sit on ADC1 pins so sampling keeps working while the radio
 * is up. Pacing is a micros() deadline advanced by the period, so one late
 * slot does not shift the whole window.
 */
class AdcSampleSource : public SampleSource {
public:
    AdcSampleSource();

    void begin();

    bool read(uint8_t channel, int32_t& voltageRaw, int32_t& currentRaw) override;
    void waitNextSample(uint32_t periodUs) override;
    int32_t fullScale() const override { return ADC_FULL_SCALE; }

private:
    static bool inRange_(int32_t raw) { return raw >= 0 && raw <= ADC_FULL_SCALE; }

    uint32_t _nextSlotUs;
    bool     _armed;
};

#endif // ADC_SAMPLE_SOURCE_H
