/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SAMPLE_SOURCE_H
#define SAMPLE_SOURCE_H

#include <stdint.h>

/**
 * @brief Raw converter access used by LoadMeter.
 *
 * The firmware implementation reads the ESP32 ADC and paces with micros();
 * host tests script the waveform.
 */
class SampleSource {
public:
    virtual ~SampleSource() {}

    // Raw counts for one channel (1-based). Returns false on a converter error.
    virtual bool read(uint8_t channel, int32_t& voltageRaw, int32_t& currentRaw) = 0;

    // Block until the next sample slot, @p periodUs after the previous slot.
    virtual void waitNextSample(uint32_t periodUs) = 0;

    // Largest valid raw count (4095 for a 12-bit converter).
    virtual int32_t fullScale() const = 0;
};

#endif // SAMPLE_SOURCE_H
