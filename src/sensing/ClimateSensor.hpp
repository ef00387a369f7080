/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CLIMATE_SENSOR_H
#define CLIMATE_SENSOR_H

#include <Config.hpp>
#include <ControlTypes.hpp>
#include <Utils.hpp>
#include <DHT.h>

/**
 * @brief DHT11 ambient temperature / humidity sensor.
 *
 * read() retries up to the configured count with DHT_RETRY_DELAY_MS between
 * attempts. Calls closer than DHT_MIN_INTERVAL_MS return the cached reading.
 * A reading with valid == false means the sensor is absent or failing;
 * the control loop treats that as "no climate data".
 */
class ClimateSensor {
public:
    ClimateSensor();

    void begin(uint8_t retries);
    bool read(EnvironmentReading& out);

    const EnvironmentReading& last() const { return _last; }
    uint32_t failures() const { return _failures; }

private:
    DHT                _dht;
    uint8_t            _retries;
    EnvironmentReading _last;
    unsigned long      _lastReadMs;
    bool               _everRead;
    uint32_t           _failures;
};

#endif // CLIMATE_SENSOR_H
