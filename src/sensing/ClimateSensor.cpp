#include <ClimateSensor.hpp>

ClimateSensor::ClimateSensor()
: _dht(DHT_DATA_PIN, DHT_SENSOR_TYPE),
  _retries(DEFAULT_DHT_RETRIES),
  _lastReadMs(0),
  _everRead(false),
  _failures(0)
{
}

void ClimateSensor::begin(uint8_t retries) {
    _retries = (retries == 0) ? 1 : retries;
    _dht.begin();
    DEBUG_PRINTF("[DHT] DHT11 on GPIO%d, %u attempts per read\n", DHT_DATA_PIN, _retries);
}

bool ClimateSensor::read(EnvironmentReading& out) {
    const unsigned long now = millis();
    if (_everRead && (now - _lastReadMs) < DHT_MIN_INTERVAL_MS) {
        out = _last;
        return _last.valid;
    }
    _everRead   = true;
    _lastReadMs = now;

    for (uint8_t attempt = 0; attempt < _retries; ++attempt) {
        const float h = _dht.readHumidity();
        const float t = _dht.readTemperature();
        if (!isnan(h) && !isnan(t)) {
            _last.temperatureC = t;
            _last.humidity     = h;
            _last.valid        = true;
            out = _last;
            return true;
        }
        if (attempt + 1 < _retries) {
            vTaskDelay(pdMS_TO_TICKS(DHT_RETRY_DELAY_MS));
        }
    }

    ++_failures;
    _last.valid = false;
    out = _last;
    DEBUG_PRINTF("[DHT] Read failed after %u attempts (total failures %lu)\n",
                 _retries, (unsigned long)_failures);
    return false;
}
