/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SETTINGS_LOADER_H
#define SETTINGS_LOADER_H

#include <NVSManager.hpp>
#include <LoadMeter.hpp>
#include <RelayControlLoop.hpp>
#include <MqttBus.hpp>

/*
 * SettingsLoader
 *
 * Reads CONF into the plain structs the portable core consumes. Non-finite
 * or out-of-range values fall back to the DEFAULT_* macro and are reported
 * once on the console; the core's own configure() clamps again.
 */
namespace SettingsLoader {
    void loadMeter(MeterConfig& out);
    void loadControlLoop(ControlLoopConfig& out);
    void loadThresholds(ThresholdConfig& out);
    void loadMqtt(MqttSettings& out);

    float         tariff();
    uint8_t       dhtRetries();
    uint32_t      envPeriodMs();
    uint32_t      detectorPeriodMs();
    uint32_t      cacheTtlMs();
    int32_t       utcOffsetMinutes();

    OperatingMode loadMode();
    bool          saveMode(OperatingMode mode);

    bool          saveFixedCeiling(uint8_t channel, float powerW);
}

#endif // SETTINGS_LOADER_H
