/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef WATCHDOG_NODE_H
#define WATCHDOG_NODE_H

#include <Config.hpp>
#include <Utils.hpp>
#include <NVSManager.hpp>
#include <RTCManager.hpp>
#include <SettingsLoader.hpp>
#include <TelemetryCache.hpp>
#include <DailyPeakTracker.hpp>
#include <NvsPeakStore.hpp>
#include <AnomalyDetector.hpp>
#include <EventJournal.hpp>
#include <MqttBus.hpp>
#include <BusCodec.hpp>
#include <TopicMap.hpp>

/**
 * WatchdogNode
 *
 * Independent supervisor. Listens to controller telemetry and relay status,
 * keeps today's peaks, and every detector period evaluates the cache. Trips
 * are sent back as issuer=safety OFF commands on the relay control topics,
 * published on the alert topic and appended to the SPIFFS journal.
 *
 * Everything runs on one task; bus callbacks fire from MqttBus::loop().
 */
class WatchdogNode {
public:
    static void          Init();
    static WatchdogNode* Get();

    bool begin();

private:
    WatchdogNode();

    static void watchdogTaskWrapper(void* param);
    void watchdogTask();

    void onBusMessage_(const char* topic, const char* payload, size_t len);
    void handleTelemetry_(uint8_t channel, const char* payload, size_t len, uint32_t nowMs);
    void handleRelayStatus_(uint8_t channel, const char* payload, size_t len, uint32_t nowMs);
    void handleThreshold_(uint8_t channel, const char* payload, size_t len);

    void runDetector_(uint32_t nowMs);
    static uint32_t trustedEpoch_();
    void publishCommand_(const ControlCommand& cmd);
    void publishAlert_(const AnomalyEvent& ev);

    static WatchdogNode* instance;

    NvsPeakStore      _peakStore;
    DailyPeakTracker  _peaks;
    TelemetryCache    _cache;
    AnomalyDetector   _detector;
    EventJournal      _journal;
    MqttBus           _bus;

    uint32_t          _periodMs;
    uint32_t          _lastDetectorMs;
    uint32_t          _lastNtpMs;
    uint32_t          _dropped;
    bool              _timeSynced;

    TaskHandle_t      _taskHandle;
};

#define WATCHDOG WatchdogNode::Get()

#endif // WATCHDOG_NODE_H
