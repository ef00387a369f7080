/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CONTROLLER_NODE_H
#define CONTROLLER_NODE_H

#include <Config.hpp>
#include <Utils.hpp>
#include <NVSManager.hpp>
#include <RTCManager.hpp>
#include <SettingsLoader.hpp>
#include <AdcSampleSource.hpp>
#include <ClimateSensor.hpp>
#include <LoadMeter.hpp>
#include <EnergyMeter.hpp>
#include <CommandInbox.hpp>
#include <RelayControlLoop.hpp>
#include <Relay.hpp>
#include <MqttBus.hpp>
#include <BusCodec.hpp>
#include <TopicMap.hpp>

/**
 * ControllerNode
 *
 * Owns the sensors, both relays and the control loop. A single task runs:
 *
 *   measure window -> integrate energy -> service bus (commands land in the
 *   inbox) -> read climate when due -> tick -> drive relays -> publish
 *
 * Bus callbacks execute inside MqttBus::loop(), i.e. on this task, so the
 * inbox and the loop state are never touched concurrently.
 */
class ControllerNode {
public:
    static void            Init();
    static ControllerNode* Get();

    bool begin();

private:
    ControllerNode();

    static void controlTaskWrapper(void* param);
    void controlTask();
    void runCycle_();

    void onBusMessage_(const char* topic, const char* payload, size_t len);
    void onBusConnected_();

    void updateClimate_(uint32_t nowMs);
    void applyTick_(const TickResult& res);

    void publishRelayStatus_(uint8_t channel);
    void publishMode_();
    void publishAlert_(const AnomalyEvent& ev);
    void publishTelemetry_();
    void publishEnvironment_();

    Relay& relay_(uint8_t channel) { return (channel == 1) ? _relay1 : _relay2; }

    static ControllerNode* instance;

    AdcSampleSource    _adc;
    LoadMeter          _meter;
    EnergyMeter        _energy;
    ClimateSensor      _climate;
    Relay              _relay1;
    Relay              _relay2;
    CommandInbox       _inbox;
    RelayControlLoop   _loop;
    MqttBus            _bus;

    OperatingMode      _mode;
    Climate            _loggedClimate;
    EnvironmentReading _env;
    uint32_t           _envPeriodMs;

    CommandIssuer      _statusIssuer[LOAD_CHANNEL_COUNT];
    char               _statusReason[LOAD_CHANNEL_COUNT][REASON_MAX_LEN];
    uint32_t           _lastFaults[LOAD_CHANNEL_COUNT];

    uint32_t           _lastWindowMs;
    uint32_t           _lastEnvMs;
    uint32_t           _lastTelemetryMs;
    uint32_t           _lastStatusMs;
    uint32_t           _lastNtpMs;
    bool               _envDue;
    bool               _statusDue;
    bool               _timeSynced;
    bool               _legacyTopics;

    TaskHandle_t       _taskHandle;
};

#define CONTROLLER ControllerNode::Get()

#endif // CONTROLLER_NODE_H
