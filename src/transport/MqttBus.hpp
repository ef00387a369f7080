/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef MQTT_BUS_H
#define MQTT_BUS_H

#include <Config.hpp>
#include <WiFi.h>
#include <PubSubClient.h>
#include <functional>
#include <Utils.hpp>
#include <TopicMap.hpp>
#include <ReconnectPolicy.hpp>

#define MQTT_MAX_SUBSCRIPTIONS   12

struct MqttSettings {
    String   ssid;
    String   password;
    String   host           = DEFAULT_MQTT_HOST;
    uint16_t port           = DEFAULT_MQTT_PORT;
    String   user;
    String   pass;
    uint32_t retryMs        = DEFAULT_MQTT_RETRY_MS;
    bool     legacyTopics   = DEFAULT_MQTT_LEGACY_TOPICS;
};

/**
 * MqttBus
 *
 * Wi-Fi station + PubSubClient link for one node, serviced cooperatively from
 * the owner task (no task of its own, so the message handler runs inside
 * loop() on the caller's stack).
 *
 *  - Connects with a retained last-will "offline" on esp32/status/<node>
 *    and publishes a retained "online" once connected.
 *  - Wi-Fi is re-joined first, then the broker, both paced by ReconnectPolicy.
 *  - Subscriptions registered with subscribe() are replayed on every connect.
 *  - publish() while disconnected returns false: nothing is queued.
 */
class MqttBus {
public:
    typedef std::function<void(const char* topic, const char* payload, size_t len)> MessageHandler;
    typedef std::function<void()> ConnectHandler;

    MqttBus();

    bool begin(const MqttSettings& settings, const char* nodeName);
    void loop(uint32_t nowMs);

    bool subscribe(const char* topic);
    bool publish(const char* topic, const char* payload, bool retained = false);

    void onMessage(MessageHandler handler)   { _onMessage = handler; }
    void onConnected(ConnectHandler handler) { _onConnected = handler; }

    bool wifiUp() const;
    bool connected();
    const ReconnectPolicy& policy() const { return _policy; }
    uint32_t publishFailures() const      { return _publishFailures; }

private:
    void serviceWifi_(uint32_t nowMs);
    bool connectBroker_();
    void dispatch_(char* topic, uint8_t* payload, unsigned int length);

    WiFiClient      _net;
    PubSubClient    _client;
    MqttSettings    _settings;
    ReconnectPolicy _policy;

    char            _clientId[40];
    char            _presenceTopic[TOPIC_MAX_LEN];
    const char*     _subs[MQTT_MAX_SUBSCRIPTIONS];
    uint8_t         _subCount;

    bool            _wifiStarted;
    uint32_t        _lastWifiAttemptMs;
    uint32_t        _publishFailures;

    MessageHandler  _onMessage;
    ConnectHandler  _onConnected;
};

#endif // MQTT_BUS_H
