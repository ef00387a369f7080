/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef TOPIC_MAP_H
#define TOPIC_MAP_H

#include <stddef.h>
#include <stdint.h>
#include <ControlTypes.hpp>

// ==================================================
// MQTT topic layout
// ==================================================
//  Per channel (n = 1 heater, 2 fan):
//    telemetry        esp32/heater/data | esp32/fan/data
//    legacy alias     esp32/load1/data  | esp32/load2/data
//    relay control    esp32/relay<n>/control
//    relay status     esp32/relay<n>/status
//    threshold update esp32/relay<n>/threshold
//  Global:
//    esp32/mode/control, esp32/mode/status
//    esp32/dht11/data (alias esp32/dht/data)
//    esp32/alerts
//    esp32/status/<node>   (retained presence, LWT "offline")
// ==================================================

#define TOPIC_HEATER_DATA          "esp32/heater/data"
#define TOPIC_FAN_DATA             "esp32/fan/data"
#define TOPIC_LOAD1_DATA           "esp32/load1/data"
#define TOPIC_LOAD2_DATA           "esp32/load2/data"
#define TOPIC_RELAY1_CONTROL       "esp32/relay1/control"
#define TOPIC_RELAY2_CONTROL       "esp32/relay2/control"
#define TOPIC_RELAY1_STATUS        "esp32/relay1/status"
#define TOPIC_RELAY2_STATUS        "esp32/relay2/status"
#define TOPIC_RELAY1_THRESHOLD     "esp32/relay1/threshold"
#define TOPIC_RELAY2_THRESHOLD     "esp32/relay2/threshold"
#define TOPIC_MODE_CONTROL         "esp32/mode/control"
#define TOPIC_MODE_STATUS          "esp32/mode/status"
#define TOPIC_ENV_DATA             "esp32/dht11/data"
#define TOPIC_ENV_DATA_ALIAS       "esp32/dht/data"
#define TOPIC_ALERTS               "esp32/alerts"
#define TOPIC_PRESENCE_PREFIX      "esp32/status/"

#define PRESENCE_ONLINE            "online"
#define PRESENCE_OFFLINE           "offline"
#define TOPIC_MAX_LEN              64

enum class TopicKind : uint8_t {
    Unknown = 0,
    Telemetry,
    RelayControl,
    RelayStatus,
    RelayThreshold,
    ModeControl,
    ModeStatus,
    Environment,
    Alerts,
    Presence
};

struct TopicMatch {
    TopicKind kind    = TopicKind::Unknown;
    uint8_t   channel = 0;     // 0 for global topics
};

class TopicMap {
public:
    // nullptr for an invalid channel.
    static const char* telemetry(uint8_t channel);
    static const char* legacyTelemetry(uint8_t channel);
    static const char* relayControl(uint8_t channel);
    static const char* relayStatus(uint8_t channel);
    static const char* relayThreshold(uint8_t channel);

    // esp32/status/<node>; false if it does not fit.
    static bool presence(const char* node, char* out, size_t outLen);

    // Map any known topic (aliases included) to its kind and channel.
    static TopicMatch classify(const char* topic);
};

#endif // TOPIC_MAP_H
