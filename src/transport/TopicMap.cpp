#include <TopicMap.hpp>
#include <stdio.h>
#include <string.h>

namespace {

struct TopicEntry {
    const char* topic;
    TopicKind   kind;
    uint8_t     channel;
};

const TopicEntry kTopics[] = {
    { TOPIC_HEATER_DATA,      TopicKind::Telemetry,      1 },
    { TOPIC_FAN_DATA,         TopicKind::Telemetry,      2 },
    { TOPIC_LOAD1_DATA,       TopicKind::Telemetry,      1 },
    { TOPIC_LOAD2_DATA,       TopicKind::Telemetry,      2 },
    { TOPIC_RELAY1_CONTROL,   TopicKind::RelayControl,   1 },
    { TOPIC_RELAY2_CONTROL,   TopicKind::RelayControl,   2 },
    { TOPIC_RELAY1_STATUS,    TopicKind::RelayStatus,    1 },
    { TOPIC_RELAY2_STATUS,    TopicKind::RelayStatus,    2 },
    { TOPIC_RELAY1_THRESHOLD, TopicKind::RelayThreshold, 1 },
    { TOPIC_RELAY2_THRESHOLD, TopicKind::RelayThreshold, 2 },
    { TOPIC_MODE_CONTROL,     TopicKind::ModeControl,    0 },
    { TOPIC_MODE_STATUS,      TopicKind::ModeStatus,     0 },
    { TOPIC_ENV_DATA,         TopicKind::Environment,    0 },
    { TOPIC_ENV_DATA_ALIAS,   TopicKind::Environment,    0 },
    { TOPIC_ALERTS,           TopicKind::Alerts,         0 },
};

const char* pick_(uint8_t channel, const char* ch1, const char* ch2) {
    if (channel == 1) return ch1;
    if (channel == 2) return ch2;
    return nullptr;
}

} // namespace

const char* TopicMap::telemetry(uint8_t channel) {
    return pick_(channel, TOPIC_HEATER_DATA, TOPIC_FAN_DATA);
}

const char* TopicMap::legacyTelemetry(uint8_t channel) {
    return pick_(channel, TOPIC_LOAD1_DATA, TOPIC_LOAD2_DATA);
}

const char* TopicMap::relayControl(uint8_t channel) {
    return pick_(channel, TOPIC_RELAY1_CONTROL, TOPIC_RELAY2_CONTROL);
}

const char* TopicMap::relayStatus(uint8_t channel) {
    return pick_(channel, TOPIC_RELAY1_STATUS, TOPIC_RELAY2_STATUS);
}

const char* TopicMap::relayThreshold(uint8_t channel) {
    return pick_(channel, TOPIC_RELAY1_THRESHOLD, TOPIC_RELAY2_THRESHOLD);
}

bool TopicMap::presence(const char* node, char* out, size_t outLen) {
    if (!node || !*node || !out || outLen == 0) return false;
    const int n = snprintf(out, outLen, "%s%s", TOPIC_PRESENCE_PREFIX, node);
    return n > 0 && static_cast<size_t>(n) < outLen;
}

TopicMatch TopicMap::classify(const char* topic) {
    TopicMatch m;
    if (!topic) return m;

    for (const TopicEntry& e : kTopics) {
        if (strcmp(topic, e.topic) == 0) {
            m.kind    = e.kind;
            m.channel = e.channel;
            return m;
        }
    }

    const size_t prefixLen = strlen(TOPIC_PRESENCE_PREFIX);
    if (strncmp(topic, TOPIC_PRESENCE_PREFIX, prefixLen) == 0 && topic[prefixLen] != '\0') {
        m.kind = TopicKind::Presence;
    }
    return m;
}
