#include <MqttBus.hpp>

MqttBus::MqttBus()
    : _client(_net),
      _subCount(0),
      _wifiStarted(false),
      _lastWifiAttemptMs(0),
      _publishFailures(0)
{
    _clientId[0]      = '\0';
    _presenceTopic[0] = '\0';
}

bool MqttBus::begin(const MqttSettings& settings, const char* nodeName) {
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTLN("#                  Starting MQTT Bus                      #");
    DEBUG_PRINTLN("###########################################################");
    DEBUGGSTOP();

    _settings = settings;
    _policy.setBackoff(settings.retryMs);

    if (!TopicMap::presence(nodeName, _presenceTopic, sizeof(_presenceTopic))) {
        DEBUG_PRINTLN("[Bus] Node name too long for presence topic");
        return false;
    }

    uint8_t mac[6];
    WiFi.macAddress(mac);
    snprintf(_clientId, sizeof(_clientId), "%s-%s-%02X%02X%02X",
             DEVICE_HOSTNAME, nodeName, mac[3], mac[4], mac[5]);

    _client.setServer(_settings.host.c_str(), _settings.port);
    if (!_client.setBufferSize(MQTT_BUFFER_SIZE)) {
        DEBUG_PRINTLN("[Bus] Buffer resize failed, keeping default");
    }
    _client.setKeepAlive(MQTT_KEEPALIVE_S);
    _client.setSocketTimeout(MQTT_SOCKET_TIMEOUT_S);
    _client.setCallback([this](char* topic, uint8_t* payload, unsigned int length) {
        dispatch_(topic, payload, length);
    });

    WiFi.mode(WIFI_STA);
    WiFi.setHostname(DEVICE_HOSTNAME);
    WiFi.setAutoReconnect(true);

    DEBUG_PRINTF("[Bus] Client %s -> %s:%u\n",
                 _clientId, _settings.host.c_str(), _settings.port);
    return true;
}

bool MqttBus::subscribe(const char* topic) {
    if (!topic || _subCount >= MQTT_MAX_SUBSCRIPTIONS) return false;
    _subs[_subCount++] = topic;
    if (_client.connected() && !_client.subscribe(topic)) {
        DEBUG_PRINTF("[Bus] Subscribe failed: %s\n", topic);
        return false;
    }
    return true;
}

bool MqttBus::wifiUp() const {
    return WiFi.status() == WL_CONNECTED;
}

bool MqttBus::connected() {
    return _client.connected();
}

void MqttBus::serviceWifi_(uint32_t nowMs) {
    if (wifiUp()) return;

    if (_wifiStarted && (uint32_t)(nowMs - _lastWifiAttemptMs) < WIFI_RETRY_MS) {
        return;
    }
    _wifiStarted       = true;
    _lastWifiAttemptMs = nowMs;

    if (_settings.ssid.length() == 0) {
        DEBUG_PRINTLN("[Bus] No Wi-Fi SSID configured");
        return;
    }
    DEBUG_PRINTF("[Bus] Joining Wi-Fi '%s'\n", _settings.ssid.c_str());
    WiFi.disconnect();
    WiFi.begin(_settings.ssid.c_str(), _settings.password.c_str());
}

bool MqttBus::connectBroker_() {
    const char* user = _settings.user.length() ? _settings.user.c_str() : nullptr;
    const char* pass = _settings.pass.length() ? _settings.pass.c_str() : nullptr;

    // willQos 1, willRetain true
    if (!_client.connect(_clientId, user, pass,
                         _presenceTopic, 1, true, PRESENCE_OFFLINE)) {
        DEBUG_PRINTF("[Bus] Broker connect failed, state=%d\n", _client.state());
        return false;
    }

    if (!_client.publish(_presenceTopic, PRESENCE_ONLINE, true)) {
        DEBUG_PRINTLN("[Bus] Presence publish failed");
    }
    for (uint8_t i = 0; i < _subCount; ++i) {
        if (!_client.subscribe(_subs[i])) {
            DEBUG_PRINTF("[Bus] Subscribe failed: %s\n", _subs[i]);
        }
    }
    return true;
}

void MqttBus::loop(uint32_t nowMs) {
    serviceWifi_(nowMs);

    if (_client.connected()) {
        _client.loop();
        return;
    }

    if (_policy.connected()) {
        _policy.onDisconnected(nowMs);
        DEBUG_PRINTLN("[Bus] Broker link lost");
    }
    if (!wifiUp() || !_policy.shouldAttempt(nowMs)) return;

    _policy.onAttempt(nowMs);
    if (connectBroker_()) {
        _policy.onConnected();
        DEBUG_PRINTF("[Bus] Connected (reconnects=%lu)\n",
                     static_cast<unsigned long>(_policy.reconnects()));
        if (_onConnected) _onConnected();
    }
}

bool MqttBus::publish(const char* topic, const char* payload, bool retained) {
    if (!topic || !payload) return false;
    if (!_client.connected() || !_client.publish(topic, payload, retained)) {
        _publishFailures++;
        return false;
    }
    return true;
}

void MqttBus::dispatch_(char* topic, uint8_t* payload, unsigned int length) {
    if (!_onMessage) return;
    _onMessage(topic, reinterpret_cast<const char*>(payload), length);
}
