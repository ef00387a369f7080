#include <WatchdogNode.hpp>

WatchdogNode* WatchdogNode::instance = nullptr;

void WatchdogNode::Init() {
    if (!instance) {
        instance = new WatchdogNode();
    }
}

WatchdogNode* WatchdogNode::Get() {
    return instance;
}

WatchdogNode::WatchdogNode()
: _peaks(&_peakStore),
  _periodMs(DEFAULT_DETECTOR_PERIOD_MS),
  _lastDetectorMs(0),
  _lastNtpMs(0),
  _dropped(0),
  _timeSynced(false),
  _taskHandle(nullptr)
{
}

bool WatchdogNode::begin() {
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTLN("#                Starting LoadGuard Watchdog              #");
    DEBUG_PRINTLN("###########################################################");

    ThresholdConfig thr;
    SettingsLoader::loadThresholds(thr);
    _detector.configure(thr);

    _periodMs = SettingsLoader::detectorPeriodMs();
    _cache.setTtl(SettingsLoader::cacheTtlMs());
    _peaks.setUtcOffsetMinutes(SettingsLoader::utcOffsetMinutes());

    if (!_peaks.begin(trustedEpoch_())) {
        DEBUG_PRINTLN("[Watchdog] No stored peaks, starting empty");
    }

    DEBUG_PRINTF("[Watchdog] Fixed ceilings    : %.1f W / %.1f W\n",
                 _detector.config().fixedPowerCeilingW[0],
                 _detector.config().fixedPowerCeilingW[1]);
    DEBUG_PRINTF("[Watchdog] Dynamic ratios    : P %.2f  V %.2f\n",
                 _detector.config().dynamicPowerRatio,
                 _detector.config().dynamicVoltageRatio);
    DEBUG_PRINTF("[Watchdog] System cap        : %.1f W\n", _detector.config().systemPowerCapW);
    DEBUG_PRINTF("[Watchdog] Period / TTL      : %lu ms / %lu ms\n",
                 (unsigned long)_periodMs, (unsigned long)_cache.ttl());
    DEBUG_PRINTF("[Watchdog] Peaks day %ld     : %.1f W / %.1f W\n",
                 (long)_peaks.currentDay(),
                 _peaks.todayPeakPower(1), _peaks.todayPeakPower(2));

    if (!_journal.begin()) {
        DEBUG_PRINTLN("[Watchdog] Journal unavailable, events are only published");
    }
    DEBUGGSTOP();

    MqttSettings mqtt;
    SettingsLoader::loadMqtt(mqtt);

    _bus.onMessage([this](const char* topic, const char* payload, size_t len) {
        onBusMessage_(topic, payload, len);
    });

    static const char* const kTopics[] = {
        TOPIC_HEATER_DATA, TOPIC_FAN_DATA,
        TOPIC_LOAD1_DATA,  TOPIC_LOAD2_DATA,
        TOPIC_RELAY1_STATUS, TOPIC_RELAY2_STATUS,
        TOPIC_RELAY1_THRESHOLD, TOPIC_RELAY2_THRESHOLD,
    };
    for (size_t i = 0; i < sizeof(kTopics) / sizeof(kTopics[0]); ++i) {
        if (!_bus.subscribe(kTopics[i])) {
            DEBUG_PRINTF("[Watchdog] Cannot subscribe %s\n", kTopics[i]);
        }
    }

    if (!_bus.begin(mqtt, WATCHDOG_NODE_NAME)) {
        DEBUG_PRINTLN("[Watchdog] Bus init failed, running offline");
    }

    BaseType_t ok = xTaskCreatePinnedToCore(
        WatchdogNode::watchdogTaskWrapper,
        "Watchdog",
        WATCHDOG_TASK_STACK_SIZE,
        this,
        WATCHDOG_TASK_PRIORITY,
        &_taskHandle,
        WATCHDOG_TASK_CORE
    );

    if (ok != pdPASS) {
        _taskHandle = nullptr;
        DEBUG_PRINTLN("[Watchdog] Failed to create Watchdog task");
        return false;
    }
    if (!_journal.recordInfo("watchdog started")) {
        DEBUG_PRINTLN("[Watchdog] Journal write failed");
    }
    return true;
}

void WatchdogNode::watchdogTaskWrapper(void* param) {
    WatchdogNode* self = static_cast<WatchdogNode*>(param);
    if (self) {
        self->watchdogTask();
    }
    vTaskDelete(nullptr);
}

void WatchdogNode::watchdogTask() {
    _lastDetectorMs = millis();
    for (;;) {
        const uint32_t now = millis();
        _bus.loop(now);

        if (!_timeSynced && _bus.wifiUp() &&
            (_lastNtpMs == 0 || (uint32_t)(now - _lastNtpMs) >= WIFI_RETRY_MS)) {
            _lastNtpMs  = (now == 0) ? 1 : now;
            _timeSynced = RTC->syncFromNtp();
        }

        if ((uint32_t)(now - _lastDetectorMs) >= _periodMs) {
            _lastDetectorMs = now;
            runDetector_(now);
        }

        vTaskDelay(pdMS_TO_TICKS(WATCHDOG_LOOP_DELAY_MS));
    }
}

uint32_t WatchdogNode::trustedEpoch_() {
    // 0 keeps the peaks on hold until NTP confirms the date.
    return RTC->isSynced() ? (uint32_t)RTC->getUnixTime() : 0;
}

// ============================================================================
// Inbound
// ============================================================================

void WatchdogNode::onBusMessage_(const char* topic, const char* payload, size_t len) {
    const TopicMatch m = TopicMap::classify(topic);
    const uint32_t now = millis();

    switch (m.kind) {
    case TopicKind::Telemetry:      handleTelemetry_(m.channel, payload, len, now); break;
    case TopicKind::RelayStatus:    handleRelayStatus_(m.channel, payload, len, now); break;
    case TopicKind::RelayThreshold: handleThreshold_(m.channel, payload, len); break;
    default: break;
    }
}

void WatchdogNode::handleTelemetry_(uint8_t channel, const char* payload, size_t len, uint32_t nowMs) {
    TelemetrySample s;
    if (!BusCodec::decodeTelemetry(channel, payload, len, s)) {
        ++_dropped;
        DEBUG_PRINTF("[Bus] dropped malformed telemetry for CH%u (%lu total)\n",
                     channel, (unsigned long)_dropped);
        return;
    }
    if (!_cache.store(s, nowMs)) return;

    if (_peaks.observe(channel, s.power, s.voltage, trustedEpoch_())) {
        DEBUG_PRINTF("[Peaks] CH%u new peak %.1f W / %.1f V\n",
                     channel, _peaks.todayPeakPower(channel), _peaks.todayPeakVoltage(channel));
    }
}

void WatchdogNode::handleRelayStatus_(uint8_t channel, const char* payload, size_t len, uint32_t nowMs) {
    bool on = false;
    CommandIssuer issuer = CommandIssuer::Manual;
    if (!BusCodec::decodeRelayStatus(payload, len, on, issuer)) {
        DEBUG_PRINTF("[Bus] dropped malformed relay status for CH%u\n", channel);
        return;
    }

    bool prevOn = false;
    CommandIssuer prevIssuer = CommandIssuer::Manual;
    const bool known = _cache.relayStatus(channel, prevOn, prevIssuer);
    if (!_cache.storeRelayStatus(channel, on, issuer, nowMs)) return;

    // Journal safety cutoffs confirmed by the controller, once per transition.
    if (issuer == CommandIssuer::Safety && !on &&
        (!known || prevOn || prevIssuer != CommandIssuer::Safety)) {
        if (!_journal.recordRelayChange(channel, on, issuer, "confirmed by controller")) {
            DEBUG_PRINTLN("[Watchdog] Journal write failed");
        }
    }
}

void WatchdogNode::handleThreshold_(uint8_t channel, const char* payload, size_t len) {
    float powerW = 0.0f;
    if (!BusCodec::decodeThreshold(payload, len, powerW)) {
        DEBUG_PRINTF("[Bus] dropped malformed threshold for CH%u\n", channel);
        return;
    }
    if (!_detector.setFixedCeiling(channel, powerW)) {
        DEBUG_PRINTF("[Watchdog] CH%u threshold %.1f W rejected\n", channel, powerW);
        return;
    }
    if (!SettingsLoader::saveFixedCeiling(channel, powerW)) {
        DEBUG_PRINTF("[Watchdog] CH%u threshold not persisted\n", channel);
    }

    char msg[64];
    snprintf(msg, sizeof(msg), "CH%u fixed power ceiling set to %.1f W", channel, powerW);
    DEBUG_PRINTF("[Watchdog] %s\n", msg);
    if (!_journal.recordInfo(msg)) {
        DEBUG_PRINTLN("[Watchdog] Journal write failed");
    }
}

// ============================================================================
// Detector tick
// ============================================================================

void WatchdogNode::runDetector_(uint32_t nowMs) {
    if (_peaks.rollover(trustedEpoch_())) {
        DEBUG_PRINTF("[Peaks] New day %ld, peaks reset\n", (long)_peaks.currentDay());
    }

    DetectorReport report;
    _detector.evaluate(_cache, _peaks, nowMs, report);

    for (uint8_t i = 0; i < report.eventCount; ++i) {
        const AnomalyEvent& ev = report.events[i];
        DEBUG_PRINTF("[Anomaly] %s: %s\n", severityName(ev.severity), ev.message);
        publishAlert_(ev);
        if (!_journal.recordAnomaly(ev)) {
            DEBUG_PRINTLN("[Watchdog] Journal write failed");
        }
    }

    for (uint8_t i = 0; i < report.commandCount; ++i) {
        const ControlCommand& cmd = report.commands[i];
        publishCommand_(cmd);
        if (!_journal.recordRelayChange(cmd.channel, cmd.relayOn, cmd.issuer, cmd.reason)) {
            DEBUG_PRINTLN("[Watchdog] Journal write failed");
        }
    }

    if (_peaks.dirty() && !_peaks.flush()) {
        DEBUG_PRINTLN("[Peaks] Persist failed, will retry");
    }
    RTC->persistIfDue(nowMs);
}

void WatchdogNode::publishCommand_(const ControlCommand& cmd) {
    char buf[BUS_PAYLOAD_MAX];
    if (BusCodec::encodeRelayControl(cmd, buf, sizeof(buf)) == 0) {
        DEBUG_PRINTF("[Bus] CH%u command encode failed\n", cmd.channel);
        return;
    }
    if (!_bus.publish(TopicMap::relayControl(cmd.channel), buf)) {
        DEBUG_PRINTF("[Watchdog] CH%u OFF not delivered, retry next tick\n", cmd.channel);
        return;
    }
    DEBUG_PRINTF("[Watchdog] CH%u OFF sent: %s\n", cmd.channel, cmd.reason);
}

void WatchdogNode::publishAlert_(const AnomalyEvent& ev) {
    char buf[BUS_PAYLOAD_MAX];
    if (BusCodec::encodeAnomaly(ev, buf, sizeof(buf)) == 0) {
        DEBUG_PRINTLN("[Bus] alert encode failed");
        return;
    }
    _bus.publish(TOPIC_ALERTS, buf);
}
