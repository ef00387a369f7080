#include <ControllerNode.hpp>

ControllerNode* ControllerNode::instance = nullptr;

void ControllerNode::Init() {
    if (!instance) {
        instance = new ControllerNode();
    }
}

ControllerNode* ControllerNode::Get() {
    return instance;
}

ControllerNode::ControllerNode()
: _meter(_adc),
  _relay1(CH1_RELAY_PIN, "relay1"),
  _relay2(CH2_RELAY_PIN, "relay2"),
  _mode(OperatingMode::Auto),
  _loggedClimate(Climate::Unknown),
  _envPeriodMs(DEFAULT_ENV_PERIOD_MS),
  _lastWindowMs(0),
  _lastEnvMs(0),
  _lastTelemetryMs(0),
  _lastStatusMs(0),
  _lastNtpMs(0),
  _envDue(true),
  _statusDue(false),
  _timeSynced(false),
  _legacyTopics(DEFAULT_MQTT_LEGACY_TOPICS),
  _taskHandle(nullptr)
{
    for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
        _statusIssuer[i] = CommandIssuer::Manual;
        copyReason(_statusReason[i], REASON_MAX_LEN, "boot");
        _lastFaults[i] = 0;
    }
}

// ============================================================================
// begin()
//   - Relays OFF first (calibration assumes the loads are off)
//   - Load configuration from NVS
//   - Zero-offset calibration
//   - Bus + control task
// ============================================================================

bool ControllerNode::begin() {
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTLN("#               Starting LoadGuard Controller             #");
    DEBUG_PRINTLN("###########################################################");

    _relay1.begin();
    _relay2.begin();

    MeterConfig meterCfg;
    SettingsLoader::loadMeter(meterCfg);
    _meter.configure(meterCfg);

    ControlLoopConfig loopCfg;
    SettingsLoader::loadControlLoop(loopCfg);
    _loop.configure(loopCfg);

    _energy.setTariff(SettingsLoader::tariff());
    _envPeriodMs = SettingsLoader::envPeriodMs();
    _mode        = SettingsLoader::loadMode();

    DEBUG_PRINTF("[Controller] Mode restored     : %s\n", modeName(_mode));
    DEBUG_PRINTF("[Controller] Auto threshold    : %.1f C\n", loopCfg.autoThresholdC);
    DEBUG_PRINTF("[Controller] Window            : %lu samples @ %lu us\n",
                 (unsigned long)_meter.samplesPerWindow(),
                 (unsigned long)_meter.samplePeriodUs());

    _adc.begin();
    _climate.begin(SettingsLoader::dhtRetries());

    if (!_meter.calibrate()) {
        DEBUG_PRINTLN("[Controller] Calibration incomplete, readings may be biased");
    }
    for (uint8_t ch = 1; ch <= LOAD_CHANNEL_COUNT; ++ch) {
        const ChannelCalibration& cal = _meter.calibration(ch);
        DEBUG_PRINTF("[Controller] CH%u offsets V=%.1f I=%.1f (%s)\n",
                     ch, cal.voltageOffset, cal.currentOffset,
                     cal.valid ? "ok" : "invalid");
    }
    DEBUGGSTOP();

    MqttSettings mqtt;
    SettingsLoader::loadMqtt(mqtt);
    _legacyTopics = mqtt.legacyTopics;

    _bus.onMessage([this](const char* topic, const char* payload, size_t len) {
        onBusMessage_(topic, payload, len);
    });
    _bus.onConnected([this]() { onBusConnected_(); });

    bool subsOk = _bus.subscribe(TOPIC_RELAY1_CONTROL);
    subsOk = _bus.subscribe(TOPIC_RELAY2_CONTROL) && subsOk;
    subsOk = _bus.subscribe(TOPIC_MODE_CONTROL) && subsOk;
    if (!subsOk) {
        DEBUG_PRINTLN("[Controller] Subscription table full");
    }

    if (!_bus.begin(mqtt, CONTROLLER_NODE_NAME)) {
        DEBUG_PRINTLN("[Controller] Bus init failed, running offline");
    }

    BaseType_t ok = xTaskCreatePinnedToCore(
        ControllerNode::controlTaskWrapper,
        "CtrlLoop",
        CONTROL_LOOP_TASK_STACK_SIZE,
        this,
        CONTROL_LOOP_TASK_PRIORITY,
        &_taskHandle,
        CONTROL_LOOP_TASK_CORE
    );

    if (ok != pdPASS) {
        _taskHandle = nullptr;
        DEBUG_PRINTLN("[Controller] Failed to create CtrlLoop");
        return false;
    }
    DEBUG_PRINTLN("[Controller] CtrlLoop started");
    return true;
}

void ControllerNode::controlTaskWrapper(void* param) {
    ControllerNode* self = static_cast<ControllerNode*>(param);
    if (self) {
        self->controlTask();
    }
    vTaskDelete(nullptr);
}

void ControllerNode::controlTask() {
    _lastWindowMs = millis();
    for (;;) {
        runCycle_();
        vTaskDelay(pdMS_TO_TICKS(CONTROL_LOOP_IDLE_DELAY_MS));
    }
}

// ============================================================================
// One control cycle
// ============================================================================

void ControllerNode::runCycle_() {
    _meter.measure();
    uint32_t now = millis();

    const uint32_t dt = now - _lastWindowMs;
    _lastWindowMs = now;

    ControlInputs in;
    for (uint8_t ch = 1; ch <= LOAD_CHANNEL_COUNT; ++ch) {
        const uint32_t faults = _meter.faultCount(ch);
        if (faults != _lastFaults[ch - 1]) {
            DEBUG_PRINTF("[Meter] CH%u window discarded (faults %lu)\n",
                         ch, (unsigned long)faults);
            _lastFaults[ch - 1] = faults;
        }

        const LoadReading& r = _meter.reading(ch);
        in.load[ch - 1] = r;
        if (_meter.windowOk(ch)) {
            _energy.accumulate(ch, _loop.relayOn(ch) ? r.power : 0.0f, dt);
        }
    }

    _bus.loop(now);

    if (!_timeSynced && _bus.wifiUp() &&
        (_lastNtpMs == 0 || (uint32_t)(now - _lastNtpMs) >= WIFI_RETRY_MS)) {
        _lastNtpMs  = (now == 0) ? 1 : now;
        _timeSynced = RTC->syncFromNtp();
    }
    RTC->persistIfDue(now);

    updateClimate_(now);
    in.env = _env;

    TickResult res;
    const OperatingMode next = _loop.tick(_mode, _inbox, in, res);
    if (res.modeChanged) {
        DEBUG_PRINTF("[Controller] Mode %s -> %s\n", modeName(_mode), modeName(next));
        _mode = next;
        if (!SettingsLoader::saveMode(_mode)) {
            DEBUG_PRINTLN("[Controller] Failed to persist mode");
        }
        publishMode_();
    }
    if (res.climate != _loggedClimate) {
        DEBUG_PRINTF("[Loop] Climate %s -> %s\n",
                     climateName(_loggedClimate), climateName(res.climate));
        _loggedClimate = res.climate;
    }
    if (res.ignoredManual) {
        DEBUG_PRINTF("[Controller] %u manual command(s) ignored in AUTO\n", res.ignoredManual);
    }

    applyTick_(res);

    now = millis();
    if (_envDue) {
        publishEnvironment_();
        _envDue = false;
    }
    if ((uint32_t)(now - _lastTelemetryMs) >= TELEMETRY_MIN_PERIOD_MS) {
        publishTelemetry_();
        _lastTelemetryMs = now;
    }
    if (_statusDue || (uint32_t)(now - _lastStatusMs) >= STATUS_REFRESH_MS) {
        for (uint8_t ch = 1; ch <= LOAD_CHANNEL_COUNT; ++ch) publishRelayStatus_(ch);
        _statusDue    = false;
        _lastStatusMs = now;
    }
}

void ControllerNode::updateClimate_(uint32_t nowMs) {
    if (_lastEnvMs != 0 && (uint32_t)(nowMs - _lastEnvMs) < _envPeriodMs) return;
    _lastEnvMs = (nowMs == 0) ? 1 : nowMs;

    EnvironmentReading env;
    if (_climate.read(env)) {
        _env    = env;
        _envDue = true;
    } else {
        _env.valid = false;
    }
}

void ControllerNode::applyTick_(const TickResult& res) {
    for (uint8_t i = 0; i < res.transitionCount; ++i) {
        const RelayTransition& t = res.transitions[i];
        const uint8_t idx = t.channel - 1;

        if (!relay_(t.channel).set(t.relayOn)) {
            DEBUG_PRINTF("[Controller] CH%u relay write deferred\n", t.channel);
        }

        // A held safety OFF repeats every window; publish only what is new.
        if (!t.changed && _statusIssuer[idx] == t.issuer) continue;

        _statusIssuer[idx] = t.issuer;
        copyReason(_statusReason[idx], REASON_MAX_LEN, t.reason);

        if (t.changed) {
            DEBUG_PRINTF("[Controller] CH%u -> %s by %s (%s)\n",
                         t.channel, t.relayOn ? "ON" : "OFF",
                         issuerName(t.issuer), t.reason);
        }
        publishRelayStatus_(t.channel);
    }

    // Catch up any write that lost the relay mutex.
    for (uint8_t ch = 1; ch <= LOAD_CHANNEL_COUNT; ++ch) {
        const bool want = _loop.relayOn(ch);
        if (relay_(ch).isOn() != want && !relay_(ch).set(want)) {
            DEBUG_PRINTF("[Controller] CH%u relay still out of sync\n", ch);
        }
    }

    for (uint8_t i = 0; i < res.eventCount; ++i) {
        DEBUG_PRINTF("[Safety] %s\n", res.events[i].message);
        publishAlert_(res.events[i]);
    }
}

// ============================================================================
// Bus
// ============================================================================

void ControllerNode::onBusMessage_(const char* topic, const char* payload, size_t len) {
    const TopicMatch m = TopicMap::classify(topic);

    switch (m.kind) {
    case TopicKind::RelayControl: {
        ControlCommand cmd;
        if (!BusCodec::decodeRelayControl(m.channel, payload, len, cmd)) {
            DEBUG_PRINTF("[Bus] dropped malformed relay command on %s\n", topic);
            return;
        }
        if (!_inbox.submit(cmd)) {
            DEBUG_PRINTF("[Bus] rejected relay command on %s\n", topic);
        }
        break;
    }
    case TopicKind::ModeControl: {
        OperatingMode mode;
        if (!BusCodec::decodeMode(payload, len, mode)) {
            DEBUG_PRINTF("[Bus] dropped malformed mode command on %s\n", topic);
            return;
        }
        _inbox.requestMode(mode);
        break;
    }
    default:
        break;
    }
}

void ControllerNode::onBusConnected_() {
    publishMode_();
    _statusDue = true;
}

void ControllerNode::publishRelayStatus_(uint8_t channel) {
    const uint8_t idx = channel - 1;
    char buf[BUS_PAYLOAD_MAX];
    const size_t n = BusCodec::encodeRelayStatus(_loop.relayOn(channel),
                                                 _statusIssuer[idx],
                                                 _statusReason[idx],
                                                 buf, sizeof(buf));
    if (n == 0) {
        DEBUG_PRINTF("[Bus] CH%u status encode failed\n", channel);
        return;
    }
    _bus.publish(TopicMap::relayStatus(channel), buf, true);
}

void ControllerNode::publishMode_() {
    char buf[BUS_PAYLOAD_MAX];
    if (BusCodec::encodeMode(_mode, buf, sizeof(buf)) == 0) return;
    _bus.publish(TOPIC_MODE_STATUS, buf, true);
}

void ControllerNode::publishAlert_(const AnomalyEvent& ev) {
    char buf[BUS_PAYLOAD_MAX];
    if (BusCodec::encodeAnomaly(ev, buf, sizeof(buf)) == 0) {
        DEBUG_PRINTLN("[Bus] alert encode failed");
        return;
    }
    _bus.publish(TOPIC_ALERTS, buf);
}

void ControllerNode::publishTelemetry_() {
    const unsigned long epoch = RTC->getUnixTime();

    for (uint8_t ch = 1; ch <= LOAD_CHANNEL_COUNT; ++ch) {
        const LoadReading& r = _meter.reading(ch);

        TelemetrySample s;
        s.channel     = ch;
        s.voltage     = r.voltage;
        s.current     = r.current;
        s.power       = r.power;
        s.relayOn     = _loop.relayOn(ch);
        s.relayKnown  = true;
        s.energyKWh   = _energy.energyKWh(ch);
        s.cost        = _energy.cost(ch);
        s.timestampMs = (uint64_t)epoch * 1000ULL;

        char buf[BUS_PAYLOAD_MAX];
        const size_t n = BusCodec::encodeTelemetry(s, buf, sizeof(buf));
        if (n == 0) {
            DEBUG_PRINTF("[Bus] CH%u telemetry encode failed\n", ch);
            continue;
        }
        _bus.publish(TopicMap::telemetry(ch), buf);
        if (_legacyTopics) {
            _bus.publish(TopicMap::legacyTelemetry(ch), buf);
        }
    }
}

void ControllerNode::publishEnvironment_() {
    char buf[BUS_PAYLOAD_MAX];
    if (BusCodec::encodeEnvironment(_env, buf, sizeof(buf)) == 0) return;
    _bus.publish(TOPIC_ENV_DATA, buf);
}
