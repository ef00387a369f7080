#include <SettingsLoader.hpp>

namespace {

float positiveFloat_(const char* key, float def) {
    const float v = CONF->GetFloat(key, def);
    if (isfinite(v) && v > 0.0f) return v;
    DEBUG_PRINTF("[Settings] %s invalid (%.4f), using %.4f\n", key, v, def);
    return def;
}

int rangedInt_(const char* key, int def, int lo, int hi) {
    const int v = CONF->GetInt(key, def);
    if (v >= lo && v <= hi) return v;
    DEBUG_PRINTF("[Settings] %s out of range (%d), using %d\n", key, v, def);
    return def;
}

} // namespace

namespace SettingsLoader {

void loadMeter(MeterConfig& out) {
    out.lineHz             = rangedInt_(AC_FREQUENCY_KEY, DEFAULT_AC_FREQUENCY, 45, 65);
    out.samplesPerCycle    = rangedInt_(SAMPLES_PER_CYCLE_KEY, DEFAULT_SAMPLES_PER_CYCLE, 8, 200);
    out.cyclesPerWindow    = rangedInt_(CYCLES_PER_WINDOW_KEY, DEFAULT_CYCLES_PER_WINDOW, 1, 50);
    out.calibrationSamples = rangedInt_(CALIB_SAMPLES_KEY, DEFAULT_CALIB_SAMPLES, 100, 20000);

    out.voltageScale[0] = positiveFloat_(CH1_VOLT_SCALE_KEY, DEFAULT_VOLT_SCALE);
    out.currentScale[0] = positiveFloat_(CH1_CURR_SCALE_KEY, DEFAULT_CURR_SCALE);
    out.voltageScale[1] = positiveFloat_(CH2_VOLT_SCALE_KEY, DEFAULT_VOLT_SCALE);
    out.currentScale[1] = positiveFloat_(CH2_CURR_SCALE_KEY, DEFAULT_CURR_SCALE);

    out.conditioner.maxVoltageV   = positiveFloat_(MAX_VOLTAGE_KEY, DEFAULT_MAX_VOLTAGE);
    out.conditioner.currentNoiseA = positiveFloat_(CURRENT_NOISE_KEY, DEFAULT_CURRENT_NOISE);

    float alpha = CONF->GetFloat(EMA_ALPHA_KEY, DEFAULT_EMA_ALPHA);
    if (!isfinite(alpha) || alpha <= 0.0f || alpha > 1.0f) alpha = DEFAULT_EMA_ALPHA;
    out.conditioner.emaAlpha = alpha;
}

void loadControlLoop(ControlLoopConfig& out) {
    float t = CONF->GetFloat(AUTO_TEMP_THRESHOLD_KEY, DEFAULT_AUTO_TEMP_THRESHOLD);
    if (!isfinite(t) || t < -20.0f || t > 80.0f) t = DEFAULT_AUTO_TEMP_THRESHOLD;
    out.autoThresholdC = t;

    out.limits[0].maxPowerW   = positiveFloat_(CH1_SAFE_POWER_KEY, DEFAULT_CH1_SAFE_POWER);
    out.limits[0].maxVoltageV = positiveFloat_(CH1_SAFE_VOLT_KEY,  DEFAULT_SAFE_VOLTAGE);
    out.limits[1].maxPowerW   = positiveFloat_(CH2_SAFE_POWER_KEY, DEFAULT_CH2_SAFE_POWER);
    out.limits[1].maxVoltageV = positiveFloat_(CH2_SAFE_VOLT_KEY,  DEFAULT_SAFE_VOLTAGE);
}

void loadThresholds(ThresholdConfig& out) {
    out.fixedPowerCeilingW[0] = positiveFloat_(CH1_FIXED_POWER_KEY, DEFAULT_CH1_FIXED_POWER);
    out.fixedPowerCeilingW[1] = positiveFloat_(CH2_FIXED_POWER_KEY, DEFAULT_CH2_FIXED_POWER);
    out.dynamicPowerRatio     = positiveFloat_(DYN_POWER_RATIO_KEY, DEFAULT_DYN_POWER_RATIO);
    out.dynamicVoltageRatio   = positiveFloat_(DYN_VOLT_RATIO_KEY,  DEFAULT_DYN_VOLT_RATIO);
    out.systemPowerCapW       = positiveFloat_(SYSTEM_POWER_CAP_KEY, DEFAULT_SYSTEM_POWER_CAP);
    out.minPeakPowerW         = positiveFloat_(MIN_PEAK_POWER_KEY, DEFAULT_MIN_PEAK_POWER);
    out.minPeakVoltageV       = positiveFloat_(MIN_PEAK_VOLT_KEY,  DEFAULT_MIN_PEAK_VOLT);
}

void loadMqtt(MqttSettings& out) {
    out.ssid         = CONF->GetString(STA_SSID_KEY, DEFAULT_STA_SSID);
    out.password     = CONF->GetString(STA_PASS_KEY, DEFAULT_STA_PASS);
    out.host         = CONF->GetString(MQTT_HOST_KEY, DEFAULT_MQTT_HOST);
    out.port         = rangedInt_(MQTT_PORT_KEY, DEFAULT_MQTT_PORT, 1, 65535);
    out.user         = CONF->GetString(MQTT_USER_KEY, DEFAULT_MQTT_USER);
    out.pass         = CONF->GetString(MQTT_PASS_KEY, DEFAULT_MQTT_PASS);
    out.retryMs      = rangedInt_(MQTT_RETRY_MS_KEY, DEFAULT_MQTT_RETRY_MS, 250, 600000);
    out.legacyTopics = CONF->GetBool(MQTT_LEGACY_TOPICS_KEY, DEFAULT_MQTT_LEGACY_TOPICS);
}

float tariff() {
    const float v = CONF->GetFloat(TARIFF_KEY, DEFAULT_TARIFF);
    return (isfinite(v) && v >= 0.0f) ? v : DEFAULT_TARIFF;
}

uint8_t dhtRetries() {
    return static_cast<uint8_t>(rangedInt_(DHT_RETRIES_KEY, DEFAULT_DHT_RETRIES, 1, 10));
}

uint32_t envPeriodMs() {
    return rangedInt_(ENV_PERIOD_MS_KEY, DEFAULT_ENV_PERIOD_MS, DHT_MIN_INTERVAL_MS, 3600000);
}

uint32_t detectorPeriodMs() {
    return rangedInt_(DETECTOR_PERIOD_MS_KEY, DEFAULT_DETECTOR_PERIOD_MS, 1000, 3600000);
}

uint32_t cacheTtlMs() {
    return rangedInt_(CACHE_TTL_MS_KEY, DEFAULT_CACHE_TTL_MS, 500, 600000);
}

int32_t utcOffsetMinutes() {
    return rangedInt_(UTC_OFFSET_MIN_KEY, DEFAULT_UTC_OFFSET_MIN, -14 * 60, 14 * 60);
}

OperatingMode loadMode() {
    return (CONF->GetInt(OPERATING_MODE_KEY, DEFAULT_OPERATING_MODE) == 1)
               ? OperatingMode::Manual
               : OperatingMode::Auto;
}

bool saveMode(OperatingMode mode) {
    return CONF->PutInt(OPERATING_MODE_KEY, static_cast<int>(mode));
}

bool saveFixedCeiling(uint8_t channel, float powerW) {
    if (channel == 1) return CONF->PutFloat(CH1_FIXED_POWER_KEY, powerW);
    if (channel == 2) return CONF->PutFloat(CH2_FIXED_POWER_KEY, powerW);
    return false;
}

} // namespace SettingsLoader
