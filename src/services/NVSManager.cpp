#include <NVSManager.hpp>

// ======================================================
// Static singleton pointer
// ======================================================
NVS* NVS::s_instance = nullptr;

void NVS::Init() {
    (void)NVS::Get();
}

NVS* NVS::Get() {
    if (!s_instance) {
        s_instance = new NVS();
    }
    return s_instance;
}

// ======================================================
// ctor / dtor
// ======================================================
NVS::NVS()
: namespaceName(CONFIG_PARTITION) {
    mutex_ = xSemaphoreCreateRecursiveMutex();
}

NVS::~NVS() {
    end();
    if (mutex_) {
        vSemaphoreDelete(mutex_);
        mutex_ = nullptr;
    }
}

inline void NVS::sleepMs_(uint32_t ms) {
    if (xTaskGetSchedulerState() != taskSCHEDULER_NOT_STARTED) {
        vTaskDelay(pdMS_TO_TICKS(ms));
    } else {
        delay(ms);
    }
}

inline void NVS::lock_()   { if (mutex_) xSemaphoreTakeRecursive(mutex_, portMAX_DELAY); }
inline void NVS::unlock_() { if (mutex_) xSemaphoreGiveRecursive(mutex_); }

// ======================================================
// Preferences open state
// ======================================================
void NVS::ensureOpenRO_() {
    if (!is_open_) {
        is_open_ = preferences.begin(namespaceName, /*readOnly=*/true);
        open_rw_ = false;
        if (!is_open_) {
            // Namespace does not exist yet: RW open creates it.
            ensureOpenRW_();
        }
    }
}

void NVS::ensureOpenRW_() {
    if (is_open_ && open_rw_) return;
    if (is_open_) {
        preferences.end();
        is_open_ = false;
    }
    is_open_ = preferences.begin(namespaceName, /*readOnly=*/false);
    open_rw_ = is_open_;
    if (!is_open_) {
        DEBUG_PRINTLN("[NVS] Failed to open namespace RW");
    }
}

void NVS::end() {
    lock_();
    if (is_open_) {
        preferences.end();
        is_open_ = false;
        open_rw_ = false;
    }
    unlock_();
}

// ======================================================
// begin()
// ======================================================
void NVS::begin() {
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTLN("#                 Starting NVS Manager                    #");
    DEBUG_PRINTLN("###########################################################");
    DEBUGGSTOP();

    if (getResetFlag()) {
        DEBUG_PRINTLN("[NVS] Initializing the device...");
        initializeDefaults();
        RestartSysDelay(5000);
    } else {
        DEBUG_PRINTLN("[NVS] Using existing configuration...");
        ensureMissingDefaults();
    }
}

bool NVS::getResetFlag() {
    lock_();
    ensureOpenRO_();
    bool v = preferences.getBool(RESET_FLAG, true);
    unlock_();
    return v;
}

void NVS::initializeDefaults() {
    writeDefaults_(false);
}

void NVS::ensureMissingDefaults() {
    writeDefaults_(true);
}

// Every key the two nodes read. With onlyMissing the stored values win.
void NVS::writeDefaults_(bool onlyMissing) {
    lock_();
    ensureOpenRW_();
    if (!open_rw_) {
        unlock_();
        return;
    }

    uint16_t written = 0;
    auto want = [&](const char* key) {
        const bool w = !onlyMissing || !preferences.isKey(key);
        if (w) written++;
        return w;
    };
    auto putBool   = [&](const char* k, bool v)        { if (want(k)) preferences.putBool(k, v); };
    auto putInt    = [&](const char* k, int v)         { if (want(k)) preferences.putInt(k, v); };
    auto putFloat  = [&](const char* k, float v)       { if (want(k)) preferences.putFloat(k, v); };
    auto putU64    = [&](const char* k, uint64_t v)    { if (want(k)) preferences.putULong64(k, v); };
    auto putString = [&](const char* k, const char* v) { if (want(k)) preferences.putString(k, v); };

    putString(DEVICE_NAME_KEY, DEFAULT_DEVICE_NAME);
    putString(STA_SSID_KEY,    DEFAULT_STA_SSID);
    putString(STA_PASS_KEY,    DEFAULT_STA_PASS);

    putString(MQTT_HOST_KEY,        DEFAULT_MQTT_HOST);
    putInt   (MQTT_PORT_KEY,        DEFAULT_MQTT_PORT);
    putString(MQTT_USER_KEY,        DEFAULT_MQTT_USER);
    putString(MQTT_PASS_KEY,        DEFAULT_MQTT_PASS);
    putInt   (MQTT_RETRY_MS_KEY,    DEFAULT_MQTT_RETRY_MS);
    putBool  (MQTT_LEGACY_TOPICS_KEY, DEFAULT_MQTT_LEGACY_TOPICS);

    putInt  (AC_FREQUENCY_KEY,      DEFAULT_AC_FREQUENCY);
    putInt  (SAMPLES_PER_CYCLE_KEY, DEFAULT_SAMPLES_PER_CYCLE);
    putInt  (CYCLES_PER_WINDOW_KEY, DEFAULT_CYCLES_PER_WINDOW);
    putInt  (CALIB_SAMPLES_KEY,     DEFAULT_CALIB_SAMPLES);
    putFloat(CH1_VOLT_SCALE_KEY,    DEFAULT_VOLT_SCALE);
    putFloat(CH1_CURR_SCALE_KEY,    DEFAULT_CURR_SCALE);
    putFloat(CH2_VOLT_SCALE_KEY,    DEFAULT_VOLT_SCALE);
    putFloat(CH2_CURR_SCALE_KEY,    DEFAULT_CURR_SCALE);
    putFloat(MAX_VOLTAGE_KEY,       DEFAULT_MAX_VOLTAGE);
    putFloat(CURRENT_NOISE_KEY,     DEFAULT_CURRENT_NOISE);
    putFloat(EMA_ALPHA_KEY,         DEFAULT_EMA_ALPHA);
    putFloat(TARIFF_KEY,            DEFAULT_TARIFF);

    putInt  (OPERATING_MODE_KEY,      DEFAULT_OPERATING_MODE);
    putFloat(AUTO_TEMP_THRESHOLD_KEY, DEFAULT_AUTO_TEMP_THRESHOLD);
    putFloat(CH1_SAFE_POWER_KEY,      DEFAULT_CH1_SAFE_POWER);
    putFloat(CH1_SAFE_VOLT_KEY,       DEFAULT_SAFE_VOLTAGE);
    putFloat(CH2_SAFE_POWER_KEY,      DEFAULT_CH2_SAFE_POWER);
    putFloat(CH2_SAFE_VOLT_KEY,       DEFAULT_SAFE_VOLTAGE);
    putInt  (DHT_RETRIES_KEY,         DEFAULT_DHT_RETRIES);
    putInt  (ENV_PERIOD_MS_KEY,       DEFAULT_ENV_PERIOD_MS);

    putFloat(CH1_FIXED_POWER_KEY,    DEFAULT_CH1_FIXED_POWER);
    putFloat(CH2_FIXED_POWER_KEY,    DEFAULT_CH2_FIXED_POWER);
    putFloat(DYN_POWER_RATIO_KEY,    DEFAULT_DYN_POWER_RATIO);
    putFloat(DYN_VOLT_RATIO_KEY,     DEFAULT_DYN_VOLT_RATIO);
    putFloat(SYSTEM_POWER_CAP_KEY,   DEFAULT_SYSTEM_POWER_CAP);
    putFloat(MIN_PEAK_POWER_KEY,     DEFAULT_MIN_PEAK_POWER);
    putFloat(MIN_PEAK_VOLT_KEY,      DEFAULT_MIN_PEAK_VOLT);
    putInt  (DETECTOR_PERIOD_MS_KEY, DEFAULT_DETECTOR_PERIOD_MS);
    putInt  (CACHE_TTL_MS_KEY,       DEFAULT_CACHE_TTL_MS);
    putInt  (UTC_OFFSET_MIN_KEY,     DEFAULT_UTC_OFFSET_MIN);

    putU64(RTC_CURRENT_EPOCH_KEY, static_cast<uint64_t>(RTC_DEFAULT_EPOCH));

    // Peaks are written by the watchdog only; never reset them here.
    putBool(RESET_FLAG, false);

    unlock_();
    DEBUG_PRINTF("[NVS] %s: %u keys written\n",
                 onlyMissing ? "Missing defaults" : "Defaults",
                 static_cast<unsigned>(written));
}

// ======================================================
// Reads (auto-open RO)
// ======================================================
bool NVS::GetBool(const char* key, bool defaultValue) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRO_();
    bool v = preferences.getBool(key, defaultValue);
    unlock_();
    return v;
}

int NVS::GetInt(const char* key, int defaultValue) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRO_();
    int v = preferences.getInt(key, defaultValue);
    unlock_();
    return v;
}

uint64_t NVS::GetULong64(const char* key, uint64_t defaultValue) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRO_();
    uint64_t v = preferences.getULong64(key, defaultValue);
    unlock_();
    return v;
}

float NVS::GetFloat(const char* key, float defaultValue) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRO_();
    float v = preferences.getFloat(key, defaultValue);
    unlock_();
    return v;
}

String NVS::GetString(const char* key, const String& defaultValue) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRO_();
    String v = preferences.getString(key, defaultValue);
    unlock_();
    return v;
}

// ======================================================
// Writes (auto-open RW). Preferences returns the byte count, 0 = failure.
// ======================================================
bool NVS::PutBool(const char* key, bool value) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRW_();
    const bool ok = preferences.putBool(key, value) > 0;
    unlock_();
    if (!ok) DEBUG_PRINTF("[NVS] write failed: %s\n", key);
    return ok;
}

bool NVS::PutInt(const char* key, int value) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRW_();
    const bool ok = preferences.putInt(key, value) > 0;
    unlock_();
    if (!ok) DEBUG_PRINTF("[NVS] write failed: %s\n", key);
    return ok;
}

bool NVS::PutULong64(const char* key, uint64_t value) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRW_();
    const bool ok = preferences.putULong64(key, value) > 0;
    unlock_();
    if (!ok) DEBUG_PRINTF("[NVS] write failed: %s\n", key);
    return ok;
}

bool NVS::PutFloat(const char* key, float value) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRW_();
    const bool ok = preferences.putFloat(key, value) > 0;
    unlock_();
    if (!ok) DEBUG_PRINTF("[NVS] write failed: %s\n", key);
    return ok;
}

bool NVS::PutString(const char* key, const String& value) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRW_();
    const bool ok = preferences.putString(key, value) == value.length();
    unlock_();
    if (!ok) DEBUG_PRINTF("[NVS] write failed: %s\n", key);
    return ok;
}

void NVS::RemoveKey(const char* key) {
    lock_();
    ensureOpenRW_();
    if (preferences.isKey(key)) {
        preferences.remove(key);
        DEBUG_PRINTF("[NVS] Removed key: %s\n", key);
    }
    unlock_();
}

// ======================================================
// Reboot path
// ======================================================
void NVS::RestartSysDelay(unsigned long delayTime) {
    unsigned long interval = delayTime / 30;
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTF("#           Restarting the Device in: %lu Sec               #\n",
                 delayTime / 1000);
    DEBUG_PRINTLN("###########################################################");
    DEBUGGSTOP();
    for (int i = 0; i < 30; i++) {
        DEBUG_PRINT("#");
        sleepMs_(interval);
        esp_task_wdt_reset();
    }
    DEBUG_PRINTLN();
    DEBUG_PRINTLN("[NVS] Restarting now...");
    ESP.restart();
}
