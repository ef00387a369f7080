/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/

#include <RTCManager.hpp>
#include <DailyPeakTracker.hpp>

RTCManager* RTCManager::s_instance = nullptr;

namespace {

inline bool isValidEpoch(uint64_t epoch) {
    return epoch >= VALID_EPOCH_MIN;
}

inline bool persistEpoch(uint64_t epoch) {
    if (!CONF) return false;
    const uint64_t cur = CONF->GetULong64(RTC_CURRENT_EPOCH_KEY,
                                          static_cast<uint64_t>(RTC_DEFAULT_EPOCH));
    if (cur == epoch) return true;
    return CONF->PutULong64(RTC_CURRENT_EPOCH_KEY, epoch);
}

} // namespace

void RTCManager::Init() {
    (void)RTCManager::Get();
}

RTCManager* RTCManager::Get() {
    if (!s_instance) {
        s_instance = new RTCManager();
    }
    return s_instance;
}

RTCManager* RTCManager::TryGet() {
    return s_instance;
}

RTCManager::RTCManager()
    : _mutex(nullptr),
      _lastPersistMs(0),
      _persistedOnce(false),
      _ntpSynced(false)
{
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTLN("#                   Starting RTC Manager                  #");
    DEBUG_PRINTLN("###########################################################");
    DEBUGGSTOP();

    _mutex = xSemaphoreCreateMutex();

    const uint64_t saved = CONF->GetULong64(RTC_CURRENT_EPOCH_KEY,
                                            static_cast<uint64_t>(RTC_DEFAULT_EPOCH));
    if (isValidEpoch(saved)) {
        setUnixTime(static_cast<unsigned long>(saved));
    } else {
        DEBUG_PRINTLN("[RTC] No persisted epoch, clock invalid until NTP");
    }
}

bool RTCManager::setUnixTime(unsigned long timestamp) {
    if (!isValidEpoch(static_cast<uint64_t>(timestamp))) {
        DEBUG_PRINTF("[RTC] Ignoring invalid epoch: %lu\n", timestamp);
        return false;
    }

    {
        MutexGuard g(_mutex, pdMS_TO_TICKS(1000));
        if (!g.ok()) {
            DEBUG_PRINTLN("[RTC] setUnixTime lock timeout");
            return false;
        }

        struct timeval tv;
        tv.tv_sec  = static_cast<time_t>(timestamp);
        tv.tv_usec = 0;
        if (settimeofday(&tv, nullptr) != 0) {
            DEBUG_PRINTLN("[RTC] settimeofday failed");
            return false;
        }
    }

    DEBUG_PRINTF("[RTC] System time set to %lu\n", timestamp);
    return persistEpoch(static_cast<uint64_t>(timestamp));
}

unsigned long RTCManager::getUnixTime() {
    const time_t now = time(nullptr);
    if (now <= 0 || !isValidEpoch(static_cast<uint64_t>(now))) {
        return 0;
    }
    return static_cast<unsigned long>(now);
}

bool RTCManager::isTimeValid() {
    return getUnixTime() != 0;
}

bool RTCManager::syncFromNtp(uint32_t timeoutMs) {
    configTime(0, 0, NTP_SERVER_1, NTP_SERVER_2);
    const uint32_t start = millis();
    tm info{};
    while ((millis() - start) < timeoutMs) {
        if (getLocalTime(&info, 500)) {
            const time_t now = mktime(&info);
            if (isValidEpoch(static_cast<uint64_t>(now))) {
                DEBUG_PRINTF("[RTC] NTP sync ok (epoch=%lu)\n",
                             static_cast<unsigned long>(now));
                _persistedOnce = persistEpoch(static_cast<uint64_t>(now));
                _lastPersistMs = millis();
                _ntpSynced     = true;
                return true;
            }
        }
        vTaskDelay(pdMS_TO_TICKS(200));
    }
    DEBUG_PRINTLN("[RTC] NTP sync failed");
    return false;
}

void RTCManager::persistIfDue(uint32_t nowMs) {
    if (_persistedOnce && (uint32_t)(nowMs - _lastPersistMs) < RTC_PERSIST_INTERVAL_MS) {
        return;
    }
    const unsigned long epoch = getUnixTime();
    if (epoch == 0) return;

    _lastPersistMs = nowMs;
    _persistedOnce = persistEpoch(static_cast<uint64_t>(epoch));
}

void RTCManager::formatTimestamp(char* out, size_t len) {
    if (!out || len == 0) return;

    const time_t now = static_cast<time_t>(getUnixTime());
    if (now == 0) {
        snprintf(out, len, "unsynced");
        return;
    }

    tm utc{};
    gmtime_r(&now, &utc);
    snprintf(out, len, "%04d-%02d-%02d %02d:%02d:%02d",
             utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
             utc.tm_hour, utc.tm_min, utc.tm_sec);
}
