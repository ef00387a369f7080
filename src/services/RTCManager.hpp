/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef RTCMANAGER_H
#define RTCMANAGER_H

#include <NVSManager.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/semphr.h>
#include <Utils.hpp>
#include <Config.hpp>
#include <time.h>
#include <sys/time.h>

/**
 * @file RTCManager.hpp
 * @brief Singleton wall clock (Unix epoch, UTC).
 *
 *  - Init() restores the last persisted epoch so the clock is roughly right
 *    before NTP answers (good enough for the daily peak day number).
 *  - syncFromNtp() is called once Wi-Fi is up.
 *  - getUnixTime() returns 0 while the clock was never set.
 *  - persistIfDue() writes the epoch to NVS at most every
 *    RTC_PERSIST_INTERVAL_MS.
 */
class RTCManager {
public:
    static void        Init();
    static RTCManager* Get();
    static RTCManager* TryGet();

    bool          setUnixTime(unsigned long timestamp);
    unsigned long getUnixTime();
    bool          isTimeValid();
    // True once NTP answered since boot. A restored epoch may be hours or
    // days behind, so date-sensitive logic waits for this.
    bool          isSynced() const { return _ntpSynced; }
    bool          syncFromNtp(uint32_t timeoutMs = NTP_SYNC_TIMEOUT_MS);
    void          persistIfDue(uint32_t nowMs);

    // "YYYY-MM-DD HH:MM:SS" (UTC) into @p out; "unsynced" while invalid.
    void          formatTimestamp(char* out, size_t len);

private:
    RTCManager();

    static RTCManager* s_instance;

    struct MutexGuard {
        explicit MutexGuard(SemaphoreHandle_t mtx,
                            TickType_t to = portMAX_DELAY)
            : _mtx(mtx), _ok(false)
        {
            if (_mtx) {
                _ok = (xSemaphoreTake(_mtx, to) == pdTRUE);
            }
        }

        ~MutexGuard() {
            if (_ok && _mtx) {
                xSemaphoreGive(_mtx);
            }
        }

        bool ok() const { return _ok; }

    private:
        SemaphoreHandle_t _mtx;
        bool              _ok;
    };

    SemaphoreHandle_t _mutex;
    uint32_t          _lastPersistMs;
    bool              _persistedOnce;
    volatile bool     _ntpSynced;
};

#define RTC RTCManager::Get()

#endif // RTCMANAGER_H
