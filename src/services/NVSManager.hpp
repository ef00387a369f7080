/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef NVS_MANAGER_H
#define NVS_MANAGER_H

#include <Config.hpp>
#include <Preferences.h>
#include <Utils.hpp>
#include <esp_task_wdt.h>

/**
 * @brief Singleton wrapper around Preferences for the "config" namespace.
 *
 * Usage at startup:
 *     NVS::Init();
 *     CONF->begin();
 *
 * First boot (RESET_FLAG missing or true) writes every default and reboots.
 * Later boots only add keys that a newer firmware introduced.
 *
 * All accessors take a recursive mutex and lazily open the namespace RO or
 * RW, so any task may read or persist settings.
 */
class NVS {
public:
    static void Init();
    static NVS* Get();

    void begin();
    void end();

    bool getResetFlag();
    void initializeDefaults();
    void ensureMissingDefaults();

    bool     GetBool(const char* key, bool defaultValue);
    int      GetInt(const char* key, int defaultValue);
    uint64_t GetULong64(const char* key, uint64_t defaultValue);
    float    GetFloat(const char* key, float defaultValue);
    String   GetString(const char* key, const String& defaultValue);

    bool PutBool(const char* key, bool value);
    bool PutInt(const char* key, int value);
    bool PutULong64(const char* key, uint64_t value);
    bool PutFloat(const char* key, float value);
    bool PutString(const char* key, const String& value);

    void RemoveKey(const char* key);
    void RestartSysDelay(unsigned long delayTime);

private:
    NVS();
    ~NVS();
    NVS(const NVS&) = delete;
    NVS& operator=(const NVS&) = delete;

    inline void lock_();
    inline void unlock_();
    inline void sleepMs_(uint32_t ms);
    void ensureOpenRO_();
    void ensureOpenRW_();
    void writeDefaults_(bool onlyMissing);

    static NVS* s_instance;

    Preferences       preferences;
    const char*       namespaceName;
    SemaphoreHandle_t mutex_   = nullptr;
    bool              is_open_ = false;
    bool              open_rw_ = false;
};

#define CONF NVS::Get()

#endif // NVS_MANAGER_H
