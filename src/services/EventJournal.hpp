/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef EVENT_JOURNAL_H
#define EVENT_JOURNAL_H

#include <Config.hpp>
#include <FS.h>
#include <SPIFFS.h>
#include <ArduinoJson.h>
#include <RTCManager.hpp>
#include <ControlTypes.hpp>

/**
 * @brief Append-only record of safety trips and anomalies on SPIFFS.
 *
 * One JSON object per line in JOURNAL_FILE_PATH. When the file grows past
 * JOURNAL_MAX_BYTES it is renamed to JOURNAL_ROTATED_PATH (replacing the
 * previous one) and a fresh file is started.
 *
 * Writes are serialized by a mutex; a failed write is reported to the caller
 * and on the debug console, never retried.
 */
class EventJournal {
public:
    EventJournal();

    bool begin();
    bool isReady() const { return _ready; }

    bool recordAnomaly(const AnomalyEvent& ev);
    bool recordRelayChange(uint8_t channel, bool relayOn,
                           CommandIssuer issuer, const char* reason);
    bool recordInfo(const char* message);

    size_t sizeBytes();

private:
    bool append_(JsonDocument& doc);
    bool rotateIfNeeded_();

    bool              _ready;
    SemaphoreHandle_t _mutex;
};

#endif // EVENT_JOURNAL_H
