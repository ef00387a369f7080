#include <EventJournal.hpp>

#define JOURNAL_DOC_CAPACITY   384

EventJournal::EventJournal()
    : _ready(false),
      _mutex(nullptr)
{
}

bool EventJournal::begin() {
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTLN("#                 Starting Event Journal                  #");
    DEBUG_PRINTLN("###########################################################");
    DEBUGGSTOP();

    if (!_mutex) _mutex = xSemaphoreCreateMutex();

    if (!SPIFFS.begin(true)) {
        DEBUG_PRINTLN("[Journal] Failed to mount SPIFFS");
        _ready = false;
        return false;
    }

    if (!SPIFFS.exists(JOURNAL_FILE_PATH)) {
        File f = SPIFFS.open(JOURNAL_FILE_PATH, FILE_WRITE);
        if (!f) {
            DEBUG_PRINTLN("[Journal] Failed to create journal file");
            _ready = false;
            return false;
        }
        f.close();
        DEBUG_PRINTLN("[Journal] Journal file created");
    }

    _ready = true;
    DEBUG_PRINTF("[Journal] Ready, %u bytes\n", static_cast<unsigned>(sizeBytes()));
    return true;
}

bool EventJournal::rotateIfNeeded_() {
    File f = SPIFFS.open(JOURNAL_FILE_PATH, FILE_READ);
    const size_t size = f ? f.size() : 0;
    if (f) f.close();
    if (size < JOURNAL_MAX_BYTES) return true;

    if (SPIFFS.exists(JOURNAL_ROTATED_PATH) && !SPIFFS.remove(JOURNAL_ROTATED_PATH)) {
        DEBUG_PRINTLN("[Journal] Failed to drop rotated file");
        return false;
    }
    if (!SPIFFS.rename(JOURNAL_FILE_PATH, JOURNAL_ROTATED_PATH)) {
        DEBUG_PRINTLN("[Journal] Rotation failed");
        return false;
    }
    DEBUG_PRINTLN("[Journal] Rotated");
    return true;
}

bool EventJournal::append_(JsonDocument& doc) {
    if (!_ready) return false;

    char ts[24];
    RTC->formatTimestamp(ts, sizeof(ts));
    doc["timestamp"] = ts;
    doc["epoch"]     = RTC->getUnixTime();
    doc["uptime_ms"] = millis();

    if (_mutex) xSemaphoreTake(_mutex, portMAX_DELAY);

    bool ok = rotateIfNeeded_();
    if (ok) {
        File f = SPIFFS.open(JOURNAL_FILE_PATH, FILE_APPEND);
        if (!f) {
            ok = false;
        } else {
            const size_t expected = measureJson(doc);
            ok = (serializeJson(doc, f) == expected) && (f.print('\n') == 1);
            f.close();
        }
    }

    if (_mutex) xSemaphoreGive(_mutex);

    if (!ok) DEBUG_PRINTLN("[Journal] Failed to append entry");
    return ok;
}

bool EventJournal::recordAnomaly(const AnomalyEvent& ev) {
    StaticJsonDocument<JOURNAL_DOC_CAPACITY> doc;
    doc["event_type"] = "anomaly";
    if (ev.channel == 0) {
        doc["channel"] = static_cast<const char*>(nullptr);
    } else {
        doc["channel"] = ev.channel;
    }
    doc["type"]            = anomalyTypeName(ev.type);
    doc["severity"]        = severityName(ev.severity);
    doc["value"]           = ev.value;
    doc["threshold_value"] = ev.threshold;
    doc["action"]          = (ev.action == TriggeredAction::RelayOff) ? "relay_off" : "none";
    doc["target"]          = ev.target;
    doc["message"]         = ev.message;
    return append_(doc);
}

bool EventJournal::recordRelayChange(uint8_t channel, bool relayOn,
                                     CommandIssuer issuer, const char* reason) {
    StaticJsonDocument<JOURNAL_DOC_CAPACITY> doc;
    doc["event_type"] = "relay";
    doc["channel"]    = channel;
    doc["state"]      = relayOn ? "on" : "off";
    doc["issuer"]     = issuerName(issuer);
    doc["reason"]     = reason ? reason : "";
    return append_(doc);
}

bool EventJournal::recordInfo(const char* message) {
    StaticJsonDocument<JOURNAL_DOC_CAPACITY> doc;
    doc["event_type"] = "info";
    doc["message"]    = message ? message : "";
    return append_(doc);
}

size_t EventJournal::sizeBytes() {
    File f = SPIFFS.open(JOURNAL_FILE_PATH, FILE_READ);
    if (!f) return 0;
    const size_t n = f.size();
    f.close();
    return n;
}
