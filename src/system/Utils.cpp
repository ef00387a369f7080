/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/

#include <Utils.hpp>
#include <stdarg.h>

// ===================== Internal config =====================

#ifndef DBG_LINE_MAX
#define DBG_LINE_MAX        192     // bytes per queued slot, newline included
#endif

#ifndef DBG_QUEUE_DEPTH
#define DBG_QUEUE_DEPTH     64
#endif

#ifndef DBG_GROUP_MAX
#define DBG_GROUP_MAX       2048
#endif

static_assert(DBG_GROUP_MAX >= DBG_LINE_MAX, "DBG_GROUP_MAX must be >= DBG_LINE_MAX");

// ===================== Debug implementation =====================

namespace {

struct DebugLine {
    uint16_t len;
    char     text[DBG_LINE_MAX];
};

QueueHandle_t     s_dbgQ       = nullptr;
TaskHandle_t      s_dbgTask    = nullptr;
SemaphoreHandle_t s_groupGate  = nullptr;   // recursive: owner may print inside
TaskHandle_t      s_groupOwner = nullptr;
bool              s_started    = false;
volatile uint32_t s_dropped    = 0;

char   s_groupBuf[DBG_GROUP_MAX];
size_t s_groupLen = 0;

void writerTask_(void*) {
    DebugLine line;
    for (;;) {
        if (xQueueReceive(s_dbgQ, &line, portMAX_DELAY) == pdTRUE) {
            Serial.write(reinterpret_cast<const uint8_t*>(line.text), line.len);
        }
    }
}

void ensureStart_(unsigned long baud = SERIAL_BAUD_RATE) {
    if (s_started) return;

    if (!Serial) Serial.begin(baud);
    if (!s_dbgQ)      s_dbgQ = xQueueCreate(DBG_QUEUE_DEPTH, sizeof(DebugLine));
    if (!s_groupGate) s_groupGate = xSemaphoreCreateRecursiveMutex();

    if (!s_dbgTask && s_dbgQ) {
        xTaskCreatePinnedToCore(writerTask_,
                                "DebugPrintTask",
                                DEBUG_PRINT_TASK_STACK_SIZE,
                                nullptr,
                                DEBUG_PRINT_TASK_PRIORITY,
                                &s_dbgTask,
                                tskNO_AFFINITY);
    }
    s_started = (s_dbgQ != nullptr);
}

// Queue one slot; if full drop the oldest so recent context survives.
void enqueue_(const char* data, size_t n) {
    if (!s_dbgQ) return;

    while (n > 0) {
        DebugLine line;
        const size_t chunk = (n < DBG_LINE_MAX) ? n : DBG_LINE_MAX;
        memcpy(line.text, data, chunk);
        line.len = static_cast<uint16_t>(chunk);

        if (xQueueSend(s_dbgQ, &line, 0) != pdTRUE) {
            DebugLine old;
            if (xQueueReceive(s_dbgQ, &old, 0) == pdTRUE) s_dropped++;
            if (xQueueSend(s_dbgQ, &line, 0) != pdTRUE) s_dropped++;
        }
        data += chunk;
        n    -= chunk;
    }
}

void groupFlush_() {
    if (s_groupLen) enqueue_(s_groupBuf, s_groupLen);
    s_groupLen = 0;
}

void emit_(const char* s, bool nl) {
    ensureStart_();
    if (!s) s = "";

    char   buf[DBG_LINE_MAX];
    size_t n = strnlen(s, DBG_LINE_MAX - 1);
    memcpy(buf, s, n);
    if (nl) buf[n++] = '\n';

    xSemaphoreTakeRecursive(s_groupGate, portMAX_DELAY);
    if (s_groupOwner == xTaskGetCurrentTaskHandle()) {
        if (s_groupLen + n > DBG_GROUP_MAX) groupFlush_();
        memcpy(s_groupBuf + s_groupLen, buf, n);
        s_groupLen += n;
    } else {
        enqueue_(buf, n);
    }
    xSemaphoreGiveRecursive(s_groupGate);
}

} // namespace

// ===================== Public Debug namespace =====================

namespace Debug {

void begin(unsigned long baud) { ensureStart_(baud); }

void print(const char* s)      { emit_(s, false); }
void print(const String& s)    { emit_(s.c_str(), false); }
void println(const char* s)    { emit_(s, true); }
void println(const String& s)  { emit_(s.c_str(), true); }
void println()                 { emit_("", true); }

void print(int32_t v)          { printf("%ld", static_cast<long>(v)); }
void print(uint32_t v)         { printf("%lu", static_cast<unsigned long>(v)); }
void print(long v)             { printf("%ld", v); }
void print(unsigned long v)    { printf("%lu", v); }
void println(int32_t v)        { printf("%ld\n", static_cast<long>(v)); }
void println(uint32_t v)       { printf("%lu\n", static_cast<unsigned long>(v)); }
void println(long v)           { printf("%ld\n", v); }
void println(unsigned long v)  { printf("%lu\n", v); }

void print(float v, int digits) {
    if (digits < 0) digits = 0;
    if (digits > 6) digits = 6;
    printf("%.*f", digits, static_cast<double>(v));
}

void println(float v, int digits) {
    print(v, digits);
    emit_("", true);
}

void printf(const char* fmt, ...) {
    char buf[DBG_LINE_MAX];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt ? fmt : "", ap);
    va_end(ap);
    emit_(buf, false);
}

uint32_t dropped() { return s_dropped; }

void groupStart() {
    ensureStart_();
    xSemaphoreTakeRecursive(s_groupGate, portMAX_DELAY);
    s_groupOwner = xTaskGetCurrentTaskHandle();
    s_groupLen   = 0;
}

void groupStop(bool addTrailingNewline) {
    ensureStart_();
    if (addTrailingNewline && s_groupLen < DBG_GROUP_MAX) {
        s_groupBuf[s_groupLen++] = '\n';
    }
    groupFlush_();
    s_groupOwner = nullptr;
    xSemaphoreGiveRecursive(s_groupGate);
}

} // namespace Debug
