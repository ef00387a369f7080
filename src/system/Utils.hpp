/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/

#ifndef UTILS_H
#define UTILS_H

/**
 * @file Utils.hpp
 * @brief Thread-safe, non-blocking debug output for both nodes.
 *
 * Every print is copied into a fixed-size slot and pushed on a FreeRTOS
 * queue; a low-priority task drains it to Serial. Writers never block on
 * the UART, which matters for the control loop: a slow console must not
 * stretch a measurement window.
 *
 * Debug::groupStart()/groupStop() keep a multi-line block (boot banners,
 * config dumps) contiguous on the console.
 */

#include <Config.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/semphr.h>

// ===================== Global debug switch =====================

#ifndef DEBUGMODE
#define DEBUGMODE true
#endif

#ifndef SERIAL_BAUD_RATE
#define SERIAL_BAUD_RATE 115200
#endif

// ===================== Thread-safe debug API =====================

namespace Debug {
    void begin(unsigned long baud = SERIAL_BAUD_RATE);

    void print(const char* s);
    void print(const String& s);
    void println(const char* s);
    void println(const String& s);
    void println();

    void print(int32_t v);
    void print(uint32_t v);
    void print(long v);
    void print(unsigned long v);
    void print(float v, int digits = 2);
    void println(int32_t v);
    void println(uint32_t v);
    void println(long v);
    void println(unsigned long v);
    void println(float v, int digits = 2);

    void printf(const char* fmt, ...);

    // Messages dropped because the queue was full.
    uint32_t dropped();

    void groupStart();
    void groupStop(bool addTrailingNewline = false);
}

// ===================== Debug macros =====================

#if DEBUGMODE

    #define DEBUG_PRINT(...)      Debug::print(__VA_ARGS__)
    #define DEBUG_PRINTLN(...)    Debug::println(__VA_ARGS__)
    #define DEBUG_PRINTF(...)     Debug::printf(__VA_ARGS__)

    #ifndef DEBUGGSTART
    #define DEBUGGSTART()         Debug::groupStart()
    #endif

    #ifndef DEBUGGSTOP
    #define DEBUGGSTOP()          Debug::groupStop(false)
    #endif

#else

    #define DEBUG_PRINT(...)      do {} while (0)
    #define DEBUG_PRINTLN(...)    do {} while (0)
    #define DEBUG_PRINTF(...)     do {} while (0)
    #define DEBUGGSTART()         do {} while (0)
    #define DEBUGGSTOP()          do {} while (0)

#endif // DEBUGMODE

#endif // UTILS_H
