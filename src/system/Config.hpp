/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CONFIG_H
#define CONFIG_H

#include <Arduino.h>
#include <ConfigNVS.hpp>

// ==================================================
// Identity
// ==================================================

#define CONTROLLER_NODE_NAME           "controller"
#define WATCHDOG_NODE_NAME             "watchdog"
#define DEVICE_HOSTNAME                "loadguard"

// ==================================================
// Load Acquisition (ADC1 only, ADC2 is shared with Wi-Fi)
// ==================================================

#define CH1_VOLTAGE_ADC_PIN            34                   // ZMPT101B output, heater line
#define CH1_CURRENT_ADC_PIN            35                   // ACS712 output, heater line
#define CH2_VOLTAGE_ADC_PIN            32                   // ZMPT101B output, fan line
#define CH2_CURRENT_ADC_PIN            33                   // ACS712 output, fan line
#define ADC_RESOLUTION_BITS            12
#define ADC_FULL_SCALE                 4095

// ==================================================
// Relay Outputs
// ==================================================

#define CH1_RELAY_PIN                  26                   // heater / bulb relay
#define CH2_RELAY_PIN                  27                   // fan relay
#define RELAY_ACTIVE_LOW               true                 // LOW energizes the coil

// ==================================================
// Climate Sensor
// ==================================================

#define DHT_DATA_PIN                   4
#define DHT_SENSOR_TYPE                DHT11
#define DHT_RETRY_DELAY_MS             100                  // between read attempts
#define DHT_MIN_INTERVAL_MS            2000                 // DHT11 refresh limit

// ==================================================
// Wi-Fi / Time
// ==================================================

#define WIFI_STA_CONNECT_TIMEOUT_MS    15000
#define WIFI_RETRY_MS                  10000
#define NTP_SERVER_1                   "pool.ntp.org"
#define NTP_SERVER_2                   "time.google.com"
#define NTP_SYNC_TIMEOUT_MS            2500
#define RTC_PERSIST_INTERVAL_MS        600000               // save epoch every 10 min

// ==================================================
// MQTT
// ==================================================

#define MQTT_BUFFER_SIZE               512
#define MQTT_KEEPALIVE_S               15
#define MQTT_SOCKET_TIMEOUT_S          3

// ==================================================
// Event Journal (SPIFFS)
// ==================================================

#define JOURNAL_FILE_PATH              "/anomalies.jsonl"
#define JOURNAL_ROTATED_PATH           "/anomalies.old"
#define JOURNAL_MAX_BYTES              (64 * 1024)

// ==================================================
//  RTOS CONFIGURATION: Task Priorities
// ==================================================
#define CONTROL_LOOP_TASK_PRIORITY        3
#define WATCHDOG_TASK_PRIORITY            2
#define DEBUG_PRINT_TASK_PRIORITY         1

// ==================================================
//  RTOS CONFIGURATION: Core Assignments
// ==================================================
#define CONTROL_LOOP_TASK_CORE            APP_CPU_NUM
#define WATCHDOG_TASK_CORE                APP_CPU_NUM

// ==================================================
//  RTOS CONFIGURATION: Stack Sizes (in words = 4 bytes)
// ==================================================
#define CONTROL_LOOP_TASK_STACK_SIZE      8192
#define WATCHDOG_TASK_STACK_SIZE          8192
#define DEBUG_PRINT_TASK_STACK_SIZE       4096

// ==================================================
//  RTOS CONFIGURATION: Task Delay Intervals & Timing (ms)
// ==================================================
#define CONTROL_LOOP_IDLE_DELAY_MS        5       // yield between windows
#define WATCHDOG_LOOP_DELAY_MS            20      // bus servicing cadence
#define TELEMETRY_MIN_PERIOD_MS           1000    // telemetry publish floor
#define STATUS_REFRESH_MS                 30000   // re-publish relay status

#endif // CONFIG_H
