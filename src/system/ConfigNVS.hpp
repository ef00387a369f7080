/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CONFIG_NVS_HPP
#define CONFIG_NVS_HPP

#include <stdint.h>
#include <math.h>

#define CONFIG_PARTITION               "config"    // NVS namespace name

// ==================================================
// Device Configuration Keys & Defaults for Preferences
// (keys <= 15 chars, NVS limit)
// ==================================================

// ---------- Boot ----------
#define RESET_FLAG                     "RTFLG"     // bool: true -> rewrite all defaults
#define DEVICE_NAME_KEY                "DEVNM"     // string: node id used in MQTT client id

// ---------- Wi-Fi ----------
#define STA_SSID_KEY                   "WIFSSD"    // Station Mode SSID key
#define STA_PASS_KEY                   "WIFPASS"   // Station Mode password key

// ---------- MQTT ----------
#define MQTT_HOST_KEY                  "MQHST"     // string: broker host or IP
#define MQTT_PORT_KEY                  "MQPRT"     // int: broker port
#define MQTT_USER_KEY                  "MQUSR"     // string: optional user
#define MQTT_PASS_KEY                  "MQPWD"     // string: optional password
#define MQTT_RETRY_MS_KEY              "MQRTY"     // int: fixed reconnect backoff [ms]
#define MQTT_LEGACY_TOPICS_KEY         "MQLEG"     // bool: mirror telemetry to esp32/load{n}/data

// ---------- Acquisition ----------
#define AC_FREQUENCY_KEY               "ACFRQ"     // int: mains line frequency [Hz]
#define SAMPLES_PER_CYCLE_KEY          "SMPCY"     // int: ADC samples per AC cycle
#define CYCLES_PER_WINDOW_KEY          "CYCWN"     // int: whole AC cycles per window
#define CALIB_SAMPLES_KEY              "CALSM"     // int: samples averaged for zero offsets
#define CH1_VOLT_SCALE_KEY             "C1VSC"     // float: V per ADC count, channel 1
#define CH1_CURR_SCALE_KEY             "C1ISC"     // float: A per ADC count, channel 1
#define CH2_VOLT_SCALE_KEY             "C2VSC"     // float: V per ADC count, channel 2
#define CH2_CURR_SCALE_KEY             "C2ISC"     // float: A per ADC count, channel 2
#define MAX_VOLTAGE_KEY                "VMAX"      // float: plausible voltage cap [V]
#define CURRENT_NOISE_KEY              "INOIS"     // float: current noise floor [A]
#define EMA_ALPHA_KEY                  "EMAA"      // float: EMA weight of the new window
#define TARIFF_KEY                     "TARIF"     // float: cost per kWh

// ---------- Relay control ----------
#define OPERATING_MODE_KEY             "OPMOD"     // int: 0=auto, 1=manual (last applied)
#define AUTO_TEMP_THRESHOLD_KEY        "ATMPT"     // float: hot/cold boundary [degC]
#define CH1_SAFE_POWER_KEY             "C1SPW"     // float: firmware power ceiling ch1 [W]
#define CH1_SAFE_VOLT_KEY              "C1SVL"     // float: firmware voltage ceiling ch1 [V]
#define CH2_SAFE_POWER_KEY             "C2SPW"     // float: firmware power ceiling ch2 [W]
#define CH2_SAFE_VOLT_KEY              "C2SVL"     // float: firmware voltage ceiling ch2 [V]
#define DHT_RETRIES_KEY                "DHTRT"     // int: read attempts before a fault
#define ENV_PERIOD_MS_KEY              "ENVMS"     // int: environment publish period [ms]

// ---------- Anomaly detector ----------
#define CH1_FIXED_POWER_KEY            "C1FPW"     // float: detector ceiling ch1 [W]
#define CH2_FIXED_POWER_KEY            "C2FPW"     // float: detector ceiling ch2 [W]
#define DYN_POWER_RATIO_KEY            "DYNPR"     // float: fraction of today's peak power
#define DYN_VOLT_RATIO_KEY             "DYNVR"     // float: fraction of today's peak voltage
#define SYSTEM_POWER_CAP_KEY           "SYSCP"     // float: aggregate cap [W]
#define MIN_PEAK_POWER_KEY             "MINPP"     // float: baseline gate [W]
#define MIN_PEAK_VOLT_KEY              "MINPV"     // float: baseline gate [V]
#define DETECTOR_PERIOD_MS_KEY         "DETMS"     // int: detector tick [ms]
#define CACHE_TTL_MS_KEY               "CTTL"      // int: telemetry cache TTL [ms]
#define UTC_OFFSET_MIN_KEY             "UTCOF"     // int: local time offset [min]
#define PEAK_DAY_KEY                   "PKDAY"     // int: day number of stored peaks
#define PEAK_P1_KEY                    "PKP1"      // float: today's peak power ch1
#define PEAK_P2_KEY                    "PKP2"      // float: today's peak power ch2
#define PEAK_V1_KEY                    "PKV1"      // float: today's peak voltage ch1
#define PEAK_V2_KEY                    "PKV2"      // float: today's peak voltage ch2

// ---------- RTC ----------
#define RTC_CURRENT_EPOCH_KEY          "RCUR"      // Last known epoch persisted
#define RTC_DEFAULT_EPOCH              0ULL

// ==================================================
// Defaults
// ==================================================
#define DEFAULT_DEVICE_NAME            "loadguard"
#define DEFAULT_STA_SSID               ""
#define DEFAULT_STA_PASS               ""
#define DEFAULT_MQTT_HOST              "192.168.1.10"
#define DEFAULT_MQTT_PORT              1883
#define DEFAULT_MQTT_USER              ""
#define DEFAULT_MQTT_PASS              ""
#define DEFAULT_MQTT_RETRY_MS          5000
#define DEFAULT_MQTT_LEGACY_TOPICS     true

#define DEFAULT_AC_FREQUENCY           50
#define DEFAULT_SAMPLES_PER_CYCLE      40
#define DEFAULT_CYCLES_PER_WINDOW      3
#define DEFAULT_CALIB_SAMPLES          2000
#define DEFAULT_VOLT_SCALE             0.2442f   // ZMPT101B divider, 12-bit ADC
#define DEFAULT_CURR_SCALE             0.0049f   // ACS712-20A, 12-bit ADC
#define DEFAULT_MAX_VOLTAGE            300.0f
#define DEFAULT_CURRENT_NOISE          0.05f
#define DEFAULT_EMA_ALPHA              0.35f
#define DEFAULT_TARIFF                 0.12f

#define DEFAULT_OPERATING_MODE         0         // auto
#define DEFAULT_AUTO_TEMP_THRESHOLD    30.0f
#define DEFAULT_CH1_SAFE_POWER         1000.0f
#define DEFAULT_CH2_SAFE_POWER         500.0f
#define DEFAULT_SAFE_VOLTAGE           250.0f
#define DEFAULT_DHT_RETRIES            3
#define DEFAULT_ENV_PERIOD_MS          5000

#define DEFAULT_CH1_FIXED_POWER        200.0f
#define DEFAULT_CH2_FIXED_POWER        120.0f
#define DEFAULT_DYN_POWER_RATIO        0.90f
#define DEFAULT_DYN_VOLT_RATIO         0.95f
#define DEFAULT_SYSTEM_POWER_CAP       300.0f
#define DEFAULT_MIN_PEAK_POWER         5.0f
#define DEFAULT_MIN_PEAK_VOLT          50.0f
#define DEFAULT_DETECTOR_PERIOD_MS     15000
#define DEFAULT_CACHE_TTL_MS           5000
#define DEFAULT_UTC_OFFSET_MIN         0

#endif // CONFIG_NVS_HPP
