#include <Arduino.h>
#include <Config.hpp>

// **************************************************************
//                       Module Includes
// **************************************************************
#include <NVSManager.hpp>
#include <RTCManager.hpp>
#include <WatchdogNode.hpp>

void setup() {
  Debug::begin(SERIAL_BAUD_RATE);
  DEBUG_PRINTLN();
  DEBUG_PRINTLN("==================================================");
  DEBUG_PRINTLN("[Setup] LoadGuard watchdog boot");
  DEBUG_PRINTLN("==================================================");

  NVS::Init();
  CONF->begin();
  RTCManager::Init();
  DEBUG_PRINTLN("[Setup] NVS + Config + RTC initialized.");

  // Peaks are restored here; the journal mounts SPIFFS.
  WatchdogNode::Init();
  if (!WATCHDOG->begin()) {
    DEBUG_PRINTLN("[FATAL] Watchdog task not started, restarting");
    CONF->RestartSysDelay(5000);
  }

  DEBUG_PRINTLN("[Setup] Boot sequence complete.");
}

void loop() {
  vTaskDelay(pdMS_TO_TICKS(1000));
}
