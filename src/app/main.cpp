#include <Arduino.h>
#include <Config.hpp>

// **************************************************************
//                       Module Includes
// **************************************************************
#include <NVSManager.hpp>
#include <RTCManager.hpp>
#include <ControllerNode.hpp>

// **************************************************************
//                           setup()
// **************************************************************
void setup() {
  // --------------------------------------------------
  // 1) Debug / Diagnostics FIRST
  // --------------------------------------------------
  Debug::begin(SERIAL_BAUD_RATE);
  DEBUG_PRINTLN();
  DEBUG_PRINTLN("==================================================");
  DEBUG_PRINTLN("[Setup] LoadGuard controller boot");
  DEBUG_PRINTLN("==================================================");

  // --------------------------------------------------
  // 2) Persistent Storage + Config + Clock
  //    (Must be ready before any logic that uses config values)
  // --------------------------------------------------
  NVS::Init();
  CONF->begin();
  RTCManager::Init();
  DEBUG_PRINTLN("[Setup] NVS + Config + RTC initialized.");

  // --------------------------------------------------
  // 3) Controller: relays forced OFF, sensors calibrated,
  //    control task and bus started.
  // --------------------------------------------------
  ControllerNode::Init();
  if (!CONTROLLER->begin()) {
    DEBUG_PRINTLN("[FATAL] Controller task not started, restarting");
    CONF->RestartSysDelay(5000);
  }

  DEBUG_PRINTLN("==================================================");
  DEBUG_PRINTLN("[Setup] Boot sequence complete.");
  DEBUG_PRINTLN("==================================================");
}

// **************************************************************
//                            loop()
// **************************************************************
void loop() {
  // Work happens in CtrlLoop; loop stays lightweight.
  vTaskDelay(pdMS_TO_TICKS(1000));
}
