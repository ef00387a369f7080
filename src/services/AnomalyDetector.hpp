/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef ANOMALY_DETECTOR_H
#define ANOMALY_DETECTOR_H

#include <ControlTypes.hpp>
#include <TelemetryCache.hpp>
#include <DailyPeakTracker.hpp>

/**
 * @file AnomalyDetector.hpp
 * @brief Second protection layer, evaluated on a fixed wall-clock tick.
 *
 * Works on the cached snapshot (TelemetryCache::latest, TTL bounded), never on
 * a live subscription. Channels with no fresh snapshot are skipped, so a bus
 * outage never produces a forced OFF by itself.
 *
 * Per active channel (relay ON, or unknown relay with power > 0), first match:
 *   1. power   > fixed per-channel ceiling                 -> critical
 *   2. power   > dynamicPowerRatio   * today's peak power  -> warning
 *   3. voltage > dynamicVoltageRatio * today's peak voltage -> warning
 * Dynamic rules only apply once the baseline reaches minPeakPowerW /
 * minPeakVoltageV. A match yields one safety OFF command and one event.
 *
 * System-wide: sum of fresh channel power > systemPowerCapW -> critical
 * system-level event; the active channel drawing the most power that was not
 * already switched off this tick gets a safety OFF.
 */

#define DETECTOR_MAX_COMMANDS  LOAD_CHANNEL_COUNT
#define DETECTOR_MAX_EVENTS    (LOAD_CHANNEL_COUNT * 2 + 1)   // power + voltage per channel, system

struct DetectorReport {
    ControlCommand commands[DETECTOR_MAX_COMMANDS];
    uint8_t        commandCount    = 0;
    AnomalyEvent   events[DETECTOR_MAX_EVENTS];
    uint8_t        eventCount      = 0;
    uint8_t        freshChannels   = 0;
    float          aggregatePowerW = 0.0f;

    void clear();
};

class AnomalyDetector {
public:
    AnomalyDetector();
    explicit AnomalyDetector(const ThresholdConfig& cfg);

    // Takes effect from the next evaluate().
    void configure(const ThresholdConfig& cfg);
    const ThresholdConfig& config() const { return _cfg; }

    bool setFixedCeiling(uint8_t channel, float powerW);

    void evaluate(const TelemetryCache& cache,
                  const PeakBaseline& peaks,
                  uint32_t nowMs,
                  DetectorReport& out) const;

private:
    static bool isActive_(const TelemetrySample& s);
    static void addOff_(uint8_t channel, const AnomalyEvent& why, DetectorReport& out);

    ThresholdConfig _cfg;
};

#endif // ANOMALY_DETECTOR_H
