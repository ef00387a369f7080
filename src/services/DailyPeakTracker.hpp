/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef DAILY_PEAK_TRACKER_H
#define DAILY_PEAK_TRACKER_H

#include <ControlTypes.hpp>

#define VALID_EPOCH_MIN        1609459200UL   // 2021-01-01, earlier = clock not set
#define SECONDS_PER_DAY        86400L

// Today's peaks as persisted. day = -1 while no valid date was ever seen.
struct PeakRecord {
    int32_t day = -1;
    float   power[LOAD_CHANNEL_COUNT]   = {0.0f, 0.0f};
    float   voltage[LOAD_CHANNEL_COUNT] = {0.0f, 0.0f};
};

// Persistence for PeakRecord (NVS on the device, memory in tests).
class PeakStore {
public:
    virtual ~PeakStore() {}
    virtual bool load(PeakRecord& out) = 0;
    virtual bool save(const PeakRecord& rec) = 0;
};

// What the anomaly detector needs: today's recorded peaks per channel.
class PeakBaseline {
public:
    virtual ~PeakBaseline() {}
    virtual float todayPeakPower(uint8_t channel) const = 0;
    virtual float todayPeakVoltage(uint8_t channel) const = 0;
};

/**
 * @brief Running maximum of power and voltage per channel for the local day.
 *
 * The day is floor((epoch + utcOffset) / 86400). Peaks reset when that number
 * changes. While the clock is not valid (epoch < VALID_EPOCH_MIN) the peaks
 * keep accumulating under the current day and never reset; the first valid
 * date adopts the running peaks without clearing them.
 *
 * New peaks only mark the record dirty; flush() writes it to the store.
 */
class DailyPeakTracker : public PeakBaseline {
public:
    explicit DailyPeakTracker(PeakStore* store = nullptr);

    void    setUtcOffsetMinutes(int32_t minutes);
    int32_t utcOffsetMinutes() const { return _utcOffsetMin; }

    // Restore from the store, then apply the day rule for @p epochSec.
    // With an invalid epoch the stored record is held aside and only merged
    // once the first valid epoch shows it belongs to today.
    bool begin(uint32_t epochSec);

    // Returns true when a new peak was recorded.
    bool observe(uint8_t channel, float powerW, float voltageV, uint32_t epochSec);

    // Apply the day rule without a sample. Returns true if peaks were reset.
    bool rollover(uint32_t epochSec);

    float todayPeakPower(uint8_t channel) const override;
    float todayPeakVoltage(uint8_t channel) const override;

    int32_t           currentDay() const { return _rec.day; }
    const PeakRecord& record() const     { return _rec; }
    bool              dirty() const      { return _dirty; }
    bool              restorePending() const { return _hasPending; }

    bool flush();

    static bool    isValidEpoch(uint32_t epochSec);
    static int32_t dayNumber(uint32_t epochSec, int32_t utcOffsetMin);

private:
    PeakStore* _store;
    PeakRecord _rec;
    int32_t    _utcOffsetMin;
    bool       _dirty;
    PeakRecord _pending;
    bool       _hasPending;
};

#endif // DAILY_PEAK_TRACKER_H
