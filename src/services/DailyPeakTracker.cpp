#include <DailyPeakTracker.hpp>
#include <math.h>

#define UTC_OFFSET_LIMIT_MIN   (14 * 60)

DailyPeakTracker::DailyPeakTracker(PeakStore* store)
    : _store(store),
      _utcOffsetMin(DEFAULT_UTC_OFFSET_MIN),
      _dirty(false),
      _hasPending(false)
{
}

void DailyPeakTracker::setUtcOffsetMinutes(int32_t minutes) {
    if (minutes < -UTC_OFFSET_LIMIT_MIN || minutes > UTC_OFFSET_LIMIT_MIN) {
        minutes = DEFAULT_UTC_OFFSET_MIN;
    }
    _utcOffsetMin = minutes;
}

bool DailyPeakTracker::isValidEpoch(uint32_t epochSec) {
    return epochSec >= VALID_EPOCH_MIN;
}

int32_t DailyPeakTracker::dayNumber(uint32_t epochSec, int32_t utcOffsetMin) {
    const int64_t local = static_cast<int64_t>(epochSec) +
                          static_cast<int64_t>(utcOffsetMin) * 60;
    return static_cast<int32_t>(local / SECONDS_PER_DAY);
}

bool DailyPeakTracker::begin(uint32_t epochSec) {
    bool loaded = false;
    if (_store) {
        PeakRecord rec;
        if (_store->load(rec)) {
            loaded = true;
            if (isValidEpoch(epochSec)) {
                _rec = rec;
            } else {
                // Unknown date: the stored day cannot be trusted as today yet.
                _pending    = rec;
                _hasPending = true;
                _rec        = PeakRecord();
            }
        }
    }
    _dirty = false;
    rollover(epochSec);
    return loaded;
}

bool DailyPeakTracker::rollover(uint32_t epochSec) {
    if (!isValidEpoch(epochSec)) return false;

    const int32_t today = dayNumber(epochSec, _utcOffsetMin);
    if (_rec.day == today) return false;

    if (_rec.day < 0) {
        // First valid date: the peaks seen so far belong to today, plus the
        // restored record if it was written today.
        if (_hasPending && _pending.day == today) {
            for (uint8_t i = 0; i < LOAD_CHANNEL_COUNT; ++i) {
                if (_pending.power[i] > _rec.power[i])     _rec.power[i]   = _pending.power[i];
                if (_pending.voltage[i] > _rec.voltage[i]) _rec.voltage[i] = _pending.voltage[i];
            }
        }
        _hasPending = false;
        _rec.day = today;
        _dirty   = true;
        return false;
    }

    PeakRecord fresh;
    fresh.day = today;
    _rec      = fresh;
    _dirty    = true;
    return true;
}

bool DailyPeakTracker::observe(uint8_t channel, float powerW, float voltageV, uint32_t epochSec) {
    if (!isValidChannel(channel)) return false;
    rollover(epochSec);

    const uint8_t i = channel - 1;
    bool changed = false;
    if (isfinite(powerW) && powerW > _rec.power[i]) {
        _rec.power[i] = powerW;
        changed = true;
    }
    if (isfinite(voltageV) && voltageV > _rec.voltage[i]) {
        _rec.voltage[i] = voltageV;
        changed = true;
    }
    if (changed) _dirty = true;
    return changed;
}

float DailyPeakTracker::todayPeakPower(uint8_t channel) const {
    if (!isValidChannel(channel)) return 0.0f;
    return _rec.power[channel - 1];
}

float DailyPeakTracker::todayPeakVoltage(uint8_t channel) const {
    if (!isValidChannel(channel)) return 0.0f;
    return _rec.voltage[channel - 1];
}

bool DailyPeakTracker::flush() {
    if (!_dirty) return true;
    if (!_store) return false;
    // Never overwrite the stored record with an undated one.
    if (_hasPending && _rec.day < 0) return true;
    if (!_store->save(_rec)) return false;
    _dirty = false;
    return true;
}
