#ifndef NVS_PEAK_STORE_H
#define NVS_PEAK_STORE_H

#include <DailyPeakTracker.hpp>

// PeakStore backed by the config namespace (PEAK_*_KEY).
class NvsPeakStore : public PeakStore {
public:
    bool load(PeakRecord& out) override;
    bool save(const PeakRecord& rec) override;
};

#endif // NVS_PEAK_STORE_H
