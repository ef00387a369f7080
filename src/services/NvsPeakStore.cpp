#include <NvsPeakStore.hpp>
#include <NVSManager.hpp>

bool NvsPeakStore::load(PeakRecord& out) {
    const int day = CONF->GetInt(PEAK_DAY_KEY, -1);
    if (day < 0) return false;

    out.day        = day;
    out.power[0]   = CONF->GetFloat(PEAK_P1_KEY, 0.0f);
    out.power[1]   = CONF->GetFloat(PEAK_P2_KEY, 0.0f);
    out.voltage[0] = CONF->GetFloat(PEAK_V1_KEY, 0.0f);
    out.voltage[1] = CONF->GetFloat(PEAK_V2_KEY, 0.0f);
    DEBUG_PRINTF("[Peaks] Restored day %d: P=%.1f/%.1f W V=%.1f/%.1f V\n",
                 day, out.power[0], out.power[1], out.voltage[0], out.voltage[1]);
    return true;
}

bool NvsPeakStore::save(const PeakRecord& rec) {
    // Day is written last.
    bool ok = CONF->PutFloat(PEAK_P1_KEY, rec.power[0]);
    ok = CONF->PutFloat(PEAK_P2_KEY, rec.power[1]) && ok;
    ok = CONF->PutFloat(PEAK_V1_KEY, rec.voltage[0]) && ok;
    ok = CONF->PutFloat(PEAK_V2_KEY, rec.voltage[1]) && ok;
    ok = ok && CONF->PutInt(PEAK_DAY_KEY, rec.day);
    return ok;
}
