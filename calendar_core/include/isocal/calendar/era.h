#pragma once

namespace isocal::calendar {

/**
 * @brief ISO 纪元：公元前 (BC) 与公元 (AD)
 *
 * ISO 年份 1 为 AD 1，ISO 年份 0 为 BC 1，ISO 年份 -1 为 BC 2。
 */
enum class Era {
    BC = 0,
    AD = 1
};

inline const char* eraName(Era era) {
    return era == Era::AD ? "AD" : "BC";
}

} // namespace isocal::calendar
