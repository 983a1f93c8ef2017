#pragma once

#include <cstdint>
#include <string>

namespace wrc {

/// Decimal rendering with at most `digits` fraction digits and no
/// trailing zeros: 97.660 -> "97.66", 60.0 -> "60".
std::string formatDecimal(double value, int digits);

/// Byte count as kilobytes rounded to two places, e.g. "58.59 KB".
std::string formatKilobytes(uintmax_t bytes);

} // namespace wrc
