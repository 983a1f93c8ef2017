#include "util/format.hpp"
#include "quality/quality_policy.hpp"
#include <iomanip>
#include <sstream>

namespace wrc {

std::string formatDecimal(double value, int digits) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(digits) << roundTo(value, digits);
    std::string text = oss.str();

    if (text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') text.pop_back();
        if (!text.empty() && text.back() == '.') text.pop_back();
    }
    if (text == "-0") text = "0";
    return text;
}

std::string formatKilobytes(uintmax_t bytes) {
    return formatDecimal(static_cast<double>(bytes) / 1024.0, 2) + " KB";
}

} // namespace wrc
