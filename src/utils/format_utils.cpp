#include "format_utils.h"

#include <iomanip>
#include <sstream>

namespace utils {

std::string human_readable_size(std::uintmax_t size_bytes) {
    static const char* units[] = { "B", "KB", "MB", "GB", "TB" };

    double size = (double)size_bytes;
    const char* unit = "PB";
    for (const char* u : units) {
        if (size < 1024.0) {
            unit = u;
            break;
        }
        size /= 1024.0;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << unit;
    return oss.str();
}

std::string format_percentage(std::uintmax_t part, std::uintmax_t whole) {
    double pct = whole == 0 ? 0.0 : (double)part / (double)whole * 100.0;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << pct;
    return oss.str();
}

} // namespace utils
