#include "bytes.hpp"

#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace tbinfo {

namespace {

constexpr std::array<const char *, 8> kUnits = {"KiB", "MiB", "GiB", "TiB", "PiB", "EiB", "ZiB", "YiB"};

std::string render(double value, const char *unit) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << ' ' << unit;
    return oss.str();
}

} // namespace

std::string formatKib(double kib) {
    double num = kib;
    for (std::size_t i = 0; i + 1 < kUnits.size(); ++i) {
        if (std::fabs(num) < 1024.0) return render(num, kUnits[i]);
        num /= 1024.0;
    }
    return render(num, kUnits.back());
}

std::string formatBytes(std::uint64_t bytes) {
    return formatKib(static_cast<double>(bytes) / 1024.0);
}

} // namespace tbinfo
