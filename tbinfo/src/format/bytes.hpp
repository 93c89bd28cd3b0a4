#pragma once

#include <cstdint>
#include <string>

namespace tbinfo {

// Formats a quantity given in KiB with binary units and one decimal:
// 1023.9 -> "1023.9 KiB", 1024 -> "1.0 MiB". Values past YiB stay in YiB.
std::string formatKib(double kib);

// Same for a raw byte count.
std::string formatBytes(std::uint64_t bytes);

} // namespace tbinfo
