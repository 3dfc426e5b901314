#pragma once

#include <optional>
#include <string>

namespace fw {

// Parses a sysfs thermal reading in millidegrees ("48312\n" -> 48.3). nullopt if not a number
std::optional<double> ParseMillidegrees(const std::string& text);

// Reads /sys/class/thermal/thermal_zone*/temp style files. nullopt when missing or unreadable
std::optional<double> ReadCpuTemperature(const std::string& path);

// Used memory in MB from /proc/meminfo text: (MemTotal - MemAvailable) / 1024.
// nullopt when either line is missing
std::optional<double> ParseMeminfoUsedMb(const std::string& text);

std::optional<double> ReadUsedMemoryMb(const std::string& path = "/proc/meminfo");

} // namespace fw
