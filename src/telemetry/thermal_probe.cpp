#include "telemetry/thermal_probe.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace fw {

std::optional<double> ParseMillidegrees(const std::string& text) {
  std::istringstream iss(text);
  double milli = 0.0;
  if (!(iss >> milli) || !std::isfinite(milli)) return std::nullopt;

  // Round to one decimal in degrees
  return std::round(milli / 100.0) / 10.0;
}

std::optional<double> ReadCpuTemperature(const std::string& path) {
  std::ifstream in(path);
  if (!in) return std::nullopt;

  std::stringstream buf;
  buf << in.rdbuf();
  return ParseMillidegrees(buf.str());
}

std::optional<double> ParseMeminfoUsedMb(const std::string& text) {
  std::istringstream iss(text);
  std::string line;
  std::optional<double> total_kb;
  std::optional<double> available_kb;

  while (std::getline(iss, line)) {
    std::istringstream ls(line);
    std::string key;
    double kb = 0.0;
    if (!(ls >> key >> kb) || !std::isfinite(kb)) continue;

    if (key == "MemTotal:") total_kb = kb;
    else if (key == "MemAvailable:") available_kb = kb;
  }

  if (!total_kb || !available_kb) return std::nullopt;
  return (*total_kb - *available_kb) / 1024.0;
}

std::optional<double> ReadUsedMemoryMb(const std::string& path) {
  std::ifstream in(path);
  if (!in) return std::nullopt;

  std::stringstream buf;
  buf << in.rdbuf();
  return ParseMeminfoUsedMb(buf.str());
}

} // namespace fw
