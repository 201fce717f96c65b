#ifndef KERNEL_SNAPSHOT_H
#define KERNEL_SNAPSHOT_H

#include "kernel/Kernel.h"
#include <string>
#include <vector>
#include <iosfwd>

// JSON export for kernel state
std::string kernelToJson(const Kernel& kernel, bool includeAgents = false);

// CSV metrics series: header + one row per day
std::string metricsCsvHeader();
void logMetrics(const TickMetrics& m, std::ostream& out);
void writeMetricsCsv(const std::vector<TickMetrics>& series, std::ostream& out);

// 0.55 -> "0p55" (safe for file names)
std::string fileSafeNumber(double value);

// "<timestamp>__n500__m3__fc0p55__cc0p04__det45__evw30" (timestamp omitted if empty)
std::string buildRunFileStem(const KernelConfig& cfg, const std::string& timestamp);

// Writes <prefix>.csv (series) and <prefix>.yml (exact parameters, readConfigFile() format).
// Throws std::runtime_error if either file cannot be written.
void exportRun(const Kernel& kernel, const std::string& prefix);

#endif
