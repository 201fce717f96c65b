#ifndef METRICS_COLLECTOR_H
#define METRICS_COLLECTOR_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "kernel/Agent.h"

struct SimulationContext;

// One simulated day. Produced once by MetricsCollector::sample and never
// modified afterwards (the collector only hands out const access).
struct TickMetrics {
    std::uint64_t day = 0;
    std::uint32_t population = 0;

    std::array<std::uint32_t, kStatusCount> status_counts{};

    std::uint32_t crime_events = 0;
    std::uint32_t arrests = 0;
    std::uint32_t wrongful_detentions = 0;
    std::uint32_t detention_exits = 0;
    std::uint32_t convictions = 0;
    std::uint32_t detention_releases = 0;
    std::uint32_t prison_releases = 0;

    std::uint32_t rewired_events = 0;
    std::size_t edge_count = 0;
    bool congestion_relief = false;

    std::uint32_t count(LegalStatus s) const { return status_counts[toIndex(s)]; }
    double share(LegalStatus s) const {
        return population ? static_cast<double>(count(s)) / population : 0.0;
    }
    std::uint32_t releases() const { return detention_releases + prison_releases; }
};

/**
 * Ordered, re-iterable series of TickMetrics for one run.
 *
 * Output writers read the series through records()/begin()/end() as often as
 * they like; release() hands the whole series over at run end.
 */
class MetricsCollector {
public:
    using const_iterator = std::vector<TickMetrics>::const_iterator;

    // Aggregate the context after the last phase of a tick
    static TickMetrics sample(const SimulationContext& ctx);

    void append(const TickMetrics& m) { records_.push_back(m); }
    void clear() { records_.clear(); }
    void reserve(std::size_t n) { records_.reserve(n); }

    const std::vector<TickMetrics>& records() const { return records_; }
    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    const TickMetrics& back() const { return records_.back(); }
    const TickMetrics& operator[](std::size_t i) const { return records_[i]; }

    const_iterator begin() const { return records_.cbegin(); }
    const_iterator end() const { return records_.cend(); }

    // Move the series out; the collector is left empty
    std::vector<TickMetrics> release();

private:
    std::vector<TickMetrics> records_;
};

#endif
