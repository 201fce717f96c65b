#ifndef REPLICATES_H
#define REPLICATES_H

#include <array>
#include <cstdint>
#include <vector>

#include "kernel/Kernel.h"

// ---------- Replicate Runs ----------
// Independent kernels (one per config) run in parallel with OpenMP. Each run
// owns its own context and RNG, so results match serial execution exactly.

using MetricsSeries = std::vector<TickMetrics>;

// Worker threads available to runReplicates
int replicateThreadCount();

// Runs every config over its full horizon; output order matches input order.
// All configs are validated before any run starts.
std::vector<MetricsSeries> runReplicates(const std::vector<KernelConfig>& configs);

// `steps` evenly spaced coercive capacities in [lo, hi] (steps == 1 gives lo)
std::vector<KernelConfig> coerciveSweep(const KernelConfig& base, double lo, double hi,
                                        std::uint32_t steps);

// `count` copies of base with seeds base.seed, base.seed + 1, ...
std::vector<KernelConfig> seedReplicates(const KernelConfig& base, std::uint32_t count);

struct SeriesSummary {
    std::uint64_t days = 0;
    std::uint64_t crimeEvents = 0;
    std::uint64_t arrests = 0;
    std::uint64_t wrongfulDetentions = 0;
    std::uint64_t detentionExits = 0;
    std::uint64_t convictions = 0;
    std::uint64_t releases = 0;
    std::array<double, kStatusCount> meanShares{};

    // wrongful / arrests, 0 when nobody was arrested
    double wrongfulRate() const {
        return arrests ? static_cast<double>(wrongfulDetentions) / static_cast<double>(arrests) : 0.0;
    }
};

SeriesSummary summarize(const MetricsSeries& series);

#endif
