#include "kernel/SimulationContext.h"

#include <algorithm>
#include <cmath>

void SimulationContext::captureSnapshot() {
    const std::size_t n = agents.size();
    status_snapshot.resize(n);
    peer_share.assign(n, 0.0);

    for (std::size_t i = 0; i < n; ++i) {
        status_snapshot[i] = agents[i].status;
    }

    for (std::size_t i = 0; i < n; ++i) {
        const auto& nbrs = network.neighbors(static_cast<std::uint32_t>(i));
        if (nbrs.empty()) continue;
        std::size_t criminal = 0;
        for (std::uint32_t j : nbrs) {
            if (status_snapshot[j] == LegalStatus::Criminal) ++criminal;
        }
        peer_share[i] = static_cast<double>(criminal) / static_cast<double>(nbrs.size());
    }
}

std::uint32_t SimulationContext::countInStatus(LegalStatus s) const {
    return static_cast<std::uint32_t>(std::count_if(agents.begin(), agents.end(),
                                                    [s](const Agent& a) { return a.status == s; }));
}

std::int32_t drawDurationDays(std::mt19937_64& rng, double meanDays) {
    std::exponential_distribution<double> dist(1.0 / meanDays);
    // Cap keeps the cast defined for absurd tail draws
    const double days = std::min(std::floor(dist(rng)), 1.0e9);
    return std::max<std::int32_t>(1, static_cast<std::int32_t>(days));
}
