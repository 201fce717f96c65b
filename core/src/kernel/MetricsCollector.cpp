#include "kernel/MetricsCollector.h"

#include <utility>

#include "kernel/SimulationContext.h"

TickMetrics MetricsCollector::sample(const SimulationContext& ctx) {
    TickMetrics m;
    m.day = ctx.tick;
    m.population = static_cast<std::uint32_t>(ctx.agents.size());

    for (const auto& agent : ctx.agents) {
        m.status_counts[toIndex(agent.status)]++;
    }

    const auto& c = ctx.counters;
    m.crime_events = c.crime_events;
    m.arrests = c.arrests;
    m.wrongful_detentions = c.wrongful_detentions;
    m.detention_exits = c.detention_exits;
    m.convictions = c.convictions;
    m.detention_releases = c.detention_releases;
    m.prison_releases = c.prison_releases;
    m.rewired_events = c.rewired_events;
    m.congestion_relief = c.congestion_relief;
    m.edge_count = ctx.network.edgeCount();
    return m;
}

std::vector<TickMetrics> MetricsCollector::release() {
    std::vector<TickMetrics> out = std::move(records_);
    records_.clear();
    return out;
}
