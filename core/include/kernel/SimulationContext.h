#ifndef SIMULATION_CONTEXT_H
#define SIMULATION_CONTEXT_H

#include <cstdint>
#include <random>
#include <vector>

#include "kernel/Agent.h"
#include "kernel/SocialNetwork.h"

// Event counters for the tick in progress; cleared at tick start.
struct TickCounters {
    std::uint32_t crime_events = 0;
    std::uint32_t arrests = 0;
    std::uint32_t wrongful_detentions = 0;
    std::uint32_t detention_exits = 0;
    std::uint32_t convictions = 0;
    std::uint32_t detention_releases = 0;
    std::uint32_t prison_releases = 0;
    std::uint32_t rewired_events = 0;
    bool congestion_relief = false;
};

/**
 * All mutable state of one simulation run.
 *
 * Phase functions receive the context explicitly; nothing lives in globals,
 * so independent replicates can run side by side in one process.
 */
struct SimulationContext {
    std::vector<Agent> agents;
    SocialNetwork network;
    std::mt19937_64 rng;
    std::uint64_t tick = 0;

    // Frozen at tick start (see captureSnapshot)
    std::vector<LegalStatus> status_snapshot;
    std::vector<double> peer_share;   // share of Criminal neighbors

    // Agents that entered custody this tick, in entry order
    std::vector<std::uint32_t> rewire_queue;

    TickCounters counters;

    // Prison share is above the congestion threshold (relief already applied)
    bool prison_congested = false;

    void captureSnapshot();
    std::uint32_t countInStatus(LegalStatus s) const;
    double uniform() { return uniform_(rng); }

private:
    std::uniform_real_distribution<double> uniform_{0.0, 1.0};
};

inline double clamp01(double value) {
    return value < 0.0 ? 0.0 : (value > 1.0 ? 1.0 : value);
}

// Custody duration: max(1, floor(Exp(mean)))
std::int32_t drawDurationDays(std::mt19937_64& rng, double meanDays);

#endif
