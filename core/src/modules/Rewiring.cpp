#include "modules/Rewiring.h"

#include <algorithm>
#include <random>

#include "kernel/Kernel.h"
#include "utils/Validation.h"

void RewiringModule::configure(const KernelConfig& cfg) {
    enabled_ = cfg.rewiringEnabled;
    drop_lawful_ = cfg.dropLawfulEdgeProb;
    add_criminal_ = cfg.addCriminalEdgeProb;
    max_new_edges_ = cfg.maxNewEdgesPerEvent;
}

void RewiringModule::applyPending(SimulationContext& ctx) {
    if (enabled_) {
        for (std::uint32_t id : ctx.rewire_queue) {
            rewireAgent(ctx, id);
        }
    }
    ctx.rewire_queue.clear();
}

void RewiringModule::rewireAgent(SimulationContext& ctx, std::uint32_t agentId) {
    validation::checkIndex(agentId, ctx.agents.size(), "RewiringModule::rewireAgent");
    ctx.counters.rewired_events++;

    // Drop lawful ties; iterate a copy since removal edits the list
    scratch_neighbors_ = ctx.network.neighbors(agentId);
    for (std::uint32_t nbr : scratch_neighbors_) {
        if (ctx.agents[nbr].status == LegalStatus::Lawful && ctx.uniform() < drop_lawful_) {
            ctx.network.removeEdge(agentId, nbr);
        }
    }

    // Gain criminal ties
    criminals_.clear();
    std::uint64_t unlinked = 0;
    for (const auto& agent : ctx.agents) {
        if (agent.status == LegalStatus::Criminal && agent.id != agentId) {
            criminals_.push_back(agent.id);
            if (!ctx.network.hasEdge(agentId, agent.id)) ++unlinked;
        }
    }

    // Never ask for more ties than there are unlinked criminals
    const std::uint64_t wanted = std::min<std::uint64_t>(max_new_edges_, unlinked);
    if (wanted == 0) return;

    std::uniform_int_distribution<std::size_t> pick(0, criminals_.size() - 1);
    std::uint64_t added = 0;
    std::uint64_t draws = 0;
    const std::uint64_t maxDraws = wanted * TuningConstants::kRewireDrawsPerTie;
    while (added < wanted && draws < maxDraws) {
        ++draws;
        const std::uint32_t candidate = criminals_[pick(ctx.rng)];
        if (ctx.network.hasEdge(agentId, candidate)) continue;
        if (ctx.uniform() < add_criminal_ && ctx.network.addEdge(agentId, candidate)) {
            ++added;
        }
    }
}
