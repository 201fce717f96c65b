#include "modules/Policing.h"

#include <cmath>
#include <limits>
#include <random>

#include "kernel/Kernel.h"
#include "kernel/StateMachine.h"
#include "utils/Validation.h"

void PolicingModule::configure(const KernelConfig& cfg) {
    coercive_ = cfg.coerciveCapacity;
    forensic_ = cfg.forensicCapacity;
    detention_mean_ = cfg.detentionDaysMean;
    stigma_increment_ = cfg.detentionStigmaIncrement;
    criminals_.clear();
    non_criminals_.clear();
}

std::uint32_t PolicingModule::attemptsPerDay(std::uint32_t population) const {
    constexpr std::uint32_t kMax = std::numeric_limits<std::uint32_t>::max();
    const double attempts = std::floor(coercive_ * static_cast<double>(population));
    if (!(attempts > 0.0)) return 0;
    if (attempts >= static_cast<double>(kMax)) return kMax;
    return static_cast<std::uint32_t>(attempts);
}

void PolicingModule::runArrests(SimulationContext& ctx) {
    const std::uint32_t attempts = attemptsPerDay(static_cast<std::uint32_t>(ctx.agents.size()));
    if (attempts == 0) return;

    criminals_.clear();
    non_criminals_.clear();
    for (const auto& agent : ctx.agents) {
        if (agent.status == LegalStatus::Criminal) {
            criminals_.push_back(agent.id);
        } else if (agent.status == LegalStatus::Lawful || agent.status == LegalStatus::AtRisk) {
            non_criminals_.push_back(agent.id);
        }
    }

    for (std::uint32_t k = 0; k < attempts; ++k) {
        std::uint32_t target;
        if (ctx.uniform() < forensic_ && !criminals_.empty()) {
            std::uniform_int_distribution<std::size_t> pick(0, criminals_.size() - 1);
            target = criminals_[pick(ctx.rng)];
        } else {
            if (non_criminals_.empty()) continue;
            std::uniform_int_distribution<std::size_t> pick(0, non_criminals_.size() - 1);
            target = non_criminals_[pick(ctx.rng)];
        }

        Agent& agent = ctx.agents[target];
        if (isInCustody(agent.status)) continue;   // already arrested this phase

        // Ground truth at arrest time decides wrongfulness, not the pool label
        const bool wrongful = agent.status != LegalStatus::Criminal;

        enterCustody(agent, LegalStatus::Detained, drawDurationDays(ctx.rng, detention_mean_), ctx.tick);

        const double before = agent.stigma;
        agent.stigma = clamp01(agent.stigma + stigma_increment_);
        validation::checkNonDecreasing(before, agent.stigma, "PolicingModule stigma");

        ctx.counters.arrests++;
        if (wrongful) ctx.counters.wrongful_detentions++;
        ctx.rewire_queue.push_back(target);
    }
}
