#include "modules/Judiciary.h"

#include <algorithm>
#include <cmath>

#include "kernel/Kernel.h"
#include "kernel/StateMachine.h"
#include "utils/Validation.h"

void JudiciaryModule::configure(const KernelConfig& cfg) {
    forensic_ = cfg.forensicCapacity;
    conviction_base_ = cfg.convictionBaseProb;
    sentence_mean_ = cfg.prisonSentenceDaysMean;
    window_days_ = static_cast<double>(cfg.evidenceWindowDays);

    detention_capital_ = cfg.detentionCapitalIncrement;
    prison_capital_ = cfg.prisonCapitalIncrement;
    release_capital_ = cfg.prisonReleaseCapitalIncrement;

    sentence_congestion_ = cfg.sentenceCongestionStrength;
    congestion_threshold_ = cfg.congestionThreshold;
    congestion_shortening_ = cfg.congestionShortening;
}

void JudiciaryModule::addCapital(Agent& agent, double increment) {
    const double before = agent.criminal_capital;
    agent.criminal_capital = clamp01(agent.criminal_capital + increment);
    validation::checkNonDecreasing(before, agent.criminal_capital, "JudiciaryModule capital");
}

double JudiciaryModule::evidenceStrength(const CrimeHistory& history) const {
    const double saturation = std::max(1.0, window_days_ * TuningConstants::kEvidenceSaturation);
    return TuningConstants::kEvidenceFloor +
           TuningConstants::kEvidenceSpan * clamp01(history.count() / saturation);
}

double JudiciaryModule::convictionProbability(const Agent& agent) const {
    // Evidence is a proxy: an innocent with a clean window can still be convicted
    return clamp01(conviction_base_ * forensic_ * evidenceStrength(agent.crime_history));
}

std::int32_t JudiciaryModule::shortenedSentence(std::int32_t remaining) const {
    const double cut = std::floor(static_cast<double>(remaining) * (1.0 - congestion_shortening_));
    return std::max<std::int32_t>(1, static_cast<std::int32_t>(cut));
}

void JudiciaryModule::processDetentions(SimulationContext& ctx) const {
    const double population = static_cast<double>(ctx.agents.size());
    std::uint32_t imprisoned = ctx.countInStatus(LegalStatus::Prison);

    for (auto& agent : ctx.agents) {
        if (agent.status != LegalStatus::Detained || agent.entered_tick == ctx.tick) continue;

        if (--agent.remaining_days > 0) continue;

        ctx.counters.detention_exits++;
        const bool convicted = ctx.uniform() < convictionProbability(agent);

        if (convicted) {
            std::int32_t sentence = drawDurationDays(ctx.rng, sentence_mean_);
            if (sentence_congestion_ > 0.0) {
                const double share = imprisoned / population;
                const double scaled = std::floor(sentence * (1.0 - sentence_congestion_ * share));
                sentence = std::max<std::int32_t>(1, static_cast<std::int32_t>(scaled));
            }
            enterCustody(agent, LegalStatus::Prison, sentence, ctx.tick);
            addCapital(agent, prison_capital_);
            ++imprisoned;
            ctx.counters.convictions++;
            ctx.rewire_queue.push_back(agent.id);
        } else {
            applyTransition(agent, LegalStatus::AtRisk);
            addCapital(agent, detention_capital_);
            ctx.counters.detention_releases++;
        }
    }
}

void JudiciaryModule::processPrison(SimulationContext& ctx) const {
    std::uint32_t imprisoned = 0;
    for (auto& agent : ctx.agents) {
        if (agent.status != LegalStatus::Prison) continue;
        if (agent.entered_tick == ctx.tick) {
            ++imprisoned;
            continue;
        }
        if (--agent.remaining_days > 0) {
            ++imprisoned;
            continue;
        }
        applyTransition(agent, LegalStatus::AtRisk);
        addCapital(agent, release_capital_);
        ctx.counters.prison_releases++;
    }

    // Congestion relief fires once per crossing and re-arms below the threshold
    const double share = static_cast<double>(imprisoned) / static_cast<double>(ctx.agents.size());
    if (share <= congestion_threshold_) {
        ctx.prison_congested = false;
        return;
    }
    if (ctx.prison_congested) return;

    ctx.prison_congested = true;
    ctx.counters.congestion_relief = true;
    for (auto& agent : ctx.agents) {
        if (agent.status == LegalStatus::Prison) {
            agent.remaining_days = shortenedSentence(agent.remaining_days);
        }
    }
}
