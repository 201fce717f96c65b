#ifndef JUDICIARY_MODULE_H
#define JUDICIARY_MODULE_H

#include <cstdint>

struct Agent;
class CrimeHistory;
struct KernelConfig;
struct SimulationContext;

/**
 * Phases 4 and 5: custody countdowns, trial outcomes and sentence release.
 *
 * Custody entered during the current tick is not counted down until the
 * next tick. Each trial outcome or release adds one criminal-capital increment:
 *   acquittal       -> + detention increment
 *   conviction      -> + prison increment
 *   prison release  -> + release increment
 */
class JudiciaryModule {
public:
    void configure(const KernelConfig& cfg);

    // Phase 4: Detained agents whose countdown expires stand trial
    void processDetentions(SimulationContext& ctx) const;

    // Phase 5: Prison agents whose sentence expires return AtRisk,
    // then the congestion policy is evaluated once
    void processPrison(SimulationContext& ctx) const;

    // 0.35 + 0.65 * clamp(crimes / max(1, 0.15 * window))
    double evidenceStrength(const CrimeHistory& history) const;
    double convictionProbability(const Agent& agent) const;

    // Remaining sentence after a one-off congestion cut (never below 1 day)
    std::int32_t shortenedSentence(std::int32_t remaining) const;

private:
    double forensic_ = 0.70;
    double conviction_base_ = 0.60;
    double sentence_mean_ = 180.0;
    double window_days_ = 30.0;

    double detention_capital_ = 0.15;
    double prison_capital_ = 0.20;
    double release_capital_ = 0.05;

    double sentence_congestion_ = 0.0;
    double congestion_threshold_ = 1.0;
    double congestion_shortening_ = 0.0;

    static void addCapital(Agent& agent, double increment);
};

#endif
