#include "kernel/Kernel.h"
#include "kernel/StateMachine.h"
#include "utils/Validation.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>

void validateConfig(const KernelConfig& cfg) {
    using namespace validation;

    if (cfg.population == 0) {
        throw std::invalid_argument("population must be > 0 (got 0)");
    }
    if (cfg.attachment < 1 || cfg.attachment >= cfg.population) {
        throw std::invalid_argument("attachment must satisfy 1 <= m < population (got m=" +
                                    std::to_string(cfg.attachment) + ", population=" +
                                    std::to_string(cfg.population) + ")");
    }
    if (cfg.horizonDays == 0) {
        throw std::invalid_argument("horizonDays must be > 0 (got 0)");
    }
    if (cfg.evidenceWindowDays == 0) {
        throw std::invalid_argument("evidenceWindowDays must be > 0 (got 0)");
    }

    requireProbability(cfg.initialCriminalShare, "initialCriminalShare");
    requireProbability(cfg.initialAtRiskShare, "initialAtRiskShare");
    if (cfg.initialCriminalShare + cfg.initialAtRiskShare > 1.0) {
        throw std::invalid_argument("initialCriminalShare + initialAtRiskShare must be <= 1 (got " +
                                    describe(cfg.initialCriminalShare + cfg.initialAtRiskShare) + ")");
    }

    requireNonNegative(cfg.peerInfluenceWeight, "peerInfluenceWeight");
    requireProbability(cfg.riskThreshold, "riskThreshold");
    requireProbability(cfg.atRiskDecayProb, "atRiskDecayProb");
    requireProbability(cfg.crimeBaseRate, "crimeBaseRate");

    requireNonNegative(cfg.coerciveCapacity, "coerciveCapacity");
    constexpr double kMaxAttempts = static_cast<double>(std::numeric_limits<std::uint32_t>::max());
    if (cfg.coerciveCapacity * cfg.population > kMaxAttempts) {
        throw std::invalid_argument("coerciveCapacity * population must be <= " +
                                    std::to_string(std::numeric_limits<std::uint32_t>::max()) +
                                    " daily attempts (got " +
                                    describe(cfg.coerciveCapacity * cfg.population) + ")");
    }
    requireProbability(cfg.forensicCapacity, "forensicCapacity");
    requirePositive(cfg.detentionDaysMean, "detentionDaysMean");
    requireProbability(cfg.convictionBaseProb, "convictionBaseProb");
    requirePositive(cfg.prisonSentenceDaysMean, "prisonSentenceDaysMean");

    requireProbability(cfg.detentionStigmaIncrement, "detentionStigmaIncrement");
    requireProbability(cfg.detentionCapitalIncrement, "detentionCapitalIncrement");
    requireProbability(cfg.prisonCapitalIncrement, "prisonCapitalIncrement");
    requireProbability(cfg.prisonReleaseCapitalIncrement, "prisonReleaseCapitalIncrement");

    requireProbability(cfg.sentenceCongestionStrength, "sentenceCongestionStrength");
    requireProbability(cfg.congestionThreshold, "congestionThreshold");
    requireInRange(cfg.congestionShortening, 0.0, 0.99, "congestionShortening");

    requireProbability(cfg.dropLawfulEdgeProb, "dropLawfulEdgeProb");
    requireProbability(cfg.addCriminalEdgeProb, "addCriminalEdgeProb");
    constexpr std::uint32_t kMaxNewEdges =
        std::numeric_limits<std::uint32_t>::max() / TuningConstants::kRewireDrawsPerTie;
    if (cfg.maxNewEdgesPerEvent > kMaxNewEdges) {
        throw std::invalid_argument("maxNewEdgesPerEvent must be <= " + std::to_string(kMaxNewEdges) +
                                    " (got " + std::to_string(cfg.maxNewEdgesPerEvent) + ")");
    }
}

Kernel::Kernel(const KernelConfig& cfg) : cfg_(cfg) {
    reset(cfg);
}

void Kernel::reset(const KernelConfig& cfg) {
    // Nothing is touched until the new configuration is known to be valid
    validateConfig(cfg);

    cfg_ = cfg;
    ctx_ = SimulationContext{};
    ctx_.rng.seed(cfg_.seed);
    collector_.clear();
    collector_.reserve(cfg_.horizonDays);

    influence_.configure(cfg_);
    offending_.configure(cfg_);
    policing_.configure(cfg_);
    judiciary_.configure(cfg_);
    rewiring_.configure(cfg_);

    buildNetwork();
    initAgents();
}

void Kernel::buildNetwork() {
    ctx_.network.buildBarabasiAlbert(cfg_.population, cfg_.attachment, ctx_.rng);
}

void Kernel::initAgents() {
    auto& agents = ctx_.agents;
    agents.clear();
    agents.reserve(cfg_.population);

    std::uniform_real_distribution<double> uniDist(0.0, 1.0);
    std::normal_distribution<double> propensityDist(TuningConstants::kPropensityMean,
                                                    TuningConstants::kPropensityStd);

    for (std::uint32_t i = 0; i < cfg_.population; ++i) {
        Agent a;
        a.id = i;

        const double u = uniDist(ctx_.rng);
        if (u < cfg_.initialCriminalShare) {
            a.status = LegalStatus::Criminal;
        } else if (u < cfg_.initialCriminalShare + cfg_.initialAtRiskShare) {
            a.status = LegalStatus::AtRisk;
        } else {
            a.status = LegalStatus::Lawful;
        }

        a.base_propensity = clamp01(propensityDist(ctx_.rng));
        a.crime_history.reset(cfg_.evidenceWindowDays);
        agents.push_back(std::move(a));
    }
}

void Kernel::step() {
    ++ctx_.tick;
    ctx_.counters = TickCounters{};
    ctx_.captureSnapshot();

    // Fixed phase order; reordering changes the dynamics
    influence_.updateAgents(ctx_);          // 1. social influence
    offending_.generateCrimes(ctx_);        // 2. crime generation
    policing_.runArrests(ctx_);             // 3. policing / targeting
    judiciary_.processDetentions(ctx_);     // 4. detention -> trial outcome
    judiciary_.processPrison(ctx_);         // 5. sentences & congestion
    rewiring_.applyPending(ctx_);           // 6. rewiring on custody entry

    collector_.append(MetricsCollector::sample(ctx_));   // 7. metrics
}

void Kernel::stepN(int n) {
    for (int i = 0; i < n; ++i) {
        step();
    }
}

void Kernel::run() {
    while (ctx_.tick < cfg_.horizonDays) {
        step();
    }
}

Kernel::Statistics Kernel::getStatistics() const {
    Statistics stats;
    const auto& agents = ctx_.agents;
    stats.totalAgents = static_cast<std::uint32_t>(agents.size());

    double stigmaSum = 0.0;
    double capitalSum = 0.0;
    double propensitySum = 0.0;
    double detentionSum = 0.0;
    double sentenceSum = 0.0;
    std::uint64_t windowCrimes = 0;
    std::size_t degreeSum = 0;

    for (const auto& agent : agents) {
        stats.statusCounts[toIndex(agent.status)]++;
        stigmaSum += agent.stigma;
        capitalSum += agent.criminal_capital;
        propensitySum += agent.base_propensity;
        stats.maxCriminalCapital = std::max(stats.maxCriminalCapital, agent.criminal_capital);
        windowCrimes += agent.crime_history.count();

        if (agent.status == LegalStatus::Detained) detentionSum += agent.remaining_days;
        if (agent.status == LegalStatus::Prison) sentenceSum += agent.remaining_days;

        const std::size_t deg = ctx_.network.degree(agent.id);
        degreeSum += deg;
        stats.maxDegree = std::max(stats.maxDegree, deg);
        if (deg == 0) stats.isolatedAgents++;
    }

    if (stats.totalAgents > 0) {
        const double n = static_cast<double>(stats.totalAgents);
        stats.avgStigma = stigmaSum / n;
        stats.avgCriminalCapital = capitalSum / n;
        stats.avgBasePropensity = propensitySum / n;
        stats.avgConnections = static_cast<double>(degreeSum) / n;
        stats.avgWindowCrimes = static_cast<double>(windowCrimes) / n;
    }

    const auto detained = stats.statusCounts[toIndex(LegalStatus::Detained)];
    const auto imprisoned = stats.statusCounts[toIndex(LegalStatus::Prison)];
    if (detained > 0) stats.avgRemainingDetention = detentionSum / detained;
    if (imprisoned > 0) stats.avgRemainingSentence = sentenceSum / imprisoned;

    stats.edgeCount = ctx_.network.edgeCount();

    for (const auto& m : collector_) {
        stats.totalArrests += m.arrests;
        stats.totalWrongful += m.wrongful_detentions;
        stats.totalConvictions += m.convictions;
        stats.totalCrimeEvents += m.crime_events;
    }
    return stats;
}
