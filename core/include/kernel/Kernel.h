#ifndef KERNEL_H
#define KERNEL_H

#include <array>
#include <vector>
#include <cstdint>
#include "kernel/Agent.h"
#include "kernel/MetricsCollector.h"
#include "kernel/SimulationContext.h"
#include "kernel/SocialNetwork.h"
#include "modules/SocialInfluence.h"
#include "modules/Offending.h"
#include "modules/Policing.h"
#include "modules/Judiciary.h"
#include "modules/Rewiring.h"

// ---------- Tuning Constants ----------
// Fixed model coefficients (not exposed as configuration).
// Changing these affects simulation outcomes - document rationale for any changes.
namespace TuningConstants {
    // Propensity heterogeneity: clamp(Normal(mean, std), 0, 1)
    constexpr double kPropensityMean = 0.15;
    constexpr double kPropensityStd = 0.05;

    // Escalation propensity weights
    constexpr double kStigmaWeight = 0.25;
    constexpr double kCapitalWeight = 0.35;

    // Daily offending probability weights
    constexpr double kCapitalCrimeWeight = 0.25;
    constexpr double kPeerCrimeWeight = 0.10;

    // Evidence proxy: floor + span * clamp(crimes / max(1, window * saturation))
    constexpr double kEvidenceFloor = 0.35;
    constexpr double kEvidenceSpan = 0.65;
    constexpr double kEvidenceSaturation = 0.15;

    // Rewiring: draws allowed per requested new tie
    constexpr std::uint32_t kRewireDrawsPerTie = 5;
}

// ---------- Configuration ----------
struct KernelConfig {
    // Population & network
    std::uint32_t population = 500;
    std::uint32_t attachment = 3;        // m for Barabasi-Albert
    std::uint64_t seed = 42;
    std::uint32_t horizonDays = 365;     // ticks executed by run()

    // Initial states
    double initialCriminalShare = 0.05;
    double initialAtRiskShare = 0.20;

    // Behaviour
    double peerInfluenceWeight = 0.35;
    double riskThreshold = 0.30;         // Lawful -> AtRisk propensity threshold
    double atRiskDecayProb = 0.0;        // AtRisk -> Lawful per tick (0 = off)
    double crimeBaseRate = 0.05;

    // Institutions
    double coerciveCapacity = 0.03;      // arrest attempts per capita per day
    double forensicCapacity = 0.70;      // targeting accuracy & evidence quality
    double detentionDaysMean = 30.0;
    double convictionBaseProb = 0.60;
    double prisonSentenceDaysMean = 180.0;

    // Criminogenic effects
    double detentionStigmaIncrement = 0.10;
    double detentionCapitalIncrement = 0.15;
    double prisonCapitalIncrement = 0.20;
    double prisonReleaseCapitalIncrement = 0.05;

    // Congestion
    double sentenceCongestionStrength = 0.0;  // new sentences *= 1 - s * prisonShare
    double congestionThreshold = 1.0;         // prison share that triggers relief
    double congestionShortening = 0.0;        // fraction cut from remaining sentences

    // Evidence window & rewiring
    std::uint32_t evidenceWindowDays = 30;
    bool rewiringEnabled = true;
    double dropLawfulEdgeProb = 0.20;
    double addCriminalEdgeProb = 0.25;
    std::uint32_t maxNewEdgesPerEvent = 3;
};

// Throws std::invalid_argument describing the first invalid field.
void validateConfig(const KernelConfig& cfg);

// ---------- Kernel Engine ----------
class Kernel {
public:
    explicit Kernel(const KernelConfig& cfg);

    // Lifecycle
    void reset(const KernelConfig& cfg);
    void step();
    void stepN(int n);
    void run();   // step until generation() == horizonDays

    // Access
    const std::vector<Agent>& agents() const { return ctx_.agents; }
    const SocialNetwork& network() const { return ctx_.network; }
    const KernelConfig& config() const { return cfg_; }
    std::uint64_t generation() const { return ctx_.tick; }

    const MetricsCollector& metrics() const { return collector_; }
    MetricsCollector& metricsMut() { return collector_; }

    // Aggregate of the current state (no event counters before the first tick)
    TickMetrics computeMetrics() const { return MetricsCollector::sample(ctx_); }

    // Detailed Statistics (for probing/analysis)
    struct Statistics {
        std::uint32_t totalAgents = 0;
        std::array<std::uint32_t, kStatusCount> statusCounts{};

        double avgStigma = 0.0;
        double avgCriminalCapital = 0.0;
        double avgBasePropensity = 0.0;
        double maxCriminalCapital = 0.0;

        // Custody
        double avgRemainingDetention = 0.0;
        double avgRemainingSentence = 0.0;

        // Network
        std::size_t edgeCount = 0;
        double avgConnections = 0.0;
        std::size_t maxDegree = 0;
        std::uint32_t isolatedAgents = 0;

        // Evidence window
        double avgWindowCrimes = 0.0;

        // Run totals
        std::uint64_t totalArrests = 0;
        std::uint64_t totalWrongful = 0;
        std::uint64_t totalConvictions = 0;
        std::uint64_t totalCrimeEvents = 0;
    };
    Statistics getStatistics() const;

private:
    void initAgents();
    void buildNetwork();

    KernelConfig cfg_;
    SimulationContext ctx_;
    MetricsCollector collector_;

    SocialInfluenceModule influence_;
    OffendingModule offending_;
    PolicingModule policing_;
    JudiciaryModule judiciary_;
    RewiringModule rewiring_;
};

#endif // KERNEL_H
