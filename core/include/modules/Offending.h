#ifndef OFFENDING_MODULE_H
#define OFFENDING_MODULE_H

struct Agent;
struct KernelConfig;
struct SimulationContext;

// Phase 2: each Criminal agent offends with
//   p = clamp(base_rate + 0.25 * capital + 0.10 * peerShare)
// and every agent appends today's flag to its evidence window.
class OffendingModule {
public:
    void configure(const KernelConfig& cfg);
    void generateCrimes(SimulationContext& ctx) const;

    double offenceProbability(const Agent& agent, double peerShare) const;

private:
    double base_rate_ = 0.05;
};

#endif
