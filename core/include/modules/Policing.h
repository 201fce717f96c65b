#ifndef POLICING_MODULE_H
#define POLICING_MODULE_H

#include <cstdint>
#include <vector>

struct KernelConfig;
struct SimulationContext;

/**
 * Phase 3: arrest targeting.
 *
 * floor(coercive * population) attempts per day. Each attempt picks the
 * Criminal pool with probability = forensic capacity (if it is non-empty),
 * otherwise a uniformly drawn Lawful/AtRisk agent. Pools are frozen at
 * phase start; an attempt that lands on someone already arrested today is
 * spent without effect. Empty pools simply produce no arrests.
 */
class PolicingModule {
public:
    void configure(const KernelConfig& cfg);
    void runArrests(SimulationContext& ctx);

    std::uint32_t attemptsPerDay(std::uint32_t population) const;

private:
    double coercive_ = 0.03;
    double forensic_ = 0.70;
    double detention_mean_ = 30.0;
    double stigma_increment_ = 0.10;

    // Scratch pools, reused across ticks
    std::vector<std::uint32_t> criminals_;
    std::vector<std::uint32_t> non_criminals_;
};

#endif
