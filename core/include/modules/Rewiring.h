#ifndef REWIRING_MODULE_H
#define REWIRING_MODULE_H

#include <cstdint>
#include <vector>

struct KernelConfig;
struct SimulationContext;

// Phase 6: network rewiring on custody entry.
// Drains SimulationContext::rewire_queue, so each entry into Detained or
// Prison rewires exactly once however long the stay lasts:
//   - each tie to a Lawful neighbor is dropped with dropLawfulEdgeProb
//   - up to maxNewEdgesPerEvent ties to random Criminal agents are added,
//     each draw accepted with addCriminalEdgeProb
class RewiringModule {
public:
    void configure(const KernelConfig& cfg);
    void applyPending(SimulationContext& ctx);
    void rewireAgent(SimulationContext& ctx, std::uint32_t agentId);

private:
    bool enabled_ = true;
    double drop_lawful_ = 0.20;
    double add_criminal_ = 0.25;
    std::uint32_t max_new_edges_ = 3;

    std::vector<std::uint32_t> scratch_neighbors_;
    std::vector<std::uint32_t> criminals_;
};

#endif
