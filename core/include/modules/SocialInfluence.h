#ifndef SOCIAL_INFLUENCE_MODULE_H
#define SOCIAL_INFLUENCE_MODULE_H

struct Agent;
struct KernelConfig;
struct SimulationContext;

/**
 * Phase 1: peer-driven escalation.
 *
 *   propensity = clamp(base + w_peer * peerShare + 0.25 * stigma + 0.35 * capital)
 *
 * Lawful agents become AtRisk once propensity reaches the risk threshold;
 * AtRisk agents turn Criminal with probability = propensity, otherwise may
 * decay back to Lawful. peerShare comes from the tick-start snapshot, so the
 * iteration order never leaks into the same tick. One step per agent per tick.
 */
class SocialInfluenceModule {
public:
    void configure(const KernelConfig& cfg);
    void updateAgents(SimulationContext& ctx) const;

    double propensity(const Agent& agent, double peerShare) const;

private:
    double peer_weight_ = 0.35;
    double risk_threshold_ = 0.30;
    double decay_prob_ = 0.0;
};

#endif
