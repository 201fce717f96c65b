#include "modules/Offending.h"

#include "kernel/Kernel.h"

void OffendingModule::configure(const KernelConfig& cfg) {
    base_rate_ = cfg.crimeBaseRate;
}

double OffendingModule::offenceProbability(const Agent& agent, double peerShare) const {
    return clamp01(base_rate_
                   + TuningConstants::kCapitalCrimeWeight * agent.criminal_capital
                   + TuningConstants::kPeerCrimeWeight * peerShare);
}

void OffendingModule::generateCrimes(SimulationContext& ctx) const {
    for (auto& agent : ctx.agents) {
        bool crime = false;
        if (agent.status == LegalStatus::Criminal) {
            crime = ctx.uniform() < offenceProbability(agent, ctx.peer_share[agent.id]);
            if (crime) {
                ctx.counters.crime_events++;
            }
        }
        // Non-offenders still push a zero so every window stays aligned by day
        agent.crime_history.push(crime);
    }
}
