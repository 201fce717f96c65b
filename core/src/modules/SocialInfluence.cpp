#include "modules/SocialInfluence.h"

#include "kernel/Kernel.h"
#include "kernel/StateMachine.h"
#include "utils/Validation.h"

void SocialInfluenceModule::configure(const KernelConfig& cfg) {
    peer_weight_ = cfg.peerInfluenceWeight;
    risk_threshold_ = cfg.riskThreshold;
    decay_prob_ = cfg.atRiskDecayProb;
}

double SocialInfluenceModule::propensity(const Agent& agent, double peerShare) const {
    return clamp01(agent.base_propensity
                   + peer_weight_ * peerShare
                   + TuningConstants::kStigmaWeight * agent.stigma
                   + TuningConstants::kCapitalWeight * agent.criminal_capital);
}

void SocialInfluenceModule::updateAgents(SimulationContext& ctx) const {
    for (auto& agent : ctx.agents) {
        const LegalStatus before = ctx.status_snapshot[agent.id];
        if (before != LegalStatus::Lawful && before != LegalStatus::AtRisk) continue;

        const double p = propensity(agent, ctx.peer_share[agent.id]);
        validation::checkUnitInterval(p, "SocialInfluenceModule::propensity");

        if (before == LegalStatus::Lawful) {
            if (p >= risk_threshold_) {
                applyTransition(agent, LegalStatus::AtRisk);
            }
            continue;
        }

        if (ctx.uniform() < p) {
            applyTransition(agent, LegalStatus::Criminal);
        } else if (decay_prob_ > 0.0 && ctx.uniform() < decay_prob_) {
            applyTransition(agent, LegalStatus::Lawful);
        }
    }
}
