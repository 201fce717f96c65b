#include "kernel/StateMachine.h"

#include <string>

const char* statusName(LegalStatus s) {
    switch (s) {
        case LegalStatus::Lawful:   return "LAWFUL";
        case LegalStatus::AtRisk:   return "AT_RISK";
        case LegalStatus::Criminal: return "CRIMINAL";
        case LegalStatus::Detained: return "DETAINED";
        case LegalStatus::Prison:   return "PRISON";
        case LegalStatus::COUNT:    break;
    }
    return "UNKNOWN";
}

bool isInCustody(LegalStatus s) {
    return s == LegalStatus::Detained || s == LegalStatus::Prison;
}

bool isTransitionPermitted(LegalStatus from, LegalStatus to) {
    switch (from) {
        case LegalStatus::Lawful:
            return to == LegalStatus::AtRisk || to == LegalStatus::Detained;
        case LegalStatus::AtRisk:
            return to == LegalStatus::Criminal || to == LegalStatus::Lawful ||
                   to == LegalStatus::Detained;
        case LegalStatus::Criminal:
            return to == LegalStatus::Detained;
        case LegalStatus::Detained:
            return to == LegalStatus::Prison || to == LegalStatus::AtRisk;
        case LegalStatus::Prison:
            return to == LegalStatus::AtRisk;
        case LegalStatus::COUNT:
            break;
    }
    return false;
}

TransitionError::TransitionError(std::uint32_t agentId, LegalStatus from, LegalStatus to)
    : std::logic_error("illegal transition for agent " + std::to_string(agentId) + ": " +
                       statusName(from) + " -> " + statusName(to)),
      agent_id_(agentId), from_(from), to_(to) {}

void applyTransition(Agent& agent, LegalStatus to) {
    if (isInCustody(to)) {
        throw std::logic_error("applyTransition: custody entry for agent " + std::to_string(agent.id) +
                               " needs a duration (use enterCustody)");
    }
    if (!isTransitionPermitted(agent.status, to)) {
        throw TransitionError(agent.id, agent.status, to);
    }
    agent.status = to;
    agent.remaining_days = 0;
}

void enterCustody(Agent& agent, LegalStatus to, std::int32_t days, std::uint64_t tick) {
    if (!isInCustody(to) || !isTransitionPermitted(agent.status, to)) {
        throw TransitionError(agent.id, agent.status, to);
    }
    if (days <= 0) {
        throw std::logic_error("enterCustody: agent " + std::to_string(agent.id) + " entering " +
                               statusName(to) + " with non-positive duration " + std::to_string(days));
    }
    agent.status = to;
    agent.remaining_days = days;
    agent.entered_tick = tick;
}
