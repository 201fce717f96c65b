#ifndef STATE_MACHINE_H
#define STATE_MACHINE_H

#include <cstdint>
#include <stdexcept>
#include "kernel/Agent.h"

/**
 * Legal status state machine
 *
 *   Lawful   -> AtRisk | Detained
 *   AtRisk   -> Criminal | Lawful | Detained
 *   Criminal -> Detained
 *   Detained -> Prison | AtRisk
 *   Prison   -> AtRisk
 *
 * Every status change in the kernel goes through applyTransition() or
 * enterCustody(); anything else is an internal logic error.
 */

const char* statusName(LegalStatus s);

// Detained or Prison
bool isInCustody(LegalStatus s);

bool isTransitionPermitted(LegalStatus from, LegalStatus to);

class TransitionError : public std::logic_error {
public:
    TransitionError(std::uint32_t agentId, LegalStatus from, LegalStatus to);

    std::uint32_t agentId() const { return agent_id_; }
    LegalStatus from() const { return from_; }
    LegalStatus to() const { return to_; }

private:
    std::uint32_t agent_id_;
    LegalStatus from_;
    LegalStatus to_;
};

// Move an agent to a non-custodial status. Clears the custody countdown.
void applyTransition(Agent& agent, LegalStatus to);

// Move an agent into Detained or Prison for `days` (> 0) starting at `tick`.
void enterCustody(Agent& agent, LegalStatus to, std::int32_t days, std::uint64_t tick);

#endif
