#include <gtest/gtest.h>
#include <string>
#include "kernel/StateMachine.h"

namespace {

Agent makeAgent(LegalStatus status) {
    Agent a;
    a.id = 7;
    a.status = status;
    return a;
}

} // namespace

TEST(StateMachineTest, PermittedTransitions) {
    using S = LegalStatus;
    EXPECT_TRUE(isTransitionPermitted(S::Lawful, S::AtRisk));
    EXPECT_TRUE(isTransitionPermitted(S::Lawful, S::Detained));
    EXPECT_TRUE(isTransitionPermitted(S::AtRisk, S::Criminal));
    EXPECT_TRUE(isTransitionPermitted(S::AtRisk, S::Lawful));
    EXPECT_TRUE(isTransitionPermitted(S::AtRisk, S::Detained));
    EXPECT_TRUE(isTransitionPermitted(S::Criminal, S::Detained));
    EXPECT_TRUE(isTransitionPermitted(S::Detained, S::Prison));
    EXPECT_TRUE(isTransitionPermitted(S::Detained, S::AtRisk));
    EXPECT_TRUE(isTransitionPermitted(S::Prison, S::AtRisk));

    EXPECT_FALSE(isTransitionPermitted(S::Lawful, S::Criminal));
    EXPECT_FALSE(isTransitionPermitted(S::Lawful, S::Prison));
    EXPECT_FALSE(isTransitionPermitted(S::Criminal, S::Lawful));
    EXPECT_FALSE(isTransitionPermitted(S::Criminal, S::AtRisk));
    EXPECT_FALSE(isTransitionPermitted(S::Detained, S::Lawful));
    EXPECT_FALSE(isTransitionPermitted(S::Prison, S::Lawful));
    EXPECT_FALSE(isTransitionPermitted(S::Prison, S::Detained));
    EXPECT_FALSE(isTransitionPermitted(S::Lawful, S::Lawful));
}

TEST(StateMachineTest, Names) {
    EXPECT_STREQ(statusName(LegalStatus::Lawful), "LAWFUL");
    EXPECT_STREQ(statusName(LegalStatus::AtRisk), "AT_RISK");
    EXPECT_STREQ(statusName(LegalStatus::Criminal), "CRIMINAL");
    EXPECT_STREQ(statusName(LegalStatus::Detained), "DETAINED");
    EXPECT_STREQ(statusName(LegalStatus::Prison), "PRISON");
    EXPECT_TRUE(isInCustody(LegalStatus::Detained));
    EXPECT_TRUE(isInCustody(LegalStatus::Prison));
    EXPECT_FALSE(isInCustody(LegalStatus::Criminal));
}

TEST(StateMachineTest, IllegalTransitionThrows) {
    Agent a = makeAgent(LegalStatus::Criminal);
    try {
        applyTransition(a, LegalStatus::Lawful);
        FAIL() << "expected TransitionError";
    } catch (const TransitionError& e) {
        EXPECT_EQ(e.agentId(), 7u);
        EXPECT_EQ(e.from(), LegalStatus::Criminal);
        EXPECT_EQ(e.to(), LegalStatus::Lawful);
        EXPECT_NE(std::string(e.what()).find("CRIMINAL -> LAWFUL"), std::string::npos);
    }
    EXPECT_EQ(a.status, LegalStatus::Criminal);
}

TEST(StateMachineTest, ApplyTransitionRejectsCustody) {
    Agent a = makeAgent(LegalStatus::Criminal);
    EXPECT_THROW(applyTransition(a, LegalStatus::Detained), std::logic_error);
    EXPECT_EQ(a.status, LegalStatus::Criminal);
}

TEST(StateMachineTest, EnterCustodySetsCountdown) {
    Agent a = makeAgent(LegalStatus::Lawful);
    enterCustody(a, LegalStatus::Detained, 12, 3);
    EXPECT_EQ(a.status, LegalStatus::Detained);
    EXPECT_EQ(a.remaining_days, 12);
    EXPECT_EQ(a.entered_tick, 3u);

    enterCustody(a, LegalStatus::Prison, 90, 15);
    EXPECT_EQ(a.status, LegalStatus::Prison);
    EXPECT_EQ(a.remaining_days, 90);

    applyTransition(a, LegalStatus::AtRisk);
    EXPECT_EQ(a.remaining_days, 0);
}

TEST(StateMachineTest, EnterCustodyErrors) {
    Agent a = makeAgent(LegalStatus::AtRisk);
    EXPECT_THROW(enterCustody(a, LegalStatus::Detained, 0, 1), std::logic_error);
    EXPECT_THROW(enterCustody(a, LegalStatus::Prison, 10, 1), TransitionError);
    EXPECT_THROW(enterCustody(a, LegalStatus::Criminal, 10, 1), TransitionError);
    EXPECT_EQ(a.status, LegalStatus::AtRisk);
    EXPECT_EQ(a.remaining_days, 0);
}
