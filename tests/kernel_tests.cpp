#include <gtest/gtest.h>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include "kernel/Kernel.h"
#include "kernel/StateMachine.h"

namespace {

KernelConfig scenarioConfig() {
    KernelConfig cfg;
    cfg.population = 500;
    cfg.attachment = 3;
    cfg.forensicCapacity = 0.55;
    cfg.coerciveCapacity = 0.04;
    cfg.detentionDaysMean = 45;
    cfg.evidenceWindowDays = 30;
    cfg.seed = 42;
    cfg.horizonDays = 365;
    return cfg;
}

} // namespace

// Basic kernel initialization test
TEST(KernelTest, Initialization) {
    KernelConfig cfg;
    cfg.population = 1000;
    cfg.attachment = 3;
    cfg.seed = 42;

    Kernel kernel(cfg);

    EXPECT_EQ(kernel.agents().size(), cfg.population);
    EXPECT_EQ(kernel.network().edgeCount(), 3u + (1000u - 4u) * 3u);
    EXPECT_EQ(kernel.generation(), 0u);
    EXPECT_TRUE(kernel.metrics().empty());

    std::uint32_t criminals = 0;
    for (std::uint32_t i = 0; i < kernel.agents().size(); ++i) {
        const auto& a = kernel.agents()[i];
        EXPECT_EQ(a.id, i);
        EXPECT_FALSE(isInCustody(a.status));
        EXPECT_EQ(a.remaining_days, 0);
        EXPECT_DOUBLE_EQ(a.stigma, 0.0);
        EXPECT_DOUBLE_EQ(a.criminal_capital, 0.0);
        EXPECT_GE(a.base_propensity, 0.0);
        EXPECT_LE(a.base_propensity, 1.0);
        EXPECT_EQ(a.crime_history.capacity(), cfg.evidenceWindowDays);
        if (a.status == LegalStatus::Criminal) ++criminals;
    }
    // ~5% initial offenders
    EXPECT_GT(criminals, 20u);
    EXPECT_LT(criminals, 100u);
}

TEST(KernelTest, DeterministicUpdates) {
    const auto cfg = scenarioConfig();
    Kernel kernel1(cfg);
    Kernel kernel2(cfg);
    kernel1.stepN(60);
    kernel2.stepN(60);

    const auto& agents1 = kernel1.agents();
    const auto& agents2 = kernel2.agents();
    ASSERT_EQ(agents1.size(), agents2.size());
    for (size_t i = 0; i < agents1.size(); ++i) {
        EXPECT_EQ(agents1[i].status, agents2[i].status);
        EXPECT_DOUBLE_EQ(agents1[i].stigma, agents2[i].stigma);
        EXPECT_DOUBLE_EQ(agents1[i].criminal_capital, agents2[i].criminal_capital);
        EXPECT_EQ(agents1[i].remaining_days, agents2[i].remaining_days);
        EXPECT_EQ(kernel1.network().neighbors(agents1[i].id), kernel2.network().neighbors(agents2[i].id));
    }
    for (std::size_t d = 0; d < kernel1.metrics().size(); ++d) {
        EXPECT_EQ(kernel1.metrics()[d].status_counts, kernel2.metrics()[d].status_counts);
        EXPECT_EQ(kernel1.metrics()[d].arrests, kernel2.metrics()[d].arrests);
    }
}

TEST(KernelTest, ResetReplaysRun) {
    const auto cfg = scenarioConfig();
    Kernel kernel(cfg);
    kernel.stepN(30);
    const auto first = kernel.metrics().records();

    kernel.reset(cfg);
    EXPECT_EQ(kernel.generation(), 0u);
    EXPECT_TRUE(kernel.metrics().empty());
    kernel.stepN(30);
    ASSERT_EQ(kernel.metrics().size(), first.size());
    for (std::size_t d = 0; d < first.size(); ++d) {
        EXPECT_EQ(kernel.metrics()[d].status_counts, first[d].status_counts);
        EXPECT_EQ(kernel.metrics()[d].crime_events, first[d].crime_events);
    }
}

TEST(KernelTest, RunCoversHorizon) {
    auto cfg = scenarioConfig();
    cfg.horizonDays = 120;
    Kernel kernel(cfg);
    kernel.run();

    EXPECT_EQ(kernel.generation(), 120u);
    ASSERT_EQ(kernel.metrics().size(), 120u);
    for (std::size_t d = 0; d < kernel.metrics().size(); ++d) {
        EXPECT_EQ(kernel.metrics()[d].day, d + 1);
    }

    kernel.run();   // horizon already reached
    EXPECT_EQ(kernel.metrics().size(), 120u);
}

// Scenario: N=500, m=3, forensic 0.55, coercive 0.04, detention 45, window 30
TEST(KernelTest, ScenarioInvariants) {
    const auto cfg = scenarioConfig();
    Kernel kernel(cfg);

    std::vector<double> stigma(cfg.population, 0.0);
    std::vector<double> capital(cfg.population, 0.0);
    std::uint64_t arrests = 0;

    for (std::uint32_t day = 0; day < cfg.horizonDays; ++day) {
        kernel.step();
        const auto& m = kernel.metrics().back();

        std::uint32_t total = 0;
        double shareSum = 0.0;
        for (std::size_t k = 0; k < kStatusCount; ++k) {
            total += m.status_counts[k];
            shareSum += m.share(static_cast<LegalStatus>(k));
        }
        EXPECT_EQ(total, cfg.population);
        EXPECT_NEAR(shareSum, 1.0, 1e-9);

        EXPECT_LE(m.wrongful_detentions, m.arrests);
        EXPECT_LE(m.arrests, 20u);   // floor(0.04 * 500)
        EXPECT_LE(m.convictions, m.detention_exits);
        EXPECT_EQ(m.convictions + m.detention_releases, m.detention_exits);
        EXPECT_EQ(m.rewired_events, m.arrests + m.convictions);
        EXPECT_EQ(m.edge_count, kernel.network().edgeCount());
        arrests += m.arrests;

        for (const auto& a : kernel.agents()) {
            EXPECT_GE(a.stigma, stigma[a.id]);
            EXPECT_GE(a.criminal_capital, capital[a.id]);
            EXPECT_LE(a.stigma, 1.0);
            EXPECT_LE(a.criminal_capital, 1.0);
            stigma[a.id] = a.stigma;
            capital[a.id] = a.criminal_capital;

            EXPECT_EQ(a.remaining_days > 0, isInCustody(a.status));
            EXPECT_LE(a.crime_history.size(), cfg.evidenceWindowDays);
        }
    }
    EXPECT_GT(arrests, 0u);
}

TEST(KernelTest, NoPolicingNoCustody) {
    auto cfg = scenarioConfig();
    cfg.coerciveCapacity = 0.0;
    cfg.horizonDays = 100;
    Kernel kernel(cfg);
    kernel.run();

    for (const auto& m : kernel.metrics()) {
        EXPECT_EQ(m.arrests, 0u);
        EXPECT_EQ(m.count(LegalStatus::Detained), 0u);
        EXPECT_EQ(m.count(LegalStatus::Prison), 0u);
    }
    for (const auto& a : kernel.agents()) {
        EXPECT_DOUBLE_EQ(a.stigma, 0.0);
    }
}

TEST(KernelTest, RewiringDisabledKeepsGraph) {
    auto cfg = scenarioConfig();
    cfg.rewiringEnabled = false;
    cfg.horizonDays = 100;
    Kernel kernel(cfg);
    const auto edges = kernel.network().edgeCount();
    kernel.run();
    for (const auto& m : kernel.metrics()) {
        EXPECT_EQ(m.edge_count, edges);
        EXPECT_EQ(m.rewired_events, 0u);
    }
}

// Blind targeting makes every detention wrongful; perfect targeting does not
TEST(KernelTest, ForensicCapacityDrivesWrongfulRate) {
    auto cfg = scenarioConfig();
    cfg.horizonDays = 120;

    cfg.forensicCapacity = 0.0;
    Kernel blind(cfg);
    blind.run();
    auto blindStats = blind.getStatistics();
    ASSERT_GT(blindStats.totalArrests, 0u);
    EXPECT_EQ(blindStats.totalWrongful, blindStats.totalArrests);

    cfg.forensicCapacity = 1.0;
    Kernel sharp(cfg);
    sharp.run();
    auto sharpStats = sharp.getStatistics();
    ASSERT_GT(sharpStats.totalArrests, 0u);
    EXPECT_LT(sharpStats.totalWrongful, sharpStats.totalArrests);
}

// The evidence window grows one day at a time, then holds exactly N days
TEST(KernelTest, EvidenceWindowLength) {
    auto cfg = scenarioConfig();
    cfg.population = 200;
    cfg.evidenceWindowDays = 10;
    Kernel kernel(cfg);

    for (std::uint64_t day = 1; day <= 25; ++day) {
        kernel.step();
        const std::size_t expected = std::min<std::uint64_t>(day, cfg.evidenceWindowDays);
        for (const auto& agent : kernel.agents()) {
            ASSERT_EQ(agent.crime_history.size(), expected) << "day " << day << " agent " << agent.id;
            ASSERT_EQ(agent.crime_history.capacity(), cfg.evidenceWindowDays);
        }
        if (day >= cfg.evidenceWindowDays) {
            EXPECT_EQ(kernel.agents().front().crime_history.size(), cfg.evidenceWindowDays);
        }
    }
}

TEST(KernelTest, StatisticsMatchSeries) {
    auto cfg = scenarioConfig();
    cfg.horizonDays = 90;
    Kernel kernel(cfg);
    kernel.run();

    const auto stats = kernel.getStatistics();
    EXPECT_EQ(stats.totalAgents, cfg.population);

    std::uint64_t arrests = 0, crimes = 0, convictions = 0;
    for (const auto& m : kernel.metrics()) {
        arrests += m.arrests;
        crimes += m.crime_events;
        convictions += m.convictions;
    }
    EXPECT_EQ(stats.totalArrests, arrests);
    EXPECT_EQ(stats.totalCrimeEvents, crimes);
    EXPECT_EQ(stats.totalConvictions, convictions);
    EXPECT_EQ(stats.statusCounts, kernel.metrics().back().status_counts);
    EXPECT_EQ(stats.edgeCount, kernel.network().edgeCount());
    EXPECT_NEAR(stats.avgConnections, 2.0 * stats.edgeCount / cfg.population, 1e-9);
}

TEST(KernelTest, InvalidConfigRejected) {
    KernelConfig cfg;

    auto bad = cfg;
    bad.population = 0;
    EXPECT_THROW(Kernel{bad}, std::invalid_argument);

    bad = cfg;
    bad.attachment = bad.population;
    EXPECT_THROW(validateConfig(bad), std::invalid_argument);

    bad = cfg;
    bad.forensicCapacity = 1.5;
    EXPECT_THROW(validateConfig(bad), std::invalid_argument);

    bad = cfg;
    bad.initialCriminalShare = 0.6;
    bad.initialAtRiskShare = 0.6;
    EXPECT_THROW(validateConfig(bad), std::invalid_argument);

    bad = cfg;
    bad.detentionDaysMean = 0.0;
    EXPECT_THROW(validateConfig(bad), std::invalid_argument);

    bad = cfg;
    bad.coerciveCapacity = -0.01;
    EXPECT_THROW(validateConfig(bad), std::invalid_argument);

    bad = cfg;
    bad.evidenceWindowDays = 0;
    EXPECT_THROW(validateConfig(bad), std::invalid_argument);

    // Daily attempts and rewiring draws must fit in 32 bits
    bad = cfg;
    bad.population = 500;
    bad.coerciveCapacity = 1e8;
    EXPECT_THROW(validateConfig(bad), std::invalid_argument);

    bad = cfg;
    bad.maxNewEdgesPerEvent = std::numeric_limits<std::uint32_t>::max();
    EXPECT_THROW(validateConfig(bad), std::invalid_argument);

    bad = cfg;
    bad.coerciveCapacity = 2.0;
    EXPECT_NO_THROW(validateConfig(bad));

    EXPECT_NO_THROW(validateConfig(cfg));
}

TEST(KernelTest, FailedResetKeepsState) {
    auto cfg = scenarioConfig();
    Kernel kernel(cfg);
    kernel.stepN(10);

    auto bad = cfg;
    bad.convictionBaseProb = 2.0;
    EXPECT_THROW(kernel.reset(bad), std::invalid_argument);
    EXPECT_EQ(kernel.generation(), 10u);
    EXPECT_DOUBLE_EQ(kernel.config().convictionBaseProb, cfg.convictionBaseProb);
}
