#pragma once

#include <cstddef>
#include <cstdint>
#include "kernel/CrimeHistory.h"

// ---------- Legal Status ----------
enum class LegalStatus : std::uint8_t {
    Lawful = 0,
    AtRisk = 1,
    Criminal = 2,
    Detained = 3,   // pre-trial
    Prison = 4,     // post-conviction
    COUNT
};

constexpr std::size_t kStatusCount = static_cast<std::size_t>(LegalStatus::COUNT);

inline std::size_t toIndex(LegalStatus s) { return static_cast<std::size_t>(s); }

// ---------- Agent Structure ----------
struct Agent {
    // Identity (also the network node key)
    std::uint32_t id = 0;
    LegalStatus status = LegalStatus::Lawful;

    // Heterogeneity, fixed at creation
    double base_propensity = 0.15;

    // Criminogenic accumulators (0..1, never decrease)
    double stigma = 0.0;
    double criminal_capital = 0.0;

    // Evidence proxy: daily crime flags over the last N days
    CrimeHistory crime_history;

    // Custody bookkeeping: remaining_days > 0 iff Detained or Prison
    std::int32_t remaining_days = 0;
    std::uint64_t entered_tick = 0;   // tick of the latest custody entry
};
