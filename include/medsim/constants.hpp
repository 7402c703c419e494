#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/medsim/constants.hpp
/// @brief Default thresholds and rates for the medsim engine.
///
/// Every value here is only a default: `EngineConfig` copies them at
/// construction so a scenario can be recalibrated without recompiling.

namespace medsim::constants {

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Allowed deviation of a party's interest weights from a sum of 1.0.
static constexpr double WEIGHT_SUM_TOLERANCE = 1e-6;

// ─── Utility Falloff ──────────────────────────────────────────────────────────

/// Satisfaction reached exactly at a party's minimum-acceptable value.
/// Past the minimum the satisfaction drops to 0.
static constexpr double DEFAULT_SATISFACTION_AT_MINIMUM = 0.5;

// ─── Acceptance ───────────────────────────────────────────────────────────────

/// Logistic steepness applied to the margin over BATNA.
static constexpr double DEFAULT_ACCEPTANCE_STEEPNESS = 10.0;

/// Extra margin over BATNA a fully risk-averse party (tolerance 0) requires.
static constexpr double DEFAULT_RISK_PREMIUM = 0.1;

/// Status thresholds: p >= STRONG → strong, p >= MARGINAL → marginal.
static constexpr double DEFAULT_STRONG_THRESHOLD   = 0.7;
static constexpr double DEFAULT_MARGINAL_THRESHOLD = 0.4;

// ─── Agreement Analysis ───────────────────────────────────────────────────────

/// Utility a party aspires to when judging an agreement efficient.
static constexpr double DEFAULT_ASPIRATION_LEVEL = 0.7;

/// Fraction of the aspiration level that counts as "near" it.
static constexpr double DEFAULT_ASPIRATION_FRACTION = 0.9;

// ─── Trend Analysis ───────────────────────────────────────────────────────────

/// One half of a run must exceed the other by this factor to count as a trend.
static constexpr double DEFAULT_TREND_RATIO = 1.5;

/// Minimum absolute difference in half-run incident counts for a trend.
static constexpr std::size_t DEFAULT_TREND_MIN_DIFFERENCE = 2;

/// Assessment bands, incidents per 100 steps.
static constexpr double DEFAULT_GOOD_INCIDENT_RATE       = 5.0;
static constexpr double DEFAULT_CONCERNING_INCIDENT_RATE = 15.0;

/// Assessment bands, average incident severity.
static constexpr double DEFAULT_GOOD_SEVERITY       = 0.35;
static constexpr double DEFAULT_CONCERNING_SEVERITY = 0.6;

/// Window length (steps) for the per-window incident-count regression.
static constexpr std::size_t DEFAULT_SLOPE_WINDOW = 10;

// ─── De-escalation Mechanisms ─────────────────────────────────────────────────

static constexpr double DEFAULT_CUES_SUCCESS    = 0.90;
static constexpr double DEFAULT_HOTLINE_SUCCESS = 0.85;

// ─── Environment ──────────────────────────────────────────────────────────────

/// Relative increase in incident probability in the roughest weather.
static constexpr double DEFAULT_WEATHER_PERTURBATION = 0.25;

/// Per-step probability that the weather state moves one notch.
static constexpr double DEFAULT_WEATHER_CHANGE_RATE = 0.05;

/// Per-interaction probability of an accidental incident in rough weather.
static constexpr double DEFAULT_ACCIDENT_RATE = 0.02;

// ─── Escalation Memory ────────────────────────────────────────────────────────

/// Fraction of accumulated tension lost every step (exponential decay).
static constexpr double DEFAULT_MEMORY_DECAY = 0.1;

/// Upper bound on any tension accumulator.
static constexpr double DEFAULT_TENSION_CAP = 3.0;

/// Number of recent interactions an agent remembers.
static constexpr std::size_t DEFAULT_MEMORY_CAPACITY = 8;

/// Relative increase in an initiator's violation odds per remembered incident.
static constexpr double DEFAULT_RECENT_INCIDENT_WEIGHT = 0.05;

/// Bounds on an agent's aggression level.
static constexpr double MIN_AGGRESSION = 0.01;
static constexpr double MAX_AGGRESSION = 0.95;

// ─── Simulation ───────────────────────────────────────────────────────────────

/// Base probability that an interacting pair produces a deliberate violation.
static constexpr double DEFAULT_INTERACTION_RATE = 0.35;

/// Standoff distance (nm) over which the deliberate-violation risk falls by e.
static constexpr double DEFAULT_STANDOFF_SCALE_NM = 4.0;

/// Notice period (hours) over which the odds of giving notice fall by e.
static constexpr double DEFAULT_NOTICE_TOLERANCE_HOURS = 96.0;

/// Number of patrol zones in the theatre.
static constexpr std::size_t DEFAULT_ZONE_COUNT = 3;

/// Maximum random variates one run may draw before it is aborted.
static constexpr std::uint64_t DEFAULT_RANDOM_DRAW_BUDGET = 1ULL << 40;

/// Duration used by the CLI when none is given.
static constexpr std::size_t DEFAULT_DURATION = 200;

}  // namespace medsim::constants
