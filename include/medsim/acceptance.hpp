#pragma once

/// @file include/medsim/acceptance.hpp
/// @brief AcceptanceModel: from utility to acceptance probability.
///
/// # Module: AcceptanceModel
///
/// ## Acceptance Curve
/// A party accepts more readily the further the proposal clears its BATNA.
/// Risk-averse parties ask for an extra premium first:
///
///     premium = (1 − risk_tolerance) · risk_premium
///     x       = (U − batna_utility) − premium
///
///     Logistic:  p = 1 / (1 + e^(−k·x))
///     Linear:    p = clamp(0.5 + k·x, 0, 1)
///
/// A red-line veto is categorical: p = 0.
///
/// ## Aggregation
/// The overall agreement probability is the product of the per-party
/// probabilities.  This treats acceptances as independent events, which is a
/// deliberate modelling simplification kept exactly as stated.
///
/// ## Guarantees
/// - Pure and thread-safe
/// - p ∈ [0, 1] for every input

#include "medsim/party.hpp"
#include "medsim/utility.hpp"
#include "medsim/constants.hpp"

#include <span>
#include <string>

namespace medsim::bargaining {

// ─── Configuration ────────────────────────────────────────────────────────────

enum class AcceptanceCurve {
    Logistic,
    Linear,
};

enum class AcceptanceStatus {
    Strong,
    Marginal,
    Weak,
};

[[nodiscard]] const char* to_string(AcceptanceCurve c) noexcept;
[[nodiscard]] const char* to_string(AcceptanceStatus s) noexcept;

struct AcceptanceConfig {
    AcceptanceCurve curve              = AcceptanceCurve::Logistic;
    double          steepness          = constants::DEFAULT_ACCEPTANCE_STEEPNESS;
    double          risk_premium       = constants::DEFAULT_RISK_PREMIUM;
    double          strong_threshold   = constants::DEFAULT_STRONG_THRESHOLD;
    double          marginal_threshold = constants::DEFAULT_MARGINAL_THRESHOLD;

    /// # Throws
    /// `ConfigurationError` if steepness ≤ 0, risk_premium < 0, either
    /// threshold leaves [0, 1], or marginal_threshold ≥ strong_threshold.
    void validate() const;
};

// ─── AcceptanceResult ─────────────────────────────────────────────────────────

struct AcceptanceResult {
    std::string      party_id;
    double           probability      = 0.0;  ///< p ∈ [0, 1]
    AcceptanceStatus status           = AcceptanceStatus::Weak;
    double           required_premium = 0.0;  ///< (1 − risk_tolerance) · risk_premium
};

// ─── AcceptanceModel ──────────────────────────────────────────────────────────

class AcceptanceModel {
public:
    explicit AcceptanceModel(AcceptanceConfig config = AcceptanceConfig{});

    /// # Throws
    /// `ValidationError(MalformedProfile)` if `score` belongs to another party
    /// or the profile's risk_tolerance / batna_utility lie outside [0, 1].
    [[nodiscard]] AcceptanceResult evaluate(const UtilityScore& score,
                                            const PartyProfile& party) const;

    /// Status tag for a probability under this model's thresholds.
    [[nodiscard]] AcceptanceStatus classify(double probability) const noexcept;

    /// Product of the per-party probabilities (1.0 for an empty span).
    [[nodiscard]] static double aggregate(std::span<const AcceptanceResult> results) noexcept;

    [[nodiscard]] const AcceptanceConfig& config() const noexcept { return config_; }

private:
    AcceptanceConfig config_;
};

}  // namespace medsim::bargaining
