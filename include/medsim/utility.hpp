#pragma once

/// @file include/medsim/utility.hpp
/// @brief UtilityEngine: scores a proposal against one party's interests.
///
/// # Module: UtilityEngine
///
/// ## Responsibility
/// Turn (proposal, party profile, issue space) into a utility in [0, 1] plus
/// a per-dimension breakdown a facilitator can read.
///
/// ## Satisfaction Curve
/// On the ordinal axis of a dimension let `d` be the distance of the proposed
/// value from the party's ideal, measured towards the minimum, and `span` the
/// distance from ideal to minimum.  With `t = d / span` and floor `f`
/// (`satisfaction_at_minimum`):
///
///     value on favourable side of ideal   → 1
///     0 ≤ t ≤ 1                          → 1 − (1 − f) · shape(t)
///     value past the minimum             → 0
///
/// where shape(t) is t (Linear), t² (Convex: slow early decay) or √t
/// (Concave: fast early decay).
///
/// ## Aggregation
///     U = Σ_k w_k · s_k           (Eigen dot product over the interests)
///
/// A red-line dimension whose value lies strictly past the minimum vetoes the
/// whole score (U = 0) when `red_line_veto` is on (the default).
///
/// ## BATNA
/// `batna_margin = U − batna_utility` is reported; falling below BATNA is
/// flagged but never zeroes the score.  Acting on it is the AcceptanceModel's
/// job.
///
/// ## Guarantees
/// - Pure: no shared mutable state, safe to call concurrently
/// - Inputs are validated before any scoring; on failure nothing is returned

#include "medsim/issue_space.hpp"
#include "medsim/party.hpp"
#include "medsim/types.hpp"
#include "medsim/constants.hpp"

#include <string>
#include <vector>

namespace medsim::bargaining {

// ─── Configuration ────────────────────────────────────────────────────────────

enum class FalloffShape {
    Linear,
    Convex,
    Concave,
};

[[nodiscard]] const char* to_string(FalloffShape s) noexcept;

struct UtilityConfig {
    FalloffShape shape                   = FalloffShape::Linear;
    double       satisfaction_at_minimum = constants::DEFAULT_SATISFACTION_AT_MINIMUM;
    bool         red_line_veto           = true;

    /// # Throws
    /// `ConfigurationError` if `satisfaction_at_minimum` is outside [0, 1).
    void validate() const;
};

// ─── UtilityScore ─────────────────────────────────────────────────────────────

/// Contribution of one interest to a party's utility.
struct DimensionSatisfaction {
    std::string dimension_id;
    double      weight       = 0.0;
    double      satisfaction = 0.0;   ///< s_k in [0, 1]
    double      contribution = 0.0;   ///< w_k · s_k
    bool        present      = false; ///< Proposal carries this dimension
    bool        past_minimum = false; ///< Value lies beyond minimum_acceptable
    bool        red_line     = false;
    bool        red_line_violated = false;
};

struct UtilityScore {
    std::string party_id;
    std::string proposal_id;
    double      score = 0.0;                      ///< U in [0, 1]
    std::vector<DimensionSatisfaction> breakdown; ///< One entry per interest
    bool        vetoed = false;
    std::vector<std::string> vetoing_dimensions;
    double      batna_utility = 0.0;
    double      batna_margin  = 0.0;              ///< U − batna_utility
    bool        below_batna   = false;            ///< U < batna_utility

    /// One-line summary: "PartyA U=0.6667 (BATNA 0.30, margin +0.3667)".
    [[nodiscard]] std::string to_string() const;
};

// ─── UtilityEngine ────────────────────────────────────────────────────────────

class UtilityEngine {
public:
    /// # Throws
    /// `ConfigurationError` if `config` fails validation.
    explicit UtilityEngine(UtilityConfig config = UtilityConfig{});

    /// Score `proposal` for `party`.
    ///
    /// # Throws
    /// `ValidationError`: the proposal references an unknown dimension
    /// (`DimensionMismatch`), carries a value of the wrong kind
    /// (`KindMismatch`) or outside the declared range (`OutOfRange`); or the
    /// party profile is inconsistent with `space` (`MalformedProfile`).
    [[nodiscard]] UtilityScore score(const Proposal&     proposal,
                                     const PartyProfile& party,
                                     const IssueSpace&   space) const;

    /// Satisfaction of an ordinal `value` given the party's `ideal` and
    /// `minimum` on the same axis.  Always in [0, 1].
    [[nodiscard]] static double satisfaction(double value,
                                             double ideal,
                                             double minimum,
                                             FalloffShape shape,
                                             double satisfaction_at_minimum) noexcept;

    /// True if `value` lies strictly beyond `minimum`, seen from `ideal`.
    [[nodiscard]] static bool past_minimum(double value,
                                           double ideal,
                                           double minimum) noexcept;

    [[nodiscard]] const UtilityConfig& config() const noexcept { return config_; }

private:
    UtilityConfig config_;
};

}  // namespace medsim::bargaining
