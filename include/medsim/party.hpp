#pragma once

/// @file include/medsim/party.hpp
/// @brief Party Model: a stakeholder's interests, constraints and BATNA.
///
/// # Module: Party Model
///
/// ## Responsibility
/// Describe what one party wants from an agreement:
///   - `interests`  : per-dimension weight, ideal value and minimum-acceptable
///                     value (weights sum to 1 across the party)
///   - `red_lines`  : dimensions whose minimum is a hard veto
///   - `batna_utility`: utility of walking away, in [0, 1]
///   - `risk_tolerance`: in [0, 1]; 0 = fully risk-averse
///
/// ## Direction of a bound
/// The position of `minimum_acceptable` relative to `ideal` on the
/// dimension's ordinal axis tells which way the party leans:
///
///     minimum < ideal   →  Floor    (higher values favour the party)
///     minimum > ideal   →  Ceiling  (lower values favour the party)
///     minimum == ideal  →  Exact    (any other value is past the bound)

#include "medsim/issue_space.hpp"
#include "medsim/types.hpp"

#include <map>
#include <set>
#include <string>

namespace medsim {

// ─── Interest ─────────────────────────────────────────────────────────────────

struct Interest {
    double weight = 0.0;       ///< Share of the party's utility, in [0, 1]
    Value  ideal;              ///< Best outcome on this dimension
    Value  minimum_acceptable; ///< Soft bound; hard when listed as a red line
};

enum class BoundDirection {
    Floor,
    Ceiling,
    Exact,
};

[[nodiscard]] const char* to_string(BoundDirection d) noexcept;

/// Direction implied by ordinal ideal / minimum positions.
[[nodiscard]] BoundDirection bound_direction(double ideal, double minimum) noexcept;

// ─── PartyProfile ─────────────────────────────────────────────────────────────

struct PartyProfile {
    std::string                     party_id;
    std::map<std::string, Interest> interests;   ///< Dimension id → interest
    std::set<std::string>           red_lines;   ///< Dimension ids
    double                          batna_utility  = 0.0;
    double                          risk_tolerance = 0.5;

    /// Check the profile against an issue space.
    ///
    /// # Throws
    /// `ValidationError(MalformedProfile)` naming the party and the offending
    /// dimension when:
    ///   - an interest or red line references an unknown dimension
    ///   - ideal / minimum have the wrong kind or lie outside the range
    ///   - a weight is negative or non-finite, or weights do not sum to 1
    ///   - a red line has no interest entry
    ///   - batna_utility or risk_tolerance lies outside [0, 1]
    void validate(const IssueSpace& space) const;
};

}  // namespace medsim
