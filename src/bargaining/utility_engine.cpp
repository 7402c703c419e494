/// @file src/bargaining/utility_engine.cpp
/// @brief UtilityEngine: weighted satisfaction scoring.

#include "medsim/utility.hpp"
#include "medsim/errors.hpp"

#include <Eigen/Core>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace medsim::bargaining {

const char* to_string(FalloffShape s) noexcept {
    switch (s) {
        case FalloffShape::Linear:  return "linear";
        case FalloffShape::Convex:  return "convex";
        case FalloffShape::Concave: return "concave";
    }
    return "unknown";
}

void UtilityConfig::validate() const {
    if (!std::isfinite(satisfaction_at_minimum)
        || satisfaction_at_minimum < 0.0 || satisfaction_at_minimum >= 1.0) {
        throw ConfigurationError("utility.satisfaction_at_minimum",
            fmt::format("{} outside [0, 1)", satisfaction_at_minimum));
    }
}

std::string UtilityScore::to_string() const {
    if (vetoed) {
        return fmt::format("{} U={:.4f} VETO on {} (BATNA {:.2f})",
                           party_id, score, vetoing_dimensions.front(), batna_utility);
    }
    return fmt::format("{} U={:.4f} (BATNA {:.2f}, margin {:+.4f}){}",
                       party_id, score, batna_utility, batna_margin,
                       below_batna ? " below BATNA" : "");
}

// ─── Construction ─────────────────────────────────────────────────────────────

UtilityEngine::UtilityEngine(UtilityConfig config)
    : config_(config) {
    config_.validate();
}

// ─── Satisfaction curve ───────────────────────────────────────────────────────

namespace {

[[nodiscard]] double apply_shape(double t, FalloffShape shape) noexcept {
    switch (shape) {
        case FalloffShape::Linear:  return t;
        case FalloffShape::Convex:  return t * t;
        case FalloffShape::Concave: return std::sqrt(t);
    }
    return t;
}

}  // namespace

bool UtilityEngine::past_minimum(double value, double ideal, double minimum) noexcept {
    switch (bound_direction(ideal, minimum)) {
        case BoundDirection::Floor:   return value < minimum;
        case BoundDirection::Ceiling: return value > minimum;
        case BoundDirection::Exact:
            return std::abs(value - ideal) > constants::FLOAT_EPSILON;
    }
    return false;
}

double UtilityEngine::satisfaction(double value,
                                   double ideal,
                                   double minimum,
                                   FalloffShape shape,
                                   double satisfaction_at_minimum) noexcept {
    if (!std::isfinite(value) || !std::isfinite(ideal) || !std::isfinite(minimum)) {
        return 0.0;
    }

    double distance = 0.0;
    switch (bound_direction(ideal, minimum)) {
        case BoundDirection::Exact:
            return std::abs(value - ideal) <= constants::FLOAT_EPSILON ? 1.0 : 0.0;
        case BoundDirection::Floor:
            if (value >= ideal)  return 1.0;
            if (value < minimum) return 0.0;
            distance = ideal - value;
            break;
        case BoundDirection::Ceiling:
            if (value <= ideal)  return 1.0;
            if (value > minimum) return 0.0;
            distance = value - ideal;
            break;
    }

    const double span = std::abs(ideal - minimum);
    const double t    = std::clamp(distance / span, 0.0, 1.0);
    const double s    = 1.0 - (1.0 - satisfaction_at_minimum) * apply_shape(t, shape);
    return std::clamp(s, 0.0, 1.0);
}

// ─── Scoring ──────────────────────────────────────────────────────────────────

UtilityScore UtilityEngine::score(const Proposal&     proposal,
                                  const PartyProfile& party,
                                  const IssueSpace&   space) const {
    space.validate(proposal);
    party.validate(space);

    UtilityScore result;
    result.party_id      = party.party_id;
    result.proposal_id   = proposal.id;
    result.batna_utility = party.batna_utility;
    result.breakdown.reserve(party.interests.size());

    const auto n = static_cast<Eigen::Index>(party.interests.size());
    Eigen::VectorXd w(n);
    Eigen::VectorXd s(n);

    Eigen::Index k = 0;
    for (const auto& [dim_id, interest] : party.interests) {
        const Dimension* dim = space.find(dim_id);

        DimensionSatisfaction entry;
        entry.dimension_id = dim_id;
        entry.weight       = interest.weight;
        entry.red_line     = party.red_lines.count(dim_id) > 0;

        if (const Value* v = proposal.find(dim_id)) {
            // Both values were validated above; the ideal may sit past the
            // range, so it is mapped without the range check.
            const double value   = *dim->ordinal(*v);
            const double ideal   = *dim->ordinal(interest.ideal);
            const double minimum = *dim->ordinal(interest.minimum_acceptable);

            entry.present      = true;
            entry.past_minimum = past_minimum(value, ideal, minimum);
            entry.satisfaction = satisfaction(value, ideal, minimum, config_.shape,
                                              config_.satisfaction_at_minimum);
            entry.red_line_violated = entry.red_line && entry.past_minimum;
        }
        // An interest the proposal does not address earns nothing.

        entry.contribution = entry.weight * entry.satisfaction;
        w(k) = entry.weight;
        s(k) = entry.satisfaction;
        ++k;

        if (entry.red_line_violated) {
            result.vetoing_dimensions.push_back(dim_id);
        }
        result.breakdown.push_back(std::move(entry));
    }

    result.score = std::clamp(w.dot(s), 0.0, 1.0);

    if (config_.red_line_veto && !result.vetoing_dimensions.empty()) {
        result.vetoed = true;
        result.score  = 0.0;
    }

    result.batna_margin = result.score - result.batna_utility;
    result.below_batna  = result.score < result.batna_utility;
    return result;
}

}  // namespace medsim::bargaining
