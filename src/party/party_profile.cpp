/// @file src/party/party_profile.cpp
/// @brief PartyProfile validation and bound direction.

#include "medsim/party.hpp"
#include "medsim/constants.hpp"
#include "medsim/errors.hpp"

#include <fmt/format.h>

#include <cmath>

namespace medsim {

const char* to_string(BoundDirection d) noexcept {
    switch (d) {
        case BoundDirection::Floor:   return "floor";
        case BoundDirection::Ceiling: return "ceiling";
        case BoundDirection::Exact:   return "exact";
    }
    return "unknown";
}

BoundDirection bound_direction(double ideal, double minimum) noexcept {
    if (minimum < ideal) return BoundDirection::Floor;
    if (minimum > ideal) return BoundDirection::Ceiling;
    return BoundDirection::Exact;
}

namespace {

[[nodiscard]] bool in_unit_interval(double x) noexcept {
    return std::isfinite(x) && x >= 0.0 && x <= 1.0;
}

/// Rethrow an issue-space complaint about one of the party's values as a
/// profile defect, keeping the original detail.
double profile_ordinal(const PartyProfile& party,
                       const IssueSpace& space,
                       const std::string& dim_id,
                       const Value& v,
                       const char* field) {
    try {
        return space.checked_ordinal(dim_id, v);
    } catch (const ValidationError& e) {
        throw ValidationError(ValidationKind::MalformedProfile, party.party_id,
            fmt::format("{} of '{}': {}", field, dim_id, e.what()));
    }
}

}  // namespace

void PartyProfile::validate(const IssueSpace& space) const {
    if (party_id.empty()) {
        throw ValidationError(ValidationKind::MalformedProfile, "<unnamed>",
                              "party_id is empty");
    }
    if (!in_unit_interval(batna_utility)) {
        throw ValidationError(ValidationKind::MalformedProfile, party_id,
            fmt::format("batna_utility {} outside [0, 1]", batna_utility));
    }
    if (!in_unit_interval(risk_tolerance)) {
        throw ValidationError(ValidationKind::MalformedProfile, party_id,
            fmt::format("risk_tolerance {} outside [0, 1]", risk_tolerance));
    }
    if (interests.empty()) {
        throw ValidationError(ValidationKind::MalformedProfile, party_id,
                              "no interests declared");
    }

    double weight_sum = 0.0;
    for (const auto& [dim_id, interest] : interests) {
        if (!std::isfinite(interest.weight) || interest.weight < 0.0) {
            throw ValidationError(ValidationKind::MalformedProfile, party_id,
                fmt::format("weight of '{}' is {}", dim_id, interest.weight));
        }
        weight_sum += interest.weight;

        // The minimum must be reachable.  A continuous ideal may sit past the
        // negotiable range (an aspiration the table cannot meet); with the
        // minimum inside the range that overshoot is always on the
        // favourable side.
        (void)profile_ordinal(*this, space, dim_id, interest.minimum_acceptable,
                              "minimum_acceptable");

        const Dimension* dim = space.find(dim_id);
        const double* ideal_num = std::get_if<double>(&interest.ideal);
        const bool aspiration = dim->kind == DimensionKind::Continuous
                             && ideal_num != nullptr && std::isfinite(*ideal_num);
        if (!aspiration) {
            (void)profile_ordinal(*this, space, dim_id, interest.ideal, "ideal_value");
        }
    }

    if (std::abs(weight_sum - 1.0) > constants::WEIGHT_SUM_TOLERANCE) {
        throw ValidationError(ValidationKind::MalformedProfile, party_id,
            fmt::format("interest weights sum to {:.6f}, expected 1", weight_sum));
    }

    for (const auto& dim_id : red_lines) {
        if (space.find(dim_id) == nullptr) {
            throw ValidationError(ValidationKind::MalformedProfile, party_id,
                fmt::format("red line '{}' is not a dimension of '{}'", dim_id, space.id()));
        }
        if (interests.find(dim_id) == interests.end()) {
            throw ValidationError(ValidationKind::MalformedProfile, party_id,
                fmt::format("red line '{}' has no minimum_acceptable", dim_id));
        }
    }
}

}  // namespace medsim
