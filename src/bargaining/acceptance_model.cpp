/// @file src/bargaining/acceptance_model.cpp
/// @brief AcceptanceModel: logistic / linear acceptance over BATNA margin.

#include "medsim/acceptance.hpp"
#include "medsim/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace medsim::bargaining {

const char* to_string(AcceptanceCurve c) noexcept {
    switch (c) {
        case AcceptanceCurve::Logistic: return "logistic";
        case AcceptanceCurve::Linear:   return "linear";
    }
    return "unknown";
}

const char* to_string(AcceptanceStatus s) noexcept {
    switch (s) {
        case AcceptanceStatus::Strong:   return "strong";
        case AcceptanceStatus::Marginal: return "marginal";
        case AcceptanceStatus::Weak:     return "weak";
    }
    return "unknown";
}

void AcceptanceConfig::validate() const {
    if (!std::isfinite(steepness) || steepness <= 0.0) {
        throw ConfigurationError("acceptance.steepness",
                                 fmt::format("{} must be positive", steepness));
    }
    if (!std::isfinite(risk_premium) || risk_premium < 0.0) {
        throw ConfigurationError("acceptance.risk_premium",
                                 fmt::format("{} must be non-negative", risk_premium));
    }
    if (!(strong_threshold >= 0.0 && strong_threshold <= 1.0)) {
        throw ConfigurationError("acceptance.strong_threshold",
                                 fmt::format("{} outside [0, 1]", strong_threshold));
    }
    if (!(marginal_threshold >= 0.0 && marginal_threshold <= 1.0)) {
        throw ConfigurationError("acceptance.marginal_threshold",
                                 fmt::format("{} outside [0, 1]", marginal_threshold));
    }
    if (marginal_threshold >= strong_threshold) {
        throw ConfigurationError("acceptance.marginal_threshold",
            fmt::format("{} must be below strong_threshold {}",
                        marginal_threshold, strong_threshold));
    }
}

// ─── AcceptanceModel ──────────────────────────────────────────────────────────

AcceptanceModel::AcceptanceModel(AcceptanceConfig config)
    : config_(config) {
    config_.validate();
}

AcceptanceResult AcceptanceModel::evaluate(const UtilityScore& score,
                                           const PartyProfile& party) const {
    if (score.party_id != party.party_id) {
        throw ValidationError(ValidationKind::MalformedProfile, party.party_id,
            fmt::format("utility score belongs to '{}'", score.party_id));
    }
    const auto in_unit = [](double x) { return std::isfinite(x) && x >= 0.0 && x <= 1.0; };
    if (!in_unit(party.risk_tolerance)) {
        throw ValidationError(ValidationKind::MalformedProfile, party.party_id,
            fmt::format("risk_tolerance {} outside [0, 1]", party.risk_tolerance));
    }
    if (!in_unit(party.batna_utility)) {
        throw ValidationError(ValidationKind::MalformedProfile, party.party_id,
            fmt::format("batna_utility {} outside [0, 1]", party.batna_utility));
    }

    const double premium = (1.0 - party.risk_tolerance) * config_.risk_premium;

    double p = 0.0;
    if (!score.vetoed) {
        const double x = (score.score - party.batna_utility) - premium;
        switch (config_.curve) {
            case AcceptanceCurve::Logistic:
                p = 1.0 / (1.0 + std::exp(-config_.steepness * x));
                break;
            case AcceptanceCurve::Linear:
                p = 0.5 + config_.steepness * x;
                break;
        }
        p = std::isfinite(p) ? std::clamp(p, 0.0, 1.0) : 0.0;
    }

    return AcceptanceResult{
        .party_id         = party.party_id,
        .probability      = p,
        .status           = classify(p),
        .required_premium = premium,
    };
}

AcceptanceStatus AcceptanceModel::classify(double probability) const noexcept {
    if (probability >= config_.strong_threshold)   return AcceptanceStatus::Strong;
    if (probability >= config_.marginal_threshold) return AcceptanceStatus::Marginal;
    return AcceptanceStatus::Weak;
}

double AcceptanceModel::aggregate(std::span<const AcceptanceResult> results) noexcept {
    double product = 1.0;
    for (const auto& r : results) {
        product *= r.probability;
    }
    return product;
}

}  // namespace medsim::bargaining
