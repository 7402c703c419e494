/// @file src/sim/agreement_terms.cpp
/// @brief Extraction of field rules from a proposal.

#include "medsim/simulation.hpp"

#include <cmath>

namespace medsim::sim {

namespace {

[[nodiscard]] std::optional<double> numeric_term(const Proposal& p, const std::string& id) noexcept {
    const Value* v = p.find(id);
    if (v == nullptr) return std::nullopt;
    if (const auto* d = std::get_if<double>(v); d != nullptr && std::isfinite(*d)) {
        return *d;
    }
    return std::nullopt;
}

[[nodiscard]] bool switch_term(const Proposal& p, const std::string& id) noexcept {
    const Value* v = p.find(id);
    if (v == nullptr) return false;
    if (const auto* b = std::get_if<bool>(v)) return *b;
    if (const auto* d = std::get_if<double>(v)) return std::isfinite(*d) && *d != 0.0;
    return false;
}

}  // namespace

AgreementTerms AgreementTerms::from_proposal(const Proposal& proposal,
                                             const TermBindings& bindings) noexcept {
    return AgreementTerms{
        .standoff_nm  = numeric_term(proposal, bindings.standoff_nm),
        .escort_limit = numeric_term(proposal, bindings.escort_limit),
        .notice_hours = numeric_term(proposal, bindings.notice_hours),
        .hotline      = switch_term(proposal, bindings.hotline),
        .cues         = switch_term(proposal, bindings.cues),
    };
}

}  // namespace medsim::sim
