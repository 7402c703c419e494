/**
 * @file  prop_acceptance_product.cpp
 * @brief Property: P(agreement) = Π p_i, each p_i ∈ [0, 1], and p is
 *        monotone in utility
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_acceptance_product
 *
 * Mathematical basis:
 *   p_i = σ(k · (U_i − BATNA_i − premium_i)),  premium_i = (1 − r_i) · ρ
 *
 *   σ is strictly increasing into (0, 1), so p_i rises with U_i and the
 *   product of n such factors never exceeds its smallest factor.
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "medsim/acceptance.hpp"

using namespace medsim;
using namespace medsim::bargaining;

namespace {

PartyProfile party(const std::string& id, double batna, double risk) {
    PartyProfile p;
    p.party_id       = id;
    p.batna_utility  = batna;
    p.risk_tolerance = risk;
    return p;
}

UtilityScore score(const PartyProfile& p, double u) {
    UtilityScore s;
    s.party_id      = p.party_id;
    s.score         = u;
    s.batna_utility = p.batna_utility;
    s.batna_margin  = u - p.batna_utility;
    s.below_batna   = u < p.batna_utility;
    return s;
}

double unit(unsigned raw) {
    return static_cast<double>(raw % 10001) / 10000.0;
}

}  // namespace

int main() {
    const AcceptanceModel model;

    // ── Property 1: aggregate is the product and bounded by the minimum ────
    rc::check(
        "acceptance_product: overall = product of parties",
        [&model](std::vector<unsigned> utilities) {
            RC_PRE(!utilities.empty() && utilities.size() <= 8);

            std::vector<AcceptanceResult> results;
            double expected = 1.0;
            double smallest = 1.0;
            for (std::size_t i = 0; i < utilities.size(); ++i) {
                const auto p = party("P" + std::to_string(i), 0.3, 0.5);
                const auto r = model.evaluate(score(p, unit(utilities[i])), p);
                RC_ASSERT(r.probability >= 0.0 && r.probability <= 1.0);
                expected *= r.probability;
                smallest  = std::min(smallest, r.probability);
                results.push_back(r);
            }
            const double overall = AcceptanceModel::aggregate(results);
            RC_ASSERT(std::abs(overall - expected) < 1e-15);
            RC_ASSERT(overall <= smallest + 1e-15);
        }
    );

    // ── Property 2: p is non-decreasing in utility ─────────────────────────
    rc::check(
        "acceptance_product: acceptance monotone in utility",
        [&model](unsigned u1_raw, unsigned u2_raw, unsigned batna_raw, unsigned risk_raw) {
            double u1 = unit(u1_raw);
            double u2 = unit(u2_raw);
            if (u1 > u2) std::swap(u1, u2);
            const auto p = party("P", unit(batna_raw), unit(risk_raw));
            RC_ASSERT(model.evaluate(score(p, u1), p).probability
                      <= model.evaluate(score(p, u2), p).probability);
        }
    );

    // ── Property 3: more risk tolerance never lowers acceptance ────────────
    rc::check(
        "acceptance_product: risk tolerance never hurts",
        [&model](unsigned u_raw, unsigned r1_raw, unsigned r2_raw) {
            double r1 = unit(r1_raw);
            double r2 = unit(r2_raw);
            if (r1 > r2) std::swap(r1, r2);
            const auto cautious = party("P", 0.4, r1);
            const auto bold     = party("P", 0.4, r2);
            const double u = unit(u_raw);
            RC_ASSERT(model.evaluate(score(cautious, u), cautious).probability
                      <= model.evaluate(score(bold, u), bold).probability);
        }
    );

    return 0;
}
