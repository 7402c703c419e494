/**
 * @file  prop_utility_bounds.cpp
 * @brief Property: ∀ proposals in range, ∀ shapes: U ∈ [0, 1] and the
 *        per-dimension contributions sum to U
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_utility_bounds
 *
 * Mathematical basis:
 *   U = Σ w_k · s_k  with  Σ w_k = 1,  s_k ∈ [0, 1]
 *
 *   so U is a convex combination of satisfactions and cannot leave [0, 1].
 *   A red-line veto forces U = 0 regardless of the other terms.
 */

#include <rapidcheck.h>
#include <cmath>

#include "medsim/utility.hpp"
#include "scenario_fixtures.hpp"

using namespace medsim;
using namespace medsim::bargaining;

namespace {

Proposal proposal_from(double standoff, double escorts, double notice) {
    Proposal p;
    p.id = "prop";
    p.values["standoff_nm"]  = standoff;
    p.values["escorts"]      = escorts;
    p.values["notice_hours"] = notice;
    return p;
}

}  // namespace

int main() {
    const auto space = fixtures::standoff_space();

    // ── Property 1: U ∈ [0, 1] for every party and shape ───────────────────
    rc::check(
        "utility_bounds: score lies in [0, 1]",
        [&space](unsigned a, unsigned b, unsigned c, unsigned shape_raw) {
            const auto p = proposal_from(10.0 * (a % 1001) / 1000.0,
                                         5.0  * (b % 1001) / 1000.0,
                                         48.0 * (c % 1001) / 1000.0);
            const auto shape = static_cast<FalloffShape>(shape_raw % 3);
            const UtilityEngine engine(UtilityConfig{.shape = shape});

            for (const auto& party : fixtures::both_parties()) {
                const auto u = engine.score(p, party, space);
                RC_ASSERT(std::isfinite(u.score));
                RC_ASSERT(u.score >= 0.0);
                RC_ASSERT(u.score <= 1.0);
            }
        }
    );

    // ── Property 2: breakdown contributions sum to U (no veto) ─────────────
    rc::check(
        "utility_bounds: contributions sum to the score",
        [&space](unsigned a, unsigned b, unsigned c) {
            const auto p = proposal_from(10.0 * (a % 101) / 100.0,
                                         5.0  * (b % 101) / 100.0,
                                         48.0 * (c % 101) / 100.0);
            const UtilityEngine engine;
            for (const auto& party : fixtures::both_parties()) {
                const auto u = engine.score(p, party, space);
                double total = 0.0;
                for (const auto& d : u.breakdown) {
                    RC_ASSERT(d.satisfaction >= 0.0 && d.satisfaction <= 1.0);
                    total += d.contribution;
                }
                RC_ASSERT(std::abs(total - u.score) < 1e-12);
            }
        }
    );

    // ── Property 3: a violated red line always vetoes to zero ──────────────
    rc::check(
        "utility_bounds: red-line violation vetoes",
        [&space](unsigned a) {
            auto party = fixtures::party_a();
            party.red_lines.insert("standoff_nm");
            // PartyA's standoff floor is 2 nm; stay strictly below it.
            const double standoff = 1.999 * (a % 1000) / 1000.0;
            const auto u = UtilityEngine{}.score(proposal_from(standoff, 2.0, 12.0), party, space);
            RC_ASSERT(u.vetoed);
            RC_ASSERT(u.score == 0.0);
        }
    );

    return 0;
}
