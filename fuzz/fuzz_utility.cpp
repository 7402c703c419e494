/**
 * @file  fuzz_utility.cpp
 * @brief libFuzzer target for UtilityEngine scoring and the acceptance model
 *
 * Build:
 *   cmake -DMEDSIM_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_utility
 *
 * Run for 60 seconds:
 *   ./fuzz_utility -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. satisfaction() is finite and in [0, 1] for every IEEE 754 input.
 *   3. A scored proposal has U ∈ [0, 1]; a veto implies U = 0.
 *   4. Acceptance probability ∈ [0, 1]; a veto implies p = 0.
 *   5. Out-of-range or non-finite terms are rejected with ValidationError.
 *
 * Fuzzer strategy:
 *   The input bytes are interpreted as raw doubles via memcpy.  The first
 *   three are fed to satisfaction() directly, the next three become a
 *   proposal on the standoff / escorts / notice space.  This exercises
 *   NaN, ±Inf, ±0 and denormals on both paths.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "medsim/acceptance.hpp"
#include "medsim/errors.hpp"
#include "medsim/issue_space.hpp"
#include "medsim/utility.hpp"

using namespace medsim;
using namespace medsim::bargaining;

namespace {

IssueSpace make_space() {
    return IssueSpace("fuzz", {
        Dimension::continuous("standoff_nm", 0.0, 10.0, "nm"),
        Dimension::continuous("escorts", 0.0, 5.0),
        Dimension::continuous("notice_hours", 0.0, 48.0, "h"),
    });
}

PartyProfile make_party() {
    PartyProfile p;
    p.party_id = "PartyA";
    p.interests["standoff_nm"]  = Interest{.weight = 0.4, .ideal = 5.0,  .minimum_acceptable = 2.0};
    p.interests["escorts"]      = Interest{.weight = 0.3, .ideal = 2.0,  .minimum_acceptable = 1.0};
    p.interests["notice_hours"] = Interest{.weight = 0.3, .ideal = 12.0, .minimum_acceptable = 48.0};
    p.red_lines.insert("standoff_nm");
    p.batna_utility  = 0.3;
    p.risk_tolerance = 0.5;
    return p;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    constexpr std::size_t N = 6;
    if (size < N * sizeof(double)) return 0;

    double v[N];
    std::memcpy(v, data, sizeof(v));

    // Invariant 2: satisfaction is total
    for (const auto shape : {FalloffShape::Linear, FalloffShape::Convex, FalloffShape::Concave}) {
        const double s = UtilityEngine::satisfaction(v[0], v[1], v[2], shape, 0.5);
        assert(std::isfinite(s));
        assert(s >= 0.0 && s <= 1.0);
    }

    static const IssueSpace   space = make_space();
    static const PartyProfile party = make_party();
    static const UtilityEngine   utility;
    static const AcceptanceModel acceptance;

    Proposal p;
    p.id = "fuzz";
    p.values["standoff_nm"]  = v[3];
    p.values["escorts"]      = v[4];
    p.values["notice_hours"] = v[5];

    try {
        const auto u = utility.score(p, party, space);

        // Invariant 3
        assert(std::isfinite(u.score));
        assert(u.score >= 0.0 && u.score <= 1.0);
        if (u.vetoed) assert(u.score == 0.0);

        // Invariant 4
        const auto r = acceptance.evaluate(u, party);
        assert(r.probability >= 0.0 && r.probability <= 1.0);
        if (u.vetoed) assert(r.probability == 0.0);
    } catch (const ValidationError& e) {
        // Invariant 5: only range or kind problems reach here
        assert(e.kind() == ValidationKind::OutOfRange);
    }

    return 0;
}
