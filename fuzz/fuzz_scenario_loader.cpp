/**
 * @file  fuzz_scenario_loader.cpp
 * @brief libFuzzer target for ScenarioLoader::parse_string and the engine
 *        it feeds
 *
 * Build:
 *   cmake -DMEDSIM_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_scenario_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_scenario_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. parse_string never throws.
 *   3. Parsing is a pure function: the same text yields the same scenario.
 *   4. Anything the parser accepted either evaluates cleanly or is rejected
 *      with a ValidationError; no other exception escapes.
 *   5. If an evaluation is returned, every probability lies in [0, 1].
 *
 * Fuzzer strategy:
 *   Input is passed directly as text.  The loader must handle:
 *     • Binary garbage (null bytes, high bytes)
 *     • "nan", "inf", "1e999" numeric tokens
 *     • Missing and surplus fields, stray '#' and CR characters
 *     • Interests and terms for undeclared dimensions or parties
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "medsim/engine.hpp"
#include "medsim/errors.hpp"
#include "medsim/scenario_loader.hpp"

using namespace medsim;
using namespace medsim::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const Scenario sc    = ScenarioLoader::parse_string(input);
    const Scenario again = ScenarioLoader::parse_string(input);

    // Invariant 3: deterministic
    assert(sc.skipped_rows == again.skipped_rows);
    assert(sc.dimensions.size() == again.dimensions.size());
    assert(sc.parties.size() == again.parties.size());
    assert(sc.proposal.values.size() == again.proposal.values.size());

    // Invariant 4: downstream rejects bad scenarios only through ValidationError
    try {
        Engine engine;
        engine.register_issue_space(sc.issue_space("fuzz"));
        const auto eval = engine.evaluate_proposal("fuzz", sc.proposal, sc.parties);

        // Invariant 5: probabilities in [0, 1]
        assert(eval.overall_probability >= 0.0 && eval.overall_probability <= 1.0);
        for (const auto& a : eval.acceptances) {
            assert(a.probability >= 0.0 && a.probability <= 1.0);
        }
        for (const auto& u : eval.utilities) {
            assert(std::isfinite(u.score));
            assert(u.score >= 0.0 && u.score <= 1.0);
        }
    } catch (const ValidationError&) {
        // Expected for inconsistent scenarios.
    }

    return 0;
}
