#pragma once

/// @file src/sim/random_stream.hpp
/// @brief RandomStream: the single seeded generator owned by one run.
///
/// Variates are derived from the raw 64-bit mt19937_64 output by hand rather
/// than through `std::uniform_real_distribution`, whose algorithm is
/// implementation-defined.  The same seed therefore reproduces the same run
/// on every standard library.

#include "medsim/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>

namespace medsim::sim {

class RandomStream {
public:
    RandomStream(std::uint64_t seed, std::uint64_t draw_budget)
        : engine_(seed)
        , budget_(draw_budget) {}

    /// Uniform in [0, 1) with 53 bits of precision.
    ///
    /// # Throws
    /// `SimulationError` once the draw budget is spent.
    [[nodiscard]] double uniform() {
        if (draws_ >= budget_) {
            throw SimulationError(fmt::format(
                "random draw budget of {} exhausted", budget_));
        }
        ++draws_;
        return static_cast<double>(engine_() >> 11) * 0x1.0p-53;
    }

    /// Uniform in [lo, hi).
    [[nodiscard]] double uniform(double lo, double hi) {
        return lo + (hi - lo) * uniform();
    }

    /// True with probability `p` (clamped to [0, 1]).  Always draws.
    [[nodiscard]] bool bernoulli(double p) {
        return uniform() < std::clamp(p, 0.0, 1.0);
    }

    /// Uniform index in [0, n).  `n` must be positive.
    [[nodiscard]] std::size_t index(std::size_t n) {
        const auto i = static_cast<std::size_t>(uniform() * static_cast<double>(n));
        return std::min(i, n - 1);
    }

    [[nodiscard]] std::uint64_t draws() const noexcept { return draws_; }

private:
    std::mt19937_64 engine_;
    std::uint64_t   budget_;
    std::uint64_t   draws_ = 0;
};

}  // namespace medsim::sim
