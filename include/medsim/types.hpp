#pragma once

/// @file include/medsim/types.hpp
/// @brief Shared value types for the medsim Bargaining & Simulation Engine.
///
/// A negotiable term takes one of three shapes: a continuous number, a
/// yes/no switch, or a label from an ordered enumeration.  `Value` carries
/// whichever the dimension declares; `IssueSpace` maps it to an ordinal
/// position for scoring.

#include <cstddef>
#include <map>
#include <string>
#include <variant>

namespace medsim {

// ─── Value ────────────────────────────────────────────────────────────────────

/// Term value.  Construct continuous values from `double` literals (`3.0`,
/// not `3`): an `int` converts to neither alternative without narrowing.
using Value = std::variant<double, bool, std::string>;

/// Human-readable rendering ("3.5", "true", "joint").
[[nodiscard]] std::string to_string(const Value& v);

// ─── Proposal ─────────────────────────────────────────────────────────────────

/// A candidate agreement: one value per negotiated dimension.
///
/// Treated as immutable once handed to the engine; every scoring and
/// simulation call takes it by const reference.
struct Proposal {
    std::string                  id;            ///< Caller-assigned identifier
    std::map<std::string, Value> values;        ///< Dimension id → term value
    std::size_t                  round_number = 0;
    std::string                  proposer;      ///< Party or mediator id

    /// Value for `dimension_id`, or nullptr if the proposal is silent on it.
    [[nodiscard]] const Value* find(const std::string& dimension_id) const noexcept;
};

}  // namespace medsim
