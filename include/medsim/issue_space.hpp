#pragma once

/// @file include/medsim/issue_space.hpp
/// @brief IssueSpace: the negotiable dimensions of a scenario.
///
/// # Module: IssueSpace
///
/// ## Responsibility
/// Declare each negotiable dimension with its kind and legal range, and
/// validate proposals against it.  Every later stage (utility, simulation)
/// assumes the proposal already passed `IssueSpace::validate`.
///
/// ## Ordinal Mapping
/// Scoring works on a single numeric axis per dimension:
///   - continuous   → the value itself, range [min, max]
///   - boolean      → false = 0, true = 1
///   - categorical  → index of the label in declaration order
///
/// ## Guarantees
/// - Immutable after construction; safe to share across threads
/// - Construction throws `ValidationError(MalformedIssueSpace)` on duplicate
///   ids, empty enumerations or inverted / non-finite ranges

#include "medsim/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace medsim {

// ─── Dimension ────────────────────────────────────────────────────────────────

enum class DimensionKind {
    Continuous,
    Categorical,
    Boolean,
};

[[nodiscard]] const char* to_string(DimensionKind k) noexcept;

/// One negotiable term.
struct Dimension {
    std::string              id;
    DimensionKind            kind = DimensionKind::Continuous;
    double                   min  = 0.0;   ///< Continuous lower bound
    double                   max  = 0.0;   ///< Continuous upper bound
    std::vector<std::string> labels;       ///< Categorical enumeration, ordered
    std::string              unit;         ///< Display unit, e.g. "nm"

    [[nodiscard]] static Dimension continuous(std::string id, double lo, double hi,
                                              std::string unit = {});
    [[nodiscard]] static Dimension boolean(std::string id);
    [[nodiscard]] static Dimension categorical(std::string id,
                                               std::vector<std::string> labels);

    /// Ordinal position of `v` on this dimension.
    ///
    /// # Returns
    /// `nullopt` if `v` has the wrong alternative for this kind, or names a
    /// label outside the enumeration.  Continuous values are NOT range-checked
    /// here; see `contains`.
    [[nodiscard]] std::optional<double> ordinal(const Value& v) const noexcept;

    /// True if `v` has the right kind and lies within range / enumeration.
    [[nodiscard]] bool contains(const Value& v) const noexcept;

    /// Ordinal lower / upper bound of the feasible range.
    [[nodiscard]] double lower() const noexcept;
    [[nodiscard]] double upper() const noexcept;

    /// Human-readable range: "[0, 10] nm", "{closed|joint|open}", "{false|true}".
    [[nodiscard]] std::string describe_range() const;
};

// ─── IssueSpace ───────────────────────────────────────────────────────────────

class IssueSpace {
public:
    IssueSpace(std::string id, std::vector<Dimension> dimensions);

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::vector<Dimension>& dimensions() const noexcept {
        return dimensions_;
    }
    [[nodiscard]] std::size_t size() const noexcept { return dimensions_.size(); }

    /// Dimension by id, or nullptr.
    [[nodiscard]] const Dimension* find(std::string_view dimension_id) const noexcept;

    /// Validate one value against its dimension.
    ///
    /// # Throws
    /// - `ValidationError(DimensionMismatch)`: unknown dimension id
    /// - `ValidationError(KindMismatch)`     : wrong value alternative
    /// - `ValidationError(OutOfRange)`       : outside range or enumeration
    ///
    /// # Returns
    /// The value's ordinal position.
    double checked_ordinal(const std::string& dimension_id, const Value& v) const;

    /// Validate every proposal value; throws on the first offending dimension.
    void validate(const Proposal& proposal) const;

private:
    std::string            id_;
    std::vector<Dimension> dimensions_;
};

}  // namespace medsim
