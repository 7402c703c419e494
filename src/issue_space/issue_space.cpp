/// @file src/issue_space/issue_space.cpp
/// @brief Dimension and IssueSpace implementation.

#include "medsim/issue_space.hpp"
#include "medsim/errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <set>

namespace medsim {

// ─── DimensionKind ────────────────────────────────────────────────────────────

const char* to_string(DimensionKind k) noexcept {
    switch (k) {
        case DimensionKind::Continuous:  return "continuous";
        case DimensionKind::Categorical: return "categorical";
        case DimensionKind::Boolean:     return "boolean";
    }
    return "unknown";
}

// ─── Dimension factories ──────────────────────────────────────────────────────

Dimension Dimension::continuous(std::string id, double lo, double hi, std::string unit) {
    return Dimension{
        .id     = std::move(id),
        .kind   = DimensionKind::Continuous,
        .min    = lo,
        .max    = hi,
        .labels = {},
        .unit   = std::move(unit),
    };
}

Dimension Dimension::boolean(std::string id) {
    return Dimension{
        .id     = std::move(id),
        .kind   = DimensionKind::Boolean,
        .min    = 0.0,
        .max    = 1.0,
        .labels = {},
        .unit   = {},
    };
}

Dimension Dimension::categorical(std::string id, std::vector<std::string> labels) {
    const double hi = labels.empty() ? 0.0 : static_cast<double>(labels.size() - 1);
    return Dimension{
        .id     = std::move(id),
        .kind   = DimensionKind::Categorical,
        .min    = 0.0,
        .max    = hi,
        .labels = std::move(labels),
        .unit   = {},
    };
}

// ─── Dimension queries ────────────────────────────────────────────────────────

std::optional<double> Dimension::ordinal(const Value& v) const noexcept {
    switch (kind) {
        case DimensionKind::Continuous:
            if (const auto* d = std::get_if<double>(&v)) return *d;
            return std::nullopt;

        case DimensionKind::Boolean:
            if (const auto* b = std::get_if<bool>(&v)) return *b ? 1.0 : 0.0;
            return std::nullopt;

        case DimensionKind::Categorical: {
            const auto* s = std::get_if<std::string>(&v);
            if (s == nullptr) return std::nullopt;
            const auto it = std::find(labels.begin(), labels.end(), *s);
            if (it == labels.end()) return std::nullopt;
            return static_cast<double>(std::distance(labels.begin(), it));
        }
    }
    return std::nullopt;
}

bool Dimension::contains(const Value& v) const noexcept {
    const auto pos = ordinal(v);
    if (!pos.has_value())       return false;
    if (!std::isfinite(*pos))   return false;
    return *pos >= lower() && *pos <= upper();
}

double Dimension::lower() const noexcept {
    return kind == DimensionKind::Continuous ? min : 0.0;
}

double Dimension::upper() const noexcept {
    switch (kind) {
        case DimensionKind::Continuous:  return max;
        case DimensionKind::Boolean:     return 1.0;
        case DimensionKind::Categorical:
            return labels.empty() ? 0.0 : static_cast<double>(labels.size() - 1);
    }
    return 0.0;
}

std::string Dimension::describe_range() const {
    switch (kind) {
        case DimensionKind::Continuous:
            return unit.empty() ? fmt::format("[{:g}, {:g}]", min, max)
                                : fmt::format("[{:g}, {:g}] {}", min, max, unit);
        case DimensionKind::Boolean:
            return "{false|true}";
        case DimensionKind::Categorical:
            return fmt::format("{{{}}}", fmt::join(labels, "|"));
    }
    return {};
}

// ─── IssueSpace ───────────────────────────────────────────────────────────────

IssueSpace::IssueSpace(std::string id, std::vector<Dimension> dimensions)
    : id_(std::move(id))
    , dimensions_(std::move(dimensions))
{
    std::set<std::string> seen;
    for (const auto& d : dimensions_) {
        if (d.id.empty()) {
            throw ValidationError(ValidationKind::MalformedIssueSpace, id_,
                                  "dimension with empty id");
        }
        if (!seen.insert(d.id).second) {
            throw ValidationError(ValidationKind::MalformedIssueSpace, d.id,
                                  "duplicate dimension id");
        }
        switch (d.kind) {
            case DimensionKind::Continuous:
                if (!std::isfinite(d.min) || !std::isfinite(d.max) || d.min > d.max) {
                    throw ValidationError(ValidationKind::MalformedIssueSpace, d.id,
                        fmt::format("invalid range [{}, {}]", d.min, d.max));
                }
                break;
            case DimensionKind::Categorical: {
                if (d.labels.empty()) {
                    throw ValidationError(ValidationKind::MalformedIssueSpace, d.id,
                                          "categorical dimension without labels");
                }
                const std::set<std::string> unique(d.labels.begin(), d.labels.end());
                if (unique.size() != d.labels.size()) {
                    throw ValidationError(ValidationKind::MalformedIssueSpace, d.id,
                                          "duplicate categorical label");
                }
                break;
            }
            case DimensionKind::Boolean:
                break;
        }
    }
}

const Dimension* IssueSpace::find(std::string_view dimension_id) const noexcept {
    const auto it = std::find_if(dimensions_.begin(), dimensions_.end(),
        [dimension_id](const Dimension& d) { return d.id == dimension_id; });
    return it == dimensions_.end() ? nullptr : &*it;
}

double IssueSpace::checked_ordinal(const std::string& dimension_id, const Value& v) const {
    const Dimension* dim = find(dimension_id);
    if (dim == nullptr) {
        throw ValidationError(ValidationKind::DimensionMismatch, dimension_id,
            fmt::format("not a dimension of issue space '{}'", id_));
    }

    const auto pos = dim->ordinal(v);
    if (!pos.has_value()) {
        // A categorical string outside the enumeration is a range problem,
        // not a kind problem.
        if (dim->kind == DimensionKind::Categorical && std::holds_alternative<std::string>(v)) {
            throw ValidationError(ValidationKind::OutOfRange, dimension_id,
                fmt::format("value '{}' not in {}", to_string(v), dim->describe_range()));
        }
        throw ValidationError(ValidationKind::KindMismatch, dimension_id,
            fmt::format("value '{}' is not {}", to_string(v), to_string(dim->kind)));
    }

    if (!dim->contains(v)) {
        throw ValidationError(ValidationKind::OutOfRange, dimension_id,
            fmt::format("value {} outside {}", to_string(v), dim->describe_range()));
    }
    return *pos;
}

void IssueSpace::validate(const Proposal& proposal) const {
    for (const auto& [dim_id, value] : proposal.values) {
        (void)checked_ordinal(dim_id, value);
    }
}

}  // namespace medsim
