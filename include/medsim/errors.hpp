#pragma once

/// @file include/medsim/errors.hpp
/// @brief Error taxonomy for the medsim engine.
///
/// # Kinds
/// - `ValidationError`   : bad proposal or party profile; raised before any
///                          scoring so nothing is partially evaluated.
/// - `ConfigurationError`: inconsistent thresholds; raised at construction.
/// - `SimulationError`   : fatal to a single simulation run only.
///
/// Cooperative cancellation is NOT an error: the run comes back flagged
/// incomplete.

#include <stdexcept>
#include <string>

namespace medsim {

/// Root of all engine exceptions.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ─── ValidationError ──────────────────────────────────────────────────────────

/// What kind of input was rejected.
enum class ValidationKind {
    DimensionMismatch,    ///< Dimension id not in the issue space
    OutOfRange,           ///< Value outside the declared range / enum
    KindMismatch,         ///< Value type does not match the dimension kind
    MalformedProfile,     ///< Party profile inconsistent with itself or the space
    MalformedProposal,    ///< Proposal structurally unusable (e.g. no parties)
    MalformedIssueSpace,  ///< Duplicate ids, empty enum, inverted range
    UnknownIssueSpace,    ///< No issue space registered under the requested id
};

[[nodiscard]] const char* to_string(ValidationKind k) noexcept;

class ValidationError : public Error {
public:
    /// `subject` names the offending dimension (or party, for profiles).
    ValidationError(ValidationKind kind, std::string subject, const std::string& detail);

    [[nodiscard]] ValidationKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& subject() const noexcept { return subject_; }

private:
    ValidationKind kind_;
    std::string    subject_;
};

// ─── ConfigurationError ───────────────────────────────────────────────────────

class ConfigurationError : public Error {
public:
    /// `setting` is the configuration field name that failed validation.
    ConfigurationError(std::string setting, const std::string& detail);

    [[nodiscard]] const std::string& setting() const noexcept { return setting_; }

private:
    std::string setting_;
};

// ─── SimulationError ──────────────────────────────────────────────────────────

class SimulationError : public Error {
public:
    using Error::Error;
};

}  // namespace medsim
