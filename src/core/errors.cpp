/// @file src/core/errors.cpp
/// @brief Error taxonomy implementation.

#include "medsim/errors.hpp"

#include <fmt/format.h>

namespace medsim {

const char* to_string(ValidationKind k) noexcept {
    switch (k) {
        case ValidationKind::DimensionMismatch:   return "DimensionMismatch";
        case ValidationKind::OutOfRange:          return "OutOfRange";
        case ValidationKind::KindMismatch:        return "KindMismatch";
        case ValidationKind::MalformedProfile:    return "MalformedProfile";
        case ValidationKind::MalformedProposal:   return "MalformedProposal";
        case ValidationKind::MalformedIssueSpace: return "MalformedIssueSpace";
        case ValidationKind::UnknownIssueSpace:   return "UnknownIssueSpace";
    }
    return "Unknown";
}

ValidationError::ValidationError(ValidationKind kind,
                                 std::string subject,
                                 const std::string& detail)
    : Error(fmt::format("{} [{}]: {}", to_string(kind), subject, detail))
    , kind_(kind)
    , subject_(std::move(subject)) {}

ConfigurationError::ConfigurationError(std::string setting, const std::string& detail)
    : Error(fmt::format("ConfigurationError [{}]: {}", setting, detail))
    , setting_(std::move(setting)) {}

}  // namespace medsim
