#pragma once

/// @file include/medsim/scenario_loader.hpp
/// @brief Scenario file loader for the medsim CLI.
///
/// # Module: ScenarioLoader
///
/// ## Responsibility
/// Parse a line-oriented scenario description into dimensions, party profiles
/// and a proposal.  Malformed rows are skipped and counted; the loader never
/// crashes on bad input.  Semantic checks (ranges, weights) are left to the
/// engine, which reports them as `ValidationError`.
///
/// ## Format
/// ```
/// # comment
/// dimension,standoff_nm,continuous,0,10,nm
/// dimension,hotline,boolean
/// dimension,zone_regime,categorical,closed|joint|open
/// party,PartyA,0.30,0.50               # id, batna, risk tolerance
/// interest,PartyA,standoff_nm,0.4,5,2  # party, dim, weight, ideal, minimum
/// redline,PartyA,standoff_nm
/// proposal,draft-1,1,Mediator          # id, round, proposer
/// term,standoff_nm,3
/// term,hotline,true
/// ```
/// Values in `interest` and `term` rows are interpreted against the declared
/// kind of their dimension, so dimensions must be declared first.
///
/// ## Guarantees
/// - Never throws; `load_file` returns `nullopt` only if the file cannot be read
/// - Does not modify any file or external state

#include "medsim/issue_space.hpp"
#include "medsim/party.hpp"
#include "medsim/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace medsim::core {

struct Scenario {
    std::vector<Dimension>    dimensions;
    std::vector<PartyProfile> parties;
    Proposal                  proposal;
    std::size_t               skipped_rows = 0;

    /// Build the issue space.
    ///
    /// # Throws
    /// `ValidationError(MalformedIssueSpace)` for inconsistent dimensions.
    [[nodiscard]] IssueSpace issue_space(std::string id) const;
};

class ScenarioLoader {
public:
    /// Load a scenario file from disk.
    ///
    /// # Returns
    /// `nullopt` if the file cannot be opened, otherwise the parsed scenario.
    [[nodiscard]] static std::optional<Scenario>
    load_file(const std::string& filepath) noexcept;

    /// Parse scenario text (useful for testing and fuzzing).
    [[nodiscard]] static Scenario
    parse_string(const std::string& content) noexcept;

    /// Interpret a raw token as a value of `dim`'s kind.
    ///
    /// # Returns
    /// `nullopt` for an empty token, a non-numeric continuous value, or a
    /// boolean token other than true/false/1/0/yes/no.  Categorical labels
    /// are passed through unchecked.
    [[nodiscard]] static std::optional<Value>
    parse_value(const Dimension& dim, const std::string& token) noexcept;
};

}  // namespace medsim::core
