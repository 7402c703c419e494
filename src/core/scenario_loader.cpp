/// @file src/core/scenario_loader.cpp
/// @brief Line-oriented scenario file loader.

#include "medsim/scenario_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace medsim::core {

namespace {

[[nodiscard]] std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

[[nodiscard]] std::vector<std::string> split(const std::string& line, char sep) {
    std::vector<std::string> out;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, sep)) {
        out.push_back(trim(token));
    }
    return out;
}

[[nodiscard]] std::optional<double> parse_number(const std::string& token) noexcept {
    if (token.empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        const double v = std::stod(token, &pos);
        if (pos != token.size() || !std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

[[nodiscard]] const Dimension* find_dimension(const Scenario& sc, const std::string& id) noexcept {
    const auto it = std::find_if(sc.dimensions.begin(), sc.dimensions.end(),
        [&id](const Dimension& d) { return d.id == id; });
    return it == sc.dimensions.end() ? nullptr : &*it;
}

[[nodiscard]] PartyProfile* find_party(Scenario& sc, const std::string& id) noexcept {
    const auto it = std::find_if(sc.parties.begin(), sc.parties.end(),
        [&id](const PartyProfile& p) { return p.party_id == id; });
    return it == sc.parties.end() ? nullptr : &*it;
}

// ─── Row handlers ─────────────────────────────────────────────────────────────
// Each returns false when the row is malformed and must be skipped.

bool parse_dimension(const std::vector<std::string>& f, Scenario& sc) {
    if (f.size() < 3 || f[1].empty()) return false;
    const std::string& kind = f[2];

    if (kind == "continuous") {
        if (f.size() < 5 || f.size() > 6) return false;
        const auto lo = parse_number(f[3]);
        const auto hi = parse_number(f[4]);
        if (!lo || !hi) return false;
        sc.dimensions.push_back(Dimension::continuous(f[1], *lo, *hi,
                                                      f.size() == 6 ? f[5] : std::string{}));
        return true;
    }
    if (kind == "boolean") {
        if (f.size() != 3) return false;
        sc.dimensions.push_back(Dimension::boolean(f[1]));
        return true;
    }
    if (kind == "categorical") {
        if (f.size() != 4) return false;
        auto labels = split(f[3], '|');
        if (labels.empty() || std::any_of(labels.begin(), labels.end(),
                                          [](const std::string& l) { return l.empty(); })) {
            return false;
        }
        sc.dimensions.push_back(Dimension::categorical(f[1], std::move(labels)));
        return true;
    }
    return false;
}

bool parse_party(const std::vector<std::string>& f, Scenario& sc) {
    if (f.size() != 4 || f[1].empty() || find_party(sc, f[1]) != nullptr) return false;
    const auto batna = parse_number(f[2]);
    const auto risk  = parse_number(f[3]);
    if (!batna || !risk) return false;

    PartyProfile p;
    p.party_id       = f[1];
    p.batna_utility  = *batna;
    p.risk_tolerance = *risk;
    sc.parties.push_back(std::move(p));
    return true;
}

bool parse_interest(const std::vector<std::string>& f, Scenario& sc) {
    if (f.size() != 6) return false;
    PartyProfile* party = find_party(sc, f[1]);
    const Dimension* dim = find_dimension(sc, f[2]);
    if (party == nullptr || dim == nullptr) return false;

    const auto weight  = parse_number(f[3]);
    const auto ideal   = ScenarioLoader::parse_value(*dim, f[4]);
    const auto minimum = ScenarioLoader::parse_value(*dim, f[5]);
    if (!weight || !ideal || !minimum) return false;

    party->interests[dim->id] = Interest{
        .weight             = *weight,
        .ideal              = *ideal,
        .minimum_acceptable = *minimum,
    };
    return true;
}

bool parse_red_line(const std::vector<std::string>& f, Scenario& sc) {
    if (f.size() != 3 || f[2].empty()) return false;
    PartyProfile* party = find_party(sc, f[1]);
    if (party == nullptr) return false;
    party->red_lines.insert(f[2]);
    return true;
}

bool parse_proposal(const std::vector<std::string>& f, Scenario& sc) {
    if (f.size() < 2 || f.size() > 4 || f[1].empty()) return false;
    std::size_t round_number = sc.proposal.round_number;
    if (f.size() >= 3) {
        // size_t max rounds up to 2^64 as a double, so the bound is exclusive.
        constexpr double round_limit =
            static_cast<double>(std::numeric_limits<std::size_t>::max());
        const auto round = parse_number(f[2]);
        if (!round || *round < 0.0 || *round >= round_limit
            || *round != std::floor(*round)) {
            return false;
        }
        round_number = static_cast<std::size_t>(*round);
    }
    sc.proposal.id           = f[1];
    sc.proposal.round_number = round_number;
    if (f.size() == 4) {
        sc.proposal.proposer = f[3];
    }
    return true;
}

bool parse_term(const std::vector<std::string>& f, Scenario& sc) {
    if (f.size() != 3) return false;
    const Dimension* dim = find_dimension(sc, f[1]);
    if (dim == nullptr) return false;
    const auto value = ScenarioLoader::parse_value(*dim, f[2]);
    if (!value) return false;
    sc.proposal.values[dim->id] = *value;
    return true;
}

}  // namespace

// ─── Scenario ─────────────────────────────────────────────────────────────────

IssueSpace Scenario::issue_space(std::string id) const {
    return IssueSpace(std::move(id), dimensions);
}

// ─── ScenarioLoader::parse_value ──────────────────────────────────────────────

std::optional<Value>
ScenarioLoader::parse_value(const Dimension& dim, const std::string& token) noexcept {
    const std::string t = trim(token);
    if (t.empty()) return std::nullopt;

    switch (dim.kind) {
        case DimensionKind::Continuous: {
            const auto v = parse_number(t);
            if (!v) return std::nullopt;
            return Value{*v};
        }
        case DimensionKind::Boolean: {
            std::string lower = t;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lower == "true" || lower == "1" || lower == "yes")  return Value{true};
            if (lower == "false" || lower == "0" || lower == "no")  return Value{false};
            return std::nullopt;
        }
        case DimensionKind::Categorical:
            return Value{t};
    }
    return std::nullopt;
}

// ─── ScenarioLoader::parse_string ─────────────────────────────────────────────

Scenario ScenarioLoader::parse_string(const std::string& content) noexcept {
    Scenario sc;
    sc.proposal.id = "proposal";

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        // Strip trailing comments and carriage returns.
        if (const auto hash = line.find('#'); hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) continue;

        const auto fields = split(line, ',');
        const std::string& record = fields.front();

        bool ok = false;
        if      (record == "dimension") ok = parse_dimension(fields, sc);
        else if (record == "party")     ok = parse_party(fields, sc);
        else if (record == "interest")  ok = parse_interest(fields, sc);
        else if (record == "redline")   ok = parse_red_line(fields, sc);
        else if (record == "proposal")  ok = parse_proposal(fields, sc);
        else if (record == "term")      ok = parse_term(fields, sc);

        if (!ok) {
            ++sc.skipped_rows;
        }
    }
    return sc;
}

// ─── ScenarioLoader::load_file ────────────────────────────────────────────────

std::optional<Scenario> ScenarioLoader::load_file(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string contents;
    std::string line;
    while (std::getline(file, line)) {
        contents += line;
        contents += '\n';
    }
    return parse_string(contents);
}

}  // namespace medsim::core
