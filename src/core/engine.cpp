/// @file src/core/engine.cpp
/// @brief Engine facade: evaluation, simulation and cancellation.

#include "medsim/engine.hpp"
#include "medsim/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <mutex>
#include <random>
#include <set>

namespace medsim::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

void AgreementConfig::validate() const {
    if (!(aspiration_level > 0.0 && aspiration_level <= 1.0)) {
        throw ConfigurationError("agreement.aspiration_level",
                                 fmt::format("{} must lie in (0, 1]", aspiration_level));
    }
    if (!(aspiration_fraction > 0.0 && aspiration_fraction <= 1.0)) {
        throw ConfigurationError("agreement.aspiration_fraction",
                                 fmt::format("{} must lie in (0, 1]", aspiration_fraction));
    }
}

void EngineConfig::validate() const {
    utility.validate();
    acceptance.validate();
    simulation.validate();
    trend.validate();
    agreement.validate();
}

namespace {

[[nodiscard]] EngineConfig prepared(EngineConfig config) {
    config.validate();
    if (config.verbose) {
        config.simulation.verbose = true;
    }
    return config;
}

/// Reject an empty or ambiguous party list, then every party profile,
/// before anything is scored.
void validate_parties(std::span<const PartyProfile> parties, const IssueSpace& space) {
    if (parties.empty()) {
        throw ValidationError(ValidationKind::MalformedProfile, "<parties>",
                              "at least one party profile is required");
    }
    std::set<std::string> seen;
    for (const auto& party : parties) {
        party.validate(space);
        if (!seen.insert(party.party_id).second) {
            throw ValidationError(ValidationKind::MalformedProfile, party.party_id,
                                  "duplicate party id");
        }
    }
}

}  // namespace

// ─── Evaluation ───────────────────────────────────────────────────────────────

std::string Evaluation::to_string() const {
    std::string out;
    out += fmt::format("{:<12} {:>8} {:>8} {:>9} {:>8}  {}\n",
                       "party", "utility", "BATNA", "margin", "p(acc)", "status");
    for (std::size_t i = 0; i < utilities.size() && i < acceptances.size(); ++i) {
        const auto& u = utilities[i];
        const auto& a = acceptances[i];
        out += fmt::format("{:<12} {:>8.4f} {:>8.2f} {:>+9.4f} {:>8.4f}  {}{}\n",
                           u.party_id, u.score, u.batna_utility, u.batna_margin,
                           a.probability, bargaining::to_string(a.status),
                           u.vetoed ? " (red-line veto)" : "");
    }
    out += fmt::format("overall agreement probability: {:.4f}\n", overall_probability);
    out += fmt::format("zone of possible agreement   : {}\n", analysis.zopa_exists ? "yes" : "no");
    out += fmt::format("Pareto efficient             : {}\n", analysis.pareto_efficient ? "yes" : "no");
    out += fmt::format("Nash product                 : {:.6f}\n", analysis.nash_product);
    for (const auto& hint : analysis.hints) {
        out += fmt::format("  - {}\n", hint);
    }
    return out;
}

// ─── SimulationHandle ─────────────────────────────────────────────────────────

SimulationHandle::SimulationHandle(std::future<sim::SimulationRun> result,
                                   sim::CancellationToken token,
                                   std::uint64_t seed)
    : result_(std::move(result))
    , token_(std::move(token))
    , seed_(seed) {}

SimulationHandle::~SimulationHandle() {
    if (result_.valid()) {
        token_.request();
    }
}

SimulationHandle& SimulationHandle::operator=(SimulationHandle&& other) noexcept {
    if (this != &other) {
        if (result_.valid()) {
            token_.request();
        }
        result_ = std::move(other.result_);
        token_  = std::move(other.token_);
        seed_   = other.seed_;
    }
    return *this;
}

void SimulationHandle::cancel() noexcept {
    if (result_.valid()) {
        token_.request();
    }
}

sim::SimulationRun SimulationHandle::get() {
    if (!result_.valid()) {
        throw SimulationError(fmt::format("result of run with seed {} was already taken", seed_));
    }
    return result_.get();
}

// ─── Engine ───────────────────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(prepared(std::move(config)))
    , utility_(config_.utility)
    , acceptance_(config_.acceptance)
    , simulator_(config_.simulation, config_.trend) {}

void Engine::register_issue_space(IssueSpace space) {
    auto shared = std::make_shared<const IssueSpace>(std::move(space));
    std::unique_lock lock(registry_mutex_);
    registry_.insert_or_assign(shared->id(), std::move(shared));
}

std::shared_ptr<const IssueSpace> Engine::issue_space(std::string_view id) const {
    std::shared_lock lock(registry_mutex_);
    const auto it = registry_.find(id);
    if (it == registry_.end()) {
        throw ValidationError(ValidationKind::UnknownIssueSpace, std::string(id),
                              "no issue space registered under this id");
    }
    return it->second;
}

Evaluation Engine::evaluate_proposal(std::string_view issue_space_id,
                                     const Proposal& proposal,
                                     std::span<const PartyProfile> parties) const {
    const auto space = issue_space(issue_space_id);
    space->validate(proposal);
    validate_parties(parties, *space);

    Evaluation eval;
    eval.utilities.reserve(parties.size());
    eval.acceptances.reserve(parties.size());

    for (const auto& party : parties) {
        eval.utilities.push_back(utility_.score(proposal, party, *space));
        eval.acceptances.push_back(acceptance_.evaluate(eval.utilities.back(), party));
    }
    eval.overall_probability = bargaining::AcceptanceModel::aggregate(eval.acceptances);
    eval.analysis            = analyse(eval.utilities);

    if (config_.verbose) {
        for (const auto& u : eval.utilities) {
            fmt::print(stderr, "[medsim] {} on '{}': {}\n",
                       proposal.id, issue_space_id, u.to_string());
        }
        fmt::print(stderr, "[medsim] {} overall p={:.4f}\n",
                   proposal.id, eval.overall_probability);
    }
    return eval;
}

sim::SimulationRun Engine::simulate_agreement(std::string_view issue_space_id,
                                              const Proposal& proposal,
                                              std::span<const PartyProfile> parties,
                                              std::size_t duration,
                                              std::optional<std::uint64_t> seed,
                                              const sim::RunOptions& options) const {
    const auto space = issue_space(issue_space_id);
    const std::uint64_t s = seed ? *seed : generate_seed();

    if (config_.verbose) {
        fmt::print(stderr, "[medsim] simulating {} for {} steps (seed {}{})\n",
                   proposal.id, duration, s, seed ? "" : ", generated");
    }
    return simulator_.run(proposal, *space, parties, duration, s, options);
}

SimulationHandle Engine::start_simulation(std::string_view issue_space_id,
                                          Proposal proposal,
                                          std::vector<PartyProfile> parties,
                                          std::size_t duration,
                                          std::optional<std::uint64_t> seed) const {
    auto space = issue_space(issue_space_id);
    const std::uint64_t s = seed ? *seed : generate_seed();
    sim::CancellationToken token;

    // The task owns copies of everything it touches, so the handle may
    // outlive this engine.
    auto task = [simulator = simulator_, space = std::move(space),
                 proposal = std::move(proposal), parties = std::move(parties),
                 duration, s, token]() {
        sim::RunOptions options;
        options.cancel = token;
        return simulator.run(proposal, *space, parties, duration, s, options);
    };

    return SimulationHandle(std::async(std::launch::async, std::move(task)), token, s);
}

void Engine::cancel_simulation(SimulationHandle& handle) noexcept {
    handle.cancel();
}

std::uint64_t Engine::generate_seed() {
    std::random_device rd;
    const auto hi = static_cast<std::uint64_t>(rd());
    const auto lo = static_cast<std::uint64_t>(rd());
    return (hi << 32) ^ lo;
}

// ─── Engine::analyse ──────────────────────────────────────────────────────────

AgreementAnalysis Engine::analyse(std::span<const bargaining::UtilityScore> utilities) const {
    const double near_aspiration =
        config_.agreement.aspiration_fraction * config_.agreement.aspiration_level;

    AgreementAnalysis a;
    a.zopa_exists = !utilities.empty();
    bool any_surplus     = false;
    bool any_near_aspiration = false;
    double product       = 1.0;

    for (const auto& u : utilities) {
        const double surplus = u.score - u.batna_utility;
        if (u.below_batna || u.vetoed) {
            a.zopa_exists = false;
        }
        // Parties without a positive surplus drop out of the product.
        if (surplus > 0.0) {
            product    *= surplus;
            any_surplus = true;
        }
        if (u.score >= near_aspiration) {
            any_near_aspiration = true;
        }

        if (u.below_batna) {
            a.below_batna.push_back(u.party_id);
            a.hints.push_back(fmt::format(
                "{} is {:.3f} below its BATNA; improve its highest-weighted dimensions",
                u.party_id, -u.batna_margin));
        }
        for (const auto& dim : u.vetoing_dimensions) {
            a.hints.push_back(fmt::format(
                "{} vetoes on '{}'; bring it back inside the red line", u.party_id, dim));
        }
        for (const auto& d : u.breakdown) {
            if (!d.present && d.weight > 0.0) {
                a.hints.push_back(fmt::format(
                    "proposal does not address '{}', which {} weights {:.2f}",
                    d.dimension_id, u.party_id, d.weight));
            } else if (d.past_minimum && !d.red_line) {
                a.hints.push_back(fmt::format(
                    "'{}' is past {}'s minimum acceptable value", d.dimension_id, u.party_id));
            }
        }
    }
    a.nash_product     = any_surplus ? product : 0.0;
    a.pareto_efficient = a.zopa_exists && any_near_aspiration;
    return a;
}

}  // namespace medsim::core
