/// @file src/sim/agent_simulator.cpp
/// @brief AgentSimulator: step loop, interactions and incident resolution.

#include "medsim/simulation.hpp"
#include "medsim/errors.hpp"
#include "sim/behavior_table.hpp"
#include "sim/random_stream.hpp"
#include "sim/weather.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <set>

namespace medsim::sim {

// ─── Names ────────────────────────────────────────────────────────────────────

const char* to_string(AgentRole r) noexcept {
    switch (r) {
        case AgentRole::CoastGuard: return "coast_guard";
        case AgentRole::Navy:       return "navy";
        case AgentRole::Militia:    return "militia";
        case AgentRole::Fisher:     return "fisher";
    }
    return "unknown";
}

const char* to_string(ActivityKind a) noexcept {
    switch (a) {
        case ActivityKind::Patrol:   return "patrol";
        case ActivityKind::Resupply: return "resupply";
        case ActivityKind::Fishing:  return "fishing";
    }
    return "unknown";
}

const char* to_string(WeatherState w) noexcept {
    switch (w) {
        case WeatherState::Calm:     return "calm";
        case WeatherState::Moderate: return "moderate";
        case WeatherState::Rough:    return "rough";
    }
    return "unknown";
}

// ─── SimulationConfig ─────────────────────────────────────────────────────────

void SimulationConfig::validate() const {
    const auto probability = [](const char* name, double v) {
        if (!(v >= 0.0 && v <= 1.0)) {
            throw ConfigurationError(fmt::format("simulation.{}", name),
                                     fmt::format("{} outside [0, 1]", v));
        }
    };
    const auto positive = [](const char* name, double v) {
        if (!std::isfinite(v) || v <= 0.0) {
            throw ConfigurationError(fmt::format("simulation.{}", name),
                                     fmt::format("{} must be positive", v));
        }
    };

    probability("cues_success", cues_success);
    probability("hotline_success", hotline_success);
    probability("weather_change_rate", weather_change_rate);
    probability("accident_rate", accident_rate);
    probability("interaction_rate", interaction_rate);

    if (!std::isfinite(weather_perturbation) || weather_perturbation < 0.0) {
        throw ConfigurationError("simulation.weather_perturbation",
            fmt::format("{} must be non-negative", weather_perturbation));
    }
    if (!std::isfinite(recent_incident_weight) || recent_incident_weight < 0.0) {
        throw ConfigurationError("simulation.recent_incident_weight",
            fmt::format("{} must be non-negative", recent_incident_weight));
    }
    if (!(memory_decay > 0.0 && memory_decay <= 1.0)) {
        throw ConfigurationError("simulation.memory_decay",
            fmt::format("{} outside (0, 1]", memory_decay));
    }
    positive("tension_cap", tension_cap);
    positive("standoff_scale_nm", standoff_scale_nm);
    positive("notice_tolerance_hours", notice_tolerance_hours);

    if (zone_count == 0) {
        throw ConfigurationError("simulation.zone_count", "must be at least 1");
    }
    if (memory_capacity == 0) {
        throw ConfigurationError("simulation.memory_capacity", "must be at least 1");
    }
    if (random_draw_budget == 0) {
        throw ConfigurationError("simulation.random_draw_budget", "must be at least 1");
    }

    for (const auto& spec : roster) {
        if (spec.party_id.empty()) {
            throw ConfigurationError("simulation.roster", "entry without party_id");
        }
        if (spec.count == 0) {
            throw ConfigurationError("simulation.roster",
                fmt::format("entry for '{}' has count 0", spec.party_id));
        }
        if (!(spec.base_aggression >= 0.0 && spec.base_aggression <= 1.0)
            || !(spec.compliance_bias >= 0.0 && spec.compliance_bias <= 1.0)) {
            throw ConfigurationError("simulation.roster",
                fmt::format("entry for '{}' has rates outside [0, 1]", spec.party_id));
        }
    }
}

// ─── CancellationToken ────────────────────────────────────────────────────────

CancellationToken::CancellationToken()
    : flag_(std::make_shared<std::atomic<bool>>(false)) {}

void CancellationToken::request() noexcept {
    flag_->store(true, std::memory_order_release);
}

bool CancellationToken::requested() const noexcept {
    return flag_->load(std::memory_order_acquire);
}

// ─── Theatre ──────────────────────────────────────────────────────────────────

namespace {

/// Tension left behind by a de-escalated incident, relative to its severity.
constexpr double DE_ESCALATED_TENSION_SHARE = 0.25;

/// Share of an incident's tension that spreads to the whole theatre.
constexpr double THEATRE_TENSION_SHARE = 0.5;

/// Tension an agent takes on from its own procedural violation.
constexpr double PROCEDURAL_TENSION_SHARE = 0.5;

[[nodiscard]] IncidentType classify_severity(double severity) noexcept {
    if (severity < 0.15) return IncidentType::CloseApproach;
    if (severity < 0.30) return IncidentType::Warning;
    if (severity < 0.50) return IncidentType::Blocking;
    if (severity < 0.70) return IncidentType::WaterCannon;
    if (severity < 0.85) return IncidentType::DetentionAttempt;
    return IncidentType::Collision;
}

/// Everything one run mutates: agents, weather, theatre tension and the RNG.
class Theatre {
public:
    Theatre(const SimulationConfig& config,
            AgreementTerms terms,
            std::vector<AgentState> agents,
            std::uint64_t seed)
        : cfg_(config)
        , terms_(terms)
        , agents_(std::move(agents))
        , rng_(seed, config.random_draw_budget)
        , weather_(config.initial_weather) {}

    void step(std::size_t step, SimulationRun& run) {
        weather_ = next_weather(weather_, cfg_.weather_change_rate, rng_);
        run.weather_trace.push_back(weather_);

        relax();
        const auto active = sample_activities(step, run);

        for (std::size_t x = 0; x < active.size(); ++x) {
            for (std::size_t y = x + 1; y < active.size(); ++y) {
                AgentState& a = agents_[active[x]];
                AgentState& b = agents_[active[y]];
                if (a.party_id == b.party_id || a.zone != b.zone) continue;
                interact(a, b, step, run);
            }
        }
    }

    [[nodiscard]] WeatherState weather() const noexcept { return weather_; }

    [[nodiscard]] std::vector<AgentState> release_agents() { return std::move(agents_); }

private:
    void relax() {
        const double keep = 1.0 - cfg_.memory_decay;
        theatre_tension_ *= keep;
        for (auto& a : agents_) {
            a.tension *= keep;
            a.aggression_level = std::clamp(
                a.base_aggression * (1.0 + a.tension + theatre_tension_),
                constants::MIN_AGGRESSION, constants::MAX_AGGRESSION);
        }
    }

    [[nodiscard]] std::vector<std::size_t> sample_activities(std::size_t step, SimulationRun& run) {
        std::vector<std::size_t> active;
        for (std::size_t i = 0; i < agents_.size(); ++i) {
            AgentState& a = agents_[i];
            const auto rates    = activity_rates(a.role);
            const auto activity = select_activity(rates, rng_.uniform());
            if (!activity) continue;

            ++run.activity[a.party_id].activities;
            if (*activity == ActivityKind::Resupply) {
                // Resupply runs converge on the contested feature.
                a.zone = 0;
                check_resupply(a, rates, step, run);
            } else {
                a.zone = rng_.index(cfg_.zone_count);
            }
            active.push_back(i);
        }
        return active;
    }

    void check_resupply(AgentState& a, const ActivityRates& rates,
                        std::size_t step, SimulationRun& run) {
        const auto escorts = static_cast<double>(rng_.index(rates.max_escorts + 1));
        bool breach = false;

        if (terms_.escort_limit && escorts > *terms_.escort_limit) {
            // A compliant skipper trims the escort group to the limit.
            if (!rng_.bernoulli(a.compliance_bias)) breach = true;
        }
        if (terms_.notice_hours && *terms_.notice_hours > 0.0) {
            const double burden = 1.0 - std::exp(-*terms_.notice_hours / cfg_.notice_tolerance_hours);
            const double p_notice = 1.0 - (1.0 - a.compliance_bias) * burden;
            if (!rng_.bernoulli(p_notice)) breach = true;
        }
        if (!breach) return;

        Incident incident;
        incident.step                = step;
        incident.actors              = {a.id};
        incident.type                = IncidentType::ProceduralViolation;
        incident.severity            = rng_.uniform(0.05, 0.25);
        incident.agreement_violation = true;
        incident.responsible_party   = a.party_id;

        ++run.activity[a.party_id].violations;
        add_tension(a, PROCEDURAL_TENSION_SHARE * incident.severity);
        remember(a, MemoryEntry{.step = step, .severity = incident.severity, .incident = true});
        run.incident_log.push_back(std::move(incident));
    }

    void interact(AgentState& a, AgentState& b, std::size_t step, SimulationRun& run) {
        AgentState& initiator = b.aggression_level > a.aggression_level ? b : a;
        AgentState& other     = &initiator == &a ? b : a;

        const double w        = weather_index(weather_);
        const double tension  = std::min(cfg_.tension_cap,
                                         std::max(a.tension, b.tension) + theatre_tension_);
        const double standoff = std::max(0.0, terms_.standoff_nm.value_or(0.0));

        const auto recalled = static_cast<double>(recalled_incidents(initiator));

        // p = rate · aggr · (1 − ½·compliance) · e^(−standoff/scale)
        //       · (1 + tension) · (1 + perturbation · w) · (1 + weight · recalled)
        const double p_deliberate = cfg_.interaction_rate
                                  * initiator.aggression_level
                                  * (1.0 - 0.5 * initiator.compliance_bias)
                                  * std::exp(-standoff / cfg_.standoff_scale_nm)
                                  * (1.0 + tension)
                                  * (1.0 + cfg_.weather_perturbation * w)
                                  * (1.0 + cfg_.recent_incident_weight * recalled);

        const bool deliberate = rng_.bernoulli(p_deliberate);
        const bool accident   = rng_.bernoulli(cfg_.accident_rate * w);

        if (!deliberate && !accident) {
            const MemoryEntry benign{.step = step, .severity = 0.0, .incident = false};
            remember(a, benign);
            remember(b, benign);
            return;
        }

        Incident incident;
        incident.step   = step;
        incident.actors = {initiator.id, other.id};

        if (deliberate) {
            const double raw = rng_.uniform()
                             * (0.5 + initiator.aggression_level)
                             * (1.0 + 0.25 * tension);
            incident.severity            = std::clamp(raw, 0.0, 1.0);
            incident.agreement_violation = terms_.standoff_nm.has_value();
            incident.responsible_party   = initiator.party_id;
            if (incident.agreement_violation) {
                ++run.activity[initiator.party_id].violations;
            }
        } else {
            incident.severity   = rng_.uniform(0.0, 0.5);
            incident.accidental = true;
        }
        incident.type = classify_severity(incident.severity);
        resolve(incident);

        const double contribution = incident.severity
            * (incident.de_escalated ? DE_ESCALATED_TENSION_SHARE : 1.0);
        add_tension(a, contribution);
        add_tension(b, contribution);
        theatre_tension_ = std::min(cfg_.tension_cap,
                                    theatre_tension_ + THEATRE_TENSION_SHARE * contribution);

        const MemoryEntry entry{.step = step, .severity = incident.severity, .incident = true};
        remember(a, entry);
        remember(b, entry);
        run.incident_log.push_back(std::move(incident));
    }

    /// CUES on scene first, then the hotline if the incident is still live.
    void resolve(Incident& incident) {
        if (terms_.cues) {
            incident.mechanism = Mechanism::Cues;
            incident.de_escalated = rng_.bernoulli(cfg_.cues_success);
        }
        if (!incident.de_escalated && terms_.hotline) {
            incident.mechanism = Mechanism::Hotline;
            incident.de_escalated = rng_.bernoulli(cfg_.hotline_success);
        }
    }

    void add_tension(AgentState& a, double amount) noexcept {
        a.tension = std::min(cfg_.tension_cap, a.tension + amount);
    }

    [[nodiscard]] static std::size_t recalled_incidents(const AgentState& a) noexcept {
        return static_cast<std::size_t>(std::count_if(a.memory.begin(), a.memory.end(),
            [](const MemoryEntry& m) { return m.incident; }));
    }

    void remember(AgentState& a, const MemoryEntry& entry) {
        a.memory.push_back(entry);
        while (a.memory.size() > cfg_.memory_capacity) {
            a.memory.pop_front();
        }
    }

    const SimulationConfig& cfg_;
    AgreementTerms          terms_;
    std::vector<AgentState> agents_;
    RandomStream            rng_;
    WeatherState            weather_;
    double                  theatre_tension_ = 0.0;
};

}  // namespace

// ─── AgentSimulator ───────────────────────────────────────────────────────────

AgentSimulator::AgentSimulator(SimulationConfig config, analysis::TrendConfig trend)
    : config_(std::move(config))
    , analyzer_(trend) {
    config_.validate();
}

std::vector<AgentState>
AgentSimulator::build_agents(std::span<const PartyProfile> parties) const {
    const auto roster = config_.roster.empty() ? default_roster(parties) : config_.roster;

    std::vector<AgentState> agents;
    for (const auto& spec : roster) {
        const bool known = std::any_of(parties.begin(), parties.end(),
            [&spec](const PartyProfile& p) { return p.party_id == spec.party_id; });
        if (!known) {
            throw ValidationError(ValidationKind::MalformedProfile, spec.party_id,
                                  "roster entry names a party that is not at the table");
        }
        for (std::size_t c = 0; c < spec.count; ++c) {
            const std::size_t id = agents.size();
            agents.push_back(AgentState{
                .id               = id,
                .party_id         = spec.party_id,
                .role             = spec.role,
                .zone             = id % config_.zone_count,
                .base_aggression  = spec.base_aggression,
                .aggression_level = std::clamp(spec.base_aggression,
                                               constants::MIN_AGGRESSION,
                                               constants::MAX_AGGRESSION),
                .compliance_bias  = spec.compliance_bias,
                .tension          = 0.0,
                .memory           = {},
            });
        }
    }
    return agents;
}

SimulationRun AgentSimulator::run(const Proposal& proposal,
                                  const IssueSpace& space,
                                  std::span<const PartyProfile> parties,
                                  std::size_t duration,
                                  std::uint64_t seed,
                                  const RunOptions& options) const {
    space.validate(proposal);
    if (parties.empty()) {
        throw ValidationError(ValidationKind::MalformedProfile, "<parties>",
                              "no parties to simulate");
    }
    std::set<std::string> ids;
    for (const auto& party : parties) {
        party.validate(space);
        if (!ids.insert(party.party_id).second) {
            throw ValidationError(ValidationKind::MalformedProfile, party.party_id,
                                  "duplicate party id");
        }
    }

    SimulationRun run;
    if (duration > run.weather_trace.max_size()) {
        throw ValidationError(ValidationKind::OutOfRange, "duration",
                              fmt::format("{} steps exceed the step trace capacity {}",
                                          duration, run.weather_trace.max_size()));
    }
    run.proposal = proposal;
    run.duration = duration;
    run.seed     = seed;
    for (const auto& party : parties) {
        run.activity[party.party_id] = PartyActivity{};
    }

    Theatre theatre(config_, AgreementTerms::from_proposal(proposal, config_.terms),
                    build_agents(parties), seed);

    for (std::size_t step = 0; step < duration; ++step) {
        if (options.cancel.requested()) break;

        const std::size_t before = run.incident_log.size();
        theatre.step(step, run);
        run.steps_completed = step + 1;

        if (config_.verbose) {
            fmt::print(stderr, "[medsim] step {:>5}  weather {:<8}  incidents +{}\n",
                       step, to_string(theatre.weather()),
                       run.incident_log.size() - before);
        }
        if (options.on_step) {
            options.on_step(step);
        }
    }

    run.complete     = run.steps_completed == duration;
    run.final_agents = theatre.release_agents();
    run.summary      = analyzer_.summarize(run);

    if (config_.verbose) {
        fmt::print(stderr, "[medsim] seed {} {}/{} steps, {} incidents{}\n",
                   seed, run.steps_completed, duration, run.incident_log.size(),
                   run.complete ? "" : " (cancelled)");
    }
    return run;
}

}  // namespace medsim::sim
