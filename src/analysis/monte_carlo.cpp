/// @file src/analysis/monte_carlo.cpp
/// @brief MonteCarloExplorer: concurrent independent runs, merged by value.

#include "medsim/monte_carlo.hpp"
#include "medsim/errors.hpp"
#include "analysis/regression.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <future>
#include <thread>

namespace medsim::analysis {

std::string MonteCarloReport::to_string() const {
    std::string out;
    out += fmt::format("{}: {} runs\n", proposal_id, runs);
    if (stddev_incidents) {
        out += fmt::format("  incidents   : mean {:.2f}  sd {:.2f}\n",
                           mean_incidents, *stddev_incidents);
    } else {
        out += fmt::format("  incidents   : mean {:.2f}\n", mean_incidents);
    }
    out += fmt::format("  severity    : mean {:.3f}\n", mean_severity);
    out += fmt::format("  escalating  : {:.1f}% of runs\n", 100.0 * escalating_share);
    for (const auto& [party, rate] : mean_compliance) {
        out += fmt::format("  compliance {:<8}: {:.1f}%\n", party, 100.0 * rate);
    }
    return out;
}

MonteCarloExplorer::MonteCarloExplorer(const core::Engine& engine) noexcept
    : engine_(engine) {}

std::vector<std::uint64_t> MonteCarloExplorer::seed_sequence(std::uint64_t base, std::size_t n) {
    std::vector<std::uint64_t> seeds(n);
    for (std::size_t i = 0; i < n; ++i) {
        seeds[i] = base + i;
    }
    return seeds;
}

MonteCarloReport MonteCarloExplorer::explore(std::string_view issue_space_id,
                                             const Proposal& proposal,
                                             std::span<const PartyProfile> parties,
                                             std::size_t duration,
                                             std::span<const std::uint64_t> seeds) const {
    if (seeds.empty()) {
        throw ValidationError(ValidationKind::MalformedProposal, proposal.id,
                              "Monte Carlo exploration needs at least one seed");
    }

    // Fan out in batches of one run per hardware thread; every run owns its
    // own RNG, agents and log and only its Summary comes back.
    const std::size_t batch = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    std::vector<sim::Summary> summaries;
    summaries.reserve(seeds.size());

    for (std::size_t start = 0; start < seeds.size(); start += batch) {
        const std::size_t end = std::min(seeds.size(), start + batch);

        std::vector<std::future<sim::Summary>> futures;
        futures.reserve(end - start);
        for (std::size_t i = start; i < end; ++i) {
            const std::uint64_t seed = seeds[i];
            futures.push_back(std::async(std::launch::async,
                [this, issue_space_id, &proposal, parties, duration, seed]() {
                    return engine_.simulate_agreement(issue_space_id, proposal,
                                                      parties, duration, seed).summary;
                }));
        }
        for (auto& f : futures) {
            summaries.push_back(f.get());
        }
    }

    return reduce(proposal.id, std::move(summaries));
}

std::vector<MonteCarloReport>
MonteCarloExplorer::compare(std::string_view issue_space_id,
                            std::span<const Proposal> candidates,
                            std::span<const PartyProfile> parties,
                            std::size_t duration,
                            std::span<const std::uint64_t> seeds) const {
    std::vector<MonteCarloReport> reports;
    reports.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        reports.push_back(explore(issue_space_id, candidate, parties, duration, seeds));
    }
    std::stable_sort(reports.begin(), reports.end(),
        [](const MonteCarloReport& a, const MonteCarloReport& b) {
            return a.mean_incidents < b.mean_incidents;
        });
    return reports;
}

MonteCarloReport MonteCarloExplorer::reduce(std::string proposal_id,
                                            std::vector<sim::Summary> summaries) {
    MonteCarloReport report;
    report.proposal_id = std::move(proposal_id);
    report.runs        = summaries.size();
    if (summaries.empty()) {
        return report;
    }

    std::vector<double> incidents;
    std::vector<double> severities;
    incidents.reserve(summaries.size());
    severities.reserve(summaries.size());
    std::size_t escalating = 0;

    for (const auto& s : summaries) {
        incidents.push_back(static_cast<double>(s.total_incidents));
        severities.push_back(s.avg_severity);
        if (s.trend == sim::Trend::Escalating) ++escalating;
        for (const auto& [party, rate] : s.compliance_rate_per_party) {
            report.mean_compliance[party] += rate;
        }
    }

    const auto n = static_cast<double>(summaries.size());
    for (auto& [party, total] : report.mean_compliance) {
        total /= n;
    }
    report.mean_incidents   = mean(incidents);
    report.stddev_incidents = sample_stddev(incidents);
    report.mean_severity    = mean(severities);
    report.escalating_share = static_cast<double>(escalating) / n;
    report.summaries        = std::move(summaries);
    return report;
}

}  // namespace medsim::analysis
