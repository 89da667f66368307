#include "association/hypothesis_generator.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace association {

namespace {

constexpr std::size_t MAX_COUNT = std::numeric_limits<std::size_t>::max();

// Saturating arithmetic for hypothesis counts
std::size_t saturating_multiply(std::size_t a, std::size_t b) {
    if (a != 0 && b > MAX_COUNT / a) {
        return MAX_COUNT;
    }
    return a * b;
}

std::size_t saturating_add(std::size_t a, std::size_t b) {
    return (b > MAX_COUNT - a) ? MAX_COUNT : a + b;
}

} // namespace

HypothesisGenerator::HypothesisGenerator(
    std::vector<std::size_t> cluster_tracks,
    std::size_t report_count,
    std::optional<GateMask> mask
) : tracks_(std::move(cluster_tracks)),
    report_count_(report_count),
    combination_count_(1),
    cursor_(0)
{
    if (mask.has_value()) {
        if (static_cast<std::size_t>(mask->cols()) != report_count_) {
            throw std::invalid_argument("Gate mask must have one column per report");
        }
        for (std::size_t track : tracks_) {
            if (track >= static_cast<std::size_t>(mask->rows())) {
                throw std::invalid_argument("Gate mask does not cover cluster track");
            }
        }
    }

    candidates_.reserve(tracks_.size());
    for (std::size_t track : tracks_) {
        std::vector<std::size_t> reports;
        if (mask.has_value()) {
            const auto row = static_cast<Eigen::Index>(track);
            for (std::size_t report = 0; report < report_count_; ++report) {
                if ((*mask)(row, static_cast<Eigen::Index>(report))) {
                    reports.push_back(report);
                }
            }
        } else {
            reports.resize(report_count_);
            for (std::size_t report = 0; report < report_count_; ++report) {
                reports[report] = report;
            }
        }

        const std::size_t base = reports.size() + 1;
        if (base == 0 || combination_count_ > MAX_COUNT / base) {
            throw std::overflow_error("Hypothesis space does not fit in std::size_t");
        }
        combination_count_ *= base;
        candidates_.push_back(std::move(reports));
    }
}

auto HypothesisGenerator::next() -> std::optional<common::Hypothesis> {
    common::Hypothesis hypothesis;
    hypothesis.reserve(tracks_.size());

    while (cursor_ < combination_count_) {
        std::size_t combination = cursor_++;
        if (decode(combination, hypothesis)) {
            return hypothesis;
        }
    }
    return std::nullopt;
}

auto HypothesisGenerator::valid_count() const -> std::size_t {
    const std::size_t n = tracks_.size();
    const std::size_t k_max = std::min(n, report_count_);

    std::size_t total = 0;
    std::size_t binomial = 1;     // C(n, k)
    std::size_t permutations = 1; // R! / (R - k)!
    for (std::size_t k = 1; k <= k_max; ++k) {
        // Split so the intermediate product cannot wrap
        const std::size_t m = n - k + 1;
        binomial = (binomial / k) * m + (binomial % k) * m / k;
        permutations = saturating_multiply(permutations, report_count_ - k + 1);
        total = saturating_add(total, saturating_multiply(binomial, permutations));
    }
    return std::min(total, combination_count_ - 1);
}

bool HypothesisGenerator::decode(std::size_t combination, common::Hypothesis& hypothesis) const {
    hypothesis.clear();
    bool any_assigned = false;

    for (std::size_t i = 0; i < tracks_.size(); ++i) {
        const auto& reports = candidates_[i];
        const std::size_t base = reports.size() + 1;
        std::size_t digit = combination % base;
        combination /= base;

        if (digit == 0) {
            hypothesis.push_back({tracks_[i], std::nullopt});
            continue;
        }

        std::size_t report = reports[digit - 1];
        for (const auto& assigned : hypothesis) {
            if (assigned.report == report) {
                return false;
            }
        }
        any_assigned = true;
        hypothesis.push_back({tracks_[i], report});
    }

    return any_assigned;
}

} // namespace association
