#include "association/resolver.hpp"

#include <stdexcept>

namespace association {

auto Resolver::resolve(
    const std::vector<common::ScoredHypothesis>& hypotheses,
    std::size_t report_count
) -> std::vector<common::ReportAssociation> {
    std::vector<common::ReportAssociation> associations;
    associations.reserve(report_count);
    for (std::size_t r = 0; r < report_count; ++r) {
        associations.push_back({r, std::nullopt, 0.0});
    }

    for (const auto& scored : hypotheses) {
        for (const auto& assignment : scored.hypothesis) {
            if (!assignment.report.has_value()) {
                continue;
            }
            auto& best = associations.at(*assignment.report);
            if (scored.probability > best.probability) {
                best.probability = scored.probability;
                best.track = assignment.track;
            }
        }
    }

    return associations;
}

} // namespace association
