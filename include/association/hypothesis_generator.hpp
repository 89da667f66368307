#pragma once

#include "association/gating.hpp"
#include "common/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace association {

/// @brief Lazy enumeration of joint assignment hypotheses for one cluster
///
/// Each cluster track has a candidate list: every report, or only the
/// reports inside its gate when a mask is given. The generator walks a
/// mixed-radix counter with one digit per track, least significant digit
/// first, in base (candidate count + 1). Digit 0 leaves the track
/// unassigned, digit v assigns the track's candidate v - 1. A combination is
/// emitted only when at least one track is assigned and no report is claimed
/// twice, so the counter space grows with gated pairs, not with the pool.
///
/// The sequence is finite and can be restarted with reset().
class HypothesisGenerator {
public:
    /// @brief Constructor
    /// @param cluster_tracks Track indices of the cluster (digit order)
    /// @param report_count Number of reports in the pool
    /// @param mask Optional admissibility, rows indexed by track and columns by report
    /// @throws std::overflow_error If the counter space does not fit in std::size_t
    /// @throws std::invalid_argument If the mask does not cover the tracks and reports
    HypothesisGenerator(
        std::vector<std::size_t> cluster_tracks,
        std::size_t report_count,
        std::optional<GateMask> mask = std::nullopt
    );

    /// @brief Next valid hypothesis, or nullopt once the counter is exhausted
    auto next() -> std::optional<common::Hypothesis>;

    /// @brief Restart the enumeration from the first combination
    void reset() { cursor_ = 0; }

    /// @brief Total number of counter values, product of (candidate count + 1)
    auto combination_count() const -> std::size_t { return combination_count_; }

    /// @brief Number of valid hypotheses, exact without a gate mask
    ///
    /// Sum over k = 1..min(N, R) of C(N, k) * R! / (R - k)!, capped at
    /// combination_count() - 1. With a mask this is an upper bound. Saturates
    /// at std::numeric_limits<std::size_t>::max().
    auto valid_count() const -> std::size_t;

    /// @brief Reports track i of the cluster may take
    auto candidates(std::size_t i) const -> const std::vector<std::size_t>& { return candidates_.at(i); }

    auto tracks() const -> const std::vector<std::size_t>& { return tracks_; }
    auto report_count() const -> std::size_t { return report_count_; }

private:
    /// @brief Decode a counter value; false if the combination is not a valid hypothesis
    bool decode(std::size_t combination, common::Hypothesis& hypothesis) const;

    std::vector<std::size_t> tracks_;
    std::size_t report_count_;
    std::vector<std::vector<std::size_t>> candidates_;
    std::size_t combination_count_;
    std::size_t cursor_;
};

} // namespace association
