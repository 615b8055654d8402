#ifndef RUNE_DEVICE_UNIT_ESTIMATOR_HPP
#define RUNE_DEVICE_UNIT_ESTIMATOR_HPP

#include <string>
#include <vector>

#include "envelope_segmenter.hpp"

namespace rune::device {

/// Timing boundaries, expressed in multiples of the estimated unit.
///
/// Standard Morse ratios are 1:3 (dot:dash) and 1:3:7 (intra-char,
/// inter-char, inter-word gap). Each boundary sits between two adjacent
/// nominal lengths; a value exactly on a boundary takes the shorter class.
struct TimingConfig {
    double dot_dash_boundary  = 2.0;
    double char_gap_boundary  = 2.0;
    double word_gap_boundary  = 5.0;
    int    max_iterations     = 8;
    double convergence_ratio  = 1e-6;   // relative change treated as stable
};

/// Result of estimating the length of one dot.
struct UnitEstimate {
    bool        valid      = false;
    double      unit       = 0.0;     // seconds, > 0 when valid
    bool        stable     = false;   // refinement converged
    int         iterations = 0;
    bool        from_gaps  = false;   // seeded from intra-character gaps
    std::string error;
};

/// Infers the Morse time unit from observed tone (and gap) durations.
///
/// Seeds with the shortest tone, then alternately partitions tones into
/// "near 1 unit" / "near 3 units" at `dot_dash_boundary` x estimate and
/// re-estimates as the mean of the short partition, until the estimate stops
/// moving or `max_iterations` is reached. When every tone is a dash the
/// shortest interior gap gives the unit away, and refinement runs on gaps.
class UnitEstimator {
public:
    explicit UnitEstimator(const TimingConfig& cfg = {});

    /// Fails (valid == false) when `segments` holds no Tone segment.
    UnitEstimate estimate(const std::vector<TimingSegment>& segments) const;

    const TimingConfig& config() const noexcept { return cfg_; }

private:
    TimingConfig cfg_;

    /// Iterative short-cluster mean starting from `seed`.
    UnitEstimate refine(const std::vector<double>& durations, double seed) const;
};

} // namespace rune::device

#endif // RUNE_DEVICE_UNIT_ESTIMATOR_HPP
