#include "unit_estimator.hpp"

#include <algorithm>
#include <cmath>

namespace rune::device {

UnitEstimator::UnitEstimator(const TimingConfig& cfg)
    : cfg_(cfg) {}

UnitEstimate UnitEstimator::refine(const std::vector<double>& durations,
                                   double seed) const {
    UnitEstimate result;
    result.valid = true;
    result.unit  = seed;

    const int max_iterations = std::max(1, cfg_.max_iterations);
    for (int i = 0; i < max_iterations; ++i) {
        const double boundary = cfg_.dot_dash_boundary * result.unit;

        double sum   = 0.0;
        int    count = 0;
        for (double d : durations) {
            if (d <= boundary) {
                sum += d;
                ++count;
            }
        }
        result.iterations = i + 1;
        if (count == 0) break;   // cannot happen while seed is in the set

        const double next = sum / count;
        const double delta = std::fabs(next - result.unit);
        result.unit = next;
        if (delta <= cfg_.convergence_ratio * next) {
            result.stable = true;
            break;
        }
    }
    return result;
}

UnitEstimate UnitEstimator::estimate(const std::vector<TimingSegment>& segments) const {
    std::vector<double> tones;
    std::vector<double> gaps;   // silences between two tones
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& s = segments[i];
        if (s.duration <= 0.0) continue;
        if (s.kind == SegmentKind::Tone) {
            tones.push_back(s.duration);
        } else if (i > 0 && i + 1 < segments.size()) {
            gaps.push_back(s.duration);
        }
    }

    if (tones.empty()) {
        UnitEstimate result;
        result.error = "no tone segments";
        return result;
    }

    const double shortest_tone = *std::min_element(tones.begin(), tones.end());
    UnitEstimate result = refine(tones, shortest_tone);

    // All tones in one cluster, yet the gaps between them are far shorter:
    // the cluster is dashes, not dots.
    const bool single_cluster = std::all_of(
        tones.begin(), tones.end(),
        [&](double d) { return d <= cfg_.dot_dash_boundary * result.unit; });
    if (single_cluster && !gaps.empty()) {
        const double shortest_gap = *std::min_element(gaps.begin(), gaps.end());
        if (shortest_gap < 0.5 * result.unit) {
            result = refine(gaps, shortest_gap);
            result.from_gaps = true;
        }
    }

    return result;
}

} // namespace rune::device
