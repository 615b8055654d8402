#include "envelope_segmenter.hpp"

#include <algorithm>
#include <cmath>

namespace rune::device {

EnvelopeSegmenter::EnvelopeSegmenter(const SegmenterConfig& cfg)
    : cfg_(cfg) {}

std::size_t EnvelopeSegmenter::window_samples(double sample_rate) const {
    double n = std::round(cfg_.smoothing_ms * 1e-3 * sample_rate);
    return n < 1.0 ? 1 : static_cast<std::size_t>(n);
}

std::vector<float> EnvelopeSegmenter::envelope(const AudioBuffer& buffer) const {
    const std::size_t n = buffer.size();
    if (n == 0) return {};

    // Prefix sums of |x| so every window average is O(1).
    std::vector<double> prefix(n + 1, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        prefix[i + 1] = prefix[i] + std::fabs(static_cast<double>(buffer.samples[i]));
    }

    const std::size_t window = window_samples(buffer.sample_rate);
    const std::size_t half   = window / 2;

    std::vector<float> env(n);
    for (std::size_t i = 0; i < n; ++i) {
        std::size_t lo = (i >= half) ? i - half : 0;
        std::size_t hi = std::min(n, lo + window);
        env[i] = static_cast<float>((prefix[hi] - prefix[lo]) /
                                    static_cast<double>(hi - lo));
    }
    return env;
}

std::vector<TimingSegment> EnvelopeSegmenter::segment(const AudioBuffer& buffer) const {
    if (buffer.empty() || buffer.sample_rate <= 0.0) {
        return {{SegmentKind::Silence, buffer.duration()}};
    }

    const std::vector<float> env = envelope(buffer);
    const double threshold = cfg_.amplitude_threshold;

    // Run-length encode active/quiet samples.
    std::vector<TimingSegment> segments;
    bool        active = env[0] > threshold;
    std::size_t count  = 1;

    auto push = [&](bool on, std::size_t samples) {
        segments.push_back({on ? SegmentKind::Tone : SegmentKind::Silence,
                            static_cast<double>(samples) / buffer.sample_rate});
    };

    for (std::size_t i = 1; i < env.size(); ++i) {
        bool now = env[i] > threshold;
        if (now == active) {
            ++count;
        } else {
            push(active, count);
            active = now;
            count = 1;
        }
    }
    push(active, count);

    return segments;
}

std::size_t count_tones(const std::vector<TimingSegment>& segments) {
    return static_cast<std::size_t>(
        std::count_if(segments.begin(), segments.end(),
                      [](const TimingSegment& s) { return s.kind == SegmentKind::Tone; }));
}

} // namespace rune::device
