#ifndef RUNE_DEVICE_ENVELOPE_SEGMENTER_HPP
#define RUNE_DEVICE_ENVELOPE_SEGMENTER_HPP

#include <cstddef>
#include <vector>

#include "audio_buffer.hpp"

namespace rune::device {

enum class SegmentKind {
    Tone,
    Silence
};

/// A run of tone or silence. Consecutive segments always differ in kind.
struct TimingSegment {
    SegmentKind kind     = SegmentKind::Silence;
    double      duration = 0.0;   // seconds
};

/// Configuration for envelope segmentation.
struct SegmenterConfig {
    double amplitude_threshold = 0.1;   // on the smoothed envelope, full scale 1.0
    double smoothing_ms        = 5.0;   // moving-average window
};

/// Splits a PCM buffer into alternating tone/silence intervals.
///
/// The envelope is the centred moving average of |x| over `smoothing_ms`.
/// Samples whose envelope exceeds the threshold are "active"; runs of equal
/// activity become segments. The threshold is fixed, not adaptive: input that
/// never crosses it is reported as silence.
class EnvelopeSegmenter {
public:
    explicit EnvelopeSegmenter(const SegmenterConfig& cfg = {});

    /// Segment a buffer. An empty or all-quiet buffer yields exactly one
    /// Silence segment spanning the buffer.
    std::vector<TimingSegment> segment(const AudioBuffer& buffer) const;

    /// Rectified, smoothed amplitude envelope (same length as the buffer).
    std::vector<float> envelope(const AudioBuffer& buffer) const;

    const SegmenterConfig& config() const noexcept { return cfg_; }

private:
    SegmenterConfig cfg_;

    std::size_t window_samples(double sample_rate) const;
};

/// Number of Tone segments in `segments`.
std::size_t count_tones(const std::vector<TimingSegment>& segments);

} // namespace rune::device

#endif // RUNE_DEVICE_ENVELOPE_SEGMENTER_HPP
