#ifndef RUNE_DEVICE_INPUT_DETECTOR_HPP
#define RUNE_DEVICE_INPUT_DETECTOR_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "envelope_segmenter.hpp"
#include "unit_estimator.hpp"

namespace rune::device {

enum class InputKind {
    Speech,
    Morse
};

const char* input_kind_name(InputKind kind);

/// Thresholds for deciding whether a capture is keyed Morse.
struct DetectorConfig {
    std::size_t min_tone_segments     = 2;
    double      element_tolerance     = 0.4;   // +/- fraction of 1 or 3 units
    double      min_well_formed_ratio = 0.8;
    double      speech_confidence     = 0.5;   // likelihood that counts as speech
};

/// Outcome of input classification.
struct InputVerdict {
    InputKind   kind        = InputKind::Speech;
    bool        ambiguous   = false;   // resolved to Speech by policy
    std::size_t tones       = 0;
    std::size_t well_formed = 0;
    std::string reason;
};

/// Decides between the Morse and speech recognition paths.
///
/// Morse is chosen only when the segmenter and the unit estimator agree on a
/// keyed signal (enough tones, a stable unit, and nearly every tone close to
/// 1 or 3 units) and the recognizer is not confident it heard speech.
/// Everything else, including the ambiguous cases, goes to speech.
class InputDetector {
public:
    explicit InputDetector(const DetectorConfig& cfg = {});

    InputVerdict classify(const std::vector<TimingSegment>& segments,
                          const UnitEstimate& unit,
                          double speech_likelihood) const;

    /// True when `duration` is within tolerance of one or three units.
    bool well_formed(double duration, double unit) const;

private:
    DetectorConfig cfg_;
};

} // namespace rune::device

#endif // RUNE_DEVICE_INPUT_DETECTOR_HPP
