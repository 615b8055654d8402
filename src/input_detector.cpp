#include "input_detector.hpp"

#include <cmath>

namespace rune::device {

const char* input_kind_name(InputKind kind) {
    switch (kind) {
        case InputKind::Speech: return "speech";
        case InputKind::Morse:  return "morse";
    }
    return "unknown";
}

InputDetector::InputDetector(const DetectorConfig& cfg)
    : cfg_(cfg) {}

bool InputDetector::well_formed(double duration, double unit) const {
    if (unit <= 0.0) return false;
    const double units = duration / unit;
    return std::fabs(units - 1.0) <= cfg_.element_tolerance ||
           std::fabs(units - 3.0) <= 3.0 * cfg_.element_tolerance;
}

InputVerdict InputDetector::classify(const std::vector<TimingSegment>& segments,
                                     const UnitEstimate& unit,
                                     double speech_likelihood) const {
    InputVerdict verdict;

    for (const auto& s : segments) {
        if (s.kind != SegmentKind::Tone) continue;
        ++verdict.tones;
        if (unit.valid && well_formed(s.duration, unit.unit)) {
            ++verdict.well_formed;
        }
    }

    bool morse_confident = false;
    if (!unit.valid) {
        verdict.reason = "no tone segments";
    } else if (!unit.stable) {
        verdict.reason = "unit estimate did not settle";
    } else if (verdict.tones < cfg_.min_tone_segments) {
        verdict.reason = "too few tones";
    } else if (static_cast<double>(verdict.well_formed) <
               cfg_.min_well_formed_ratio * static_cast<double>(verdict.tones)) {
        verdict.reason = "tone lengths are irregular";
    } else {
        morse_confident = true;
    }

    const bool speech_confident = speech_likelihood >= cfg_.speech_confidence;

    if (morse_confident && !speech_confident) {
        verdict.kind = InputKind::Morse;
        verdict.reason = "keyed signal";
    } else if (!morse_confident && speech_confident) {
        verdict.kind = InputKind::Speech;
        verdict.reason = "speech detected";
    } else {
        verdict.kind = InputKind::Speech;
        verdict.ambiguous = true;
        if (morse_confident) verdict.reason = "keyed signal, but speech likely";
    }
    return verdict;
}

} // namespace rune::device
