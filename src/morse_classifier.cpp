#include "morse_classifier.hpp"

namespace rune::device {

MorseClassifier::MorseClassifier(const TimingConfig& cfg)
    : cfg_(cfg) {}

MorseSymbol MorseClassifier::classify_one(const TimingSegment& segment,
                                          double unit) const {
    // A non-positive unit cannot come out of the estimator; treat every
    // interval as the shortest class rather than dividing by zero.
    const double units = unit > 0.0 ? segment.duration / unit : 0.0;

    if (segment.kind == SegmentKind::Tone) {
        return units <= cfg_.dot_dash_boundary ? MorseSymbol::Dot
                                               : MorseSymbol::Dash;
    }
    if (units <= cfg_.char_gap_boundary) return MorseSymbol::IntraCharGap;
    if (units <= cfg_.word_gap_boundary) return MorseSymbol::InterCharGap;
    return MorseSymbol::InterWordGap;
}

std::vector<MorseSymbol> MorseClassifier::classify(
    const std::vector<TimingSegment>& segments, double unit) const {
    std::vector<MorseSymbol> symbols;
    symbols.reserve(segments.size());
    for (const auto& segment : segments) {
        symbols.push_back(classify_one(segment, unit));
    }
    return symbols;
}

} // namespace rune::device
