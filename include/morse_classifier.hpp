#ifndef RUNE_DEVICE_MORSE_CLASSIFIER_HPP
#define RUNE_DEVICE_MORSE_CLASSIFIER_HPP

#include <vector>

#include "envelope_segmenter.hpp"
#include "morse_codec.hpp"
#include "unit_estimator.hpp"

namespace rune::device {

/// Maps timing segments to Morse symbols against a known unit.
///
/// Total: every segment yields a symbol. Tones become Dot or Dash, silences
/// become one of the three gap classes. Values exactly on a boundary resolve
/// to the shorter class, which favours fast senders over slow ones.
class MorseClassifier {
public:
    explicit MorseClassifier(const TimingConfig& cfg = {});

    std::vector<MorseSymbol> classify(const std::vector<TimingSegment>& segments,
                                      double unit) const;

    MorseSymbol classify_one(const TimingSegment& segment, double unit) const;

private:
    TimingConfig cfg_;
};

} // namespace rune::device

#endif // RUNE_DEVICE_MORSE_CLASSIFIER_HPP
