#ifndef RUNE_DEVICE_DECODE_PIPELINE_HPP
#define RUNE_DEVICE_DECODE_PIPELINE_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "audio_buffer.hpp"
#include "envelope_segmenter.hpp"
#include "morse_classifier.hpp"
#include "morse_codec.hpp"
#include "unit_estimator.hpp"

namespace rune::device {

/// Stages of the decode pipeline.
enum class DecodeStage {
    None,
    Segment,
    EstimateUnit,
    Classify,
    Tokenize,
    Translate,
    Complete
};

const char* decode_stage_name(DecodeStage stage);

/// Result from the full decode pipeline, with staged error reporting.
struct DecodeResult {
    DecodeStage stage_reached = DecodeStage::None;
    bool        success       = false;

    // Intermediate values (populated as stages complete).
    std::vector<TimingSegment> segments;
    UnitEstimate               unit;
    std::vector<MorseSymbol>   symbols;
    std::vector<MorseToken>    tokens;
    std::string                morse_text;   // ".-- .." style, for display
    std::string                text;
    std::size_t                unrecognized = 0;

    std::string error;
};

/// Full receive/decode pipeline: PCM -> text.
///
/// Stages:
///   1. Envelope segmentation -> tone/silence runs
///   2. Unit estimation       -> dot length
///   3. Classification        -> Morse symbols
///   4. Tokenization          -> one token per character
///   5. Translation           -> text (unknown patterns become the sentinel)
///
/// Unknown characters do not fail the decode; only a buffer without any tone
/// does.
class DecodePipeline {
public:
    DecodePipeline(const SegmenterConfig& seg_cfg = {},
                   const TimingConfig& timing_cfg = {},
                   const CodecConfig& codec_cfg = {});

    /// Run the full pipeline on a PCM buffer.
    DecodeResult decode(const AudioBuffer& buffer) const;

    /// Run stages 2-5 on segments that were already produced.
    DecodeResult decode_segments(std::vector<TimingSegment> segments) const;

    const EnvelopeSegmenter& segmenter() const noexcept { return segmenter_; }
    const UnitEstimator&     estimator() const noexcept { return estimator_; }
    const MorseCodec&        codec() const noexcept { return codec_; }

private:
    EnvelopeSegmenter segmenter_;
    UnitEstimator     estimator_;
    MorseClassifier   classifier_;
    MorseCodec        codec_;
};

} // namespace rune::device

#endif // RUNE_DEVICE_DECODE_PIPELINE_HPP
