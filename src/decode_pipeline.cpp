#include "decode_pipeline.hpp"

#include <utility>

namespace rune::device {

const char* decode_stage_name(DecodeStage stage) {
    switch (stage) {
        case DecodeStage::None:         return "none";
        case DecodeStage::Segment:      return "segment";
        case DecodeStage::EstimateUnit: return "estimate_unit";
        case DecodeStage::Classify:     return "classify";
        case DecodeStage::Tokenize:     return "tokenize";
        case DecodeStage::Translate:    return "translate";
        case DecodeStage::Complete:     return "complete";
    }
    return "unknown";
}

DecodePipeline::DecodePipeline(const SegmenterConfig& seg_cfg,
                               const TimingConfig& timing_cfg,
                               const CodecConfig& codec_cfg)
    : segmenter_(seg_cfg),
      estimator_(timing_cfg),
      classifier_(timing_cfg),
      codec_(codec_cfg) {}

DecodeResult DecodePipeline::decode(const AudioBuffer& buffer) const {
    // Stage 1: envelope segmentation.
    auto segments = segmenter_.segment(buffer);
    DecodeResult result = decode_segments(std::move(segments));
    if (result.stage_reached == DecodeStage::None) {
        result.stage_reached = DecodeStage::Segment;
    }
    return result;
}

DecodeResult DecodePipeline::decode_segments(std::vector<TimingSegment> segments) const {
    DecodeResult result;
    result.segments = std::move(segments);

    if (result.segments.empty()) {
        result.error = "Segment: no intervals to analyze";
        return result;
    }

    // Stage 2: unit estimation.
    result.stage_reached = DecodeStage::EstimateUnit;
    result.unit = estimator_.estimate(result.segments);
    if (!result.unit.valid) {
        result.error = "Unit estimate: " + result.unit.error;
        return result;
    }

    // Stage 3: classify every interval.
    result.stage_reached = DecodeStage::Classify;
    result.symbols = classifier_.classify(result.segments, result.unit.unit);

    // Stage 4: group into characters.
    result.stage_reached = DecodeStage::Tokenize;
    result.tokens = MorseCodec::symbols_to_tokens(result.symbols);
    if (result.tokens.empty()) {
        result.error = "Tokenize: no characters recovered";
        return result;
    }
    for (std::size_t i = 0; i < result.tokens.size(); ++i) {
        if (i > 0) {
            result.morse_text += result.tokens[i - 1].ends_word ? "   " : " ";
        }
        result.morse_text += result.tokens[i].pattern;
    }

    // Stage 5: table lookup.
    result.stage_reached = DecodeStage::Translate;
    result.text         = codec_.tokens_to_text(result.tokens);
    result.unrecognized = codec_.count_unrecognized(result.tokens);

    result.stage_reached = DecodeStage::Complete;
    result.success = true;
    return result;
}

} // namespace rune::device
