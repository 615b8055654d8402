#include "collaborators.hpp"

namespace rune::device {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                    return "none";
        case ErrorKind::InsufficientSignal:      return "insufficient_signal";
        case ErrorKind::UnrecognizedCharacter:   return "unrecognized_character";
        case ErrorKind::ClassificationAmbiguous: return "classification_ambiguous";
        case ErrorKind::CaptureFailure:          return "capture_failure";
        case ErrorKind::RecognitionFailure:      return "recognition_failure";
        case ErrorKind::AssistantFailure:        return "assistant_failure";
        case ErrorKind::SynthesisFailure:        return "synthesis_failure";
        case ErrorKind::PlaybackFailure:         return "playback_failure";
    }
    return "unknown";
}

} // namespace rune::device
