#ifndef RUNE_DEVICE_OFFLINE_MODELS_HPP
#define RUNE_DEVICE_OFFLINE_MODELS_HPP

#include <ctime>
#include <functional>
#include <string>

#include "collaborators.hpp"
#include "morse_codec.hpp"
#include "tone_renderer.hpp"

namespace rune::device {

/// Rule-based responder used when no language model is installed.
///
/// Answers greetings, the time of day and questions about Morse; anything
/// else gets a short description of the device.
class KeywordAssistant : public Assistant {
public:
    using TimeSource = std::function<std::time_t()>;

    explicit KeywordAssistant(TimeSource now = [] { return std::time(nullptr); });

    TextResult respond(const std::string& text) override;

private:
    TimeSource now_;
};

/// Speaks text back as keyed Morse tone.
class MorseSynthesizer : public SpeechSynthesizer {
public:
    MorseSynthesizer(const MorseVoiceConfig& voice = {}, const CodecConfig& codec = {});

    AudioResult synthesize(const std::string& text) override;

private:
    ToneRenderer renderer_;
    MorseCodec   codec_;
};

/// Stand-in when no speech model is configured: every transcription fails.
class UnavailableRecognizer : public SpeechRecognizer {
public:
    explicit UnavailableRecognizer(std::string reason = "no speech model configured");

    TextResult transcribe(const AudioBuffer& audio) override;

private:
    std::string reason_;
};

} // namespace rune::device

#endif // RUNE_DEVICE_OFFLINE_MODELS_HPP
