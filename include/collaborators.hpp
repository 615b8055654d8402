#ifndef RUNE_DEVICE_COLLABORATORS_HPP
#define RUNE_DEVICE_COLLABORATORS_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "audio_buffer.hpp"

namespace rune::device {

using Clock = std::chrono::steady_clock;

/// Failure classes reported by the interaction engine.
enum class ErrorKind {
    None,
    InsufficientSignal,
    UnrecognizedCharacter,
    ClassificationAmbiguous,
    CaptureFailure,
    RecognitionFailure,
    AssistantFailure,
    SynthesisFailure,
    PlaybackFailure
};

const char* error_kind_name(ErrorKind kind);

/// Push-to-talk edge.
struct ButtonEvent {
    enum class Kind { Pressed, Released };

    Kind              kind = Kind::Pressed;
    Clock::time_point timestamp{};
};

/// Text produced by a collaborator, or the reason it could not be.
struct TextResult {
    bool        success = false;
    std::string text;
    std::string error;
};

/// Audio produced by a collaborator, or the reason it could not be.
struct AudioResult {
    bool        success = false;
    AudioBuffer audio;
    std::string error;
};

// ---------------------------------------------------------------------------
// Device side
// ---------------------------------------------------------------------------

/// Level read of the push-to-talk button.
class ButtonInput {
public:
    virtual ~ButtonInput() = default;
    virtual bool is_pressed() = 0;
};

/// Microphone.
class AudioSource {
public:
    virtual ~AudioSource() = default;

    /// Begin capturing at `sample_rate`.
    virtual bool start(double sample_rate) = 0;

    /// Append up to `max_frames` captured samples to `out`, blocking until
    /// they are available. Returns the number appended; 0 on a device error.
    virtual std::size_t read(std::vector<float>& out, std::size_t max_frames) = 0;

    virtual void stop() = 0;
};

/// Speaker.
class PlaybackSink {
public:
    virtual ~PlaybackSink() = default;

    /// Start playing `audio` and return without waiting for it to finish.
    virtual bool play(const AudioBuffer& audio) = 0;

    /// Stop playback and discard whatever has not been played. Safe to call
    /// at any time, including when nothing is playing.
    virtual void stop() = 0;

    virtual bool is_playing() const = 0;
};

// ---------------------------------------------------------------------------
// Model side
// ---------------------------------------------------------------------------

class SpeechRecognizer {
public:
    virtual ~SpeechRecognizer() = default;

    virtual TextResult transcribe(const AudioBuffer& audio) = 0;

    /// Confidence in [0, 1] that `audio` holds speech. Recognizers without a
    /// voice-activity model report 0 (no opinion).
    virtual double speech_likelihood(const AudioBuffer& /*audio*/) { return 0.0; }
};

class Assistant {
public:
    virtual ~Assistant() = default;
    virtual TextResult respond(const std::string& text) = 0;
};

class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;
    virtual AudioResult synthesize(const std::string& text) = 0;
};

} // namespace rune::device

#endif // RUNE_DEVICE_COLLABORATORS_HPP
