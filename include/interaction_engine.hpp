#ifndef RUNE_DEVICE_INTERACTION_ENGINE_HPP
#define RUNE_DEVICE_INTERACTION_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "collaborators.hpp"
#include "decode_pipeline.hpp"
#include "event_slot.hpp"
#include "input_detector.hpp"

namespace rune::device {

/// Push-to-talk session states. Idle is both initial and resting state.
enum class InteractionState {
    Idle,
    Capturing,
    Classifying,
    Recognizing,
    Responding
};

const char* interaction_state_name(InteractionState state);

/// Configuration for the interaction engine.
struct EngineConfig {
    double                    sample_rate          = 16000.0;
    double                    max_capture_sec      = 30.0;
    std::size_t               capture_chunk_frames = 320;   // 20 ms at 16 kHz
    std::chrono::milliseconds poll_interval{10};

    SegmenterConfig segmenter;
    TimingConfig    timing;
    DetectorConfig  detector;
    CodecConfig     codec;
};

/// The unit of work: one press-speak-release-answer round trip.
struct Session {
    std::uint64_t     id = 0;
    InteractionState  state = InteractionState::Idle;
    Clock::time_point started_at{};
    AudioBuffer       audio;
    InputKind         input = InputKind::Speech;
    std::string       recognized_text;
    std::string       response_text;
};

/// What became of a session. Emitted exactly once per session.
struct SessionReport {
    std::uint64_t session_id   = 0;
    InputKind     input        = InputKind::Speech;
    ErrorKind     error        = ErrorKind::None;
    std::string   message;
    std::string   recognized_text;
    std::string   response_text;
    std::size_t   unrecognized = 0;       // Morse characters with no match
    bool          completed    = false;   // response played to the end
    bool          superseded   = false;   // discarded by barge-in
};

/// External collaborators the engine drives. All must outlive the engine.
struct Collaborators {
    AudioSource&       microphone;
    PlaybackSink&      speaker;
    SpeechRecognizer&  recognizer;
    Assistant&         assistant;
    SpeechSynthesizer& synthesizer;
};

/// Top-level orchestrator: button edges in, spoken answers out.
///
///   Idle --press--> Capturing --release--> Classifying --> Recognizing
///        --> Responding --playback done--> Idle
///
/// A press while Responding stops playback and opens a new session
/// (barge-in). A press while Capturing is ignored. Any collaborator failure
/// reports the session and returns to Idle. Microphone and speaker are never
/// active together: capture always stops playback first.
///
/// All transitions happen on the thread that calls step()/run().
class InteractionEngine {
public:
    using StateListener  = std::function<void(InteractionState from, InteractionState to)>;
    using ReportListener = std::function<void(const SessionReport&)>;

    InteractionEngine(const Collaborators& collaborators, EventSlot& events,
                      const EngineConfig& cfg = {});

    InteractionEngine(const InteractionEngine&) = delete;
    InteractionEngine& operator=(const InteractionEngine&) = delete;

    /// Run one iteration of the state machine, waiting at most `wait` for a
    /// button edge when there is nothing else to do. Returns true if
    /// anything happened.
    bool step(std::chrono::milliseconds wait);

    /// Loop step() until stop() is called.
    void run();

    /// Ask run() to return; safe from any thread.
    void stop();

    /// Stop any audio and drop the active session without reporting it.
    void shutdown();

    InteractionState state() const noexcept { return state_.load(); }

    /// Active session, or nullptr when Idle. Engine thread only.
    const Session* session() const noexcept {
        return session_ ? &*session_ : nullptr;
    }

    void on_state_change(StateListener listener) { state_listener_ = std::move(listener); }
    void on_report(ReportListener listener) { report_listener_ = std::move(listener); }

    const DecodePipeline& pipeline() const noexcept { return pipeline_; }

private:
    enum class AudioOwner { None, Microphone, Speaker };

    AudioSource&       microphone_;
    PlaybackSink&      speaker_;
    SpeechRecognizer&  recognizer_;
    Assistant&         assistant_;
    SpeechSynthesizer& synthesizer_;
    EventSlot&         events_;

    EngineConfig   cfg_;
    DecodePipeline pipeline_;
    InputDetector  detector_;

    std::atomic<InteractionState> state_{InteractionState::Idle};
    std::atomic<bool>             running_{false};
    std::optional<Session>        session_;
    SessionReport                 report_;
    AudioOwner                    owner_   = AudioOwner::None;
    std::uint64_t                 next_id_ = 0;

    StateListener  state_listener_;
    ReportListener report_listener_;

    void transition(InteractionState to);

    void begin_capture(Clock::time_point pressed_at);
    void capture_chunk();
    void finish_capture();
    bool recognize(const std::vector<TimingSegment>& segments, const UnitEstimate& unit);
    void respond();
    void barge_in(Clock::time_point pressed_at);

    /// Take a pending edge; a press starts a new session and returns true.
    bool superseded_by_press();
    void finish_response();

    /// Report the active session as failed and return to Idle.
    void fail(ErrorKind kind, const std::string& message);

    void release_audio();
    void close_session();
};

} // namespace rune::device

#endif // RUNE_DEVICE_INTERACTION_ENGINE_HPP
