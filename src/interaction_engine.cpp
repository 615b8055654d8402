#include "interaction_engine.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace rune::device {

const char* interaction_state_name(InteractionState state) {
    switch (state) {
        case InteractionState::Idle:        return "idle";
        case InteractionState::Capturing:   return "capturing";
        case InteractionState::Classifying: return "classifying";
        case InteractionState::Recognizing: return "recognizing";
        case InteractionState::Responding:  return "responding";
    }
    return "unknown";
}

InteractionEngine::InteractionEngine(const Collaborators& collaborators,
                                     EventSlot& events,
                                     const EngineConfig& cfg)
    : microphone_(collaborators.microphone),
      speaker_(collaborators.speaker),
      recognizer_(collaborators.recognizer),
      assistant_(collaborators.assistant),
      synthesizer_(collaborators.synthesizer),
      events_(events),
      cfg_(cfg),
      pipeline_(cfg.segmenter, cfg.timing, cfg.codec),
      detector_(cfg.detector) {
    if (cfg_.capture_chunk_frames == 0) cfg_.capture_chunk_frames = 1;
}

// ---------------------------------------------------------------------------
// Loop
// ---------------------------------------------------------------------------

bool InteractionEngine::step(std::chrono::milliseconds wait) {
    switch (state_.load()) {
        case InteractionState::Idle: {
            auto event = events_.wait_for(wait);
            if (!event) return false;
            if (event->kind == ButtonEvent::Kind::Pressed) {
                begin_capture(event->timestamp);
            }
            return true;
        }

        case InteractionState::Capturing: {
            auto event = events_.take();
            if (event && event->kind == ButtonEvent::Kind::Released) {
                finish_capture();
                return true;
            }
            // A press while capturing is a repeated edge: ignore it.
            capture_chunk();
            return true;
        }

        case InteractionState::Responding: {
            auto event = events_.wait_for(std::min(wait, cfg_.poll_interval));
            if (event && event->kind == ButtonEvent::Kind::Pressed) {
                barge_in(event->timestamp);
                return true;
            }
            if (!speaker_.is_playing()) {
                finish_response();
                return true;
            }
            return event.has_value();
        }

        case InteractionState::Classifying:
        case InteractionState::Recognizing:
            // Only held inside finish_capture(); never seen between steps.
            break;
    }
    return false;
}

void InteractionEngine::run() {
    running_.store(true);
    std::fprintf(stderr, "[engine] ready\n");
    while (running_.load() && !events_.closed()) {
        step(cfg_.poll_interval);
    }
    shutdown();
    std::fprintf(stderr, "[engine] stopped\n");
}

void InteractionEngine::stop() {
    running_.store(false);
    events_.close();
}

void InteractionEngine::shutdown() {
    release_audio();
    session_.reset();
    transition(InteractionState::Idle);
}

// ---------------------------------------------------------------------------
// Capture
// ---------------------------------------------------------------------------

void InteractionEngine::begin_capture(Clock::time_point pressed_at) {
    // The speaker must be silent before the first sample is taken.
    speaker_.stop();
    owner_ = AudioOwner::None;

    Session session;
    session.id = ++next_id_;
    session.started_at = pressed_at;
    session.audio.sample_rate = cfg_.sample_rate;
    session_ = std::move(session);

    report_ = SessionReport{};
    report_.session_id = session_->id;

    transition(InteractionState::Capturing);

    if (!microphone_.start(cfg_.sample_rate)) {
        fail(ErrorKind::CaptureFailure, "microphone did not start");
        return;
    }
    owner_ = AudioOwner::Microphone;
}

void InteractionEngine::capture_chunk() {
    std::size_t got = microphone_.read(session_->audio.samples,
                                       cfg_.capture_chunk_frames);
    if (got == 0) {
        fail(ErrorKind::CaptureFailure, "microphone read failed");
        return;
    }
    if (session_->audio.duration() >= cfg_.max_capture_sec) {
        std::fprintf(stderr, "[engine] session %llu: capture limit of %.1f s reached\n",
                     static_cast<unsigned long long>(session_->id), cfg_.max_capture_sec);
        finish_capture();
    }
}

void InteractionEngine::finish_capture() {
    microphone_.stop();
    owner_ = AudioOwner::None;

    // Classify: keyed Morse or speech?
    transition(InteractionState::Classifying);
    const AudioBuffer& audio = session_->audio;

    auto segments = pipeline_.segmenter().segment(audio);
    auto unit = pipeline_.estimator().estimate(segments);
    double likelihood = recognizer_.speech_likelihood(audio);
    InputVerdict verdict = detector_.classify(segments, unit, likelihood);

    session_->input = verdict.kind;
    report_.input = verdict.kind;
    if (verdict.ambiguous) {
        std::fprintf(stderr, "[engine] session %llu: ambiguous input (%s), using speech path\n",
                     static_cast<unsigned long long>(session_->id), verdict.reason.c_str());
    }

    transition(InteractionState::Recognizing);
    if (!recognize(segments, unit)) return;

    respond();
}

bool InteractionEngine::recognize(const std::vector<TimingSegment>& segments,
                                  const UnitEstimate& unit) {
    if (session_->input == InputKind::Morse) {
        DecodeResult decoded = pipeline_.decode_segments(segments);
        if (!decoded.success) {
            fail(ErrorKind::InsufficientSignal, decoded.error);
            return false;
        }
        report_.unrecognized = decoded.unrecognized;
        if (decoded.unrecognized > 0) {
            std::fprintf(stderr, "[engine] session %llu: %zu unrecognized character(s) in \"%s\"\n",
                         static_cast<unsigned long long>(session_->id),
                         decoded.unrecognized, decoded.morse_text.c_str());
        }
        std::printf("[engine] session %llu: morse %s (unit %.0f ms) -> \"%s\"\n",
                    static_cast<unsigned long long>(session_->id),
                    decoded.morse_text.c_str(), unit.unit * 1e3, decoded.text.c_str());
        session_->recognized_text = decoded.text;
    } else {
        TextResult heard = recognizer_.transcribe(session_->audio);
        if (!heard.success) {
            fail(ErrorKind::RecognitionFailure, heard.error);
            return false;
        }
        if (heard.text.empty()) {
            fail(ErrorKind::RecognitionFailure, "nothing recognized");
            return false;
        }
        std::printf("[engine] session %llu: heard \"%s\"\n",
                    static_cast<unsigned long long>(session_->id), heard.text.c_str());
        session_->recognized_text = std::move(heard.text);
    }
    report_.recognized_text = session_->recognized_text;
    return true;
}

// ---------------------------------------------------------------------------
// Response
// ---------------------------------------------------------------------------

void InteractionEngine::respond() {
    transition(InteractionState::Responding);

    // A press that arrived while the models were busy supersedes this
    // response; stop before spending more model time on it.
    if (superseded_by_press()) return;

    TextResult reply = assistant_.respond(session_->recognized_text);
    if (!reply.success) {
        fail(ErrorKind::AssistantFailure, reply.error);
        return;
    }
    session_->response_text = reply.text;
    report_.response_text = reply.text;
    if (superseded_by_press()) return;

    AudioResult voice = synthesizer_.synthesize(reply.text);
    if (!voice.success) {
        fail(ErrorKind::SynthesisFailure, voice.error);
        return;
    }

    if (superseded_by_press()) return;

    if (!speaker_.play(voice.audio)) {
        fail(ErrorKind::PlaybackFailure, "speaker refused the response");
        return;
    }
    owner_ = AudioOwner::Speaker;
    std::printf("[engine] session %llu: answering \"%s\"\n",
                static_cast<unsigned long long>(session_->id), reply.text.c_str());
}

void InteractionEngine::barge_in(Clock::time_point pressed_at) {
    std::fprintf(stderr, "[engine] session %llu: interrupted by a new press\n",
                 static_cast<unsigned long long>(session_->id));
    speaker_.stop();
    owner_ = AudioOwner::None;
    report_.superseded = true;
    close_session();
    begin_capture(pressed_at);
}

bool InteractionEngine::superseded_by_press() {
    auto event = events_.take();
    if (!event || event->kind != ButtonEvent::Kind::Pressed) return false;
    barge_in(event->timestamp);
    return true;
}

void InteractionEngine::finish_response() {
    owner_ = AudioOwner::None;
    report_.completed = true;
    close_session();
    transition(InteractionState::Idle);
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

void InteractionEngine::fail(ErrorKind kind, const std::string& message) {
    const unsigned long long id = session_ ? session_->id : 0;
    std::fprintf(stderr, "[engine] session %llu failed (%s): %s\n",
                 id, error_kind_name(kind), message.c_str());

    release_audio();
    if (session_) {
        report_.error = kind;
        report_.message = message;
        close_session();
    }
    transition(InteractionState::Idle);
}

void InteractionEngine::release_audio() {
    switch (owner_) {
        case AudioOwner::Microphone: microphone_.stop(); break;
        case AudioOwner::Speaker:    speaker_.stop();    break;
        case AudioOwner::None:                           break;
    }
    owner_ = AudioOwner::None;
}

void InteractionEngine::close_session() {
    SessionReport report = std::move(report_);
    report_ = SessionReport{};
    session_.reset();
    if (report_listener_) report_listener_(report);
}

void InteractionEngine::transition(InteractionState to) {
    InteractionState from = state_.exchange(to);
    if (session_) session_->state = to;
    if (from != to && state_listener_) state_listener_(from, to);
}

} // namespace rune::device
