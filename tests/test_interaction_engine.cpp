/**
 * @file test_interaction_engine.cpp
 * @brief Scenario tests for the push-to-talk InteractionEngine
 *
 * The engine is driven with step(0ms) so every transition happens on the
 * test thread; button edges are posted straight into the EventSlot.
 */

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "gtest/gtest.h"
#include "interaction_engine.hpp"
#include "support/fakes.hpp"
#include "tone_renderer.hpp"

using namespace rune::device;
using namespace rune::device::test_support;
using namespace std::chrono_literals;

namespace {

class InteractionEngineTest : public ::testing::Test {
 protected:
  InteractionEngineTest()
      : mic_(log_), speaker_(log_) {}

  void SetUp() override { Build(); }

  /// (Re)create the engine with the current cfg_.
  void Build() {
    engine_.reset();
    engine_.reset(new InteractionEngine(
        Collaborators{mic_, speaker_, recognizer_, assistant_, synthesizer_}, slot_, cfg_));
    engine_->on_state_change([this](InteractionState from, InteractionState to) {
      transitions_.emplace_back(from, to);
    });
    engine_->on_report([this](const SessionReport& report) { reports_.push_back(report); });
  }

  void Post(ButtonEvent::Kind kind) {
    ButtonEvent event;
    event.kind = kind;
    event.timestamp = Clock::now();
    slot_.post(event);
  }

  void Press() {
    Post(ButtonEvent::Kind::Pressed);
    engine_->step(0ms);
  }

  void Release() {
    Post(ButtonEvent::Kind::Released);
    engine_->step(0ms);
  }

  void Capture(int chunks) {
    for (int i = 0; i < chunks; ++i) engine_->step(0ms);
  }

  /// Press, capture a little silence, release: a session judged as speech.
  void SpeakAndRelease() {
    Press();
    Capture(3);
    Release();
  }

  void ExpectIdleAfterFailure(ErrorKind kind) {
    EXPECT_EQ(InteractionState::Idle, engine_->state());
    EXPECT_EQ(nullptr, engine_->session());
    ASSERT_EQ(1u, reports_.size());
    EXPECT_EQ(kind, reports_[0].error);
    EXPECT_FALSE(reports_[0].completed);
    EXPECT_FALSE(reports_[0].message.empty());
  }

  void UseWorkingSpeechPath() {
    recognizer_.likelihood = 0.9;
    recognizer_.result = {true, "what time is it", {}};
  }

  CallLog log_;
  FakeMicrophone mic_;
  FakeSpeaker speaker_;
  FakeRecognizer recognizer_;
  FakeAssistant assistant_;
  FakeSynthesizer synthesizer_;
  EventSlot slot_;
  EngineConfig cfg_;
  std::unique_ptr<InteractionEngine> engine_;

  std::vector<std::pair<InteractionState, InteractionState>> transitions_;
  std::vector<SessionReport> reports_;
};

// ============================================================================
// Idle and capture
// ============================================================================

TEST_F(InteractionEngineTest, StartsIdle) {
  EXPECT_EQ(InteractionState::Idle, engine_->state());
  EXPECT_EQ(nullptr, engine_->session());
  EXPECT_FALSE(engine_->step(0ms));
}

TEST_F(InteractionEngineTest, ReleaseWhileIdleIsIgnored) {
  Post(ButtonEvent::Kind::Released);
  engine_->step(0ms);

  EXPECT_EQ(InteractionState::Idle, engine_->state());
  EXPECT_EQ(0u, log_.Count("mic.start"));
  EXPECT_TRUE(reports_.empty());
}

TEST_F(InteractionEngineTest, PressStopsSpeakerThenStartsCapture) {
  Press();

  EXPECT_EQ(InteractionState::Capturing, engine_->state());
  ASSERT_NE(nullptr, engine_->session());
  EXPECT_EQ(1u, engine_->session()->id);
  EXPECT_EQ(InteractionState::Capturing, engine_->session()->state);
  EXPECT_LT(log_.LastIndexOf("speaker.stop"), log_.LastIndexOf("mic.start"));
}

TEST_F(InteractionEngineTest, PressWhileCapturingIsIgnored) {
  Press();
  Capture(2);
  Press();
  Capture(2);

  EXPECT_EQ(InteractionState::Capturing, engine_->state());
  EXPECT_EQ(1u, log_.Count("mic.start"));
  EXPECT_EQ(1u, engine_->session()->id);
}

TEST_F(InteractionEngineTest, CaptureAccumulatesChunks) {
  Press();
  Capture(4);
  ASSERT_NE(nullptr, engine_->session());
  EXPECT_EQ(4u * cfg_.capture_chunk_frames, engine_->session()->audio.size());
}

TEST_F(InteractionEngineTest, MicrophoneStartFailure) {
  mic_.start_ok = false;
  Press();
  ExpectIdleAfterFailure(ErrorKind::CaptureFailure);
}

TEST_F(InteractionEngineTest, MicrophoneReadFailureReleasesMicrophone) {
  mic_.fail_reads = true;
  Press();
  Capture(1);

  ExpectIdleAfterFailure(ErrorKind::CaptureFailure);
  EXPECT_EQ(1u, log_.Count("mic.stop"));
}

TEST_F(InteractionEngineTest, CaptureLimitEndsRecording) {
  cfg_.max_capture_sec = 0.1;
  Build();

  Press();
  for (int i = 0; i < 10 && engine_->state() == InteractionState::Capturing; ++i) {
    engine_->step(0ms);
  }

  EXPECT_EQ(1, recognizer_.calls);
  // 0.1 s at 16 kHz in 320-frame chunks.
  EXPECT_EQ(1600u, recognizer_.last_audio.size());
  EXPECT_EQ(1u, log_.Count("mic.stop"));
}

// ============================================================================
// Recognition
// ============================================================================

TEST_F(InteractionEngineTest, SilenceFallsBackToSpeechAndReportsRecognitionFailure) {
  SpeakAndRelease();

  ExpectIdleAfterFailure(ErrorKind::RecognitionFailure);
  EXPECT_EQ(InputKind::Speech, reports_[0].input);
  EXPECT_EQ(1, recognizer_.calls);
  EXPECT_TRUE(assistant_.queries.empty());

  const std::vector<std::pair<InteractionState, InteractionState>> expected = {
      {InteractionState::Idle, InteractionState::Capturing},
      {InteractionState::Capturing, InteractionState::Classifying},
      {InteractionState::Classifying, InteractionState::Recognizing},
      {InteractionState::Recognizing, InteractionState::Idle},
  };
  EXPECT_EQ(expected, transitions_);
}

TEST_F(InteractionEngineTest, EmptyTranscriptionIsRecognitionFailure) {
  recognizer_.likelihood = 0.9;
  recognizer_.result = {true, "", {}};
  SpeakAndRelease();
  ExpectIdleAfterFailure(ErrorKind::RecognitionFailure);
}

TEST_F(InteractionEngineTest, KeyedMorseIsDecodedAndAnswered) {
  MorseVoiceConfig voice;
  voice.sample_rate = cfg_.sample_rate;
  voice.dot_duration_sec = 0.06;
  voice.lead_in_sec = 0.2;
  ToneRenderer renderer(voice);
  mic_.Load(renderer.render(ToneRenderer::timing_for("... --- ...")).samples);

  Press();
  while (mic_.Remaining() > 0) engine_->step(0ms);
  Capture(5);   // trailing silence
  Release();

  ASSERT_EQ(InteractionState::Responding, engine_->state());
  EXPECT_EQ(0, recognizer_.calls);
  ASSERT_EQ(1u, assistant_.queries.size());
  EXPECT_EQ("SOS", assistant_.queries[0]);
  EXPECT_EQ(std::vector<std::string>{"OK"}, synthesizer_.texts);
  ASSERT_EQ(1u, speaker_.played.size());
  EXPECT_LT(log_.LastIndexOf("mic.stop"), log_.LastIndexOf("speaker.play"));

  // Still playing: nothing changes.
  engine_->step(0ms);
  EXPECT_EQ(InteractionState::Responding, engine_->state());

  speaker_.Finish();
  engine_->step(0ms);

  EXPECT_EQ(InteractionState::Idle, engine_->state());
  ASSERT_EQ(1u, reports_.size());
  EXPECT_TRUE(reports_[0].completed);
  EXPECT_EQ(ErrorKind::None, reports_[0].error);
  EXPECT_EQ(InputKind::Morse, reports_[0].input);
  EXPECT_EQ("SOS", reports_[0].recognized_text);
  EXPECT_EQ("OK", reports_[0].response_text);
  EXPECT_EQ(0u, reports_[0].unrecognized);
}

// ============================================================================
// Response
// ============================================================================

TEST_F(InteractionEngineTest, SpeechIsTranscribedAndAnswered) {
  UseWorkingSpeechPath();
  SpeakAndRelease();

  EXPECT_EQ(InteractionState::Responding, engine_->state());
  ASSERT_EQ(1u, assistant_.queries.size());
  EXPECT_EQ("what time is it", assistant_.queries[0]);
  EXPECT_EQ(1u, speaker_.played.size());
  EXPECT_TRUE(reports_.empty());
}

TEST_F(InteractionEngineTest, AssistantFailure) {
  UseWorkingSpeechPath();
  assistant_.result = {false, {}, "model crashed"};
  SpeakAndRelease();

  ExpectIdleAfterFailure(ErrorKind::AssistantFailure);
  EXPECT_EQ("model crashed", reports_[0].message);
  EXPECT_TRUE(synthesizer_.texts.empty());
  EXPECT_EQ(0u, log_.Count("speaker.play"));
}

TEST_F(InteractionEngineTest, SynthesisFailure) {
  UseWorkingSpeechPath();
  synthesizer_.result = AudioResult{false, {}, "no voice"};
  SpeakAndRelease();

  ExpectIdleAfterFailure(ErrorKind::SynthesisFailure);
  EXPECT_EQ("what time is it", reports_[0].recognized_text);
  EXPECT_EQ(0u, log_.Count("speaker.play"));
}

TEST_F(InteractionEngineTest, PlaybackFailure) {
  UseWorkingSpeechPath();
  speaker_.accept = false;
  SpeakAndRelease();

  ExpectIdleAfterFailure(ErrorKind::PlaybackFailure);
  EXPECT_EQ(1u, log_.Count("speaker.play"));
}

TEST_F(InteractionEngineTest, PressDuringPlaybackBargesIn) {
  UseWorkingSpeechPath();
  SpeakAndRelease();
  ASSERT_EQ(InteractionState::Responding, engine_->state());

  Press();

  EXPECT_EQ(InteractionState::Capturing, engine_->state());
  ASSERT_NE(nullptr, engine_->session());
  EXPECT_EQ(2u, engine_->session()->id);
  EXPECT_FALSE(speaker_.is_playing());
  EXPECT_LT(log_.LastIndexOf("speaker.stop"), log_.LastIndexOf("mic.start"));
  EXPECT_EQ(1u, speaker_.played.size());

  ASSERT_EQ(1u, reports_.size());
  EXPECT_EQ(1u, reports_[0].session_id);
  EXPECT_TRUE(reports_[0].superseded);
  EXPECT_FALSE(reports_[0].completed);
  EXPECT_EQ(ErrorKind::None, reports_[0].error);

  // The new session answers with its own audio; the first answer is never
  // resumed.
  synthesizer_.result.audio.samples.assign(800, 0.5f);
  Capture(3);
  Release();

  ASSERT_EQ(InteractionState::Responding, engine_->state());
  ASSERT_EQ(2u, speaker_.played.size());
  EXPECT_EQ(800u, speaker_.played[1].size());
  EXPECT_FLOAT_EQ(0.5f, speaker_.played[1].samples.front());

  speaker_.Finish();
  engine_->step(0ms);

  EXPECT_EQ(InteractionState::Idle, engine_->state());
  EXPECT_EQ(2u, log_.Count("speaker.play"));
  ASSERT_EQ(2u, reports_.size());
  EXPECT_EQ(2u, reports_[1].session_id);
  EXPECT_TRUE(reports_[1].completed);
  EXPECT_FALSE(reports_[1].superseded);
}

TEST_F(InteractionEngineTest, PressDuringRecognitionSkipsModelsAndPlayback) {
  UseWorkingSpeechPath();
  recognizer_.during_call = [this] { Post(ButtonEvent::Kind::Pressed); };
  SpeakAndRelease();

  EXPECT_TRUE(assistant_.queries.empty());
  EXPECT_TRUE(synthesizer_.texts.empty());
  EXPECT_EQ(0u, log_.Count("speaker.play"));
  EXPECT_EQ(InteractionState::Capturing, engine_->state());
  EXPECT_EQ(2u, engine_->session()->id);
  ASSERT_EQ(1u, reports_.size());
  EXPECT_TRUE(reports_[0].superseded);
  EXPECT_EQ("what time is it", reports_[0].recognized_text);
}

TEST_F(InteractionEngineTest, PressDuringAssistantSkipsSynthesis) {
  UseWorkingSpeechPath();
  assistant_.during_call = [this] { Post(ButtonEvent::Kind::Pressed); };
  SpeakAndRelease();

  EXPECT_EQ(1u, assistant_.queries.size());
  EXPECT_TRUE(synthesizer_.texts.empty());
  EXPECT_EQ(0u, log_.Count("speaker.play"));
  EXPECT_EQ(InteractionState::Capturing, engine_->state());
  ASSERT_EQ(1u, reports_.size());
  EXPECT_TRUE(reports_[0].superseded);
  EXPECT_EQ("OK", reports_[0].response_text);
}

TEST_F(InteractionEngineTest, PressDuringSynthesisSkipsPlayback) {
  UseWorkingSpeechPath();
  synthesizer_.during_call = [this] { Post(ButtonEvent::Kind::Pressed); };
  SpeakAndRelease();

  EXPECT_EQ(1u, synthesizer_.texts.size());
  EXPECT_EQ(0u, log_.Count("speaker.play"));
  EXPECT_EQ(InteractionState::Capturing, engine_->state());
  ASSERT_NE(nullptr, engine_->session());
  EXPECT_EQ(2u, engine_->session()->id);
  ASSERT_EQ(1u, reports_.size());
  EXPECT_TRUE(reports_[0].superseded);
}

TEST_F(InteractionEngineTest, SessionIdsIncrease) {
  SpeakAndRelease();
  SpeakAndRelease();

  ASSERT_EQ(2u, reports_.size());
  EXPECT_EQ(1u, reports_[0].session_id);
  EXPECT_EQ(2u, reports_[1].session_id);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(InteractionEngineTest, StepNeverRestsInTransientStates) {
  UseWorkingSpeechPath();
  std::vector<InteractionState> seen;
  auto step = [&] {
    engine_->step(0ms);
    seen.push_back(engine_->state());
  };

  Post(ButtonEvent::Kind::Pressed);
  step();
  step();
  Post(ButtonEvent::Kind::Released);
  step();
  speaker_.Finish();
  step();

  const std::vector<InteractionState> expected = {
      InteractionState::Capturing, InteractionState::Capturing,
      InteractionState::Responding, InteractionState::Idle};
  EXPECT_EQ(expected, seen);
}

TEST_F(InteractionEngineTest, ErrorKindNamesAreStable) {
  EXPECT_STREQ("none", error_kind_name(ErrorKind::None));
  EXPECT_STREQ("insufficient_signal", error_kind_name(ErrorKind::InsufficientSignal));
  EXPECT_STREQ("capture_failure", error_kind_name(ErrorKind::CaptureFailure));
  EXPECT_STREQ("recognition_failure", error_kind_name(ErrorKind::RecognitionFailure));
  EXPECT_STREQ("playback_failure", error_kind_name(ErrorKind::PlaybackFailure));
}

TEST_F(InteractionEngineTest, ShutdownDropsSessionAndReleasesAudio) {
  Press();
  Capture(1);
  engine_->shutdown();

  EXPECT_EQ(InteractionState::Idle, engine_->state());
  EXPECT_EQ(nullptr, engine_->session());
  EXPECT_EQ(1u, log_.Count("mic.stop"));
  EXPECT_TRUE(reports_.empty());
}

TEST_F(InteractionEngineTest, RunReturnsAfterStop) {
  cfg_.max_capture_sec = 1.0;
  Build();
  std::atomic<bool> captured{false};
  engine_->on_state_change([&captured](InteractionState, InteractionState to) {
    if (to == InteractionState::Capturing) captured = true;
  });

  std::thread loop([this] { engine_->run(); });
  Post(ButtonEvent::Kind::Pressed);

  auto deadline = std::chrono::steady_clock::now() + 5s;
  while (!captured && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  engine_->stop();
  loop.join();

  EXPECT_TRUE(captured);
  EXPECT_TRUE(slot_.closed());
  EXPECT_EQ(InteractionState::Idle, engine_->state());
  EXPECT_EQ(nullptr, engine_->session());
}

}  // namespace
