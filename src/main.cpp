#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include "audio_io.hpp"
#include "button_monitor.hpp"
#include "console_button.hpp"
#include "decode_pipeline.hpp"
#include "event_slot.hpp"
#include "interaction_engine.hpp"
#include "offline_models.hpp"
#include "tone_renderer.hpp"

namespace dev = rune::device;

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) { g_interrupted.store(true); }

/// Everything the command line can tune.
struct Options {
    dev::AudioConfig      audio;
    dev::EngineConfig     engine;
    dev::MorseVoiceConfig voice;
};

void print_usage() {
    std::puts(
        "rune-device v1.0.0\n"
        "Usage:\n"
        "  rune-device run                 Push-to-talk loop (Enter toggles the button)\n"
        "  rune-device encode <text>       Print text as Morse\n"
        "  rune-device decode <morse>      Print Morse as text\n"
        "  rune-device play <text>         Key text as Morse tone on the speaker\n"
        "  rune-device listen <seconds>    Capture audio and decode Morse\n"
        "  rune-device loopback <text>     Render text to tone and decode it offline\n"
        "  rune-device devices             List available audio devices\n"
        "Options:\n"
        "  --threshold <amp>     envelope threshold (default 0.1)\n"
        "  --sample-rate <hz>    audio sample rate (default 16000)\n"
        "  --tone <hz>           reply tone frequency (default 800)\n"
        "  --dot-ms <ms>         reply dot length (default 100)\n"
        "  --word-gap <units>    inter-char/word gap boundary (default 5)\n"
        "  --sentinel <char>     marker for unknown characters (default ?)\n"
        "  --max-capture <sec>   longest capture per press (default 30)\n"
        "  --input-device <n>    PortAudio input device index\n"
        "  --output-device <n>   PortAudio output device index\n"
    );
}

bool parse_number(const char* text, double& out) {
    char* end = nullptr;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0') return false;
    out = value;
    return true;
}

/// Split argv into positional arguments and options. Returns false on a
/// malformed option.
bool parse_args(int argc, char* argv[], Options& opt, std::vector<std::string>& positional) {
    for (int i = 2; i < argc; ++i) {
        const char* arg = argv[i];
        // "--." is Morse, "--tone" is an option.
        if (std::strncmp(arg, "--", 2) != 0 ||
            !std::isalpha(static_cast<unsigned char>(arg[2]))) {
            positional.emplace_back(arg);
            continue;
        }
        if (i + 1 >= argc) {
            std::fprintf(stderr, "error: %s needs a value\n", arg);
            return false;
        }
        const char* value = argv[++i];

        if (std::strcmp(arg, "--sentinel") == 0) {
            if (std::strlen(value) != 1) {
                std::fprintf(stderr, "error: --sentinel takes one character\n");
                return false;
            }
            opt.engine.codec.unrecognized_sentinel = value[0];
            continue;
        }

        double number = 0.0;
        if (!parse_number(value, number)) {
            std::fprintf(stderr, "error: %s expects a number, got '%s'\n", arg, value);
            return false;
        }

        if (std::strcmp(arg, "--threshold") == 0) {
            opt.engine.segmenter.amplitude_threshold = number;
        } else if (std::strcmp(arg, "--sample-rate") == 0) {
            opt.audio.sample_rate  = number;
            opt.engine.sample_rate = number;
            opt.voice.sample_rate  = number;
        } else if (std::strcmp(arg, "--tone") == 0) {
            opt.voice.tone_freq_hz = number;
        } else if (std::strcmp(arg, "--dot-ms") == 0) {
            opt.voice.dot_duration_sec = number / 1000.0;
        } else if (std::strcmp(arg, "--word-gap") == 0) {
            opt.engine.timing.word_gap_boundary = number;
        } else if (std::strcmp(arg, "--max-capture") == 0) {
            opt.engine.max_capture_sec = number;
        } else if (std::strcmp(arg, "--input-device") == 0) {
            opt.audio.input_device = static_cast<int>(number);
        } else if (std::strcmp(arg, "--output-device") == 0) {
            opt.audio.output_device = static_cast<int>(number);
        } else {
            std::fprintf(stderr, "error: unknown option %s\n", arg);
            return false;
        }
    }
    return true;
}

std::string join(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out += ' ';
        out += w;
    }
    return out;
}

void print_decode_failure(const char* tag, const dev::DecodeResult& result) {
    std::fprintf(stderr, "[%s] decode failed at stage '%s': %s\n", tag,
                 dev::decode_stage_name(result.stage_reached), result.error.c_str());
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int cmd_encode(const Options& opt, const std::string& text) {
    dev::MorseCodec codec(opt.engine.codec);
    std::puts(codec.text_to_morse(text).c_str());
    return 0;
}

int cmd_decode(const Options& opt, const std::string& morse) {
    dev::MorseCodec codec(opt.engine.codec);
    std::puts(codec.morse_to_text(morse).c_str());
    return 0;
}

int cmd_play(const Options& opt, const std::string& text) {
    dev::MorseCodec codec(opt.engine.codec);
    dev::ToneRenderer renderer(opt.voice);
    dev::AudioBuffer pcm = renderer.render_text(text, codec);
    if (pcm.empty()) {
        std::fprintf(stderr, "error: nothing in '%s' can be keyed\n", text.c_str());
        return 1;
    }

    dev::AudioIO audio;
    if (!audio.open(opt.audio)) {
        std::fprintf(stderr, "error: failed to open audio\n");
        return 1;
    }
    if (!audio.play(pcm)) {
        std::fprintf(stderr, "error: audio playback failed\n");
        return 1;
    }
    std::printf("[play] keying %.1f s of Morse\n", pcm.duration());
    while (audio.is_playing() && !g_interrupted.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    audio.close();
    return 0;
}

int cmd_listen(const Options& opt, double seconds) {
    dev::AudioIO audio;
    if (!audio.open(opt.audio)) {
        std::fprintf(stderr, "error: failed to open audio\n");
        return 1;
    }

    std::printf("[listen] capturing %.1f seconds of audio...\n", seconds);
    dev::AudioBuffer pcm = audio.capture(seconds);
    audio.close();
    std::printf("[listen] captured %zu samples\n", pcm.size());

    dev::DecodePipeline pipeline(opt.engine.segmenter, opt.engine.timing, opt.engine.codec);
    auto result = pipeline.decode(pcm);
    if (!result.success) {
        print_decode_failure("listen", result);
        return 1;
    }
    std::printf("[listen] morse: %s\n", result.morse_text.c_str());
    std::printf("[listen] unit:  %.1f ms%s\n", result.unit.unit * 1e3,
                result.unit.stable ? "" : " (unstable)");
    std::printf("[listen] text:  %s\n", result.text.c_str());
    return 0;
}

int cmd_loopback(const Options& opt, const std::string& text) {
    std::puts("=== Offline Loopback Test ===\n");

    dev::MorseCodec codec(opt.engine.codec);
    dev::MorseVoiceConfig voice = opt.voice;
    voice.sample_rate = opt.engine.sample_rate;
    dev::ToneRenderer renderer(voice);

    // 1. Encode
    std::string morse = codec.text_to_morse(text);
    if (morse.empty()) {
        std::fprintf(stderr, "error: nothing in '%s' can be keyed\n", text.c_str());
        return 1;
    }
    std::printf("[1/3] encoded: %s\n", morse.c_str());

    // 2. Render
    dev::AudioBuffer pcm = renderer.render(dev::ToneRenderer::timing_for(morse));
    std::printf("[2/3] rendered %zu samples (%.2f s)\n", pcm.size(), pcm.duration());

    // 3. Decode
    dev::DecodePipeline pipeline(opt.engine.segmenter, opt.engine.timing, opt.engine.codec);
    auto result = pipeline.decode(pcm);
    if (!result.success) {
        print_decode_failure("3/3", result);
        return 1;
    }
    std::printf("[3/3] decoded: %s (unit %.1f ms)\n", result.text.c_str(),
                result.unit.unit * 1e3);

    const std::string expected = codec.morse_to_text(morse);
    if (result.text != expected) {
        std::printf("\n=== MISMATCH: expected '%s' ===\n", expected.c_str());
        return 1;
    }
    std::puts("\n=== PASS: roundtrip matches ===");
    return 0;
}

int cmd_run(const Options& opt) {
    dev::AudioIO audio;
    if (!audio.open(opt.audio)) {
        std::fprintf(stderr, "error: failed to open audio\n");
        return 1;
    }

    dev::EventSlot             events;
    dev::ConsoleButton         button;
    dev::ButtonMonitor         monitor(button, events, opt.engine.poll_interval);
    dev::UnavailableRecognizer recognizer;
    dev::KeywordAssistant      assistant;
    dev::MorseSynthesizer      synthesizer(opt.voice, opt.engine.codec);

    dev::Collaborators collaborators{audio.microphone(), audio.speaker(),
                                     recognizer, assistant, synthesizer};
    dev::InteractionEngine engine(collaborators, events, opt.engine);

    engine.on_report([](const dev::SessionReport& report) {
        if (report.error != dev::ErrorKind::None) {
            std::printf("[run] session %llu: %s (%s)\n",
                        static_cast<unsigned long long>(report.session_id),
                        dev::error_kind_name(report.error), report.message.c_str());
        } else if (report.superseded) {
            std::printf("[run] session %llu: interrupted\n",
                        static_cast<unsigned long long>(report.session_id));
        } else {
            std::printf("[run] session %llu: \"%s\" -> \"%s\"\n",
                        static_cast<unsigned long long>(report.session_id),
                        report.recognized_text.c_str(), report.response_text.c_str());
        }
        std::fflush(stdout);
    });

    monitor.start();
    std::puts("[run] press Enter to start talking, Enter again to stop; Ctrl-C quits");
    std::fflush(stdout);

    while (!g_interrupted.load() && !button.eof()) {
        engine.step(opt.engine.poll_interval);
    }

    monitor.stop();
    engine.shutdown();
    audio.close();
    return 0;
}

} // namespace

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const char* cmd = argv[1];

    Options opt;
    std::vector<std::string> args;
    if (!parse_args(argc, argv, opt, args)) {
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    if (std::strcmp(cmd, "devices") == 0) {
        dev::AudioIO::list_devices();
        return 0;
    }
    if (std::strcmp(cmd, "run") == 0) {
        return cmd_run(opt);
    }
    if (std::strcmp(cmd, "encode") == 0 && !args.empty()) {
        return cmd_encode(opt, join(args));
    }
    if (std::strcmp(cmd, "decode") == 0 && !args.empty()) {
        // Unquoted arguments are single characters; quote to keep word gaps.
        return cmd_decode(opt, join(args));
    }
    if (std::strcmp(cmd, "play") == 0 && !args.empty()) {
        return cmd_play(opt, join(args));
    }
    if (std::strcmp(cmd, "listen") == 0 && args.size() == 1) {
        double seconds = 0.0;
        if (!parse_number(args[0].c_str(), seconds) || seconds <= 0.0) {
            std::fprintf(stderr, "error: listen needs a positive duration\n");
            return 1;
        }
        return cmd_listen(opt, seconds);
    }
    if (std::strcmp(cmd, "loopback") == 0 && !args.empty()) {
        return cmd_loopback(opt, join(args));
    }

    print_usage();
    return 1;
}
