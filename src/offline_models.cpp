#include "offline_models.hpp"

#include <cctype>
#include <set>
#include <utility>

namespace rune::device {

namespace {

/// Lower-case words of `text`, punctuation stripped.
std::set<std::string> words_of(const std::string& text) {
    std::set<std::string> words;
    std::string word;
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            word += static_cast<char>(std::tolower(uc));
        } else if (!word.empty()) {
            words.insert(word);
            word.clear();
        }
    }
    if (!word.empty()) words.insert(word);
    return words;
}

} // namespace

// ---------------------------------------------------------------------------
// KeywordAssistant
// ---------------------------------------------------------------------------

KeywordAssistant::KeywordAssistant(TimeSource now)
    : now_(std::move(now)) {}

TextResult KeywordAssistant::respond(const std::string& text) {
    const auto words = words_of(text);
    if (words.empty()) {
        return {false, {}, "empty query"};
    }

    if (words.count("hello") || words.count("hi")) {
        return {true, "Hello! I'm Rune, your offline assistant. How can I help?", {}};
    }
    if (words.count("time")) {
        std::time_t t = now_();
        std::tm local{};
        if (!localtime_r(&t, &local)) {
            return {false, {}, "clock unavailable"};
        }
        char buf[16];
        std::strftime(buf, sizeof(buf), "%H:%M", &local);
        return {true, std::string("The time is ") + buf + ".", {}};
    }
    if (words.count("morse")) {
        return {true, "I can read Morse keyed into the microphone and answer in Morse.", {}};
    }
    return {true, "I'm an offline assistant running on this device.", {}};
}

// ---------------------------------------------------------------------------
// MorseSynthesizer
// ---------------------------------------------------------------------------

MorseSynthesizer::MorseSynthesizer(const MorseVoiceConfig& voice,
                                   const CodecConfig& codec)
    : renderer_(voice), codec_(codec) {}

AudioResult MorseSynthesizer::synthesize(const std::string& text) {
    const std::string morse = codec_.text_to_morse(text);
    if (morse.empty()) {
        return {false, {}, "nothing in the response can be keyed"};
    }
    return {true, renderer_.render(ToneRenderer::timing_for(morse)), {}};
}

// ---------------------------------------------------------------------------
// UnavailableRecognizer
// ---------------------------------------------------------------------------

UnavailableRecognizer::UnavailableRecognizer(std::string reason)
    : reason_(std::move(reason)) {}

TextResult UnavailableRecognizer::transcribe(const AudioBuffer& /*audio*/) {
    return {false, {}, reason_};
}

} // namespace rune::device
