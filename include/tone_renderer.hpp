#ifndef RUNE_DEVICE_TONE_RENDERER_HPP
#define RUNE_DEVICE_TONE_RENDERER_HPP

#include <cstdint>
#include <string_view>
#include <vector>

#include "audio_buffer.hpp"
#include "morse_codec.hpp"

namespace rune::device {

/// How Morse is keyed when the device answers in code.
struct MorseVoiceConfig {
    double sample_rate      = 16000.0;
    double tone_freq_hz     = 800.0;
    double dot_duration_sec = 0.1;
    double amplitude        = 0.8;
    double lead_in_sec      = 0.0;   // silence before the first element
};

/// Renders Morse as a keyed sine tone.
class ToneRenderer {
public:
    explicit ToneRenderer(const MorseVoiceConfig& cfg = {});

    /// Convert a Morse string (". -" alphabet, 1/3 space separators) to a
    /// timing array. Each element is +1 (tone ON) or -1 (silence) for one
    /// timing unit, using 1:3 element and 1:3:7 gap ratios.
    static std::vector<int8_t> timing_for(std::string_view morse);

    /// Render a timing array into PCM.
    AudioBuffer render(const std::vector<int8_t>& timing) const;

    /// Encode text with `codec` and render it.
    AudioBuffer render_text(std::string_view text, const MorseCodec& codec) const;

    const MorseVoiceConfig& config() const noexcept { return cfg_; }

private:
    MorseVoiceConfig cfg_;
};

} // namespace rune::device

#endif // RUNE_DEVICE_TONE_RENDERER_HPP
