#include "tone_renderer.hpp"

#include <cmath>

namespace rune::device {

namespace {

constexpr double kPi = 3.14159265358979323846;

void append(std::vector<int8_t>& timing, int8_t value, int units) {
    timing.insert(timing.end(), static_cast<std::size_t>(units), value);
}

} // namespace

ToneRenderer::ToneRenderer(const MorseVoiceConfig& cfg)
    : cfg_(cfg) {}

std::vector<int8_t> ToneRenderer::timing_for(std::string_view morse) {
    std::vector<int8_t> timing;
    bool in_char = false;   // an element of the current character was keyed
    int  pending_spaces = 0;

    for (char c : morse) {
        if (c == ' ') {
            ++pending_spaces;
            continue;
        }
        if (c != '.' && c != '-') continue;

        if (!timing.empty()) {
            if (pending_spaces >= 3)      append(timing, -1, 7);
            else if (pending_spaces > 0)  append(timing, -1, 3);
            else if (in_char)             append(timing, -1, 1);
        }
        pending_spaces = 0;
        append(timing, 1, c == '.' ? 1 : 3);
        in_char = true;
    }
    return timing;
}

AudioBuffer ToneRenderer::render(const std::vector<int8_t>& timing) const {
    AudioBuffer out;
    out.sample_rate = cfg_.sample_rate;

    const auto samples_per_unit =
        static_cast<std::size_t>(std::lround(cfg_.sample_rate * cfg_.dot_duration_sec));
    const auto lead_in =
        static_cast<std::size_t>(std::lround(cfg_.sample_rate * cfg_.lead_in_sec));

    out.samples.reserve(lead_in + timing.size() * samples_per_unit);
    out.samples.assign(lead_in, 0.0f);

    const double omega = 2.0 * kPi * cfg_.tone_freq_hz / cfg_.sample_rate;
    std::size_t  sample_idx = 0;

    for (int8_t t : timing) {
        for (std::size_t s = 0; s < samples_per_unit; ++s, ++sample_idx) {
            if (t > 0) {
                out.samples.push_back(static_cast<float>(
                    cfg_.amplitude * std::sin(omega * static_cast<double>(sample_idx))));
            } else {
                out.samples.push_back(0.0f);
            }
        }
    }
    return out;
}

AudioBuffer ToneRenderer::render_text(std::string_view text,
                                      const MorseCodec& codec) const {
    return render(timing_for(codec.text_to_morse(text)));
}

} // namespace rune::device
