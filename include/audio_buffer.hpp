#ifndef RUNE_DEVICE_AUDIO_BUFFER_HPP
#define RUNE_DEVICE_AUDIO_BUFFER_HPP

#include <cstddef>
#include <vector>

namespace rune::device {

/// Mono PCM samples (full scale +/-1.0) plus the rate they were taken at.
struct AudioBuffer {
    std::vector<float> samples;
    double             sample_rate = 16000.0;

    bool empty() const noexcept { return samples.empty(); }
    std::size_t size() const noexcept { return samples.size(); }

    /// Length of the buffer in seconds.
    double duration() const noexcept {
        return sample_rate > 0.0
                   ? static_cast<double>(samples.size()) / sample_rate
                   : 0.0;
    }
};

} // namespace rune::device

#endif // RUNE_DEVICE_AUDIO_BUFFER_HPP
