#ifndef RUNE_DEVICE_AUDIO_IO_HPP
#define RUNE_DEVICE_AUDIO_IO_HPP

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

#include <portaudio.h>

#include "audio_buffer.hpp"
#include "collaborators.hpp"

namespace rune::device {

/// Configuration for audio I/O.
struct AudioConfig {
    double      sample_rate     = 16000.0;
    int         output_device   = -1;     // -1 = default
    int         input_device    = -1;     // -1 = default
    std::size_t playback_chunk  = 512;    // frames per blocking write
};

/// PortAudio wrapper for the device's microphone and speaker.
///
/// The two never run together: starting a capture stops playback first.
/// Playback runs on a writer thread so it can be stopped mid-buffer.
class AudioIO {
public:
    /// Microphone view for the interaction engine.
    class Microphone : public AudioSource {
    public:
        explicit Microphone(AudioIO& io) : io_(io) {}
        bool start(double sample_rate) override { return io_.start_capture(sample_rate); }
        std::size_t read(std::vector<float>& out, std::size_t max_frames) override {
            return io_.read_capture(out, max_frames);
        }
        void stop() override { io_.stop_capture(); }

    private:
        AudioIO& io_;
    };

    /// Speaker view for the interaction engine.
    class Speaker : public PlaybackSink {
    public:
        explicit Speaker(AudioIO& io) : io_(io) {}
        bool play(const AudioBuffer& audio) override { return io_.play(audio); }
        void stop() override { io_.stop_playback(); }
        bool is_playing() const override { return io_.is_playing(); }

    private:
        AudioIO& io_;
    };

    AudioIO();
    ~AudioIO();

    AudioIO(const AudioIO&) = delete;
    AudioIO& operator=(const AudioIO&) = delete;

    /// Initialise PortAudio and open both streams.
    bool open(const AudioConfig& cfg);

    /// Stop everything and shut down PortAudio.
    void close();

    // ----- Capture -----

    bool start_capture(double sample_rate);
    std::size_t read_capture(std::vector<float>& out, std::size_t max_frames);
    void stop_capture();

    /// Record for `duration_sec` seconds in one go.
    AudioBuffer capture(double duration_sec);

    // ----- Playback -----

    /// Start playing `audio`; returns once the writer thread is running.
    bool play(const AudioBuffer& audio);

    /// Abort playback, dropping anything not yet written.
    void stop_playback();

    bool is_playing() const noexcept { return playing_.load(); }

    AudioSource&  microphone() noexcept { return microphone_; }
    PlaybackSink& speaker() noexcept { return speaker_; }

    /// List available audio devices and their indices.
    static void list_devices();

    /// Device index to open: `default_device` when `requested` is negative,
    /// paNoDevice when `requested` is past the last of `device_count`.
    static int resolve_device(int requested, int default_device, int device_count);

private:
    PaStream*   output_stream_ = nullptr;
    PaStream*   input_stream_  = nullptr;
    AudioConfig cfg_;
    bool        initialized_   = false;
    bool        capturing_     = false;

    std::thread       playback_thread_;
    std::atomic<bool> playing_{false};
    std::atomic<bool> abort_playback_{false};

    Microphone microphone_{*this};
    Speaker    speaker_{*this};

    void write_loop(std::vector<float> pcm);
};

} // namespace rune::device

#endif // RUNE_DEVICE_AUDIO_IO_HPP
