#include "audio_io.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace rune::device {

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

AudioIO::AudioIO() = default;

AudioIO::~AudioIO() { close(); }

bool AudioIO::open(const AudioConfig& cfg) {
    cfg_ = cfg;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::fprintf(stderr, "[audio] Pa_Initialize failed: %s\n",
                     Pa_GetErrorText(err));
        return false;
    }
    initialized_ = true;

    const int device_count = Pa_GetDeviceCount();

    // --- output stream ---
    PaStreamParameters out_params{};
    out_params.device = resolve_device(cfg_.output_device,
                                       Pa_GetDefaultOutputDevice(), device_count);
    const PaDeviceInfo* out_info =
        (out_params.device == paNoDevice) ? nullptr : Pa_GetDeviceInfo(out_params.device);
    if (!out_info) {
        std::fprintf(stderr, "[audio] no output device (requested %d, %d available)\n",
                     cfg_.output_device, std::max(device_count, 0));
        return false;
    }
    out_params.channelCount = 1;
    out_params.sampleFormat = paFloat32;
    out_params.suggestedLatency = out_info->defaultLowOutputLatency;

    err = Pa_OpenStream(&output_stream_, nullptr, &out_params,
                        cfg_.sample_rate, paFramesPerBufferUnspecified,
                        paClipOff, nullptr, nullptr);
    if (err != paNoError) {
        std::fprintf(stderr, "[audio] output stream open failed: %s\n",
                     Pa_GetErrorText(err));
        output_stream_ = nullptr;
        return false;
    }

    // --- input stream ---
    // Input is non-fatal: encode/play commands still work without it.
    PaStreamParameters in_params{};
    in_params.device = resolve_device(cfg_.input_device,
                                      Pa_GetDefaultInputDevice(), device_count);
    const PaDeviceInfo* in_info =
        (in_params.device == paNoDevice) ? nullptr : Pa_GetDeviceInfo(in_params.device);
    if (!in_info) {
        std::fprintf(stderr, "[audio] no input device (requested %d), capture disabled\n",
                     cfg_.input_device);
        input_stream_ = nullptr;
        return true;
    }
    in_params.channelCount = 1;
    in_params.sampleFormat = paFloat32;
    in_params.suggestedLatency = in_info->defaultLowInputLatency;

    err = Pa_OpenStream(&input_stream_, &in_params, nullptr,
                        cfg_.sample_rate, paFramesPerBufferUnspecified,
                        paClipOff, nullptr, nullptr);
    if (err != paNoError) {
        std::fprintf(stderr, "[audio] input stream open failed: %s\n",
                     Pa_GetErrorText(err));
        input_stream_ = nullptr;
    }

    return true;
}

void AudioIO::close() {
    stop_playback();
    stop_capture();
    if (output_stream_) { Pa_CloseStream(output_stream_); output_stream_ = nullptr; }
    if (input_stream_)  { Pa_CloseStream(input_stream_);  input_stream_  = nullptr; }
    if (initialized_)   { Pa_Terminate(); initialized_ = false; }
}

// ---------------------------------------------------------------------------
// Capture
// ---------------------------------------------------------------------------

bool AudioIO::start_capture(double sample_rate) {
    if (!input_stream_) return false;
    if (std::fabs(sample_rate - cfg_.sample_rate) > 0.5) {
        std::fprintf(stderr, "[audio] capture at %.0f Hz requested, device opened at %.0f Hz\n",
                     sample_rate, cfg_.sample_rate);
        return false;
    }

    // Never record our own voice.
    stop_playback();

    if (capturing_) return true;
    PaError err = Pa_StartStream(input_stream_);
    if (err != paNoError) {
        std::fprintf(stderr, "[audio] input start failed: %s\n", Pa_GetErrorText(err));
        return false;
    }
    capturing_ = true;
    return true;
}

std::size_t AudioIO::read_capture(std::vector<float>& out, std::size_t max_frames) {
    if (!capturing_ || max_frames == 0) return 0;

    const std::size_t offset = out.size();
    out.resize(offset + max_frames, 0.0f);

    PaError err = Pa_ReadStream(input_stream_, out.data() + offset,
                                static_cast<unsigned long>(max_frames));
    if (err == paInputOverflowed) {
        // Samples were lost upstream; what we read is still usable.
        std::fprintf(stderr, "[audio] input overflow\n");
    } else if (err != paNoError) {
        std::fprintf(stderr, "[audio] read failed: %s\n", Pa_GetErrorText(err));
        out.resize(offset);
        return 0;
    }
    return max_frames;
}

void AudioIO::stop_capture() {
    if (!capturing_) return;
    Pa_StopStream(input_stream_);
    capturing_ = false;
}

AudioBuffer AudioIO::capture(double duration_sec) {
    AudioBuffer buf;
    buf.sample_rate = cfg_.sample_rate;
    if (!start_capture(cfg_.sample_rate)) return buf;

    auto num_frames = static_cast<std::size_t>(cfg_.sample_rate * duration_sec);
    if (read_capture(buf.samples, num_frames) == 0) buf.samples.clear();
    stop_capture();
    return buf;
}

// ---------------------------------------------------------------------------
// Playback
// ---------------------------------------------------------------------------

bool AudioIO::play(const AudioBuffer& audio) {
    if (!output_stream_) return false;

    stop_playback();
    if (capturing_) {
        std::fprintf(stderr, "[audio] refusing to play while capturing\n");
        return false;
    }
    if (audio.empty()) return true;

    PaError err = Pa_StartStream(output_stream_);
    if (err != paNoError) {
        std::fprintf(stderr, "[audio] output start failed: %s\n", Pa_GetErrorText(err));
        return false;
    }

    abort_playback_.store(false);
    playing_.store(true);
    playback_thread_ = std::thread(&AudioIO::write_loop, this, audio.samples);
    return true;
}

void AudioIO::stop_playback() {
    abort_playback_.store(true);
    if (playback_thread_.joinable()) playback_thread_.join();
    playing_.store(false);
}

void AudioIO::write_loop(std::vector<float> pcm) {
    const std::size_t chunk = std::max<std::size_t>(1, cfg_.playback_chunk);
    std::size_t pos = 0;

    while (pos < pcm.size() && !abort_playback_.load()) {
        const std::size_t n = std::min(chunk, pcm.size() - pos);
        PaError err = Pa_WriteStream(output_stream_, pcm.data() + pos,
                                     static_cast<unsigned long>(n));
        if (err != paNoError && err != paOutputUnderflowed) {
            std::fprintf(stderr, "[audio] write failed: %s\n", Pa_GetErrorText(err));
            break;
        }
        pos += n;
    }

    if (abort_playback_.load()) {
        Pa_AbortStream(output_stream_);   // drop what is still queued
    } else {
        Pa_StopStream(output_stream_);    // let the tail drain
    }
    playing_.store(false);
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

int AudioIO::resolve_device(int requested, int default_device, int device_count) {
    if (requested < 0) return default_device;
    if (requested >= device_count) return paNoDevice;
    return requested;
}

void AudioIO::list_devices() {
    if (Pa_Initialize() != paNoError) {
        std::fprintf(stderr, "[audio] Pa_Initialize failed\n");
        return;
    }
    int n = Pa_GetDeviceCount();
    for (int i = 0; i < n; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        std::printf("  [%d] %s  (in:%d out:%d)\n",
                    i, info->name,
                    info->maxInputChannels,
                    info->maxOutputChannels);
    }
    Pa_Terminate();
}

} // namespace rune::device
