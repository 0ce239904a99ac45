#pragma once

#include "scaletuner/audio_input.hpp"
#include "scaletuner/circular_buffer.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace scaletuner::audio {

// Owns a capture session and the circular buffer its callback writes into.
//
// Settings that a session can only take at creation time (device, channels,
// sample rate, burst size) are changed by recreating the session. The buffer
// is swapped at the same time so it never mixes frames of different shapes.
// Buffer writes, reads and the swap all happen under one mutex.
class InputStream {
public:
    using BackendFactory = std::function<std::unique_ptr<IAudioInput>(const AudioConfig&)>;
    using Buffer = CircularBuffer<float>;

    // Buffer contents with the shape they were captured in.
    struct Frames {
        Buffer::Snapshot samples;   // interleaved, oldest first
        unsigned int channels = 0;
        unsigned int sample_rate = 0;
    };

    // `bufsize` (frames) takes precedence over `bufsecs` when non-zero.
    explicit InputStream(const AudioConfig& config = AudioConfig{},
                         double bufsecs = 0.1,
                         std::size_t bufsize = 0,
                         BackendFactory factory = createAudioInput);
    ~InputStream();

    InputStream(const InputStream&) = delete;
    InputStream& operator=(const InputStream&) = delete;

    // Opens a new session first if the current one was closed.
    bool start();
    // Halts capture and clears the buffer so a restart never sees stale audio.
    void stop();
    void close();

    Buffer::Snapshot read() const;
    Frames read_frames() const;

    // Live properties, taken from the current session
    std::string name() const;
    bool active() const;
    bool closed() const;
    unsigned int samplerate() const;
    unsigned int channels() const;
    unsigned int burstsize() const;
    std::size_t bufsize() const;
    double bufsecs() const;
    AudioConfig config() const;

    // Each of these recreates the session; they return false when the new
    // session could not be opened or restarted.
    bool set_device(const std::string& device_name);
    bool set_channels(unsigned int channels);
    bool set_samplerate(unsigned int sample_rate);
    bool set_burstsize(unsigned int frames);

    // These only replace the buffer.
    void set_bufsize(std::size_t frames);
    void set_bufsecs(double secs);

private:
    bool reinitialize(const std::function<void(AudioConfig&)>& change);
    void install_backend(const AudioConfig& config, std::size_t buffer_frames);
    void on_audio(unsigned long generation, const float* input, int num_frames);

    BackendFactory factory_;

    // Serializes structural changes (start/stop/close/reconfigure). Always
    // taken before mutex_.
    mutable std::mutex reconfig_mutex_;
    // Guards backend_, buffer_ and generation_ against the capture callback
    // and readers.
    mutable std::mutex mutex_;

    std::unique_ptr<IAudioInput> backend_;
    std::unique_ptr<Buffer> buffer_;
    // Bumped whenever the session is retired; callbacks from an older
    // generation are dropped.
    unsigned long generation_ = 0;
    bool verbose_ = false;
};

} // namespace scaletuner::audio
