#pragma once

#include <functional>
#include <memory>
#include <string>

namespace scaletuner {

struct AudioConfig {
    std::string device_name = "default";  // ALSA device (e.g., "hw:0", "plughw:0")
    unsigned int channels = 1;            // 0 = every channel the device offers
    unsigned int sample_rate = 48000;     // 0 = device default
    unsigned int period_size = 0;         // Frames per burst, 0 = device default
    unsigned int num_periods = 2;
    bool use_realtime_priority = false;
    bool verbose = false;
};

// One capture session on one device. The device is opened when the session is
// created; start()/stop() pause and resume capture, close() releases the
// device for good. A closed session cannot be started again, create a new one.
//
// get_config() reports what the device actually negotiated, so fields left at
// 0 in the requested config are filled in once the session is open.
class IAudioInput {
public:
    // `input` holds num_frames interleaved frames of get_config().channels samples.
    using ProcessCallback = std::function<void(const float* input, int num_frames)>;

    virtual ~IAudioInput() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual void close() = 0;
    virtual bool is_running() const = 0;
    virtual bool is_closed() const = 0;

    virtual void set_process_callback(ProcessCallback callback) = 0;
    virtual const AudioConfig& get_config() const = 0;

    struct LatencyStats {
        float min_ms;
        float max_ms;
        float avg_ms;
        int xruns;
    };
    virtual LatencyStats get_latency_stats() const = 0;
};

// Factory that returns the active platform backend
std::unique_ptr<IAudioInput> createAudioInput(const AudioConfig& config);

} // namespace scaletuner
