#include "scaletuner/audio_input.hpp"

#include <alsa/asoundlib.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <pthread.h>
#include <sched.h>
#include <string>
#include <sys/mman.h>
#include <thread>
#include <utility>
#include <vector>

namespace scaletuner {

namespace {

constexpr unsigned int kFallbackRate = 48000;
constexpr float kS16Scale = 1.0f / 32768.0f;

// Requested device first, then "default", then every capture-capable
// plughw: and hw: device ALSA knows about.
std::vector<std::string> capture_candidates(const std::string& requested) {
    std::vector<std::string> out;
    if (!requested.empty()) out.push_back(requested);
    if (requested != "default") out.push_back("default");

    void** hints = nullptr;
    if (snd_device_name_hint(-1, "pcm", &hints) != 0 || !hints) {
        return out;
    }
    std::vector<std::string> plug;
    std::vector<std::string> raw;
    for (void** h = hints; *h != nullptr; ++h) {
        char* name = snd_device_name_get_hint(*h, "NAME");
        char* ioid = snd_device_name_get_hint(*h, "IOID");
        // IOID is absent for devices that do both directions
        const bool capture = !ioid || std::strcmp(ioid, "Input") == 0;
        if (name && capture) {
            const std::string s(name);
            if (s.rfind("plughw:", 0) == 0) plug.push_back(s);
            else if (s.rfind("hw:", 0) == 0) raw.push_back(s);
        }
        std::free(name);
        std::free(ioid);
    }
    snd_device_name_free_hint(hints);
    out.insert(out.end(), plug.begin(), plug.end());
    out.insert(out.end(), raw.begin(), raw.end());
    return out;
}

bool check(int err, const char* what) {
    if (err < 0) {
        std::cerr << "ALSA: cannot " << what << ": " << snd_strerror(err) << std::endl;
        return false;
    }
    return true;
}

} // namespace

// Capture session on one ALSA PCM. The device is opened and its hardware
// parameters negotiated in the constructor; frames are read on a dedicated
// thread and handed to the process callback one period at a time.
class AlsaAudioInput : public IAudioInput {
public:
    explicit AlsaAudioInput(const AudioConfig& config) : config_(config) {
        opened_ = open();
    }

    ~AlsaAudioInput() override { close(); }

    bool start() override {
        if (running_.load()) {
            return true;
        }
        if (!opened_.load()) {
            std::cerr << "ALSA: cannot start closed capture session on " << config_.device_name << std::endl;
            return false;
        }
        running_ = true;
        thread_ = std::thread(&AlsaAudioInput::capture_loop, this);
        if (config_.use_realtime_priority) {
            raise_priority();
        }
        return true;
    }

    void stop() override {
        if (!running_.exchange(false)) {
            return;
        }
        if (thread_.joinable()) {
            thread_.join();
        }
        // Discard what is queued so the next start() begins with fresh audio
        snd_pcm_drop(pcm_);
        snd_pcm_prepare(pcm_);
    }

    void close() override {
        stop();
        release();
    }

    bool is_running() const override { return running_.load(); }
    bool is_closed() const override { return !opened_.load(); }

    void set_process_callback(ProcessCallback callback) override { callback_ = std::move(callback); }
    const AudioConfig& get_config() const override { return config_; }

    LatencyStats get_latency_stats() const override {
        LatencyStats stats{};
        const int count = callback_count_.load();
        stats.min_ms = count > 0 ? min_ms_.load() : 0.0f;
        stats.max_ms = max_ms_.load();
        stats.avg_ms = count > 0 ? total_ms_.load() / count : 0.0f;
        stats.xruns = xruns_.load();
        return stats;
    }

private:
    bool open() {
        std::string device;
        for (const auto& candidate : capture_candidates(config_.device_name)) {
            if (snd_pcm_open(&pcm_, candidate.c_str(), SND_PCM_STREAM_CAPTURE, 0) == 0) {
                device = candidate;
                break;
            }
        }
        if (device.empty()) {
            std::cerr << "ALSA: no capture device could be opened (asked for "
                      << config_.device_name << ")" << std::endl;
            return false;
        }
        if (device != config_.device_name) {
            std::cout << "Using capture device: " << device << std::endl;
            config_.device_name = device;
        }
        if (!negotiate()) {
            release();
            return false;
        }
        return true;
    }

    // Applies the requested shape; zero fields take what the device offers.
    // On success config_ holds the negotiated values.
    bool negotiate() {
        snd_pcm_hw_params_t* hw;
        snd_pcm_hw_params_alloca(&hw);

        if (!check(snd_pcm_hw_params_any(pcm_, hw), "read hardware parameters")) return false;
        if (!check(snd_pcm_hw_params_set_access(pcm_, hw, SND_PCM_ACCESS_RW_INTERLEAVED), "set access type")) {
            return false;
        }

        format_ = SND_PCM_FORMAT_FLOAT_LE;
        if (snd_pcm_hw_params_set_format(pcm_, hw, format_) < 0) {
            format_ = SND_PCM_FORMAT_S16_LE;
            if (!check(snd_pcm_hw_params_set_format(pcm_, hw, format_), "set sample format")) return false;
        }

        unsigned int channels = config_.channels;
        if (channels == 0) {
            snd_pcm_hw_params_get_channels_max(hw, &channels);
        }
        if (!check(snd_pcm_hw_params_set_channels_near(pcm_, hw, &channels), "set channel count")) return false;

        unsigned int rate = config_.sample_rate > 0 ? config_.sample_rate : kFallbackRate;
        if (!check(snd_pcm_hw_params_set_rate_near(pcm_, hw, &rate, nullptr), "set sample rate")) return false;

        snd_pcm_uframes_t period = config_.period_size;
        if (period > 0 &&
            !check(snd_pcm_hw_params_set_period_size_near(pcm_, hw, &period, nullptr), "set period size")) {
            return false;
        }

        unsigned int periods = config_.num_periods;
        if (!check(snd_pcm_hw_params_set_periods_near(pcm_, hw, &periods, nullptr), "set period count")) return false;
        if (!check(snd_pcm_hw_params(pcm_, hw), "apply hardware parameters")) return false;
        if (!check(snd_pcm_prepare(pcm_), "prepare capture")) return false;

        snd_pcm_hw_params_get_period_size(hw, &period, nullptr);
        snd_pcm_hw_params_get_rate(hw, &rate, nullptr);
        snd_pcm_hw_params_get_channels(hw, &channels);

        if (config_.sample_rate > 0 && rate != config_.sample_rate) {
            std::cout << "Sample rate adjusted to " << rate << " Hz" << std::endl;
        }
        if (config_.period_size > 0 && period != config_.period_size) {
            std::cout << "Period size adjusted to " << period << " frames" << std::endl;
        }

        config_.sample_rate = rate;
        config_.channels = channels;
        config_.period_size = static_cast<unsigned int>(period);
        config_.num_periods = periods;

        std::cout << "ALSA capture on " << config_.device_name << ": " << channels << " ch, " << rate
                  << " Hz, " << period << " frames/period (" << (1000.0f * period / rate) << " ms)"
                  << (format_ == SND_PCM_FORMAT_S16_LE ? ", 16-bit" : "") << std::endl;
        return true;
    }

    void release() {
        opened_ = false;
        if (pcm_) {
            snd_pcm_close(pcm_);
            pcm_ = nullptr;
        }
    }

    void capture_loop() {
        if (config_.use_realtime_priority) {
            mlockall(MCL_CURRENT | MCL_FUTURE);
        }

        const snd_pcm_uframes_t period = config_.period_size;
        const std::size_t samples = period * config_.channels;
        const bool is_float = format_ == SND_PCM_FORMAT_FLOAT_LE;
        std::vector<float> frames(samples);
        std::vector<int16_t> raw(is_float ? 0 : samples);

        while (running_.load()) {
            const auto t0 = std::chrono::steady_clock::now();
            const snd_pcm_sframes_t got = is_float ? snd_pcm_readi(pcm_, frames.data(), period)
                                                   : snd_pcm_readi(pcm_, raw.data(), period);
            if (got == -EAGAIN) {
                continue;
            }
            if (got == -EPIPE) {
                // Overrun: count it and recover
                ++xruns_;
                snd_pcm_prepare(pcm_);
                continue;
            }
            if (got < 0) {
                std::cerr << "ALSA read error: " << snd_strerror(static_cast<int>(got)) << std::endl;
                break;
            }
            if (got == 0 || !callback_) {
                continue;
            }

            if (!is_float) {
                const std::size_t n = static_cast<std::size_t>(got) * config_.channels;
                for (std::size_t i = 0; i < n; ++i) frames[i] = raw[i] * kS16Scale;
            }
            callback_(frames.data(), static_cast<int>(got));
            record_latency(std::chrono::steady_clock::now() - t0);
        }

        if (config_.use_realtime_priority) {
            munlockall();
        }
    }

    void record_latency(std::chrono::steady_clock::duration elapsed) {
        const float ms = std::chrono::duration<float, std::milli>(elapsed).count();
        float lo = min_ms_.load();
        while (ms < lo && !min_ms_.compare_exchange_weak(lo, ms)) {}
        float hi = max_ms_.load();
        while (ms > hi && !max_ms_.compare_exchange_weak(hi, ms)) {}
        total_ms_.store(total_ms_.load() + ms);
        ++callback_count_;
    }

    void raise_priority() {
        sched_param param{};
        param.sched_priority = sched_get_priority_max(SCHED_FIFO) - 1;
        if (pthread_setschedparam(thread_.native_handle(), SCHED_FIFO, &param) != 0) {
            std::cerr << "Warning: could not set realtime priority for capture (needs rtprio in limits.conf)"
                      << std::endl;
        }
    }

    AudioConfig config_;
    snd_pcm_t* pcm_ = nullptr;
    snd_pcm_format_t format_ = SND_PCM_FORMAT_FLOAT_LE;
    std::atomic<bool> opened_{false};
    std::atomic<bool> running_{false};
    std::thread thread_;
    ProcessCallback callback_;

    std::atomic<float> min_ms_{1000.0f};
    std::atomic<float> max_ms_{0.0f};
    std::atomic<float> total_ms_{0.0f};
    std::atomic<int> callback_count_{0};
    std::atomic<int> xruns_{0};
};

std::unique_ptr<IAudioInput> createAudioInput(const AudioConfig& config) {
    return std::make_unique<AlsaAudioInput>(config);
}

} // namespace scaletuner
