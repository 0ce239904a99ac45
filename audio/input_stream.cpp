#include "scaletuner/input_stream.hpp"
#include "scaletuner/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace scaletuner::audio {

InputStream::InputStream(const AudioConfig& config, double bufsecs, std::size_t bufsize,
                         BackendFactory factory)
    : factory_(std::move(factory)), verbose_(config.verbose) {
    if (!factory_) {
        throw ConfigError("input stream needs a capture backend factory");
    }
    std::unique_ptr<IAudioInput> session = factory_(config);
    const AudioConfig negotiated = session->get_config();
    if (bufsize == 0 && bufsecs > 0.0) {
        bufsize = static_cast<std::size_t>(std::lround(bufsecs * negotiated.sample_rate));
    }
    if (bufsize == 0) {
        throw ConfigError("input buffer length must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    backend_ = std::move(session);
    const unsigned long generation = generation_;
    backend_->set_process_callback([this, generation](const float* input, int num_frames) {
        on_audio(generation, input, num_frames);
    });
    buffer_ = std::make_unique<Buffer>(bufsize, std::max(1u, negotiated.channels), 0.0);
}

InputStream::~InputStream() {
    close();
}

void InputStream::install_backend(const AudioConfig& config, std::size_t buffer_frames) {
    backend_ = factory_(config);
    const unsigned long generation = generation_;
    backend_->set_process_callback([this, generation](const float* input, int num_frames) {
        on_audio(generation, input, num_frames);
    });
    const unsigned int width = std::max(1u, backend_->get_config().channels);
    buffer_ = std::make_unique<Buffer>(buffer_frames, width, 0.0);
}

void InputStream::on_audio(unsigned long generation, const float* input, int num_frames) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ || num_frames <= 0) {
        return;
    }
    buffer_->write(input, static_cast<std::size_t>(num_frames));
}

bool InputStream::reinitialize(const std::function<void(AudioConfig&)>& change) {
    AudioConfig config;
    bool was_active = false;
    std::size_t frames = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = backend_->get_config();
        if (change) change(config);
        was_active = backend_->is_running();
        frames = buffer_->capacity();
        ++generation_;
    }

    // The old capture thread may be blocked on mutex_ inside on_audio, so the
    // session is shut down without holding it. Anything it still delivers
    // carries the old generation and is dropped.
    backend_->close();

    bool ok = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        install_backend(config, frames);
        ok = !backend_->is_closed();
        if (ok && was_active) {
            ok = backend_->start();
        }
    }

    if (!ok) {
        std::cerr << "Failed to reinitialize input stream on " << config.device_name << std::endl;
    } else if (verbose_) {
        std::cout << "Input stream reinitialized: device=" << config.device_name
                  << ", channels=" << config.channels
                  << ", samplerate=" << config.sample_rate
                  << ", burstsize=" << config.period_size << std::endl;
    }
    return ok;
}

bool InputStream::start() {
    std::lock_guard<std::mutex> reconfig(reconfig_mutex_);
    if (backend_->is_closed() && !reinitialize(nullptr)) {
        return false;
    }
    if (verbose_) {
        std::cout << "Starting stream: device=" << backend_->get_config().device_name << std::endl;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->start();
}

void InputStream::stop() {
    std::lock_guard<std::mutex> reconfig(reconfig_mutex_);
    if (verbose_) {
        std::cout << "Stopping stream: device=" << backend_->get_config().device_name << std::endl;
    }
    backend_->stop();
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_->clear();
}

void InputStream::close() {
    std::lock_guard<std::mutex> reconfig(reconfig_mutex_);
    if (verbose_ && !backend_->is_closed()) {
        std::cout << "Closing stream: device=" << backend_->get_config().device_name << std::endl;
    }
    backend_->close();
}

InputStream::Buffer::Snapshot InputStream::read() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_->read();
}

InputStream::Frames InputStream::read_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Frames frames;
    frames.samples = buffer_->read();
    frames.channels = static_cast<unsigned int>(buffer_->width());
    frames.sample_rate = backend_->get_config().sample_rate;
    return frames;
}

std::string InputStream::name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->get_config().device_name;
}

bool InputStream::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->is_running();
}

bool InputStream::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->is_closed();
}

unsigned int InputStream::samplerate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->get_config().sample_rate;
}

unsigned int InputStream::channels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->get_config().channels;
}

unsigned int InputStream::burstsize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->get_config().period_size;
}

std::size_t InputStream::bufsize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_->capacity();
}

double InputStream::bufsecs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const unsigned int rate = backend_->get_config().sample_rate;
    return rate > 0 ? static_cast<double>(buffer_->capacity()) / rate : 0.0;
}

AudioConfig InputStream::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->get_config();
}

bool InputStream::set_device(const std::string& device_name) {
    std::lock_guard<std::mutex> reconfig(reconfig_mutex_);
    return reinitialize([&](AudioConfig& c) { c.device_name = device_name; });
}

bool InputStream::set_channels(unsigned int channels) {
    std::lock_guard<std::mutex> reconfig(reconfig_mutex_);
    return reinitialize([&](AudioConfig& c) { c.channels = channels; });
}

bool InputStream::set_samplerate(unsigned int sample_rate) {
    std::lock_guard<std::mutex> reconfig(reconfig_mutex_);
    return reinitialize([&](AudioConfig& c) { c.sample_rate = sample_rate; });
}

bool InputStream::set_burstsize(unsigned int frames) {
    std::lock_guard<std::mutex> reconfig(reconfig_mutex_);
    return reinitialize([&](AudioConfig& c) { c.period_size = frames; });
}

void InputStream::set_bufsize(std::size_t frames) {
    if (frames == 0) {
        throw ConfigError("input buffer length must be positive");
    }
    std::lock_guard<std::mutex> reconfig(reconfig_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_ = std::make_unique<Buffer>(frames, buffer_->width(), 0.0);
}

void InputStream::set_bufsecs(double secs) {
    if (!(secs > 0.0)) {
        throw ConfigError("input buffer length must be positive");
    }
    set_bufsize(static_cast<std::size_t>(std::lround(secs * samplerate())));
}

} // namespace scaletuner::audio
