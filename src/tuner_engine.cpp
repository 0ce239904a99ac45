#include "scaletuner/tuner_engine.hpp"
#include "scaletuner/errors.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace scaletuner {

TunerEngine::TunerEngine(audio::InputStream& stream, PitchEstimator& pitch,
                         IntonationEstimator& intonation, Clock& clock, bool verbose)
    : stream_(stream), pitch_(pitch), intonation_(intonation), clock_(clock), verbose_(verbose) {}

TunerEngine::~TunerEngine() {
    stop();
}

std::shared_ptr<const Block> TunerEngine::process_once() {
    const audio::InputStream::Frames frames = stream_.read_frames();
    if (!frames.samples || frames.samples->empty() || frames.channels == 0 || frames.sample_rate == 0) {
        return nullptr;
    }

    // Channel 0 of the interleaved frames
    const std::vector<float>& interleaved = *frames.samples;
    const std::size_t num_frames = interleaved.size() / frames.channels;
    std::vector<float> mono(num_frames);
    for (std::size_t i = 0; i < num_frames; ++i) {
        mono[i] = interleaved[i * frames.channels];
    }

    apply_pending();
    if (pitch_.samplerate() != static_cast<float>(frames.sample_rate)) {
        pitch_.set_samplerate(static_cast<float>(frames.sample_rate));
    }

    const double t = clock_.running() ? clock_.elapsed() : 0.0;
    auto block = std::make_shared<Block>(std::move(mono), block_count_.load(), t,
                                         static_cast<double>(frames.sample_rate));
    block->rms = compute_rms(block->data());

    pitch_.process(*block);
    intonation_.process(*block);
    ++block_count_;

    std::vector<Observer> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_ = block;
        observers = observers_;
    }
    for (const auto& observer : observers) {
        observer(*block);
    }
    return block;
}

bool TunerEngine::start(std::chrono::milliseconds interval, std::chrono::milliseconds warmup) {
    if (running_.load()) {
        return true;
    }
    if (!stream_.start()) {
        std::cerr << "Tuner engine: could not start input stream " << stream_.name() << std::endl;
        return false;
    }
    if (clock_.ready()) {
        clock_.start();
    }
    running_ = true;
    worker_ = std::thread(&TunerEngine::run, this, interval, warmup);
    if (verbose_) {
        std::cout << "Tuner engine started: interval " << interval.count() << " ms, warm-up "
                  << warmup.count() << " ms" << std::endl;
    }
    return true;
}

void TunerEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!running_.load() && !worker_.joinable()) {
            return;
        }
        running_ = false;
    }
    wait_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    stream_.stop();
    if (verbose_) {
        std::cout << "Tuner engine stopped after " << block_count_.load() << " blocks" << std::endl;
    }
}

void TunerEngine::add_observer(Observer observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

std::shared_ptr<const Block> TunerEngine::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

void TunerEngine::set_pitch_config(const PitchConfig& config) {
    PitchEstimator::validate(config);
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.pitch_config = config;
    pending_.frequency_range.reset();
}

void TunerEngine::set_frequency_range(float fmin, float fmax) {
    PitchConfig range;
    range.fmin = fmin;
    range.fmax = fmax;
    PitchEstimator::validate(range);
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.frequency_range = std::make_pair(fmin, fmax);
}

void TunerEngine::set_scale(std::shared_ptr<const Scale> scale) {
    if (!scale) {
        throw ConfigError("tuner engine needs a scale");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.scale = std::move(scale);
}

void TunerEngine::set_tuning_note(int degree) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.tuning_degree = degree;
    pending_.tuning_name.reset();
}

void TunerEngine::set_tuning_note(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.tuning_name = name;
    pending_.tuning_degree.reset();
}

void TunerEngine::set_tuning_pitch(float hz) {
    if (!(hz > 0.0f)) {
        throw ConfigError("tuning pitch must be positive");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.tuning_pitch = hz;
}

// Runs on the analysis thread, so the estimators are only touched there.
void TunerEngine::apply_pending() {
    PendingSettings pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(pending, pending_);
    }
    if (pending.pitch_config) {
        pitch_.set_config(*pending.pitch_config);
    }
    if (pending.frequency_range) {
        pitch_.set_frequency_range(pending.frequency_range->first, pending.frequency_range->second);
    }
    if (pending.scale) {
        intonation_.set_scale(std::move(pending.scale));
    }
    try {
        if (pending.tuning_degree) {
            intonation_.set_tuning_note(*pending.tuning_degree);
        } else if (pending.tuning_name) {
            intonation_.set_tuning_note(*pending.tuning_name);
        }
    } catch (const LookupError& e) {
        std::cerr << "Tuner engine: tuning note not applied: " << e.what() << std::endl;
    }
    if (pending.tuning_pitch) {
        intonation_.set_tuning_pitch(*pending.tuning_pitch);
    }
    if (verbose_ && (pending.pitch_config || pending.frequency_range || pending.scale ||
                     pending.tuning_degree || pending.tuning_name || pending.tuning_pitch)) {
        std::cout << "Tuner engine: settings applied (" << pitch_.config().fmin << "-"
                  << pitch_.config().fmax << " Hz, tuning note " << intonation_.tuning_note() << " at "
                  << intonation_.tuning_pitch() << " Hz)" << std::endl;
    }
}

bool TunerEngine::wait_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    return !wait_cv_.wait_for(lock, duration, [this] { return !running_.load(); });
}

void TunerEngine::run(std::chrono::milliseconds interval, std::chrono::milliseconds warmup) {
    if (!wait_for(warmup)) {
        return;
    }
    auto next = std::chrono::steady_clock::now();
    while (running_.load()) {
        try {
            process_once();
        } catch (const std::exception& e) {
            std::cerr << "Tuner engine: analysis failed: " << e.what() << std::endl;
        }
        next += interval;
        const auto now = std::chrono::steady_clock::now();
        if (next < now) {
            // Fell behind; skip ahead instead of bursting.
            next = now;
        }
        if (!wait_for(std::chrono::duration_cast<std::chrono::milliseconds>(next - now))) {
            return;
        }
    }
}

} // namespace scaletuner
