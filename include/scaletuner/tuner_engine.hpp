#pragma once

#include "scaletuner/block.hpp"
#include "scaletuner/clock.hpp"
#include "scaletuner/input_stream.hpp"
#include "scaletuner/intonation_estimator.hpp"
#include "scaletuner/pitch_estimator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace scaletuner {

// Periodic analysis driver: snapshot the input buffer, wrap channel 0 in a
// Block and pass it through the pitch and intonation estimators.
//
// The engine only holds references; the stream, estimators and clock must
// outlive it. While the worker runs, the estimators belong to it: change their
// settings through the engine's setters, which take effect at the start of the
// next cycle.
class TunerEngine {
public:
    using Observer = std::function<void(const Block&)>;

    TunerEngine(audio::InputStream& stream, PitchEstimator& pitch,
                IntonationEstimator& intonation, Clock& clock, bool verbose = false);
    ~TunerEngine();

    TunerEngine(const TunerEngine&) = delete;
    TunerEngine& operator=(const TunerEngine&) = delete;

    // One analysis cycle. Returns nullptr when there was nothing to analyze.
    std::shared_ptr<const Block> process_once();

    // Starts the stream (and the clock if it is still ready), waits `warmup`
    // for the buffer to fill, then calls process_once() every `interval`.
    // Returns false when the stream could not be started.
    bool start(std::chrono::milliseconds interval = std::chrono::milliseconds(10),
               std::chrono::milliseconds warmup = std::chrono::milliseconds(400));
    void stop();
    bool is_running() const { return running_.load(); }

    // Called from the analysis thread after each processed block.
    void add_observer(Observer observer);

    std::shared_ptr<const Block> latest() const;
    std::size_t blocks_processed() const { return block_count_.load(); }

    // Staged settings. Values that are invalid on their own throw ConfigError
    // here; a tuning note the active scale lacks is logged and dropped when
    // it is applied.
    void set_pitch_config(const PitchConfig& config);
    void set_frequency_range(float fmin, float fmax);
    void set_scale(std::shared_ptr<const Scale> scale);
    void set_tuning_note(int degree);
    void set_tuning_note(const std::string& name);
    void set_tuning_pitch(float hz);

private:
    struct PendingSettings {
        std::optional<PitchConfig> pitch_config;
        std::optional<std::pair<float, float>> frequency_range;
        std::shared_ptr<const Scale> scale;
        std::optional<int> tuning_degree;
        std::optional<std::string> tuning_name;
        std::optional<float> tuning_pitch;
    };

    void apply_pending();
    void run(std::chrono::milliseconds interval, std::chrono::milliseconds warmup);
    // Returns false when stop() was requested during the wait.
    bool wait_for(std::chrono::milliseconds duration);

    audio::InputStream& stream_;
    PitchEstimator& pitch_;
    IntonationEstimator& intonation_;
    Clock& clock_;
    bool verbose_;

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> block_count_{0};
    std::thread worker_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    mutable std::mutex mutex_;
    std::shared_ptr<const Block> latest_;
    std::vector<Observer> observers_;
    PendingSettings pending_;
};

} // namespace scaletuner
