#include "scaletuner/errors.hpp"
#include "scaletuner/pitch_estimator.hpp"
#include "signals.hpp"

#include <catch2/catch.hpp>

#include <vector>

using namespace scaletuner;
using scaletuner::test::sine;

namespace {

constexpr float kFs = 48000.0f;
constexpr int kBlockLen = 4800;

Block tone_block(float freq, std::size_t index, double t) {
    return Block(sine(freq, kFs, kBlockLen, static_cast<int>(index) * kBlockLen), index, t, kFs);
}

Block silent_block(std::size_t index, double t) {
    return Block(std::vector<float>(kBlockLen, 0.0f), index, t, kFs);
}

} // namespace

TEST_CASE("lag grid follows sample rate and frequency range", "[pitch]") {
    PitchEstimator est(kFs);
    CHECK(est.num_lags() == 1200);
    CHECK(est.lag_min() == 32);
    CHECK(est.lag_max() == 800);

    est.set_frequency_range(100.0f, 1000.0f);
    CHECK(est.lag_min() == 48);
    CHECK(est.lag_max() == 480);

    est.set_samplerate(44100.0f);
    CHECK(est.num_lags() == 1103);
    CHECK(est.lag_min() == 44);
    CHECK(est.lag_max() == 441);
}

TEST_CASE("invalid parameters are configuration errors", "[pitch]") {
    CHECK_THROWS_AS(PitchEstimator(0.0f), ConfigError);

    PitchEstimator est(kFs);
    CHECK_THROWS_AS(est.set_frequency_range(500.0f, 100.0f), ConfigError);
    CHECK_THROWS_AS(est.set_frequency_range(0.0f, 100.0f), ConfigError);
    CHECK_THROWS_AS(est.set_frequency_range(30.0f, 1500.0f), ConfigError);
    CHECK_THROWS_AS(est.set_samplerate(-1.0f), ConfigError);

    PitchConfig bad;
    bad.interp_half_width = 0;
    CHECK_THROWS_AS(est.set_config(bad), ConfigError);
    bad = PitchConfig{};
    bad.interp_upsample_fac = 0;
    CHECK_THROWS_AS(est.set_config(bad), ConfigError);
    bad = PitchConfig{};
    bad.onset_thresh = -0.1f;
    CHECK_THROWS_AS(est.set_config(bad), ConfigError);

    // A rejected config leaves the previous one in place
    CHECK(est.config().interp_half_width == 10);
    CHECK_THROWS_AS(PitchEstimator(kFs, PitchConfig{}, 0), ConfigError);
}

TEST_CASE("search range reaches down to the lowest analyzed lag", "[pitch]") {
    PitchEstimator est(kFs);
    est.set_frequency_range(40.0f, 1500.0f);
    CHECK(est.lag_max() == est.num_lags());
    CHECK_THROWS_AS(est.set_frequency_range(39.9f, 1500.0f), ConfigError);
    CHECK(est.config().fmin == 40.0f);
}

TEST_CASE("steady tone is detected and tracked", "[pitch]") {
    PitchEstimator est(kFs);

    Block first = tone_block(440.0f, 0, 0.1);
    est.process(first);
    REQUIRE(first.tunable);
    CHECK(first.ix_best == 109);
    CHECK(first.pitch == Approx(440.0f).margin(0.5));
    CHECK(first.dn_score < 0.15f);
    CHECK_FALSE(first.minima.empty());
    CHECK(first.d.size() == 1200);
    CHECK(est.state() == OnsetState::OnsetActive);
    CHECK(est.onset_lag() == 109);
    CHECK(est.onset_time() == Approx(0.1));

    for (std::size_t i = 1; i < 4; ++i) {
        Block b = tone_block(440.0f, i, 0.1 * (i + 1));
        est.process(b);
        REQUIRE(b.tunable);
        CHECK(b.pitch == Approx(440.0f).margin(0.5));
    }
    CHECK(est.pitch_history().size() == 4);
    CHECK(est.lag_history().read()->back() == 109);
    CHECK(est.onset_time() == Approx(0.1));
}

TEST_CASE("onset needs a candidate below the onset threshold", "[pitch]") {
    PitchConfig config;
    config.onset_thresh = 0.0f;
    PitchEstimator est(kFs, config);

    Block b = tone_block(440.0f, 0, 0.0);
    est.process(b);
    // Candidates pass min_thresh but nothing starts a tone
    CHECK_FALSE(b.minima.empty());
    CHECK_FALSE(b.tunable);
    CHECK(b.pitch == -1.0f);
    CHECK(est.state() == OnsetState::NoOnset);
    CHECK(est.pitch_history().empty());
}

TEST_CASE("silence is not tunable and ends a tone", "[pitch]") {
    PitchEstimator est(kFs);

    Block quiet = silent_block(0, 0.1);
    est.process(quiet);
    CHECK_FALSE(quiet.tunable);
    CHECK(quiet.minima.empty());
    CHECK(est.state() == OnsetState::NoOnset);

    Block tone = tone_block(440.0f, 1, 0.2);
    est.process(tone);
    REQUIRE(est.state() == OnsetState::OnsetActive);
    REQUIRE(est.pitch_history().size() == 1);

    Block after = silent_block(2, 0.3);
    est.process(after);
    CHECK_FALSE(after.tunable);
    CHECK(after.pitch == -1.0f);
    CHECK(est.state() == OnsetState::NoOnset);
    CHECK(est.offset_time() == Approx(0.3));
    CHECK(est.onset_lag() == 0);
    CHECK(est.pitch_history().empty());
    CHECK(est.lag_history().empty());
    CHECK(est.score_history().empty());
}

TEST_CASE("tones outside the search range are ignored", "[pitch]") {
    PitchEstimator est(kFs);
    Block low = tone_block(50.0f, 0, 0.0);
    est.process(low);
    CHECK(low.minima.empty());
    CHECK_FALSE(low.tunable);

    est.set_frequency_range(500.0f, 1500.0f);
    Block a4 = tone_block(440.0f, 1, 0.1);
    est.process(a4);
    CHECK_FALSE(a4.tunable);
}

TEST_CASE("octave jump is corrected back to the reference lag", "[pitch]") {
    PitchEstimator est(kFs);

    Block onset = tone_block(220.0f, 0, 0.1);
    est.process(onset);
    REQUIRE(onset.tunable);
    REQUIRE(est.onset_lag() == 218);

    // 440 Hz has minima at 109 and 218; 109 looks best but is one octave off.
    Block jump = tone_block(440.0f, 1, 0.2);
    est.process(jump);
    REQUIRE(jump.tunable);
    CHECK(jump.ix_best == 218);
    CHECK(jump.pitch == Approx(220.0f).margin(0.5));
    CHECK(est.state() == OnsetState::OnsetActive);
    CHECK(est.onset_lag() == 218);
    CHECK(est.pitch_history().size() == 2);
}

TEST_CASE("unrelated new pitch is followed without moving the reference", "[pitch]") {
    PitchEstimator est(kFs);

    Block a4 = tone_block(440.0f, 0, 0.1);
    est.process(a4);
    REQUIRE(est.onset_lag() == 109);

    Block e4 = tone_block(330.0f, 1, 0.2);
    est.process(e4);
    REQUIRE(e4.tunable);
    CHECK(e4.ix_best == 145);
    CHECK(e4.pitch == Approx(330.0f).margin(0.5));
    CHECK(est.onset_lag() == 109);
    CHECK(est.pitch_history().size() == 2);
}

TEST_CASE("faded reference forces an offset and a fresh onset", "[pitch]") {
    PitchConfig config;
    config.offset_thresh_2 = 0.0f;
    PitchEstimator est(kFs, config);

    Block onset = tone_block(220.0f, 0, 0.1);
    est.process(onset);
    REQUIRE(est.onset_lag() == 218);

    Block jump = tone_block(440.0f, 1, 0.2);
    est.process(jump);
    REQUIRE(jump.tunable);
    CHECK(jump.ix_best == 109);
    CHECK(jump.pitch == Approx(440.0f).margin(0.5));
    CHECK(est.state() == OnsetState::OnsetActive);
    CHECK(est.onset_lag() == 109);
    CHECK(est.onset_time() == Approx(0.2));
    // Offset cleared the history before this block was added
    CHECK(est.pitch_history().size() == 1);
}

TEST_CASE("forced offset without a new onset still reports the block", "[pitch]") {
    PitchEstimator est(kFs);

    Block onset = tone_block(220.0f, 0, 0.1);
    est.process(onset);
    REQUIRE(est.state() == OnsetState::OnsetActive);

    PitchConfig config = est.config();
    config.offset_thresh_2 = 0.0f;
    config.onset_thresh = 0.0f;
    est.set_config(config);

    Block jump = tone_block(440.0f, 1, 0.2);
    est.process(jump);
    CHECK(jump.tunable);
    CHECK(jump.ix_best == 109);
    CHECK(est.state() == OnsetState::NoOnset);
    CHECK(est.offset_time() == Approx(0.2));
    CHECK(est.pitch_history().size() == 1);
}

TEST_CASE("reset drops tracking state", "[pitch]") {
    PitchEstimator est(kFs);
    Block b = tone_block(440.0f, 0, 0.1);
    est.process(b);
    REQUIRE(est.state() == OnsetState::OnsetActive);

    est.reset();
    CHECK(est.state() == OnsetState::NoOnset);
    CHECK(est.onset_lag() == 0);
    CHECK(est.pitch_history().empty());
}

TEST_CASE("sample rate change restarts tracking", "[pitch]") {
    PitchEstimator est(96000.0f);
    Block high(sine(440.0f, 96000.0f, 9600), 0, 0.1, 96000.0);
    est.process(high);
    REQUIRE(high.tunable);
    CHECK(high.ix_best == 218);
    REQUIRE(est.onset_lag() == 218);

    est.set_samplerate(96000.0f);
    CHECK(est.state() == OnsetState::OnsetActive);

    est.set_samplerate(kFs);
    CHECK(est.state() == OnsetState::NoOnset);
    CHECK(est.onset_lag() == 0);
    CHECK(est.lag_history().empty());

    // Same tone at the new rate must not snap to the old reference lag
    Block low = tone_block(440.0f, 1, 0.2);
    est.process(low);
    REQUIRE(low.tunable);
    CHECK(low.ix_best == 109);
    CHECK(low.pitch == Approx(440.0f).margin(0.5));
    CHECK(est.onset_lag() == 109);
}
