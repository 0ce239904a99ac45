#include "scaletuner/clock.hpp"
#include "scaletuner/errors.hpp"

#include <catch2/catch.hpp>

#include <string>

using scaletuner::Clock;
using scaletuner::ClockState;
using scaletuner::StateError;

TEST_CASE("clock walks ready, running, stopped", "[clock]") {
    double now = 10.0;
    Clock clock(false, [&] { return now; });

    REQUIRE(clock.ready());
    CHECK_THROWS_AS(clock.elapsed(), StateError);
    CHECK_THROWS_AS(clock.stop(), StateError);

    CHECK(clock.start() == 0.0);
    CHECK(clock.running());
    CHECK_THROWS_AS(clock.start(), StateError);

    now = 11.5;
    CHECK(clock.elapsed() == Approx(1.5));
    CHECK(clock() == Approx(1.5));

    now = 12.0;
    CHECK(clock.stop() == Approx(2.0));
    CHECK(clock.stopped());
    CHECK_THROWS_AS(clock.elapsed(), StateError);
    CHECK_THROWS_AS(clock.start(), StateError);
}

TEST_CASE("reset returns to ready and can restart immediately", "[clock]") {
    double now = 0.0;
    Clock clock(true, [&] { return now; });
    REQUIRE(clock.running());

    now = 5.0;
    clock.stop();
    clock.reset();
    CHECK(clock.state() == ClockState::Ready);

    clock.reset(true);
    CHECK(clock.running());
    now = 7.0;
    CHECK(clock.elapsed() == Approx(2.0));
}

TEST_CASE("state error names the offending state", "[clock]") {
    Clock clock(false, [] { return 0.0; });
    try {
        clock.elapsed();
        FAIL("expected StateError");
    } catch (const StateError& e) {
        CHECK(std::string(e.what()).find("ready") != std::string::npos);
    }
    CHECK(std::string(scaletuner::to_string(ClockState::Running)) == "running");
}

TEST_CASE("default time source is monotonic", "[clock]") {
    Clock clock(true);
    const double a = clock.elapsed();
    const double b = clock.elapsed();
    CHECK(a >= 0.0);
    CHECK(b >= a);
}
