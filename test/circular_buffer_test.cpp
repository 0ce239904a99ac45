#include "scaletuner/circular_buffer.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <cmath>
#include <thread>
#include <vector>

using scaletuner::CircularBuffer;
using scaletuner::ConfigError;

TEST_CASE("unpadded buffer reads back only written rows", "[circular_buffer]") {
    CircularBuffer<int> buf(5);
    REQUIRE(buf.empty());
    REQUIRE(buf.read()->empty());

    buf.write(std::vector<int>{0, 1, 2});
    CHECK(buf.size() == 3);
    CHECK_FALSE(buf.full());
    CHECK(*buf.read() == std::vector<int>{0, 1, 2});

    buf.write(std::vector<int>{3, 4, 5, 6});
    CHECK(buf.size() == 5);
    CHECK(buf.full());
    CHECK(*buf.read() == std::vector<int>{2, 3, 4, 5, 6});
}

TEST_CASE("padded buffer always reads full capacity", "[circular_buffer]") {
    CircularBuffer<int> buf(5, 1, 0.0);
    CHECK(buf.size() == 5);
    CHECK(*buf.read() == std::vector<int>{0, 0, 0, 0, 0});

    buf.write(std::vector<int>{0, 1, 2});
    CHECK(*buf.read() == std::vector<int>{0, 1, 2, 0, 0});

    buf.write(std::vector<int>{3, 4, 5, 6});
    CHECK(*buf.read() == std::vector<int>{2, 3, 4, 5, 6});
}

TEST_CASE("write that exactly fills the buffer wraps the head", "[circular_buffer]") {
    CircularBuffer<int> buf(4);
    buf.write(std::vector<int>{1, 2, 3, 4});
    CHECK(buf.full());
    CHECK(*buf.read() == std::vector<int>{1, 2, 3, 4});

    buf.append(5);
    CHECK(*buf.read() == std::vector<int>{2, 3, 4, 5});
}

TEST_CASE("oversized write keeps only the tail", "[circular_buffer]") {
    CircularBuffer<int> buf(5);
    buf.write(std::vector<int>{1, 2});
    std::vector<int> big;
    for (int i = 0; i < 12; ++i) big.push_back(i);
    buf.write(big);
    CHECK(*buf.read() == std::vector<int>{7, 8, 9, 10, 11});

    // And continues correctly afterwards
    buf.write(std::vector<int>{12, 13});
    CHECK(*buf.read() == std::vector<int>{9, 10, 11, 12, 13});
}

TEST_CASE("total written beyond capacity returns the last capacity values", "[circular_buffer]") {
    CircularBuffer<float> buf(7);
    std::vector<float> all;
    int next = 0;
    for (int burst : {3, 1, 5, 2, 6, 4}) {
        std::vector<float> chunk;
        for (int i = 0; i < burst; ++i) chunk.push_back(static_cast<float>(next++));
        all.insert(all.end(), chunk.begin(), chunk.end());
        buf.write(chunk);
    }
    REQUIRE(buf.size() == 7);
    std::vector<float> expected(all.end() - 7, all.end());
    CHECK(*buf.read() == expected);
}

TEST_CASE("rows of several values stay together", "[circular_buffer]") {
    CircularBuffer<float> buf(3, 2);
    buf.write(std::vector<float>{1, 2, 3, 4});
    CHECK(buf.size() == 2);
    CHECK(*buf.read() == std::vector<float>{1, 2, 3, 4});

    buf.write(std::vector<float>{5, 6, 7, 8});
    CHECK(*buf.read() == std::vector<float>{3, 4, 5, 6, 7, 8});

    CHECK_THROWS_AS(buf.write(std::vector<float>{1, 2, 3}), ConfigError);
    CHECK_THROWS_AS(buf.append(1.0f), ConfigError);
}

TEST_CASE("repeated reads share one snapshot until the next write", "[circular_buffer]") {
    CircularBuffer<int> buf(4);
    buf.write(std::vector<int>{1, 2});
    auto a = buf.read();
    auto b = buf.read();
    CHECK(a.get() == b.get());

    buf.append(3);
    auto c = buf.read();
    CHECK(c.get() != a.get());
    // Earlier snapshots are not modified by later writes
    CHECK(*a == std::vector<int>{1, 2});
    CHECK(*c == std::vector<int>{1, 2, 3});
}

TEST_CASE("clear empties the buffer and drops the snapshot", "[circular_buffer]") {
    CircularBuffer<int> plain(3);
    plain.write(std::vector<int>{1, 2, 3, 4});
    auto before = plain.read();
    plain.clear();
    CHECK(plain.empty());
    CHECK_FALSE(plain.full());
    CHECK(plain.read()->empty());
    CHECK(plain.read().get() != before.get());

    CircularBuffer<float> padded(3, 1, -1.0);
    padded.write(std::vector<float>{4, 5});
    padded.clear();
    CHECK(*padded.read() == std::vector<float>{-1, -1, -1});
}

TEST_CASE("invalid construction is a configuration error", "[circular_buffer]") {
    CHECK_THROWS_AS(CircularBuffer<int>(0), ConfigError);
    CHECK_THROWS_AS(CircularBuffer<int>(4, 0), ConfigError);
    CHECK_THROWS_AS(CircularBuffer<int>(4, 1, std::nan("")), ConfigError);

    CircularBuffer<float> nan_padded(2, 1, std::nan(""));
    REQUIRE(nan_padded.fill_value().has_value());
    CHECK(std::isnan(*nan_padded.fill_value()));
    CHECK(std::isnan(nan_padded.read()->at(0)));
}

TEST_CASE("concurrent writes and reads see whole bursts", "[circular_buffer]") {
    const int capacity = 64;
    CircularBuffer<int> buf(capacity);
    std::vector<int> seed(capacity);
    for (int i = 0; i < capacity; ++i) seed[i] = i;
    buf.write(seed);

    std::atomic<bool> done(false);
    std::thread writer([&] {
        int next = capacity;
        for (int burst = 0; burst < 2000; ++burst) {
            std::vector<int> chunk(1 + burst % 7);
            for (int& v : chunk) v = next++;
            buf.write(chunk);
        }
        done = true;
    });

    bool consistent = true;
    while (!done.load()) {
        auto snap = buf.read();
        if (snap->size() != static_cast<size_t>(capacity)) consistent = false;
        for (size_t i = 1; i < snap->size(); ++i) {
            if ((*snap)[i] != (*snap)[i - 1] + 1) consistent = false;
        }
    }
    writer.join();
    CHECK(consistent);
}
