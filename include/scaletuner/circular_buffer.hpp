#pragma once

#include "scaletuner/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <vector>

namespace scaletuner {

// Thread-safe ring buffer of fixed-width rows (e.g. interleaved audio frames).
//
// Writes overwrite the oldest rows once the buffer is full. Reads do not
// consume anything: read() returns the retained rows oldest first as one
// contiguous array. That array is cached and handed out again until the
// next write or clear().
//
// Without a fill value, a buffer that has not wrapped yet reads back only the
// rows written so far. With a fill value the whole capacity is always
// returned, padded at the end.
template<typename T>
class CircularBuffer {
public:
    using Snapshot = std::shared_ptr<const std::vector<T>>;

    explicit CircularBuffer(std::size_t capacity, std::size_t width = 1,
                            std::optional<double> fill_value = std::nullopt)
        : capacity_(capacity), width_(width) {
        if (capacity_ == 0 || width_ == 0) {
            throw ConfigError("circular buffer capacity and width must be positive");
        }
        if (fill_value) {
            if (std::is_integral<T>::value && std::isnan(*fill_value)) {
                throw ConfigError("cannot pad an integral circular buffer with NaN");
            }
            fill_ = static_cast<T>(*fill_value);
        }
        data_.assign(capacity_ * width_, fill_ ? *fill_ : T{});
    }

    CircularBuffer(const CircularBuffer&) = delete;
    CircularBuffer& operator=(const CircularBuffer&) = delete;

    // Append `num_rows` rows of `width()` values each.
    void write(const T* rows, std::size_t num_rows) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_rows(rows, num_rows);
        cached_.reset();
    }

    void write(const std::vector<T>& values) {
        if (values.size() % width_ != 0) {
            throw ConfigError("write length is not a multiple of the row width");
        }
        write(values.data(), values.size() / width_);
    }

    void append(T value) {
        if (width_ != 1) {
            throw ConfigError("append() needs a buffer of width 1");
        }
        write(&value, 1);
    }

    Snapshot read() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cached_) {
            cached_ = std::make_shared<const std::vector<T>>(read_rows());
        }
        return cached_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::fill(data_.begin(), data_.end(), fill_ ? *fill_ : T{});
        head_ = 0;
        full_ = false;
        cached_.reset();
    }

    // Number of rows read() returns.
    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return (full_ || fill_) ? capacity_ : head_;
    }

    bool empty() const { return size() == 0; }

    bool full() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return full_;
    }

    std::size_t capacity() const { return capacity_; }
    std::size_t width() const { return width_; }
    const std::optional<T>& fill_value() const { return fill_; }

private:
    void write_rows(const T* rows, std::size_t num_rows) {
        if (num_rows == 0) return;
        const std::size_t n = num_rows * width_;

        // Only the tail fits: replace everything.
        if (num_rows >= capacity_) {
            std::copy(rows + (num_rows - capacity_) * width_, rows + n, data_.begin());
            head_ = 0;
            full_ = true;
            return;
        }

        const std::size_t free_rows = capacity_ - head_;
        if (num_rows <= free_rows) {
            std::copy(rows, rows + n, data_.begin() + head_ * width_);
            head_ += num_rows;
            if (head_ == capacity_) {
                head_ = 0;
                full_ = true;
            }
            return;
        }

        // Wrap around: fill to the end, continue from the start.
        const std::size_t split = free_rows * width_;
        std::copy(rows, rows + split, data_.begin() + head_ * width_);
        std::copy(rows + split, rows + n, data_.begin());
        head_ = num_rows - free_rows;
        full_ = true;
    }

    std::vector<T> read_rows() const {
        if (full_) {
            if (head_ == 0) return data_;
            std::vector<T> out(data_.size());
            std::rotate_copy(data_.begin(), data_.begin() + head_ * width_, data_.end(), out.begin());
            return out;
        }
        if (fill_) return data_;
        return std::vector<T>(data_.begin(), data_.begin() + head_ * width_);
    }

    const std::size_t capacity_;
    const std::size_t width_;
    std::optional<T> fill_;
    std::vector<T> data_;
    std::size_t head_ = 0;
    bool full_ = false;

    mutable std::mutex mutex_;
    mutable Snapshot cached_;
};

} // namespace scaletuner
