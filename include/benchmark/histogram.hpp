#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace econ {
namespace benchmark {

// Fixed-bucket histogram for latency measurement
// Pre-allocated, no heap allocation during recording
template <size_t NumBuckets = 1000, uint64_t MaxValue = 100000>
class Histogram {
public:
    static constexpr uint64_t BUCKET_SIZE = MaxValue / NumBuckets;

    Histogram() { reset(); }

    void reset() {
        buckets_.fill(0);
        count_ = 0;
        sum_ = 0;
        min_ = std::numeric_limits<uint64_t>::max();
        max_ = 0;
    }

    void record(uint64_t value) {
        size_t bucket = std::min<size_t>(value / BUCKET_SIZE, NumBuckets - 1);
        ++buckets_[bucket];
        ++count_;
        sum_ += value;
        min_ = std::min(min_, value);
        max_ = std::max(max_, value);
    }

    uint64_t count() const { return count_; }
    uint64_t min() const { return count_ > 0 ? min_ : 0; }
    uint64_t max() const { return max_; }

    double mean() const { return count_ > 0 ? static_cast<double>(sum_) / static_cast<double>(count_) : 0.0; }

    // Bucket midpoint of percentile p (0-100)
    uint64_t percentile(double p) const {
        if (count_ == 0)
            return 0;

        uint64_t target = static_cast<uint64_t>(static_cast<double>(count_) * p / 100.0);
        uint64_t cumulative = 0;
        for (size_t i = 0; i < NumBuckets; ++i) {
            cumulative += buckets_[i];
            if (cumulative >= target) {
                return i * BUCKET_SIZE + BUCKET_SIZE / 2;
            }
        }
        return MaxValue;
    }

    uint64_t p50() const { return percentile(50); }
    uint64_t p99() const { return percentile(99); }
    uint64_t p999() const { return percentile(99.9); }

    // Merge per-thread histograms after a concurrent run
    void merge(const Histogram& other) {
        for (size_t i = 0; i < NumBuckets; ++i) {
            buckets_[i] += other.buckets_[i];
        }
        count_ += other.count_;
        sum_ += other.sum_;
        if (other.count_ > 0) {
            min_ = std::min(min_, other.min_);
            max_ = std::max(max_, other.max_);
        }
    }

private:
    std::array<uint64_t, NumBuckets> buckets_;
    uint64_t count_;
    uint64_t sum_;
    uint64_t min_;
    uint64_t max_;
};

} // namespace benchmark
} // namespace econ
