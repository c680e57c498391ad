/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "relaykit/core/format.hpp"

#include <algorithm>
#include <cstddef>
#include <string>

namespace rly {

/**
 * Keeps an incremental average together with the extremes of all added values. Unlike a sliding window nothing is
 * forgotten until reset() is called.
 */
class RunningStats {
  public:
    /**
     * Adds a new value.
     * @param value The value to add.
     */
    void add(const double value) {
        count_++;
        average_ += (value - average_) / static_cast<double>(count_);
        if (count_ == 1) {
            min_ = value;
            max_ = value;
            return;
        }
        min_ = std::min(min_, value);
        max_ = std::max(max_, value);
    }

    /**
     * @return The average of all values, or 0 if no values were added.
     */
    [[nodiscard]] double average() const {
        return average_;
    }

    /**
     * @return The smallest value, or 0 if no values were added.
     */
    [[nodiscard]] double min() const {
        return min_;
    }

    /**
     * @return The largest value, or 0 if no values were added.
     */
    [[nodiscard]] double max() const {
        return max_;
    }

    /**
     * @returns The number of values added.
     */
    [[nodiscard]] size_t count() const {
        return count_;
    }

    /**
     * @return The statistics as string.
     */
    [[nodiscard]] std::string to_string() const {
        return fmt::format("average={:.3f}, min={:.3f}, max={:.3f}, count={}", average_, min_, max_, count_);
    }

    /**
     * Forgets all values.
     */
    void reset() {
        count_ = 0;
        average_ = {};
        min_ = {};
        max_ = {};
    }

  private:
    double average_ {};
    double min_ {};
    double max_ {};
    size_t count_ {};
};

}  // namespace rly
