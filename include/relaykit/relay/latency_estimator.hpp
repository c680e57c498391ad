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

#include <string>

namespace rly {

/**
 * Result of the symmetric clock offset estimate for one relay cycle. All values are in seconds.
 */
struct LatencyEstimate {
    double offset {};         // Actuation agent clock minus measurement agent clock
    double corrected_t2 {};   // Receipt time expressed in the measurement agent's clock
    double one_way_delay {};  // corrected_t2 - t1

    /**
     * @return The one way delay in milliseconds.
     */
    [[nodiscard]] double delay_ms() const {
        return one_way_delay * 1000.0;
    }

    /**
     * The estimate is only as good as the assumption that both transit legs take equally long. A negative delay, or an
     * unreasonably large one, means the assumption was violated for this sample.
     * @param max_delay The largest delay considered plausible, in seconds.
     * @return True if the delay lies within [0, max_delay].
     */
    [[nodiscard]] bool is_plausible(const double max_delay) const {
        return one_way_delay >= 0.0 && one_way_delay <= max_delay;
    }

    [[nodiscard]] std::string to_string() const {
        return fmt::format(
            "offset={:.6f}s, corrected_t2={:.6f}, delay={:.3f}ms", offset, corrected_t2, delay_ms()
        );
    }
};

/**
 * Estimates the one way delay from four timestamps taken on unsynchronised clocks, assuming the forward and return
 * transit times are equal. Same arithmetic as the offset calculation of a request-response delay sequence.
 * The result is not clamped: implausible values are legitimate output and are returned as is.
 * @param t1 Send time of the telemetry packet, measurement agent clock.
 * @param t2 Receipt time of the command, actuation agent clock.
 * @param t3 Send time of the acknowledgement, actuation agent clock.
 * @param t4 Receipt time of the acknowledgement, relay clock.
 * @return The estimate.
 */
inline LatencyEstimate estimate_latency(const double t1, const double t2, const double t3, const double t4) {
    LatencyEstimate estimate;
    estimate.offset = ((t2 - t1) + (t3 - t4)) / 2.0;
    estimate.corrected_t2 = t2 - estimate.offset;
    estimate.one_way_delay = estimate.corrected_t2 - t1;
    return estimate;
}

}  // namespace rly
