/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/relay/session_log.hpp"

#include "relaykit/core/clock.hpp"
#include "relaykit/core/log.hpp"

std::string rly::SessionReport::to_string() const {
    return fmt::format(
        "records={}, mean_delay={:.3f} ms, min_delay={:.3f} ms, max_delay={:.3f} ms, stop_reason={}",
        records.size(), delay_stats.average(), delay_stats.min(), delay_stats.max(), rly::to_string(stop_reason)
    );
}

void rly::SessionLog::start() {
    std::lock_guard notify_lock(subscribers_mutex_);
    {
        std::lock_guard lock(mutex_);
        if (active_) {
            RLY_WARNING("Session restarted, discarding {} records", records_.size());
        }
        records_.clear();
        delay_samples_.clear();
        delay_stats_.reset();
        started_at_ = clock::now_wall_seconds();
        active_ = true;
    }

    RLY_INFO("Session started");

    subscribers_.notify(&Subscriber::on_session_started);
}

std::optional<uint64_t> rly::SessionLog::append(LatencyRecord record) {
    std::lock_guard notify_lock(subscribers_mutex_);
    {
        std::lock_guard lock(mutex_);
        if (!active_) {
            return std::nullopt;
        }
        record.sequence_number = records_.size() + 1;
        delay_samples_.push_back(record.delay_ms);
        delay_stats_.add(record.delay_ms);
        records_.push_back(record);
    }

    subscribers_.notify(&Subscriber::on_record_appended, record);

    return record.sequence_number;
}

std::optional<rly::SessionReport> rly::SessionLog::stop(const StopReason reason) {
    std::lock_guard notify_lock(subscribers_mutex_);

    SessionReport report;
    {
        std::lock_guard lock(mutex_);
        if (!active_) {
            return std::nullopt;
        }
        active_ = false;

        report.started_at = started_at_;
        report.records = records_;
        report.delay_stats = delay_stats_;
    }
    report.stopped_at = clock::now_wall_seconds();
    report.stop_reason = reason;

    RLY_INFO("Session stopped ({}): {}", to_string(reason), report.to_string());

    subscribers_.notify(&Subscriber::on_session_stopped, report);

    return report;
}

bool rly::SessionLog::is_active() const {
    std::lock_guard lock(mutex_);
    return active_;
}

size_t rly::SessionLog::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

std::vector<rly::LatencyRecord> rly::SessionLog::records() const {
    std::lock_guard lock(mutex_);
    return records_;
}

std::vector<double> rly::SessionLog::delay_samples() const {
    std::lock_guard lock(mutex_);
    return delay_samples_;
}

rly::RunningStats rly::SessionLog::delay_stats() const {
    std::lock_guard lock(mutex_);
    return delay_stats_;
}

bool rly::SessionLog::subscribe(Subscriber* subscriber) {
    std::lock_guard notify_lock(subscribers_mutex_);
    return subscribers_.add(subscriber);
}

bool rly::SessionLog::unsubscribe(const Subscriber* subscriber) {
    std::lock_guard notify_lock(subscribers_mutex_);
    return subscribers_.remove(subscriber);
}
