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

#include "relaykit/core/log.hpp"

#include <boost/asio.hpp>

#include <optional>
#include <thread>
#include <vector>

namespace rly {

/**
 * Helper class to run a boost::asio::io_context on one or more threads.
 */
class IoContextRunner {
  public:
    IoContextRunner() = default;

    /**
     * Constructs a runner with a specific number of threads.
     * @param num_threads Number of threads to run the io_context on.
     */
    explicit IoContextRunner(const size_t num_threads) :
        num_threads_(num_threads), io_context_(static_cast<int>(num_threads)) {}

    ~IoContextRunner() {
        stop();
    }

    IoContextRunner(const IoContextRunner&) = delete;
    IoContextRunner& operator=(const IoContextRunner&) = delete;

    IoContextRunner(IoContextRunner&&) = delete;
    IoContextRunner& operator=(IoContextRunner&&) = delete;

    /**
     * Starts the threads, returning immediately. The threads keep running when there is no work, until stop() is
     * called.
     */
    void start() {
        if (is_running()) {
            return;
        }

        io_context_.restart();
        work_guard_.emplace(boost::asio::make_work_guard(io_context_));
        threads_.reserve(num_threads_);

        for (size_t i = 0; i < num_threads_; i++) {
            threads_.emplace_back([this] {
                while (true) {
                    try {
                        io_context_.run();
                        break;
                    } catch (const std::exception& e) {
                        RLY_ERROR("Exception thrown on io_context runner thread: {}", e.what());
                    }
                }
            });
        }
    }

    /**
     * Stops the runner and waits for all threads to finish. Handlers which didn't run yet are not run.
     */
    void stop() {
        work_guard_.reset();
        io_context_.stop();
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads_.clear();
    }

    /**
     * @return True if the runner is currently running, false otherwise.
     */
    [[nodiscard]] bool is_running() const {
        return !threads_.empty();
    }

    /**
     * @return The io_context used by this runner.
     */
    boost::asio::io_context& io_context() {
        return io_context_;
    }

  private:
    const size_t num_threads_ {1};
    boost::asio::io_context io_context_ {1};
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> threads_ {};
};

}  // namespace rly
