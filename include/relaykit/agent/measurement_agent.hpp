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

#include "agent.hpp"
#include "hardware.hpp"

namespace rly::agent {

/**
 * Samples the sensor at a fixed interval and sends every sample, together with the latest position, to the relay.
 */
class MeasurementAgent final: public Agent {
  public:
    /**
     * @param config The configuration.
     * @param sensor The sensor to sample. Must outlive the agent.
     * @param positions The position source. Must outlive the agent.
     */
    MeasurementAgent(AgentConfig config, SensorProvider& sensor, PositionProvider& positions);
    ~MeasurementAgent() override;

    /**
     * Takes a sample and turns it into a packet, stamped with the current wall clock time.
     * @return The packet.
     */
    wire::TelemetryPacket make_packet();

    /**
     * @return The number of packets sent since construction.
     */
    [[nodiscard]] uint64_t num_packets_sent() const;

  protected:
    tl::expected<void, Error> serve(PeerConnection& connection) override;

  private:
    SensorProvider& sensor_;
    PositionProvider& positions_;
    std::atomic<uint64_t> num_packets_sent_ {0};
};

}  // namespace rly::agent
