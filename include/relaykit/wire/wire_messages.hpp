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

#include "role.hpp"
#include "relaykit/core/json.hpp"
#include "relaykit/core/string.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace rly::wire {

/**
 * Quality of a sensor sample as judged by the measurement agent.
 */
enum class DataStatus {
    proper,
    junk,
};

inline const char* to_string(const DataStatus status) {
    switch (status) {
        case DataStatus::proper:
            return "Proper";
        case DataStatus::junk:
            return "Junk";
    }
    return "";
}

/**
 * A satellite position fix in decimal degrees.
 */
struct Position {
    double latitude {};
    double longitude {};

    [[nodiscard]] std::string to_string() const {
        return fmt::format("({:.6f}, {:.6f})", latitude, longitude);
    }

    friend bool operator==(const Position& lhs, const Position& rhs) {
        return lhs.latitude == rhs.latitude && lhs.longitude == rhs.longitude;
    }

    friend bool operator!=(const Position& lhs, const Position& rhs) {
        return !(lhs == rhs);
    }
};

/**
 * First message on every connection, identifying the agent.
 */
struct Hello {
    static constexpr auto k_type = "hello";

    std::string agent_id;
    std::optional<Role> role;  // Optional on the wire, must match the listening port when present.
};

/**
 * One measurement sample, sent by the measurement agent.
 */
struct TelemetryPacket {
    static constexpr auto k_type = "sensor_data";

    double voltage {};
    DataStatus status {DataStatus::junk};
    std::optional<Position> position;
    double send_time {};  // t1, measurement agent clock
};

/**
 * Instruction forwarded to the actuation agent, derived 1:1 from a TelemetryPacket.
 */
struct Command {
    static constexpr auto k_type = "command";

    uint64_t request_id {};
    double voltage {};
    DataStatus status {DataStatus::junk};
};

/**
 * The actuation agent's report of what it did with a Command.
 */
struct Acknowledgement {
    static constexpr auto k_type = "actuator_status";

    std::optional<uint64_t> request_id;  // Echo of Command::request_id, absent for peers that don't echo it.
    double receipt_time {};              // t2, actuation agent clock
    double reply_send_time {};           // t3, actuation agent clock
    std::optional<double> applied_voltage;
    std::optional<Position> position;
};

namespace detail {

    inline const boost::json::object& as_message_object(const boost::json::value& jv, const char* expected_type) {
        const auto* obj = jv.if_object();
        if (obj == nullptr) {
            throw std::invalid_argument("message is not a json object");
        }
        if (const auto* type = obj->if_contains("type")) {
            const auto* str = type->if_string();
            if (str == nullptr || *str != expected_type) {
                throw std::invalid_argument(fmt::format("expected message of type '{}'", expected_type));
            }
        }
        return *obj;
    }

    inline std::optional<Position> position_from_member(const boost::json::object& obj, const std::string_view key) {
        const auto* v = obj.if_contains(key);
        if (v == nullptr || v->is_null()) {
            return std::nullopt;
        }
        return boost::json::value_to<Position>(*v);
    }

    inline boost::json::value position_to_value(const std::optional<Position>& position);

}  // namespace detail

inline void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const DataStatus& status) {
    jv = to_string(status);
}

inline DataStatus tag_invoke(const boost::json::value_to_tag<DataStatus>&, const boost::json::value& jv) {
    const auto* str = jv.if_string();
    if (str == nullptr) {
        throw std::invalid_argument("status is not a string");
    }
    const std::string_view status(str->data(), str->size());
    if (status == "Proper") {
        return DataStatus::proper;
    }
    // Agents qualify junk samples, like "Junk (Disconnected)".
    if (string_starts_with(status, "Junk")) {
        return DataStatus::junk;
    }
    throw std::invalid_argument(fmt::format("unknown status '{}'", status));
}

inline void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Position& position) {
    jv = boost::json::array {position.latitude, position.longitude};
}

inline Position tag_invoke(const boost::json::value_to_tag<Position>&, const boost::json::value& jv) {
    const auto* arr = jv.if_array();
    if (arr == nullptr || arr->size() != 2) {
        throw std::invalid_argument("position must be an array of [lat, lon]");
    }
    return Position {json_to_number((*arr)[0], "latitude"), json_to_number((*arr)[1], "longitude")};
}

inline boost::json::value detail::position_to_value(const std::optional<Position>& position) {
    if (!position) {
        return nullptr;
    }
    return boost::json::value_from(*position);
}

inline void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Hello& hello) {
    boost::json::object obj {{"type", Hello::k_type}, {"id", hello.agent_id}};
    if (hello.role) {
        obj["role"] = to_string(*hello.role);
    }
    jv = std::move(obj);
}

inline Hello tag_invoke(const boost::json::value_to_tag<Hello>&, const boost::json::value& jv) {
    const auto& obj = detail::as_message_object(jv, Hello::k_type);
    Hello hello;
    const auto* id = obj.if_contains("id");
    if (id == nullptr || !id->is_string()) {
        throw std::invalid_argument("hello without agent id");
    }
    hello.agent_id = id->get_string().c_str();
    if (const auto* role = obj.if_contains("role"); role != nullptr && !role->is_null()) {
        const auto* str = role->if_string();
        if (str == nullptr) {
            throw std::invalid_argument("role is not a string");
        }
        hello.role = role_from_string(std::string_view(str->data(), str->size()));
        if (!hello.role) {
            throw std::invalid_argument(fmt::format("unknown role '{}'", std::string_view(str->data(), str->size())));
        }
    }
    return hello;
}

inline void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const TelemetryPacket& packet) {
    jv = {
        {"type", TelemetryPacket::k_type},
        {"voltage", packet.voltage},
        {"status", boost::json::value_from(packet.status)},
        {"gps", detail::position_to_value(packet.position)},
        {"timestamp", packet.send_time},
    };
}

inline TelemetryPacket tag_invoke(const boost::json::value_to_tag<TelemetryPacket>&, const boost::json::value& jv) {
    const auto& obj = detail::as_message_object(jv, TelemetryPacket::k_type);
    TelemetryPacket packet;
    packet.voltage = json_get_number(obj, "voltage");
    packet.status = boost::json::value_to<DataStatus>(obj.at("status"));
    packet.position = detail::position_from_member(obj, "gps");
    packet.send_time = json_get_number(obj, "timestamp");
    return packet;
}

inline void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Command& command) {
    jv = {
        {"type", Command::k_type},
        {"request_id", command.request_id},
        {"voltage", command.voltage},
        {"status", boost::json::value_from(command.status)},
    };
}

inline Command tag_invoke(const boost::json::value_to_tag<Command>&, const boost::json::value& jv) {
    const auto& obj = detail::as_message_object(jv, Command::k_type);
    Command command;
    if (const auto* id = obj.if_contains("request_id")) {
        command.request_id = boost::json::value_to<uint64_t>(*id);
    }
    command.voltage = json_get_number(obj, "voltage");
    command.status = boost::json::value_to<DataStatus>(obj.at("status"));
    return command;
}

inline void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Acknowledgement& ack) {
    boost::json::object obj {
        {"type", Acknowledgement::k_type},
        {"t2", ack.receipt_time},
        {"t3", ack.reply_send_time},
        {"gps", detail::position_to_value(ack.position)},
    };
    if (ack.request_id) {
        obj["request_id"] = *ack.request_id;
    }
    if (ack.applied_voltage) {
        obj["voltage_set"] = *ack.applied_voltage;
    }
    jv = std::move(obj);
}

inline Acknowledgement tag_invoke(const boost::json::value_to_tag<Acknowledgement>&, const boost::json::value& jv) {
    const auto& obj = detail::as_message_object(jv, Acknowledgement::k_type);
    Acknowledgement ack;
    if (const auto* id = obj.if_contains("request_id"); id != nullptr && !id->is_null()) {
        ack.request_id = boost::json::value_to<uint64_t>(*id);
    }
    ack.receipt_time = json_get_number(obj, "t2");
    ack.reply_send_time = json_get_number(obj, "t3");
    if (const auto* v = obj.if_contains("voltage_set"); v != nullptr && v->is_number()) {
        ack.applied_voltage = json_to_number(*v, "voltage_set");
    }
    ack.position = detail::position_from_member(obj, "gps");
    return ack;
}

}  // namespace rly::wire
