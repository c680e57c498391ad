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

#include <cstdint>
#include <optional>
#include <string_view>

namespace rly {

/**
 * The slot a peer connection occupies. Each role has its own listening port and at most one live connection.
 */
enum class Role {
    measurement,
    actuation,
};

inline constexpr Role k_all_roles[] = {Role::measurement, Role::actuation};

inline const char* to_string(const Role role) {
    switch (role) {
        case Role::measurement:
            return "measurement";
        case Role::actuation:
            return "actuation";
    }
    return "unknown";
}

inline constexpr uint16_t k_default_measurement_port = 65430;
inline constexpr uint16_t k_default_actuation_port = 65431;

/**
 * @param role The role.
 * @return The port the relay listens on for given role, unless configured otherwise.
 */
inline uint16_t default_port(const Role role) {
    return role == Role::measurement ? k_default_measurement_port : k_default_actuation_port;
}

inline std::optional<Role> role_from_string(const std::string_view str) {
    if (str == "measurement") {
        return Role::measurement;
    }
    if (str == "actuation") {
        return Role::actuation;
    }
    return std::nullopt;
}

}  // namespace rly
