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

#include "expected.hpp"
#include "format.hpp"

#include <boost/json.hpp>
#include <boost/json/value_to.hpp>    // Don't remove or suffer the errors
#include <boost/json/value_from.hpp>  // Don't remove or suffer the errors

#include <stdexcept>
#include <string>
#include <string_view>

namespace rly {

/**
 * Parses given string as JSON and converts the result to T using the tag_invoke overloads of T.
 * Conversion functions signal invalid input by throwing, which is reported here as an error string.
 * @tparam T The type to convert to.
 * @param json_str The JSON text.
 * @return The converted value, or a description of what went wrong.
 */
template<typename T>
tl::expected<T, std::string> parse_json(const std::string_view json_str) {
    boost::system::error_code ec;
    const auto jv = boost::json::parse(json_str, ec);
    if (ec) {
        return tl::unexpected(fmt::format("invalid json: {}", ec.message()));
    }
    try {
        return boost::json::value_to<T>(jv);
    } catch (const std::exception& e) {
        return tl::unexpected(std::string(e.what()));
    }
}

/**
 * @param v The value to convert.
 * @param what Name of the value, used in the error message.
 * @return The value converted to double. Integers are accepted as well.
 * @throws std::invalid_argument if the value is not a number.
 */
inline double json_to_number(const boost::json::value& v, const std::string_view what) {
    if (v.is_double()) {
        return v.get_double();
    }
    if (v.is_int64()) {
        return static_cast<double>(v.get_int64());
    }
    if (v.is_uint64()) {
        return static_cast<double>(v.get_uint64());
    }
    throw std::invalid_argument(fmt::format("field '{}' is not a number", what));
}

/**
 * @param obj The object to look into.
 * @param key The key of the member.
 * @return The member converted to double.
 * @throws std::invalid_argument if the member is missing or not a number.
 */
inline double json_get_number(const boost::json::object& obj, const std::string_view key) {
    const auto* v = obj.if_contains(key);
    if (v == nullptr) {
        throw std::invalid_argument(fmt::format("missing field '{}'", key));
    }
    return json_to_number(*v, key);
}

}  // namespace rly
