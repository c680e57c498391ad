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

#include "relaykit/core/expected.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace rly::file {

enum class Error {
    invalid_path,
    file_does_not_exist,
    failed_to_open,
    failed_to_create_directory,
    failed_to_read_from_file,
    failed_to_write_to_file,
};

inline const char* to_string(const Error error) {
    switch (error) {
        case Error::invalid_path:
            return "invalid path";
        case Error::file_does_not_exist:
            return "file does not exist";
        case Error::failed_to_open:
            return "failed to open";
        case Error::failed_to_create_directory:
            return "failed to create directory";
        case Error::failed_to_read_from_file:
            return "failed to read from file";
        case Error::failed_to_write_to_file:
            return "failed to write to file";
    }
    return "unknown error";
}

/**
 * Reads the contents of given file into a string.
 * @param file The file to read from.
 * @return An expected holding a string with the contents on success, or an Error in case of failure.
 */
inline tl::expected<std::string, Error> read_file_as_string(const std::filesystem::path& file) {
    if (file.empty()) {
        return tl::unexpected(Error::invalid_path);
    }

    std::ifstream stream(file, std::ios::binary);
    if (!stream.is_open()) {
        std::error_code ec;
        if (!std::filesystem::exists(file, ec)) {
            return tl::unexpected(Error::file_does_not_exist);
        }
        return tl::unexpected(Error::failed_to_open);
    }

    std::string result {std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
    if (stream.bad()) {
        return tl::unexpected(Error::failed_to_read_from_file);
    }

    return result;
}

/**
 * Appends text to given file, creating the file and its parent directories when they don't exist.
 * @param file The file to append to.
 * @param text The text to append.
 * @return An expected indicating success or the reason of failure.
 */
inline tl::expected<void, Error> append_to_file(const std::filesystem::path& file, const std::string_view text) {
    if (file.empty()) {
        return tl::unexpected(Error::invalid_path);
    }

    if (file.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) {
            return tl::unexpected(Error::failed_to_create_directory);
        }
    }

    std::ofstream stream(file, std::ios::binary | std::ios::app);
    if (!stream.is_open()) {
        return tl::unexpected(Error::failed_to_open);
    }

    stream.write(text.data(), static_cast<std::streamsize>(text.size()));
    stream.flush();
    if (!stream.good()) {
        return tl::unexpected(Error::failed_to_write_to_file);
    }

    return {};
}

}  // namespace rly::file
