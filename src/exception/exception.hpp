// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

/*************************************************

Date: 2026-10-18

Description: Exception types shared by all Live Themes modules

*************************************************/

#ifndef LIVETHEMES_EXCEPTION_EXCEPTION_HPP
#define LIVETHEMES_EXCEPTION_EXCEPTION_HPP

#include <cstddef>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace livethemes {

/**
 * @brief Base exception class for Live Themes errors
 */
class LiveThemesException : public std::runtime_error {
public:
    explicit LiveThemesException(
        std::string_view message,
        std::source_location location = std::source_location::current())
        : std::runtime_error(std::string(message)), location_(location) {}

    [[nodiscard]] auto location() const noexcept
        -> const std::source_location& {
        return location_;
    }

private:
    std::source_location location_;
};

/**
 * @brief Thrown when a relaxed JSON document fails strict parsing
 *
 * Line and column are 1-based and refer to the stripped text, which lines up
 * with the original document when comments were replaced by whitespace.
 */
class RelaxedJsonParseException : public LiveThemesException {
public:
    RelaxedJsonParseException(
        std::string_view message, std::size_t byte, std::size_t line,
        std::size_t column,
        std::source_location location = std::source_location::current())
        : LiveThemesException(message, location),
          byte_(byte),
          line_(line),
          column_(column) {}

    [[nodiscard]] auto byte() const noexcept -> std::size_t { return byte_; }
    [[nodiscard]] auto line() const noexcept -> std::size_t { return line_; }
    [[nodiscard]] auto column() const noexcept -> std::size_t {
        return column_;
    }

private:
    std::size_t byte_;
    std::size_t line_;
    std::size_t column_;
};

/**
 * @brief Thrown when a download fails
 */
class NetworkException : public LiveThemesException {
public:
    explicit NetworkException(
        std::string_view message, int curlCode = 0, long httpStatus = 0,
        std::source_location location = std::source_location::current())
        : LiveThemesException(message, location),
          curlCode_(curlCode),
          httpStatus_(httpStatus) {}

    [[nodiscard]] auto curlCode() const noexcept -> int { return curlCode_; }
    [[nodiscard]] auto httpStatus() const noexcept -> long {
        return httpStatus_;
    }

private:
    int curlCode_;
    long httpStatus_;
};

/**
 * @brief Thrown when a theme list or theme document has an unexpected shape
 */
class ThemeFormatException : public LiveThemesException {
public:
    using LiveThemesException::LiveThemesException;
};

/**
 * @brief Thrown for unreadable or invalid configuration and settings files
 */
class SettingsException : public LiveThemesException {
public:
    using LiveThemesException::LiveThemesException;
};

}  // namespace livethemes

#endif  // LIVETHEMES_EXCEPTION_EXCEPTION_HPP
