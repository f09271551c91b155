/*
 * SPDX-FileCopyrightText: (c) 2025 wlink contributors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include "backtrace.hpp"

namespace wlink::assert {

inline std::string throw_header(char const* file, int line, const std::string& assert_type, char const* condition_str) {
    std::stringstream ss;
    ss << assert_type << " @ " << file << ":" << line << ": " << condition_str << std::endl;
    return ss.str();
}

[[noreturn]] inline void raise(std::string trace_message) {
    trace_message += "Backtrace:\n";
    trace_message += ::wlink::assert::backtrace_to_string(100, 3, " --- ");
    spdlog::default_logger()->flush();
    throw std::runtime_error(trace_message);
}

[[noreturn]] inline void wlink_throw(
    char const* file, int line, const std::string& assert_type, char const* condition_str) {
    raise(throw_header(file, line, assert_type, condition_str));
}

template <typename... Ts>
[[noreturn]] void wlink_throw(
    char const* file,
    int line,
    const std::string& assert_type,
    char const* condition_str,
    fmt::format_string<Ts...> format,
    Ts&&... args) {
    std::string message = throw_header(file, line, assert_type, condition_str);
    message += fmt::format(format, std::forward<Ts>(args)...);
    message += '\n';
    raise(std::move(message));
}

inline void wlink_assert(
    char const* file, int line, const std::string& assert_type, bool condition, char const* condition_str) {
    if (not condition) {
        ::wlink::assert::wlink_throw(file, line, assert_type, condition_str);
    }
}

template <typename... Ts>
void wlink_assert(
    char const* file,
    int line,
    const std::string& assert_type,
    bool condition,
    char const* condition_str,
    fmt::format_string<Ts...> format,
    Ts&&... args) {
    if (not condition) {
        ::wlink::assert::wlink_throw(file, line, assert_type, condition_str, format, std::forward<Ts>(args)...);
    }
}

}  // namespace wlink::assert

#define WLINK_ASSERT(condition, ...) \
    ::wlink::assert::wlink_assert(__FILE__, __LINE__, "WLINK_ASSERT", (condition), #condition, ##__VA_ARGS__)
#define WLINK_THROW(...) \
    ::wlink::assert::wlink_throw(__FILE__, __LINE__, "WLINK_THROW", "wlink::exception", ##__VA_ARGS__)
