/*
 * SPDX-FileCopyrightText: (c) 2025 wlink contributors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cxxabi.h>
#include <execinfo.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace wlink::assert {

inline std::string demangle(const char* str) {
    size_t size = 0;
    int status = 0;
    std::string rt(256, '\0');
    if (1 == sscanf(str, "%*[^(]%*[^_]%255[^)+]", &rt[0])) {
        char* v = abi::__cxa_demangle(&rt[0], nullptr, &size, &status);
        if (v) {
            std::string result(v);
            free(v);
            return result;
        }
    }
    return str;
}

// Returns the current call stack, skipping the innermost `skip` frames.
inline std::vector<std::string> backtrace(int size = 64, int skip = 1) {
    std::vector<std::string> bt;
    std::vector<void*> array(size);
    int s = ::backtrace(array.data(), size);
    std::unique_ptr<char*, decltype(&free)> strings(backtrace_symbols(array.data(), s), &free);
    if (strings == nullptr) {
        return bt;
    }
    for (int i = skip; i < s; ++i) {
        bt.push_back(demangle(strings.get()[i]));
    }
    return bt;
}

inline std::string backtrace_to_string(int size = 64, int skip = 2, const std::string& prefix = "") {
    std::vector<std::string> bt = backtrace(size, skip);
    std::ostringstream ss;
    for (const auto& frame : bt) {
        ss << prefix << frame << std::endl;
    }
    return ss.str();
}

}  // namespace wlink::assert
