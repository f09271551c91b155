// SPDX-FileCopyrightText: © 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdlib.h>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace wlink::test_utils {

// Fresh directory under the system temp dir, removed with its contents on destruction.
class TempDirectory {
public:
    TempDirectory() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "wlink_test_XXXXXX").string();
        if (mkdtemp(tmpl.data()) == nullptr) {
            throw std::runtime_error("Failed to create temporary directory");
        }
        path_ = tmpl;
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace wlink::test_utils
