//
// Created by cv2 on 10/5/25.
//

#include "libkeel/paths.h"
#include "libkeel/logging.h"

#include <cstdlib>
#include <unistd.h>

namespace keel {

    namespace {
        bool usable_dir(const std::filesystem::path& dir) {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec || !std::filesystem::is_directory(dir)) {
                return false;
            }
            return access(dir.c_str(), W_OK) == 0;
        }
    }

    std::filesystem::path default_data_path(const std::string& filename) {
        if (usable_dir(kSystemDataDir)) {
            return kSystemDataDir / filename;
        }

        const char* home = std::getenv("HOME");
        const std::filesystem::path fallback_dir = std::filesystem::path(home ? home : ".") / ".config" / "keel";
        log::debug("Cannot use " + kSystemDataDir.string() + ", falling back to " + fallback_dir.string());

        std::error_code ec;
        std::filesystem::create_directories(fallback_dir, ec);
        if (ec) {
            log::warn("Could not create " + fallback_dir.string() + ": " + ec.message());
        }
        return fallback_dir / filename;
    }

} // namespace keel
