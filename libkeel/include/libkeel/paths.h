//
// Created by cv2 on 10/5/25.
//

#pragma once

#include <filesystem>
#include <string>

namespace keel {

    inline const std::filesystem::path kSystemDataDir = "/var/lib/keel";

    // `/var/lib/keel/<filename>` when that directory exists or can be created,
    // otherwise `$HOME/.config/keel/<filename>` (created on demand).
    std::filesystem::path default_data_path(const std::string& filename);

} // namespace keel
