#pragma once

#include <unistd.h> // For isatty and STDOUT_FILENO

namespace keel::ui {

    /**
     * @brief Checks if standard output is connected to an interactive terminal (TTY).
     * @return True if output is interactive, false otherwise (e.g., piped or redirected to a file).
     */
    inline bool is_interactive() {
        static const bool interactive = isatty(STDOUT_FILENO) != 0;
        return interactive;
    }

} // namespace keel::ui
