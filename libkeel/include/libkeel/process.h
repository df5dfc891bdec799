//
// Created by cv2 on 10/5/25.
//

#pragma once

#include <functional>
#include <string>
#include <vector>

namespace keel {

    struct CommandOutcome {
        int exit_code = -1;
        std::string output; // stdout and stderr, interleaved

        bool ok() const { return exit_code == 0; }
    };

    // Runs `command` through /bin/sh -c and waits for it.
    // exit_code is -1 if the process could not be started or was killed by a signal.
    CommandOutcome run_command(const std::string& command);

    // Single-quotes `arg` for safe interpolation into a shell command line.
    std::string shell_quote(const std::string& arg);
    std::string shell_join(const std::vector<std::string>& args);

    // Injection point for anything that shells out (rollback, command modules).
    using CommandRunner = std::function<CommandOutcome(const std::string& command)>;

} // namespace keel
