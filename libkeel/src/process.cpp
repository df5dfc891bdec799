//
// Created by cv2 on 10/5/25.
//

#include "libkeel/process.h"
#include "libkeel/logging.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace keel {

    CommandOutcome run_command(const std::string& command) {
        CommandOutcome outcome;

        // Close-on-exec, so children forked by other threads never hold our write end.
        int pipe_fds[2];
        if (pipe2(pipe_fds, O_CLOEXEC) != 0) {
            log::error("Failed to create pipe for command: " + std::string(std::strerror(errno)));
            return outcome;
        }

        const pid_t pid = fork();
        if (pid < 0) {
            log::error("Failed to fork for command: " + std::string(std::strerror(errno)));
            close(pipe_fds[0]);
            close(pipe_fds[1]);
            return outcome;
        }

        if (pid == 0) {
            // Child: route both output streams into the pipe and exec the shell.
            close(pipe_fds[0]);
            dup2(pipe_fds[1], STDOUT_FILENO);
            dup2(pipe_fds[1], STDERR_FILENO);
            close(pipe_fds[1]);
            execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
            _exit(127);
        }

        close(pipe_fds[1]);
        std::array<char, 4096> buffer{};
        while (true) {
            const ssize_t n = read(pipe_fds[0], buffer.data(), buffer.size());
            if (n > 0) {
                outcome.output.append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n < 0 && errno == EINTR) {
                continue;
            } else {
                break;
            }
        }
        close(pipe_fds[0]);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                log::error("waitpid failed for command: " + std::string(std::strerror(errno)));
                return outcome;
            }
        }

        if (WIFEXITED(status)) {
            outcome.exit_code = WEXITSTATUS(status);
        }
        return outcome;
    }

    std::string shell_quote(const std::string& arg) {
        std::string quoted = "'";
        for (const char c : arg) {
            if (c == '\'') {
                quoted += "'\\''";
            } else {
                quoted += c;
            }
        }
        quoted += "'";
        return quoted;
    }

    std::string shell_join(const std::vector<std::string>& args) {
        std::string out;
        for (size_t i = 0; i < args.size(); ++i) {
            out += shell_quote(args[i]);
            if (i < args.size() - 1) {
                out += ' ';
            }
        }
        return out;
    }

} // namespace keel
