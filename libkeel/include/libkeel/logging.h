//
// Created by cv2 on 10/2/25.
//

#pragma once

#include "ui.h"

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <source_location> // C++20, but essential for good logging

namespace keel::log {

    namespace detail {
        // Every line goes through this one lock, so output from concurrent
        // module threads never interleaves mid-message.
        inline std::mutex& sink_mutex() {
            static std::mutex m;
            return m;
        }

        inline std::atomic<bool>& verbose_flag() {
            static std::atomic<bool> flag{false};
            return flag;
        }

        inline const char* color(const char* code) {
            return ui::is_interactive() ? code : "";
        }
    }

    inline void set_verbose(bool verbose) {
        detail::verbose_flag().store(verbose);
    }

    inline bool is_verbose() {
        return detail::verbose_flag().load();
    }

    // Helper function to format the output consistently
    inline void print(const std::string& level, const char* color_code, const std::string& msg) {
        std::string line;
        line.reserve(msg.size() + 32);
        line += detail::color(color_code);
        line += "[  " + level + "  ] > ";
        line += detail::color("\033[0m");
        line += msg;
        line += '\n';

        std::lock_guard<std::mutex> lock(detail::sink_mutex());
        std::cout << line << std::flush;
    }

    inline void ok(const std::string& msg) {
        print("OKY", "\033[1;32m", msg); // Bold Green
    }

    inline void error(const std::string& msg, const std::source_location& loc = std::source_location::current()) {
        std::string full_msg = msg + " (at " + loc.file_name() + ":" + std::to_string(loc.line()) + ")";
        print("ERR", "\033[1;31m", full_msg); // Bold Red
    }

    inline void info(const std::string& msg) {
        print("LOG", "\033[1;34m", msg); // Bold Blue
    }

    inline void warn(const std::string& msg) {
        print("WRN", "\033[1;33m", msg); // Bold Yellow
    }

    inline void debug(const std::string& msg) {
        if (is_verbose()) {
            print("DBG", "\033[0;36m", msg); // Cyan
        }
    }

    // Prints a progress message without a newline, and flushes the output.
    // Only meant for the single-threaded phases (planning, rollback).
    inline void progress(const std::string& msg) {
        std::lock_guard<std::mutex> lock(detail::sink_mutex());
        if (ui::is_interactive()) {
            // \r: Carriage return, \033[K: Erase to the end of the line
            std::cout << "\r\033[K" << "\033[1;34m" << "[..] > " << "\033[0m" << msg << std::flush;
        } else {
            std::cout << "[..] > " << msg << std::flush;
        }
    }

    // Prints a green "[OK]" message and finally moves to the next line.
    inline void progress_ok() {
        std::lock_guard<std::mutex> lock(detail::sink_mutex());
        std::cout << " [" << detail::color("\033[1;32m") << "  OKY  " << detail::color("\033[0m") << "]" << std::endl;
    }

} // namespace keel::log
