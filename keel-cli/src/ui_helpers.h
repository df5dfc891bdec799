//
// Created by cv2 on 10/9/25.
//

#pragma once

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <libkeel/installer.h>
#include <libkeel/ui.h>

namespace ui {

// --- ANSI Color Codes ---
    const char* const RESET = "\033[0m";
    const char* const BOLD = "\033[1m";
    const char* const BLUE = "\033[1;34m";
    const char* const GREEN = "\033[0;32m";
    const char* const RED = "\033[1;31m";
    const char* const YELLOW = "\033[1;33m";
    const char* const CYAN = "\033[0;36m";

    const char* paint(const char* code) {
        return keel::ui::is_interactive() ? code : "";
    }

// --- Formatted Printing Functions ---

    void action(const std::string& msg) {
        std::cout << paint(BLUE) << ":: " << paint(RESET) << paint(BOLD) << msg << paint(RESET) << std::endl;
    }

    void header(const std::string& msg) {
        std::cout << paint(BOLD) << msg << paint(RESET) << std::endl;
    }

    void item(const std::string& msg) {
        std::cout << " " << paint(GREEN) << "-" << paint(RESET) << " " << msg << std::endl;
    }

    void error(const std::string& msg) {
        std::cerr << paint(RED) << "error: " << paint(RESET) << msg << std::endl;
    }

    void warning(const std::string& msg) {
        std::cout << paint(YELLOW) << "warning: " << paint(RESET) << msg << std::endl;
    }

// Asks the user a "Yes/No" question.
    bool confirm(const std::string& question) {
        std::cout << paint(CYAN) << ":: " << paint(RESET) << paint(BOLD) << question << " [Y/n] " << paint(RESET);
        std::string response;
        std::getline(std::cin, response);
        return response.empty() || response[0] == 'y' || response[0] == 'Y';
    }

    std::string join(const std::vector<std::string>& names) {
        std::string out;
        for (size_t i = 0; i < names.size(); ++i) {
            out += names[i];
            if (i < names.size() - 1) {
                out += ", ";
            }
        }
        return out;
    }

    std::string seconds(double value) {
        std::ostringstream out;
        out << std::fixed << std::setprecision(2) << value << "s";
        return out.str();
    }

    // Prints the batches of an execution plan, one line per batch.
    void print_plan(const keel::BatchList& batches) {
        size_t total = 0;
        for (const auto& batch : batches) {
            total += batch.size();
        }
        header("\nExecution plan (" + std::to_string(total) + " modules in "
               + std::to_string(batches.size()) + " batches):");
        for (size_t i = 0; i < batches.size(); ++i) {
            item("batch " + std::to_string(i + 1) + ": " + join(batches[i]));
        }
        std::cout << std::endl;
    }

    void print_report(const keel::InstallReport& report) {
        header("\nInstallation " + report.installation_id + (report.resumed ? " (resumed)" : ""));
        for (const auto& batch : report.batches) {
            for (const auto& name : batch) {
                auto it = report.results.find(name);
                if (it == report.results.end()) {
                    continue;
                }
                const auto& result = it->second;
                if (result.success) {
                    item(name + " " + paint(GREEN) + "ok" + paint(RESET) + " (" + seconds(result.duration_seconds) + ")");
                } else if (result.cancelled) {
                    item(name + " " + paint(YELLOW) + "cancelled" + paint(RESET));
                } else {
                    item(name + " " + paint(RED) + "failed" + paint(RESET) + " at " + result.failed_stage
                         + ": " + result.error.value_or("unknown error"));
                }
            }
        }
        if (!report.skipped.empty()) {
            item("already completed: " + join(report.skipped));
        }
        if (!report.cancelled.empty()) {
            item("not run: " + join(report.cancelled));
        }
        if (report.rolled_back) {
            item("rollback " + std::string(report.rollback_succeeded ? "completed" : "incomplete")
                 + " (" + report.rollback_summary + ")");
        }
        header("Total time: " + seconds(report.duration_seconds));
    }

} // namespace ui
