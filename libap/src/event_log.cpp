//
// Created by the autopatch developers on 10/12/26.
//

#include "libap/event_log.h"
#include "libap/logging.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace ap {

    std::string current_timestamp() {
        const auto now = std::chrono::system_clock::now();
        const auto in_time_t = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
        localtime_r(&in_time_t, &local);
        std::stringstream ss;
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    void LogSink::banner(const std::string& text) {
        write_line("=== " + text + " at " + current_timestamp() + " ===");
    }

    FileLogSink::FileLogSink(std::filesystem::path log_path)
            : m_path(std::move(log_path)) {}

    void FileLogSink::write_line(const std::string& line) {
        std::ofstream out(m_path, std::ios::app);
        if (!out) {
            // Nowhere else to put it; keep the line visible on the console.
            log::error("Could not open log file " + m_path.string() + ": " + line);
            return;
        }
        out << "[" << current_timestamp() << "] " << line << '\n';
    }

} // namespace ap
