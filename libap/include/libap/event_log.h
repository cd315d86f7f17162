//
// Created by the autopatch developers on 10/12/26.
//

#pragma once

#include <filesystem>
#include <string>

namespace ap {

    // Append-only destination for the run's event lines.
    class LogSink {
    public:
        virtual ~LogSink() = default;

        virtual void write_line(const std::string& line) = 0;

        void error(const std::string& message) { write_line("ERROR: " + message); }
        void banner(const std::string& text);
    };

    // Writes to a file on disk. The file is opened and closed for every line so
    // that a killed run never leaves a half-buffered log behind.
    class FileLogSink : public LogSink {
    public:
        explicit FileLogSink(std::filesystem::path log_path);

        void write_line(const std::string& line) override;

        const std::filesystem::path& path() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };

    // Current local time as "YYYY-mm-dd HH:MM:SS".
    std::string current_timestamp();

} // namespace ap
