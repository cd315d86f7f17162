//
// Created by the autopatch developers on 10/13/26.
//

#include "libap/command.h"
#include "libap/logging.h"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace ap {

    std::string shell_quote(const std::string& arg) {
        std::string quoted = "'";
        for (char c : arg) {
            if (c == '\'') {
                quoted += "'\\''";
            } else {
                quoted += c;
            }
        }
        quoted += "'";
        return quoted;
    }

    std::string join_command(const std::vector<std::string>& argv) {
        std::string joined;
        for (const auto& arg : argv) {
            if (!joined.empty()) joined += ' ';
            joined += arg;
        }
        return joined;
    }

    CommandResult ShellCommandRunner::run(const std::vector<std::string>& argv) {
        CommandResult result;
        if (argv.empty()) {
            log::error("Refusing to run an empty command.");
            return result;
        }

        std::string command;
        for (const auto& arg : argv) {
            if (!command.empty()) command += ' ';
            command += shell_quote(arg);
        }
        command += " 2>&1";

        FILE* pipe = popen(command.c_str(), "r");
        if (!pipe) {
            log::error("Failed to start command '" + join_command(argv) + "': " + std::strerror(errno));
            return result;
        }

        std::array<char, 4096> buffer{};
        size_t n;
        while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
            result.output.append(buffer.data(), n);
        }

        int status = pclose(pipe);
        if (status == -1) {
            log::error("Failed to collect exit status of '" + join_command(argv) + "'.");
        } else if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            log::error("'" + join_command(argv) + "' was killed by signal " + std::to_string(WTERMSIG(status)));
        }
        return result;
    }

    bool ShellCommandRunner::program_exists(const std::string& program) const {
        const char* path_env = std::getenv("PATH");
        std::string search_path = path_env ? path_env : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

        std::stringstream ss(search_path);
        std::string dir;
        while (std::getline(ss, dir, ':')) {
            if (dir.empty()) continue;
            const auto candidate = std::filesystem::path(dir) / program;
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
                return true;
            }
        }
        return false;
    }

    void ShellCommandRunner::set_environment(const std::string& name, const std::string& value) {
        if (setenv(name.c_str(), value.c_str(), 1) != 0) {
            log::error("Failed to set environment variable " + name + ": " + std::strerror(errno));
        }
    }

} // namespace ap
