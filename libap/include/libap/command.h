//
// Created by the autopatch developers on 10/13/26.
//

#pragma once

#include <string>
#include <vector>

namespace ap {

    // Combined stdout+stderr of one external command and how it exited.
    // A command that could not be started, or died on a signal, reports exit_code -1.
    struct CommandResult {
        int exit_code = -1;
        std::string output;

        bool succeeded() const { return exit_code == 0; }
    };

    class CommandRunner {
    public:
        virtual ~CommandRunner() = default;

        // Runs argv synchronously and blocks until it exits. No timeout.
        virtual CommandResult run(const std::vector<std::string>& argv) = 0;

        // Equivalent of `command -v <program>`.
        virtual bool program_exists(const std::string& program) const = 0;

        // Sets a variable in this process's environment, inherited by every later command.
        virtual void set_environment(const std::string& name, const std::string& value) = 0;
    };

    // Runs commands through /bin/sh with each argument single-quoted.
    class ShellCommandRunner : public CommandRunner {
    public:
        CommandResult run(const std::vector<std::string>& argv) override;
        bool program_exists(const std::string& program) const override;
        void set_environment(const std::string& name, const std::string& value) override;
    };

    std::string shell_quote(const std::string& arg);
    std::string join_command(const std::vector<std::string>& argv);

} // namespace ap
