//
// Created by the autopatch developers on 10/13/26.
//

#pragma once

#include "libap/command.h"

#include <expected>
#include <memory>
#include <string>

namespace ap {

    class LogSink;

    enum class BackendFamily {
        Apt,
        YumDnf
    };

    enum class UpgradeMode {
        Simple,
        DistUpgrade
    };

    enum class BackendErrorKind {
        BackendNotFound,
        RefreshFailed,
        UpdateCheckFailed,
        ApplyFailed
    };

    struct BackendError {
        BackendErrorKind kind;
        int exit_code = 0;
    };

    // Raw text of a dry run. Only the finding parser looks inside it.
    struct DryRunOutput {
        std::string text;
        int exit_code = 0;
    };

    enum class UpdateAvailability {
        None,
        Available,
        Error
    };

    struct UpdateCheck {
        UpdateAvailability availability = UpdateAvailability::Available;
        int exit_code = 0; // only meaningful for Error
    };

    class Backend {
    public:
        virtual ~Backend() = default;

        virtual BackendFamily family() const = 0;
        // The executable in charge: "apt", "dnf" or "yum".
        virtual const std::string& tool() const = 0;

        virtual std::expected<void, BackendError> refresh_metadata() = 0;
        // Never mutates the system.
        virtual DryRunOutput simulate_upgrade(UpgradeMode mode) = 0;
        virtual UpdateCheck check_updates_available() = 0;
        // Non-interactive; always keeps locally modified configuration files.
        virtual std::expected<void, BackendError> apply_upgrade(UpgradeMode mode) = 0;
    };

    class AptBackend : public Backend {
    public:
        AptBackend(CommandRunner& runner, LogSink& transcript);

        BackendFamily family() const override { return BackendFamily::Apt; }
        const std::string& tool() const override { return m_tool; }

        std::expected<void, BackendError> refresh_metadata() override;
        DryRunOutput simulate_upgrade(UpgradeMode mode) override;
        UpdateCheck check_updates_available() override;
        std::expected<void, BackendError> apply_upgrade(UpgradeMode mode) override;

    private:
        CommandRunner& m_runner;
        LogSink& m_transcript;
        std::string m_tool = "apt";
    };

    // yum and dnf share a command-line surface; the tool name picks the binary.
    class YumDnfBackend : public Backend {
    public:
        YumDnfBackend(std::string tool, CommandRunner& runner, LogSink& transcript);

        BackendFamily family() const override { return BackendFamily::YumDnf; }
        const std::string& tool() const override { return m_tool; }

        std::expected<void, BackendError> refresh_metadata() override;
        DryRunOutput simulate_upgrade(UpgradeMode mode) override;
        UpdateCheck check_updates_available() override;
        std::expected<void, BackendError> apply_upgrade(UpgradeMode mode) override;

    private:
        CommandRunner& m_runner;
        LogSink& m_transcript;
        std::string m_tool;
    };

    // First match wins: apt, then dnf, then yum.
    std::expected<std::unique_ptr<Backend>, BackendError> detect_backend(CommandRunner& runner, LogSink& transcript);

    std::string to_string(BackendFamily family);
    std::string to_string(const BackendError& error);

} // namespace ap
