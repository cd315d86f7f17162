//
// Created by the autopatch developers on 10/13/26.
//

#include "libap/backend.h"
#include "libap/event_log.h"
#include "libap/logging.h"

#include <sstream>

namespace ap {

    // yum/dnf check-update: 0 = nothing to do, 100 = updates pending.
    static constexpr int CHECK_UPDATE_NONE = 0;
    static constexpr int CHECK_UPDATE_AVAILABLE = 100;

    // Mirrors a command and everything it printed into the event log.
    static CommandResult run_logged(CommandRunner& runner, LogSink& transcript, const std::vector<std::string>& argv) {
        transcript.write_line("$ " + join_command(argv));
        CommandResult result = runner.run(argv);

        std::stringstream ss(result.output);
        std::string line;
        while (std::getline(ss, line)) {
            transcript.write_line(line);
        }
        return result;
    }

    // --- Apt family ---

    AptBackend::AptBackend(CommandRunner& runner, LogSink& transcript)
            : m_runner(runner), m_transcript(transcript)
    {
        // Must be in place before the first apt call so debconf never prompts.
        m_runner.set_environment("DEBIAN_FRONTEND", "noninteractive");
    }

    std::expected<void, BackendError> AptBackend::refresh_metadata() {
        auto result = run_logged(m_runner, m_transcript, {m_tool, "update", "-y"});
        if (!result.succeeded()) {
            return std::unexpected(BackendError{BackendErrorKind::RefreshFailed, result.exit_code});
        }
        return {};
    }

    DryRunOutput AptBackend::simulate_upgrade(UpgradeMode mode) {
        const char* verb = (mode == UpgradeMode::DistUpgrade) ? "dist-upgrade" : "upgrade";
        auto result = m_runner.run({m_tool, verb, "--simulate"});
        return DryRunOutput{std::move(result.output), result.exit_code};
    }

    UpdateCheck AptBackend::check_updates_available() {
        // apt has no cheap pre-check; the simulation is the check.
        return UpdateCheck{UpdateAvailability::Available, 0};
    }

    std::expected<void, BackendError> AptBackend::apply_upgrade(UpgradeMode mode) {
        const char* verb = (mode == UpgradeMode::DistUpgrade) ? "dist-upgrade" : "upgrade";
        auto result = run_logged(m_runner, m_transcript,
                                 {m_tool, verb, "-y", "-o", "Dpkg::Options::=--force-confold"});
        if (!result.succeeded()) {
            return std::unexpected(BackendError{BackendErrorKind::ApplyFailed, result.exit_code});
        }
        return {};
    }

    // --- Yum/Dnf family ---

    YumDnfBackend::YumDnfBackend(std::string tool, CommandRunner& runner, LogSink& transcript)
            : m_runner(runner), m_transcript(transcript), m_tool(std::move(tool)) {}

    std::expected<void, BackendError> YumDnfBackend::refresh_metadata() {
        auto result = run_logged(m_runner, m_transcript, {m_tool, "makecache"});
        if (!result.succeeded()) {
            return std::unexpected(BackendError{BackendErrorKind::RefreshFailed, result.exit_code});
        }
        return {};
    }

    DryRunOutput YumDnfBackend::simulate_upgrade(UpgradeMode) {
        // --assumeno answers "no" at the transaction prompt, so the exit code is
        // non-zero even for a clean plan. It is kept but not interpreted.
        auto result = m_runner.run({m_tool, "upgrade", "--assumeno"});
        return DryRunOutput{std::move(result.output), result.exit_code};
    }

    UpdateCheck YumDnfBackend::check_updates_available() {
        auto result = run_logged(m_runner, m_transcript, {m_tool, "check-update"});
        switch (result.exit_code) {
            case CHECK_UPDATE_NONE:
                return UpdateCheck{UpdateAvailability::None, result.exit_code};
            case CHECK_UPDATE_AVAILABLE:
                return UpdateCheck{UpdateAvailability::Available, result.exit_code};
            default:
                return UpdateCheck{UpdateAvailability::Error, result.exit_code};
        }
    }

    std::expected<void, BackendError> YumDnfBackend::apply_upgrade(UpgradeMode mode) {
        if (mode == UpgradeMode::DistUpgrade) {
            log::warn(m_tool + " has a single upgrade mode; running a plain upgrade.");
        }
        // rpm never overwrites modified config files, it writes .rpmnew instead.
        auto result = run_logged(m_runner, m_transcript, {m_tool, "upgrade", "-y"});
        if (!result.succeeded()) {
            return std::unexpected(BackendError{BackendErrorKind::ApplyFailed, result.exit_code});
        }
        return {};
    }

    std::expected<std::unique_ptr<Backend>, BackendError> detect_backend(CommandRunner& runner, LogSink& transcript) {
        if (runner.program_exists("apt")) {
            return std::make_unique<AptBackend>(runner, transcript);
        }
        for (const char* tool : {"dnf", "yum"}) {
            if (runner.program_exists(tool)) {
                return std::make_unique<YumDnfBackend>(tool, runner, transcript);
            }
        }
        return std::unexpected(BackendError{BackendErrorKind::BackendNotFound, 0});
    }

    std::string to_string(BackendFamily family) {
        switch (family) {
            case BackendFamily::Apt: return "apt";
            case BackendFamily::YumDnf: return "yum/dnf";
        }
        return "unknown";
    }

    std::string to_string(const BackendError& error) {
        switch (error.kind) {
            case BackendErrorKind::BackendNotFound:
                return "No supported package manager found";
            case BackendErrorKind::RefreshFailed:
                return "Failed to update package lists (exit code: " + std::to_string(error.exit_code) + ")";
            case BackendErrorKind::UpdateCheckFailed:
                return "Failed to check for updates (exit code: " + std::to_string(error.exit_code) + ")";
            case BackendErrorKind::ApplyFailed:
                return "Upgrade failed with exit code " + std::to_string(error.exit_code);
        }
        return "Unknown backend error";
    }

} // namespace ap
