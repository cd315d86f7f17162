//
// Created by the autopatch developers on 10/14/26.
//

#include "libap/controller.h"
#include "libap/finding_parser.h"
#include "libap/logging.h"

namespace ap {

    UpdateController::UpdateController(const Config& config, Notifier& notifier, LogSink& log)
            : m_config(config),
              m_notifier(notifier),
              m_log(log),
              m_engine(EngineOptions{config.strict_parsing}) {}

    RunOutcome UpdateController::run(const BackendProvider& detect) {
        RunOutcome outcome;
        m_log.banner("autopatch started");
        execute(detect, outcome);
        m_log.banner("autopatch completed");
        return outcome;
    }

    void UpdateController::execute(const BackendProvider& detect, RunOutcome& outcome) {
        // --- 1. Backend detection ---
        auto detected = detect();
        if (!detected) {
            outcome.verdict = Verdict::detection_failed(to_string(detected.error()));
            report_error(outcome.verdict->reason, outcome, m_config.notify_on_detection_failure);
            outcome.exit_code = EXIT_OPERATIONAL_FAILURE;
            return;
        }
        Backend& backend = **detected;
        outcome.backend = backend.family();
        outcome.tool = backend.tool();
        note("Detected " + backend.tool() + " package manager");

        // --- 2. Metadata refresh ---
        note("Updating package lists with " + backend.tool());
        if (auto refreshed = backend.refresh_metadata(); !refreshed) {
            report_error(to_string(refreshed.error()), outcome);
            outcome.exit_code = EXIT_OPERATIONAL_FAILURE;
            return;
        }

        // --- 3. Decision ---
        Verdict verdict = decide(backend);
        note("Verdict: " + to_string(verdict.kind) + (verdict.reason.empty() ? "" : " (" + verdict.reason + ")"));
        outcome.verdict = verdict;

        // --- 4. Action ---
        act(backend, verdict, outcome);
    }

    Verdict UpdateController::decide(Backend& backend) {
        const BackendFamily family = backend.family();

        if (family == BackendFamily::YumDnf) {
            note("Checking for available updates");
        }
        if (auto terminal = m_engine.evaluate_update_check(backend.check_updates_available())) {
            return *terminal;
        }

        if (family == BackendFamily::Apt) {
            note("Checking for packages that would be removed or held back");
        } else {
            note("Checking for packages that would be removed");
        }
        const FindingSet first = FindingParser::parse(family, backend.simulate_upgrade(UpgradeMode::Simple));

        std::optional<FindingSet> dist_upgrade;
        if (m_engine.needs_dist_upgrade_probe(family, first)) {
            note("Some packages kept back. Checking if dist-upgrade would remove packages.");
            dist_upgrade = FindingParser::parse(family, backend.simulate_upgrade(UpgradeMode::DistUpgrade));
        }

        return m_engine.evaluate(family, first, dist_upgrade);
    }

    void UpdateController::act(Backend& backend, const Verdict& verdict, RunOutcome& outcome) {
        switch (verdict.kind) {
            case VerdictKind::ProceedSimpleUpgrade:
            case VerdictKind::ProceedDistUpgrade: {
                const bool dist = verdict.kind == VerdictKind::ProceedDistUpgrade;
                const std::string label = dist ? "dist-upgrade" : "Upgrade";
                if (dist) {
                    note("dist-upgrade would not remove packages. Proceeding with dist-upgrade.");
                } else {
                    note("No packages would be removed. Proceeding with automatic upgrade.");
                }

                auto applied = backend.apply_upgrade(dist ? UpgradeMode::DistUpgrade : UpgradeMode::Simple);
                if (applied) {
                    outcome.action_exit_code = 0;
                    note(label + " completed successfully");
                } else {
                    // Reported, but the run itself still counts as completed.
                    outcome.action_exit_code = applied.error().exit_code;
                    report_error(label + " failed with exit code " + std::to_string(applied.error().exit_code), outcome);
                }
                break;
            }
            case VerdictKind::Escalate:
                note("Manual intervention required (" + verdict.reason + "). Sending email.");
                notify_once("[" + m_config.hostname + "] Manual intervention required for system update",
                            escalation_body(verdict), outcome);
                break;
            case VerdictKind::NoUpdatesAvailable:
                note("No updates available");
                break;
            case VerdictKind::DetectionFailed:
                report_error(verdict.reason, outcome);
                outcome.exit_code = EXIT_OPERATIONAL_FAILURE;
                break;
        }
    }

    std::string UpdateController::escalation_body(const Verdict& verdict) const {
        const std::string& host = m_config.hostname;
        if (verdict.reason == REASON_DIST_UPGRADE_WOULD_REMOVE) {
            return "The system update on " + host + " has packages kept back, and using dist-upgrade would remove packages.\n\n"
                   + verdict.detail;
        }
        std::string why;
        if (verdict.reason == REASON_REMOVAL_OR_MANUAL) {
            why = "packages would be removed or require manual handling";
        } else if (verdict.reason == REASON_REMOVAL_OR_CONFLICT) {
            why = "packages would be removed or there are conflicts";
        } else if (verdict.reason == REASON_UNRECOGNIZED_OUTPUT) {
            why = "the package manager output could not be confirmed as safe";
        } else {
            why = "the update could not be classified (" + verdict.reason + ")";
        }
        return "The system update on " + host + " requires manual intervention because " + why + ".\n\nDetails:\n"
               + verdict.detail;
    }

    void UpdateController::note(const std::string& message) {
        m_log.write_line(message);
        // Under cron any stdout becomes mail; only echo when someone is watching.
        if (ui::is_interactive()) {
            log::info(message);
        }
    }

    void UpdateController::report_error(const std::string& message, RunOutcome& outcome, bool send_mail) {
        m_log.error(message);
        log::error(message);

        if (send_mail) {
            const std::string& host = m_config.hostname;
            notify_once("[" + host + "] Error during system update",
                        "An error occurred during the system update process on " + host + ":\n\n" + message
                        + "\n\nPlease check " + m_config.log_file.string() + " for details.",
                        outcome);
        }
    }

    void UpdateController::notify_once(const std::string& subject, const std::string& body, RunOutcome& outcome) {
        if (outcome.notification_attempted) {
            log::warn("A notification was already sent during this run; suppressing: " + subject);
            return;
        }
        outcome.notification_attempted = true;

        auto sent = m_notifier.send(subject, body);
        if (sent) {
            outcome.notification_sent = true;
            m_log.write_line("Email sent to " + m_config.admin_email);
        } else {
            // Nothing left to escalate to; the log is the only record.
            m_log.write_line("Failed to send email to " + m_config.admin_email + ": " + sent.error().message);
            log::warn("Failed to send email to " + m_config.admin_email + ": " + sent.error().message);
        }
    }

} // namespace ap
