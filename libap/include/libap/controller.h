//
// Created by the autopatch developers on 10/14/26.
//

#pragma once

#include "libap/backend.h"
#include "libap/config.h"
#include "libap/decision_engine.h"
#include "libap/event_log.h"
#include "libap/notifier.h"

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ap {

    // Process exit codes.
    inline constexpr int EXIT_RUN_COMPLETED = 0;
    inline constexpr int EXIT_OPERATIONAL_FAILURE = 1;

    // Final state of one invocation.
    struct RunOutcome {
        std::optional<BackendFamily> backend;
        std::string tool;
        std::optional<Verdict> verdict; // empty if the run died before deciding
        std::optional<int> action_exit_code;
        bool notification_attempted = false;
        bool notification_sent = false;
        int exit_code = EXIT_RUN_COMPLETED;
    };

    using BackendProvider = std::function<std::expected<std::unique_ptr<Backend>, BackendError>()>;

    class UpdateController {
    public:
        UpdateController(const Config& config, Notifier& notifier, LogSink& log);

        // Detect -> refresh -> decide -> act. Sends at most one notification.
        RunOutcome run(const BackendProvider& detect);

    private:
        void execute(const BackendProvider& detect, RunOutcome& outcome);
        Verdict decide(Backend& backend);
        void act(Backend& backend, const Verdict& verdict, RunOutcome& outcome);

        void note(const std::string& message);
        void report_error(const std::string& message, RunOutcome& outcome, bool send_mail = true);
        void notify_once(const std::string& subject, const std::string& body, RunOutcome& outcome);

        std::string escalation_body(const Verdict& verdict) const;

        const Config& m_config;
        Notifier& m_notifier;
        LogSink& m_log;
        DecisionEngine m_engine;
    };

} // namespace ap
