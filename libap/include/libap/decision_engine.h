//
// Created by the autopatch developers on 10/13/26.
//

#pragma once

#include "libap/backend.h"
#include "libap/finding_parser.h"

#include <optional>
#include <string>

namespace ap {

    enum class VerdictKind {
        ProceedSimpleUpgrade,
        ProceedDistUpgrade,
        Escalate,
        NoUpdatesAvailable,
        DetectionFailed
    };

    struct Verdict {
        VerdictKind kind;
        std::string reason; // Escalate and DetectionFailed only
        std::string detail; // Escalate only

        static Verdict proceed_simple() { return {VerdictKind::ProceedSimpleUpgrade, {}, {}}; }
        static Verdict proceed_dist() { return {VerdictKind::ProceedDistUpgrade, {}, {}}; }
        static Verdict no_updates() { return {VerdictKind::NoUpdatesAvailable, {}, {}}; }
        static Verdict escalate(std::string reason, std::string detail) {
            return {VerdictKind::Escalate, std::move(reason), std::move(detail)};
        }
        static Verdict detection_failed(std::string reason) {
            return {VerdictKind::DetectionFailed, std::move(reason), {}};
        }
    };

    // Escalation reasons.
    inline constexpr const char* REASON_REMOVAL_OR_MANUAL = "removal-or-manual";
    inline constexpr const char* REASON_DIST_UPGRADE_WOULD_REMOVE = "dist-upgrade-would-remove";
    inline constexpr const char* REASON_REMOVAL_OR_CONFLICT = "removal-or-conflict";
    inline constexpr const char* REASON_UNRECOGNIZED_OUTPUT = "unrecognized-output";
    inline constexpr const char* REASON_DIST_UPGRADE_NOT_PROBED = "dist-upgrade-not-probed";

    struct EngineOptions {
        // Require the tool's transaction summary before trusting an empty FindingSet.
        bool strict_parsing = false;
    };

    // Pure; never runs a command. The controller feeds it the parsed dry runs.
    class DecisionEngine {
    public:
        explicit DecisionEngine(EngineOptions options = {}) : m_options(options) {}

        // yum/dnf pre-check. Returns a terminal verdict, or nothing if the run should go on to simulate.
        std::optional<Verdict> evaluate_update_check(const UpdateCheck& check) const;

        // True when apt only held packages back and a dist-upgrade dry run is needed to decide.
        bool needs_dist_upgrade_probe(BackendFamily family, const FindingSet& first) const;

        Verdict evaluate(BackendFamily family, const FindingSet& first,
                         const std::optional<FindingSet>& dist_upgrade = std::nullopt) const;

    private:
        Verdict evaluate_apt(const FindingSet& first, const std::optional<FindingSet>& dist_upgrade) const;
        Verdict evaluate_yum_dnf(const FindingSet& findings) const;

        EngineOptions m_options;
    };

    std::string to_string(VerdictKind kind);

} // namespace ap
