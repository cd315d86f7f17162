//
// Created by the autopatch developers on 10/13/26.
//

#include "libap/decision_engine.h"

namespace ap {

    std::optional<Verdict> DecisionEngine::evaluate_update_check(const UpdateCheck& check) const {
        switch (check.availability) {
            case UpdateAvailability::None:
                return Verdict::no_updates();
            case UpdateAvailability::Error:
                return Verdict::detection_failed(
                        to_string(BackendError{BackendErrorKind::UpdateCheckFailed, check.exit_code}));
            case UpdateAvailability::Available:
                break;
        }
        return std::nullopt;
    }

    bool DecisionEngine::needs_dist_upgrade_probe(BackendFamily family, const FindingSet& first) const {
        return family == BackendFamily::Apt
               && !first.packages_to_remove
               && !first.manual_intervention
               && first.packages_held_back.has_value();
    }

    Verdict DecisionEngine::evaluate(BackendFamily family, const FindingSet& first,
                                     const std::optional<FindingSet>& dist_upgrade) const {
        if (family == BackendFamily::Apt) {
            return evaluate_apt(first, dist_upgrade);
        }
        return evaluate_yum_dnf(first);
    }

    Verdict DecisionEngine::evaluate_apt(const FindingSet& first, const std::optional<FindingSet>& dist_upgrade) const {
        if (first.packages_to_remove || first.manual_intervention) {
            return Verdict::escalate(REASON_REMOVAL_OR_MANUAL, first.raw_detail);
        }
        if (m_options.strict_parsing && !first.summary_recognized) {
            return Verdict::escalate(REASON_UNRECOGNIZED_OUTPUT, first.raw_detail);
        }

        if (!first.packages_held_back) {
            return Verdict::proceed_simple();
        }

        // Held back: only a dist-upgrade can pull these in, and that may remove things.
        if (!dist_upgrade) {
            return Verdict::escalate(REASON_DIST_UPGRADE_NOT_PROBED, *first.packages_held_back);
        }

        if (dist_upgrade->packages_to_remove) {
            std::string combined = "Kept back:\n" + *first.packages_held_back
                                   + "\n\ndist-upgrade details:\n" + dist_upgrade->raw_detail;
            return Verdict::escalate(REASON_DIST_UPGRADE_WOULD_REMOVE, std::move(combined));
        }
        if (m_options.strict_parsing && !dist_upgrade->summary_recognized) {
            return Verdict::escalate(REASON_UNRECOGNIZED_OUTPUT, dist_upgrade->raw_detail);
        }
        return Verdict::proceed_dist();
    }

    Verdict DecisionEngine::evaluate_yum_dnf(const FindingSet& findings) const {
        if (findings.packages_to_remove || findings.manual_intervention) {
            return Verdict::escalate(REASON_REMOVAL_OR_CONFLICT, findings.raw_detail);
        }
        if (m_options.strict_parsing && !findings.summary_recognized) {
            return Verdict::escalate(REASON_UNRECOGNIZED_OUTPUT, findings.raw_detail);
        }
        return Verdict::proceed_simple();
    }

    std::string to_string(VerdictKind kind) {
        switch (kind) {
            case VerdictKind::ProceedSimpleUpgrade: return "ProceedSimpleUpgrade";
            case VerdictKind::ProceedDistUpgrade: return "ProceedDistUpgrade";
            case VerdictKind::Escalate: return "Escalate";
            case VerdictKind::NoUpdatesAvailable: return "NoUpdatesAvailable";
            case VerdictKind::DetectionFailed: return "DetectionFailed";
        }
        return "Unknown";
    }

} // namespace ap
