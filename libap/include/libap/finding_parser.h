//
// Created by the autopatch developers on 10/13/26.
//

#pragma once

#include "libap/backend.h"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace ap {

    // What a dry run revealed. All three optional fields empty means "safe".
    struct FindingSet {
        std::optional<std::string> packages_to_remove;
        std::optional<std::string> packages_held_back; // apt only
        std::optional<std::string> manual_intervention;
        std::string raw_detail;
        bool summary_recognized = false;

        bool is_safe() const {
            return !packages_to_remove && !packages_held_back && !manual_intervention;
        }

        bool operator==(const FindingSet&) const = default;
    };

    enum class FindingKind {
        PackagesToRemove,
        PackagesHeldBack,
        ManualIntervention,
        Summary
    };

    enum class Capture {
        MatchedLine, // just the line that matched
        Block        // the matching header plus the indented lines under it
    };

    struct FindingRule {
        FindingKind kind;
        std::regex pattern;
        Capture capture;
    };

    // apt: header line + this many following lines go into raw_detail.
    inline constexpr size_t APT_DETAIL_MAX_LINES = 100;

    class FindingParser {
    public:
        static FindingSet parse(BackendFamily family, const DryRunOutput& output);

        // Phrasings are tied to the tool's version; extend these tables rather than the parse loop.
        static const std::vector<FindingRule>& rules_for(BackendFamily family);
    };

} // namespace ap
