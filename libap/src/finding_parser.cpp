//
// Created by the autopatch developers on 10/13/26.
//

#include "libap/finding_parser.h"

#include <set>
#include <sstream>
#include <utility>

namespace ap {

    // First package-list header in apt output; raw_detail starts here.
    // apt >= 3.0 (APT::Output-Version 30) prints the short titles.
    static const std::regex APT_LIST_HEADER(
            "^(The following packages|REMOVING:|Not upgrading:|DOWNGRADING:|(Upgrading|Installing|Installing dependencies):[ \\t]*$)");

    static std::vector<FindingRule> make_apt_rules() {
        const auto flags = std::regex::ECMAScript | std::regex::optimize;
        return {
            {FindingKind::PackagesToRemove, std::regex("The following packages will be REMOVED", flags), Capture::Block},
            {FindingKind::PackagesToRemove, std::regex("^REMOVING:", flags), Capture::Block},
            {FindingKind::PackagesToRemove, std::regex("WARNING: The following essential packages will be removed", flags), Capture::MatchedLine},
            {FindingKind::PackagesHeldBack, std::regex("The following packages have been kept back", flags), Capture::Block},
            {FindingKind::PackagesHeldBack, std::regex("^Not upgrading:", flags), Capture::Block},
            {FindingKind::ManualIntervention, std::regex("You should explicitly select", flags), Capture::MatchedLine},
            {FindingKind::ManualIntervention, std::regex("The following packages require", flags), Capture::MatchedLine},
            {FindingKind::ManualIntervention, std::regex("Need to get .* of archives", flags), Capture::MatchedLine},
            {FindingKind::Summary, std::regex("[0-9]+ upgraded, [0-9]+ newly installed, [0-9]+ to remove", flags), Capture::MatchedLine},
            {FindingKind::Summary, std::regex("Upgrading: [0-9]+, Installing: [0-9]+", flags), Capture::MatchedLine},
        };
    }

    static std::vector<FindingRule> make_yum_dnf_rules() {
        const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
        return {
            {FindingKind::PackagesToRemove, std::regex("removing", flags), Capture::MatchedLine},
            {FindingKind::ManualIntervention, std::regex("error:", flags), Capture::MatchedLine},
            {FindingKind::ManualIntervention, std::regex("warning:", flags), Capture::MatchedLine},
            {FindingKind::ManualIntervention, std::regex("conflict", flags), Capture::MatchedLine},
            {FindingKind::ManualIntervention, std::regex("failed", flags), Capture::MatchedLine},
            {FindingKind::ManualIntervention, std::regex("is needed by", flags), Capture::MatchedLine},
            {FindingKind::Summary, std::regex("Transaction Summary", flags), Capture::MatchedLine},
            {FindingKind::Summary, std::regex("Nothing to do", flags), Capture::MatchedLine},
            {FindingKind::Summary, std::regex("No packages marked for update", flags), Capture::MatchedLine},
            {FindingKind::Summary, std::regex("Dependencies resolved", flags), Capture::MatchedLine},
        };
    }

    const std::vector<FindingRule>& FindingParser::rules_for(BackendFamily family) {
        static const std::vector<FindingRule> apt_rules = make_apt_rules();
        static const std::vector<FindingRule> yum_dnf_rules = make_yum_dnf_rules();
        return family == BackendFamily::Apt ? apt_rules : yum_dnf_rules;
    }

    static std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines;
        std::stringstream ss(text);
        std::string line;
        while (std::getline(ss, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(std::move(line));
        }
        return lines;
    }

    static bool is_continuation(const std::string& line) {
        return !line.empty() && (line.front() == ' ' || line.front() == '\t');
    }

    static void append_capture(std::optional<std::string>& slot, const std::string& text) {
        if (slot) {
            *slot += "\n" + text;
        } else {
            slot = text;
        }
    }

    static std::string join_lines(const std::vector<std::string>& lines, size_t first, size_t count) {
        std::string joined;
        for (size_t i = first; i < lines.size() && i < first + count; ++i) {
            if (i != first) joined += '\n';
            joined += lines[i];
        }
        return joined;
    }

    // From the first package-list header, capped; the whole transcript is too
    // long to mail when apt lists hundreds of packages.
    static std::string apt_detail(const std::vector<std::string>& lines) {
        for (size_t i = 0; i < lines.size(); ++i) {
            if (std::regex_search(lines[i], APT_LIST_HEADER)) {
                return join_lines(lines, i, APT_DETAIL_MAX_LINES + 1);
            }
        }
        return join_lines(lines, 0, APT_DETAIL_MAX_LINES);
    }

    FindingSet FindingParser::parse(BackendFamily family, const DryRunOutput& output) {
        FindingSet findings;
        const auto lines = split_lines(output.text);
        // A line hit by two rules of the same kind is only captured once.
        std::set<std::pair<FindingKind, size_t>> seen;

        for (const auto& rule : rules_for(family)) {
            for (size_t i = 0; i < lines.size(); ++i) {
                if (!std::regex_search(lines[i], rule.pattern)) {
                    continue;
                }
                if (!seen.insert({rule.kind, i}).second) {
                    continue;
                }

                std::string captured = lines[i];
                if (rule.capture == Capture::Block) {
                    for (size_t j = i + 1; j < lines.size() && is_continuation(lines[j]); ++j) {
                        captured += "\n" + lines[j];
                    }
                }

                switch (rule.kind) {
                    case FindingKind::PackagesToRemove:
                        append_capture(findings.packages_to_remove, captured);
                        break;
                    case FindingKind::PackagesHeldBack:
                        append_capture(findings.packages_held_back, captured);
                        break;
                    case FindingKind::ManualIntervention:
                        append_capture(findings.manual_intervention, captured);
                        break;
                    case FindingKind::Summary:
                        findings.summary_recognized = true;
                        break;
                }
            }
        }

        findings.raw_detail = (family == BackendFamily::Apt) ? apt_detail(lines) : output.text;
        return findings;
    }

} // namespace ap
