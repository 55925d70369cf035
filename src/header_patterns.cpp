#include "paper_splitter/header_patterns.h"
#include "paper_splitter/text_utils.h"
#include <algorithm>

namespace paper_splitter {

namespace {

const char* const STATUS_TAG = "(SOLVED|UNSOLVED|SOLUTIONS)";

std::string normalize_match(const std::string& matched) {
    std::string text = trim(matched);
    std::replace(text.begin(), text.end(), '\n', ' ');
    return text;
}

bool better_match(const PatternMatch& candidate, const PatternMatch& best) {
    if (candidate.specificity != best.specificity) {
        return candidate.specificity > best.specificity;
    }
    if (candidate.priority != best.priority) {
        return candidate.priority < best.priority;
    }
    return candidate.position < best.position;
}

} // namespace

HeaderPatternSet HeaderPatternSet::defaults() {
    const std::string tag = STATUS_TAG;

    HeaderPatternSet set;
    int priority = 0;
    set.add("tagged_self_assessment", tag + "\\s+Self\\s+Assessment\\s+Paper-\\d+", priority++);
    set.add("self_assessment", "Self\\s+Assessment\\s+Paper-\\d+", priority++);
    set.add("sample_question", tag + "?\\s*Sample\\s+Question\\s+(?:SOLVED\\s+)?Paper-\\d+", priority++);
    set.add("practice_paper", tag + "?\\s*(Practice|Mock|Test|Question)\\s+(Paper|Test)?-\\d+", priority++);
    set.add("sqp", tag + "?\\s*SQP\\s*-\\s*\\d+", priority++);
    set.add("sap", tag + "?\\s*SAP\\s*-\\s*\\d+", priority++);
    set.add("pp", tag + "?\\s*PP\\s*-\\s*\\d+", priority++);
    set.add("numbered_mind_map", "Mind\\s+Map\\s*-\\s*\\d+", priority++);
    set.add("mind_map", "Mind\\s+map", priority++);
    set.add("on_tips", "On\\s+tips", priority++);
    set.add("generic_chapter", "\\s*" + tag + "?\\s*(chapter|unit|part)\\s*\\d+\\s*[:.\\-]?\\s*.*", priority++);
    return set;
}

void HeaderPatternSet::add(const std::string& label, const std::string& expression, int priority) {
    patterns_.push_back({
        label,
        std::regex(expression, std::regex::ECMAScript | std::regex::icase),
        priority
    });
}

std::vector<PatternMatch> HeaderPatternSet::match_all(const std::string& header) const {
    std::vector<PatternMatch> matches;
    if (header.empty()) {
        return matches;
    }

    std::vector<size_t> line_starts{0};
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == '\n' && i + 1 < header.size()) {
            line_starts.push_back(i + 1);
        }
    }

    for (const auto& pattern : patterns_) {
        size_t resume_at = 0;
        for (size_t start : line_starts) {
            if (start < resume_at) {
                continue;
            }

            std::smatch match;
            if (!std::regex_search(header.cbegin() + start, header.cend(), match, pattern.regex,
                                   std::regex_constants::match_continuous)) {
                continue;
            }

            std::string text = normalize_match(match.str(0));
            resume_at = start + std::max<size_t>(match.length(0), 1);
            if (text.empty()) {
                continue;
            }

            matches.push_back({text, text.length(), pattern.priority, pattern.label, start});
        }
    }

    return matches;
}

std::optional<PatternMatch> HeaderPatternSet::best_match(const std::string& header) const {
    std::optional<PatternMatch> best;
    for (auto& candidate : match_all(header)) {
        if (!best || better_match(candidate, *best)) {
            best = std::move(candidate);
        }
    }
    return best;
}

} // namespace paper_splitter
