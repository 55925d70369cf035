#pragma once

#include <string>
#include <vector>
#include <regex>
#include <optional>

namespace paper_splitter {

// One structural title template. Lower priority values win ties between
// matches of equal specificity.
struct HeaderPattern {
    std::string label;
    std::regex regex;
    int priority;
};

struct PatternMatch {
    std::string text;        // trimmed, newlines folded to spaces
    size_t specificity;      // text.length()
    int priority;
    std::string label;
    size_t position;         // offset of the match in the header string
};

class HeaderPatternSet {
public:
    HeaderPatternSet() = default;

    // Self Assessment / Sample Question / Practice papers, their
    // abbreviations, mind maps and the generic chapter/unit/part fallback.
    static HeaderPatternSet defaults();

    // `expression` is an ECMAScript regex without a leading `^`; it is
    // matched case-insensitively and only at line starts.
    void add(const std::string& label, const std::string& expression, int priority);

    // Every non-overlapping line-anchored match of every pattern.
    std::vector<PatternMatch> match_all(const std::string& header) const;

    // Longest match; ties go to the lower priority value, then to the
    // earlier position in the header.
    std::optional<PatternMatch> best_match(const std::string& header) const;

    size_t size() const { return patterns_.size(); }
    const std::vector<HeaderPattern>& patterns() const { return patterns_; }

private:
    std::vector<HeaderPattern> patterns_;
};

} // namespace paper_splitter
