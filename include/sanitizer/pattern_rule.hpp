#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace re2 {
class RE2;
}

namespace promptsan {

/**
 * @brief One compiled, immutable pattern tied to the [FILTERED] marker
 *
 * Backed by RE2, so matching time is linear in the input length regardless
 * of the pattern. \s and \w match Unicode whitespace and word characters,
 * and a \b at either end of the pattern is a Unicode word boundary. A \b
 * anywhere else is rejected. Compilation failures do not throw: the rule
 * reports !ok() and behaves as a no-op.
 */
class PatternRule {
public:
    explicit PatternRule(std::string_view pattern);
    ~PatternRule();

    PatternRule(PatternRule&&) noexcept;
    PatternRule& operator=(PatternRule&&) noexcept;
    PatternRule(const PatternRule&) = delete;
    PatternRule& operator=(const PatternRule&) = delete;

    [[nodiscard]] bool ok() const { return re_ != nullptr; }
    [[nodiscard]] const std::string& pattern() const { return pattern_; }
    [[nodiscard]] const std::string& error() const { return error_; }

    /**
     * @brief True if the pattern matches anywhere in text.
     */
    [[nodiscard]] bool matches(std::string_view text) const;

    /**
     * @brief Replace every non-overlapping leftmost match with the marker
     * @param text Buffer rewritten in place
     * @return Number of replacements made (0 for a rule that failed to compile)
     */
    size_t replace_all(std::string& text) const;

private:
    // First match at or after from whose ends satisfy the word-boundary flags
    bool find(std::string_view text, size_t from, size_t& begin, size_t& end) const;

    std::string pattern_;
    std::string error_;
    std::unique_ptr<const re2::RE2> re_;
    bool word_start_ = false;
    bool word_end_ = false;
};

} // namespace promptsan
