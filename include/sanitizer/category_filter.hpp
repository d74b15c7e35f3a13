#pragma once

#include "core/types.hpp"
#include "sanitizer/pattern_rule.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace promptsan {

/**
 * @brief Apply an ordered rule list to text
 *
 * Each rule replaces all of its non-overlapping matches with the marker and
 * hands the rewritten text to the next rule. Rules that failed to compile
 * are skipped.
 *
 * @param text Input buffer (consumed)
 * @param rules Rules in application order
 * @param replacements Incremented by the number of replacements made
 * @return Rewritten text
 */
[[nodiscard]] std::string apply_rules(std::string text,
                                      std::span<const PatternRule> rules,
                                      size_t& replacements);

[[nodiscard]] std::string apply_rules(std::string text, std::span<const PatternRule> rules);

/**
 * @brief One themed group of rules, compiled from its static table
 */
class CategoryFilter {
public:
    CategoryFilter(Category category, std::span<const std::string_view> patterns);

    [[nodiscard]] Category category() const { return category_; }
    [[nodiscard]] const char* name() const { return category_to_string(category_); }

    [[nodiscard]] const std::vector<PatternRule>& rules() const { return rules_; }
    [[nodiscard]] size_t skipped_rules() const { return skipped_; }

    [[nodiscard]] std::string apply(std::string text) const;
    [[nodiscard]] std::string apply(std::string text, size_t& replacements) const;

private:
    Category category_;
    std::vector<PatternRule> rules_;
    size_t skipped_ = 0;
};

} // namespace promptsan
