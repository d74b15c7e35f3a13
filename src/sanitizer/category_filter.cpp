#include "sanitizer/category_filter.hpp"
#include "core/utils.hpp"

#include <format>

namespace promptsan {

std::string apply_rules(std::string text,
                        std::span<const PatternRule> rules,
                        size_t& replacements) {
    for (const auto& rule : rules) {
        replacements += rule.replace_all(text);
    }
    return text;
}

std::string apply_rules(std::string text, std::span<const PatternRule> rules) {
    size_t ignored = 0;
    return apply_rules(std::move(text), rules, ignored);
}

CategoryFilter::CategoryFilter(Category category, std::span<const std::string_view> patterns)
    : category_(category) {
    rules_.reserve(patterns.size());
    for (const auto pattern : patterns) {
        PatternRule rule(pattern);
        if (!rule.ok()) {
            // Fail open: a broken rule is dropped, the rest of the category still runs
            utils::log::warn(std::format("Skipping {} pattern '{}': {}",
                name(), rule.pattern(), rule.error()));
            ++skipped_;
            continue;
        }
        rules_.emplace_back(std::move(rule));
    }
}

std::string CategoryFilter::apply(std::string text) const {
    return apply_rules(std::move(text), rules_);
}

std::string CategoryFilter::apply(std::string text, size_t& replacements) const {
    return apply_rules(std::move(text), rules_, replacements);
}

} // namespace promptsan
