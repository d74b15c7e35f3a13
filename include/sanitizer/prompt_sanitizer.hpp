#pragma once

#include "core/types.hpp"
#include "sanitizer/category_filter.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace promptsan {

/**
 * @brief Prompt-injection sanitization pipeline
 *
 * Runs the ten category filters in pipeline order, each on the output of
 * the previous one, then trims surrounding whitespace. Input whose trimmed
 * form is empty short-circuits to an empty result.
 *
 * Instances are immutable after construction and safe to share between
 * threads.
 */
class PromptSanitizer {
public:
    // Built-in rule set in kPipelineOrder
    PromptSanitizer();

    // Caller-supplied filters, applied in the given order
    explicit PromptSanitizer(std::vector<CategoryFilter> filters);

    /**
     * @brief Process-wide instance over the built-in rule set, compiled on first use.
     */
    [[nodiscard]] static const PromptSanitizer& instance();

    [[nodiscard]] std::string sanitize(std::string_view input) const;

    /**
     * @brief Same output as sanitize(), plus per-category replacement counts
     */
    [[nodiscard]] SanitizeReport analyze(std::string_view input) const;

    [[nodiscard]] const std::vector<CategoryFilter>& filters() const { return filters_; }
    [[nodiscard]] size_t skipped_rule_count() const { return skipped_rules_; }

private:
    std::vector<CategoryFilter> filters_;
    size_t skipped_rules_ = 0;
};

/**
 * @brief Sanitize text with the built-in rule set. Total; never throws on any input.
 */
[[nodiscard]] std::string sanitize(std::string_view input);

} // namespace promptsan
