#include "sanitizer/prompt_sanitizer.hpp"
#include "sanitizer/pattern_tables.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>

namespace promptsan {

namespace {

std::vector<CategoryFilter> build_default_filters() {
    std::vector<CategoryFilter> filters;
    filters.reserve(kPipelineOrder.size());
    for (const auto category : kPipelineOrder) {
        filters.emplace_back(category, category_patterns(category));
    }
    return filters;
}

} // anonymous namespace

PromptSanitizer::PromptSanitizer()
    : PromptSanitizer(build_default_filters()) {}

PromptSanitizer::PromptSanitizer(std::vector<CategoryFilter> filters)
    : filters_(std::move(filters)) {
    for (const auto& filter : filters_) {
        skipped_rules_ += filter.skipped_rules();
    }
    if (skipped_rules_ > 0) {
        utils::log::warn(std::format("{} pattern rule(s) failed to compile and will be skipped",
            skipped_rules_));
    }
}

const PromptSanitizer& PromptSanitizer::instance() {
    static const PromptSanitizer sanitizer;
    return sanitizer;
}

std::string PromptSanitizer::sanitize(std::string_view input) const {
    return analyze(input).text;
}

SanitizeReport PromptSanitizer::analyze(std::string_view input) const {
    SanitizeReport report;
    report.skipped_rules = skipped_rules_;

    if (utils::trim_view(input).empty()) {
        return report;
    }

    std::string text(input);
    report.categories.reserve(filters_.size());
    for (const auto& filter : filters_) {
        CategoryReport entry;
        entry.category = filter.category();
        text = filter.apply(std::move(text), entry.replacements);
        report.total_replacements += entry.replacements;
        report.categories.push_back(entry);
    }

    report.text = utils::trim(text);
    return report;
}

std::string sanitize(std::string_view input) {
    return PromptSanitizer::instance().sanitize(input);
}

} // namespace promptsan
