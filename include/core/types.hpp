#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace promptsan {

// ============================================================================
// Marker
// ============================================================================

// Literal token written in place of every matched pattern
inline constexpr std::string_view kFilteredMarker = "[FILTERED]";

// ============================================================================
// Categories (pipeline order)
// ============================================================================

enum class Category : uint8_t {
    SYSTEM_PROMPT_INJECTION,
    ROLE_MANIPULATION,
    INSTRUCTION_OVERRIDE,
    CONTEXT_ESCAPE,
    JAILBREAK,
    PROMPT_LEAKING,
    CODE_EXECUTION,
    TRAINING_DATA_EXTRACTION,
    INDIRECT_INJECTION,
    MODEL_MANIPULATION
};

inline constexpr size_t kCategoryCount = 10;

// Order in which the pipeline applies categories. Later categories only ever
// see the output of earlier ones.
inline constexpr std::array<Category, kCategoryCount> kPipelineOrder = {
    Category::SYSTEM_PROMPT_INJECTION,
    Category::ROLE_MANIPULATION,
    Category::INSTRUCTION_OVERRIDE,
    Category::CONTEXT_ESCAPE,
    Category::JAILBREAK,
    Category::PROMPT_LEAKING,
    Category::CODE_EXECUTION,
    Category::TRAINING_DATA_EXTRACTION,
    Category::INDIRECT_INJECTION,
    Category::MODEL_MANIPULATION,
};

inline constexpr const char* category_to_string(Category category) {
    switch (category) {
        case Category::SYSTEM_PROMPT_INJECTION:  return "system_prompt_injection";
        case Category::ROLE_MANIPULATION:        return "role_manipulation";
        case Category::INSTRUCTION_OVERRIDE:     return "instruction_override";
        case Category::CONTEXT_ESCAPE:           return "context_escape";
        case Category::JAILBREAK:                return "jailbreak";
        case Category::PROMPT_LEAKING:           return "prompt_leaking";
        case Category::CODE_EXECUTION:           return "code_execution";
        case Category::TRAINING_DATA_EXTRACTION: return "training_data_extraction";
        case Category::INDIRECT_INJECTION:       return "indirect_injection";
        case Category::MODEL_MANIPULATION:       return "model_manipulation";
        default:                                 return "unknown";
    }
}

// ============================================================================
// Reports
// ============================================================================

struct CategoryReport {
    Category category = Category::SYSTEM_PROMPT_INJECTION;
    size_t replacements = 0;
};

/**
 * @brief Result of a sanitization pass with per-category accounting
 *
 * `text` is exactly what sanitize() returns for the same input.
 */
struct SanitizeReport {
    std::string text;
    std::vector<CategoryReport> categories;
    size_t total_replacements = 0;
    size_t skipped_rules = 0;

    [[nodiscard]] bool clean() const { return total_replacements == 0; }
};

} // namespace promptsan
