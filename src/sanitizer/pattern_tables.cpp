#include "sanitizer/pattern_tables.hpp"

#include <array>

namespace promptsan {

namespace {

// Explicit role headers and wholesale instruction resets
constexpr std::array<std::string_view, 6> kSystemPromptInjection = {
    R"((?i)\bsystem\s*:)",
    R"((?i)\byou\s+are\s+now\b)",
    R"((?i)\bignore\s+previous\s+instructions\b)",
    R"((?i)\bignore\s+all\s+previous\s+instructions\b)",
    R"((?i)\bforget\s+everything\b)",
    R"((?i)\bnew\s+instructions\s*:)",
};

constexpr std::array<std::string_view, 5> kRoleManipulation = {
    R"((?i)\bact\s+as\s+a\s+\w+)",
    R"((?i)\bpretend\s+to\s+be\b)",
    R"((?i)\broleplay\s+as\b)",
    R"((?i)\bsimulate\s+being\b)",
    R"((?i)\btake\s+on\s+the\s+role\b)",
};

// The singular "instruction" rule appears twice; the second pass is a no-op
// but is kept so the table stays identical to the published rule set.
constexpr std::array<std::string_view, 7> kInstructionOverride = {
    R"((?i)\binstead\s+of\s+following\b)",
    R"((?i)\boverride\s+your\s+instructions\b)",
    R"((?i)\bignore\s+previous\s+instruction\b)",
    R"((?i)\bdisregard\s+the\s+above\b)",
    R"((?i)\bignore\s+your\s+guidelines\b)",
    R"((?i)\bignore\s+previous\s+instruction\b)",
    R"((?i)\bnew\s+directive\s*:)",
};

constexpr std::array<std::string_view, 5> kContextEscape = {
    R"((?i)\bbreak\s+out\s+of\s+character\b)",
    R"((?i)\bexit\s+the\s+simulation\b)",
    R"((?i)\bend\s+conversation\b)",
    R"((?i)\bstop\s+being\s+an?\s+\w+)",
    R"((?i)\bleave\s+your\s+role\b)",
};

constexpr std::array<std::string_view, 6> kJailbreak = {
    R"((?i)\bjailbreak\b)",
    R"((?i)\bdan\s+mode\b)",
    R"((?i)\bdeveloper\s+mode\b)",
    R"((?i)\bevil\s+mode\b)",
    R"((?i)\bunrestricted\s+mode\b)",
    R"((?i)\bbypass\s+safety\b)",
};

constexpr std::array<std::string_view, 5> kPromptLeaking = {
    R"((?i)\bshow\s+me\s+your\s+prompt\b)",
    R"((?i)\bwhat\s+are\s+your\s+instructions\b)",
    R"((?i)\brepeat\s+your\s+system\s+message\b)",
    R"((?i)\breveal\s+your\s+guidelines\b)",
    R"((?i)\bdisplay\s+your\s+configuration\b)",
};

// Fenced blocks are matched lazily so two blocks on one line stay separate
constexpr std::array<std::string_view, 6> kCodeExecution = {
    R"((?i)\bexecute\s+code\b)",
    R"((?i)\brun\s+this\s+script\b)",
    R"((?i)\beval\s*\()",
    R"((?i)\bsystem\s*\()",
    R"((?i)\bshell\s+command\b)",
    R"(```[\s\S]*?```)",
};

constexpr std::array<std::string_view, 6> kTrainingDataExtraction = {
    R"((?i)\btraining\s+data\b)",
    R"((?i)\bmemorized\s+content\b)",
    R"((?i)\brepeat\s+verbatim\b)",
    R"((?i)\bexact\s+copy\b)",
    R"((?i)\bword\s+for\s+word\b)",
    R"((?i)\bwhat\s+did\s+you\s+learn\b)",
};

constexpr std::array<std::string_view, 5> kIndirectInjection = {
    R"((?i)\bwhen\s+you\s+see\s+this\b)",
    R"((?i)\bif\s+someone\s+asks\b)",
    R"((?i)\bfuture\s+instructions\b)",
    R"((?i)\bnext\s+time\s+respond\b)",
    R"((?i)\bremember\s+to\s+always\b)",
};

constexpr std::array<std::string_view, 6> kModelManipulation = {
    R"((?i)\btemperature\s*=)",
    R"((?i)\bmax_tokens\s*=)",
    R"((?i)\btop_p\s*=)",
    R"((?i)\bfrequency_penalty\b)",
    R"((?i)\bpresence_penalty\b)",
    R"((?i)\bmodel\s+parameters\b)",
};

} // anonymous namespace

std::span<const std::string_view> category_patterns(Category category) {
    switch (category) {
        case Category::SYSTEM_PROMPT_INJECTION:  return kSystemPromptInjection;
        case Category::ROLE_MANIPULATION:        return kRoleManipulation;
        case Category::INSTRUCTION_OVERRIDE:     return kInstructionOverride;
        case Category::CONTEXT_ESCAPE:           return kContextEscape;
        case Category::JAILBREAK:                return kJailbreak;
        case Category::PROMPT_LEAKING:           return kPromptLeaking;
        case Category::CODE_EXECUTION:           return kCodeExecution;
        case Category::TRAINING_DATA_EXTRACTION: return kTrainingDataExtraction;
        case Category::INDIRECT_INJECTION:       return kIndirectInjection;
        case Category::MODEL_MANIPULATION:       return kModelManipulation;
    }
    return {};
}

size_t total_pattern_count() {
    size_t total = 0;
    for (const auto category : kPipelineOrder) {
        total += category_patterns(category).size();
    }
    return total;
}

} // namespace promptsan
