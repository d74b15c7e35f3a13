#pragma once

#include "core/types.hpp"

#include <span>
#include <string_view>

namespace promptsan {

/**
 * @brief Static pattern table for one category, in application order
 *
 * Patterns use RE2 syntax. Every entry carries its own `(?i)` flag where
 * matching is case-insensitive. The returned span refers to process-lifetime
 * constant storage.
 */
[[nodiscard]] std::span<const std::string_view> category_patterns(Category category);

/**
 * @brief Total number of pattern entries across all categories.
 */
[[nodiscard]] size_t total_pattern_count();

} // namespace promptsan
