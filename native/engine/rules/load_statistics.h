/*
 * Copyright 2025 AxonOps
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace rulebox {
namespace rules {

class Rule;

/**
 * Structural statistics of a rule set, computed once at construction.
 *
 * Plain values (no atomics): a rule set never changes after it is built.
 */
struct LoadStatistics {
    // Rules
    uint64_t rule_count = 0;
    uint64_t active_rule_count = 0;
    uint64_t empty_rule_count = 0;          // No groups, can never fire
    uint64_t purely_negative_rule_count = 0;

    // Patterns per group
    uint64_t or_pattern_count = 0;
    uint64_t and_pattern_count = 0;
    uint64_t not_pattern_count = 0;

    // Flags
    uint64_t case_insensitive_patterns = 0;
    uint64_t multi_line_patterns = 0;

    // RE2 program sizes
    uint64_t total_program_size = 0;
    uint64_t max_program_size = 0;

    std::chrono::system_clock::time_point generated_at;

    uint64_t patternCount() const {
        return or_pattern_count + and_pattern_count + not_pattern_count;
    }

    /**
     * Walk every rule and pattern.
     */
    static LoadStatistics collect(const std::vector<Rule>& rules);

    /**
     * Serialize to JSON.
     *
     * @return JSON string
     */
    std::string toJson() const;
};

}  // namespace rules
}  // namespace rulebox
