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

#include "rules/load_statistics.h"
#include "rules/rule.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>

using json = nlohmann::json;

namespace rulebox {
namespace rules {

// Helper to format ISO 8601 timestamp
static std::string formatISO8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    #ifdef _WIN32
        gmtime_s(&tm, &time_t);
    #else
        gmtime_r(&time_t, &tm);
    #endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

static void countGroup(const std::optional<PatternGroup>& group,
                       uint64_t& group_counter,
                       LoadStatistics& stats) {
    if (!group) {
        return;
    }

    for (const auto& matcher : *group) {
        group_counter++;
        if (matcher.options().case_insensitive) stats.case_insensitive_patterns++;
        if (matcher.options().multi_line)       stats.multi_line_patterns++;

        uint64_t size = matcher.programSize();
        stats.total_program_size += size;
        stats.max_program_size = std::max(stats.max_program_size, size);
    }
}

LoadStatistics LoadStatistics::collect(const std::vector<Rule>& rules) {
    LoadStatistics stats;
    stats.generated_at = std::chrono::system_clock::now();

    for (const auto& rule : rules) {
        stats.rule_count++;
        if (rule.isActive()) stats.active_rule_count++;

        const RuleCondition& condition = rule.condition();
        if (condition.isEmpty())          stats.empty_rule_count++;
        if (condition.isPurelyNegative()) stats.purely_negative_rule_count++;

        countGroup(condition.orPatterns(), stats.or_pattern_count, stats);
        countGroup(condition.andPatterns(), stats.and_pattern_count, stats);
        countGroup(condition.notPatterns(), stats.not_pattern_count, stats);
    }

    return stats;
}

std::string LoadStatistics::toJson() const {
    json j;

    j["generated_at"] = formatISO8601(generated_at);

    // Rules
    json rules;
    rules["total"] = rule_count;
    rules["active"] = active_rule_count;
    rules["empty"] = empty_rule_count;
    rules["purely_negative"] = purely_negative_rule_count;
    j["rules"] = rules;

    // Patterns
    json patterns;
    patterns["total"] = patternCount();
    patterns["or"] = or_pattern_count;
    patterns["and"] = and_pattern_count;
    patterns["not"] = not_pattern_count;
    patterns["case_insensitive"] = case_insensitive_patterns;
    patterns["multi_line"] = multi_line_patterns;
    j["patterns"] = patterns;

    // RE2 programs
    json programs;
    programs["total_size"] = total_program_size;
    programs["max_size"] = max_program_size;
    programs["avg_size"] = patternCount() > 0 ? total_program_size / patternCount() : 0;
    j["re2_programs"] = programs;

    return j.dump();
}

}  // namespace rules
}  // namespace rulebox
