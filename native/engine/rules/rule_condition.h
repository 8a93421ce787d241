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

#include "rules/pattern_matcher.h"
#include <cstddef>
#include <optional>
#include <string_view>

namespace rulebox {
namespace rules {

/**
 * Boolean combination of pattern groups deciding whether a rule fires.
 *
 * Evaluation order (short-circuit):
 * 1. not_patterns present and any matches  -> false
 * 2. neither or_patterns nor and_patterns  -> true if not_patterns present
 *                                             (pure negative), else false
 * 3. or_patterns present and none match    -> false
 * 4. and_patterns present and one misses   -> false
 * 5. otherwise                             -> true
 *
 * A group that is present is never empty (checked at construction).
 */
class RuleCondition {
public:
    /**
     * @throws MalformedDefinitionError if a present group is empty
     */
    RuleCondition(std::optional<PatternGroup> or_patterns,
                  std::optional<PatternGroup> and_patterns,
                  std::optional<PatternGroup> not_patterns);

    RuleCondition(RuleCondition&&) noexcept = default;
    RuleCondition& operator=(RuleCondition&&) noexcept = default;

    bool evaluate(std::string_view text) const;

    const std::optional<PatternGroup>& orPatterns() const { return or_patterns_; }
    const std::optional<PatternGroup>& andPatterns() const { return and_patterns_; }
    const std::optional<PatternGroup>& notPatterns() const { return not_patterns_; }

    /**
     * No groups at all - never fires.
     */
    bool isEmpty() const;

    /**
     * Only not_patterns - fires on any text none of them match.
     */
    bool isPurelyNegative() const;

    size_t patternCount() const;

private:
    std::optional<PatternGroup> or_patterns_;
    std::optional<PatternGroup> and_patterns_;
    std::optional<PatternGroup> not_patterns_;
};

}  // namespace rules
}  // namespace rulebox
