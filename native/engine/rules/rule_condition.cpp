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

#include "rules/rule_condition.h"
#include "rules/rule_errors.h"
#include <algorithm>
#include <utility>

namespace rulebox {
namespace rules {

namespace {

void requireNonEmpty(const std::optional<PatternGroup>& group, const char* name) {
    if (group && group->empty()) {
        MalformedDefinitionError error("pattern group must not be empty");
        error.attachLocation(name);
        throw error;
    }
}

bool anyMatches(const PatternGroup& group, std::string_view text) {
    return std::any_of(group.begin(), group.end(),
                       [text](const PatternMatcher& m) { return m.matches(text); });
}

bool allMatch(const PatternGroup& group, std::string_view text) {
    return std::all_of(group.begin(), group.end(),
                       [text](const PatternMatcher& m) { return m.matches(text); });
}

}  // namespace

RuleCondition::RuleCondition(std::optional<PatternGroup> or_patterns,
                             std::optional<PatternGroup> and_patterns,
                             std::optional<PatternGroup> not_patterns)
    : or_patterns_(std::move(or_patterns)),
      and_patterns_(std::move(and_patterns)),
      not_patterns_(std::move(not_patterns)) {
    requireNonEmpty(or_patterns_, "or_patterns");
    requireNonEmpty(and_patterns_, "and_patterns");
    requireNonEmpty(not_patterns_, "not_patterns");
}

bool RuleCondition::evaluate(std::string_view text) const {
    // NOT group vetoes before anything else is evaluated
    if (not_patterns_ && anyMatches(*not_patterns_, text)) {
        return false;
    }

    if (!or_patterns_ && !and_patterns_) {
        return not_patterns_.has_value();
    }

    if (or_patterns_ && !anyMatches(*or_patterns_, text)) {
        return false;
    }

    if (and_patterns_ && !allMatch(*and_patterns_, text)) {
        return false;
    }

    return true;
}

bool RuleCondition::isEmpty() const {
    return !or_patterns_ && !and_patterns_ && !not_patterns_;
}

bool RuleCondition::isPurelyNegative() const {
    return !or_patterns_ && !and_patterns_ && not_patterns_;
}

size_t RuleCondition::patternCount() const {
    size_t count = 0;
    if (or_patterns_)  count += or_patterns_->size();
    if (and_patterns_) count += and_patterns_->size();
    if (not_patterns_) count += not_patterns_->size();
    return count;
}

}  // namespace rules
}  // namespace rulebox
