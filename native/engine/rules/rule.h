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

#include "rules/rule_condition.h"
#include <string>
#include <string_view>

namespace rulebox {
namespace rules {

/**
 * Optional bookkeeping fields carried by a rule definition.
 */
struct RuleMetadata {
    std::string uuid;        // Opaque identifier; Loader generates a UUIDv7 when absent
    std::string proto_text;  // Example text the rule is expected to fire on
    bool active = true;      // Inactive rules are compiled but never fire
};

/**
 * Label plus the condition that decides whether the label is emitted.
 *
 * Labels are opaque: emitted verbatim and not required to be unique.
 */
class Rule {
public:
    /**
     * @throws MalformedDefinitionError if label is empty
     */
    Rule(std::string label, RuleCondition condition, RuleMetadata metadata = {});

    Rule(Rule&&) noexcept = default;
    Rule& operator=(Rule&&) noexcept = default;

    /**
     * True if the rule is active and its condition holds for text.
     */
    bool fires(std::string_view text) const {
        return metadata_.active && condition_.evaluate(text);
    }

    const std::string& label() const { return label_; }
    const RuleCondition& condition() const { return condition_; }
    const RuleMetadata& metadata() const { return metadata_; }
    bool isActive() const { return metadata_.active; }

private:
    std::string label_;
    RuleCondition condition_;
    RuleMetadata metadata_;
};

}  // namespace rules
}  // namespace rulebox
