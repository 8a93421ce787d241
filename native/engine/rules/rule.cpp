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

#include "rules/rule.h"
#include "rules/rule_errors.h"
#include <utility>

namespace rulebox {
namespace rules {

Rule::Rule(std::string label, RuleCondition condition, RuleMetadata metadata)
    : label_(std::move(label)),
      condition_(std::move(condition)),
      metadata_(std::move(metadata)) {
    if (label_.empty()) {
        MalformedDefinitionError error("label must be a non-empty string");
        error.attachLocation("label");
        throw error;
    }
}

}  // namespace rules
}  // namespace rulebox
