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

#include "rules/engine_config.h"
#include "rules/rule_errors.h"
#include "rules/rule_set.h"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>

namespace rulebox {
namespace rules {

/**
 * Loader - builds an immutable RuleSet from a JSON rule definition.
 *
 * Definition format (array order = evaluation order):
 * [
 *   { "label": "greeting",
 *     "uuid": "...",            (optional, generated UUIDv7 if absent)
 *     "proto_text": "...",      (optional)
 *     "active": true,           (optional, default true)
 *     "rule": {
 *       "or_patterns":  [ { "pattern": "\\bhello\\b", "flags": ["i"] } ],
 *       "and_patterns": [ ... ],
 *       "not_patterns": [ ... ]
 *     }
 *   }
 * ]
 *
 * Loading is all-or-nothing: the first problem aborts with a LoaderError
 * subclass carrying the rule index, label, group position and pattern.
 */
class Loader {
public:
    explicit Loader(const EngineConfig& config = EngineConfig::defaults());

    /**
     * Load from a JSON file.
     *
     * @throws SourceReadError if the file cannot be read
     * @throws LoaderError subclasses for invalid content
     */
    std::shared_ptr<const RuleSet> fromPath(const std::string& path) const;

    /**
     * Load from JSON text.
     *
     * @throws MalformedDefinitionError if text is not valid JSON
     * @throws LoaderError subclasses for invalid content
     */
    std::shared_ptr<const RuleSet> fromJson(const std::string& json_text) const;

    /**
     * Load from an already-parsed JSON document.
     *
     * @throws LoaderError subclasses for invalid content
     */
    std::shared_ptr<const RuleSet> fromDefinition(const nlohmann::json& definition) const;

    const EngineConfig& config() const { return config_; }

private:
    std::shared_ptr<const RuleSet> build(const nlohmann::json& definition,
                                         const std::string& source) const;
    Rule parseRule(const nlohmann::json& entry) const;
    RuleCondition parseCondition(const nlohmann::json& body) const;
    std::optional<PatternGroup> parseGroup(const nlohmann::json& body, const char* key) const;
    PatternMatcher parsePattern(const nlohmann::json& entry) const;

    void checkKnownFields(const nlohmann::json& object,
                          std::initializer_list<const char*> known) const;

    EngineConfig config_;
    api::PatternOptions base_options_;
};

}  // namespace rules
}  // namespace rulebox
