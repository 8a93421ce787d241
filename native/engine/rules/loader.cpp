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

#include "rules/loader.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace rulebox {
namespace rules {

namespace {

MalformedDefinitionError malformedAt(const std::string& location, const std::string& cause) {
    MalformedDefinitionError error(cause);
    error.attachLocation(location);
    return error;
}

// Best-effort label for error context (entry may itself be malformed)
std::string labelOf(const json& entry) {
    if (entry.is_object()) {
        auto it = entry.find("label");
        if (it != entry.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

// UUIDv7 (RFC 9562): 48-bit Unix epoch milliseconds, version 7, variant 10,
// remaining 74 bits random
std::string generateUuidV7() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    uint64_t unix_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    uint64_t rand_a = rng();
    uint64_t rand_b = rng();

    uint8_t bytes[16];
    for (int i = 0; i < 6; i++) {
        bytes[i] = static_cast<uint8_t>(unix_ms >> (40 - 8 * i));
    }
    bytes[6] = static_cast<uint8_t>(0x70 | ((rand_a >> 8) & 0x0F));
    bytes[7] = static_cast<uint8_t>(rand_a);
    bytes[8] = static_cast<uint8_t>(0x80 | ((rand_b >> 56) & 0x3F));
    for (int i = 9; i < 16; i++) {
        bytes[i] = static_cast<uint8_t>(rand_b >> (8 * (15 - i)));
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return oss.str();
}

}  // namespace

//============================================================================
// Public API
//============================================================================

Loader::Loader(const EngineConfig& config)
    : config_(config),
      base_options_(config.patternDefaults()) {
    config_.validate();
}

std::shared_ptr<const RuleSet> Loader::fromPath(const std::string& path) const {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw SourceReadError(path, "is a directory");
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        throw SourceReadError(path, std::strerror(errno));
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw SourceReadError(path, "read failed");
    }

    json definition;
    try {
        definition = json::parse(contents.str());
    } catch (const json::parse_error& e) {
        MalformedDefinitionError error(std::string("invalid JSON: ") + e.what());
        spdlog::error("Loader: rejected rule definition from {}: {}", path, error.what());
        throw error;
    }

    return build(definition, path);
}

std::shared_ptr<const RuleSet> Loader::fromJson(const std::string& json_text) const {
    json definition;
    try {
        definition = json::parse(json_text);
    } catch (const json::parse_error& e) {
        MalformedDefinitionError error(std::string("invalid JSON: ") + e.what());
        spdlog::error("Loader: rejected rule definition from JSON text: {}", error.what());
        throw error;
    }

    return fromDefinition(definition);
}

std::shared_ptr<const RuleSet> Loader::fromDefinition(const json& definition) const {
    return build(definition, "in-memory definition");
}

//============================================================================
// Parsing
//============================================================================

std::shared_ptr<const RuleSet> Loader::build(const json& definition,
                                             const std::string& source) const {
    if (!definition.is_array()) {
        MalformedDefinitionError error("rule definition must be a JSON array of rule objects");
        spdlog::error("Loader: rejected rule definition from {}: {}", source, error.what());
        throw error;
    }

    std::vector<Rule> rules;
    rules.reserve(definition.size());

    for (size_t i = 0; i < definition.size(); i++) {
        const json& entry = definition[i];

        try {
            rules.push_back(parseRule(entry));
        } catch (LoaderError& e) {
            e.attachRule(i, labelOf(entry));
            spdlog::error("Loader: rejected rule definition from {}: {} ({})",
                          source, e.what(), e.kind());
            throw;
        }

        const Rule& rule = rules.back();
        if (rule.condition().isEmpty()) {
            spdlog::warn("Loader: rule {} '{}' has no pattern groups and will never fire",
                         i, rule.label());
        }
    }

    auto rule_set = std::make_shared<const RuleSet>(std::move(rules), config_);

    const LoadStatistics& stats = rule_set->statistics();
    spdlog::info("Loader: loaded {} rules ({} active, {} patterns) from {}",
                 stats.rule_count, stats.active_rule_count, stats.patternCount(), source);

    return rule_set;
}

Rule Loader::parseRule(const json& entry) const {
    if (!entry.is_object()) {
        throw MalformedDefinitionError("rule entry must be a JSON object");
    }

    checkKnownFields(entry, {"label", "rule", "uuid", "proto_text", "active"});

    // Label
    auto label_it = entry.find("label");
    if (label_it == entry.end()) {
        throw malformedAt("label", "missing required field");
    }
    if (!label_it->is_string()) {
        throw malformedAt("label", "must be a string");
    }
    std::string label = label_it->get<std::string>();
    if (label.empty()) {
        throw malformedAt("label", "must be a non-empty string");
    }

    // Metadata (all optional)
    RuleMetadata metadata;
    if (auto it = entry.find("uuid"); it != entry.end()) {
        if (!it->is_string()) throw malformedAt("uuid", "must be a string");
        metadata.uuid = it->get<std::string>();
    } else {
        metadata.uuid = generateUuidV7();
    }
    if (auto it = entry.find("proto_text"); it != entry.end()) {
        if (!it->is_string()) throw malformedAt("proto_text", "must be a string");
        metadata.proto_text = it->get<std::string>();
    }
    if (auto it = entry.find("active"); it != entry.end()) {
        if (!it->is_boolean()) throw malformedAt("active", "must be a boolean");
        metadata.active = it->get<bool>();
    }

    // Rule body
    auto body_it = entry.find("rule");
    if (body_it == entry.end()) {
        throw malformedAt("rule", "missing required field");
    }
    if (!body_it->is_object()) {
        throw malformedAt("rule", "must be a JSON object");
    }

    std::optional<RuleCondition> condition;
    try {
        condition.emplace(parseCondition(*body_it));
    } catch (LoaderError& e) {
        e.attachLocation("rule");
        throw;
    }

    return Rule(std::move(label), std::move(*condition), std::move(metadata));
}

RuleCondition Loader::parseCondition(const json& body) const {
    checkKnownFields(body, {"or_patterns", "and_patterns", "not_patterns"});

    // Fixed order: first failure reported is deterministic
    auto or_patterns = parseGroup(body, "or_patterns");
    auto and_patterns = parseGroup(body, "and_patterns");
    auto not_patterns = parseGroup(body, "not_patterns");

    return RuleCondition(std::move(or_patterns), std::move(and_patterns), std::move(not_patterns));
}

std::optional<PatternGroup> Loader::parseGroup(const json& body, const char* key) const {
    auto it = body.find(key);
    if (it == body.end()) {
        return std::nullopt;
    }

    if (!it->is_array()) {
        throw malformedAt(key, "must be an array of pattern objects");
    }
    if (it->empty()) {
        throw malformedAt(key, "pattern group must not be empty");
    }

    PatternGroup group;
    group.reserve(it->size());

    for (size_t i = 0; i < it->size(); i++) {
        try {
            group.push_back(parsePattern((*it)[i]));
        } catch (LoaderError& e) {
            e.attachLocation(std::string(key) + "[" + std::to_string(i) + "]");
            throw;
        }
    }

    return group;
}

PatternMatcher Loader::parsePattern(const json& entry) const {
    if (!entry.is_object()) {
        throw MalformedDefinitionError("pattern entry must be a JSON object");
    }

    checkKnownFields(entry, {"pattern", "flags"});

    auto pattern_it = entry.find("pattern");
    if (pattern_it == entry.end()) {
        throw malformedAt("pattern", "missing required field");
    }
    if (!pattern_it->is_string()) {
        throw malformedAt("pattern", "must be a string");
    }
    std::string pattern = pattern_it->get<std::string>();

    std::vector<std::string> flags;
    if (auto it = entry.find("flags"); it != entry.end()) {
        if (!it->is_array()) {
            throw malformedAt("flags", "must be an array of strings");
        }
        for (const auto& flag : *it) {
            if (!flag.is_string()) {
                MalformedDefinitionError error("must be an array of strings");
                error.attachLocation("flags");
                error.attachPattern(pattern);
                throw error;
            }
            flags.push_back(flag.get<std::string>());
        }
    }

    api::PatternOptions options;
    try {
        options = api::PatternOptions::fromFlags(flags, base_options_);
    } catch (LoaderError& e) {
        e.attachPattern(pattern);
        throw;
    }

    return PatternMatcher(pattern, options);
}

void Loader::checkKnownFields(const json& object,
                              std::initializer_list<const char*> known) const {
    if (!config_.reject_unknown_fields) {
        return;
    }

    for (const auto& item : object.items()) {
        bool found = false;
        for (const char* name : known) {
            if (item.key() == name) {
                found = true;
                break;
            }
        }
        if (!found) {
            throw MalformedDefinitionError("unknown field '" + item.key() + "'");
        }
    }
}

}  // namespace rules
}  // namespace rulebox
