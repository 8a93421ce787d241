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

#include "rules/rule_set.h"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rulebox {
namespace api {

/**
 * High-level C++ API for rule-based text labeling.
 *
 * This facade layer provides simple functions for language wrappers (JNI, Python, Go, etc.)
 * No function here throws: load failures come back as nullptr plus an error
 * message and ErrorCode, evaluation never fails.
 *
 * Typical usage:
 *   std::string error;
 *   RuleBox* box = loadFromPath("rules.json", "", error);
 *   auto labels = assignLabels(box, "Hello there");   // {"greeting"}
 *   releaseRuleBox(box);
 */

/**
 * Failure category of a load call (stable values for bindings).
 */
enum class ErrorCode : int {
    None = 0,
    PatternCompile = 1,
    UnsupportedFlag = 2,
    MalformedDefinition = 3,
    SourceRead = 4,
    InvalidConfig = 5,
};

/**
 * Handle owned by the binding layer (one loaded rule set).
 *
 * Shares the immutable rule set: concurrent calls on one handle are safe.
 */
struct RuleBox {
    std::shared_ptr<const rules::RuleSet> rule_set;
};

/**
 * Load rules from a JSON file.
 *
 * @param path rule definition file
 * @param config_json engine configuration JSON (empty = defaults)
 * @param error_out output parameter for load errors (empty if success)
 * @param code_out optional output for the error category
 * @return rule box, or nullptr on error
 */
RuleBox* loadFromPath(
    const std::string& path,
    const std::string& config_json,
    std::string& error_out,
    ErrorCode* code_out = nullptr);

/**
 * Load rules from JSON text.
 *
 * @param definition_json rule definition (JSON array)
 * @param config_json engine configuration JSON (empty = defaults)
 * @param error_out output parameter for load errors (empty if success)
 * @param code_out optional output for the error category
 * @return rule box, or nullptr on error
 */
RuleBox* loadFromJson(
    const std::string& definition_json,
    const std::string& config_json,
    std::string& error_out,
    ErrorCode* code_out = nullptr);

/**
 * Release rule box (nullptr safe).
 */
void releaseRuleBox(RuleBox* box);

/**
 * Labels of every rule firing on text, in rule order.
 *
 * @param box loaded rule box (nullptr yields no labels)
 * @param text input text
 * @return labels (empty if none fire)
 */
std::vector<std::string> assignLabels(const RuleBox* box, std::string_view text);

/**
 * assignLabels() for each text; result[i] corresponds to texts[i].
 *
 * @param box loaded rule box (nullptr yields one empty list per text)
 * @param texts input texts
 * @return label lists in input order
 */
std::vector<std::vector<std::string>> assignLabelsVector(
    const RuleBox* box,
    const std::vector<std::string>& texts);

/**
 * Bulk labeling over raw arrays (zero-copy input for bindings).
 *
 * Null texts and negative lengths are treated as missing values: their
 * slot receives an empty label list and processing continues.
 *
 * @param box loaded rule box
 * @param texts array of text pointers
 * @param text_lens array of text lengths
 * @param num_texts number of texts
 * @param results_out array of num_texts label vectors (output)
 */
void assignLabelsBulk(
    const RuleBox* box,
    const char* const* texts,
    const int* text_lens,
    int num_texts,
    std::vector<std::string>* results_out);

/**
 * Structural statistics of the loaded rule set as JSON ("{}" for nullptr).
 */
std::string getStatisticsJSON(const RuleBox* box);

/**
 * Effective engine configuration as JSON ("{}" for nullptr).
 */
std::string getConfigJSON(const RuleBox* box);

/**
 * Human-readable name of an error code ("PatternCompileError", ...).
 */
const char* errorCodeName(ErrorCode code);

}  // namespace api
}  // namespace rulebox
