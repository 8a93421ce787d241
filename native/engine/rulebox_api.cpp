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

#include "rulebox_api.h"
#include "rules/loader.h"
#include <stdexcept>

namespace rulebox {
namespace api {

//============================================================================
// Helpers
//============================================================================

static void setError(std::string& error_out,
                     ErrorCode* code_out,
                     ErrorCode code,
                     const std::string& message) {
    error_out = std::string(errorCodeName(code)) + ": " + message;
    if (code_out) {
        *code_out = code;
    }
}

// Builds the loader from config_json, runs load_fn, maps every failure
// onto an ErrorCode. Never throws.
template <typename LoadFn>
static RuleBox* loadWith(
    const std::string& config_json,
    std::string& error_out,
    ErrorCode* code_out,
    LoadFn&& load_fn) {

    error_out.clear();
    if (code_out) {
        *code_out = ErrorCode::None;
    }

    rules::EngineConfig config;
    try {
        config = rules::EngineConfig::fromJson(config_json);
    } catch (const std::exception& e) {
        setError(error_out, code_out, ErrorCode::InvalidConfig, e.what());
        return nullptr;
    }

    try {
        rules::Loader loader(config);
        return new RuleBox{load_fn(loader)};
    } catch (const rules::PatternCompileError& e) {
        setError(error_out, code_out, ErrorCode::PatternCompile, e.what());
    } catch (const rules::UnsupportedFlagError& e) {
        setError(error_out, code_out, ErrorCode::UnsupportedFlag, e.what());
    } catch (const rules::SourceReadError& e) {
        setError(error_out, code_out, ErrorCode::SourceRead, e.what());
    } catch (const rules::LoaderError& e) {
        setError(error_out, code_out, ErrorCode::MalformedDefinition, e.what());
    } catch (const std::exception& e) {
        setError(error_out, code_out, ErrorCode::MalformedDefinition,
                 std::string("Exception: ") + e.what());
    }

    return nullptr;
}

//============================================================================
// Public API
//============================================================================

RuleBox* loadFromPath(
    const std::string& path,
    const std::string& config_json,
    std::string& error_out,
    ErrorCode* code_out) {

    return loadWith(config_json, error_out, code_out,
                    [&path](const rules::Loader& loader) { return loader.fromPath(path); });
}

RuleBox* loadFromJson(
    const std::string& definition_json,
    const std::string& config_json,
    std::string& error_out,
    ErrorCode* code_out) {

    return loadWith(config_json, error_out, code_out,
                    [&definition_json](const rules::Loader& loader) {
                        return loader.fromJson(definition_json);
                    });
}

void releaseRuleBox(RuleBox* box) {
    delete box;  // Null-safe; rule set freed when last shared owner goes
}

std::vector<std::string> assignLabels(const RuleBox* box, std::string_view text) {
    if (!box || !box->rule_set) {
        return {};
    }

    return box->rule_set->assignLabels(text);
}

std::vector<std::vector<std::string>> assignLabelsVector(
    const RuleBox* box,
    const std::vector<std::string>& texts) {

    if (!box || !box->rule_set) {
        return std::vector<std::vector<std::string>>(texts.size());
    }

    return box->rule_set->assignLabelsVector(texts);
}

void assignLabelsBulk(
    const RuleBox* box,
    const char* const* texts,
    const int* text_lens,
    int num_texts,
    std::vector<std::string>* results_out) {

    if (!results_out || num_texts <= 0) {
        return;
    }

    // Validate box and arrays - clear all on failure
    if (!box || !box->rule_set || !texts || !text_lens) {
        for (int i = 0; i < num_texts; i++) {
            results_out[i].clear();
        }
        return;
    }

    for (int i = 0; i < num_texts; i++) {
        // Missing values (null / negative length) get no labels
        if (texts[i] == nullptr || text_lens[i] < 0) {
            results_out[i].clear();
            continue;
        }

        std::string_view text(texts[i], static_cast<size_t>(text_lens[i]));
        results_out[i] = box->rule_set->assignLabels(text);
    }
}

std::string getStatisticsJSON(const RuleBox* box) {
    if (!box || !box->rule_set) {
        return "{}";
    }

    return box->rule_set->statistics().toJson();
}

std::string getConfigJSON(const RuleBox* box) {
    if (!box || !box->rule_set) {
        return "{}";
    }

    return box->rule_set->config().toJson();
}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                return "None";
        case ErrorCode::PatternCompile:      return "PatternCompileError";
        case ErrorCode::UnsupportedFlag:     return "UnsupportedFlagError";
        case ErrorCode::MalformedDefinition: return "MalformedDefinitionError";
        case ErrorCode::SourceRead:          return "SourceReadError";
        case ErrorCode::InvalidConfig:       return "InvalidConfigError";
    }
    return "Unknown";
}

}  // namespace api
}  // namespace rulebox
