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

#include "rules/engine_config.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <sstream>

using json = nlohmann::json;

namespace rulebox {
namespace rules {

EngineConfig EngineConfig::fromJson(const std::string& json_str) {
    EngineConfig config;

    try {
        json j = json::parse(json_str.empty() ? std::string("{}") : json_str);

        if (!j.is_object()) {
            throw std::runtime_error("Engine configuration JSON must be an object");
        }

        // Batch evaluation
        config.parallel_enabled = j.value("parallel_enabled", true);
        // Sizes read signed so negative values are rejected instead of wrapping
        int64_t min_batch_size = j.value("parallel_min_batch_size", static_cast<int64_t>(256));
        int64_t grain_size = j.value("parallel_grain_size", static_cast<int64_t>(64));
        if (min_batch_size <= 0) {
            throw std::invalid_argument("parallel_min_batch_size must be > 0");
        }
        if (grain_size <= 0) {
            throw std::invalid_argument("parallel_grain_size must be > 0");
        }
        config.parallel_min_batch_size = static_cast<size_t>(min_batch_size);
        config.parallel_grain_size = static_cast<size_t>(grain_size);
        config.parallel_max_threads = j.value("parallel_max_threads", 0);

        // Pattern compilation
        config.pattern_max_mem = j.value("pattern_max_mem", static_cast<int64_t>(8388608));  // 8MB
        config.pattern_utf8 = j.value("pattern_utf8", true);

        // Loader
        config.reject_unknown_fields = j.value("reject_unknown_fields", true);

        // Validate
        config.validate();

        return config;

    } catch (const json::parse_error& e) {
        std::ostringstream msg;
        msg << "Failed to parse engine configuration JSON: " << e.what();
        throw std::runtime_error(msg.str());
    } catch (const json::type_error& e) {
        std::ostringstream msg;
        msg << "Invalid type in engine configuration JSON: " << e.what();
        throw std::runtime_error(msg.str());
    }
}

EngineConfig EngineConfig::defaults() {
    return fromJson("{}");
}

void EngineConfig::validate() const {
    if (parallel_min_batch_size == 0) {
        throw std::invalid_argument(
            "parallel_min_batch_size must be > 0");
    }
    if (parallel_grain_size == 0) {
        throw std::invalid_argument(
            "parallel_grain_size must be > 0");
    }
    if (parallel_max_threads < 0) {
        throw std::invalid_argument(
            "parallel_max_threads must be >= 0 (0 = TBB default)");
    }
    if (pattern_max_mem <= 0) {
        throw std::invalid_argument(
            "pattern_max_mem must be > 0");
    }
}

std::string EngineConfig::toJson() const {
    json j;

    // Batch evaluation
    j["parallel_enabled"] = parallel_enabled;
    j["parallel_min_batch_size"] = parallel_min_batch_size;
    j["parallel_grain_size"] = parallel_grain_size;
    j["parallel_max_threads"] = parallel_max_threads;

    // Pattern compilation
    j["pattern_max_mem"] = pattern_max_mem;
    j["pattern_utf8"] = pattern_utf8;

    // Loader
    j["reject_unknown_fields"] = reject_unknown_fields;

    return j.dump(2);  // Pretty-print with 2-space indent
}

api::PatternOptions EngineConfig::patternDefaults() const {
    api::PatternOptions opts = api::PatternOptions::defaults();
    opts.utf8 = pattern_utf8;
    opts.max_mem = pattern_max_mem;
    return opts;
}

}  // namespace rules
}  // namespace rulebox
