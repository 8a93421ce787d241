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

#include "pattern_options.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace rulebox {
namespace rules {

/**
 * Configuration for rule loading and evaluation.
 *
 * All parameters configurable via JSON. Missing keys take defaults.
 */
struct EngineConfig {
    // Batch evaluation (TBB)
    bool parallel_enabled;
    size_t parallel_min_batch_size;  // Batches smaller than this run sequentially
    size_t parallel_grain_size;      // blocked_range grain
    int parallel_max_threads;        // 0 = TBB default concurrency

    // Pattern compilation
    int64_t pattern_max_mem;         // RE2 max_mem per pattern
    bool pattern_utf8;               // true=UTF8, false=Latin1

    // Loader
    bool reject_unknown_fields;      // Unknown keys are MalformedDefinitionError

    /**
     * Parse configuration from JSON string.
     *
     * An empty string is treated as "{}".
     *
     * @param json JSON configuration string
     * @return parsed configuration with defaults applied
     * @throws std::runtime_error if JSON invalid
     * @throws std::invalid_argument if validation fails
     */
    static EngineConfig fromJson(const std::string& json);

    /**
     * Default configuration (same as fromJson("{}")).
     */
    static EngineConfig defaults();

    /**
     * Validate configuration parameters.
     *
     * @throws std::invalid_argument if configuration invalid
     */
    void validate() const;

    /**
     * Serialize configuration to JSON (for debugging).
     *
     * @return JSON string
     */
    std::string toJson() const;

    /**
     * Engine-wide base options every pattern is compiled with.
     */
    api::PatternOptions patternDefaults() const;
};

}  // namespace rules
}  // namespace rulebox
