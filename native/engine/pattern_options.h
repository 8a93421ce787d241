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

#include <re2/re2.h>
#include <cstdint>
#include <string>
#include <vector>

namespace rulebox {
namespace api {

/**
 * Closed set of per-pattern matching flags accepted in rule definitions.
 *
 *   "i" -> CaseInsensitive  (fold case for the whole pattern)
 *   "m" -> MultiLine        (^ and $ also match at internal line boundaries)
 */
enum class PatternFlag : uint8_t {
    CaseInsensitive = 1 << 0,
    MultiLine       = 1 << 1,
};

/**
 * Pattern compilation options for one pattern matcher.
 *
 * Used for:
 * 1. Resolving rule-definition flag strings into a closed flag set
 * 2. Configuring RE2 pattern compilation
 *
 * Flags are a set: applying the same flag twice has no extra effect and
 * the order in which flags are applied does not matter.
 */
struct PatternOptions {
    // ========== RULE FLAGS ==========
    bool case_insensitive = false;  // "i"
    bool multi_line = false;        // "m"

    // ========== ENGINE-WIDE (from EngineConfig) ==========
    bool utf8 = true;               // true=UTF8, false=Latin1
    int64_t max_mem = 8388608;      // 8MB default (RE2 default)

    /**
     * Convert to RE2::Options.
     *
     * RE2's error logging is always disabled: compile failures are reported
     * through PatternCompileError instead of stderr.
     *
     * @return RE2::Options with all fields set from this struct
     */
    RE2::Options toRE2Options() const;

    /**
     * Pattern text handed to RE2.
     *
     * RE2 has no Options field for multi-line anchors outside POSIX mode,
     * so MultiLine is applied as the (?m) inline flag.
     *
     * @param pattern raw pattern from the rule definition
     * @return pattern to compile
     */
    std::string effectivePattern(const std::string& pattern) const;

    /**
     * Set the option corresponding to a flag.
     */
    void apply(PatternFlag flag);

    /**
     * Check whether a flag is set.
     */
    bool has(PatternFlag flag) const;

    /**
     * Canonical flag names in fixed order ("i" before "m").
     */
    std::vector<std::string> flagNames() const;

    /**
     * Resolve a flag string from a rule definition.
     *
     * @param flag flag text ("i" or "m")
     * @return resolved flag
     * @throws rules::UnsupportedFlagError for any other value
     */
    static PatternFlag parseFlag(const std::string& flag);

    /**
     * Build options from a list of flag strings on top of base options.
     *
     * @param flags flag strings (duplicates allowed)
     * @param base engine-wide defaults (encoding, memory budget)
     * @return options with all flags applied
     * @throws rules::UnsupportedFlagError on the first unknown flag
     */
    static PatternOptions fromFlags(const std::vector<std::string>& flags,
                                    const PatternOptions& base);

    /**
     * Create default options (no flags, UTF-8, 8MB).
     */
    static PatternOptions defaults();

    /**
     * Equality comparison (for testing).
     */
    bool operator==(const PatternOptions& other) const = default;
};

}  // namespace api
}  // namespace rulebox
