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
#include <re2/re2.h>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rulebox {
namespace rules {

/**
 * One compiled RE2 pattern plus the options it was compiled with.
 *
 * Compiled eagerly in the constructor; immutable afterwards. RE2 objects are
 * thread-safe for matching, so a single PatternMatcher may be used from any
 * number of threads concurrently.
 */
class PatternMatcher {
public:
    /**
     * Compile pattern.
     *
     * @param pattern raw pattern string from the rule definition
     * @param options resolved flags and engine-wide options
     * @throws PatternCompileError if RE2 rejects the pattern
     */
    PatternMatcher(const std::string& pattern, const api::PatternOptions& options);

    PatternMatcher(PatternMatcher&&) noexcept = default;
    PatternMatcher& operator=(PatternMatcher&&) noexcept = default;

    PatternMatcher(const PatternMatcher&) = delete;
    PatternMatcher& operator=(const PatternMatcher&) = delete;

    /**
     * Unanchored search - true if the pattern occurs anywhere in text.
     */
    bool matches(std::string_view text) const;

    const std::string& pattern() const { return pattern_string_; }
    const api::PatternOptions& options() const { return options_; }

    /**
     * RE2 program size (approximate compiled cost).
     */
    size_t programSize() const { return program_size_; }

private:
    std::string pattern_string_;
    api::PatternOptions options_;
    std::unique_ptr<RE2> compiled_regex_;
    size_t program_size_ = 0;
};

/**
 * Ordered, non-empty sequence of matchers forming one OR/AND/NOT group.
 */
using PatternGroup = std::vector<PatternMatcher>;

}  // namespace rules
}  // namespace rulebox
