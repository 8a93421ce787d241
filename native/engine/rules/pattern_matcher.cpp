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

#include "rules/pattern_matcher.h"
#include "rules/rule_errors.h"

namespace rulebox {
namespace rules {

PatternMatcher::PatternMatcher(const std::string& pattern, const api::PatternOptions& options)
    : pattern_string_(pattern),
      options_(options) {

    auto regex = std::make_unique<RE2>(options_.effectivePattern(pattern_string_),
                                       options_.toRE2Options());

    if (!regex->ok()) {
        throw PatternCompileError(pattern_string_, regex->error());
    }

    program_size_ = static_cast<size_t>(regex->ProgramSize());
    compiled_regex_ = std::move(regex);
}

bool PatternMatcher::matches(std::string_view text) const {
    // Zero-copy: string_view wrapped in StringPiece
    return RE2::PartialMatch(re2::StringPiece(text.data(), text.size()), *compiled_regex_);
}

}  // namespace rules
}  // namespace rulebox
