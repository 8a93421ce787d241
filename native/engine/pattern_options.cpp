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

#include "pattern_options.h"
#include "rules/rule_errors.h"

namespace rulebox {
namespace api {

RE2::Options PatternOptions::toRE2Options() const {
    RE2::Options opts;

    opts.set_log_errors(false);
    opts.set_case_sensitive(!case_insensitive);
    opts.set_encoding(utf8 ? RE2::Options::EncodingUTF8 : RE2::Options::EncodingLatin1);
    opts.set_max_mem(max_mem);

    return opts;
}

std::string PatternOptions::effectivePattern(const std::string& pattern) const {
    if (!multi_line) {
        return pattern;
    }
    return "(?m)" + pattern;
}

void PatternOptions::apply(PatternFlag flag) {
    switch (flag) {
        case PatternFlag::CaseInsensitive:
            case_insensitive = true;
            break;
        case PatternFlag::MultiLine:
            multi_line = true;
            break;
    }
}

bool PatternOptions::has(PatternFlag flag) const {
    switch (flag) {
        case PatternFlag::CaseInsensitive:
            return case_insensitive;
        case PatternFlag::MultiLine:
            return multi_line;
    }
    return false;
}

std::vector<std::string> PatternOptions::flagNames() const {
    std::vector<std::string> names;
    if (case_insensitive) names.emplace_back("i");
    if (multi_line)       names.emplace_back("m");
    return names;
}

PatternFlag PatternOptions::parseFlag(const std::string& flag) {
    if (flag == "i") return PatternFlag::CaseInsensitive;
    if (flag == "m") return PatternFlag::MultiLine;
    throw rules::UnsupportedFlagError(flag);
}

PatternOptions PatternOptions::fromFlags(const std::vector<std::string>& flags,
                                         const PatternOptions& base) {
    PatternOptions opts = base;
    opts.case_insensitive = false;
    opts.multi_line = false;

    for (const auto& flag : flags) {
        opts.apply(parseFlag(flag));
    }

    return opts;
}

PatternOptions PatternOptions::defaults() {
    PatternOptions opts;
    // All fields already initialized with defaults in struct definition
    return opts;
}

}  // namespace api
}  // namespace rulebox
