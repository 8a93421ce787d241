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

#include "rules/rule_errors.h"
#include <sstream>

namespace rulebox {
namespace rules {

//============================================================================
// LoaderError
//============================================================================

LoaderError::LoaderError(const std::string& cause)
    : std::runtime_error(cause),
      cause_(cause),
      message_(cause) {}

const char* LoaderError::what() const noexcept {
    return message_.c_str();
}

const char* LoaderError::kind() const noexcept {
    return "LoaderError";
}

void LoaderError::attachRule(size_t index, const std::string& label) {
    rule_index_ = index;
    label_ = label;
    rebuildMessage();
}

void LoaderError::attachLocation(const std::string& location) {
    // Called innermost first: each outer location becomes a prefix
    if (location_.empty()) {
        location_ = location;
    } else {
        location_ = location + "." + location_;
    }
    rebuildMessage();
}

void LoaderError::attachPattern(const std::string& pattern) {
    pattern_ = pattern;
    rebuildMessage();
}

void LoaderError::rebuildMessage() {
    std::ostringstream msg;
    bool has_context = false;

    if (rule_index_) {
        msg << "rule " << *rule_index_;
        if (!label_.empty()) {
            msg << " '" << label_ << "'";
        }
        has_context = true;
    }

    if (!location_.empty()) {
        if (has_context) msg << ", ";
        msg << location_;
        has_context = true;
    }

    if (!pattern_.empty()) {
        if (has_context) msg << ", ";
        msg << "pattern '" << pattern_ << "'";
        has_context = true;
    }

    if (has_context) msg << ": ";
    msg << cause_;

    message_ = msg.str();
}

//============================================================================
// Subclasses
//============================================================================

PatternCompileError::PatternCompileError(const std::string& pattern, const std::string& re2_error)
    : LoaderError("invalid regex: " + re2_error),
      re2_error_(re2_error) {
    attachPattern(pattern);
}

const char* PatternCompileError::kind() const noexcept {
    return "PatternCompileError";
}

UnsupportedFlagError::UnsupportedFlagError(const std::string& flag)
    : LoaderError("unsupported flag '" + flag + "' (expected one of: i, m)"),
      flag_(flag) {}

const char* UnsupportedFlagError::kind() const noexcept {
    return "UnsupportedFlagError";
}

MalformedDefinitionError::MalformedDefinitionError(const std::string& cause)
    : LoaderError(cause) {}

const char* MalformedDefinitionError::kind() const noexcept {
    return "MalformedDefinitionError";
}

SourceReadError::SourceReadError(const std::string& path, const std::string& reason)
    : LoaderError("cannot read rule definition '" + path + "': " + reason),
      path_(path) {}

const char* SourceReadError::kind() const noexcept {
    return "SourceReadError";
}

}  // namespace rules
}  // namespace rulebox
