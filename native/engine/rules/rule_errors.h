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

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace rulebox {
namespace rules {

/**
 * Base class for every failure raised while building a rule set.
 *
 * Carries the underlying cause plus optional context (rule index, label,
 * group location, pattern text). Context is attached by the loader while
 * the exception propagates, so the thrower only needs to know the cause:
 *
 *   try { parsePattern(entry); }
 *   catch (LoaderError& e) { e.attachLocation("or_patterns[2]"); throw; }
 *
 * what() renders "<context>: <cause>", e.g.
 *   "rule 3 'greeting', rule.or_patterns[1], pattern '(': invalid regex: missing ): ("
 */
class LoaderError : public std::runtime_error {
public:
    explicit LoaderError(const std::string& cause);

    const char* what() const noexcept override;

    /**
     * Short error category name ("PatternCompileError", ...).
     */
    virtual const char* kind() const noexcept;

    const std::string& cause() const { return cause_; }
    const std::optional<size_t>& ruleIndex() const { return rule_index_; }
    const std::string& label() const { return label_; }
    const std::string& location() const { return location_; }
    const std::string& pattern() const { return pattern_; }

    void attachRule(size_t index, const std::string& label);
    void attachLocation(const std::string& location);
    void attachPattern(const std::string& pattern);

private:
    void rebuildMessage();

    std::string cause_;
    std::optional<size_t> rule_index_;
    std::string label_;
    std::string location_;
    std::string pattern_;
    std::string message_;
};

/**
 * A pattern string is not a valid RE2 regular expression.
 */
class PatternCompileError : public LoaderError {
public:
    PatternCompileError(const std::string& pattern, const std::string& re2_error);

    const char* kind() const noexcept override;

    const std::string& re2Error() const { return re2_error_; }

private:
    std::string re2_error_;
};

/**
 * A flag outside {i, m} was specified for a pattern.
 */
class UnsupportedFlagError : public LoaderError {
public:
    explicit UnsupportedFlagError(const std::string& flag);

    const char* kind() const noexcept override;

    const std::string& flag() const { return flag_; }

private:
    std::string flag_;
};

/**
 * The definition is not a well-formed sequence of rule objects
 * (missing label, wrong field types, empty pattern groups, bad JSON).
 */
class MalformedDefinitionError : public LoaderError {
public:
    explicit MalformedDefinitionError(const std::string& cause);

    const char* kind() const noexcept override;
};

/**
 * The definition could not be read from its source.
 */
class SourceReadError : public LoaderError {
public:
    SourceReadError(const std::string& path, const std::string& reason);

    const char* kind() const noexcept override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}  // namespace rules
}  // namespace rulebox
