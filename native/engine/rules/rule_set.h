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

#include "rules/engine_config.h"
#include "rules/load_statistics.h"
#include "rules/rule.h"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rulebox {
namespace rules {

/**
 * Rule Set - ordered, immutable collection of rules (one labeling engine).
 *
 * Built once (normally by Loader), then only read. Every method is const and
 * touches no shared mutable state, so one instance may serve any number of
 * threads without locking.
 *
 * Typical usage:
 *   auto rule_set = Loader().fromPath("rules.json");
 *   auto labels = rule_set->assignLabels("Hello there");        // {"greeting"}
 *   auto batch = rule_set->assignLabelsVector({"hi", "bye"});   // {{"greeting"}, {}}
 */
class RuleSet {
public:
    RuleSet(std::vector<Rule> rules, const EngineConfig& config);

    // Disable copy/move (shared via shared_ptr<const RuleSet>)
    RuleSet(const RuleSet&) = delete;
    RuleSet& operator=(const RuleSet&) = delete;

    /**
     * Labels of every firing rule, in rule definition order.
     *
     * Duplicate labels from different rules are all kept. Never fails;
     * returns an empty vector when no rule fires.
     *
     * @param text input text
     * @return labels in rule order
     */
    std::vector<std::string> assignLabels(std::string_view text) const;

    /**
     * assignLabels() applied to each text independently.
     *
     * Element i of the result always corresponds to texts[i]. Large batches
     * (config parallel_min_batch_size) are spread over TBB worker threads;
     * the result is identical to the sequential one.
     *
     * @param texts input texts
     * @return one label vector per text, in input order
     */
    std::vector<std::vector<std::string>> assignLabelsVector(
        const std::vector<std::string>& texts) const;

    /**
     * Indices of active rules whose non-empty proto_text does not make
     * the rule fire (audit helper for rule authors).
     */
    std::vector<size_t> prototypeMismatches() const;

    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }
    const Rule& rule(size_t index) const { return rules_.at(index); }
    const std::vector<Rule>& rules() const { return rules_; }

    const EngineConfig& config() const { return config_; }
    const LoadStatistics& statistics() const { return statistics_; }

private:
    void assignLabelsRange(const std::vector<std::string>& texts,
                           size_t begin,
                           size_t end,
                           std::vector<std::vector<std::string>>& results) const;

    bool shouldRunParallel(size_t batch_size) const;

    const std::vector<Rule> rules_;
    const EngineConfig config_;
    const LoadStatistics statistics_;
};

}  // namespace rules
}  // namespace rulebox
