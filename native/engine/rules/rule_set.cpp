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

#include "rules/rule_set.h"
#include <oneapi/tbb/blocked_range.h>
#include <oneapi/tbb/parallel_for.h>
#include <oneapi/tbb/task_arena.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace rulebox {
namespace rules {

RuleSet::RuleSet(std::vector<Rule> rules, const EngineConfig& config)
    : rules_(std::move(rules)),
      config_(config),
      statistics_(LoadStatistics::collect(rules_)) {}

std::vector<std::string> RuleSet::assignLabels(std::string_view text) const {
    std::vector<std::string> labels;

    for (const auto& rule : rules_) {
        if (rule.fires(text)) {
            labels.push_back(rule.label());
        }
    }

    return labels;
}

std::vector<std::vector<std::string>> RuleSet::assignLabelsVector(
    const std::vector<std::string>& texts) const {

    std::vector<std::vector<std::string>> results(texts.size());

    if (!shouldRunParallel(texts.size())) {
        assignLabelsRange(texts, 0, texts.size(), results);
        return results;
    }

    spdlog::debug("RuleSet: evaluating {} texts in parallel (grain {}, max threads {})",
                  texts.size(), config_.parallel_grain_size, config_.parallel_max_threads);

    // Each task writes only results[begin, end) - no synchronization needed
    auto run = [&]() {
        tbb::parallel_for(
            tbb::blocked_range<size_t>(0, texts.size(), config_.parallel_grain_size),
            [&](const tbb::blocked_range<size_t>& range) {
                assignLabelsRange(texts, range.begin(), range.end(), results);
            });
    };

    if (config_.parallel_max_threads > 0) {
        tbb::task_arena arena(config_.parallel_max_threads);
        arena.execute(run);
    } else {
        run();
    }

    return results;
}

std::vector<size_t> RuleSet::prototypeMismatches() const {
    std::vector<size_t> mismatches;

    for (size_t i = 0; i < rules_.size(); i++) {
        const Rule& rule = rules_[i];
        const std::string& proto_text = rule.metadata().proto_text;

        if (!rule.isActive() || proto_text.empty()) {
            continue;
        }

        if (!rule.fires(proto_text)) {
            mismatches.push_back(i);
        }
    }

    return mismatches;
}

void RuleSet::assignLabelsRange(const std::vector<std::string>& texts,
                                size_t begin,
                                size_t end,
                                std::vector<std::vector<std::string>>& results) const {
    for (size_t i = begin; i < end; i++) {
        results[i] = assignLabels(texts[i]);
    }
}

bool RuleSet::shouldRunParallel(size_t batch_size) const {
    return config_.parallel_enabled
        && batch_size >= config_.parallel_min_batch_size
        && batch_size > 1;
}

}  // namespace rules
}  // namespace rulebox
