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

#include "rules/loader.h"
#include "rules/rule_set.h"
#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace rulebox::rules;
using Labels = std::vector<std::string>;

/**
 * Rule Set Tests - Test BOTH sequential and TBB batch evaluation.
 *
 * Tests are parameterized to run with parallel=false and parallel=true
 * (parallel forced even for tiny batches). Results must be identical.
 */
class RuleSetTest : public ::testing::TestWithParam<bool> {
protected:
    EngineConfig makeConfig(bool parallel) {
        std::string json = std::string(R"({
            "parallel_enabled": )") + (parallel ? "true" : "false") + R"(,
            "parallel_min_batch_size": 1,
            "parallel_grain_size": 1
        })";
        return EngineConfig::fromJson(json);
    }

    std::shared_ptr<const RuleSet> load(const std::string& definition) {
        return Loader(makeConfig(GetParam())).fromJson(definition);
    }

    static constexpr const char* kMessageRules = R"([
        {"label": "greeting", "rule": {"or_patterns": [
            {"pattern": "\\bhello\\b", "flags": ["i"]},
            {"pattern": "\\bhi\\b", "flags": ["i"]}]}},
        {"label": "question", "rule": {"and_patterns": [{"pattern": "\\?"}]}},
        {"label": "urgent", "rule": {"and_patterns": [
            {"pattern": "urgent", "flags": ["i"]},
            {"pattern": "asap|immediately|now", "flags": ["i"]}]}},
        {"label": "not_spam", "rule": {
            "or_patterns": [{"pattern": "legitimate"}],
            "not_patterns": [
                {"pattern": "click here", "flags": ["i"]},
                {"pattern": "free money", "flags": ["i"]}]}}
    ])";
};

// Greeting scenario
TEST_P(RuleSetTest, SingleOrRule) {
    auto rule_set = load(R"([{"label":"greeting","rule":{"or_patterns":[
        {"pattern":"\\bhello\\b","flags":["i"]}]}}])");

    EXPECT_EQ(rule_set->assignLabels("Hello there"), Labels{"greeting"});
    EXPECT_EQ(rule_set->assignLabels("goodbye"), Labels{});
}

// Urgent scenario
TEST_P(RuleSetTest, AndRule) {
    auto rule_set = load(R"([{"label":"urgent","rule":{"and_patterns":[
        {"pattern":"urgent","flags":["i"]},
        {"pattern":"asap|now","flags":["i"]}]}}])");

    EXPECT_EQ(rule_set->assignLabels("urgent: asap please"), Labels{"urgent"});
    EXPECT_EQ(rule_set->assignLabels("urgent request"), Labels{});
}

// Output follows rule definition order, not match position in text
TEST_P(RuleSetTest, OutputInRuleOrder) {
    auto rule_set = load(kMessageRules);

    EXPECT_EQ(rule_set->assignLabels("Is this urgent? Hello, reply now"),
              (Labels{"greeting", "question", "urgent"}));
}

// Duplicate labels from distinct rules are both emitted
TEST_P(RuleSetTest, DuplicateLabelsKept) {
    auto rule_set = load(R"([
        {"label":"contact","rule":{"or_patterns":[{"pattern":"@"}]}},
        {"label":"other","rule":{"or_patterns":[{"pattern":"zzz"}]}},
        {"label":"contact","rule":{"or_patterns":[{"pattern":"\\d{3}-\\d{4}"}]}}
    ])");

    EXPECT_EQ(rule_set->assignLabels("mail a@b.c or call 555-1234"),
              (Labels{"contact", "contact"}));
    EXPECT_EQ(rule_set->assignLabels("mail a@b.c"), Labels{"contact"});
}

// NOT suppresses an otherwise matching rule
TEST_P(RuleSetTest, NotSuppresses) {
    auto rule_set = load(kMessageRules);

    EXPECT_EQ(rule_set->assignLabels("This is a legitimate request"), Labels{"not_spam"});
    EXPECT_EQ(rule_set->assignLabels("legitimate but click here for free money"), Labels{});
}

// Pure negative rule
TEST_P(RuleSetTest, PurelyNegativeRule) {
    auto rule_set = load(R"([{"label":"clean","rule":{"not_patterns":[
        {"pattern":"spam","flags":["i"]}]}}])");

    EXPECT_EQ(rule_set->assignLabels("quarterly report"), Labels{"clean"});
    EXPECT_EQ(rule_set->assignLabels(""), Labels{"clean"});
    EXPECT_EQ(rule_set->assignLabels("SPAM offer"), Labels{});
}

// Empty text follows the patterns' own behaviour on ""
TEST_P(RuleSetTest, EmptyText) {
    auto rule_set = load(R"([
        {"label":"blank","rule":{"or_patterns":[{"pattern":"^$"}]}},
        {"label":"word","rule":{"or_patterns":[{"pattern":"\\w"}]}}
    ])");

    EXPECT_EQ(rule_set->assignLabels(""), Labels{"blank"});
    EXPECT_EQ(rule_set->assignLabels("x"), Labels{"word"});
}

// Inactive rules are skipped
TEST_P(RuleSetTest, InactiveRulesSkipped) {
    auto rule_set = load(R"([
        {"label":"a","active":false,"rule":{"or_patterns":[{"pattern":"x"}]}},
        {"label":"b","rule":{"or_patterns":[{"pattern":"x"}]}}
    ])");

    EXPECT_EQ(rule_set->size(), 2u);
    EXPECT_EQ(rule_set->assignLabels("x"), Labels{"b"});
}

// Empty rule set never labels anything
TEST_P(RuleSetTest, EmptyRuleSet) {
    auto rule_set = load("[]");

    EXPECT_TRUE(rule_set->empty());
    EXPECT_EQ(rule_set->assignLabels("Hello world"), Labels{});
    EXPECT_EQ(rule_set->assignLabelsVector({"a", "b"}), (std::vector<Labels>{{}, {}}));
}

// Vector call is pointwise-equivalent to scalar call
TEST_P(RuleSetTest, VectorMatchesScalar) {
    auto rule_set = load(kMessageRules);

    std::vector<std::string> texts = {
        "Hello there",
        "Goodbye",
        "Hi everyone, is this urgent? do it now",
        "",
        "legitimate offer",
        "legitimate offer, click here",
        "what?",
    };

    auto results = rule_set->assignLabelsVector(texts);

    ASSERT_EQ(results.size(), texts.size());
    for (size_t i = 0; i < texts.size(); i++) {
        EXPECT_EQ(results[i], rule_set->assignLabels(texts[i])) << "text " << i;
    }

    EXPECT_EQ(results[0], Labels{"greeting"});
    EXPECT_EQ(results[1], Labels{});
    EXPECT_EQ(results[2], (Labels{"greeting", "question", "urgent"}));
}

// Empty batch
TEST_P(RuleSetTest, VectorEmptyInput) {
    auto rule_set = load(kMessageRules);
    EXPECT_TRUE(rule_set->assignLabelsVector({}).empty());
}

// Large batch keeps input order
TEST_P(RuleSetTest, VectorLargeBatchOrder) {
    auto rule_set = load(R"([
        {"label":"even","rule":{"or_patterns":[{"pattern":"[02468]$"}]}},
        {"label":"big","rule":{"and_patterns":[{"pattern":"^\\d{4,}$"}]}}
    ])");

    std::vector<std::string> texts;
    for (int i = 0; i < 5000; i++) {
        texts.push_back(std::to_string(i));
    }

    auto results = rule_set->assignLabelsVector(texts);

    ASSERT_EQ(results.size(), texts.size());
    for (int i = 0; i < 5000; i++) {
        Labels expected;
        if (i % 2 == 0) expected.push_back("even");
        if (i >= 1000)  expected.push_back("big");
        EXPECT_EQ(results[i], expected) << "text " << i;
    }
}

// Idempotence
TEST_P(RuleSetTest, Idempotent) {
    auto rule_set = load(kMessageRules);

    auto first = rule_set->assignLabels("Hello? urgent, now");
    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(rule_set->assignLabels("Hello? urgent, now"), first);
    }
}

// One rule set shared by many threads
TEST_P(RuleSetTest, ConcurrentEvaluation) {
    auto rule_set = load(kMessageRules);
    std::vector<std::string> texts = {"Hello there", "urgent, now?", "legitimate", "nothing"};
    auto expected = rule_set->assignLabelsVector(texts);

    std::vector<std::thread> threads;
    std::atomic<int> mismatches{0};

    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; i++) {
                if (rule_set->assignLabelsVector(texts) != expected) mismatches++;
                if (rule_set->assignLabels(texts[i % texts.size()]) != expected[i % texts.size()]) {
                    mismatches++;
                }
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
}

// Long text
TEST_P(RuleSetTest, LongText) {
    auto rule_set = load(R"([
        {"label":"greeting","rule":{"or_patterns":[{"pattern":"\\bhello\\b","flags":["i"]}]}},
        {"label":"email","rule":{"or_patterns":[
            {"pattern":"[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\\.[a-zA-Z]{2,}"}]}}
    ])");

    std::string text = "Hello ";
    for (int i = 0; i < 1000; i++) {
        text += "word ";
    }
    text += "test@example.com";

    EXPECT_EQ(rule_set->assignLabels(text), (Labels{"greeting", "email"}));
}

// Regex metacharacters in input text are plain data
TEST_P(RuleSetTest, SpecialCharactersInText) {
    auto rule_set = load(kMessageRules);

    EXPECT_EQ(rule_set->assignLabels("Hello [world] (test) {hello} ^start$ .any*"),
              Labels{"greeting"});
}

// proto_text audit
TEST_P(RuleSetTest, PrototypeMismatches) {
    auto rule_set = load(R"([
        {"label":"ok","proto_text":"hello there","rule":{"or_patterns":[{"pattern":"hello"}]}},
        {"label":"broken","proto_text":"Hello there","rule":{"or_patterns":[{"pattern":"hello"}]}},
        {"label":"no_proto","rule":{"or_patterns":[{"pattern":"x"}]}},
        {"label":"inactive","active":false,"proto_text":"nope","rule":{"or_patterns":[{"pattern":"x"}]}}
    ])");

    EXPECT_EQ(rule_set->prototypeMismatches(), std::vector<size_t>{1});
    EXPECT_EQ(rule_set->rule(0).metadata().proto_text, "hello there");
}

INSTANTIATE_TEST_SUITE_P(
    SequentialAndParallel,
    RuleSetTest,
    ::testing::Values(false, true),
    [](const ::testing::TestParamInfo<bool>& info) {
        return info.param ? "Parallel" : "Sequential";
    });

//============================================================================
// Threading configuration
//============================================================================

class RuleSetThreadingTest : public ::testing::Test {};

// Limited arena produces the same result as the default one
TEST_F(RuleSetThreadingTest, MaxThreadsArena) {
    std::string rules = R"([{"label":"digit","rule":{"or_patterns":[{"pattern":"\\d"}]}}])";

    auto limited = Loader(EngineConfig::fromJson(R"({
        "parallel_min_batch_size": 2, "parallel_grain_size": 4, "parallel_max_threads": 2
    })")).fromJson(rules);
    auto unlimited = Loader(EngineConfig::fromJson(R"({"parallel_min_batch_size": 2})")).fromJson(rules);

    std::vector<std::string> texts;
    for (int i = 0; i < 1000; i++) {
        texts.push_back(i % 3 == 0 ? "abc" : "a1c");
    }

    EXPECT_EQ(limited->assignLabelsVector(texts), unlimited->assignLabelsVector(texts));
}

// Config is retained by the rule set
TEST_F(RuleSetThreadingTest, ConfigRetained) {
    auto rule_set = Loader(EngineConfig::fromJson(R"({"parallel_enabled": false})")).fromJson("[]");

    EXPECT_FALSE(rule_set->config().parallel_enabled);
    EXPECT_EQ(rule_set->config().parallel_min_batch_size, 256u);
}
