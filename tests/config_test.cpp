// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "depmap/config.hpp"
#include "depmap/errors.hpp"
#include "test_support/temporary_project.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace depmap;
using depmap::testing::TemporaryProject;
using ::testing::Contains;

TEST(EngineConfigTest, Defaults) {
    EngineConfig config;
    EXPECT_EQ(config.num_threads, 0u);
    EXPECT_EQ(config.default_impact_depth, 5u);
    EXPECT_EQ(config.max_impact_results, 10000u);
    EXPECT_EQ(config.cycle_step_factor, 64u);
    EXPECT_FALSE(config.include_self_loops);
    EXPECT_EQ(config.store_path, ".depmap.json");
    EXPECT_EQ(config.log_level, LogLevel::Warn);
    EXPECT_THAT(config.ignore_patterns, Contains("node_modules"));
    EXPECT_THAT(config.ignore_patterns, Contains("__pycache__"));
}

TEST(EngineConfigTest, OverlaysKnownKeysAndIgnoresUnknown) {
    json j = {{"num_threads", 3},
              {"default_impact_depth", 2},
              {"include_self_loops", true},
              {"ignore_patterns", {"third_party"}},
              {"log_level", "debug"},
              {"colour", "blue"}};
    EngineConfig config = EngineConfig::from_json(j);
    EXPECT_EQ(config.num_threads, 3u);
    EXPECT_EQ(config.default_impact_depth, 2u);
    EXPECT_TRUE(config.include_self_loops);
    EXPECT_EQ(config.ignore_patterns, std::vector<std::string>{"third_party"});
    EXPECT_EQ(config.log_level, LogLevel::Debug);
    EXPECT_EQ(config.max_impact_results, 10000u);
}

TEST(EngineConfigTest, RejectsBadTypes) {
    EXPECT_THROW(EngineConfig::from_json(json::array()), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"num_threads", -1}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"num_threads", "four"}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"include_self_loops", 1}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"ignore_patterns", {1, 2}}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"log_level", "loud"}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"cycle_step_factor", 0}}), ConfigError);
}

TEST(EngineConfigTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(EngineConfig::from_json({{"num_threads", 4294967296ull}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"default_impact_depth", 0}}), ConfigError);
    EXPECT_EQ(EngineConfig::from_json({{"num_threads", 4294967295ull}}).num_threads, 4294967295u);
    EXPECT_EQ(EngineConfig::from_json({{"default_impact_depth", 1}}).default_impact_depth, 1u);
}

TEST(EngineConfigTest, LoadsFromFile) {
    TemporaryProject project;
    project.write("depmap.json", R"({"max_impact_results": 50, "store_path": "graph.json"})");

    EngineConfig config = EngineConfig::load(project.path("depmap.json").string());
    EXPECT_EQ(config.max_impact_results, 50u);
    EXPECT_EQ(config.store_path, "graph.json");

    EngineConfig again = EngineConfig::from_json(config.to_json());
    EXPECT_EQ(again.max_impact_results, 50u);
    EXPECT_EQ(again.ignore_patterns, config.ignore_patterns);
}

TEST(EngineConfigTest, LoadFailuresAreConfigErrors) {
    TemporaryProject project;
    project.write("broken.json", "{ not json");
    EXPECT_THROW(EngineConfig::load(project.path("broken.json").string()), ConfigError);
    EXPECT_THROW(EngineConfig::load(project.path("missing.json").string()), ConfigError);
}
