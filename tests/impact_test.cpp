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

#include "depmap/impact.hpp"
#include "test_support/graph_fixture.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace depmap;
using depmap::testing::GraphFixture;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::SizeIs;

namespace {

std::vector<std::string> names(const ImpactResult &result) {
    std::vector<std::string> out;
    for (const auto &e : result.entries)
        out.push_back(e.name);
    return out;
}

// A <- B <- C <- D <- E: each calls the previous one
void chain(GraphFixture &g) {
    for (const char *name : {"A", "B", "C", "D", "E"})
        g.add(name);
    g.link("B", "A");
    g.link("C", "B");
    g.link("D", "C");
    g.link("E", "D");
}

} // namespace

TEST(ImpactAnalyzerTest, DepthCapBoundsTheWalk) {
    GraphFixture g;
    chain(g);

    ImpactOptions options;
    options.max_depth = 2;
    auto result = ImpactAnalyzer(g.store).impact_of(g.id("A"), options);

    EXPECT_TRUE(result.target_found);
    ASSERT_THAT(names(result), ElementsAre("B", "C"));
    EXPECT_EQ(result.entries[0].depth, 1u);
    EXPECT_EQ(result.entries[1].depth, 2u);
    EXPECT_EQ(result.entries[0].file, "B.py");
}

TEST(ImpactAnalyzerTest, DefaultDepthReachesWholeChain) {
    GraphFixture g;
    chain(g);
    auto result = ImpactAnalyzer(g.store).impact_of(g.id("A"));
    EXPECT_THAT(names(result), ElementsAre("B", "C", "D", "E"));
    EXPECT_FALSE(result.truncated);
}

TEST(ImpactAnalyzerTest, LeafWithoutCallersIsEmptyNotError) {
    GraphFixture g;
    chain(g);
    auto result = ImpactAnalyzer(g.store).impact_of(g.id("E"));
    EXPECT_TRUE(result.target_found);
    EXPECT_THAT(result.entries, IsEmpty());

    auto unknown = ImpactAnalyzer(g.store).impact_of(9999);
    EXPECT_FALSE(unknown.target_found);
}

TEST(ImpactAnalyzerTest, ShortestDepthWins) {
    GraphFixture g;
    for (const char *name : {"T", "M", "X"})
        g.add(name);
    g.link("M", "T");
    g.link("X", "M");
    g.link("X", "T"); // Direct route

    auto result = ImpactAnalyzer(g.store).impact_of(g.id("T"));
    ASSERT_THAT(result.entries, SizeIs(2));
    for (const auto &e : result.entries)
        EXPECT_EQ(e.depth, 1u);
}

TEST(ImpactAnalyzerTest, UncertainEdgesGivePossibleImpact) {
    GraphFixture g;
    for (const char *name : {"T", "cond", "dyn", "above"})
        g.add(name);
    g.link("cond", "T", Confidence::Conditional);
    g.link("dyn", "T", Confidence::Dynamic);
    g.link("above", "cond");

    auto result = ImpactAnalyzer(g.store).impact_of(g.id("T"));
    ASSERT_THAT(names(result), ElementsAre("cond", "dyn", "above"));
    for (const auto &e : result.entries)
        EXPECT_EQ(e.certainty, ImpactCertainty::Possible);
}

TEST(ImpactAnalyzerTest, ResolvedShortestPathMakesImpactCertain) {
    GraphFixture g;
    for (const char *name : {"T", "a", "b", "top"})
        g.add(name);
    g.link("a", "T", Confidence::Dynamic);
    g.link("b", "T");
    g.link("top", "a");
    g.link("top", "b");

    auto result = ImpactAnalyzer(g.store).impact_of(g.id("T"));
    ASSERT_THAT(names(result), ElementsAre("a", "b", "top"));
    EXPECT_EQ(result.entries[0].certainty, ImpactCertainty::Possible);
    EXPECT_EQ(result.entries[1].certainty, ImpactCertainty::Certain);
    EXPECT_EQ(result.entries[2].certainty, ImpactCertainty::Certain);
}

TEST(ImpactAnalyzerTest, CyclesTerminateAndSelfCallsAreSkipped) {
    GraphFixture g;
    g.add("A");
    g.add("B");
    g.link("A", "B");
    g.link("B", "A");
    g.link("A", "A");

    auto result = ImpactAnalyzer(g.store).impact_of(g.id("A"));
    EXPECT_THAT(names(result), ElementsAre("B"));
}

TEST(ImpactAnalyzerTest, ResultAndFanoutCapsTruncate) {
    GraphFixture g;
    g.add("T");
    for (int i = 0; i < 6; ++i) {
        std::string name = "c" + std::to_string(i);
        g.add(name);
        g.link(name, "T");
    }

    ImpactOptions capped;
    capped.max_results = 3;
    auto result = ImpactAnalyzer(g.store).impact_of(g.id("T"), capped);
    EXPECT_THAT(result.entries, SizeIs(3));
    EXPECT_TRUE(result.truncated);

    ImpactOptions fanout;
    fanout.max_fanout = 2;
    auto narrow = ImpactAnalyzer(g.store).impact_of(g.id("T"), fanout);
    EXPECT_THAT(names(narrow), ElementsAre("c0", "c1"));
    EXPECT_TRUE(narrow.truncated);
}

TEST(ImpactAnalyzerTest, TombstonedTargetHasNoImpact) {
    GraphFixture g;
    g.add("A");
    g.add("B");
    g.link("B", "A");
    g.store.tombstone_file(g.store.find_file("A.py")->id);

    auto result = ImpactAnalyzer(g.store).impact_of(g.id("A"));
    EXPECT_FALSE(result.target_found);
    EXPECT_THAT(result.entries, IsEmpty());
}
