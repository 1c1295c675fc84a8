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

#include "depmap/cycles.hpp"
#include "test_support/graph_fixture.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <algorithm>
#include <set>

using namespace depmap;
using depmap::testing::GraphFixture;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::SizeIs;
using ::testing::UnorderedElementsAre;

TEST(CycleEnumeratorTest, FindsThreeSymbolCycle) {
    GraphFixture g;
    g.add("A");
    g.add("B");
    g.add("C");
    g.link("A", "B");
    g.link("B", "C");
    g.link("C", "A");

    auto cycles = CycleEnumerator(g.store).all();
    ASSERT_THAT(cycles, SizeIs(1));
    EXPECT_THAT(g.names(cycles[0].symbols), ElementsAre("A", "B", "C"));
    EXPECT_TRUE(cycles[0].certain);

    // An unrelated symbol changes nothing
    g.add("D");
    EXPECT_THAT(CycleEnumerator(g.store).all(), SizeIs(1));
}

TEST(CycleEnumeratorTest, DynamicEdgesNeverCloseACycle) {
    GraphFixture g;
    g.add("X");
    g.add("Y");
    g.link("X", "Y", Confidence::Dynamic);
    g.link("Y", "X");

    CycleEnumerator enumerator(g.store);
    EXPECT_THAT(enumerator.all(), IsEmpty());
    EXPECT_EQ(enumerator.component_count(), 0u);
}

TEST(CycleEnumeratorTest, ConditionalEdgeMakesCycleUncertain) {
    GraphFixture g;
    g.add("A");
    g.add("B");
    g.link("A", "B", Confidence::Conditional);
    g.link("B", "A");

    auto cycles = CycleEnumerator(g.store).all();
    ASSERT_THAT(cycles, SizeIs(1));
    EXPECT_FALSE(cycles[0].certain);
}

TEST(CycleEnumeratorTest, SelfLoopsAreOptIn) {
    GraphFixture g;
    g.add("recurse");
    g.link("recurse", "recurse");

    EXPECT_THAT(CycleEnumerator(g.store).all(), IsEmpty());

    CycleOptions options;
    options.include_self_loops = true;
    auto cycles = CycleEnumerator(g.store, options).all();
    ASSERT_THAT(cycles, SizeIs(1));
    EXPECT_THAT(g.names(cycles[0].symbols), ElementsAre("recurse"));
}

TEST(CycleEnumeratorTest, SeparateComponentsEachReportTheirCycle) {
    GraphFixture g;
    for (const char *name : {"A", "B", "P", "Q", "R"})
        g.add(name);
    g.link("A", "B");
    g.link("B", "A");
    g.link("P", "Q");
    g.link("Q", "R");
    g.link("R", "P");
    g.link("B", "P"); // Bridge, not part of any cycle

    CycleEnumerator enumerator(g.store);
    auto cycles = enumerator.all();
    EXPECT_EQ(enumerator.component_count(), 2u);
    ASSERT_THAT(cycles, SizeIs(2));

    std::vector<std::vector<std::string>> found;
    for (const auto &c : cycles)
        found.push_back(g.names(c.symbols));
    EXPECT_THAT(found, UnorderedElementsAre(ElementsAre("A", "B"), ElementsAre("P", "Q", "R")));
}

TEST(CycleEnumeratorTest, OverlappingCyclesInOneComponent) {
    GraphFixture g;
    for (const char *name : {"A", "B", "C"})
        g.add(name);
    g.link("A", "B");
    g.link("B", "A");
    g.link("B", "C");
    g.link("C", "B");

    auto cycles = CycleEnumerator(g.store).all();
    std::vector<std::vector<std::string>> found;
    for (const auto &c : cycles)
        found.push_back(g.names(c.symbols));
    EXPECT_THAT(found, UnorderedElementsAre(ElementsAre("A", "B"), ElementsAre("B", "C")));
}

TEST(CycleEnumeratorTest, CycleClosedThroughCrossEdgeIsReported) {
    GraphFixture g;
    for (const char *name : {"a", "b", "c"})
        g.add(name);
    g.link("a", "b");
    g.link("b", "a");
    g.link("a", "c");
    g.link("c", "b");

    CycleEnumerator enumerator(g.store);
    auto cycles = enumerator.all();
    EXPECT_FALSE(enumerator.truncated());

    std::vector<std::vector<std::string>> found;
    for (const auto &c : cycles)
        found.push_back(g.names(c.symbols));
    EXPECT_THAT(found, UnorderedElementsAre(ElementsAre("a", "b"), ElementsAre("a", "c", "b")));
}

TEST(CycleEnumeratorTest, EveryElementaryCycleOfADenseComponent) {
    // Complete graph on four symbols: 6 two-cycles, 8 three-cycles, 6 four-cycles
    GraphFixture g;
    const std::vector<std::string> names = {"A", "B", "C", "D"};
    for (const auto &name : names)
        g.add(name);
    for (const auto &from : names) {
        for (const auto &to : names) {
            if (from != to)
                g.link(from, to);
        }
    }

    CycleEnumerator enumerator(g.store);
    auto cycles = enumerator.all();
    EXPECT_FALSE(enumerator.truncated());
    ASSERT_THAT(cycles, SizeIs(20));

    std::set<std::vector<SymbolId>> distinct;
    for (const auto &c : cycles) {
        EXPECT_EQ(c.symbols.front(), *std::min_element(c.symbols.begin(), c.symbols.end()));
        distinct.insert(c.symbols);
    }
    EXPECT_EQ(distinct.size(), cycles.size());
}

TEST(CycleEnumeratorTest, LazyIterationAndRestart) {
    GraphFixture g;
    for (const char *name : {"A", "B", "C", "D"})
        g.add(name);
    g.link("A", "B");
    g.link("B", "A");
    g.link("C", "D");
    g.link("D", "C");

    CycleEnumerator enumerator(g.store);
    ASSERT_TRUE(enumerator.next().has_value());
    ASSERT_TRUE(enumerator.next().has_value());
    EXPECT_FALSE(enumerator.next().has_value());

    enumerator.restart();
    EXPECT_TRUE(enumerator.next().has_value());
}

TEST(CycleEnumeratorTest, SnapshotIgnoresLaterCommits) {
    GraphFixture g;
    g.add("A");
    g.add("B");
    g.link("A", "B");

    CycleEnumerator enumerator(g.store);
    g.link("B", "A");
    EXPECT_THAT(enumerator.all(), IsEmpty());
    EXPECT_THAT(CycleEnumerator(g.store).all(), SizeIs(1));
}

TEST(CycleEnumeratorTest, TombstonedSymbolsBreakCycles) {
    GraphFixture g;
    g.add("A");
    g.add("B");
    g.link("A", "B");
    g.link("B", "A");

    g.store.tombstone_file(g.store.find_file("B.py")->id);
    EXPECT_THAT(CycleEnumerator(g.store).all(), IsEmpty());
}

TEST(CycleEnumeratorTest, StepBudgetTruncates) {
    GraphFixture g;
    const int n = 12;
    for (int i = 0; i < n; ++i)
        g.add("n" + std::to_string(i));
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if (i != j)
                g.link("n" + std::to_string(i), "n" + std::to_string(j));
        }
    }

    CycleOptions options;
    options.step_factor = 1;
    CycleEnumerator enumerator(g.store, options);
    enumerator.all();
    EXPECT_TRUE(enumerator.truncated());
}
