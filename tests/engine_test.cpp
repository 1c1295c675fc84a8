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

#include "depmap/engine.hpp"
#include "depmap/errors.hpp"
#include "test_support/script_scanner.hpp"
#include "test_support/temporary_project.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace depmap;
using namespace depmap::testing;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::SizeIs;
using ::testing::UnorderedElementsAre;

namespace {

std::vector<std::string> names_of(const std::vector<Symbol> &symbols) {
    std::vector<std::string> names;
    for (const auto &s : symbols)
        names.push_back(s.name);
    return names;
}

std::vector<std::string> names_of(const std::vector<SymbolView> &views) {
    std::vector<std::string> names;
    for (const auto &v : views)
        names.push_back(v.symbol.name);
    return names;
}

class EngineTest : public ::testing::Test {
protected:
    Engine engine{EngineConfig{}, nullptr, script_registry()};

    SymbolId id_of(const std::string &name) {
        auto found = engine.symbols_named(name);
        EXPECT_THAT(found, SizeIs(1)) << name;
        return found.empty() ? INVALID_ID : found[0].symbol.id;
    }

    std::vector<std::string> cycle_names(const Cycle &cycle) {
        std::vector<std::string> names;
        for (SymbolId id : cycle.symbols)
            names.push_back(engine.store().get_symbol(id)->name);
        return names;
    }
};

} // namespace

TEST_F(EngineTest, SecondSyncOfSameTreeChangesNothing) {
    std::vector<SourceInput> tree = {script_input("a.dm", "fn A\ncall A B\n"),
                                     script_input("b.dm", "fn B\n")};
    engine.sync(tree);
    GraphStats before = engine.stats();

    auto report = engine.sync(tree);
    EXPECT_EQ(report.files_added + report.files_modified + report.files_removed, 0u);
    EXPECT_EQ(report.files_unchanged, 2u);

    GraphStats after = engine.stats();
    EXPECT_EQ(after.symbols, before.symbols);
    EXPECT_EQ(after.edges, before.edges);
    EXPECT_EQ(after.resolved_edges, before.resolved_edges);
}

TEST_F(EngineTest, RemovedFileLeavesNoSymbolsOrImpact) {
    engine.sync({script_input("x.dm", "fn A\nfn B\ncall A B\n")});
    SymbolId b = id_of("B");
    ASSERT_THAT(engine.impact_of(b).entries, SizeIs(1));

    engine.sync({});
    EXPECT_THAT(engine.symbols_in("x.dm"), IsEmpty());
    EXPECT_THAT(engine.impact_of(b).entries, IsEmpty());
    EXPECT_EQ(engine.stats().tombstoned_files, 1u);
}

TEST_F(EngineTest, FindsTheThreeSymbolCycle) {
    engine.sync({script_input("abc.dm", "fn A\nfn B\nfn C\ncall A B\ncall B C\ncall C A\n")});

    auto cycles = engine.find_cycles();
    ASSERT_THAT(cycles, SizeIs(1));
    EXPECT_THAT(cycle_names(cycles[0]), UnorderedElementsAre("A", "B", "C"));
    EXPECT_TRUE(cycles[0].certain);

    engine.sync({script_input("abc.dm", "fn A\nfn B\nfn C\ncall A B\ncall B C\ncall C A\n"),
                 script_input("d.dm", "fn D\n")});
    EXPECT_THAT(engine.find_cycles(), SizeIs(1));
}

TEST_F(EngineTest, DynamicEdgesNeverCloseACycle) {
    engine.sync({script_input("xy.dm", "fn X\nfn Y\ncall X Y dynamic\ncall Y X\n")});

    EXPECT_THAT(engine.find_cycles(), IsEmpty());

    auto cycles = engine.cycles();
    EXPECT_FALSE(cycles.next().has_value());
}

TEST_F(EngineTest, ConditionalCycleIsUncertain) {
    engine.sync({script_input("pq.dm", "fn P\nfn Q\ncall P Q conditional\ncall Q P\n")});

    auto cycles = engine.find_cycles();
    ASSERT_THAT(cycles, SizeIs(1));
    EXPECT_FALSE(cycles[0].certain);
}

TEST_F(EngineTest, ImpactStopsAtRequestedDepth) {
    engine.sync({script_input("chain.dm", "fn A\n"
                                          "fn B\ncall B A\n"
                                          "fn C\ncall C B\n"
                                          "fn D\ncall D C\n"
                                          "fn E\ncall E D\n")});

    auto result = engine.impact_of(id_of("A"), 2);
    EXPECT_TRUE(result.target_found);
    ASSERT_THAT(result.entries, SizeIs(2));
    EXPECT_EQ(result.entries[0].name, "B");
    EXPECT_EQ(result.entries[0].depth, 1u);
    EXPECT_EQ(result.entries[1].name, "C");
    EXPECT_EQ(result.entries[1].depth, 2u);
    EXPECT_EQ(result.entries[0].file, "chain.dm");

    // Configured default depth is 5
    EXPECT_THAT(engine.impact_of(id_of("A")).entries, SizeIs(4));
}

TEST_F(EngineTest, UnreadableFileDoesNotBlockOthers) {
    engine.sync({script_input("a.dm", "fn A\n"), script_input("b.dm", "fn B\n")});

    auto report = engine.sync({unreadable_input("a.dm"), script_input("b.dm", "fn B\nfn B2\n")});
    EXPECT_EQ(report.files_modified, 1u);
    ASSERT_THAT(report.errors, SizeIs(1));
    EXPECT_EQ(report.errors[0].kind, FileErrorKind::Scan);
    EXPECT_THAT(names_of(engine.symbols_in("a.dm")), ElementsAre("<module>", "A"));
    EXPECT_THAT(names_of(engine.symbols_in("b.dm")), ElementsAre("<module>", "B", "B2"));
}

TEST_F(EngineTest, RenamedFunctionIsRemovedAndAdded) {
    engine.sync({script_input("m.dm", "fn foo 1\n")});
    SymbolId foo = id_of("foo");

    auto report = engine.sync({script_input("m.dm", "fn bar 1\n")});
    EXPECT_THAT(report.updated_symbols, IsEmpty());
    ASSERT_THAT(report.created_symbols, SizeIs(1));
    EXPECT_EQ(report.created_symbols[0].name, "bar");
    ASSERT_THAT(report.tombstoned_symbols, SizeIs(1));
    EXPECT_EQ(report.tombstoned_symbols[0].id, foo);
    EXPECT_THAT(names_of(engine.symbols_in("m.dm")), ElementsAre("<module>", "bar"));
}

TEST_F(EngineTest, OrphansIgnoreRecursion) {
    engine.sync({script_input("a.dm", "fn main\nfn used\nfn unused\nfn recursive\n"
                                      "call main used\ncall recursive recursive\n")});

    EXPECT_THAT(names_of(engine.find_orphans()), ElementsAre("main", "unused", "recursive"));
}

TEST_F(EngineTest, UncertainEdgesNameBothEnds) {
    engine.sync({script_input("a.dm", "fn run\nfn save\ncall run save dynamic\ncall run load\n")});

    auto edges = engine.uncertain_edges();
    ASSERT_THAT(edges, SizeIs(1));
    EXPECT_EQ(edges[0].source_name, "run");
    EXPECT_EQ(edges[0].source_file, "a.dm");
    EXPECT_EQ(edges[0].target_name, "save");
    EXPECT_EQ(edges[0].edge.confidence, Confidence::Dynamic);
}

TEST_F(EngineTest, SymbolSearch) {
    engine.sync({script_input("a.dm", "fn Engine::step\nfn Engine::stop\nfn helper\n")});

    EXPECT_THAT(names_of(engine.find_symbols("Engine::")),
                UnorderedElementsAre("Engine::step", "Engine::stop"));
    EXPECT_THAT(names_of(engine.symbols_named("Engine::step")), ElementsAre("Engine::step"));
    // Falls back to the resolution key
    EXPECT_THAT(names_of(engine.symbols_named("stop")), ElementsAre("Engine::stop"));
    EXPECT_THAT(engine.symbols_named("missing"), IsEmpty());
}

TEST_F(EngineTest, SaveAndLoadRoundTrip) {
    TemporaryProject dir;
    std::vector<SourceInput> tree = {script_input("a.dm", "fn A\ncall A B\n"),
                                     script_input("b.dm", "fn B\n")};
    engine.sync(tree);
    std::string path = dir.path("store.json").string();
    engine.save(path);
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

    Engine restored(EngineConfig{}, nullptr, script_registry());
    restored.load(path);
    EXPECT_EQ(restored.stats().symbols, engine.stats().symbols);
    EXPECT_EQ(restored.stats().resolved_edges, 1u);
    EXPECT_EQ(restored.checksums().entries(), engine.checksums().entries());

    auto report = restored.sync(tree);
    EXPECT_EQ(report.files_unchanged, 2u);
    EXPECT_FALSE(report.has_changes());
}

TEST_F(EngineTest, LoadRejectsBadStores) {
    TemporaryProject dir;
    engine.sync({script_input("a.dm", "fn A\n")});
    size_t symbols = engine.stats().symbols;

    EXPECT_THROW(engine.load(dir.path("missing.json").string()), StoreError);

    dir.write("garbage.json", "{not json");
    EXPECT_THROW(engine.load(dir.path("garbage.json").string()), StoreError);

    dir.write("future.json",
              R"({"metadata": {"version": "2.0.0"}, "graph": {}, "checksums": {}})");
    EXPECT_THROW(engine.load(dir.path("future.json").string()), StoreError);

    EXPECT_EQ(engine.stats().symbols, symbols);
    EXPECT_TRUE(engine.checksums().contains("a.dm"));
}

TEST_F(EngineTest, SyncDirectoryWalksTheTree) {
    TemporaryProject project;
    project.write("src/a.dm", "fn A\ncall A B\n");
    project.write("src/b.dm", "fn B\n");
    project.write("node_modules/dep/c.dm", "fn C\n");

    auto report = engine.sync_directory(project.root_string());
    EXPECT_EQ(report.files_added, 2u);
    EXPECT_THAT(names_of(engine.symbols_in("src/a.dm")), ElementsAre("<module>", "A"));
    EXPECT_THAT(engine.symbols_named("C"), IsEmpty());

    project.remove("src/b.dm");
    report = engine.sync_directory(project.root_string());
    EXPECT_EQ(report.files_removed, 1u);
    EXPECT_TRUE(engine.uncertain_edges().empty());
}
