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

#pragma once

#include "graph.hpp"
#include "types.hpp"
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace depmap {

struct CycleOptions {
    bool include_self_loops = false;
    // Traversal budget is (number of symbols) x step_factor edge visits
    size_t step_factor = 64;
};

// Lazy, restartable sequence of the provable cycles in the graph.
//
// The constructor copies the resolved/conditional edges under the store's
// shared lock and releases it; dynamic and external edges never take part.
// Strongly connected components are found with Tarjan's algorithm. Inside
// each component Johnson's circuit search runs once per start symbol, in
// ascending id order, over the members not below the start, so every
// elementary cycle is produced exactly once, beginning at its smallest id.
class CycleEnumerator {
public:
    explicit CycleEnumerator(const GraphStore &store, CycleOptions options = {});

    // Next cycle, or nullopt when exhausted (or the budget ran out)
    std::optional<Cycle> next();

    // Start over on the same snapshot
    void restart();

    // Drain from the start
    std::vector<Cycle> all();

    // The step budget stopped the walk before every component was done
    bool truncated() const { return truncated_; }

    size_t component_count() const { return components_.size(); }

private:
    CycleOptions options_;
    std::map<SymbolId, std::vector<SymbolId>> adjacency_; // Sorted, deduplicated targets
    std::map<std::pair<SymbolId, SymbolId>, Confidence> best_; // Most certain edge per pair
    std::vector<std::vector<SymbolId>> components_;           // Size > 1, or self-loops
    size_t budget_ = 0;

    // Iteration state
    size_t next_component_ = 0;
    size_t next_start_ = 0; // Index into the current component
    size_t steps_ = 0;
    bool truncated_ = false;
    std::deque<Cycle> pending_;
    std::set<std::vector<SymbolId>> emitted_;

    void find_components();

    // Elementary cycles whose smallest member is component[start_index]
    void circuits_from(const std::vector<SymbolId> &component, size_t start_index);

    void emit(std::vector<SymbolId> walk);
    bool spend(size_t steps);
};

} // namespace depmap
