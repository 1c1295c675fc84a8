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
#include <vector>

namespace depmap {

struct ImpactOptions {
    size_t max_depth = 5;
    size_t max_results = 10000;
    size_t max_fanout = 0; // Callers expanded per symbol, 0 = all
};

struct ImpactResult {
    std::vector<ImpactEntry> entries; // By depth, then name
    bool target_found = false;
    bool truncated = false; // A result or fan-out cap cut the walk short
};

// Bounded reverse reachability: who depends, transitively, on a symbol.
//
// Breadth-first over bound in-edges, one depth level at a time, under the
// store's shared lock. Each dependent is reported once at the depth it was
// first reached. It is certain when some shortest path to the target uses
// only resolved edges, possible otherwise.
class ImpactAnalyzer {
public:
    explicit ImpactAnalyzer(const GraphStore &store) : store_(store) {}

    ImpactResult impact_of(SymbolId target, const ImpactOptions &options = {}) const;

private:
    const GraphStore &store_;
};

} // namespace depmap
