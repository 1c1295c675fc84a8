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
#include <algorithm>
#include <unordered_map>

namespace depmap {

ImpactResult ImpactAnalyzer::impact_of(SymbolId target, const ImpactOptions &options) const {
    ImpactResult result;
    auto view = store_.read();

    const Symbol *root = view.symbol(target);
    if (!root || root->tombstoned)
        return result;
    result.target_found = true;

    struct Reach {
        size_t depth;
        bool certain;
    };
    std::unordered_map<SymbolId, Reach> reached;
    reached[target] = {0, true};

    std::vector<SymbolId> frontier{target};
    for (size_t depth = 1; depth <= options.max_depth && !frontier.empty(); ++depth) {
        std::vector<SymbolId> next_frontier;

        for (SymbolId node : frontier) {
            bool node_certain = reached[node].certain;
            auto incoming = view.edges_to(node);
            std::sort(incoming.begin(), incoming.end(),
                      [](const Edge *a, const Edge *b) { return a->source < b->source; });
            if (options.max_fanout > 0 && incoming.size() > options.max_fanout) {
                incoming.resize(options.max_fanout);
                result.truncated = true;
            }

            for (const Edge *edge : incoming) {
                if (edge->source == node)
                    continue;
                bool certain = node_certain && edge->confidence == Confidence::Resolved;

                auto found = reached.find(edge->source);
                if (found != reached.end()) {
                    // Another shortest path may prove it
                    if (found->second.depth == depth && certain)
                        found->second.certain = true;
                    continue;
                }
                if (reached.size() - 1 >= options.max_results) {
                    result.truncated = true;
                    continue;
                }
                reached[edge->source] = {depth, certain};
                next_frontier.push_back(edge->source);
            }
        }
        frontier = std::move(next_frontier);
    }

    for (const auto &[id, reach] : reached) {
        if (id == target)
            continue;
        const Symbol *symbol = view.symbol(id);
        const SourceFile *file = symbol ? view.file(symbol->file) : nullptr;

        ImpactEntry entry;
        entry.symbol = id;
        entry.name = symbol ? symbol->name : "";
        entry.file = file ? file->path : "";
        entry.depth = reach.depth;
        entry.certainty = reach.certain ? ImpactCertainty::Certain : ImpactCertainty::Possible;
        result.entries.push_back(std::move(entry));
    }

    std::sort(result.entries.begin(), result.entries.end(),
              [](const ImpactEntry &a, const ImpactEntry &b) {
                  if (a.depth != b.depth)
                      return a.depth < b.depth;
                  if (a.name != b.name)
                      return a.name < b.name;
                  return a.symbol < b.symbol;
              });
    return result;
}

} // namespace depmap
