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
#include <algorithm>
#include <map>
#include <unordered_map>

namespace depmap {

namespace {

struct Frame {
    SymbolId node;
    size_t next_child;
};

} // namespace

CycleEnumerator::CycleEnumerator(const GraphStore &store, CycleOptions options)
    : options_(options) {
    size_t nodes = 0;
    {
        auto view = store.read();
        nodes = view.symbols().size();
        for (const Edge *e : view.edges()) {
            if (!e->internal() || !is_provable(e->confidence))
                continue;
            if (e->source == e->target && !options_.include_self_loops)
                continue;
            const Symbol *source = view.symbol(e->source);
            const Symbol *target = view.symbol(e->target);
            if (!source || !target || source->tombstoned || target->tombstoned)
                continue;

            adjacency_[e->source].push_back(e->target);
            auto key = std::make_pair(e->source, e->target);
            auto found = best_.find(key);
            if (found == best_.end())
                best_[key] = e->confidence;
            else
                found->second = most_certain(found->second, e->confidence);
        }
    }

    for (auto &[node, targets] : adjacency_) {
        std::sort(targets.begin(), targets.end());
        targets.erase(std::unique(targets.begin(), targets.end()), targets.end());
    }

    budget_ = std::max<size_t>(nodes, 1) * std::max<size_t>(options_.step_factor, 1);
    find_components();
}

void CycleEnumerator::find_components() {
    std::unordered_map<SymbolId, size_t> index;
    std::unordered_map<SymbolId, size_t> low;
    std::set<SymbolId> on_stack;
    std::vector<SymbolId> stack;
    size_t counter = 0;

    // Iterative Tarjan; call frames replace recursion
    for (const auto &[root, unused] : adjacency_) {
        if (index.count(root))
            continue;

        std::vector<Frame> call{{root, 0}};
        index[root] = low[root] = counter++;
        stack.push_back(root);
        on_stack.insert(root);

        while (!call.empty()) {
            SymbolId v = call.back().node;
            auto adj = adjacency_.find(v);
            if (adj != adjacency_.end() && call.back().next_child < adj->second.size()) {
                SymbolId w = adj->second[call.back().next_child++];
                if (!index.count(w)) {
                    index[w] = low[w] = counter++;
                    stack.push_back(w);
                    on_stack.insert(w);
                    call.push_back({w, 0});
                } else if (on_stack.count(w)) {
                    low[v] = std::min(low[v], index[w]);
                }
                continue;
            }

            call.pop_back();
            if (!call.empty()) {
                SymbolId parent = call.back().node;
                low[parent] = std::min(low[parent], low[v]);
            }

            if (low[v] == index[v]) {
                std::vector<SymbolId> component;
                SymbolId w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack.erase(w);
                    component.push_back(w);
                } while (w != v);

                bool self_loop = component.size() == 1 && best_.count({v, v});
                if (component.size() > 1 || self_loop) {
                    std::sort(component.begin(), component.end());
                    components_.push_back(std::move(component));
                }
            }
        }
    }

    std::sort(components_.begin(), components_.end());
}

bool CycleEnumerator::spend(size_t steps) {
    steps_ += steps;
    if (steps_ > budget_) {
        truncated_ = true;
        return false;
    }
    return true;
}

void CycleEnumerator::emit(std::vector<SymbolId> walk) {
    if (walk.empty())
        return;
    std::rotate(walk.begin(), std::min_element(walk.begin(), walk.end()), walk.end());
    if (!emitted_.insert(walk).second)
        return;

    Cycle cycle;
    cycle.symbols = walk;
    for (size_t i = 0; i < walk.size(); ++i) {
        auto found = best_.find({walk[i], walk[(i + 1) % walk.size()]});
        if (found == best_.end() || found->second != Confidence::Resolved) {
            cycle.certain = false;
            break;
        }
    }
    pending_.push_back(std::move(cycle));
}

namespace {

// Johnson's unblock, without recursion
void unblock(SymbolId node, std::set<SymbolId> &blocked,
             std::map<SymbolId, std::set<SymbolId>> &block_map) {
    std::vector<SymbolId> work{node};
    while (!work.empty()) {
        SymbolId v = work.back();
        work.pop_back();
        blocked.erase(v);
        auto waiting = block_map.find(v);
        if (waiting == block_map.end())
            continue;
        for (SymbolId w : waiting->second) {
            if (blocked.count(w))
                work.push_back(w);
        }
        block_map.erase(waiting);
    }
}

struct CircuitFrame {
    SymbolId node;
    size_t next_child;
    bool closed; // Some cycle back to the start went through this node
};

} // namespace

void CycleEnumerator::circuits_from(const std::vector<SymbolId> &component,
                                    size_t start_index) {
    SymbolId start = component[start_index];
    if (component.size() == 1) {
        emit({start});
        return;
    }

    std::set<SymbolId> allowed(component.begin() + start_index, component.end());
    std::set<SymbolId> blocked{start};
    std::map<SymbolId, std::set<SymbolId>> block_map;
    std::vector<SymbolId> path{start};
    std::vector<CircuitFrame> call{{start, 0, false}};

    while (!call.empty()) {
        CircuitFrame &top = call.back();
        auto adj = adjacency_.find(top.node);
        if (adj != adjacency_.end() && top.next_child < adj->second.size()) {
            SymbolId w = adj->second[top.next_child++];
            if (!spend(1))
                return;
            if (!allowed.count(w))
                continue;

            if (w == start) {
                emit(path);
                top.closed = true;
            } else if (!blocked.count(w)) {
                blocked.insert(w);
                path.push_back(w);
                call.push_back({w, 0, false});
            }
            continue;
        }

        CircuitFrame done = top;
        call.pop_back();
        path.pop_back();

        if (done.closed) {
            unblock(done.node, blocked, block_map);
            if (!call.empty())
                call.back().closed = true;
        } else if (adj != adjacency_.end()) {
            // Stays blocked until one of its successors is unblocked
            for (SymbolId w : adj->second) {
                if (allowed.count(w))
                    block_map[w].insert(done.node);
            }
        }
    }
}

std::optional<Cycle> CycleEnumerator::next() {
    while (pending_.empty()) {
        if (truncated_ || next_component_ >= components_.size())
            return std::nullopt;

        const auto &component = components_[next_component_];
        circuits_from(component, next_start_++);
        if (next_start_ >= component.size()) {
            ++next_component_;
            next_start_ = 0;
        }
    }
    Cycle cycle = std::move(pending_.front());
    pending_.pop_front();
    return cycle;
}

void CycleEnumerator::restart() {
    next_component_ = 0;
    next_start_ = 0;
    steps_ = 0;
    truncated_ = false;
    pending_.clear();
    emitted_.clear();
}

std::vector<Cycle> CycleEnumerator::all() {
    restart();
    std::vector<Cycle> cycles;
    while (auto cycle = next()) {
        cycles.push_back(std::move(*cycle));
    }
    return cycles;
}

} // namespace depmap
