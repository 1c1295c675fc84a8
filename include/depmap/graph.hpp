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

#include "errors.hpp"
#include "types.hpp"
#include <atomic>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace depmap {

using json = nlohmann::json;

// Everything one file commit changes. Built by the sync engine from the
// diff between the stored state and a fresh scan; applied all-or-nothing.
struct FileDelta {
    std::string path;
    Language language = Language::Unknown;
    std::string digest;
    uint64_t expected_revision = 0; // 0 when the file was unknown at diff time

    std::vector<Symbol> symbol_inserts;     // Ids from allocate_symbol_id()
    std::vector<Symbol> symbol_updates;     // Changed or resurrected symbols
    std::vector<SymbolId> symbol_removals;  // Tombstoned by this commit
    std::vector<Edge> edge_inserts;         // Ids assigned by the store
    std::vector<Edge> edge_updates;         // Matched by id
    std::vector<EdgeId> edge_deletes;

    bool empty() const {
        return symbol_inserts.empty() && symbol_updates.empty() && symbol_removals.empty() &&
               edge_inserts.empty() && edge_updates.empty() && edge_deletes.empty();
    }
};

// Stored state of one file, tombstoned symbols included
struct FileSnapshot {
    std::optional<SourceFile> file;
    std::vector<Symbol> symbols;
    std::vector<Edge> edges; // Out-edges of the symbols above
    uint64_t revision = 0;
};

// Binds an unbound edge to a symbol that now exists
struct EdgeRebind {
    EdgeId edge = INVALID_ID;
    SymbolId target = INVALID_ID;
    Confidence confidence = Confidence::Resolved;
};

class GraphStore;

// Consistent read access for a whole traversal. Holds the store's shared
// lock until destroyed; commits wait for it. Pointers stay valid for the
// lifetime of the view.
class ReadView {
public:
    ReadView(ReadView &&) = default;

    const SourceFile *file(FileId id) const;
    const SourceFile *file_by_path(const std::string &path) const;
    const Symbol *symbol(SymbolId id) const;
    const Edge *edge(EdgeId id) const;

    // Out-edges, bound or not
    std::vector<const Edge *> edges_from(SymbolId id) const;
    // Bound in-edges
    std::vector<const Edge *> edges_to(SymbolId id) const;
    // External edges waiting for a symbol with this resolution key
    std::vector<const Edge *> unbound_edges(const std::string &key) const;

    // Active symbols with the given resolution key, lowest id first
    std::vector<const Symbol *> lookup(const std::string &key, SymbolKind kind) const;

    std::vector<const Symbol *> symbols_of(FileId id, bool include_tombstoned = false) const;

    // All active symbols / all edges, by id
    std::vector<const Symbol *> symbols() const;
    std::vector<const Edge *> edges() const;

private:
    friend class GraphStore;
    explicit ReadView(const GraphStore &store);

    const GraphStore *store_;
    std::shared_lock<std::shared_mutex> lock_;
};

// Persistent repository of files, symbols and edges.
//
// Writes are transactional per file: apply() validates a whole FileDelta
// before touching anything, so a file's symbol and edge set either commits
// completely or not at all. Queries take a shared lock, writes an exclusive
// one. Tombstoned files and symbols are kept (and persisted) so a file that
// comes back gets its old ids.
class GraphStore {
public:
    GraphStore() = default;
    virtual ~GraphStore() = default;

    GraphStore(const GraphStore &) = delete;
    GraphStore &operator=(const GraphStore &) = delete;

    // ------------------------------------------------------------------
    // Writes
    // ------------------------------------------------------------------

    // Commit one file. Throws StoreError when the file's revision moved
    // since the snapshot the delta was built from, ConsistencyError when
    // the delta would leave a dangling or duplicate edge.
    virtual uint64_t apply(const FileDelta &delta);

    // Create or refresh a file record (un-tombstoning it)
    FileId upsert_file(const std::string &path, Language language, const std::string &digest);

    // Insert or update symbols of a file, matched by (name, arity).
    // Symbols not listed are left alone. Returns ids in input order.
    std::vector<SymbolId> upsert_symbols(FileId file, const std::vector<SymbolDraft> &symbols);

    // Insert edges, or reconfirm (observation_count + 1) and refresh an
    // existing edge with the same (source, target, kind)
    std::vector<EdgeId> upsert_edges(const std::vector<Edge> &edges);

    // Tombstone a file and its symbols; their out-edges are deleted and
    // edges pointing at them from elsewhere become external
    std::vector<SymbolId> tombstone_file(FileId file);

    // Bind unbound edges; returns how many changed. An edge that collides
    // with an existing one is merged into it.
    size_t rebind_edges(const std::vector<EdgeRebind> &rebinds);

    // Ids are reserved outside the write lock so a delta can refer to them
    SymbolId allocate_symbol_id() { return next_symbol_id_++; }

    // ------------------------------------------------------------------
    // Point queries (copies, each under its own shared lock)
    // ------------------------------------------------------------------

    std::optional<Symbol> get_symbol(SymbolId id) const;
    std::optional<SourceFile> get_file(FileId id) const;
    std::optional<SourceFile> find_file(const std::string &path) const;
    std::vector<Edge> edges_from(SymbolId id) const;
    std::vector<Edge> edges_to(SymbolId id) const;
    std::vector<Symbol> symbols_in(FileId id) const;
    std::vector<Symbol> lookup(const std::string &key, SymbolKind kind) const;
    std::vector<Edge> unbound_edges_for(const std::string &key) const;
    FileSnapshot snapshot_file(const std::string &path) const;
    GraphStats stats() const;

    ReadView read() const { return ReadView(*this); }

    // Key under which (source, target, kind) is unique; unbound edges use
    // the name as written in place of a target
    static std::string edge_key(SymbolId source, SymbolId target, const std::string &target_name,
                                RelationKind kind);
    static std::string edge_key(const Edge &edge) {
        return edge_key(edge.source, edge.target, edge.target_name, edge.kind);
    }

    // ------------------------------------------------------------------
    // Persistence
    // ------------------------------------------------------------------

    json to_json() const;

    // Replace the contents; throws StoreError on an incompatible schema
    // version or malformed input
    void load_json(const json &j);

private:
    friend class ReadView;

    mutable std::shared_mutex mutex_;

    std::map<FileId, SourceFile> files_;
    std::unordered_map<std::string, FileId> file_by_path_;
    std::map<SymbolId, Symbol> symbols_;
    std::unordered_map<FileId, std::set<SymbolId>> file_symbols_; // Tombstoned included
    std::map<EdgeId, Edge> edges_;
    std::unordered_map<SymbolId, std::set<EdgeId>> out_edges_;
    std::unordered_map<SymbolId, std::set<EdgeId>> in_edges_; // Bound edges only
    std::unordered_map<std::string, EdgeId> edge_by_key_;
    std::unordered_map<std::string, std::set<EdgeId>> unbound_by_key_;
    std::map<std::pair<SymbolKind, std::string>, std::set<SymbolId>> name_index_; // Active only

    FileId next_file_id_ = 1;
    EdgeId next_edge_id_ = 1;
    std::atomic<SymbolId> next_symbol_id_{1};

    // Unlocked helpers; callers hold mutex_
    const SourceFile *file_locked(const std::string &path) const;
    bool symbol_active(SymbolId id) const;
    FileId owner_of(SymbolId id) const;

    void index_symbol(const Symbol &symbol);
    void unindex_symbol(const Symbol &symbol);
    void index_edge(const Edge &edge);
    void unindex_edge(const Edge &edge);

    EdgeId insert_edge(Edge edge);
    void erase_edge(EdgeId id);

    // Turns a bound edge into an external one; merges on key collision
    void demote_edge(EdgeId id);

    // Folds an already unindexed edge into the existing edge with its key
    void merge_into(EdgeId from, EdgeId into);

    void refresh_leaf(SymbolId id);
    void touch_file(FileId id);
    FileId ensure_file(const std::string &path, Language language, const std::string &digest);

    void tombstone_symbol(SymbolId id, std::set<SymbolId> &touched);

    void validate(const FileDelta &delta) const;
};

} // namespace depmap
