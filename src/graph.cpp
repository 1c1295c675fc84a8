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

#include "depmap/graph.hpp"
#include "depmap/version.hpp"
#include <algorithm>
#include <chrono>
#include <mutex>

namespace depmap {

namespace {

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string symbol_label(SymbolId id) { return "symbol " + std::to_string(id); }
std::string edge_label(EdgeId id) { return "edge " + std::to_string(id); }

} // namespace

// ============================================================================
// ReadView
// ============================================================================

ReadView::ReadView(const GraphStore &store) : store_(&store), lock_(store.mutex_) {}

const SourceFile *ReadView::file(FileId id) const {
    auto it = store_->files_.find(id);
    return it == store_->files_.end() ? nullptr : &it->second;
}

const SourceFile *ReadView::file_by_path(const std::string &path) const {
    return store_->file_locked(path);
}

const Symbol *ReadView::symbol(SymbolId id) const {
    auto it = store_->symbols_.find(id);
    return it == store_->symbols_.end() ? nullptr : &it->second;
}

const Edge *ReadView::edge(EdgeId id) const {
    auto it = store_->edges_.find(id);
    return it == store_->edges_.end() ? nullptr : &it->second;
}

std::vector<const Edge *> ReadView::edges_from(SymbolId id) const {
    std::vector<const Edge *> result;
    auto it = store_->out_edges_.find(id);
    if (it == store_->out_edges_.end())
        return result;
    for (EdgeId eid : it->second) {
        result.push_back(&store_->edges_.at(eid));
    }
    return result;
}

std::vector<const Edge *> ReadView::edges_to(SymbolId id) const {
    std::vector<const Edge *> result;
    auto it = store_->in_edges_.find(id);
    if (it == store_->in_edges_.end())
        return result;
    for (EdgeId eid : it->second) {
        result.push_back(&store_->edges_.at(eid));
    }
    return result;
}

std::vector<const Edge *> ReadView::unbound_edges(const std::string &key) const {
    std::vector<const Edge *> result;
    auto it = store_->unbound_by_key_.find(key);
    if (it == store_->unbound_by_key_.end())
        return result;
    for (EdgeId eid : it->second) {
        result.push_back(&store_->edges_.at(eid));
    }
    return result;
}

std::vector<const Symbol *> ReadView::lookup(const std::string &key, SymbolKind kind) const {
    std::vector<const Symbol *> result;
    auto it = store_->name_index_.find({kind, key});
    if (it == store_->name_index_.end())
        return result;
    for (SymbolId id : it->second) {
        result.push_back(&store_->symbols_.at(id));
    }
    return result;
}

std::vector<const Symbol *> ReadView::symbols_of(FileId id, bool include_tombstoned) const {
    std::vector<const Symbol *> result;
    auto it = store_->file_symbols_.find(id);
    if (it == store_->file_symbols_.end())
        return result;
    for (SymbolId sid : it->second) {
        const Symbol &s = store_->symbols_.at(sid);
        if (include_tombstoned || !s.tombstoned)
            result.push_back(&s);
    }
    return result;
}

std::vector<const Symbol *> ReadView::symbols() const {
    std::vector<const Symbol *> result;
    for (const auto &[id, s] : store_->symbols_) {
        if (!s.tombstoned)
            result.push_back(&s);
    }
    return result;
}

std::vector<const Edge *> ReadView::edges() const {
    std::vector<const Edge *> result;
    result.reserve(store_->edges_.size());
    for (const auto &[id, e] : store_->edges_) {
        result.push_back(&e);
    }
    return result;
}

// ============================================================================
// Index maintenance
// ============================================================================

std::string GraphStore::edge_key(SymbolId source, SymbolId target, const std::string &target_name,
                                 RelationKind kind) {
    std::string key = std::to_string(source) + "|";
    if (target != INVALID_ID) {
        key += std::to_string(target);
    } else {
        key += "?" + target_name;
    }
    return key + "|" + relation_to_string(kind);
}

const SourceFile *GraphStore::file_locked(const std::string &path) const {
    auto it = file_by_path_.find(path);
    if (it == file_by_path_.end())
        return nullptr;
    return &files_.at(it->second);
}

bool GraphStore::symbol_active(SymbolId id) const {
    auto it = symbols_.find(id);
    return it != symbols_.end() && !it->second.tombstoned;
}

FileId GraphStore::owner_of(SymbolId id) const {
    auto it = symbols_.find(id);
    return it == symbols_.end() ? INVALID_ID : it->second.file;
}

void GraphStore::index_symbol(const Symbol &symbol) {
    if (!symbol.tombstoned)
        name_index_[{symbol.kind, symbol.short_name}].insert(symbol.id);
}

void GraphStore::unindex_symbol(const Symbol &symbol) {
    auto it = name_index_.find({symbol.kind, symbol.short_name});
    if (it == name_index_.end())
        return;
    it->second.erase(symbol.id);
    if (it->second.empty())
        name_index_.erase(it);
}

void GraphStore::index_edge(const Edge &edge) {
    edge_by_key_[edge_key(edge)] = edge.id;
    out_edges_[edge.source].insert(edge.id);
    if (edge.internal()) {
        in_edges_[edge.target].insert(edge.id);
    } else {
        unbound_by_key_[edge.target_key].insert(edge.id);
    }
}

void GraphStore::unindex_edge(const Edge &edge) {
    auto key_it = edge_by_key_.find(edge_key(edge));
    if (key_it != edge_by_key_.end() && key_it->second == edge.id)
        edge_by_key_.erase(key_it);

    auto out_it = out_edges_.find(edge.source);
    if (out_it != out_edges_.end()) {
        out_it->second.erase(edge.id);
        if (out_it->second.empty())
            out_edges_.erase(out_it);
    }
    if (edge.internal()) {
        auto in_it = in_edges_.find(edge.target);
        if (in_it != in_edges_.end()) {
            in_it->second.erase(edge.id);
            if (in_it->second.empty())
                in_edges_.erase(in_it);
        }
    } else {
        auto un_it = unbound_by_key_.find(edge.target_key);
        if (un_it != unbound_by_key_.end()) {
            un_it->second.erase(edge.id);
            if (un_it->second.empty())
                unbound_by_key_.erase(un_it);
        }
    }
}

EdgeId GraphStore::insert_edge(Edge edge) {
    edge.id = next_edge_id_++;
    EdgeId id = edge.id;
    index_edge(edges_.emplace(id, std::move(edge)).first->second);
    return id;
}

void GraphStore::erase_edge(EdgeId id) {
    auto it = edges_.find(id);
    if (it == edges_.end())
        return;
    unindex_edge(it->second);
    edges_.erase(it);
}

void GraphStore::merge_into(EdgeId from, EdgeId into) {
    Edge &target = edges_.at(into);
    target.observation_count += edges_.at(from).observation_count;
    edges_.erase(from);
}

void GraphStore::demote_edge(EdgeId id) {
    Edge &edge = edges_.at(id);
    unindex_edge(edge);
    if (edge.confidence != Confidence::External && !edge.demoted_from)
        edge.demoted_from = edge.confidence;
    edge.confidence = Confidence::External;
    edge.target = INVALID_ID;

    SymbolId source = edge.source;
    auto existing = edge_by_key_.find(edge_key(edge));
    if (existing != edge_by_key_.end()) {
        merge_into(id, existing->second);
    } else {
        index_edge(edge);
    }
    refresh_leaf(source);
    touch_file(owner_of(source));
}

void GraphStore::refresh_leaf(SymbolId id) {
    auto it = symbols_.find(id);
    if (it == symbols_.end())
        return;
    bool leaf = true;
    auto out = out_edges_.find(id);
    if (out != out_edges_.end()) {
        for (EdgeId eid : out->second) {
            const Edge &e = edges_.at(eid);
            if (e.internal() && e.confidence == Confidence::Resolved) {
                leaf = false;
                break;
            }
        }
    }
    it->second.leaf = leaf;
}

void GraphStore::touch_file(FileId id) {
    auto it = files_.find(id);
    if (it != files_.end())
        ++it->second.revision;
}

FileId GraphStore::ensure_file(const std::string &path, Language language,
                               const std::string &digest) {
    auto it = file_by_path_.find(path);
    FileId id;
    if (it == file_by_path_.end()) {
        id = next_file_id_++;
        SourceFile file;
        file.id = id;
        file.path = path;
        files_[id] = std::move(file);
        file_by_path_[path] = id;
    } else {
        id = it->second;
    }
    SourceFile &file = files_.at(id);
    file.language = language;
    file.digest = digest;
    file.tombstoned = false;
    return id;
}

void GraphStore::tombstone_symbol(SymbolId id, std::set<SymbolId> &touched) {
    Symbol &symbol = symbols_.at(id);
    if (symbol.tombstoned)
        return;

    auto out = out_edges_.find(id);
    if (out != out_edges_.end()) {
        std::set<EdgeId> outgoing = out->second;
        for (EdgeId eid : outgoing) {
            erase_edge(eid);
        }
    }

    // Callers elsewhere still call something: keep the edge, unbound
    auto in = in_edges_.find(id);
    if (in != in_edges_.end()) {
        std::set<EdgeId> incoming = in->second;
        for (EdgeId eid : incoming) {
            touched.insert(edges_.at(eid).source);
            demote_edge(eid);
        }
    }

    unindex_symbol(symbol);
    symbol.tombstoned = true;
    symbol.leaf = true;
}

// ============================================================================
// Writes
// ============================================================================

void GraphStore::validate(const FileDelta &delta) const {
    const SourceFile *file = file_locked(delta.path);
    uint64_t revision = file ? file->revision : 0;
    if (revision != delta.expected_revision) {
        throw StoreError(delta.path + " changed since it was read (revision " +
                         std::to_string(revision) + ", expected " +
                         std::to_string(delta.expected_revision) + ")");
    }
    FileId fid = file ? file->id : INVALID_ID;
    auto owned = [&](SymbolId id) { return fid != INVALID_ID && owner_of(id) == fid; };

    std::set<SymbolId> removed(delta.symbol_removals.begin(), delta.symbol_removals.end());
    std::set<SymbolId> final_symbols;
    if (fid != INVALID_ID) {
        auto it = file_symbols_.find(fid);
        if (it != file_symbols_.end()) {
            for (SymbolId sid : it->second) {
                if (symbol_active(sid) && !removed.count(sid))
                    final_symbols.insert(sid);
            }
        }
    }

    for (SymbolId id : delta.symbol_removals) {
        if (!owned(id) || !symbol_active(id))
            throw ConsistencyError(symbol_label(id) + " is not an active symbol of " + delta.path);
    }
    for (const auto &s : delta.symbol_updates) {
        if (!owned(s.id))
            throw ConsistencyError(symbol_label(s.id) + " does not belong to " + delta.path);
        if (removed.count(s.id))
            throw ConsistencyError(symbol_label(s.id) + " is both updated and removed");
        final_symbols.insert(s.id);
    }
    for (const auto &s : delta.symbol_inserts) {
        if (s.id == INVALID_ID || symbols_.count(s.id) || final_symbols.count(s.id))
            throw ConsistencyError(symbol_label(s.id) + " is already taken");
        final_symbols.insert(s.id);
    }

    auto check_target = [&](const Edge &e) {
        if (!e.internal())
            return;
        if (final_symbols.count(e.target))
            return;
        if (symbol_active(e.target) && owner_of(e.target) != fid)
            return;
        throw ConsistencyError(edge_label(e.id) + " from " + delta.path + " points at missing " +
                               symbol_label(e.target));
    };

    std::set<EdgeId> deleted(delta.edge_deletes.begin(), delta.edge_deletes.end());
    std::set<EdgeId> updated;
    for (EdgeId id : delta.edge_deletes) {
        auto it = edges_.find(id);
        if (it == edges_.end() || !owned(it->second.source))
            throw ConsistencyError(edge_label(id) + " does not belong to " + delta.path);
    }
    for (const auto &e : delta.edge_updates) {
        auto it = edges_.find(e.id);
        if (it == edges_.end() || !owned(it->second.source))
            throw ConsistencyError(edge_label(e.id) + " does not belong to " + delta.path);
        if (deleted.count(e.id))
            throw ConsistencyError(edge_label(e.id) + " is both updated and deleted");
        if (e.source != it->second.source)
            throw ConsistencyError(edge_label(e.id) + " cannot change its source");
        updated.insert(e.id);
    }

    // Final out-edge keys of the file must stay unique
    std::set<std::string> keys;
    auto claim = [&](const Edge &e) {
        if (!keys.insert(edge_key(e)).second)
            throw ConsistencyError("duplicate edge " + edge_key(e) + " in " + delta.path);
    };

    for (SymbolId sid : final_symbols) {
        auto out = out_edges_.find(sid);
        if (out == out_edges_.end())
            continue;
        for (EdgeId eid : out->second) {
            if (deleted.count(eid) || updated.count(eid))
                continue;
            const Edge &e = edges_.at(eid);
            if (e.internal() && removed.count(e.target))
                throw ConsistencyError(edge_label(eid) + " still points at removed " +
                                       symbol_label(e.target));
            claim(e);
        }
    }
    for (const auto &e : delta.edge_updates) {
        if (!final_symbols.count(e.source))
            throw ConsistencyError(edge_label(e.id) + " has no live source in " + delta.path);
        check_target(e);
        claim(e);
    }
    for (const auto &e : delta.edge_inserts) {
        if (!final_symbols.count(e.source))
            throw ConsistencyError("edge source " + symbol_label(e.source) + " is not in " +
                                   delta.path);
        check_target(e);
        claim(e);
    }
}

uint64_t GraphStore::apply(const FileDelta &delta) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    validate(delta);

    FileId fid = ensure_file(delta.path, delta.language, delta.digest);
    std::set<SymbolId> touched;

    for (EdgeId id : delta.edge_deletes) {
        touched.insert(edges_.at(id).source);
        erase_edge(id);
    }
    for (SymbolId id : delta.symbol_removals) {
        tombstone_symbol(id, touched);
    }
    for (const auto &update : delta.symbol_updates) {
        Symbol &current = symbols_.at(update.id);
        unindex_symbol(current);
        current.name = update.name;
        current.short_name = update.short_name;
        current.kind = update.kind;
        current.param_types = update.param_types;
        current.arity = update.arity;
        current.line = update.line;
        current.tombstoned = false;
        index_symbol(current);
        touched.insert(current.id);
    }
    for (const auto &insert : delta.symbol_inserts) {
        Symbol symbol = insert;
        symbol.file = fid;
        symbol.tombstoned = false;
        symbols_[symbol.id] = symbol;
        file_symbols_[fid].insert(symbol.id);
        index_symbol(symbol);
        touched.insert(symbol.id);
    }
    for (const auto &update : delta.edge_updates) {
        Edge &current = edges_.at(update.id);
        unindex_edge(current);
        current.target = update.target;
        current.target_name = update.target_name;
        current.target_key = update.target_key;
        current.kind = update.kind;
        current.confidence = update.confidence;
        current.demoted_from = update.demoted_from;
        current.observation_count = update.observation_count;
        current.arg_count = update.arg_count;
        current.line = update.line;
        index_edge(current);
        touched.insert(current.source);
    }
    for (const auto &insert : delta.edge_inserts) {
        touched.insert(insert.source);
        insert_edge(insert);
    }

    for (SymbolId id : touched) {
        refresh_leaf(id);
    }

    SourceFile &file = files_.at(fid);
    ++file.revision;
    file.synced_at = now_ms();
    return file.revision;
}

FileId GraphStore::upsert_file(const std::string &path, Language language,
                               const std::string &digest) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    FileId id = ensure_file(path, language, digest);
    SourceFile &file = files_.at(id);
    ++file.revision;
    file.synced_at = now_ms();
    return id;
}

std::vector<SymbolId> GraphStore::upsert_symbols(FileId file,
                                                 const std::vector<SymbolDraft> &symbols) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto file_it = files_.find(file);
    if (file_it == files_.end() || file_it->second.tombstoned)
        throw StoreError("cannot add symbols to unknown file " + std::to_string(file));

    std::unordered_map<std::string, SymbolId> by_identity;
    for (SymbolId sid : file_symbols_[file]) {
        const Symbol &s = symbols_.at(sid);
        by_identity[s.name + "/" + std::to_string(s.arity)] = sid;
    }

    std::vector<SymbolId> ids;
    ids.reserve(symbols.size());
    for (const auto &draft : symbols) {
        auto found = by_identity.find(draft.identity());
        SymbolId id;
        if (found != by_identity.end()) {
            id = found->second;
            unindex_symbol(symbols_.at(id));
        } else {
            id = next_symbol_id_++;
            by_identity[draft.identity()] = id;
            file_symbols_[file].insert(id);
        }
        Symbol &symbol = symbols_[id];
        symbol.id = id;
        symbol.file = file;
        symbol.name = draft.name;
        symbol.short_name = draft.short_name;
        symbol.kind = draft.kind;
        symbol.param_types = draft.param_types;
        symbol.arity = draft.arity;
        symbol.line = draft.line;
        symbol.tombstoned = false;
        index_symbol(symbol);
        refresh_leaf(id);
        ids.push_back(id);
    }
    touch_file(file);
    return ids;
}

std::vector<EdgeId> GraphStore::upsert_edges(const std::vector<Edge> &edges) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto &e : edges) {
        if (!symbol_active(e.source))
            throw ConsistencyError("edge source " + symbol_label(e.source) + " does not exist");
        if (e.internal() && !symbol_active(e.target))
            throw ConsistencyError("edge target " + symbol_label(e.target) + " does not exist");
    }

    std::vector<EdgeId> ids;
    ids.reserve(edges.size());
    std::set<FileId> files;
    for (const auto &e : edges) {
        auto existing = edge_by_key_.find(edge_key(e));
        if (existing != edge_by_key_.end()) {
            Edge &current = edges_.at(existing->second);
            unindex_edge(current);
            current.confidence = e.confidence;
            current.target_key = e.target_key;
            current.arg_count = e.arg_count;
            current.line = e.line;
            current.demoted_from.reset();
            ++current.observation_count;
            index_edge(current);
            ids.push_back(current.id);
        } else {
            ids.push_back(insert_edge(e));
        }
        refresh_leaf(e.source);
        files.insert(owner_of(e.source));
    }
    for (FileId id : files) {
        touch_file(id);
    }
    return ids;
}

std::vector<SymbolId> GraphStore::tombstone_file(FileId file) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto file_it = files_.find(file);
    if (file_it == files_.end())
        throw StoreError("cannot tombstone unknown file " + std::to_string(file));
    if (file_it->second.tombstoned)
        return {};

    std::vector<SymbolId> active;
    for (SymbolId sid : file_symbols_[file]) {
        if (symbol_active(sid))
            active.push_back(sid);
    }

    // Edges inside the file go first so they are not demoted below
    for (SymbolId sid : active) {
        auto out = out_edges_.find(sid);
        if (out == out_edges_.end())
            continue;
        std::set<EdgeId> outgoing = out->second;
        for (EdgeId eid : outgoing) {
            erase_edge(eid);
        }
    }

    std::set<SymbolId> touched;
    for (SymbolId sid : active) {
        tombstone_symbol(sid, touched);
    }
    for (SymbolId sid : touched) {
        refresh_leaf(sid);
    }

    file_it->second.tombstoned = true;
    ++file_it->second.revision;
    file_it->second.synced_at = now_ms();
    return active;
}

size_t GraphStore::rebind_edges(const std::vector<EdgeRebind> &rebinds) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto &r : rebinds) {
        if (!edges_.count(r.edge))
            throw ConsistencyError("cannot rebind missing " + edge_label(r.edge));
        if (!symbol_active(r.target))
            throw ConsistencyError("cannot rebind " + edge_label(r.edge) + " to missing " +
                                   symbol_label(r.target));
    }

    size_t changed = 0;
    for (const auto &r : rebinds) {
        auto it = edges_.find(r.edge);
        // Merged away or bound earlier in this batch
        if (it == edges_.end() || it->second.internal())
            continue;

        Edge &edge = it->second;
        unindex_edge(edge);
        edge.target = r.target;
        edge.confidence = r.confidence;
        edge.demoted_from.reset();

        SymbolId source = edge.source;
        auto existing = edge_by_key_.find(edge_key(edge));
        if (existing != edge_by_key_.end()) {
            merge_into(r.edge, existing->second);
        } else {
            index_edge(edge);
        }
        refresh_leaf(source);
        touch_file(owner_of(source));
        ++changed;
    }
    return changed;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Symbol> GraphStore::get_symbol(SymbolId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = symbols_.find(id);
    if (it == symbols_.end())
        return std::nullopt;
    return it->second;
}

std::optional<SourceFile> GraphStore::get_file(FileId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = files_.find(id);
    if (it == files_.end())
        return std::nullopt;
    return it->second;
}

std::optional<SourceFile> GraphStore::find_file(const std::string &path) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const SourceFile *file = file_locked(path);
    if (!file)
        return std::nullopt;
    return *file;
}

std::vector<Edge> GraphStore::edges_from(SymbolId id) const {
    auto view = read();
    std::vector<Edge> result;
    for (const Edge *e : view.edges_from(id)) {
        result.push_back(*e);
    }
    return result;
}

std::vector<Edge> GraphStore::edges_to(SymbolId id) const {
    auto view = read();
    std::vector<Edge> result;
    for (const Edge *e : view.edges_to(id)) {
        result.push_back(*e);
    }
    return result;
}

std::vector<Symbol> GraphStore::symbols_in(FileId id) const {
    auto view = read();
    std::vector<Symbol> result;
    for (const Symbol *s : view.symbols_of(id)) {
        result.push_back(*s);
    }
    return result;
}

std::vector<Symbol> GraphStore::lookup(const std::string &key, SymbolKind kind) const {
    auto view = read();
    std::vector<Symbol> result;
    for (const Symbol *s : view.lookup(key, kind)) {
        result.push_back(*s);
    }
    return result;
}

std::vector<Edge> GraphStore::unbound_edges_for(const std::string &key) const {
    auto view = read();
    std::vector<Edge> result;
    for (const Edge *e : view.unbound_edges(key)) {
        result.push_back(*e);
    }
    return result;
}

FileSnapshot GraphStore::snapshot_file(const std::string &path) const {
    auto view = read();
    FileSnapshot snapshot;
    const SourceFile *file = view.file_by_path(path);
    if (!file)
        return snapshot;

    snapshot.file = *file;
    snapshot.revision = file->revision;
    for (const Symbol *s : view.symbols_of(file->id, true)) {
        snapshot.symbols.push_back(*s);
        for (const Edge *e : view.edges_from(s->id)) {
            snapshot.edges.push_back(*e);
        }
    }
    return snapshot;
}

GraphStats GraphStore::stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    GraphStats stats;
    for (const auto &[id, file] : files_) {
        if (file.tombstoned)
            ++stats.tombstoned_files;
        else
            ++stats.files;
    }
    for (const auto &[id, symbol] : symbols_) {
        if (symbol.tombstoned)
            ++stats.tombstoned_symbols;
        else
            ++stats.symbols;
    }
    stats.edges = edges_.size();
    for (const auto &[id, edge] : edges_) {
        switch (edge.confidence) {
        case Confidence::Resolved:
            ++stats.resolved_edges;
            break;
        case Confidence::Conditional:
            ++stats.conditional_edges;
            break;
        case Confidence::Dynamic:
            ++stats.dynamic_edges;
            break;
        case Confidence::External:
            ++stats.external_edges;
            break;
        }
    }
    return stats;
}

// ============================================================================
// Persistence
// ============================================================================

json GraphStore::to_json() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    json j;

    j["metadata"]["version"] = STORE_SCHEMA_VERSION;
    j["metadata"]["num_files"] = files_.size();
    j["metadata"]["num_symbols"] = symbols_.size();
    j["metadata"]["num_edges"] = edges_.size();
    j["metadata"]["next_file_id"] = next_file_id_;
    j["metadata"]["next_symbol_id"] = next_symbol_id_.load();
    j["metadata"]["next_edge_id"] = next_edge_id_;

    json files = json::array();
    for (const auto &[id, f] : files_) {
        files.push_back({{"id", f.id},
                         {"path", f.path},
                         {"language", language_to_string(f.language)},
                         {"digest", f.digest},
                         {"synced_at", f.synced_at},
                         {"revision", f.revision},
                         {"tombstoned", f.tombstoned}});
    }
    j["files"] = std::move(files);

    json symbols = json::array();
    for (const auto &[id, s] : symbols_) {
        symbols.push_back({{"id", s.id},
                           {"file", s.file},
                           {"name", s.name},
                           {"short_name", s.short_name},
                           {"kind", symbol_kind_to_string(s.kind)},
                           {"param_types", s.param_types},
                           {"arity", s.arity},
                           {"line", s.line},
                           {"leaf", s.leaf},
                           {"tombstoned", s.tombstoned}});
    }
    j["symbols"] = std::move(symbols);

    json edges = json::array();
    for (const auto &[id, e] : edges_) {
        json entry = {{"id", e.id},
                      {"source", e.source},
                      {"target", e.target},
                      {"target_name", e.target_name},
                      {"target_key", e.target_key},
                      {"kind", relation_to_string(e.kind)},
                      {"confidence", confidence_to_string(e.confidence)},
                      {"observation_count", e.observation_count},
                      {"arg_count", e.arg_count},
                      {"line", e.line}};
        if (e.demoted_from)
            entry["demoted_from"] = confidence_to_string(*e.demoted_from);
        edges.push_back(std::move(entry));
    }
    j["edges"] = std::move(edges);

    return j;
}

namespace {

Confidence parse_confidence(const json &value) {
    auto c = confidence_from_string(value.get<std::string>());
    if (!c)
        throw StoreError("unknown confidence class " + value.dump());
    return *c;
}

} // namespace

void GraphStore::load_json(const json &j) {
    std::vector<SourceFile> files;
    std::vector<Symbol> symbols;
    std::vector<Edge> edges;
    FileId next_file = 1;
    SymbolId next_symbol = 1;
    EdgeId next_edge = 1;

    try {
        // Check schema version compatibility
        if (!j.is_object() || !j.contains("metadata") || !j["metadata"].contains("version"))
            throw StoreError("store has no schema version");
        const json &meta = j["metadata"];
        std::string file_version = meta["version"].get<std::string>();
        int major = 0, minor = 0, patch = 0;
        if (!parse_version(file_version, major, minor, patch) ||
            !is_schema_compatible(major, minor, patch)) {
            throw StoreError("store version " + file_version +
                             " is not compatible with this version of depmap (expects " +
                             STORE_SCHEMA_VERSION + "). Please re-sync.");
        }
        next_file = meta.value("next_file_id", FileId{1});
        next_symbol = meta.value("next_symbol_id", SymbolId{1});
        next_edge = meta.value("next_edge_id", EdgeId{1});

        for (const auto &f : j.at("files")) {
            SourceFile file;
            file.id = f.at("id").get<FileId>();
            file.path = f.at("path").get<std::string>();
            file.language = language_from_string(f.at("language").get<std::string>());
            file.digest = f.at("digest").get<std::string>();
            file.synced_at = f.value("synced_at", int64_t{0});
            file.revision = f.value("revision", uint64_t{0});
            file.tombstoned = f.value("tombstoned", false);
            files.push_back(std::move(file));
        }
        for (const auto &s : j.at("symbols")) {
            Symbol symbol;
            symbol.id = s.at("id").get<SymbolId>();
            symbol.file = s.at("file").get<FileId>();
            symbol.name = s.at("name").get<std::string>();
            symbol.short_name = s.at("short_name").get<std::string>();
            symbol.kind = s.at("kind").get<std::string>() == "module" ? SymbolKind::Module
                                                                      : SymbolKind::Function;
            symbol.param_types = s.value("param_types", std::vector<std::string>{});
            symbol.arity = s.value("arity", uint32_t{0});
            symbol.line = s.value("line", uint32_t{0});
            symbol.leaf = s.value("leaf", true);
            symbol.tombstoned = s.value("tombstoned", false);
            symbols.push_back(std::move(symbol));
        }
        for (const auto &e : j.at("edges")) {
            Edge edge;
            edge.id = e.at("id").get<EdgeId>();
            edge.source = e.at("source").get<SymbolId>();
            edge.target = e.at("target").get<SymbolId>();
            edge.target_name = e.at("target_name").get<std::string>();
            edge.target_key = e.at("target_key").get<std::string>();
            auto kind = relation_from_string(e.at("kind").get<std::string>());
            if (!kind)
                throw StoreError("unknown relation kind " + e.at("kind").dump());
            edge.kind = *kind;
            edge.confidence = parse_confidence(e.at("confidence"));
            if (e.contains("demoted_from"))
                edge.demoted_from = parse_confidence(e.at("demoted_from"));
            edge.observation_count = e.value("observation_count", uint32_t{1});
            edge.arg_count = e.value("arg_count", -1);
            edge.line = e.value("line", uint32_t{0});
            edges.push_back(std::move(edge));
        }
    } catch (const json::exception &ex) {
        throw StoreError(std::string("malformed store: ") + ex.what());
    }

    // Referential checks before anything is replaced
    std::set<FileId> file_ids;
    std::set<SymbolId> symbol_ids;
    for (const auto &file : files) {
        file_ids.insert(file.id);
    }
    for (const auto &symbol : symbols) {
        if (!file_ids.count(symbol.file))
            throw StoreError(symbol_label(symbol.id) + " belongs to an unknown file");
        symbol_ids.insert(symbol.id);
    }
    for (const auto &edge : edges) {
        if (!symbol_ids.count(edge.source) || (edge.internal() && !symbol_ids.count(edge.target)))
            throw StoreError(edge_label(edge.id) + " names an unknown symbol");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    files_.clear();
    file_by_path_.clear();
    symbols_.clear();
    file_symbols_.clear();
    edges_.clear();
    out_edges_.clear();
    in_edges_.clear();
    edge_by_key_.clear();
    unbound_by_key_.clear();
    name_index_.clear();

    for (auto &file : files) {
        next_file = std::max(next_file, file.id + 1);
        file_by_path_[file.path] = file.id;
        files_[file.id] = std::move(file);
    }
    for (auto &symbol : symbols) {
        next_symbol = std::max(next_symbol, symbol.id + 1);
        file_symbols_[symbol.file].insert(symbol.id);
        index_symbol(symbol);
        symbols_[symbol.id] = std::move(symbol);
    }
    for (auto &edge : edges) {
        next_edge = std::max(next_edge, edge.id + 1);
        EdgeId id = edge.id;
        index_edge(edges_.emplace(id, std::move(edge)).first->second);
    }

    next_file_id_ = next_file;
    next_edge_id_ = next_edge;
    next_symbol_id_ = next_symbol;
}

} // namespace depmap
