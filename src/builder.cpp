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

#include "depmap/builder.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <set>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace depmap {

namespace {

std::string identity_of(const Symbol &symbol) {
    return symbol.name + "/" + std::to_string(symbol.arity);
}

json symbol_refs_to_json(const std::vector<SymbolRef> &refs) {
    json result = json::array();
    for (const auto &ref : refs) {
        result.push_back({{"id", ref.id}, {"name", ref.name}, {"file", ref.file}});
    }
    return result;
}

bool is_cancelled(const SyncOptions &options) {
    return options.cancel && options.cancel->cancelled();
}

} // namespace

const char *sync_state_to_string(SyncState state) {
    switch (state) {
    case SyncState::Idle:
        return "idle";
    case SyncState::Scanning:
        return "scanning";
    case SyncState::Diffing:
        return "diffing";
    case SyncState::Committing:
        return "committing";
    }
    return "idle";
}

json SyncReport::to_json() const {
    json j;
    j["files"] = {{"added", files_added},
                  {"modified", files_modified},
                  {"removed", files_removed},
                  {"unchanged", files_unchanged},
                  {"failed", files_failed}};

    json errs = json::array();
    for (const auto &e : errors) {
        errs.push_back(
            {{"kind", file_error_kind_to_string(e.kind)}, {"path", e.path}, {"message", e.message}});
    }
    j["errors"] = std::move(errs);

    j["symbols"] = {{"created", symbol_refs_to_json(created_symbols)},
                    {"tombstoned", symbol_refs_to_json(tombstoned_symbols)},
                    {"updated", symbol_refs_to_json(updated_symbols)}};
    j["edges"] = {{"inserted", edges_inserted},
                  {"updated", edges_updated},
                  {"reconfirmed", edges_reconfirmed},
                  {"deleted", edges_deleted},
                  {"relinked", edges_relinked}};
    j["cancelled"] = cancelled;
    j["duration_ms"] = duration_ms;
    return j;
}

GraphBuilder::GraphBuilder(GraphStore &store, ChecksumIndex &checksums,
                           const ScannerRegistry &scanners, std::shared_ptr<Logger> logger,
                           BuilderConfig config)
    : store_(store), checksums_(checksums), scanners_(scanners),
      logger_(ensure_logger(std::move(logger))), config_(config) {
    // Auto-detect thread count if not specified
    if (config_.num_threads == 0) {
        config_.num_threads = std::thread::hardware_concurrency();
        if (config_.num_threads == 0)
            config_.num_threads = 4; // Fallback
    }
}

void GraphBuilder::set_state(SyncState state) {
    SyncState previous = state_.exchange(state);
    if (previous != state) {
        logger_->debug("sync state",
                       {{"from", sync_state_to_string(previous)}, {"to", sync_state_to_string(state)}});
    }
}

void GraphBuilder::report_error(SyncReport &report, FileErrorKind kind, const std::string &path,
                                const std::string &message) {
    logger_->warn(file_error_kind_to_string(kind), {{"path", path}, {"reason", message}});
    report.errors.push_back(FileError{kind, path, message});
    ++report.files_failed;
}

// ============================================================================
// Scanning
// ============================================================================

void GraphBuilder::worker_scan_files(std::vector<PendingFile> &files, size_t start_idx,
                                     size_t end_idx, const SyncOptions &options,
                                     std::atomic<size_t> &done) {
    for (size_t i = start_idx; i < end_idx; ++i) {
        if (is_cancelled(options))
            return;

        PendingFile &file = files[i];
        const SourceScanner *scanner = scanners_.scanner_for(file.input->path);
        if (!scanner) {
            ScanResult failed;
            failed.error = "no scanner for " + file.input->path;
            file.result = std::move(failed);
        } else {
            file.result = scanner->scan(file.input->path, *file.input->content);
        }

        size_t current = ++done;
        logger_->debug("scanned", {{"path", file.input->path},
                                   {"symbols", std::to_string(file.result->symbols.size())},
                                   {"edges", std::to_string(file.result->edges.size())}});
        if (options.progress_callback) {
            options.progress_callback(file.input->path, current, files.size());
        }
    }
}

void GraphBuilder::scan_all(std::vector<PendingFile> &files, const SyncOptions &options) {
    if (files.empty())
        return;

    // Each worker owns a contiguous slice; results land in place
    std::vector<std::thread> threads;
    std::atomic<size_t> done{0};
    unsigned int num_threads =
        static_cast<unsigned int>(std::min<size_t>(config_.num_threads, files.size()));
    size_t files_per_thread = (files.size() + num_threads - 1) / num_threads;

    for (unsigned int t = 0; t < num_threads; ++t) {
        size_t start_idx = t * files_per_thread;
        size_t end_idx = std::min(start_idx + files_per_thread, files.size());

        if (start_idx >= files.size())
            break;

        threads.emplace_back(&GraphBuilder::worker_scan_files, this, std::ref(files), start_idx,
                             end_idx, std::cref(options), std::ref(done));
    }

    // Wait for all threads
    for (auto &t : threads) {
        t.join();
    }
}

// ============================================================================
// Diffing
// ============================================================================

GraphBuilder::DiffOutcome GraphBuilder::diff(const PendingFile &file) {
    DiffOutcome out;
    FileDelta &delta = out.delta;
    const SourceInput &input = *file.input;
    const ScanResult &scan = *file.result;

    delta.path = input.path;
    delta.language = file.language;
    delta.digest = input.digest;

    auto view = store_.read();
    const SourceFile *stored = view.file_by_path(input.path);
    delta.expected_revision = stored ? stored->revision : 0;
    FileId fid = stored ? stored->id : INVALID_ID;

    std::vector<const Symbol *> old_symbols;
    if (stored)
        old_symbols = view.symbols_of(fid, true);
    std::unordered_map<std::string, const Symbol *> old_by_identity;
    for (const Symbol *s : old_symbols) {
        old_by_identity[identity_of(*s)] = s;
    }

    // Symbols: same (name, arity) keeps its id, anything else is delete+add
    std::vector<SymbolId> ids(scan.symbols.size(), INVALID_ID);
    std::unordered_set<SymbolId> kept;
    std::map<std::pair<SymbolKind, std::string>, std::vector<size_t>> local_by_key;

    for (size_t i = 0; i < scan.symbols.size(); ++i) {
        const SymbolDraft &draft = scan.symbols[i];
        local_by_key[{draft.kind, draft.short_name}].push_back(i);

        auto found = old_by_identity.find(draft.identity());
        if (found != old_by_identity.end()) {
            const Symbol &old = *found->second;
            ids[i] = old.id;
            kept.insert(old.id);

            bool signature_changed = old.kind != draft.kind || old.param_types != draft.param_types ||
                                     old.short_name != draft.short_name;
            if (!old.tombstoned && !signature_changed && old.line == draft.line)
                continue;

            Symbol updated = old;
            updated.short_name = draft.short_name;
            updated.kind = draft.kind;
            updated.param_types = draft.param_types;
            updated.line = draft.line;
            updated.tombstoned = false;
            delta.symbol_updates.push_back(updated);

            if (old.tombstoned) {
                out.created.push_back({old.id, old.name, input.path});
                out.created_ids.push_back(old.id);
            } else if (signature_changed) {
                out.updated.push_back({old.id, old.name, input.path});
            }
            continue;
        }

        Symbol symbol;
        symbol.id = store_.allocate_symbol_id();
        symbol.file = fid;
        symbol.name = draft.name;
        symbol.short_name = draft.short_name;
        symbol.kind = draft.kind;
        symbol.param_types = draft.param_types;
        symbol.arity = draft.arity;
        symbol.line = draft.line;
        ids[i] = symbol.id;
        out.created.push_back({symbol.id, symbol.name, input.path});
        out.created_ids.push_back(symbol.id);
        delta.symbol_inserts.push_back(std::move(symbol));
    }

    for (const Symbol *old : old_symbols) {
        if (!old->tombstoned && !kept.count(old->id)) {
            delta.symbol_removals.push_back(old->id);
            out.removed.push_back({old->id, old->name, input.path});
        }
    }

    // Edges: resolve each draft, then collapse drafts with the same key
    std::map<std::string, Edge> fresh;
    for (const EdgeDraft &draft : scan.edges) {
        if (draft.source >= ids.size()) {
            throw ConsistencyError("scanner produced an edge from unknown symbol index " +
                                   std::to_string(draft.source) + " in " + input.path);
        }

        SymbolKind kind = target_kind_for(draft.kind);
        std::vector<Candidate> candidates;
        for (const Symbol *s : view.lookup(draft.target_key, kind)) {
            if (s->file != fid)
                candidates.push_back({s->id, s->file, s->arity, false});
        }
        auto local = local_by_key.find({kind, draft.target_key});
        if (local != local_by_key.end()) {
            for (size_t idx : local->second) {
                candidates.push_back({ids[idx], fid, scan.symbols[idx].arity, true});
            }
        }

        Annotation annotation = annotator_.annotate(draft, candidates);
        if (!annotation.keep)
            continue;

        Edge edge;
        edge.source = ids[draft.source];
        edge.target = annotation.target;
        edge.target_name = draft.target_name;
        edge.target_key = draft.target_key;
        edge.kind = draft.kind;
        edge.confidence = annotation.confidence;
        edge.arg_count = draft.arg_count;
        edge.line = draft.line;

        auto [it, inserted] = fresh.emplace(GraphStore::edge_key(edge), edge);
        if (!inserted) {
            it->second.confidence = most_certain(it->second.confidence, edge.confidence);
            it->second.line = std::min(it->second.line, edge.line);
        }
    }

    std::unordered_map<std::string, const Edge *> old_edges;
    for (const Symbol *s : old_symbols) {
        for (const Edge *e : view.edges_from(s->id)) {
            old_edges[GraphStore::edge_key(*e)] = e;
        }
    }

    for (auto &[key, edge] : fresh) {
        auto found = old_edges.find(key);
        if (found == old_edges.end()) {
            delta.edge_inserts.push_back(edge);
            continue;
        }

        const Edge &old = *found->second;
        bool changed = old.confidence != edge.confidence || old.target_key != edge.target_key ||
                       old.arg_count != edge.arg_count || old.demoted_from.has_value();
        Edge updated = old;
        updated.confidence = edge.confidence;
        updated.target_key = edge.target_key;
        updated.arg_count = edge.arg_count;
        updated.line = edge.line;
        updated.demoted_from.reset();
        updated.observation_count = old.observation_count + 1;
        delta.edge_updates.push_back(std::move(updated));
        if (changed)
            ++out.edges_updated;
        else
            ++out.edges_reconfirmed;
        old_edges.erase(found);
    }

    for (const auto &[key, old] : old_edges) {
        delta.edge_deletes.push_back(old->id);
    }
    std::sort(delta.edge_deletes.begin(), delta.edge_deletes.end());

    return out;
}

// ============================================================================
// Committing
// ============================================================================

bool GraphBuilder::commit_file(const PendingFile &file, SyncReport &report,
                               std::vector<SymbolId> &created_ids) {
    const std::string &path = file.input->path;

    for (int attempt = 0; attempt < 2; ++attempt) {
        set_state(SyncState::Diffing);
        DiffOutcome outcome = diff(file);

        set_state(SyncState::Committing);
        try {
            store_.apply(outcome.delta);
        } catch (const StoreError &e) {
            if (attempt == 0) {
                logger_->warn("commit failed, retrying", {{"path", path}, {"reason", e.what()}});
                continue;
            }
            checksums_.revert(path);
            report_error(report, FileErrorKind::Commit, path, e.what());
            return false;
        }

        if (file.change == ChangeKind::Added)
            ++report.files_added;
        else
            ++report.files_modified;

        report.created_symbols.insert(report.created_symbols.end(), outcome.created.begin(),
                                      outcome.created.end());
        report.updated_symbols.insert(report.updated_symbols.end(), outcome.updated.begin(),
                                      outcome.updated.end());
        report.tombstoned_symbols.insert(report.tombstoned_symbols.end(), outcome.removed.begin(),
                                         outcome.removed.end());
        report.edges_inserted += outcome.delta.edge_inserts.size();
        report.edges_deleted += outcome.delta.edge_deletes.size();
        report.edges_updated += outcome.edges_updated;
        report.edges_reconfirmed += outcome.edges_reconfirmed;
        created_ids.insert(created_ids.end(), outcome.created_ids.begin(),
                           outcome.created_ids.end());

        logger_->debug("committed",
                       {{"path", path},
                        {"symbols_created", std::to_string(outcome.created.size())},
                        {"symbols_removed", std::to_string(outcome.removed.size())},
                        {"edges_inserted", std::to_string(outcome.delta.edge_inserts.size())},
                        {"edges_deleted", std::to_string(outcome.delta.edge_deletes.size())}});
        return true;
    }
    return false;
}

bool GraphBuilder::remove_file(const std::string &path, SyncReport &report) {
    set_state(SyncState::Committing);

    for (int attempt = 0; attempt < 2; ++attempt) {
        FileSnapshot snapshot = store_.snapshot_file(path);
        if (!snapshot.file || snapshot.file->tombstoned) {
            checksums_.confirm_removed(path);
            ++report.files_removed;
            return true;
        }

        std::vector<SymbolId> removed;
        try {
            removed = store_.tombstone_file(snapshot.file->id);
        } catch (const StoreError &e) {
            if (attempt == 0) {
                logger_->warn("tombstone failed, retrying", {{"path", path}, {"reason", e.what()}});
                continue;
            }
            report_error(report, FileErrorKind::Commit, path, e.what());
            return false;
        }

        std::unordered_map<SymbolId, std::string> names;
        for (const auto &s : snapshot.symbols) {
            names[s.id] = s.name;
        }
        for (SymbolId id : removed) {
            report.tombstoned_symbols.push_back({id, names[id], path});
        }
        checksums_.confirm_removed(path);
        ++report.files_removed;
        logger_->debug("tombstoned", {{"path", path}, {"symbols", std::to_string(removed.size())}});
        return true;
    }
    return false;
}

// ============================================================================
// Relinking
// ============================================================================

void GraphBuilder::relink(const std::vector<SymbolId> &created_ids, SyncReport &report) {
    if (created_ids.empty())
        return;

    std::vector<EdgeRebind> rebinds;
    {
        auto view = store_.read();
        std::set<EdgeId> seen;
        for (SymbolId id : created_ids) {
            const Symbol *symbol = view.symbol(id);
            if (!symbol || symbol->tombstoned)
                continue;

            auto matches = view.lookup(symbol->short_name, symbol->kind);
            for (const Edge *edge : view.unbound_edges(symbol->short_name)) {
                if (target_kind_for(edge->kind) != symbol->kind || !seen.insert(edge->id).second)
                    continue;

                const Symbol *source = view.symbol(edge->source);
                FileId source_file = source ? source->file : INVALID_ID;
                std::vector<Candidate> candidates;
                for (const Symbol *m : matches) {
                    candidates.push_back({m->id, m->file, m->arity, m->file == source_file});
                }

                Annotation annotation =
                    annotator_.annotate(hint_for(*edge), false, edge->arg_count, candidates);
                if (annotation.target != INVALID_ID) {
                    rebinds.push_back({edge->id, annotation.target, annotation.confidence});
                }
            }
        }
    }

    if (!rebinds.empty()) {
        report.edges_relinked += store_.rebind_edges(rebinds);
    }
}

// ============================================================================
// Sync run
// ============================================================================

SyncReport GraphBuilder::sync(const std::vector<SourceInput> &inputs, const SyncOptions &options) {
    auto start = std::chrono::steady_clock::now();
    SyncReport report;

    set_state(SyncState::Scanning);
    logger_->info("sync started", {{"files", std::to_string(inputs.size())},
                                   {"threads", std::to_string(config_.num_threads)}});

    // Change detection
    checksums_.begin_walk();
    std::vector<PendingFile> pending;
    std::set<std::string> seen_paths;
    for (const auto &input : inputs) {
        if (!seen_paths.insert(input.path).second)
            continue;

        if (!input.content) {
            checksums_.record_unreadable(input.path);
            report_error(report, FileErrorKind::Scan, input.path,
                         input.read_error.empty() ? "unreadable" : input.read_error);
            continue;
        }

        ChangeKind change = checksums_.record(input.path, input.digest);
        if (change == ChangeKind::Unchanged) {
            ++report.files_unchanged;
            continue;
        }

        PendingFile file;
        file.input = &input;
        file.change = change;
        file.language = scanners_.language_for(input.path);
        pending.push_back(std::move(file));
    }
    std::vector<std::string> removed = checksums_.finish_walk();

    std::sort(pending.begin(), pending.end(), [](const PendingFile &a, const PendingFile &b) {
        return a.input->path < b.input->path;
    });

    scan_all(pending, options);

    std::vector<SymbolId> created_ids;
    size_t next = 0;
    try {
        for (const auto &path : removed) {
            if (is_cancelled(options)) {
                report.cancelled = true;
                break;
            }
            remove_file(path, report);
        }

        for (; next < pending.size() && !report.cancelled; ++next) {
            const PendingFile &file = pending[next];
            if (is_cancelled(options) || !file.result) {
                report.cancelled = true;
                break;
            }

            if (!file.result->ok()) {
                // Stale but present beats silently empty
                checksums_.revert(file.input->path);
                report_error(report, FileErrorKind::Scan, file.input->path, *file.result->error);
                continue;
            }

            commit_file(file, report, created_ids);
        }
    } catch (const ConsistencyError &e) {
        for (size_t i = next; i < pending.size(); ++i) {
            checksums_.revert(pending[i].input->path);
        }
        set_state(SyncState::Idle);
        logger_->error("sync aborted", {{"reason", e.what()}});
        throw;
    }

    // Whatever cancellation left behind is retried next run
    for (size_t i = next; i < pending.size(); ++i) {
        checksums_.revert(pending[i].input->path);
    }

    relink(created_ids, report);

    set_state(SyncState::Idle);
    report.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - start)
                             .count();

    logger_->info("sync finished", {{"added", std::to_string(report.files_added)},
                                    {"modified", std::to_string(report.files_modified)},
                                    {"removed", std::to_string(report.files_removed)},
                                    {"failed", std::to_string(report.files_failed)},
                                    {"relinked", std::to_string(report.edges_relinked)},
                                    {"cancelled", report.cancelled ? "true" : "false"}});
    return report;
}

} // namespace depmap
