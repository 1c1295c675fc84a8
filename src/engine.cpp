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
#include "depmap/version.hpp"
#include "depmap/walker.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace depmap {

namespace fs = std::filesystem;

Engine::Engine(EngineConfig config, std::shared_ptr<Logger> logger, ScannerRegistry scanners,
               std::unique_ptr<GraphStore> store)
    : config_(std::move(config)), logger_(ensure_logger(std::move(logger))),
      scanners_(std::move(scanners)), store_(std::move(store)) {
    if (!store_) {
        store_ = std::make_unique<GraphStore>();
    }
}

// ============================================================================
// Sync
// ============================================================================

SyncReport Engine::sync(const std::vector<SourceInput> &inputs, const SyncOptions &options) {
    std::lock_guard<std::mutex> lock(sync_mutex_);

    BuilderConfig builder_config;
    builder_config.num_threads = config_.num_threads;
    GraphBuilder builder(*store_, checksums_, scanners_, logger_, builder_config);
    return builder.sync(inputs, options);
}

SyncReport Engine::sync_directory(const std::string &root, const SyncOptions &options) {
    WalkOptions walk;
    walk.root = root;
    walk.ignore_patterns = config_.ignore_patterns;

    DirectoryWalker walker(scanners_, walk);
    auto inputs = walker.walk();
    logger_->debug("walk finished", {{"root", root}, {"files", std::to_string(inputs.size())}});
    return sync(inputs, options);
}

// ============================================================================
// Queries
// ============================================================================

CycleOptions Engine::cycle_options() const {
    CycleOptions options;
    options.include_self_loops = config_.include_self_loops;
    options.step_factor = config_.cycle_step_factor;
    return options;
}

std::vector<Cycle> Engine::find_cycles() const {
    CycleEnumerator enumerator(*store_, cycle_options());
    auto result = enumerator.all();
    if (enumerator.truncated()) {
        logger_->warn("cycle search stopped at its step budget",
                      {{"found", std::to_string(result.size())},
                       {"components", std::to_string(enumerator.component_count())}});
    }
    return result;
}

CycleEnumerator Engine::cycles() const { return CycleEnumerator(*store_, cycle_options()); }

ImpactResult Engine::impact_of(SymbolId target, std::optional<size_t> max_depth) const {
    ImpactOptions options;
    options.max_depth = max_depth.value_or(config_.default_impact_depth);
    options.max_results = config_.max_impact_results;
    options.max_fanout = config_.max_impact_fanout;

    ImpactAnalyzer analyzer(*store_);
    auto result = analyzer.impact_of(target, options);
    if (result.truncated) {
        logger_->warn("impact result truncated", {{"symbol", std::to_string(target)},
                                                  {"entries",
                                                   std::to_string(result.entries.size())}});
    }
    return result;
}

std::vector<Symbol> Engine::symbols_in(FileId file) const { return store_->symbols_in(file); }

std::vector<Symbol> Engine::symbols_in(const std::string &path) const {
    auto file = store_->find_file(path);
    if (!file || file->tombstoned)
        return {};
    return store_->symbols_in(file->id);
}

namespace {

std::string path_of(const ReadView &view, FileId id) {
    const SourceFile *file = view.file(id);
    return file ? file->path : std::string();
}

} // namespace

std::vector<SymbolView> Engine::find_symbols(const std::string &pattern) const {
    std::vector<SymbolView> matches;
    auto view = store_->read();
    for (const Symbol *symbol : view.symbols()) {
        if (symbol->name.find(pattern) != std::string::npos) {
            matches.push_back({*symbol, path_of(view, symbol->file)});
        }
    }
    return matches;
}

std::vector<SymbolView> Engine::symbols_named(const std::string &name) const {
    std::vector<SymbolView> exact;
    std::vector<SymbolView> by_key;
    auto view = store_->read();
    for (const Symbol *symbol : view.symbols()) {
        if (symbol->name == name) {
            exact.push_back({*symbol, path_of(view, symbol->file)});
        } else if (symbol->short_name == name) {
            by_key.push_back({*symbol, path_of(view, symbol->file)});
        }
    }
    return exact.empty() ? by_key : exact;
}

std::vector<SymbolView> Engine::find_orphans() const {
    std::vector<SymbolView> orphans;
    auto view = store_->read();
    for (const Symbol *symbol : view.symbols()) {
        if (symbol->kind != SymbolKind::Function)
            continue;

        // Recursion alone does not make a symbol used
        auto incoming = view.edges_to(symbol->id);
        bool used = std::any_of(incoming.begin(), incoming.end(),
                                [&](const Edge *e) { return e->source != symbol->id; });
        if (!used) {
            orphans.push_back({*symbol, path_of(view, symbol->file)});
        }
    }

    std::sort(orphans.begin(), orphans.end(), [](const SymbolView &a, const SymbolView &b) {
        if (a.file != b.file)
            return a.file < b.file;
        if (a.symbol.line != b.symbol.line)
            return a.symbol.line < b.symbol.line;
        return a.symbol.id < b.symbol.id;
    });
    return orphans;
}

std::vector<EdgeView> Engine::uncertain_edges() const {
    std::vector<EdgeView> result;
    auto view = store_->read();
    for (const Edge *edge : view.edges()) {
        if (edge->confidence != Confidence::Dynamic)
            continue;
        const Symbol *source = view.symbol(edge->source);
        if (!source || source->tombstoned)
            continue;

        EdgeView entry;
        entry.edge = *edge;
        entry.source_name = source->name;
        entry.source_file = path_of(view, source->file);
        const Symbol *target = edge->internal() ? view.symbol(edge->target) : nullptr;
        entry.target_name = target ? target->name : edge->target_name;
        result.push_back(std::move(entry));
    }
    return result;
}

// ============================================================================
// Persistence
// ============================================================================

void Engine::save(const std::string &path) const {
    std::lock_guard<std::mutex> lock(sync_mutex_);

    json doc;
    doc["metadata"] = {{"version", STORE_SCHEMA_VERSION}, {"tool_version", VERSION_STRING}};
    doc["graph"] = store_->to_json();
    doc["checksums"] = checksums_.to_json();

    std::string temp_path = path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw StoreError("failed to open file for writing: " + temp_path);
        }
        file << doc.dump();
        file.flush();
        if (!file) {
            throw StoreError("failed to write " + temp_path);
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        throw StoreError("failed to replace " + path);
    }
    logger_->debug("store saved", {{"path", path}});
}

void Engine::load(const std::string &path) {
    std::lock_guard<std::mutex> lock(sync_mutex_);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw StoreError("failed to open file for reading: " + path);
    }

    try {
        json doc = json::parse(file);
        if (!doc.is_object() || !doc.contains("metadata") || !doc.contains("graph") ||
            !doc.contains("checksums")) {
            throw StoreError(path + " is not a depmap store");
        }

        // Check schema version compatibility
        std::string version = doc.at("metadata").value("version", "");
        int major = 0, minor = 0, patch = 0;
        if (!parse_version(version, major, minor, patch) ||
            !is_schema_compatible(major, minor, patch)) {
            throw StoreError(path + " has schema version '" + version + "', expected " +
                             STORE_SCHEMA_VERSION + "; run a fresh sync");
        }

        ChecksumIndex checksums = ChecksumIndex::from_json(doc.at("checksums"));
        store_->load_json(doc.at("graph"));
        checksums_ = std::move(checksums);
    } catch (const json::exception &e) {
        throw StoreError(path + ": " + e.what());
    }

    logger_->info("store loaded", {{"path", path},
                                   {"files", std::to_string(checksums_.size())}});
}

} // namespace depmap
