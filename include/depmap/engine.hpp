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

#include "builder.hpp"
#include "checksum.hpp"
#include "config.hpp"
#include "cycles.hpp"
#include "graph.hpp"
#include "impact.hpp"
#include "logging.hpp"
#include "scanner.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace depmap {

// An edge together with the names of both ends, for reports
struct EdgeView {
    Edge edge;
    std::string source_name;
    std::string source_file;
    std::string target_name;
};

// A symbol together with the path of its file
struct SymbolView {
    Symbol symbol;
    std::string file;
};

// Owns a graph store, its checksum index and the scanners, and exposes the
// query surface: sync, cycles, impact, per-file symbols, structural
// problems. Syncs are serialized; queries may run alongside them and see
// the graph between file commits.
class Engine {
public:
    explicit Engine(EngineConfig config = {}, std::shared_ptr<Logger> logger = nullptr,
                    ScannerRegistry scanners = ScannerRegistry::with_default_scanners(),
                    std::unique_ptr<GraphStore> store = nullptr);

    // ========================================================================
    // Sync
    // ========================================================================

    // The file set is the whole tree: known paths absent from it are removed
    SyncReport sync(const std::vector<SourceInput> &inputs, const SyncOptions &options = {});

    // Walks root with the configured ignore patterns, then syncs
    SyncReport sync_directory(const std::string &root, const SyncOptions &options = {});

    // ========================================================================
    // Queries
    // ========================================================================

    std::vector<Cycle> find_cycles() const;

    // Lazy form of find_cycles()
    CycleEnumerator cycles() const;

    // Depth defaults to the configured default_impact_depth
    ImpactResult impact_of(SymbolId target, std::optional<size_t> max_depth = std::nullopt) const;

    std::vector<Symbol> symbols_in(FileId file) const;
    std::vector<Symbol> symbols_in(const std::string &path) const;

    // Active symbols whose qualified name contains pattern
    std::vector<SymbolView> find_symbols(const std::string &pattern) const;

    // Active symbols whose qualified name, or else resolution key, is name
    std::vector<SymbolView> symbols_named(const std::string &name) const;

    // Active callables nothing else calls, imports or composes
    std::vector<SymbolView> find_orphans() const;

    // Edges whose target could not be determined statically
    std::vector<EdgeView> uncertain_edges() const;

    GraphStats stats() const { return store_->stats(); }

    // ========================================================================
    // Persistence
    // ========================================================================

    // Store and checksum index in one JSON document, written to a temporary
    // file first and renamed into place. Throws StoreError.
    void save(const std::string &path) const;

    // Throws StoreError when the file is missing, malformed or written by an
    // incompatible schema version; the engine is unchanged in that case.
    void load(const std::string &path);

    // ========================================================================
    // Accessors
    // ========================================================================

    GraphStore &store() { return *store_; }
    const GraphStore &store() const { return *store_; }
    const ChecksumIndex &checksums() const { return checksums_; }
    const ScannerRegistry &scanners() const { return scanners_; }
    const EngineConfig &config() const { return config_; }
    Logger &logger() const { return *logger_; }

private:
    EngineConfig config_;
    std::shared_ptr<Logger> logger_;
    ScannerRegistry scanners_;
    std::unique_ptr<GraphStore> store_;
    ChecksumIndex checksums_;
    mutable std::mutex sync_mutex_;

    CycleOptions cycle_options() const;
};

} // namespace depmap
