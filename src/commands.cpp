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

#include "depmap/commands.hpp"
#include "depmap/errors.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <mutex>

namespace depmap {

namespace fs = std::filesystem;

namespace {

json symbol_view_to_json(const SymbolView &view) {
    return {{"id", view.symbol.id},
            {"name", view.symbol.name},
            {"kind", symbol_kind_to_string(view.symbol.kind)},
            {"signature", view.symbol.signature()},
            {"file", view.file},
            {"line", view.symbol.line}};
}

void print_symbol_view(const SymbolView &view) {
    std::cout << "  " << view.symbol.name << view.symbol.signature() << "  " << view.file << ":"
              << view.symbol.line << std::endl;
}

std::string file_of(const Engine &engine, FileId id) {
    auto file = engine.store().get_file(id);
    return file ? file->path : std::string();
}

// Cycle as "a -> b -> c -> a"
std::string format_cycle(const Engine &engine, const Cycle &cycle) {
    std::string text;
    for (SymbolId id : cycle.symbols) {
        auto symbol = engine.store().get_symbol(id);
        text += (symbol ? symbol->name : std::to_string(id)) + " -> ";
    }
    auto first = engine.store().get_symbol(cycle.symbols.front());
    text += first ? first->name : std::to_string(cycle.symbols.front());
    return text;
}

void print_sync_report(const SyncReport &report) {
    std::cout << "Files: " << report.files_added << " added, " << report.files_modified
              << " modified, " << report.files_removed << " removed, " << report.files_unchanged
              << " unchanged, " << report.files_failed << " failed" << std::endl;
    std::cout << "Symbols: " << report.created_symbols.size() << " created, "
              << report.tombstoned_symbols.size() << " tombstoned, "
              << report.updated_symbols.size() << " updated" << std::endl;
    std::cout << "Edges: " << report.edges_inserted << " inserted, " << report.edges_updated
              << " updated, " << report.edges_deleted << " deleted, " << report.edges_relinked
              << " relinked" << std::endl;

    for (const auto &error : report.errors) {
        std::cout << "Warning: " << file_error_kind_to_string(error.kind) << " " << error.path
                  << ": " << error.message << std::endl;
    }
    if (report.cancelled)
        std::cout << "Sync cancelled; remaining files will be retried" << std::endl;
    std::cout << "Completed in " << report.duration_ms << " ms" << std::endl;
}

} // namespace

std::unique_ptr<Engine> open_engine(const CliContext &ctx, bool allow_missing) {
    auto logger = make_stream_logger(std::cerr, ctx.config.log_level);
    auto engine = std::make_unique<Engine>(ctx.config, logger);

    std::error_code ec;
    if (!fs::exists(ctx.config.store_path, ec)) {
        if (allow_missing)
            return engine;
        std::cerr << "Error: no store at " << ctx.config.store_path << ". Run 'depmap --sync' first."
                  << std::endl;
        return nullptr;
    }

    try {
        engine->load(ctx.config.store_path);
    } catch (const StoreError &e) {
        std::cerr << "Error loading store: " << e.what() << std::endl;
        return nullptr;
    }
    return engine;
}

int cmd_sync(const CliContext &ctx, const std::string &root) {
    auto engine = open_engine(ctx, true);
    if (!engine)
        return STATUS_ERROR;

    if (!ctx.json_output)
        std::cout << "Syncing " << root << "..." << std::endl;

    SyncOptions options;
    std::mutex progress_mutex;
    if (!ctx.json_output) {
        options.progress_callback = [&progress_mutex](const std::string &, size_t current,
                                                      size_t total) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            std::cerr << "\rScanned " << current << "/" << total << " files" << std::flush;
            if (current == total)
                std::cerr << std::endl;
        };
    }

    SyncReport report;
    try {
        report = engine->sync_directory(root, options);
    } catch (const ConsistencyError &e) {
        std::cerr << "Error: sync aborted, the graph was not saved: " << e.what() << std::endl;
        return STATUS_CONSISTENCY;
    } catch (const ConfigError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return STATUS_ERROR;
    }

    try {
        engine->save(ctx.config.store_path);
    } catch (const StoreError &e) {
        std::cerr << "Error saving store: " << e.what() << std::endl;
        return STATUS_ERROR;
    }

    if (ctx.json_output) {
        std::cout << report.to_json().dump(2) << std::endl;
    } else {
        print_sync_report(report);
        std::cout << "Store saved to: " << ctx.config.store_path << std::endl;
    }
    return report.has_failures() ? STATUS_FILE_FAILURES : STATUS_OK;
}

int cmd_cycles(const CliContext &ctx) {
    auto engine = open_engine(ctx, false);
    if (!engine)
        return STATUS_ERROR;

    auto enumerator = engine->cycles();
    auto cycles = enumerator.all();

    if (ctx.json_output) {
        json out = json::array();
        for (const auto &cycle : cycles) {
            json symbols = json::array();
            for (SymbolId id : cycle.symbols) {
                auto symbol = engine->store().get_symbol(id);
                symbols.push_back({{"id", id},
                                   {"name", symbol ? symbol->name : std::string()},
                                   {"file", symbol ? file_of(*engine, symbol->file)
                                                   : std::string()}});
            }
            out.push_back({{"symbols", symbols}, {"certain", cycle.certain}});
        }
        std::cout << json{{"cycles", out}, {"truncated", enumerator.truncated()}}.dump(2)
                  << std::endl;
        return STATUS_OK;
    }

    if (cycles.empty()) {
        std::cout << "No cycles found." << std::endl;
    }
    for (const auto &cycle : cycles) {
        std::cout << (cycle.certain ? "[certain]  " : "[possible] ") << format_cycle(*engine, cycle)
                  << std::endl;
    }
    if (enumerator.truncated())
        std::cout << "Search stopped early; the graph has more cycles than listed." << std::endl;
    return STATUS_OK;
}

int cmd_impact(const CliContext &ctx, const std::string &name, std::optional<size_t> depth) {
    auto engine = open_engine(ctx, false);
    if (!engine)
        return STATUS_ERROR;

    auto targets = engine->symbols_named(name);
    if (targets.empty()) {
        std::cerr << "Error: symbol not found: " << name << std::endl;
        auto matches = engine->find_symbols(name);
        if (!matches.empty()) {
            std::cerr << "Did you mean one of these?" << std::endl;
            for (size_t i = 0; i < std::min(matches.size(), size_t(5)); ++i)
                std::cerr << "  " << matches[i].symbol.name << std::endl;
        }
        return STATUS_ERROR;
    }

    json out = json::array();
    for (const auto &target : targets) {
        auto result = engine->impact_of(target.symbol.id, depth);

        if (ctx.json_output) {
            json entries = json::array();
            for (const auto &entry : result.entries) {
                entries.push_back(
                    {{"id", entry.symbol},
                     {"name", entry.name},
                     {"file", entry.file},
                     {"depth", entry.depth},
                     {"certainty",
                      entry.certainty == ImpactCertainty::Certain ? "certain" : "possible"}});
            }
            out.push_back({{"target", symbol_view_to_json(target)},
                           {"dependents", entries},
                           {"truncated", result.truncated}});
            continue;
        }

        std::cout << "Impact of " << target.symbol.name << " (" << target.file << ":"
                  << target.symbol.line << "):" << std::endl;
        if (result.entries.empty())
            std::cout << "  nothing depends on it" << std::endl;
        for (const auto &entry : result.entries) {
            std::cout << "  [" << entry.depth << "] " << entry.name << "  " << entry.file
                      << (entry.certainty == ImpactCertainty::Possible ? "  (possible)" : "")
                      << std::endl;
        }
        if (result.truncated)
            std::cout << "  (truncated)" << std::endl;
    }

    if (ctx.json_output)
        std::cout << out.dump(2) << std::endl;
    return STATUS_OK;
}

int cmd_symbols(const CliContext &ctx, const std::string &path) {
    auto engine = open_engine(ctx, false);
    if (!engine)
        return STATUS_ERROR;

    auto symbols = engine->symbols_in(path);
    if (ctx.json_output) {
        json out = json::array();
        for (const auto &symbol : symbols)
            out.push_back(symbol_view_to_json({symbol, path}));
        std::cout << out.dump(2) << std::endl;
        return STATUS_OK;
    }

    if (symbols.empty()) {
        std::cout << "No symbols in " << path << std::endl;
    }
    for (const auto &symbol : symbols) {
        print_symbol_view({symbol, path});
    }
    return STATUS_OK;
}

int cmd_orphans(const CliContext &ctx) {
    auto engine = open_engine(ctx, false);
    if (!engine)
        return STATUS_ERROR;

    auto orphans = engine->find_orphans();
    if (ctx.json_output) {
        json out = json::array();
        for (const auto &view : orphans)
            out.push_back(symbol_view_to_json(view));
        std::cout << out.dump(2) << std::endl;
        return STATUS_OK;
    }

    std::cout << orphans.size() << " symbols with no callers:" << std::endl;
    for (const auto &view : orphans) {
        print_symbol_view(view);
    }
    return STATUS_OK;
}

int cmd_dynamic(const CliContext &ctx) {
    auto engine = open_engine(ctx, false);
    if (!engine)
        return STATUS_ERROR;

    auto edges = engine->uncertain_edges();
    if (ctx.json_output) {
        json out = json::array();
        for (const auto &view : edges) {
            out.push_back({{"source", view.source_name},
                           {"file", view.source_file},
                           {"line", view.edge.line},
                           {"target", view.target_name},
                           {"kind", relation_to_string(view.edge.kind)},
                           {"bound", view.edge.internal()}});
        }
        std::cout << out.dump(2) << std::endl;
        return STATUS_OK;
    }

    std::cout << edges.size() << " edges not provable by static analysis:" << std::endl;
    for (const auto &view : edges) {
        std::cout << "  " << view.source_file << ":" << view.edge.line << "  " << view.source_name
                  << " -> " << view.target_name << std::endl;
    }
    return STATUS_OK;
}

int cmd_search(const CliContext &ctx, const std::string &pattern) {
    auto engine = open_engine(ctx, false);
    if (!engine)
        return STATUS_ERROR;

    auto matches = engine->find_symbols(pattern);
    if (ctx.json_output) {
        json out = json::array();
        for (const auto &view : matches)
            out.push_back(symbol_view_to_json(view));
        std::cout << out.dump(2) << std::endl;
        return STATUS_OK;
    }

    if (matches.empty()) {
        std::cout << "No symbols found matching: " << pattern << std::endl;
    }
    for (const auto &view : matches) {
        print_symbol_view(view);
    }
    return STATUS_OK;
}

int cmd_stats(const CliContext &ctx) {
    auto engine = open_engine(ctx, false);
    if (!engine)
        return STATUS_ERROR;

    GraphStats stats = engine->stats();
    if (ctx.json_output) {
        json out = {{"files", stats.files},
                    {"tombstoned_files", stats.tombstoned_files},
                    {"symbols", stats.symbols},
                    {"tombstoned_symbols", stats.tombstoned_symbols},
                    {"edges",
                     {{"total", stats.edges},
                      {"resolved", stats.resolved_edges},
                      {"conditional", stats.conditional_edges},
                      {"dynamic", stats.dynamic_edges},
                      {"external", stats.external_edges}}}};
        std::cout << out.dump(2) << std::endl;
        return STATUS_OK;
    }

    std::cout << "Files:   " << stats.files << " (" << stats.tombstoned_files << " tombstoned)"
              << std::endl;
    std::cout << "Symbols: " << stats.symbols << " (" << stats.tombstoned_symbols
              << " tombstoned)" << std::endl;
    std::cout << "Edges:   " << stats.edges << std::endl;
    std::cout << "  resolved:    " << stats.resolved_edges << std::endl;
    std::cout << "  conditional: " << stats.conditional_edges << std::endl;
    std::cout << "  dynamic:     " << stats.dynamic_edges << std::endl;
    std::cout << "  external:    " << stats.external_edges << std::endl;
    return STATUS_OK;
}

} // namespace depmap
