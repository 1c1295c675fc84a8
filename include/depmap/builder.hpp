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

#include "checksum.hpp"
#include "confidence.hpp"
#include "errors.hpp"
#include "graph.hpp"
#include "logging.hpp"
#include "scanner.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace depmap {

// Callback for progress reporting
using SyncProgressCallback =
    std::function<void(const std::string &file, size_t current, size_t total)>;

// Checked between file units; a file is never half committed
class CancellationToken {
public:
    void cancel() { cancelled_ = true; }
    void reset() { cancelled_ = false; }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

enum class SyncState { Idle, Scanning, Diffing, Committing };

const char *sync_state_to_string(SyncState state);

struct SymbolRef {
    SymbolId id = INVALID_ID;
    std::string name;
    std::string file;
};

struct SyncReport {
    size_t files_added = 0;
    size_t files_modified = 0;
    size_t files_removed = 0;
    size_t files_unchanged = 0;
    size_t files_failed = 0;

    std::vector<FileError> errors;
    std::vector<SymbolRef> created_symbols; // New or resurrected
    std::vector<SymbolRef> tombstoned_symbols;
    std::vector<SymbolRef> updated_symbols; // Signature changed

    size_t edges_inserted = 0;
    size_t edges_updated = 0;     // Confidence, target key or arguments changed
    size_t edges_reconfirmed = 0; // Seen again unchanged
    size_t edges_deleted = 0;
    size_t edges_relinked = 0; // External edges bound after the commits

    bool cancelled = false;
    int64_t duration_ms = 0;

    bool has_failures() const { return !errors.empty(); }
    bool has_changes() const { return files_added + files_modified + files_removed > 0; }

    json to_json() const;
};

struct BuilderConfig {
    unsigned int num_threads = 0; // 0 = auto-detect
};

struct SyncOptions {
    const CancellationToken *cancel = nullptr;
    SyncProgressCallback progress_callback = nullptr;
};

// The sync engine. Reconciles a walk of the tree against the store:
//
//   Idle -> Scanning -> (Diffing -> Committing)* -> Idle
//
// Scanning runs on a pool of worker threads. Files are then diffed and
// committed one at a time in path order: removed files first, then added
// and modified ones. A file that fails to scan or commit keeps its stored
// symbols and its previous digest, so the next sync retries it. After the
// commits, external edges naming a newly created symbol are relinked.
//
// A ConsistencyError from the store aborts the run: pending digests are
// rolled back and the exception propagates to the caller.
class GraphBuilder {
public:
    GraphBuilder(GraphStore &store, ChecksumIndex &checksums, const ScannerRegistry &scanners,
                 std::shared_ptr<Logger> logger = nullptr, BuilderConfig config = {});

    SyncReport sync(const std::vector<SourceInput> &inputs, const SyncOptions &options = {});

    SyncState state() const { return state_.load(); }

private:
    struct PendingFile {
        const SourceInput *input = nullptr;
        ChangeKind change = ChangeKind::Unchanged;
        Language language = Language::Unknown;
        std::optional<ScanResult> result; // Empty when skipped by cancellation
    };

    struct DiffOutcome {
        FileDelta delta;
        std::vector<SymbolRef> created;
        std::vector<SymbolRef> updated;
        std::vector<SymbolRef> removed;
        std::vector<SymbolId> created_ids;
        size_t edges_updated = 0;
        size_t edges_reconfirmed = 0;
    };

    GraphStore &store_;
    ChecksumIndex &checksums_;
    const ScannerRegistry &scanners_;
    std::shared_ptr<Logger> logger_;
    BuilderConfig config_;
    ConfidenceAnnotator annotator_;
    std::atomic<SyncState> state_{SyncState::Idle};

    void set_state(SyncState state);

    void scan_all(std::vector<PendingFile> &files, const SyncOptions &options);

    // Worker function for thread pool
    void worker_scan_files(std::vector<PendingFile> &files, size_t start_idx, size_t end_idx,
                           const SyncOptions &options, std::atomic<size_t> &done);

    bool remove_file(const std::string &path, SyncReport &report);

    // False when the file failed and was reported
    bool commit_file(const PendingFile &file, SyncReport &report,
                     std::vector<SymbolId> &created_ids);

    DiffOutcome diff(const PendingFile &file);

    void relink(const std::vector<SymbolId> &created_ids, SyncReport &report);

    void report_error(SyncReport &report, FileErrorKind kind, const std::string &path,
                      const std::string &message);
};

} // namespace depmap
