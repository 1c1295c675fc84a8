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

#include "config.hpp"
#include "engine.hpp"
#include <memory>
#include <optional>
#include <string>

namespace depmap {

// Process exit statuses
enum ExitStatus : int {
    STATUS_OK = 0,
    STATUS_ERROR = 1,       // Usage, configuration or store errors
    STATUS_CONSISTENCY = 2, // A sync run was aborted by a ConsistencyError
    STATUS_FILE_FAILURES = 3 // Sync completed with per-file failures
};

// Options shared by every command
struct CliContext {
    EngineConfig config;
    bool json_output = false;
};

// Engine with the store at config.store_path loaded. When the store does
// not exist yet, an empty engine is returned if allow_missing is set and
// nullptr (with a message) otherwise. nullptr on load errors as well.
std::unique_ptr<Engine> open_engine(const CliContext &ctx, bool allow_missing);

// Command implementations
int cmd_sync(const CliContext &ctx, const std::string &root);
int cmd_cycles(const CliContext &ctx);
int cmd_impact(const CliContext &ctx, const std::string &name, std::optional<size_t> depth);
int cmd_symbols(const CliContext &ctx, const std::string &path);
int cmd_orphans(const CliContext &ctx);
int cmd_dynamic(const CliContext &ctx);
int cmd_search(const CliContext &ctx, const std::string &pattern);
int cmd_stats(const CliContext &ctx);

} // namespace depmap
