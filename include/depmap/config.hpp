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

#include "logging.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace depmap {

using json = nlohmann::json;

constexpr const char *DEFAULT_CONFIG_FILE = ".depmap.config.json";
constexpr const char *DEFAULT_STORE_FILE = ".depmap.json";

// Directory names never walked: build output, dependency caches, VCS data
std::vector<std::string> default_ignore_patterns();

// Engine configuration
struct EngineConfig {
    // Threading config
    unsigned int num_threads = 0; // 0 = auto-detect

    // Query limits
    size_t default_impact_depth = 5;
    size_t max_impact_results = 10000;
    size_t max_impact_fanout = 0; // 0 = unlimited
    size_t cycle_step_factor = 64;
    bool include_self_loops = false;

    std::string store_path = DEFAULT_STORE_FILE;

    // File patterns to ignore
    std::vector<std::string> ignore_patterns = default_ignore_patterns();

    LogLevel log_level = LogLevel::Warn;

    // Overlay the keys present in j on the defaults. Unknown keys are
    // ignored; a known key with the wrong type throws ConfigError.
    static EngineConfig from_json(const json &j);

    // Throws ConfigError when the file cannot be read or parsed
    static EngineConfig load(const std::string &path);

    json to_json() const;
};

} // namespace depmap
