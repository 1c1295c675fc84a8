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

#include "depmap/config.hpp"
#include "depmap/errors.hpp"
#include <cstdint>
#include <fstream>
#include <limits>

namespace depmap {

namespace {

template <typename T> void read_unsigned(const json &j, const char *key, T &out) {
    if (!j.contains(key))
        return;
    const json &value = j.at(key);
    if (!value.is_number_unsigned())
        throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
    if (value.get<uint64_t>() > std::numeric_limits<T>::max())
        throw ConfigError(std::string("'") + key + "' is out of range");
    out = value.get<T>();
}

void read_bool(const json &j, const char *key, bool &out) {
    if (!j.contains(key))
        return;
    const json &value = j.at(key);
    if (!value.is_boolean())
        throw ConfigError(std::string("'") + key + "' must be true or false");
    out = value.get<bool>();
}

void read_string(const json &j, const char *key, std::string &out) {
    if (!j.contains(key))
        return;
    const json &value = j.at(key);
    if (!value.is_string())
        throw ConfigError(std::string("'") + key + "' must be a string");
    out = value.get<std::string>();
}

void read_string_list(const json &j, const char *key, std::vector<std::string> &out) {
    if (!j.contains(key))
        return;
    const json &value = j.at(key);
    if (!value.is_array())
        throw ConfigError(std::string("'") + key + "' must be a list of strings");
    std::vector<std::string> items;
    for (const auto &item : value) {
        if (!item.is_string())
            throw ConfigError(std::string("'") + key + "' must be a list of strings");
        items.push_back(item.get<std::string>());
    }
    out = std::move(items);
}

} // namespace

std::vector<std::string> default_ignore_patterns() {
    return {"node_modules", "venv",        "env",       "__pycache__", "target",
            "build",        "dist",        "vendor",    "coverage",    "htmlcov",
            ".git",         ".svn",        ".hg",       ".venv",       ".tox",
            ".mypy_cache",  ".pytest_cache", ".next",   ".nuxt",       ".cache",
            "CMakeFiles"};
}

EngineConfig EngineConfig::from_json(const json &j) {
    if (!j.is_object())
        throw ConfigError("configuration must be a JSON object");

    EngineConfig config;
    read_unsigned(j, "num_threads", config.num_threads);
    read_unsigned(j, "default_impact_depth", config.default_impact_depth);
    read_unsigned(j, "max_impact_results", config.max_impact_results);
    read_unsigned(j, "max_impact_fanout", config.max_impact_fanout);
    read_unsigned(j, "cycle_step_factor", config.cycle_step_factor);
    read_bool(j, "include_self_loops", config.include_self_loops);
    read_string(j, "store_path", config.store_path);
    read_string_list(j, "ignore_patterns", config.ignore_patterns);

    std::string level;
    read_string(j, "log_level", level);
    if (!level.empty())
        config.log_level = log_level_from_string(level);

    if (config.default_impact_depth == 0)
        throw ConfigError("'default_impact_depth' must be at least 1");
    if (config.cycle_step_factor == 0)
        throw ConfigError("'cycle_step_factor' must be at least 1");
    if (config.store_path.empty())
        throw ConfigError("'store_path' must not be empty");
    return config;
}

EngineConfig EngineConfig::load(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open " + path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error &e) {
        throw ConfigError(path + ": " + e.what());
    }
    return from_json(j);
}

json EngineConfig::to_json() const {
    return {{"num_threads", num_threads},
            {"default_impact_depth", default_impact_depth},
            {"max_impact_results", max_impact_results},
            {"max_impact_fanout", max_impact_fanout},
            {"cycle_step_factor", cycle_step_factor},
            {"include_self_loops", include_self_loops},
            {"store_path", store_path},
            {"ignore_patterns", ignore_patterns},
            {"log_level", log_level_to_string(log_level)}};
}

} // namespace depmap
