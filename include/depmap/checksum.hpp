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

#include "types.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace depmap {

using json = nlohmann::json;

// Lowercase hex SHA-256 of the given bytes
std::string sha256_hex(std::string_view data);

// Maps each source path to the digest of its last synced content.
//
// A sync run brackets its records with begin_walk()/finish_walk(). record()
// updates the entry immediately; revert() puts back the digest held before
// the current walk, which is how a failed or cancelled file gets retried on
// the next run. Removal is two-step: finish_walk() reports the paths not
// seen, confirm_removed() drops them once the graph has tombstoned them.
//
// Not thread-safe; owned by the sync engine.
class ChecksumIndex {
public:
    void begin_walk();

    ChangeKind record(const std::string &path, const std::string &digest);

    // The file exists but could not be read: keep its previous digest and
    // do not report it as removed.
    void record_unreadable(const std::string &path);

    // Known paths not recorded since begin_walk(), sorted
    std::vector<std::string> finish_walk() const;

    void confirm_removed(const std::string &path);

    // Undo this walk's record() for path
    void revert(const std::string &path);

    std::optional<std::string> digest_of(const std::string &path) const;
    bool contains(const std::string &path) const { return digests_.count(path) > 0; }
    size_t size() const { return digests_.size(); }
    const std::map<std::string, std::string> &entries() const { return digests_; }

    json to_json() const;
    static ChecksumIndex from_json(const json &j);

private:
    std::map<std::string, std::string> digests_;
    std::unordered_set<std::string> seen_;
    // Digest before this walk's record(); nullopt when the path was new
    std::unordered_map<std::string, std::optional<std::string>> previous_;
};

} // namespace depmap
