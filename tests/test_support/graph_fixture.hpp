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

#include "depmap/graph.hpp"
#include <map>
#include <string>
#include <vector>

namespace depmap {
namespace testing {

// Builds small graphs directly through the store's upsert API. Each symbol
// lives in its own file "<name>.py" unless a file is given.
class GraphFixture {
public:
    SymbolId add(const std::string &name, const std::string &file = "") {
        std::string path = file.empty() ? name + ".py" : file;
        FileId fid = store.upsert_file(path, Language::Python, "digest-" + path);

        SymbolDraft draft;
        draft.name = name;
        draft.short_name = name;
        SymbolId id = store.upsert_symbols(fid, {draft})[0];
        ids[name] = id;
        return id;
    }

    void link(const std::string &from, const std::string &to,
              Confidence confidence = Confidence::Resolved) {
        Edge edge;
        edge.source = ids.at(from);
        edge.target = ids.at(to);
        edge.target_name = to;
        edge.target_key = to;
        edge.confidence = confidence;
        store.upsert_edges({edge});
    }

    SymbolId id(const std::string &name) const { return ids.at(name); }

    std::vector<std::string> names(const std::vector<SymbolId> &symbol_ids) const {
        std::vector<std::string> result;
        for (SymbolId sid : symbol_ids) {
            for (const auto &[name, known] : ids) {
                if (known == sid)
                    result.push_back(name);
            }
        }
        return result;
    }

    GraphStore store;
    std::map<std::string, SymbolId> ids;
};

} // namespace testing
} // namespace depmap
