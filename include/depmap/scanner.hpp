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
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace depmap {

// Turns one file's content into symbol and edge drafts. Implementations
// are stateless from the caller's point of view: scan() may be called from
// several worker threads at once.
class SourceScanner {
public:
    virtual ~SourceScanner() = default;

    // Never throws for bad input; unparseable content is reported through
    // ScanResult::error with empty symbol and edge lists.
    virtual ScanResult scan(const std::string &path, const std::string &content) const = 0;

    virtual std::vector<Language> languages() const = 0;
};

// Maps file extensions to a language and the scanner handling it
class ScannerRegistry {
public:
    void register_scanner(const std::string &extension, Language language,
                          std::shared_ptr<const SourceScanner> scanner);

    // nullptr when no scanner handles the path's extension
    const SourceScanner *scanner_for(const std::string &path) const;
    Language language_for(const std::string &path) const;
    bool supports(const std::string &path) const { return scanner_for(path) != nullptr; }

    std::vector<std::string> extensions() const;
    bool empty() const { return entries_.empty(); }

    // Tree-sitter scanner for Python/C/C++, pattern scanner for
    // JavaScript/TypeScript/Rust/Go/Java
    static ScannerRegistry with_default_scanners();

private:
    struct Entry {
        Language language = Language::Unknown;
        std::shared_ptr<const SourceScanner> scanner;
    };
    std::map<std::string, Entry> entries_;
};

// Resolution key for a callee as written: template arguments and call
// parentheses dropped, last segment of "a.b", "a::b" or "a->b".
std::string resolution_key(const std::string &name);

// Key other files use to import this one: the file name for C/C++
// (matching #include), the parent directory for Python's __init__.py,
// the file stem otherwise.
std::string module_key(const std::string &path, Language language);

// Accumulates drafts for one file. Symbols are unique by (name, arity);
// a redeclaration folds into the first one, keeping its references.
class DraftCollector {
public:
    DraftCollector(const std::string &path, Language language);

    size_t add_symbol(SymbolDraft draft);

    // Index of the per-file module symbol
    size_t module_symbol() const { return 0; }

    void add_edge(size_t source, EdgeDraft edge);

    ScanResult take();

private:
    ScanResult result_;
    std::unordered_map<std::string, size_t> by_identity_;
};

} // namespace depmap
