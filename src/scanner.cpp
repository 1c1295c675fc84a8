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

#include "depmap/scanner.hpp"
#include "depmap/parser.hpp"
#include "depmap/pattern_scanner.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace depmap {

namespace fs = std::filesystem;

namespace {

std::string extension_of(const std::string &path) {
    return fs::path(path).extension().string();
}

std::string trim(const std::string &text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string first_identifier(const std::string &text) {
    size_t start = 0;
    while (start < text.size()) {
        char c = text[start];
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_')
            break;
        ++start;
    }
    size_t end = start;
    while (end < text.size()) {
        char c = text[end];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
            break;
        ++end;
    }
    return text.substr(start, end - start);
}

} // namespace

void ScannerRegistry::register_scanner(const std::string &extension, Language language,
                                       std::shared_ptr<const SourceScanner> scanner) {
    entries_[extension] = Entry{language, std::move(scanner)};
}

const SourceScanner *ScannerRegistry::scanner_for(const std::string &path) const {
    auto it = entries_.find(extension_of(path));
    if (it == entries_.end())
        return nullptr;
    return it->second.scanner.get();
}

Language ScannerRegistry::language_for(const std::string &path) const {
    auto it = entries_.find(extension_of(path));
    if (it == entries_.end())
        return Language::Unknown;
    return it->second.language;
}

std::vector<std::string> ScannerRegistry::extensions() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto &[ext, entry] : entries_) {
        result.push_back(ext);
    }
    return result;
}

ScannerRegistry ScannerRegistry::with_default_scanners() {
    ScannerRegistry registry;

    auto tree_sitter = std::make_shared<TreeSitterScanner>();
    for (const char *ext : {".py"}) {
        registry.register_scanner(ext, Language::Python, tree_sitter);
    }
    for (const char *ext : {".c", ".h"}) {
        registry.register_scanner(ext, Language::C, tree_sitter);
    }
    for (const char *ext : {".cpp", ".cc", ".cxx", ".hpp", ".hh", ".hxx"}) {
        registry.register_scanner(ext, Language::Cpp, tree_sitter);
    }

    auto patterns = std::make_shared<PatternScanner>();
    for (const char *ext : {".js", ".jsx", ".mjs", ".cjs"}) {
        registry.register_scanner(ext, Language::JavaScript, patterns);
    }
    for (const char *ext : {".ts", ".tsx"}) {
        registry.register_scanner(ext, Language::TypeScript, patterns);
    }
    registry.register_scanner(".rs", Language::Rust, patterns);
    registry.register_scanner(".go", Language::Go, patterns);
    registry.register_scanner(".java", Language::Java, patterns);

    return registry;
}

std::string resolution_key(const std::string &name) {
    std::string key = name;
    size_t cut = key.find_first_of("<(");
    if (cut != std::string::npos) {
        key = key.substr(0, cut);
    }
    key = trim(key);

    size_t best = std::string::npos;
    size_t sep_len = 0;
    for (const char *sep : {"::", "->", "."}) {
        size_t pos = key.rfind(sep);
        if (pos != std::string::npos && (best == std::string::npos || pos > best)) {
            best = pos;
            sep_len = std::char_traits<char>::length(sep);
        }
    }
    if (best != std::string::npos) {
        key = key.substr(best + sep_len);
    }
    return key;
}

std::string module_key(const std::string &path, Language language) {
    fs::path p(path);
    std::string stem = p.stem().string();
    std::string parent = p.parent_path().filename().string();

    switch (language) {
    case Language::C:
    case Language::Cpp:
        return p.filename().string();
    case Language::Python:
        if (stem == "__init__" && !parent.empty())
            return parent;
        return stem;
    case Language::JavaScript:
    case Language::TypeScript:
        if (stem == "index" && !parent.empty())
            return parent;
        return stem;
    case Language::Rust:
        if (stem == "mod" && !parent.empty())
            return parent;
        return stem;
    default:
        return stem;
    }
}

DraftCollector::DraftCollector(const std::string &path, Language language) {
    result_.language = language;

    SymbolDraft module;
    module.name = MODULE_SYMBOL_NAME;
    module.short_name = module_key(path, language);
    module.kind = SymbolKind::Module;
    module.line = 1;
    add_symbol(std::move(module));
}

size_t DraftCollector::add_symbol(SymbolDraft draft) {
    std::string identity = draft.identity();
    auto it = by_identity_.find(identity);
    if (it != by_identity_.end()) {
        return it->second;
    }

    size_t index = result_.symbols.size();
    by_identity_.emplace(std::move(identity), index);
    result_.symbols.push_back(std::move(draft));
    return index;
}

void DraftCollector::add_edge(size_t source, EdgeDraft edge) {
    if (edge.target_key.empty()) {
        edge.target_key = resolution_key(edge.target_name);
    }
    if (edge.target_key.empty()) {
        // "(*fp)", "handlers[i]": fall back to the first identifier
        edge.target_key = first_identifier(edge.target_name);
    }
    if (edge.target_key.empty())
        return;
    edge.source = source;
    result_.edges.push_back(std::move(edge));
}

ScanResult DraftCollector::take() { return std::move(result_); }

} // namespace depmap
