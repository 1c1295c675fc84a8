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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace depmap {

// Node identifiers - 64-bit unsigned integers, 0 is never assigned
using FileId = uint64_t;
using SymbolId = uint64_t;
using EdgeId = uint64_t;

constexpr uint64_t INVALID_ID = 0;

// Supported languages
enum class Language { Unknown, Python, C, Cpp, JavaScript, TypeScript, Rust, Go, Java };

// Convert language enum to string
inline const char *language_to_string(Language lang) {
    switch (lang) {
    case Language::Python:
        return "python";
    case Language::C:
        return "c";
    case Language::Cpp:
        return "cpp";
    case Language::JavaScript:
        return "javascript";
    case Language::TypeScript:
        return "typescript";
    case Language::Rust:
        return "rust";
    case Language::Go:
        return "go";
    case Language::Java:
        return "java";
    default:
        return "unknown";
    }
}

inline Language language_from_string(const std::string &name) {
    if (name == "python")
        return Language::Python;
    if (name == "c")
        return Language::C;
    if (name == "cpp")
        return Language::Cpp;
    if (name == "javascript")
        return Language::JavaScript;
    if (name == "typescript")
        return Language::TypeScript;
    if (name == "rust")
        return Language::Rust;
    if (name == "go")
        return Language::Go;
    if (name == "java")
        return Language::Java;
    return Language::Unknown;
}

// Get language from file extension
inline Language language_from_extension(const std::string &ext) {
    if (ext == ".py")
        return Language::Python;
    if (ext == ".c" || ext == ".h")
        return Language::C;
    if (ext == ".cpp" || ext == ".cc" || ext == ".cxx" || ext == ".hpp" || ext == ".hh" ||
        ext == ".hxx")
        return Language::Cpp;
    if (ext == ".js" || ext == ".jsx" || ext == ".mjs" || ext == ".cjs")
        return Language::JavaScript;
    if (ext == ".ts" || ext == ".tsx")
        return Language::TypeScript;
    if (ext == ".rs")
        return Language::Rust;
    if (ext == ".go")
        return Language::Go;
    if (ext == ".java")
        return Language::Java;
    return Language::Unknown;
}

// Certainty of an edge's target, most certain first. Every edge carries
// exactly one class.
enum class Confidence : uint8_t { Resolved = 0, Conditional = 1, Dynamic = 2, External = 3 };

inline const char *confidence_to_string(Confidence c) {
    switch (c) {
    case Confidence::Resolved:
        return "resolved";
    case Confidence::Conditional:
        return "conditional";
    case Confidence::Dynamic:
        return "dynamic";
    case Confidence::External:
        return "external";
    }
    return "external";
}

inline std::optional<Confidence> confidence_from_string(const std::string &name) {
    if (name == "resolved")
        return Confidence::Resolved;
    if (name == "conditional")
        return Confidence::Conditional;
    if (name == "dynamic")
        return Confidence::Dynamic;
    if (name == "external")
        return Confidence::External;
    return std::nullopt;
}

inline Confidence most_certain(Confidence a, Confidence b) { return a < b ? a : b; }

// Only resolved and conditional edges can take part in a provable cycle
inline bool is_provable(Confidence c) {
    return c == Confidence::Resolved || c == Confidence::Conditional;
}

enum class RelationKind : uint8_t { Call, Import, Compose };

inline const char *relation_to_string(RelationKind kind) {
    switch (kind) {
    case RelationKind::Call:
        return "call";
    case RelationKind::Import:
        return "import";
    case RelationKind::Compose:
        return "compose";
    }
    return "call";
}

inline std::optional<RelationKind> relation_from_string(const std::string &name) {
    if (name == "call")
        return RelationKind::Call;
    if (name == "import")
        return RelationKind::Import;
    if (name == "compose")
        return RelationKind::Compose;
    return std::nullopt;
}

// Function: a callable unit. Module: the per-file pseudo symbol that owns
// imports and top-level code.
enum class SymbolKind : uint8_t { Function, Module };

inline const char *symbol_kind_to_string(SymbolKind kind) {
    return kind == SymbolKind::Module ? "module" : "function";
}

// Symbol kind an edge of the given relation must point at
inline SymbolKind target_kind_for(RelationKind kind) {
    return kind == RelationKind::Import ? SymbolKind::Module : SymbolKind::Function;
}

enum class ChangeKind { Unchanged, Added, Modified, Removed };

inline const char *change_kind_to_string(ChangeKind kind) {
    switch (kind) {
    case ChangeKind::Unchanged:
        return "unchanged";
    case ChangeKind::Added:
        return "added";
    case ChangeKind::Modified:
        return "modified";
    case ChangeKind::Removed:
        return "removed";
    }
    return "unchanged";
}

// Display name of the module pseudo symbol
constexpr const char *MODULE_SYMBOL_NAME = "<module>";

// Build "(int, char*)" from parameter types, dropping const qualifiers
std::string build_param_signature(const std::vector<std::string> &param_types);

// ============================================================================
// Persistent graph entities
// ============================================================================

struct SourceFile {
    FileId id = INVALID_ID;
    std::string path;  // Unique key
    Language language = Language::Unknown;
    std::string digest;
    int64_t synced_at = 0; // Unix milliseconds of the last commit
    uint64_t revision = 0; // Bumped by every commit touching the file
    bool tombstoned = false;
};

struct Symbol {
    SymbolId id = INVALID_ID;
    FileId file = INVALID_ID;
    std::string name;       // Qualified display name (e.g. "Parser.parse", "ns::Foo::bar")
    std::string short_name; // Resolution key (last name segment, or file name for modules)
    SymbolKind kind = SymbolKind::Function;
    std::vector<std::string> param_types; // Empty strings where a type is not visible
    uint32_t arity = 0;
    uint32_t line = 0;
    bool leaf = true; // No outgoing resolved edge
    bool tombstoned = false;

    // "(int, char*)" style signature
    std::string signature() const;
};

struct Edge {
    EdgeId id = INVALID_ID;
    SymbolId source = INVALID_ID;
    SymbolId target = INVALID_ID; // INVALID_ID for external / unresolved targets
    std::string target_name;      // Descriptor as written in the source
    std::string target_key;       // Resolution key derived from target_name
    RelationKind kind = RelationKind::Call;
    Confidence confidence = Confidence::External;
    std::optional<Confidence> demoted_from; // Class held before its target vanished
    uint32_t observation_count = 1;
    int arg_count = -1; // Arguments at the call site, -1 when unknown
    uint32_t line = 0;

    bool internal() const { return target != INVALID_ID; }
};

// ============================================================================
// Scanner drafts (no ids yet)
// ============================================================================

struct SymbolDraft {
    std::string name;
    std::string short_name;
    SymbolKind kind = SymbolKind::Function;
    std::vector<std::string> param_types;
    uint32_t arity = 0;
    uint32_t line = 0;

    // Identity within a file: (name, arity)
    std::string identity() const { return name + "/" + std::to_string(arity); }
};

// Syntactic shape of a reference, decided by the scanner
enum class DispatchHint : uint8_t { Direct, Conditional, Dynamic };

struct EdgeDraft {
    size_t source = 0;        // Index into ScanResult::symbols
    std::string target_name;  // As written
    std::string target_key;   // Resolution key
    RelationKind kind = RelationKind::Call;
    DispatchHint hint = DispatchHint::Direct;
    bool speculative = false; // Keep only when the target resolves in-tree
    int arg_count = -1;       // -1 when unknown
    uint32_t line = 0;
};

struct ScanResult {
    Language language = Language::Unknown;
    std::vector<SymbolDraft> symbols;
    std::vector<EdgeDraft> edges;
    std::optional<std::string> error; // ScanError message

    bool ok() const { return !error.has_value(); }
};

// One entry supplied by the directory walker
struct SourceInput {
    std::string path;
    std::optional<std::string> content; // Empty when the file could not be read
    std::string digest;
    std::string read_error;
};

// ============================================================================
// Derived query results
// ============================================================================

// Closed walk over resolved/conditional edges; the first symbol is not
// repeated at the end.
struct Cycle {
    std::vector<SymbolId> symbols;
    bool certain = true; // Every edge is resolved

    bool operator==(const Cycle &other) const { return symbols == other.symbols; }
};

enum class ImpactCertainty { Certain, Possible };

struct ImpactEntry {
    SymbolId symbol = INVALID_ID;
    std::string name;
    std::string file;
    size_t depth = 0; // Shortest-path depth
    ImpactCertainty certainty = ImpactCertainty::Certain;
};

struct GraphStats {
    size_t files = 0;
    size_t tombstoned_files = 0;
    size_t symbols = 0;
    size_t tombstoned_symbols = 0;
    size_t edges = 0;
    size_t resolved_edges = 0;
    size_t conditional_edges = 0;
    size_t dynamic_edges = 0;
    size_t external_edges = 0;
};

} // namespace depmap
