#pragma once

#include "scanner.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <tree_sitter/api.h>
#include <vector>

// Forward declarations for tree-sitter language functions
extern "C" {
const TSLanguage *tree_sitter_python();
const TSLanguage *tree_sitter_c();
const TSLanguage *tree_sitter_cpp();
}

namespace depmap {

// Parsed function definition
struct FunctionDef {
    std::string name;                     // Simple name as declared
    std::string qualified_name;           // Class/namespace qualified name
    std::string containing_class;         // Containing class/struct (if any)
    std::vector<std::string> param_types; // One entry per parameter, "" when untyped
    uint32_t arity = 0;
    uint32_t start_line = 0;
    uint32_t end_line = 0;
    TSNode node; // Original tree-sitter node
};

// Parser for a single language. Owns the tree-sitter parser and the tree
// of the last parse; not shareable between threads.
class LanguageParser {
public:

    explicit LanguageParser(Language lang);
    ~LanguageParser();

    // Non-copyable
    LanguageParser(const LanguageParser &) = delete;
    LanguageParser &operator=(const LanguageParser &) = delete;

    // Movable
    LanguageParser(LanguageParser &&other) noexcept;
    LanguageParser &operator=(LanguageParser &&other) noexcept;

    // Parse source code
    bool parse(const std::string &source);

    // Line of the first ERROR or missing node, if the tree has any
    std::optional<uint32_t> syntax_error_line() const;

    // Extract function definitions, outermost first
    std::vector<FunctionDef> extract_functions() const;

    // Calls, imports and compositions inside a function. Nested function
    // bodies are left to their own FunctionDef.
    std::vector<EdgeDraft> extract_references(const FunctionDef &func) const;

    // References made by top-level code
    std::vector<EdgeDraft> extract_module_references() const;

    // Get root node
    TSNode root() const;

    // Get source code
    const std::string &source() const { return source_; }

    // Get language
    Language language() const { return language_; }

private:

    Language language_;
    TSParser *parser_ = nullptr;
    TSTree *tree_ = nullptr;
    std::string source_;

    // Helper to get node text
    std::string node_text(TSNode node) const;

    // Language-specific extractors
    std::vector<FunctionDef> extract_functions_python() const;
    std::vector<FunctionDef> extract_functions_c() const;
    std::vector<FunctionDef> extract_functions_cpp() const;

    // Walks scope, skipping nested function definitions
    void collect_references(TSNode scope, std::vector<EdgeDraft> &out) const;

    void add_call_python(TSNode call, TSNode scope, std::vector<EdgeDraft> &out) const;
    void add_call_c_family(TSNode call, TSNode scope, std::vector<EdgeDraft> &out) const;
    void add_import_python(TSNode node, TSNode scope, std::vector<EdgeDraft> &out) const;
    void add_include(TSNode node, TSNode scope, std::vector<EdgeDraft> &out) const;
    void add_decorators(const FunctionDef &func, std::vector<EdgeDraft> &out) const;

    // Function references passed as call arguments
    void add_argument_references(TSNode arguments, std::vector<EdgeDraft> &out) const;

    // Conditional when node only runs under a branch taken inside scope
    DispatchHint branch_hint(TSNode node, TSNode scope) const;

    int argument_count(TSNode arguments) const;

    // Contents of a string literal node, nullopt for anything else
    std::optional<std::string> string_literal(TSNode node) const;

    // Iterative pre-order walk; the visitor returns false to skip a subtree
    void visit_nodes(TSNode node, const std::function<bool(TSNode)> &visitor) const;

    uint32_t python_arity(TSNode params, bool is_method, std::vector<std::string> &types) const;
    uint32_t c_arity(TSNode params, std::vector<std::string> &types) const;
};

// Factory to create parser for a language
std::unique_ptr<LanguageParser> create_parser(Language lang);

// SourceScanner over tree-sitter grammars for Python, C and C++. Creates a
// parser per scan, so one instance serves all scan workers.
class TreeSitterScanner : public SourceScanner {
public:
    ScanResult scan(const std::string &path, const std::string &content) const override;
    std::vector<Language> languages() const override;
};

} // namespace depmap
