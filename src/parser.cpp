#include "depmap/parser.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <stdexcept>

namespace depmap {

namespace {

TSNode field(TSNode node, const char *name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(strlen(name)));
}

bool is_type(TSNode node, const char *type) { return strcmp(ts_node_type(node), type) == 0; }

uint32_t line_of(TSNode node) { return ts_node_start_point(node).row + 1; }

// Node types whose children only run when a runtime branch is taken
bool is_branch(const char *type) {
    static const char *const kBranches[] = {
        "if_statement",     "elif_clause",     "else_clause",    "conditional_expression",
        "switch_statement", "case_statement",  "match_statement", "case_clause",
        "except_clause",    "catch_clause",
    };
    for (const char *branch : kBranches) {
        if (strcmp(type, branch) == 0)
            return true;
    }
    return false;
}

// Loops whose body may run zero times. The header (condition, iterable,
// initializer) always runs; everything else under the loop is conditional.
bool is_loop(const char *type) {
    static const char *const kLoops[] = {
        "while_statement", "for_statement", "for_in_statement", "for_range_loop",
    };
    for (const char *loop : kLoops) {
        if (strcmp(type, loop) == 0)
            return true;
    }
    return false;
}

// `a && b`, `a or b`: the right operand only runs when the left does not decide
bool is_short_circuit(TSNode node) {
    if (!is_type(node, "boolean_operator") && !is_type(node, "binary_expression"))
        return false;
    TSNode op = field(node, "operator");
    if (ts_node_is_null(op))
        return false;
    const char *text = ts_node_type(op);
    return strcmp(text, "&&") == 0 || strcmp(text, "||") == 0 || strcmp(text, "and") == 0 ||
           strcmp(text, "or") == 0;
}

std::string last_dotted_segment(const std::string &name) {
    size_t dot = name.rfind('.');
    return dot == std::string::npos ? name : name.substr(dot + 1);
}

} // namespace

LanguageParser::LanguageParser(Language lang) : language_(lang) {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create tree-sitter parser");
    }

    const TSLanguage *ts_lang = nullptr;
    switch (lang) {
    case Language::Python:
        ts_lang = tree_sitter_python();
        break;
    case Language::C:
        ts_lang = tree_sitter_c();
        break;
    case Language::Cpp:
        ts_lang = tree_sitter_cpp();
        break;
    default:
        ts_parser_delete(parser_);
        throw std::runtime_error("Unsupported language");
    }

    if (!ts_parser_set_language(parser_, ts_lang)) {
        ts_parser_delete(parser_);
        throw std::runtime_error("Failed to set parser language");
    }
}

LanguageParser::~LanguageParser() {
    if (tree_)
        ts_tree_delete(tree_);
    if (parser_)
        ts_parser_delete(parser_);
}

LanguageParser::LanguageParser(LanguageParser &&other) noexcept
    : language_(other.language_), parser_(other.parser_), tree_(other.tree_),
      source_(std::move(other.source_)) {
    other.parser_ = nullptr;
    other.tree_ = nullptr;
}

LanguageParser &LanguageParser::operator=(LanguageParser &&other) noexcept {
    if (this != &other) {
        if (tree_)
            ts_tree_delete(tree_);
        if (parser_)
            ts_parser_delete(parser_);

        language_ = other.language_;
        parser_ = other.parser_;
        tree_ = other.tree_;
        source_ = std::move(other.source_);

        other.parser_ = nullptr;
        other.tree_ = nullptr;
    }
    return *this;
}

bool LanguageParser::parse(const std::string &source) {
    source_ = source;

    if (tree_) {
        ts_tree_delete(tree_);
        tree_ = nullptr;
    }

    tree_ = ts_parser_parse_string(parser_, nullptr, source_.c_str(),
                                   static_cast<uint32_t>(source_.size()));
    return tree_ != nullptr;
}

TSNode LanguageParser::root() const {
    if (!tree_) {
        return TSNode{};
    }
    return ts_tree_root_node(tree_);
}

std::optional<uint32_t> LanguageParser::syntax_error_line() const {
    if (!tree_)
        return std::nullopt;

    TSNode top = root();
    if (!ts_node_has_error(top))
        return std::nullopt;

    std::optional<uint32_t> line;
    visit_nodes(top, [&](TSNode node) {
        if (line)
            return false;
        if (is_type(node, "ERROR") || ts_node_is_missing(node)) {
            line = line_of(node);
            return false;
        }
        return static_cast<bool>(ts_node_has_error(node));
    });
    return line ? line : std::optional<uint32_t>(1);
}

std::string LanguageParser::node_text(TSNode node) const {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start < source_.size() && end <= source_.size()) {
        return source_.substr(start, end - start);
    }
    return "";
}

void LanguageParser::visit_nodes(TSNode node,
                                 const std::function<bool(TSNode)> &visitor) const {
    // Use iterative approach with explicit stack to avoid recursion
    std::vector<TSNode> stack;
    stack.push_back(node);

    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();

        if (!visitor(current))
            continue;

        uint32_t child_count = ts_node_child_count(current);
        // Add children in reverse order so they're processed in order
        for (uint32_t i = child_count; i > 0; --i) {
            stack.push_back(ts_node_child(current, i - 1));
        }
    }
}

std::optional<std::string> LanguageParser::string_literal(TSNode node) const {
    if (ts_node_is_null(node))
        return std::nullopt;
    if (!is_type(node, "string") && !is_type(node, "string_literal"))
        return std::nullopt;

    // f-strings and similar are not literals
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        if (is_type(ts_node_named_child(node, i), "interpolation"))
            return std::nullopt;
    }

    std::string text = node_text(node);
    size_t start = 0;
    while (start < text.size() && std::isalpha(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    text = text.substr(start);

    size_t quote = 1;
    if (text.size() >= 6 && (text.compare(0, 3, "\"\"\"") == 0 || text.compare(0, 3, "'''") == 0)) {
        quote = 3;
    }
    if (text.size() < 2 * quote)
        return std::nullopt;
    return text.substr(quote, text.size() - 2 * quote);
}

int LanguageParser::argument_count(TSNode arguments) const {
    if (ts_node_is_null(arguments))
        return -1;
    if (is_type(arguments, "generator_expression"))
        return 1;

    int count = 0;
    uint32_t n = ts_node_named_child_count(arguments);
    for (uint32_t i = 0; i < n; ++i) {
        if (!is_type(ts_node_named_child(arguments, i), "comment"))
            ++count;
    }
    return count;
}

DispatchHint LanguageParser::branch_hint(TSNode node, TSNode scope) const {
    TSNode child = node;
    TSNode parent = ts_node_parent(node);

    while (!ts_node_is_null(parent) && !ts_node_eq(child, scope)) {
        const char *type = ts_node_type(parent);
        if (is_branch(type)) {
            TSNode condition = field(parent, "condition");
            if (ts_node_is_null(condition)) {
                condition = field(parent, "subject");
            }
            if (ts_node_is_null(condition) && strcmp(type, "conditional_expression") == 0) {
                // Python: <consequence> if <condition> else <alternative>
                condition = ts_node_named_child(parent, 1);
            }

            bool in_condition = !ts_node_is_null(condition) && ts_node_eq(condition, child);
            if (!in_condition)
                return DispatchHint::Conditional;
        }
        if (is_loop(type)) {
            static const char *const kHeader[] = {"condition", "right", "initializer", "left",
                                                  "declarator", "type"};
            bool in_header = false;
            for (const char *name : kHeader) {
                TSNode part = field(parent, name);
                if (!ts_node_is_null(part) && ts_node_eq(part, child)) {
                    in_header = true;
                    break;
                }
            }
            if (!in_header)
                return DispatchHint::Conditional;
        }
        if (is_short_circuit(parent)) {
            TSNode right = field(parent, "right");
            if (!ts_node_is_null(right) && ts_node_eq(right, child))
                return DispatchHint::Conditional;
        }
        child = parent;
        parent = ts_node_parent(parent);
    }
    return DispatchHint::Direct;
}

std::vector<FunctionDef> LanguageParser::extract_functions() const {
    switch (language_) {
    case Language::Python:
        return extract_functions_python();
    case Language::C:
        return extract_functions_c();
    case Language::Cpp:
        return extract_functions_cpp();
    default:
        return {};
    }
}

std::vector<EdgeDraft> LanguageParser::extract_references(const FunctionDef &func) const {
    std::vector<EdgeDraft> out;
    if (!tree_)
        return out;

    if (language_ == Language::Python) {
        add_decorators(func, out);
    }
    collect_references(func.node, out);
    return out;
}

std::vector<EdgeDraft> LanguageParser::extract_module_references() const {
    std::vector<EdgeDraft> out;
    if (!tree_)
        return out;
    collect_references(root(), out);
    return out;
}

void LanguageParser::collect_references(TSNode scope, std::vector<EdgeDraft> &out) const {
    visit_nodes(scope, [&](TSNode node) {
        if (!ts_node_eq(node, scope)) {
            if (is_type(node, "function_definition"))
                return false;
            if (is_type(node, "decorated_definition")) {
                TSNode definition = field(node, "definition");
                if (!ts_node_is_null(definition) && is_type(definition, "function_definition"))
                    return false;
            }
        }

        if (language_ == Language::Python) {
            if (is_type(node, "call")) {
                add_call_python(node, scope, out);
            } else if (is_type(node, "import_statement") ||
                       is_type(node, "import_from_statement")) {
                add_import_python(node, scope, out);
            }
        } else {
            if (is_type(node, "call_expression") || is_type(node, "new_expression")) {
                add_call_c_family(node, scope, out);
            } else if (is_type(node, "preproc_include")) {
                add_include(node, scope, out);
            }
        }
        return true;
    });
}

// ============ Python Implementation ============

uint32_t LanguageParser::python_arity(TSNode params, bool is_method,
                                      std::vector<std::string> &types) const {
    uint32_t arity = 0;
    if (ts_node_is_null(params))
        return arity;

    uint32_t param_count = ts_node_named_child_count(params);
    for (uint32_t i = 0; i < param_count; ++i) {
        TSNode param = ts_node_named_child(params, i);
        const char *param_type = ts_node_type(param);

        if (strcmp(param_type, "comment") == 0 || strcmp(param_type, "keyword_separator") == 0 ||
            strcmp(param_type, "positional_separator") == 0) {
            continue;
        }

        std::string name;
        std::string type;
        if (strcmp(param_type, "identifier") == 0) {
            name = node_text(param);
        } else if (strcmp(param_type, "typed_parameter") == 0) {
            if (ts_node_named_child_count(param) > 0) {
                name = node_text(ts_node_named_child(param, 0));
            }
            TSNode type_node = field(param, "type");
            if (!ts_node_is_null(type_node)) {
                type = node_text(type_node);
            }
        } else if (strcmp(param_type, "default_parameter") == 0 ||
                   strcmp(param_type, "typed_default_parameter") == 0) {
            TSNode name_node = field(param, "name");
            if (!ts_node_is_null(name_node)) {
                name = node_text(name_node);
            }
            TSNode type_node = field(param, "type");
            if (!ts_node_is_null(type_node)) {
                type = node_text(type_node);
            }
        } else {
            name = node_text(param);
        }

        if (arity == 0 && types.empty() && is_method && (name == "self" || name == "cls")) {
            is_method = false;
            continue;
        }

        types.push_back(type);
        ++arity;
    }
    return arity;
}

std::vector<FunctionDef> LanguageParser::extract_functions_python() const {
    std::vector<FunctionDef> functions;
    if (!tree_)
        return functions;

    // Track class and enclosing function context using a stack
    struct Context {
        std::string name;
        bool is_class;
        uint32_t end_byte;
    };
    std::vector<Context> scope_stack;

    visit_nodes(root(), [&](TSNode node) {
        const char *type = ts_node_type(node);
        uint32_t start_byte = ts_node_start_byte(node);

        // Pop scopes that we've exited
        while (!scope_stack.empty() && start_byte >= scope_stack.back().end_byte) {
            scope_stack.pop_back();
        }

        if (strcmp(type, "class_definition") == 0) {
            TSNode name_node = field(node, "name");
            if (!ts_node_is_null(name_node)) {
                scope_stack.push_back({node_text(name_node), true, ts_node_end_byte(node)});
            }
        } else if (strcmp(type, "function_definition") == 0) {
            FunctionDef func;

            TSNode name_node = field(node, "name");
            if (ts_node_is_null(name_node))
                return true;
            func.name = node_text(name_node);

            std::string prefix;
            for (const auto &ctx : scope_stack) {
                prefix += ctx.name + ".";
            }
            bool is_method = !scope_stack.empty() && scope_stack.back().is_class;
            if (is_method) {
                func.containing_class = scope_stack.back().name;
            }

            func.arity = python_arity(field(node, "parameters"), is_method, func.param_types);
            func.qualified_name = prefix + func.name;
            func.start_line = line_of(node);
            func.end_line = ts_node_end_point(node).row + 1;
            func.node = node;
            functions.push_back(func);

            scope_stack.push_back({func.name, false, ts_node_end_byte(node)});
        }
        return true;
    });

    return functions;
}

void LanguageParser::add_call_python(TSNode call, TSNode scope,
                                     std::vector<EdgeDraft> &out) const {
    TSNode func_node = field(call, "function");
    if (ts_node_is_null(func_node))
        return;
    TSNode arguments = field(call, "arguments");

    EdgeDraft edge;
    edge.kind = RelationKind::Call;
    edge.hint = branch_hint(call, scope);
    edge.arg_count = argument_count(arguments);
    edge.line = line_of(call);

    auto first_literal_argument = [&](uint32_t index) -> std::optional<std::string> {
        if (ts_node_is_null(arguments) || ts_node_named_child_count(arguments) <= index)
            return std::nullopt;
        return string_literal(ts_node_named_child(arguments, index));
    };

    // __import__("m") / importlib.import_module("m")
    auto add_dynamic_import = [&](const std::string &callee) {
        auto module = first_literal_argument(0);
        edge.hint = DispatchHint::Dynamic;
        if (module && !module->empty()) {
            edge.kind = RelationKind::Import;
            edge.target_name = *module;
            edge.target_key = last_dotted_segment(*module);
            edge.arg_count = -1;
        } else {
            edge.target_name = callee;
        }
        out.push_back(edge);
    };

    const char *func_type = ts_node_type(func_node);
    if (strcmp(func_type, "identifier") == 0) {
        std::string name = node_text(func_node);
        if (name == "__import__") {
            add_dynamic_import(name);
        } else {
            if (name == "eval" || name == "exec") {
                edge.hint = DispatchHint::Dynamic;
            }
            edge.target_name = name;
            out.push_back(edge);
        }
    } else if (strcmp(func_type, "attribute") == 0) {
        std::string name = node_text(func_node);
        if (name == "importlib.import_module") {
            add_dynamic_import(name);
        } else {
            edge.target_name = name;
            TSNode attr = field(func_node, "attribute");
            if (!ts_node_is_null(attr)) {
                edge.target_key = node_text(attr);
            }
            out.push_back(edge);
        }
    } else if (strcmp(func_type, "call") == 0) {
        // getattr(obj, "name")(...) or factory()(...)
        edge.hint = DispatchHint::Dynamic;
        edge.target_name = node_text(func_node);
        TSNode inner = field(func_node, "function");
        if (!ts_node_is_null(inner) && node_text(inner) == "getattr") {
            TSNode inner_args = field(func_node, "arguments");
            if (!ts_node_is_null(inner_args) && ts_node_named_child_count(inner_args) >= 2) {
                if (auto attr = string_literal(ts_node_named_child(inner_args, 1))) {
                    edge.target_name = *attr;
                }
            }
        }
        out.push_back(edge);
    } else if (strcmp(func_type, "subscript") == 0) {
        // table["name"](...)
        edge.hint = DispatchHint::Dynamic;
        edge.target_name = node_text(func_node);
        if (auto key = string_literal(field(func_node, "subscript"))) {
            edge.target_name = *key;
        }
        out.push_back(edge);
    } else {
        edge.hint = DispatchHint::Dynamic;
        edge.target_name = node_text(func_node);
        out.push_back(edge);
    }

    add_argument_references(arguments, out);
}

void LanguageParser::add_import_python(TSNode node, TSNode scope,
                                       std::vector<EdgeDraft> &out) const {
    DispatchHint hint = branch_hint(node, scope);
    auto push = [&](const std::string &module, TSNode at) {
        if (module.empty())
            return;
        EdgeDraft edge;
        edge.kind = RelationKind::Import;
        edge.hint = hint;
        edge.target_name = module;
        edge.target_key = last_dotted_segment(module);
        edge.line = line_of(at);
        out.push_back(edge);
    };
    auto imported_name = [&](TSNode child) -> std::string {
        if (is_type(child, "dotted_name"))
            return node_text(child);
        if (is_type(child, "aliased_import")) {
            TSNode name = field(child, "name");
            if (!ts_node_is_null(name))
                return node_text(name);
        }
        return "";
    };

    if (is_type(node, "import_statement")) {
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            push(imported_name(child), child);
        }
        return;
    }

    // from <module> import <names>
    TSNode module_node = field(node, "module_name");
    std::string module;
    if (!ts_node_is_null(module_node)) {
        module = node_text(module_node);
        module.erase(0, module.find_first_not_of('.'));
        if (module.find_first_not_of('.') == std::string::npos) {
            module.clear();
        }
    }
    if (!module.empty()) {
        push(module, node);
        return;
    }

    // from . import a, b: the names are sibling modules
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (!ts_node_is_null(module_node) && ts_node_eq(child, module_node))
            continue;
        push(imported_name(child), child);
    }
}

void LanguageParser::add_decorators(const FunctionDef &func, std::vector<EdgeDraft> &out) const {
    TSNode parent = ts_node_parent(func.node);
    if (ts_node_is_null(parent) || !is_type(parent, "decorated_definition"))
        return;

    uint32_t count = ts_node_named_child_count(parent);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode decorator = ts_node_named_child(parent, i);
        if (!is_type(decorator, "decorator") || ts_node_named_child_count(decorator) == 0)
            continue;

        TSNode expr = ts_node_named_child(decorator, 0);
        if (is_type(expr, "call")) {
            TSNode callee = field(expr, "function");
            if (!ts_node_is_null(callee))
                expr = callee;
        }

        EdgeDraft edge;
        edge.kind = RelationKind::Compose;
        edge.hint = DispatchHint::Direct;
        edge.target_name = node_text(expr);
        edge.line = line_of(decorator);
        out.push_back(edge);
    }
}

void LanguageParser::add_argument_references(TSNode arguments,
                                             std::vector<EdgeDraft> &out) const {
    if (ts_node_is_null(arguments))
        return;

    auto push = [&](TSNode name_node) {
        EdgeDraft edge;
        edge.kind = RelationKind::Compose;
        edge.hint = DispatchHint::Dynamic;
        edge.speculative = true;
        edge.target_name = node_text(name_node);
        edge.line = line_of(name_node);
        out.push_back(edge);
    };

    uint32_t count = ts_node_named_child_count(arguments);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode arg = ts_node_named_child(arguments, i);
        if (is_type(arg, "identifier")) {
            push(arg);
        } else if (is_type(arg, "keyword_argument")) {
            TSNode value = field(arg, "value");
            if (!ts_node_is_null(value) && is_type(value, "identifier"))
                push(value);
        } else if (is_type(arg, "pointer_expression")) {
            // &callback
            TSNode target = field(arg, "argument");
            if (!ts_node_is_null(target) && is_type(target, "identifier"))
                push(target);
        }
    }
}

// ============ C / C++ Implementation ============

uint32_t LanguageParser::c_arity(TSNode params, std::vector<std::string> &types) const {
    uint32_t arity = 0;
    if (ts_node_is_null(params))
        return arity;

    uint32_t param_count = ts_node_named_child_count(params);
    for (uint32_t i = 0; i < param_count; ++i) {
        TSNode param = ts_node_named_child(params, i);
        const char *param_type_str = ts_node_type(param);

        if (strcmp(param_type_str, "parameter_declaration") == 0 ||
            strcmp(param_type_str, "optional_parameter_declaration") == 0 ||
            strcmp(param_type_str, "variadic_parameter_declaration") == 0) {
            std::string type;
            TSNode type_node = field(param, "type");
            if (!ts_node_is_null(type_node)) {
                type = node_text(type_node);
            }
            TSNode declarator = field(param, "declarator");

            // f(void) takes no arguments
            if (param_count == 1 && type == "void" && ts_node_is_null(declarator)) {
                return 0;
            }

            if (!ts_node_is_null(declarator)) {
                if (is_type(declarator, "pointer_declarator") ||
                    is_type(declarator, "abstract_pointer_declarator")) {
                    type += "*";
                } else if (is_type(declarator, "reference_declarator") ||
                           is_type(declarator, "abstract_reference_declarator")) {
                    type += "&";
                }
            }
            types.push_back(type);
            ++arity;
        }
    }
    return arity;
}

std::vector<FunctionDef> LanguageParser::extract_functions_c() const {
    std::vector<FunctionDef> functions;
    if (!tree_)
        return functions;

    visit_nodes(root(), [&](TSNode node) {
        if (!is_type(node, "function_definition"))
            return true;

        FunctionDef func;

        // Get declarator which contains function name and parameters
        TSNode func_decl = field(node, "declarator");
        while (!ts_node_is_null(func_decl) && is_type(func_decl, "pointer_declarator")) {
            func_decl = field(func_decl, "declarator");
        }

        if (!ts_node_is_null(func_decl) && is_type(func_decl, "function_declarator")) {
            TSNode name_decl = field(func_decl, "declarator");
            if (!ts_node_is_null(name_decl)) {
                func.name = node_text(name_decl);
            }
            func.arity = c_arity(field(func_decl, "parameters"), func.param_types);
        }

        if (!func.name.empty()) {
            func.qualified_name = func.name;
            func.start_line = line_of(node);
            func.end_line = ts_node_end_point(node).row + 1;
            func.node = node;
            functions.push_back(func);
        }
        return true;
    });

    return functions;
}

std::vector<FunctionDef> LanguageParser::extract_functions_cpp() const {
    std::vector<FunctionDef> functions;
    if (!tree_)
        return functions;

    // Track namespace and class context
    struct Context {
        std::string name;
        bool is_class;
        uint32_t end_byte;
    };
    std::vector<Context> context_stack;

    visit_nodes(root(), [&](TSNode node) {
        const char *type = ts_node_type(node);
        uint32_t start_byte = ts_node_start_byte(node);

        // Pop contexts that we've exited
        while (!context_stack.empty() && start_byte >= context_stack.back().end_byte) {
            context_stack.pop_back();
        }

        if (strcmp(type, "namespace_definition") == 0) {
            TSNode name_node = field(node, "name");
            if (!ts_node_is_null(name_node)) {
                context_stack.push_back({node_text(name_node), false, ts_node_end_byte(node)});
            }
        } else if (strcmp(type, "class_specifier") == 0 || strcmp(type, "struct_specifier") == 0) {
            TSNode name_node = field(node, "name");
            if (!ts_node_is_null(name_node)) {
                context_stack.push_back({node_text(name_node), true, ts_node_end_byte(node)});
            }
        } else if (strcmp(type, "function_definition") == 0) {
            FunctionDef func;

            // Handle reference/pointer declarators
            TSNode func_decl = field(node, "declarator");
            while (!ts_node_is_null(func_decl) && (is_type(func_decl, "pointer_declarator") ||
                                                   is_type(func_decl, "reference_declarator"))) {
                func_decl = field(func_decl, "declarator");
            }

            if (!ts_node_is_null(func_decl) && is_type(func_decl, "function_declarator")) {
                TSNode name_decl = field(func_decl, "declarator");
                if (!ts_node_is_null(name_decl)) {
                    func.name = node_text(name_decl);
                }
                func.arity = c_arity(field(func_decl, "parameters"), func.param_types);
            }

            if (!func.name.empty()) {
                // Build qualified name from context stack
                std::string prefix;
                for (const auto &ctx : context_stack) {
                    prefix += ctx.name + "::";
                    if (ctx.is_class) {
                        func.containing_class = ctx.name;
                    }
                }

                size_t sep = func.name.rfind("::");
                if (sep == std::string::npos) {
                    func.qualified_name = prefix + func.name;
                } else {
                    // Out-of-line member definition (Class::method)
                    func.qualified_name = func.name;
                    func.containing_class = resolution_key(func.name.substr(0, sep));
                }

                func.start_line = line_of(node);
                func.end_line = ts_node_end_point(node).row + 1;
                func.node = node;
                functions.push_back(func);
            }
        }
        return true;
    });

    return functions;
}

void LanguageParser::add_call_c_family(TSNode call, TSNode scope,
                                       std::vector<EdgeDraft> &out) const {
    EdgeDraft edge;
    edge.kind = RelationKind::Call;
    edge.hint = branch_hint(call, scope);
    edge.line = line_of(call);

    // Constructor calls (new expressions)
    if (is_type(call, "new_expression")) {
        TSNode type_node = field(call, "type");
        if (ts_node_is_null(type_node))
            return;
        edge.target_name = node_text(type_node);
        edge.arg_count = argument_count(field(call, "arguments"));
        out.push_back(edge);
        return;
    }

    TSNode func_node = field(call, "function");
    if (ts_node_is_null(func_node))
        return;
    TSNode arguments = field(call, "arguments");
    edge.arg_count = argument_count(arguments);

    const char *func_type = ts_node_type(func_node);
    if (strcmp(func_type, "identifier") == 0) {
        edge.target_name = node_text(func_node);

        // dlsym(handle, "name") / GetProcAddress(module, "name")
        if ((edge.target_name == "dlsym" || edge.target_name == "GetProcAddress") &&
            !ts_node_is_null(arguments) && ts_node_named_child_count(arguments) >= 2) {
            if (auto symbol = string_literal(ts_node_named_child(arguments, 1))) {
                EdgeDraft lookup = edge;
                lookup.hint = DispatchHint::Dynamic;
                lookup.target_name = *symbol;
                lookup.target_key = *symbol;
                lookup.arg_count = -1;
                out.push_back(lookup);
            }
        }
    } else if (strcmp(func_type, "qualified_identifier") == 0 ||
               strcmp(func_type, "scoped_identifier") == 0) {
        edge.target_name = node_text(func_node);
    } else if (strcmp(func_type, "field_expression") == 0) {
        // obj.method() / obj->method(); in C the member is a function pointer
        edge.target_name = node_text(func_node);
        TSNode member = field(func_node, "field");
        if (!ts_node_is_null(member)) {
            edge.target_key = resolution_key(node_text(member));
        }
        if (language_ == Language::C) {
            edge.hint = DispatchHint::Dynamic;
        }
    } else if (strcmp(func_type, "template_function") == 0) {
        edge.target_name = node_text(func_node);
        TSNode name = field(func_node, "name");
        if (!ts_node_is_null(name)) {
            edge.target_key = resolution_key(node_text(name));
        }
    } else {
        // (*fp)(), table[i](), make_handler()()
        edge.hint = DispatchHint::Dynamic;
        edge.target_name = node_text(func_node);
    }

    out.push_back(edge);
    add_argument_references(arguments, out);
}

void LanguageParser::add_include(TSNode node, TSNode scope, std::vector<EdgeDraft> &out) const {
    TSNode path_node = field(node, "path");
    if (ts_node_is_null(path_node))
        return;

    std::string path = node_text(path_node);
    if (path.size() >= 2 && (path.front() == '"' || path.front() == '<')) {
        path = path.substr(1, path.size() - 2);
    }
    if (path.empty())
        return;

    EdgeDraft edge;
    edge.kind = RelationKind::Import;
    edge.hint = branch_hint(node, scope);
    edge.target_name = path;
    size_t slash = path.rfind('/');
    edge.target_key = slash == std::string::npos ? path : path.substr(slash + 1);
    edge.line = line_of(node);
    out.push_back(edge);
}

std::unique_ptr<LanguageParser> create_parser(Language lang) {
    if (lang == Language::Unknown) {
        return nullptr;
    }
    return std::make_unique<LanguageParser>(lang);
}

// ============ Scanner ============

ScanResult TreeSitterScanner::scan(const std::string &path, const std::string &content) const {
    Language lang = language_from_extension(std::filesystem::path(path).extension().string());

    ScanResult failed;
    failed.language = lang;
    if (lang != Language::Python && lang != Language::C && lang != Language::Cpp) {
        failed.error = "no syntax tree grammar for " + path;
        return failed;
    }
    if (content.find('\0') != std::string::npos) {
        failed.error = "binary content";
        return failed;
    }

    std::unique_ptr<LanguageParser> parser;
    try {
        parser = create_parser(lang);
    } catch (const std::runtime_error &e) {
        failed.error = e.what();
        return failed;
    }
    if (!parser->parse(content)) {
        failed.error = "parser produced no tree";
        return failed;
    }
    if (auto line = parser->syntax_error_line()) {
        failed.error = "syntax error at line " + std::to_string(*line);
        return failed;
    }

    DraftCollector drafts(path, lang);
    for (auto &edge : parser->extract_module_references()) {
        drafts.add_edge(drafts.module_symbol(), std::move(edge));
    }

    for (const auto &func : parser->extract_functions()) {
        SymbolDraft symbol;
        symbol.name = func.qualified_name;
        symbol.short_name = resolution_key(func.name);
        symbol.kind = SymbolKind::Function;
        symbol.param_types = func.param_types;
        symbol.arity = func.arity;
        symbol.line = func.start_line;

        size_t index = drafts.add_symbol(std::move(symbol));
        for (auto &edge : parser->extract_references(func)) {
            drafts.add_edge(index, std::move(edge));
        }
    }

    return drafts.take();
}

std::vector<Language> TreeSitterScanner::languages() const {
    return {Language::Python, Language::C, Language::Cpp};
}

} // namespace depmap
