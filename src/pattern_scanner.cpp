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

#include "depmap/pattern_scanner.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <regex>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace depmap {

namespace {

constexpr size_t npos = std::string::npos;

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

std::string trim(const std::string &text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == npos)
        return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

bool is_identifier(const std::string &text) {
    if (text.empty() || !is_ident_start(text[0]))
        return false;
    return std::all_of(text.begin(), text.end(), is_ident_char);
}

bool is_keyword(const std::string &word) {
    static const std::unordered_set<std::string> kKeywords = {
        "if",       "else",     "for",        "while",   "do",        "switch",    "case",
        "default",  "catch",    "try",        "finally", "return",    "throw",     "new",
        "delete",   "typeof",   "instanceof", "void",    "in",        "of",        "function",
        "func",     "fn",       "class",      "struct",  "interface", "enum",      "impl",
        "trait",    "match",    "loop",       "select",  "go",        "defer",     "yield",
        "await",    "async",    "import",     "export",  "super",     "this",      "self",
        "sizeof",   "let",      "const",      "var",     "static",    "public",    "private",
        "protected", "where",   "as",         "use",     "mod",       "package",   "extends",
        "implements", "throws", "synchronized", "assert", "break",    "continue",  "goto",
    };
    return kKeywords.count(word) > 0;
}

// Values that are never function references
bool is_literal_word(const std::string &word) {
    static const std::unordered_set<std::string> kLiterals = {
        "true", "false", "null", "nil", "undefined", "None", "this", "self", "Self", "super",
    };
    return kLiterals.count(word) > 0;
}

// Words before a name that make a Java match a statement, not a declaration
bool is_statement_word(const std::string &word) {
    static const std::unordered_set<std::string> kWords = {
        "return", "new", "throw", "else", "case", "yield", "await", "assert", "package", "import",
    };
    return kWords.count(word) > 0;
}

// Offsets into the original text are preserved: comments and string
// contents are replaced by spaces in masked(), newlines are kept.
class SourceText {
public:
    SourceText(const std::string &original, Language lang) : original_(original), lang_(lang) {
        for (size_t i = 0; i < original_.size(); ++i) {
            if (original_[i] == '\n')
                line_starts_.push_back(i + 1);
        }
        if (mask()) {
            match_braces();
        }
    }

    bool ok() const { return error_.empty(); }
    const std::string &error() const { return error_; }
    const std::string &original() const { return original_; }
    const std::string &masked() const { return masked_; }
    size_t size() const { return masked_.size(); }

    uint32_t line_at(size_t pos) const {
        auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), pos);
        return static_cast<uint32_t>(it - line_starts_.begin());
    }

    size_t line_count() const { return line_starts_.size(); }
    size_t line_start(size_t line) const { return line_starts_[line]; }
    size_t line_end(size_t line) const {
        if (line + 1 < line_starts_.size())
            return line_starts_[line + 1] - 1;
        return masked_.size();
    }

    size_t close_of(size_t open) const {
        auto it = close_.find(open);
        return it == close_.end() ? npos : it->second;
    }

    size_t parent_brace(size_t open) const {
        auto it = parent_.find(open);
        return it == parent_.end() ? npos : it->second;
    }

    // Innermost '{' whose block contains pos
    size_t innermost_brace(size_t pos) const {
        auto it = std::lower_bound(opens_.begin(), opens_.end(), pos);
        if (it == opens_.begin())
            return npos;
        size_t brace = *(it - 1);
        while (brace != npos && close_of(brace) < pos) {
            brace = parent_brace(brace);
        }
        return brace;
    }

    size_t match_paren(size_t open) const {
        int depth = 0;
        for (size_t i = open; i < masked_.size(); ++i) {
            if (masked_[i] == '(') {
                ++depth;
            } else if (masked_[i] == ')') {
                if (--depth == 0)
                    return i;
            }
        }
        return npos;
    }

    // Contents of the string literal whose opening quote is at pos
    std::optional<std::string> literal_at(size_t pos) const {
        if (pos >= original_.size())
            return std::nullopt;
        char quote = original_[pos];
        if (quote != '"' && quote != '\'' && quote != '`')
            return std::nullopt;
        std::string value;
        for (size_t i = pos + 1; i < original_.size(); ++i) {
            char c = original_[i];
            if (c == '\\' && i + 1 < original_.size()) {
                value += original_[++i];
                continue;
            }
            if (c == quote)
                return value;
            value += c;
        }
        return std::nullopt;
    }

private:
    std::string original_;
    std::string masked_;
    Language lang_;
    std::string error_;
    std::vector<size_t> line_starts_{0};
    std::vector<size_t> opens_;
    std::unordered_map<size_t, size_t> close_;
    std::unordered_map<size_t, size_t> parent_;

    bool fail(const std::string &what, size_t pos) {
        error_ = what + " at line " + std::to_string(line_at(pos));
        return false;
    }

    void blank(size_t from, size_t to) {
        for (size_t k = from; k < to && k < masked_.size(); ++k) {
            if (masked_[k] != '\n')
                masked_[k] = ' ';
        }
    }

    bool mask() {
        masked_ = original_;
        const size_t n = original_.size();
        size_t i = 0;

        while (i < n) {
            char c = original_[i];
            char next = i + 1 < n ? original_[i + 1] : '\0';

            if (c == '/' && next == '/') {
                size_t end = original_.find('\n', i);
                if (end == npos)
                    end = n;
                blank(i, end);
                i = end;
                continue;
            }
            if (c == '/' && next == '*') {
                size_t end = original_.find("*/", i + 2);
                if (end == npos)
                    return fail("unterminated comment", i);
                blank(i, end + 2);
                i = end + 2;
                continue;
            }
            if (lang_ == Language::Java && original_.compare(i, 3, "\"\"\"") == 0) {
                size_t end = original_.find("\"\"\"", i + 3);
                if (end == npos)
                    return fail("unterminated text block", i);
                blank(i + 3, end);
                i = end + 3;
                continue;
            }
            if (lang_ == Language::Rust && c == 'r' && (next == '"' || next == '#') &&
                (i == 0 || !is_ident_char(original_[i - 1]))) {
                size_t j = i + 1;
                size_t hashes = 0;
                while (j < n && original_[j] == '#') {
                    ++hashes;
                    ++j;
                }
                if (j < n && original_[j] == '"') {
                    std::string closing = "\"" + std::string(hashes, '#');
                    size_t end = original_.find(closing, j + 1);
                    if (end == npos)
                        return fail("unterminated raw string", i);
                    blank(j + 1, end);
                    i = end + closing.size();
                    continue;
                }
            }

            bool quote = c == '"';
            if (c == '\'') {
                // Rust: 'a' and '\n' are chars, 'a alone is a lifetime
                quote = lang_ != Language::Rust || next == '\\' ||
                        (i + 2 < n && original_[i + 2] == '\'');
            }
            if (c == '`') {
                quote = lang_ == Language::JavaScript || lang_ == Language::TypeScript ||
                        lang_ == Language::Go;
            }

            if (quote) {
                bool multiline = c == '`' || lang_ == Language::Rust;
                bool raw = c == '`' && lang_ == Language::Go;
                size_t j = i + 1;
                while (j < n) {
                    char d = original_[j];
                    if (d == '\\' && !raw) {
                        j += 2;
                        continue;
                    }
                    if (d == c)
                        break;
                    if (d == '\n' && !multiline)
                        return fail("unterminated string literal", i);
                    ++j;
                }
                if (j >= n)
                    return fail("unterminated string literal", i);
                blank(i + 1, j);
                i = j + 1;
                continue;
            }
            ++i;
        }
        return true;
    }

    bool match_braces() {
        std::vector<size_t> stack;
        for (size_t i = 0; i < masked_.size(); ++i) {
            if (masked_[i] == '{') {
                stack.push_back(i);
            } else if (masked_[i] == '}') {
                if (stack.empty())
                    return fail("unbalanced braces", i);
                size_t open = stack.back();
                stack.pop_back();
                close_[open] = i;
                parent_[open] = stack.empty() ? npos : stack.back();
                opens_.push_back(open);
            }
        }
        if (!stack.empty())
            return fail("unbalanced braces", stack.back());
        std::sort(opens_.begin(), opens_.end());
        return true;
    }
};

struct LanguagePatterns {
    std::regex function;           // Declaration pattern
    std::vector<int> name_groups;  // Last matched one holds the name
    int receiver_group = -1;       // Go method receiver
    std::optional<std::regex> container;
    bool container_header = false; // Name comes from the text before '{'
    std::optional<std::regex> member; // Methods declared directly in a class body
    std::string separator = ".";
    char required = '\0'; // Lines without this character cannot match
};

const char *kJsMember =
    R"(^[ \t]*(?:(?:public|private|protected|static|async|readonly|override|get|set)[ \t]+)*(\w+)[ \t]*\()";

const LanguagePatterns *patterns_for(Language lang) {
    static const LanguagePatterns javascript{
        std::regex(
            R"((?:function\s+(\w+)|(?:const|let|var)\s+(\w+)\s*=\s*(?:async\s+)?(?:function|\([^)]*\)\s*=>)))"),
        {1, 2},
        -1,
        std::regex(R"(\bclass\s+(\w+))"),
        false,
        std::regex(kJsMember),
        "."};
    static const LanguagePatterns typescript{
        std::regex(
            R"((?:function\s+(\w+)|(?:const|let|var)\s+(\w+)\s*(?::\s*\w+)?\s*=\s*(?:async\s+)?(?:function|\([^)]*\)\s*=>)))"),
        {1, 2},
        -1,
        std::regex(R"(\b(?:class|interface)\s+(\w+))"),
        false,
        std::regex(kJsMember),
        "."};
    static const LanguagePatterns rust{std::regex(R"((?:pub\s+)?(?:async\s+)?fn\s+(\w+))"),
                                       {1},
                                       -1,
                                       std::regex(R"(\b(?:impl|trait)\b)"),
                                       true,
                                       std::nullopt,
                                       "::"};
    static const LanguagePatterns go{std::regex(R"(func\s+(\([^)]+\)\s+)?(\w+))"),
                                     {2},
                                     1,
                                     std::nullopt,
                                     false,
                                     std::nullopt,
                                     "."};
    static const LanguagePatterns java{
        std::regex(
            R"((?:public|private|protected)?\s*(?:static\s+)?((?:[\w<>\[\].?]+\s+){1,6})(\w+)\s*\()"),
        {2},
        -1,
        std::regex(R"(\b(?:class|interface|enum|record)\s+(\w+))"),
        false,
        std::nullopt,
        ".",
        '('};

    switch (lang) {
    case Language::JavaScript:
        return &javascript;
    case Language::TypeScript:
        return &typescript;
    case Language::Rust:
        return &rust;
    case Language::Go:
        return &go;
    case Language::Java:
        return &java;
    default:
        return nullptr;
    }
}

// Runs re over each line of the masked text. A line lacking required (when
// set) is skipped without invoking the regex engine.
template <typename Fn>
void for_each_match(const SourceText &src, const std::regex &re, char required, Fn &&fn) {
    for (size_t line = 0; line < src.line_count(); ++line) {
        size_t begin = src.line_start(line);
        size_t end = src.line_end(line);
        if (end <= begin)
            continue;
        if (required != '\0' &&
            src.masked().find(required, begin) >= end)
            continue;
        std::string text = src.masked().substr(begin, end - begin);
        for (std::sregex_iterator it(text.begin(), text.end(), re), last; it != last; ++it) {
            fn(*it, begin);
        }
    }
}

template <typename Fn> void for_each_match(const SourceText &src, const std::regex &re, Fn &&fn) {
    for_each_match(src, re, '\0', std::forward<Fn>(fn));
}

struct Container {
    std::string name;
    size_t open = 0;
    size_t close = 0;
};

struct Declaration {
    std::string name;
    std::string qualified_name;
    size_t name_pos = 0;
    size_t body_begin = 0;
    size_t body_end = 0;
    size_t stop_brace = npos; // Branch checks end at this block
    std::vector<std::string> param_types;
    uint32_t arity = 0;
    size_t symbol = 0;
};

// Name of the type an impl/trait header applies to
std::string rust_container_name(std::string header) {
    std::string stripped;
    int depth = 0;
    for (char c : header) {
        if (c == '<') {
            ++depth;
        } else if (c == '>' && depth > 0) {
            --depth;
        } else if (depth == 0) {
            stripped += c;
        }
    }
    size_t where = stripped.find(" where ");
    if (where != npos)
        stripped = stripped.substr(0, where);
    size_t for_pos = stripped.rfind(" for ");
    if (for_pos != npos)
        stripped = stripped.substr(for_pos + 5);
    stripped = trim(stripped);
    size_t sep = stripped.rfind("::");
    if (sep != npos)
        stripped = stripped.substr(sep + 2);

    size_t start = 0;
    while (start < stripped.size() && !is_ident_start(stripped[start]))
        ++start;
    size_t end = start;
    while (end < stripped.size() && is_ident_char(stripped[end]))
        ++end;
    return stripped.substr(start, end - start);
}

std::string go_receiver_type(const std::string &receiver) {
    std::string inner = receiver;
    size_t bracket = inner.find('[');
    if (bracket != npos)
        inner = inner.substr(0, bracket);
    size_t end = inner.find_last_of(")");
    if (end != npos)
        inner = inner.substr(0, end);
    size_t stop = inner.size();
    while (stop > 0 && !is_ident_char(inner[stop - 1]))
        --stop;
    size_t start = stop;
    while (start > 0 && is_ident_char(inner[start - 1]))
        --start;
    return inner.substr(start, stop - start);
}

// Splits masked text between two offsets on top-level commas
std::vector<std::string> split_arguments(const std::string &masked, size_t open, size_t close,
                                         bool angle_brackets) {
    std::vector<std::string> parts;
    std::string current;
    int depth = 0;
    for (size_t i = open + 1; i < close; ++i) {
        char c = masked[i];
        char prev = i > 0 ? masked[i - 1] : '\0';
        if (c == '(' || c == '[' || c == '{' || (angle_brackets && c == '<')) {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}' ||
                   (angle_brackets && c == '>' && prev != '=' && prev != '-')) {
            --depth;
        } else if (c == ',' && depth == 0) {
            parts.push_back(trim(current));
            current.clear();
            continue;
        }
        current += c;
    }
    std::string last = trim(current);
    if (!last.empty() || !parts.empty())
        parts.push_back(last);
    parts.erase(std::remove(parts.begin(), parts.end(), std::string()), parts.end());
    return parts;
}

std::string parameter_type(const std::string &param, Language lang) {
    switch (lang) {
    case Language::TypeScript:
    case Language::Rust: {
        size_t colon = param.find(':');
        return colon == npos ? "" : trim(param.substr(colon + 1));
    }
    case Language::Java: {
        size_t space = param.find_last_of(" \t");
        return space == npos ? "" : trim(param.substr(0, space));
    }
    case Language::Go: {
        size_t space = param.find_first_of(" \t");
        return space == npos ? "" : trim(param.substr(space + 1));
    }
    default:
        return "";
    }
}

std::string first_word(const std::string &text, size_t *end_out = nullptr) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == npos)
        return "";
    size_t end = start;
    while (end < text.size() && is_ident_char(text[end]))
        ++end;
    if (end_out)
        *end_out = end;
    return text.substr(start, end - start);
}

std::string previous_word(const std::string &masked, size_t pos) {
    size_t end = pos;
    while (end > 0 && std::isspace(static_cast<unsigned char>(masked[end - 1])))
        --end;
    size_t start = end;
    while (start > 0 && is_ident_char(masked[start - 1]))
        --start;
    return masked.substr(start, end - start);
}

class FileScan {
public:
    FileScan(const SourceText &src, const LanguagePatterns &patterns, Language lang,
             DraftCollector &drafts)
        : src_(src), masked_(src.masked()), patterns_(patterns), lang_(lang), drafts_(drafts) {}

    void run() {
        find_containers();
        find_declarations();
        for (auto &decl : declarations_) {
            SymbolDraft symbol;
            symbol.name = decl.qualified_name;
            symbol.short_name = decl.name;
            symbol.kind = SymbolKind::Function;
            symbol.param_types = decl.param_types;
            symbol.arity = decl.arity;
            symbol.line = src_.line_at(decl.name_pos);
            decl.symbol = drafts_.add_symbol(std::move(symbol));
        }
        find_calls();
        find_dynamic_lookups();
        find_imports();
    }

private:
    const SourceText &src_;
    const std::string &masked_;
    const LanguagePatterns &patterns_;
    Language lang_;
    DraftCollector &drafts_;

    std::vector<Container> containers_;
    std::unordered_map<size_t, size_t> container_by_open_;
    std::vector<Declaration> declarations_;
    std::unordered_set<size_t> declared_names_;

    bool angle_brackets() const {
        return lang_ == Language::Java || lang_ == Language::TypeScript ||
               lang_ == Language::Rust;
    }

    bool in_container_body(size_t pos) const {
        size_t brace = src_.innermost_brace(pos);
        return brace != npos && container_by_open_.count(brace) > 0;
    }

    // Scans back from pos to the start of its statement
    size_t statement_start(size_t pos) const {
        int depth = 0;
        size_t i = pos;
        while (i > 0) {
            char c = masked_[i - 1];
            if (c == ')') {
                ++depth;
            } else if (c == '(') {
                --depth;
            } else if (c == '{' || c == '}') {
                return i;
            } else if (c == ';' && depth >= 0) {
                return i;
            }
            --i;
        }
        return 0;
    }

    // pos sits in a brace-less branch body or a ternary arm
    bool statement_is_conditional(size_t pos) const {
        size_t start = statement_start(pos);
        std::string prefix = masked_.substr(start, pos - start);

        size_t word_end = 0;
        std::string word = first_word(prefix, &word_end);
        if (word == "else" || word == "case" || word == "default")
            return true;

        if (word == "if" || word == "switch" || word == "match" || word == "select") {
            size_t kw_end = start + word_end;
            size_t j = kw_end;
            while (j < masked_.size() && std::isspace(static_cast<unsigned char>(masked_[j])))
                ++j;
            size_t condition_end = npos;
            if (j < masked_.size() && masked_[j] == '(' && lang_ != Language::Go &&
                lang_ != Language::Rust) {
                condition_end = src_.match_paren(j);
            } else {
                condition_end = masked_.find('{', kw_end);
            }
            return condition_end == npos || pos > condition_end;
        }

        if (lang_ != Language::Rust && lang_ != Language::Go) {
            for (size_t i = 0; i < prefix.size(); ++i) {
                if (prefix[i] != '?')
                    continue;
                char next = i + 1 < prefix.size() ? prefix[i + 1] : '\0';
                char prev = i > 0 ? prefix[i - 1] : '\0';
                if (next != '.' && next != '?' && prev != '?')
                    return true;
            }
        }
        return false;
    }

    bool block_is_branch(size_t open) const {
        size_t start = statement_start(open);
        std::string word = first_word(masked_.substr(start, open - start));
        return word == "if" || word == "else" || word == "switch" || word == "case" ||
               word == "default" || word == "catch" || word == "match" || word == "select";
    }

    DispatchHint branch_hint(size_t pos, size_t stop_brace) const {
        if (statement_is_conditional(pos))
            return DispatchHint::Conditional;
        size_t brace = src_.innermost_brace(pos);
        while (brace != npos && brace != stop_brace) {
            if (block_is_branch(brace))
                return DispatchHint::Conditional;
            brace = src_.parent_brace(brace);
        }
        return DispatchHint::Direct;
    }

    const Declaration *owner_of(size_t pos) const {
        const Declaration *best = nullptr;
        for (const auto &decl : declarations_) {
            if (pos >= decl.body_begin && pos < decl.body_end &&
                (!best || decl.body_begin > best->body_begin)) {
                best = &decl;
            }
        }
        return best;
    }

    void add_reference(size_t pos, EdgeDraft edge) {
        const Declaration *owner = owner_of(pos);
        size_t stop = owner ? owner->stop_brace : npos;
        if (edge.hint == DispatchHint::Direct) {
            edge.hint = branch_hint(pos, stop);
        }
        edge.line = src_.line_at(pos);
        drafts_.add_edge(owner ? owner->symbol : drafts_.module_symbol(), std::move(edge));
    }

    void find_containers() {
        if (!patterns_.container)
            return;
        for_each_match(src_, *patterns_.container, [&](const std::smatch &m, size_t base) {
            size_t match_end = base + m.position(0) + m.length(0);
            size_t open = masked_.find_first_of("{;", match_end);
            if (open == npos || masked_[open] != '{')
                return;

            Container container;
            if (patterns_.container_header) {
                container.name = rust_container_name(masked_.substr(match_end, open - match_end));
            } else {
                container.name = m.str(1);
            }
            if (container.name.empty())
                return;
            container.open = open;
            container.close = src_.close_of(open);
            container_by_open_[open] = containers_.size();
            containers_.push_back(std::move(container));
        });
    }

    void add_declaration(const std::string &name, size_t name_pos, const std::string &receiver) {
        if (is_keyword(name) || declared_names_.count(name_pos))
            return;

        size_t name_end = name_pos + name.size();
        size_t open = masked_.find('(', name_end);
        if (open == npos)
            return;
        std::string between = masked_.substr(name_end, open - name_end);
        if (between.find_first_of(";{}") != npos)
            return;
        size_t close = src_.match_paren(open);
        if (close == npos)
            return;

        Declaration decl;
        size_t j = close + 1;
        bool found = false;
        while (j < masked_.size()) {
            char c = masked_[j];
            if (c == '{') {
                decl.body_begin = j;
                decl.body_end = src_.close_of(j);
                found = true;
                break;
            }
            if (c == ';' || c == '}')
                return;
            if (masked_.compare(j, 2, "=>") == 0) {
                j += 2;
                while (j < masked_.size() && (masked_[j] == ' ' || masked_[j] == '\t'))
                    ++j;
                if (j < masked_.size() && masked_[j] == '{')
                    continue;
                size_t end = masked_.find_first_of(";\n", j);
                decl.body_begin = j;
                decl.body_end = end == npos ? masked_.size() : end;
                found = true;
                break;
            }
            ++j;
        }
        if (!found || decl.body_end == npos)
            return;

        decl.stop_brace = masked_[decl.body_begin] == '{' ? decl.body_begin
                                                          : src_.innermost_brace(decl.body_begin);
        decl.name = name;
        decl.name_pos = name_pos;

        std::string prefix;
        for (const auto &container : containers_) {
            if (name_pos > container.open && name_pos < container.close) {
                prefix += container.name + patterns_.separator;
            }
        }
        if (!receiver.empty()) {
            prefix += receiver + patterns_.separator;
        }
        decl.qualified_name = prefix + name;

        auto params = split_arguments(masked_, open, close, angle_brackets());
        for (size_t i = 0; i < params.size(); ++i) {
            std::string param = params[i];
            if (lang_ == Language::Rust && i == 0 && param.find("self") != npos &&
                param.find(':') == npos) {
                continue;
            }
            decl.param_types.push_back(parameter_type(param, lang_));
        }
        decl.arity = static_cast<uint32_t>(decl.param_types.size());

        declared_names_.insert(name_pos);
        declarations_.push_back(std::move(decl));
    }

    void find_declarations() {
        for_each_match(src_, patterns_.function, patterns_.required, [&](const std::smatch &m, size_t base) {
            int group = -1;
            for (int g : patterns_.name_groups) {
                if (m[g].matched)
                    group = g;
            }
            if (group < 0)
                return;

            if (lang_ == Language::Java) {
                std::string words = m.str(1);
                size_t i = 0;
                while (i < words.size()) {
                    size_t end = 0;
                    std::string word = first_word(words.substr(i), &end);
                    if (word.empty())
                        break;
                    if (is_statement_word(word))
                        return;
                    i += end;
                }
            }

            std::string receiver;
            if (patterns_.receiver_group >= 0 && m[patterns_.receiver_group].matched) {
                receiver = go_receiver_type(m.str(patterns_.receiver_group));
            }
            add_declaration(m.str(group), base + m.position(group), receiver);
        });

        if (patterns_.member) {
            for_each_match(src_, *patterns_.member, [&](const std::smatch &m, size_t base) {
                size_t pos = base + m.position(1);
                if (in_container_body(pos)) {
                    add_declaration(m.str(1), pos, "");
                }
            });
        }

        std::sort(declarations_.begin(), declarations_.end(),
                  [](const Declaration &a, const Declaration &b) { return a.name_pos < b.name_pos; });
    }

    void add_argument_references(size_t open, size_t close) {
        for (const auto &arg : split_arguments(masked_, open, close, false)) {
            if (!is_identifier(arg) || is_keyword(arg) || is_literal_word(arg))
                continue;
            size_t pos = masked_.find(arg, open);
            EdgeDraft edge;
            edge.kind = RelationKind::Compose;
            edge.hint = DispatchHint::Dynamic;
            edge.speculative = true;
            edge.target_name = arg;
            add_reference(pos == npos ? open : pos, std::move(edge));
        }
    }

    void find_calls() {
        static const std::regex kCall(
            R"(([A-Za-z_$][\w$]*(?:\s*(?:\.|::|->|\?\.)\s*[A-Za-z_$][\w$]*)*)\s*(?:::\s*<[^<>()]*>\s*)?(\())");
        static const std::unordered_set<std::string> kDeclarators = {
            "struct", "enum", "union", "fn",        "func",  "function",
            "class",  "interface", "trait", "impl", "type",  "record",
        };

        for_each_match(src_, kCall, '(', [&](const std::smatch &m, size_t base) {
            std::string chain;
            for (char c : m.str(1)) {
                if (!std::isspace(static_cast<unsigned char>(c)))
                    chain += c;
            }
            size_t chain_pos = base + m.position(1);
            size_t paren = base + m.position(2);
            std::string callee = resolution_key(chain);
            bool single = callee == chain;

            if (callee.empty() || (single && is_keyword(callee)))
                return;
            size_t callee_pos = chain_pos + m.str(1).rfind(callee);
            if (declared_names_.count(callee_pos))
                return;
            if (single && (lang_ == Language::JavaScript || lang_ == Language::TypeScript) &&
                callee == "require")
                return;
            if (chain_pos > 0 && masked_[chain_pos - 1] == '@')
                return;
            if (chain_pos >= 2 && masked_.compare(chain_pos - 2, 2, "#[") == 0)
                return;
            std::string before = previous_word(masked_, chain_pos);
            if (kDeclarators.count(before))
                return;

            // Signatures directly in a class/interface body
            if (in_container_body(chain_pos)) {
                size_t start = statement_start(chain_pos);
                if (masked_.substr(start, chain_pos - start).find('=') == npos)
                    return;
            }

            size_t close = src_.match_paren(paren);
            if (close == npos)
                return;

            EdgeDraft edge;
            edge.kind = RelationKind::Call;
            edge.target_name = chain;
            edge.target_key = callee;
            edge.arg_count = static_cast<int>(split_arguments(masked_, paren, close, false).size());
            if ((single && callee == "eval") || (callee == "Function" && before == "new")) {
                edge.hint = DispatchHint::Dynamic;
            }
            add_reference(chain_pos, std::move(edge));
            add_argument_references(paren, close);
        });
    }

    void add_literal_lookup(size_t quote_pos, size_t at) {
        auto name = src_.literal_at(quote_pos);
        if (!name || name->empty())
            return;
        EdgeDraft edge;
        edge.kind = RelationKind::Call;
        edge.hint = DispatchHint::Dynamic;
        edge.target_name = *name;
        edge.target_key = resolution_key(*name);
        add_reference(at, std::move(edge));
    }

    void find_dynamic_lookups() {
        switch (lang_) {
        case Language::JavaScript:
        case Language::TypeScript: {
            // obj["name"](...) / handlers[key](...)
            static const std::regex kIndexCall(R"(([A-Za-z_$][\w$.]*)\s*\[([^\]]*)\]\s*\()");
            for_each_match(src_, kIndexCall, [&](const std::smatch &m, size_t base) {
                size_t at = base + m.position(0);
                size_t index_pos = base + m.position(2);
                std::string index = m.str(2);
                size_t quote = index.find_first_not_of(" \t");
                if (quote != npos && (index[quote] == '"' || index[quote] == '\'' ||
                                      index[quote] == '`')) {
                    add_literal_lookup(index_pos + quote, at);
                    return;
                }
                EdgeDraft edge;
                edge.kind = RelationKind::Call;
                edge.hint = DispatchHint::Dynamic;
                edge.target_name = m.str(1) + "[" + trim(index) + "]";
                edge.target_key = resolution_key(m.str(1));
                add_reference(at, std::move(edge));
            });
            break;
        }
        case Language::Go: {
            static const std::regex kReflect(R"(\bMethodByName\s*\(\s*("))");
            for_each_match(src_, kReflect, [&](const std::smatch &m, size_t base) {
                add_literal_lookup(base + m.position(1), base + m.position(0));
            });
            break;
        }
        case Language::Java: {
            static const std::regex kReflect(R"(\bget(?:Declared)?Method\s*\(\s*("))");
            for_each_match(src_, kReflect, [&](const std::smatch &m, size_t base) {
                add_literal_lookup(base + m.position(1), base + m.position(0));
            });
            break;
        }
        default:
            break;
        }
    }

    void add_import(size_t at, const std::string &target, const std::string &key,
                    DispatchHint hint = DispatchHint::Direct) {
        if (key.empty() || key == "." || key == "..")
            return;
        EdgeDraft edge;
        edge.kind = RelationKind::Import;
        edge.hint = hint;
        edge.target_name = target;
        edge.target_key = key;
        add_reference(at, std::move(edge));
    }

    static std::string script_module_key(const std::string &specifier) {
        std::vector<std::string> segments;
        size_t start = 0;
        while (start <= specifier.size()) {
            size_t slash = specifier.find('/', start);
            if (slash == npos)
                slash = specifier.size();
            std::string segment = specifier.substr(start, slash - start);
            if (!segment.empty() && segment != "." && segment != "..")
                segments.push_back(segment);
            start = slash + 1;
        }
        if (segments.empty())
            return "";

        std::string key = segments.back();
        for (const char *ext : {".js", ".jsx", ".mjs", ".cjs", ".ts", ".tsx"}) {
            std::string suffix(ext);
            if (key.size() > suffix.size() &&
                key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
                key = key.substr(0, key.size() - suffix.size());
                break;
            }
        }
        if (key == "index" && segments.size() > 1)
            key = segments[segments.size() - 2];
        return key;
    }

    void find_imports() {
        switch (lang_) {
        case Language::JavaScript:
        case Language::TypeScript: {
            static const std::regex kStatic(R"(\b(?:from|import)\s*(["'`]))");
            static const std::regex kRequire(R"(\brequire\s*\(\s*(["'`]))");
            static const std::regex kDynamic(R"(\bimport\s*\(\s*(["'`]))");
            auto add = [&](const std::smatch &m, size_t base, DispatchHint hint) {
                size_t quote = base + m.position(1);
                auto specifier = src_.literal_at(quote);
                if (specifier)
                    add_import(base + m.position(0), *specifier, script_module_key(*specifier),
                               hint);
            };
            for_each_match(src_, kStatic, [&](const std::smatch &m, size_t base) {
                add(m, base, DispatchHint::Direct);
            });
            for_each_match(src_, kRequire, [&](const std::smatch &m, size_t base) {
                add(m, base, DispatchHint::Direct);
            });
            for_each_match(src_, kDynamic, [&](const std::smatch &m, size_t base) {
                add(m, base, DispatchHint::Dynamic);
            });
            break;
        }
        case Language::Rust: {
            static const std::regex kMod(R"(\bmod\s+(\w+)\s*;)");
            static const std::regex kUse(R"(\buse\s+([\w:]+))");
            for_each_match(src_, kMod, [&](const std::smatch &m, size_t base) {
                add_import(base + m.position(0), m.str(1), m.str(1));
            });
            for_each_match(src_, kUse, [&](const std::smatch &m, size_t base) {
                std::string path = m.str(1);
                std::string key;
                size_t start = 0;
                while (start < path.size()) {
                    size_t sep = path.find("::", start);
                    std::string segment = path.substr(start, sep == npos ? npos : sep - start);
                    if (!segment.empty() && segment != "crate" && segment != "self" &&
                        segment != "super") {
                        key = segment;
                        break;
                    }
                    if (sep == npos)
                        break;
                    start = sep + 2;
                }
                add_import(base + m.position(0), path, key);
            });
            break;
        }
        case Language::Go: {
            static const std::regex kSingle(R"(\bimport\s+(?:[\w.]+\s+)?("))");
            static const std::regex kBlock(R"(\bimport\s*(\())");
            auto add_path = [&](size_t quote, size_t at) {
                auto path = src_.literal_at(quote);
                if (!path)
                    return;
                size_t slash = path->rfind('/');
                add_import(at, *path, slash == npos ? *path : path->substr(slash + 1));
            };
            for_each_match(src_, kSingle, [&](const std::smatch &m, size_t base) {
                add_path(base + m.position(1), base + m.position(0));
            });
            for_each_match(src_, kBlock, [&](const std::smatch &m, size_t base) {
                size_t open = base + m.position(1);
                size_t close = src_.match_paren(open);
                if (close == npos)
                    return;
                for (size_t i = open + 1; i < close; ++i) {
                    if (masked_[i] != '"')
                        continue;
                    add_path(i, i);
                    size_t end = masked_.find('"', i + 1);
                    if (end == npos || end > close)
                        break;
                    i = end;
                }
            });
            break;
        }
        case Language::Java: {
            static const std::regex kImport(R"(\bimport\s+(static\s+)?([\w.]+?)(?:\.\*)?\s*;)");
            for_each_match(src_, kImport, [&](const std::smatch &m, size_t base) {
                std::string path = m.str(2);
                std::string key = path;
                size_t dot = key.rfind('.');
                if (m[1].matched && dot != npos) {
                    // import static a.b.Type.member: the module is Type
                    key = key.substr(0, dot);
                    dot = key.rfind('.');
                }
                if (dot != npos)
                    key = key.substr(dot + 1);
                add_import(base + m.position(0), path, key);
            });
            break;
        }
        default:
            break;
        }
    }
};

} // namespace

ScanResult PatternScanner::scan(const std::string &path, const std::string &content) const {
    Language lang = language_from_extension(std::filesystem::path(path).extension().string());

    ScanResult failed;
    failed.language = lang;
    const LanguagePatterns *patterns = patterns_for(lang);
    if (!patterns) {
        failed.error = "no declaration patterns for " + path;
        return failed;
    }
    if (content.find('\0') != npos) {
        failed.error = "binary content";
        return failed;
    }

    SourceText src(content, lang);
    if (!src.ok()) {
        failed.error = src.error();
        return failed;
    }

    DraftCollector drafts(path, lang);
    FileScan(src, *patterns, lang, drafts).run();
    return drafts.take();
}

std::vector<Language> PatternScanner::languages() const {
    return {Language::JavaScript, Language::TypeScript, Language::Rust, Language::Go,
            Language::Java};
}

} // namespace depmap
