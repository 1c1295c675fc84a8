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
#include "test_support/scan_helpers.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <chrono>
#include <string>

using namespace depmap;
using namespace depmap::testing;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;

TEST(PatternScannerTest, JavaScriptDeclarationsCallsAndImports) {
    const char *source = R"(import { helper } from './util.js';
const lib = require("lodash");

function main(a, b) {
  helper(a);
  if (a) {
    render(b);
  }
  return a ? fallback() : 0;
}

const arrow = (x) => transform(x);

class Greeter {
  greet(name) {
    return format(name);
  }
}
)";
    auto result = PatternScanner().scan("src/app.js", source);
    ASSERT_TRUE(result.ok()) << *result.error;
    EXPECT_EQ(result.language, Language::JavaScript);
    EXPECT_THAT(symbol_names(result), ElementsAre("<module>", "main", "arrow", "Greeter.greet"));

    EXPECT_EQ(result.symbols[0].kind, SymbolKind::Module);
    EXPECT_EQ(result.symbols[0].short_name, "app");
    EXPECT_EQ(find_symbol(result, "main")->arity, 2u);
    EXPECT_EQ(find_symbol(result, "main")->line, 4u);
    EXPECT_EQ(find_symbol(result, "Greeter.greet")->short_name, "greet");

    auto helper = edges_to(result, "helper");
    ASSERT_THAT(helper, SizeIs(1));
    EXPECT_EQ(source_name(result, *helper[0]), "main");
    EXPECT_EQ(helper[0]->hint, DispatchHint::Direct);
    EXPECT_EQ(helper[0]->arg_count, 1);
    EXPECT_EQ(helper[0]->line, 5u);

    auto render = edges_to(result, "render");
    ASSERT_THAT(render, SizeIs(1));
    EXPECT_EQ(render[0]->hint, DispatchHint::Conditional);

    auto fallback = edges_to(result, "fallback");
    ASSERT_THAT(fallback, SizeIs(1));
    EXPECT_EQ(fallback[0]->hint, DispatchHint::Conditional);
    EXPECT_EQ(fallback[0]->arg_count, 0);

    auto transform = edges_to(result, "transform");
    ASSERT_THAT(transform, SizeIs(1));
    EXPECT_EQ(source_name(result, *transform[0]), "arrow");

    auto format = edges_to(result, "format");
    ASSERT_THAT(format, SizeIs(1));
    EXPECT_EQ(source_name(result, *format[0]), "Greeter.greet");

    auto util = edges_to(result, "util", RelationKind::Import);
    ASSERT_THAT(util, SizeIs(1));
    EXPECT_EQ(util[0]->target_name, "./util.js");
    EXPECT_EQ(util[0]->source, 0u);
    EXPECT_THAT(edges_to(result, "lodash", RelationKind::Import), SizeIs(1));
    EXPECT_THAT(edges_to(result, "require"), IsEmpty());
}

TEST(PatternScannerTest, ArgumentsNamingFunctionsAreSpeculativeReferences) {
    auto result = PatternScanner().scan("a.js", "function run(cb) {\n  setTimeout(tick, 10);\n}\n");
    ASSERT_TRUE(result.ok());

    auto tick = edges_to(result, "tick", RelationKind::Compose);
    ASSERT_THAT(tick, SizeIs(1));
    EXPECT_TRUE(tick[0]->speculative);
    EXPECT_EQ(source_name(result, *tick[0]), "run");
}

TEST(PatternScannerTest, JavaScriptDynamicDispatch) {
    const char *source = R"(function run(name) {
  handlers["save"](name);
  eval(code);
}
)";
    auto result = PatternScanner().scan("dispatch.js", source);
    ASSERT_TRUE(result.ok());

    auto save = edges_to(result, "save");
    ASSERT_THAT(save, SizeIs(1));
    EXPECT_EQ(save[0]->hint, DispatchHint::Dynamic);
    EXPECT_EQ(source_name(result, *save[0]), "run");

    auto eval = edges_to(result, "eval");
    ASSERT_THAT(eval, SizeIs(1));
    EXPECT_EQ(eval[0]->hint, DispatchHint::Dynamic);
}

TEST(PatternScannerTest, CommentsAndStringsAreIgnored) {
    const char *source = R"src(function f() {
  // ghost();
  /* spectre(); */
  const s = "phantom()";
  real();
}
)src";
    auto result = PatternScanner().scan("f.ts", source);
    ASSERT_TRUE(result.ok());
    EXPECT_THAT(edges_to(result, "ghost"), IsEmpty());
    EXPECT_THAT(edges_to(result, "spectre"), IsEmpty());
    EXPECT_THAT(edges_to(result, "phantom"), IsEmpty());
    EXPECT_THAT(edges_to(result, "real"), SizeIs(1));
}

TEST(PatternScannerTest, RustImplMethodsAndMatchArms) {
    const char *source = R"(mod parser;
use crate::lexer::Token;

struct Engine;

impl Engine {
    pub fn run(&self, input: &str) -> usize {
        let t = tokenize(input);
        match t {
            0 => fallback(),
            _ => self.step(t),
        }
    }

    fn step(&self, n: usize) -> usize { n }
}
)";
    auto result = PatternScanner().scan("src/engine.rs", source);
    ASSERT_TRUE(result.ok()) << *result.error;
    EXPECT_THAT(symbol_names(result), ElementsAre("<module>", "Engine::run", "Engine::step"));

    const SymbolDraft *run = find_symbol(result, "Engine::run");
    EXPECT_EQ(run->arity, 1u);
    EXPECT_THAT(run->param_types, ElementsAre("&str"));

    auto tokenize = edges_to(result, "tokenize");
    ASSERT_THAT(tokenize, SizeIs(1));
    EXPECT_EQ(tokenize[0]->hint, DispatchHint::Direct);

    auto fallback = edges_to(result, "fallback");
    ASSERT_THAT(fallback, SizeIs(1));
    EXPECT_EQ(fallback[0]->hint, DispatchHint::Conditional);

    auto step = edges_to(result, "step");
    ASSERT_THAT(step, SizeIs(1));
    EXPECT_EQ(step[0]->target_name, "self.step");
    EXPECT_EQ(step[0]->hint, DispatchHint::Conditional);

    EXPECT_THAT(edges_to(result, "parser", RelationKind::Import), SizeIs(1));
    EXPECT_THAT(edges_to(result, "lexer", RelationKind::Import), SizeIs(1));
}

TEST(PatternScannerTest, GoReceiversImportsAndReflection) {
    const char *source = R"(package server

import (
	"fmt"
	"net/http"
)

type Server struct{}

func (s *Server) Handle(w int, r string) {
	fmt.Println(w)
	s.route(r)
}

func route(r string) {
	m := reflect.ValueOf(r).MethodByName("Serve")
	_ = m
}
)";
    auto result = PatternScanner().scan("server.go", source);
    ASSERT_TRUE(result.ok()) << *result.error;
    EXPECT_THAT(symbol_names(result), ElementsAre("<module>", "Server.Handle", "route"));
    EXPECT_THAT(find_symbol(result, "Server.Handle")->param_types, ElementsAre("int", "string"));

    auto route = edges_to(result, "route");
    ASSERT_THAT(route, SizeIs(1));
    EXPECT_EQ(source_name(result, *route[0]), "Server.Handle");
    EXPECT_THAT(edges_to(result, "Println"), SizeIs(1));

    auto serve = edges_to(result, "Serve");
    ASSERT_THAT(serve, SizeIs(1));
    EXPECT_EQ(serve[0]->hint, DispatchHint::Dynamic);
    EXPECT_EQ(source_name(result, *serve[0]), "route");

    EXPECT_THAT(edges_to(result, "fmt", RelationKind::Import), SizeIs(1));
    auto http = edges_to(result, "http", RelationKind::Import);
    ASSERT_THAT(http, SizeIs(1));
    EXPECT_EQ(http[0]->target_name, "net/http");
}

TEST(PatternScannerTest, JavaMethodsAndImports) {
    const char *source = R"(package app;

import java.util.List;
import static org.junit.Assert.assertEquals;

public class Service {
    public int compute(int x, String label) {
        int y = helper(x);
        if (x > 0) {
            return validate(y);
        }
        return 0;
    }

    private static int helper(int v) {
        return v * 2;
    }
}
)";
    auto result = PatternScanner().scan("Service.java", source);
    ASSERT_TRUE(result.ok()) << *result.error;
    EXPECT_THAT(symbol_names(result),
                ElementsAre("<module>", "Service.compute", "Service.helper"));
    EXPECT_THAT(find_symbol(result, "Service.compute")->param_types, ElementsAre("int", "String"));

    auto helper = edges_to(result, "helper");
    ASSERT_THAT(helper, SizeIs(1));
    EXPECT_EQ(helper[0]->hint, DispatchHint::Direct);
    EXPECT_EQ(source_name(result, *helper[0]), "Service.compute");

    auto validate = edges_to(result, "validate");
    ASSERT_THAT(validate, SizeIs(1));
    EXPECT_EQ(validate[0]->hint, DispatchHint::Conditional);

    EXPECT_THAT(edges_to(result, "List", RelationKind::Import), SizeIs(1));
    EXPECT_THAT(edges_to(result, "Assert", RelationKind::Import), SizeIs(1));
}

TEST(PatternScannerTest, JavaLongLiteralLinesScanInBoundedTime) {
    std::string elements;
    for (int i = 0; i < 8000; ++i) {
        if (i > 0)
            elements += ", ";
        elements += std::to_string(i);
    }
    std::string source = "public class Table {\n"
                         "    static final int[] VALUES = {" + elements + "};\n"
                         "    static final List<Integer> BOXED = Arrays.asList(" + elements + ");\n"
                         "    public Map<String, Integer> lookup(int key) {\n"
                         "        return index(key);\n"
                         "    }\n"
                         "}\n";

    auto started = std::chrono::steady_clock::now();
    auto result = PatternScanner().scan("Table.java", source);
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result.ok()) << *result.error;
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);
    EXPECT_THAT(symbol_names(result), ElementsAre("<module>", "Table.lookup"));
    EXPECT_THAT(edges_to(result, "index"), SizeIs(1));
}

TEST(PatternScannerTest, UnparseableContentIsScanError) {
    PatternScanner scanner;

    auto unbalanced = scanner.scan("a.js", "function f() {\n  g();\n");
    ASSERT_FALSE(unbalanced.ok());
    EXPECT_THAT(*unbalanced.error, HasSubstr("unbalanced braces"));
    EXPECT_THAT(unbalanced.symbols, IsEmpty());

    auto comment = scanner.scan("a.go", "func f() {}\n/* never closed\n");
    ASSERT_FALSE(comment.ok());
    EXPECT_THAT(*comment.error, HasSubstr("unterminated comment at line 2"));

    auto binary = scanner.scan("a.java", std::string("class A {\0}", 11));
    ASSERT_FALSE(binary.ok());
    EXPECT_EQ(*binary.error, "binary content");

    EXPECT_FALSE(scanner.scan("a.py", "def f(): pass\n").ok());
}

TEST(PatternScannerTest, EmptyFileHasOnlyModuleSymbol) {
    auto result = PatternScanner().scan("empty.ts", "");
    ASSERT_TRUE(result.ok());
    EXPECT_THAT(symbol_names(result), ElementsAre("<module>"));
    EXPECT_THAT(result.edges, IsEmpty());
}
