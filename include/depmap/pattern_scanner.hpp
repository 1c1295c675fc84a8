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

#include "scanner.hpp"
#include <string>
#include <vector>

namespace depmap {

// Regular-expression scanner for languages without a bundled grammar:
// JavaScript, TypeScript, Rust, Go and Java.
//
// Comments and string contents are blanked out (offsets preserved) before
// any pattern runs, function bodies are found by brace matching, and a call
// belongs to the innermost function body containing it. Content with NUL
// bytes, unterminated comments/strings or unbalanced braces is a scan error.
class PatternScanner : public SourceScanner {
public:
    ScanResult scan(const std::string &path, const std::string &content) const override;
    std::vector<Language> languages() const override;
};

} // namespace depmap
