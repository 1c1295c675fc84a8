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
#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace depmap {

namespace fs = std::filesystem;

struct WalkOptions {
    std::string root = ".";
    std::vector<std::string> ignore_patterns;
    bool skip_hidden = true;
};

// Finds the source files under a root that some registered scanner
// handles, reads them and digests them. Paths are reported relative to
// the root with forward slashes, sorted.
class DirectoryWalker {
public:
    DirectoryWalker(const ScannerRegistry &scanners, WalkOptions options);

    // Throws ConfigError when the root is not a directory
    std::vector<SourceInput> walk() const;

    // Discovery only, no reads
    std::vector<fs::path> discover_files() const;

    bool should_ignore(const fs::path &relative) const;

private:
    const ScannerRegistry &scanners_;
    WalkOptions options_;

    SourceInput read_input(const fs::path &path) const;
};

} // namespace depmap
