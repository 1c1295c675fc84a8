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

#include "depmap/walker.hpp"
#include "depmap/checksum.hpp"
#include "depmap/errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace depmap {

DirectoryWalker::DirectoryWalker(const ScannerRegistry &scanners, WalkOptions options)
    : scanners_(scanners), options_(std::move(options)) {}

bool DirectoryWalker::should_ignore(const fs::path &relative) const {
    for (const auto &component : relative) {
        std::string comp = component.string();
        for (const auto &pattern : options_.ignore_patterns) {
            if (comp == pattern) {
                return true;
            }
        }

        // Ignore hidden files/directories
        if (options_.skip_hidden && !comp.empty() && comp[0] == '.' && comp != "." &&
            comp != "..") {
            return true;
        }
    }

    return false;
}

std::vector<fs::path> DirectoryWalker::discover_files() const {
    std::vector<fs::path> files;

    fs::path root(options_.root);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw ConfigError("not a directory: " + options_.root);
    }

    // Iterative directory traversal
    std::vector<fs::path> dirs_to_visit;
    dirs_to_visit.push_back(root);

    while (!dirs_to_visit.empty()) {
        fs::path current_dir = dirs_to_visit.back();
        dirs_to_visit.pop_back();

        fs::directory_iterator it(current_dir, ec);
        if (ec)
            continue;

        for (const auto &entry : it) {
            const fs::path &path = entry.path();
            if (should_ignore(path.lexically_relative(root)))
                continue;

            std::error_code type_ec;
            if (entry.is_directory(type_ec) && !entry.is_symlink(type_ec)) {
                dirs_to_visit.push_back(path);
            } else if (entry.is_regular_file(type_ec) && scanners_.supports(path.string())) {
                files.push_back(path);
            }
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

SourceInput DirectoryWalker::read_input(const fs::path &path) const {
    SourceInput input;
    input.path = path.lexically_relative(fs::path(options_.root)).generic_string();

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        input.read_error = std::string("cannot open: ") + std::strerror(errno);
        return input;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        input.read_error = "read failed";
        return input;
    }

    input.content = buffer.str();
    input.digest = sha256_hex(*input.content);
    return input;
}

std::vector<SourceInput> DirectoryWalker::walk() const {
    std::vector<SourceInput> inputs;
    for (const auto &path : discover_files()) {
        inputs.push_back(read_input(path));
    }

    std::sort(inputs.begin(), inputs.end(),
              [](const SourceInput &a, const SourceInput &b) { return a.path < b.path; });
    return inputs;
}

} // namespace depmap
