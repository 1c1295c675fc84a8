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

#include <stdexcept>
#include <string>

namespace depmap {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// The graph is about to violate one of its invariants (an edge naming a
// symbol that does not exist, a symbol claimed by two files). Aborts the
// sync run.
class ConsistencyError : public Error {
public:
    explicit ConsistencyError(const std::string &what) : Error("consistency: " + what) {}
};

// A single file commit could not be applied
class StoreError : public Error {
public:
    explicit StoreError(const std::string &what) : Error("store: " + what) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string &what) : Error("config: " + what) {}
};

// File-scoped failures reported in a SyncReport instead of thrown
enum class FileErrorKind { Scan, Commit };

inline const char *file_error_kind_to_string(FileErrorKind kind) {
    return kind == FileErrorKind::Scan ? "ScanError" : "CommitError";
}

struct FileError {
    FileErrorKind kind = FileErrorKind::Scan;
    std::string path;
    std::string message;
};

} // namespace depmap
