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

#include "depmap/types.hpp"
#include <sstream>

namespace depmap {

std::string build_param_signature(const std::vector<std::string> &param_types) {
    if (param_types.empty()) {
        return "()";
    }

    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < param_types.size(); ++i) {
        if (i > 0)
            oss << ", ";
        std::string type = param_types[i];
        size_t start = type.find_first_not_of(" \t\n");
        size_t end = type.find_last_not_of(" \t\n");
        if (start == std::string::npos) {
            oss << "_";
            continue;
        }
        type = type.substr(start, end - start + 1);
        size_t pos;
        while ((pos = type.find("const ")) != std::string::npos) {
            type.erase(pos, 6);
        }
        while ((pos = type.find(" const")) != std::string::npos) {
            type.erase(pos, 6);
        }
        while ((pos = type.find("  ")) != std::string::npos) {
            type.erase(pos, 1);
        }
        oss << type;
    }
    oss << ")";
    return oss.str();
}

std::string Symbol::signature() const {
    if (param_types.empty() && arity > 0) {
        return build_param_signature(std::vector<std::string>(arity));
    }
    return build_param_signature(param_types);
}

} // namespace depmap
