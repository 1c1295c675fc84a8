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

#include "types.hpp"
#include <string>
#include <vector>

namespace depmap {

// An in-tree symbol an edge draft could point at
struct Candidate {
    SymbolId id = INVALID_ID;
    FileId file = INVALID_ID;
    uint32_t arity = 0;
    bool same_file = false; // Declared in the file the edge comes from
};

struct Annotation {
    Confidence confidence = Confidence::External;
    SymbolId target = INVALID_ID;
    bool keep = true; // false: drop the draft (speculative, nothing matched)
};

// Assigns a confidence class and a target to each edge draft.
//
// Decision order:
//   1. dynamic dispatch shape          -> dynamic
//   2. reachable only under a branch   -> conditional
//   3. exactly one in-tree candidate   -> resolved
//      (same-file candidates win, then arity narrows the rest;
//       several left -> dynamic, bound to the lowest id)
//   4. no in-tree candidate            -> external
class ConfidenceAnnotator {
public:
    Annotation annotate(const EdgeDraft &draft, const std::vector<Candidate> &candidates) const;

    // Same decision for an already stored edge being relinked
    Annotation annotate(DispatchHint hint, bool speculative, int arg_count,
                        const std::vector<Candidate> &candidates) const;

private:
    // Candidates left after the same-file and arity filters, lowest id first
    static std::vector<Candidate> narrow(const std::vector<Candidate> &candidates, int arg_count);
};

// Hint to reuse when re-annotating a stored edge
DispatchHint hint_for(const Edge &edge);

} // namespace depmap
