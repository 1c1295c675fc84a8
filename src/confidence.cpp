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

#include "depmap/confidence.hpp"
#include <algorithm>

namespace depmap {

std::vector<Candidate> ConfidenceAnnotator::narrow(const std::vector<Candidate> &candidates,
                                                   int arg_count) {
    std::vector<Candidate> pool;
    for (const auto &c : candidates) {
        if (c.same_file)
            pool.push_back(c);
    }
    if (pool.empty())
        pool = candidates;

    if (arg_count >= 0) {
        std::vector<Candidate> by_arity;
        for (const auto &c : pool) {
            if (c.arity == static_cast<uint32_t>(arg_count))
                by_arity.push_back(c);
        }
        // Default arguments and varargs make a mismatch inconclusive
        if (!by_arity.empty())
            pool = std::move(by_arity);
    }

    std::sort(pool.begin(), pool.end(),
              [](const Candidate &a, const Candidate &b) { return a.id < b.id; });
    return pool;
}

Annotation ConfidenceAnnotator::annotate(const EdgeDraft &draft,
                                         const std::vector<Candidate> &candidates) const {
    return annotate(draft.hint, draft.speculative, draft.arg_count, candidates);
}

Annotation ConfidenceAnnotator::annotate(DispatchHint hint, bool speculative, int arg_count,
                                         const std::vector<Candidate> &candidates) const {
    Annotation result;
    auto pool = narrow(candidates, arg_count);

    if (speculative && pool.empty()) {
        result.keep = false;
        return result;
    }

    switch (hint) {
    case DispatchHint::Dynamic:
        result.confidence = Confidence::Dynamic;
        if (!pool.empty())
            result.target = pool.front().id;
        return result;
    case DispatchHint::Conditional:
        result.confidence = Confidence::Conditional;
        if (!pool.empty())
            result.target = pool.front().id;
        return result;
    case DispatchHint::Direct:
        break;
    }

    if (pool.empty()) {
        result.confidence = Confidence::External;
        return result;
    }
    result.target = pool.front().id;
    result.confidence = pool.size() == 1 ? Confidence::Resolved : Confidence::Dynamic;
    return result;
}

DispatchHint hint_for(const Edge &edge) {
    Confidence previous = edge.demoted_from.value_or(edge.confidence);
    switch (previous) {
    case Confidence::Dynamic:
        return DispatchHint::Dynamic;
    case Confidence::Conditional:
        return DispatchHint::Conditional;
    default:
        return DispatchHint::Direct;
    }
}

} // namespace depmap
