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
#include <gtest/gtest.h>

using namespace depmap;

namespace {

EdgeDraft draft(DispatchHint hint = DispatchHint::Direct, int arg_count = -1,
                bool speculative = false) {
    EdgeDraft d;
    d.target_name = "helper";
    d.target_key = "helper";
    d.hint = hint;
    d.arg_count = arg_count;
    d.speculative = speculative;
    return d;
}

} // namespace

TEST(ConfidenceAnnotatorTest, SingleCandidateResolves) {
    ConfidenceAnnotator annotator;
    auto a = annotator.annotate(draft(), {{7, 2, 1, false}});
    EXPECT_EQ(a.confidence, Confidence::Resolved);
    EXPECT_EQ(a.target, 7u);
    EXPECT_TRUE(a.keep);
}

TEST(ConfidenceAnnotatorTest, NoCandidateIsExternal) {
    ConfidenceAnnotator annotator;
    auto a = annotator.annotate(draft(), {});
    EXPECT_EQ(a.confidence, Confidence::External);
    EXPECT_EQ(a.target, INVALID_ID);
    EXPECT_TRUE(a.keep);
}

TEST(ConfidenceAnnotatorTest, SameFileCandidateWins) {
    ConfidenceAnnotator annotator;
    auto a = annotator.annotate(draft(), {{3, 1, 0, false}, {9, 2, 0, true}, {4, 5, 0, false}});
    EXPECT_EQ(a.confidence, Confidence::Resolved);
    EXPECT_EQ(a.target, 9u);
}

TEST(ConfidenceAnnotatorTest, ArityNarrowsAmbiguousCandidates) {
    ConfidenceAnnotator annotator;
    auto a = annotator.annotate(draft(DispatchHint::Direct, 2), {{3, 1, 1, false}, {5, 2, 2, false}});
    EXPECT_EQ(a.confidence, Confidence::Resolved);
    EXPECT_EQ(a.target, 5u);

    // No arity match: the mismatch is inconclusive and all stay
    auto b = annotator.annotate(draft(DispatchHint::Direct, 4), {{3, 1, 1, false}, {5, 2, 2, false}});
    EXPECT_EQ(b.confidence, Confidence::Dynamic);
    EXPECT_EQ(b.target, 3u);
}

TEST(ConfidenceAnnotatorTest, AmbiguousTargetIsDynamicBoundToLowestId) {
    ConfidenceAnnotator annotator;
    auto a = annotator.annotate(draft(), {{12, 1, 0, false}, {4, 2, 0, false}, {8, 3, 0, false}});
    EXPECT_EQ(a.confidence, Confidence::Dynamic);
    EXPECT_EQ(a.target, 4u);
}

TEST(ConfidenceAnnotatorTest, DispatchShapeOverridesResolution) {
    ConfidenceAnnotator annotator;
    auto dynamic = annotator.annotate(draft(DispatchHint::Dynamic), {{7, 2, 0, false}});
    EXPECT_EQ(dynamic.confidence, Confidence::Dynamic);
    EXPECT_EQ(dynamic.target, 7u);

    auto conditional = annotator.annotate(draft(DispatchHint::Conditional), {{7, 2, 0, false}});
    EXPECT_EQ(conditional.confidence, Confidence::Conditional);
    EXPECT_EQ(conditional.target, 7u);

    // Dynamic shape with nothing in the tree stays dynamic, unbound
    auto unbound = annotator.annotate(draft(DispatchHint::Dynamic), {});
    EXPECT_EQ(unbound.confidence, Confidence::Dynamic);
    EXPECT_EQ(unbound.target, INVALID_ID);
}

TEST(ConfidenceAnnotatorTest, SpeculativeDraftDroppedWithoutCandidates) {
    ConfidenceAnnotator annotator;
    EXPECT_FALSE(annotator.annotate(draft(DispatchHint::Direct, -1, true), {}).keep);

    auto kept = annotator.annotate(draft(DispatchHint::Direct, -1, true), {{2, 1, 0, false}});
    EXPECT_TRUE(kept.keep);
    EXPECT_EQ(kept.confidence, Confidence::Resolved);
}

TEST(ConfidenceAnnotatorTest, HintForRestoresDemotedClass) {
    Edge edge;
    edge.confidence = Confidence::External;
    EXPECT_EQ(hint_for(edge), DispatchHint::Direct);

    edge.demoted_from = Confidence::Conditional;
    EXPECT_EQ(hint_for(edge), DispatchHint::Conditional);

    edge.demoted_from.reset();
    edge.confidence = Confidence::Dynamic;
    EXPECT_EQ(hint_for(edge), DispatchHint::Dynamic);
}
