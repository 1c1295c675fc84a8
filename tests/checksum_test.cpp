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

#include "depmap/checksum.hpp"
#include "depmap/errors.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace depmap;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(Sha256Test, KnownDigests) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ChecksumIndexTest, ClassifiesAddedModifiedUnchanged) {
    ChecksumIndex index;
    index.begin_walk();
    EXPECT_EQ(index.record("a.py", "d1"), ChangeKind::Added);
    EXPECT_EQ(index.record("b.py", "d2"), ChangeKind::Added);
    EXPECT_THAT(index.finish_walk(), IsEmpty());

    index.begin_walk();
    EXPECT_EQ(index.record("a.py", "d1"), ChangeKind::Unchanged);
    EXPECT_EQ(index.record("b.py", "d3"), ChangeKind::Modified);
    EXPECT_EQ(index.digest_of("b.py"), "d3");
}

TEST(ChecksumIndexTest, UnseenPathsAreReportedRemovedUntilConfirmed) {
    ChecksumIndex index;
    index.begin_walk();
    index.record("a.py", "d1");
    index.record("b.py", "d2");
    index.record("c.py", "d3");

    index.begin_walk();
    index.record("b.py", "d2");
    EXPECT_THAT(index.finish_walk(), ElementsAre("a.py", "c.py"));
    EXPECT_TRUE(index.contains("a.py"));

    index.confirm_removed("a.py");
    EXPECT_FALSE(index.contains("a.py"));
    EXPECT_THAT(index.finish_walk(), ElementsAre("c.py"));
}

TEST(ChecksumIndexTest, UnreadableFileKeepsDigestAndIsNotRemoved) {
    ChecksumIndex index;
    index.begin_walk();
    index.record("a.py", "d1");

    index.begin_walk();
    index.record_unreadable("a.py");
    EXPECT_THAT(index.finish_walk(), IsEmpty());
    EXPECT_EQ(index.digest_of("a.py"), "d1");
}

TEST(ChecksumIndexTest, RevertRestoresPreviousDigest) {
    ChecksumIndex index;
    index.begin_walk();
    index.record("a.py", "d1");

    index.begin_walk();
    EXPECT_EQ(index.record("a.py", "d2"), ChangeKind::Modified);
    EXPECT_EQ(index.record("new.py", "d9"), ChangeKind::Added);
    index.revert("a.py");
    index.revert("new.py");

    EXPECT_EQ(index.digest_of("a.py"), "d1");
    EXPECT_FALSE(index.contains("new.py"));

    // The reverted file is still modified on the next walk
    index.begin_walk();
    EXPECT_EQ(index.record("a.py", "d2"), ChangeKind::Modified);
}

TEST(ChecksumIndexTest, JsonRoundTripAndMalformedInput) {
    ChecksumIndex index;
    index.begin_walk();
    index.record("src/a.py", "d1");
    index.record("src/b.c", "d2");

    ChecksumIndex loaded = ChecksumIndex::from_json(index.to_json());
    EXPECT_EQ(loaded.entries(), index.entries());

    EXPECT_THROW(ChecksumIndex::from_json(json::array()), StoreError);
}
