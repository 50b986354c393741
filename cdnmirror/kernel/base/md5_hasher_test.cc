/*
 * Copyright 2010 Google Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "cdnmirror/kernel/base/md5_hasher.h"

#include "cdnmirror/kernel/base/gtest.h"
#include "cdnmirror/kernel/base/string.h"

namespace net_cdnmirror {

namespace {

TEST(Md5HasherTest, KnownDigests) {
  MD5Hasher hasher;
  EXPECT_EQ("d41d8cd98f00b204e9800998ecf8427e", hasher.Hash(""));
  EXPECT_EQ("9e107d9d372bb6826bd81d3542a419d6",
            hasher.Hash("The quick brown fox jumps over the lazy dog"));
}

TEST(Md5HasherTest, Sizes) {
  MD5Hasher hasher;
  EXPECT_EQ(16, hasher.RawHashSizeInBytes());
  EXPECT_EQ(16U, hasher.RawHash("/wp-content/a.css").size());
  EXPECT_EQ(32U, hasher.Hash("/wp-content/a.css").size());
}

TEST(Md5HasherTest, DistinctInputsDistinctHashes) {
  MD5Hasher hasher;
  EXPECT_NE(hasher.Hash("/a.css"), hasher.Hash("/a.css?ver=1"));
  EXPECT_EQ(hasher.Hash("/a.css"), hasher.Hash("/a.css"));
}

}  // namespace

}  // namespace net_cdnmirror
