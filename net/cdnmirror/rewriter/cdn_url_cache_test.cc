/*
 * Copyright 2016 Google Inc.
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

#include "net/cdnmirror/rewriter/public/cdn_url_cache.h"

#include "cdnmirror/kernel/base/gtest.h"
#include "cdnmirror/kernel/base/md5_hasher.h"
#include "cdnmirror/kernel/base/string.h"

namespace net_cdnmirror {

namespace {

class CdnUrlCacheTest : public testing::Test {
 protected:
  CdnUrlCacheTest() : cache_(&hasher_) {}

  MD5Hasher hasher_;
  CdnUrlCache cache_;
};

TEST_F(CdnUrlCacheTest, LookupMissThenHit) {
  GoogleString out;
  EXPECT_FALSE(cache_.Lookup("/a.css", &out));
  cache_.Insert("/a.css", "https://cdn.example/a.css");
  ASSERT_TRUE(cache_.Lookup("/a.css", &out));
  EXPECT_EQ("https://cdn.example/a.css", out);
  EXPECT_EQ(1, cache_.size());
}

TEST_F(CdnUrlCacheTest, IdentityEntries) {
  cache_.Insert("/a.php", "/a.php");
  GoogleString out;
  ASSERT_TRUE(cache_.Lookup("/a.php", &out));
  EXPECT_EQ("/a.php", out);
}

TEST_F(CdnUrlCacheTest, KeysAreMd5Hex) {
  EXPECT_EQ("d41d8cd98f00b204e9800998ecf8427e", cache_.CacheKey(""));
  EXPECT_EQ(32U, cache_.CacheKey("/wp-content/a.css").size());
  EXPECT_NE(cache_.CacheKey("/a.css"), cache_.CacheKey("/A.css"));
}

TEST_F(CdnUrlCacheTest, Clear) {
  cache_.Insert("/a.css", "x");
  cache_.Insert("/b.css", "y");
  EXPECT_EQ(2, cache_.size());
  cache_.Clear();
  EXPECT_EQ(0, cache_.size());
  GoogleString out;
  EXPECT_FALSE(cache_.Lookup("/a.css", &out));
}

}  // namespace

}  // namespace net_cdnmirror
