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

#include "net/cdnmirror/rewriter/public/cdn_path_mapper.h"

#include "cdnmirror/kernel/base/gtest.h"
#include "cdnmirror/kernel/base/string.h"
#include "net/cdnmirror/rewriter/public/cdn_config_snapshot.h"
#include "net/cdnmirror/rewriter/public/cdn_options.h"
#include "net/cdnmirror/rewriter/public/remote_path_resolver.h"

namespace net_cdnmirror {

namespace {

class CdnPathMapperTest : public testing::Test {
 protected:
  GoogleString Map(const StringPiece& site, const StringPiece& base,
                   const StringPiece& url) {
    CdnOptions options;
    options.set_enabled(true);
    options.set_site_url(site);
    options.set_explicit_cdn_base_url(base);
    CdnConfigSnapshot config(options);
    SiteRootPathResolver resolver(&config);
    CdnPathMapper mapper(&config, &resolver);
    return mapper.MapToCdnUrl(url);
  }
};

TEST_F(CdnPathMapperTest, SiteAtRoot) {
  EXPECT_EQ("https://cdn.example/user/repo@main/wp-content/themes/x/style.css",
            Map("https://site.example", "https://cdn.example/user/repo@main/",
                "https://site.example/wp-content/themes/x/style.css"));
}

TEST_F(CdnPathMapperTest, QueryIsPreserved) {
  EXPECT_EQ("https://cdn.example/r@main/wp-content/a.css?ver=1.2",
            Map("https://site.example/", "https://cdn.example/r@main",
                "https://site.example/wp-content/a.css?ver=1.2"));
}

TEST_F(CdnPathMapperTest, SiteInSubdirectory) {
  const char kSite[] = "https://site.example/blog";
  const char kBase[] = "https://cdn.example/r@main/";
  EXPECT_EQ("https://cdn.example/r@main/wp-content/a.js",
            Map(kSite, kBase, "https://site.example/blog/wp-content/a.js"));
  EXPECT_EQ("https://cdn.example/r@main/wp-content/a.js",
            Map(kSite, kBase, "/blog/wp-content/a.js"));
  // Only a whole leading segment is the site path.
  EXPECT_EQ("https://cdn.example/r@main/blogroll/a.js",
            Map(kSite, kBase, "/blogroll/a.js"));
  EXPECT_EQ("https://cdn.example/r@main/other/a.js",
            Map(kSite, kBase, "https://site.example/other/a.js"));
}

TEST_F(CdnPathMapperTest, ProtocolRelativeAndRelative) {
  const char kSite[] = "https://site.example";
  const char kBase[] = "https://cdn.example/r@main/";
  EXPECT_EQ("https://cdn.example/r@main/wp-content/a.png",
            Map(kSite, kBase, "//site.example/wp-content/a.png"));
  EXPECT_EQ("https://cdn.example/r@main/images/a.png",
            Map(kSite, kBase, "images/a.png"));
}

TEST_F(CdnPathMapperTest, NoReencoding) {
  EXPECT_EQ("https://cdn.example/r@main/wp-content/a%20b.css?x=%2F",
            Map("https://site.example", "https://cdn.example/r@main/",
                "/wp-content/a%20b.css?x=%2F"));
}

TEST(CdnPathMapperJoinTest, ExactlyOneSlash) {
  EXPECT_EQ("https://cdn.example/a.css",
            CdnPathMapper::JoinCdnUrl("https://cdn.example///", "//a.css"));
  EXPECT_EQ("https://cdn.example/a.css",
            CdnPathMapper::JoinCdnUrl("https://cdn.example", "a.css"));
  EXPECT_EQ("https://cdn.example/",
            CdnPathMapper::JoinCdnUrl("https://cdn.example/", ""));
}

}  // namespace

}  // namespace net_cdnmirror
