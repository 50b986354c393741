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

#include "net/cdnmirror/rewriter/public/url_eligibility.h"

#include "cdnmirror/kernel/base/gtest.h"
#include "cdnmirror/kernel/base/string.h"
#include "net/cdnmirror/rewriter/public/cdn_rewrite_test_base.h"

namespace net_cdnmirror {

namespace {

class UrlEligibilityTest : public CdnRewriteTestBase {
 protected:
  bool ShouldRewrite(const StringPiece& url) {
    return UrlEligibility::ShouldRewrite(url, config());
  }
};

TEST_F(UrlEligibilityTest, SameOriginAbsolute) {
  EXPECT_TRUE(ShouldRewrite("https://site.example/wp-content/a.css"));
  EXPECT_TRUE(ShouldRewrite("https://site.example/wp-content/a.css?ver=1.2"));
  EXPECT_TRUE(ShouldRewrite("https://SITE.example/wp-content/logo.PNG"));
  EXPECT_TRUE(ShouldRewrite("//site.example/wp-includes/js/jquery.js"));
}

TEST_F(UrlEligibilityTest, CrossOrigin) {
  EXPECT_FALSE(ShouldRewrite("https://other-domain.example/a.css"));
  EXPECT_FALSE(ShouldRewrite("http://site.example/a.css"));
  EXPECT_FALSE(ShouldRewrite("https://site.example:8443/a.css"));
  EXPECT_FALSE(ShouldRewrite("//cdn.other.example/a.js"));
  EXPECT_FALSE(ShouldRewrite("https://site.example.evil.example/a.css"));
}

TEST_F(UrlEligibilityTest, AuthorityMustBeLiteral) {
  EXPECT_FALSE(ShouldRewrite("https:\\\\site.example\\wp-content\\a.css"));
  EXPECT_FALSE(ShouldRewrite("https:/site.example/a.css"));
  EXPECT_FALSE(ShouldRewrite("https://site.example\\wp-content\\a.css"));
  EXPECT_TRUE(ShouldRewrite("https://site.example/a.css?q=a\\b"));
}

TEST_F(UrlEligibilityTest, Relative) {
  EXPECT_TRUE(ShouldRewrite("/wp-content/a.js"));
  EXPECT_TRUE(ShouldRewrite("/wp-content/a.js?ver=5#top"));
  EXPECT_TRUE(ShouldRewrite("images/a.gif"));
}

TEST_F(UrlEligibilityTest, ExtensionGating) {
  EXPECT_FALSE(ShouldRewrite("/index.php"));
  EXPECT_FALSE(ShouldRewrite("/wp-content/uploads/video.mp4"));
  EXPECT_FALSE(ShouldRewrite("/wp-content/fonts/"));
  EXPECT_FALSE(ShouldRewrite("/wp-content/no_extension"));
  EXPECT_FALSE(ShouldRewrite("/wp-content/trailing."));
  EXPECT_FALSE(ShouldRewrite("/wp.content/file"));
  EXPECT_FALSE(ShouldRewrite("https://site.example"));
  // The query does not supply an extension.
  EXPECT_FALSE(ShouldRewrite("/load.php?file=a.css"));
}

TEST_F(UrlEligibilityTest, Exclusions) {
  options_.set_excluded_paths("/private/*, /wp-content/secret.js");
  ResetRewriter();
  EXPECT_FALSE(ShouldRewrite("/private/a.css"));
  EXPECT_FALSE(ShouldRewrite("https://site.example/private/b/c.png"));
  EXPECT_FALSE(ShouldRewrite("/wp-content/secret.js"));
  EXPECT_FALSE(ShouldRewrite("/wp-content/secret.js?v=1"));
  EXPECT_TRUE(ShouldRewrite("/wp-content/secret.json.js"));
  EXPECT_TRUE(ShouldRewrite("/privately/a.css"));
}

TEST_F(UrlEligibilityTest, AdminAndDataUrls) {
  EXPECT_FALSE(ShouldRewrite("/wp-admin/x.js"));
  EXPECT_FALSE(ShouldRewrite("/wp-login.css"));
  EXPECT_FALSE(ShouldRewrite("/wp-content/a.css?back=/wp-admin"));
  EXPECT_FALSE(ShouldRewrite("data:image/png;base64,AAAA"));
  EXPECT_FALSE(ShouldRewrite("DATA:text/css,a.css"));
  EXPECT_FALSE(ShouldRewrite(""));
}

TEST_F(UrlEligibilityTest, DisabledOrNoBase) {
  options_.set_enabled(false);
  ResetRewriter();
  EXPECT_FALSE(ShouldRewrite("/wp-content/a.css"));
  options_.set_enabled(true);
  options_.set_explicit_cdn_base_url("");
  ResetRewriter();
  EXPECT_FALSE(ShouldRewrite("/wp-content/a.css"));
}

TEST_F(UrlEligibilityTest, AbsoluteUrlsNeedSite) {
  options_.set_site_url("");
  ResetRewriter();
  EXPECT_FALSE(ShouldRewrite("https://site.example/a.css"));
  EXPECT_TRUE(ShouldRewrite("/a.css"));
}

TEST(UrlEligibilityStaticTest, ExtractExtension) {
  GoogleString ext;
  EXPECT_TRUE(UrlEligibility::ExtractExtension("/a/b.min.JS", &ext));
  EXPECT_EQ("js", ext);
  EXPECT_TRUE(UrlEligibility::ExtractExtension("/a/.htaccess", &ext));
  EXPECT_EQ("htaccess", ext);
  EXPECT_FALSE(UrlEligibility::ExtractExtension("/a.b/c", &ext));
  EXPECT_FALSE(UrlEligibility::ExtractExtension("/a/b.", &ext));
  EXPECT_FALSE(UrlEligibility::ExtractExtension("", &ext));
}

TEST(UrlEligibilityStaticTest, HasLiteralAuthority) {
  EXPECT_TRUE(UrlEligibility::HasLiteralAuthority("https://site.example/a"));
  EXPECT_TRUE(UrlEligibility::HasLiteralAuthority("//site.example/a"));
  EXPECT_TRUE(UrlEligibility::HasLiteralAuthority("https://site.example"));
  EXPECT_FALSE(UrlEligibility::HasLiteralAuthority("https:/site.example/a"));
  EXPECT_FALSE(UrlEligibility::HasLiteralAuthority("https:site.example/a"));
  EXPECT_FALSE(UrlEligibility::HasLiteralAuthority(
      "https:\\\\site.example\\a"));
  EXPECT_FALSE(UrlEligibility::HasLiteralAuthority("/a/b.css"));
}

TEST(UrlEligibilityStaticTest, Markers) {
  EXPECT_TRUE(UrlEligibility::HasAdminMarker("https://x/wp-admin/a.js"));
  EXPECT_TRUE(UrlEligibility::HasAdminMarker("/wp-login.php"));
  EXPECT_FALSE(UrlEligibility::HasAdminMarker("/wp-content/admin.js"));
  EXPECT_TRUE(UrlEligibility::IsDataUrl("Data:foo"));
  EXPECT_FALSE(UrlEligibility::IsDataUrl("/data:foo"));
}

}  // namespace

}  // namespace net_cdnmirror
