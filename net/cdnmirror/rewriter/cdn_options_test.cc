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

#include "net/cdnmirror/rewriter/public/cdn_options.h"

#include "cdnmirror/kernel/base/gtest.h"
#include "cdnmirror/kernel/base/mock_message_handler.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"
#include "cdnmirror/kernel/base/string_writer.h"

namespace net_cdnmirror {

namespace {

class CdnOptionsTest : public testing::Test {
 protected:
  CdnOptions::OptionSettingResult Set(StringPiece name, StringPiece arg) {
    GoogleString msg;
    return options_.ParseAndSetOptionFromName1(name, arg, &msg, &handler_);
  }

  GoogleString DumpMessages() {
    GoogleString out;
    StringWriter writer(&out);
    handler_.Dump(&writer);
    return out;
  }

  CdnOptions options_;
  MockMessageHandler handler_;
};

TEST_F(CdnOptionsTest, Defaults) {
  EXPECT_FALSE(options_.enabled());
  EXPECT_FALSE(options_.debug());
  EXPECT_EQ("", options_.github_username());
  EXPECT_EQ("", options_.github_repository());
  EXPECT_EQ("main", options_.github_branch());
  EXPECT_EQ("js,css,png,jpg,jpeg,gif,svg,woff,woff2,ttf,eot",
            JoinCollection(options_.file_types(), ","));
  ASSERT_EQ(2U, options_.excluded_paths().size());
  EXPECT_EQ("/wp-admin/*", options_.excluded_paths()[0]);
  EXPECT_EQ("/wp-login.php", options_.excluded_paths()[1]);
  EXPECT_EQ("", options_.CdnBaseUrl());
}

TEST_F(CdnOptionsTest, JsDelivrBaseFromGithubSettings) {
  options_.set_github_username("user");
  EXPECT_EQ("", options_.CdnBaseUrl());
  options_.set_github_repository("repo");
  EXPECT_EQ("https://cdn.jsdelivr.net/gh/user/repo@main/",
            options_.CdnBaseUrl());
  options_.set_github_branch("assets");
  EXPECT_EQ("https://cdn.jsdelivr.net/gh/user/repo@assets/",
            options_.CdnBaseUrl());
}

TEST_F(CdnOptionsTest, ExplicitBaseWins) {
  options_.set_github_username("user");
  options_.set_github_repository("repo");
  options_.set_explicit_cdn_base_url("https://cdn.example/user/repo@main/");
  EXPECT_EQ("https://cdn.example/user/repo@main/", options_.CdnBaseUrl());
}

TEST_F(CdnOptionsTest, BooleanDirectives) {
  EXPECT_EQ(CdnOptions::kOptionOk, Set("CdnEnabled", "on"));
  EXPECT_TRUE(options_.enabled());
  EXPECT_EQ(CdnOptions::kOptionOk, Set("cdnenabled", "FALSE"));
  EXPECT_FALSE(options_.enabled());
  EXPECT_EQ(CdnOptions::kOptionOk, Set("CdnDebug", "true"));
  EXPECT_TRUE(options_.debug());
  EXPECT_EQ(CdnOptions::kOptionValueInvalid, Set("CdnDebug", "maybe"));
  EXPECT_TRUE(options_.debug());
}

TEST_F(CdnOptionsTest, OnOffShorthand) {
  GoogleString msg;
  EXPECT_EQ(CdnOptions::kOptionOk,
            options_.ParseAndSetOptions0("on", &msg, &handler_));
  EXPECT_TRUE(options_.enabled());
  EXPECT_EQ(CdnOptions::kOptionNameUnknown,
            options_.ParseAndSetOptions0("unplugged", &msg, &handler_));
}

TEST_F(CdnOptionsTest, FileTypesAreNormalized) {
  EXPECT_EQ(CdnOptions::kOptionOk, Set("FileTypes", " .JS, Css ,,webp "));
  ASSERT_EQ(3U, options_.file_types().size());
  EXPECT_EQ("js", options_.file_types()[0]);
  EXPECT_EQ("css", options_.file_types()[1]);
  EXPECT_EQ("webp", options_.file_types()[2]);
}

TEST_F(CdnOptionsTest, UrlValidation) {
  EXPECT_EQ(CdnOptions::kOptionOk, Set("SiteUrl", "https://site.example"));
  EXPECT_EQ("https://site.example", options_.site_url());
  EXPECT_EQ(CdnOptions::kOptionValueInvalid, Set("SiteUrl", "site.example"));
  EXPECT_EQ(CdnOptions::kOptionValueInvalid,
            Set("CdnBaseUrl", "ftp://cdn.example/"));
  EXPECT_EQ(CdnOptions::kOptionOk, Set("CdnBaseUrl", ""));
  EXPECT_EQ(CdnOptions::kOptionValueInvalid, Set("GithubBranch", ""));
  EXPECT_EQ(CdnOptions::kOptionValueInvalid, Set("GithubUsername", "a/b"));
  EXPECT_EQ(CdnOptions::kOptionNameUnknown, Set("GithubToken", "secret"));
}

TEST_F(CdnOptionsTest, ParseConfigText) {
  const char kConfig[] =
      "# Mirror static assets through jsDelivr.\n"
      "CdnEnabled on\n"
      "\n"
      "SiteUrl https://site.example\n"
      "GithubUsername user\n"
      "GithubRepository repo\n"
      "  FileTypes \"js, css, png\"\n"
      "ExcludedPaths /wp-admin/*, /private/*\n";
  EXPECT_TRUE(options_.ParseConfigText(kConfig, "cdn.conf", &handler_));
  EXPECT_EQ(0, handler_.TotalMessages());
  EXPECT_TRUE(options_.enabled());
  EXPECT_EQ("https://site.example", options_.site_url());
  EXPECT_EQ("https://cdn.jsdelivr.net/gh/user/repo@main/",
            options_.CdnBaseUrl());
  EXPECT_EQ("js,css,png", JoinCollection(options_.file_types(), ","));
  ASSERT_EQ(2U, options_.excluded_paths().size());
  EXPECT_EQ("/private/*", options_.excluded_paths()[1]);
}

TEST_F(CdnOptionsTest, ParseConfigTextReportsEveryBadLine) {
  const char kConfig[] =
      "CdnEnabled sometimes\n"
      "Bogus directive here\n"
      "CdnDebug on\n";
  EXPECT_FALSE(options_.ParseConfigText(kConfig, "cdn.conf", &handler_));
  EXPECT_EQ(2, handler_.MessagesOfType(kError));
  EXPECT_TRUE(options_.debug());
  GoogleString messages = DumpMessages();
  EXPECT_HAS_SUBSTR("\"CdnEnabled sometimes\" must be on or off", messages);
  EXPECT_HAS_SUBSTR("\"Bogus\" not recognized", messages);
}

}  // namespace

}  // namespace net_cdnmirror
