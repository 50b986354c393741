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

#include "net/cdnmirror/rewriter/public/cdn_config_script.h"

#include "cdnmirror/kernel/base/gtest.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_writer.h"
#include "json/json.h"
#include "net/cdnmirror/rewriter/public/cdn_config_snapshot.h"
#include "net/cdnmirror/rewriter/public/path_rule.h"
#include "net/cdnmirror/rewriter/public/cdn_rewrite_test_base.h"

namespace net_cdnmirror {

namespace {

class CdnConfigScriptTest : public CdnRewriteTestBase {
 protected:
  virtual void ResetRewriter() {
    script_.reset(NULL);
    CdnRewriteTestBase::ResetRewriter();
    script_.reset(new CdnConfigScript(config_.get(), &request_context_));
  }

  GoogleString Emit() {
    GoogleString out;
    StringWriter writer(&out);
    EXPECT_TRUE(script_->Emit(&writer, &message_handler_));
    return out;
  }

  scoped_ptr<CdnConfigScript> script_;
};

TEST_F(CdnConfigScriptTest, ConfigJson) {
  Json::Value root;
  Json::Reader reader;
  ASSERT_TRUE(reader.parse(script_->ConfigJson(), root));
  EXPECT_EQ(kSiteUrl, root["baseUrl"].asString());
  EXPECT_EQ(kCdnBaseUrl, root["cdnBaseUrl"].asString());
  ASSERT_EQ(11U, root["fileTypes"].size());
  EXPECT_EQ("js", root["fileTypes"][0].asString());
  EXPECT_EQ("eot", root["fileTypes"][10].asString());
  ASSERT_EQ(2U, root["excludedPaths"].size());
  EXPECT_EQ("/wp-admin/*", root["excludedPaths"][0].asString());
  EXPECT_EQ("/wp-login.php", root["excludedPaths"][1].asString());
}

// The client applies the same rules as the server: fileTypes must be the
// snapshot's extensions and excludedPaths its rules as written, with a
// trailing '*' marking a prefix rule.
TEST_F(CdnConfigScriptTest, JsonMatchesSnapshotRules) {
  options_.set_file_types(".CSS, png");
  options_.set_excluded_paths("/private/*, /exact.js");
  ResetRewriter();

  Json::Value root;
  Json::Reader reader;
  ASSERT_TRUE(reader.parse(script_->ConfigJson(), root));

  const StringVector& file_types = config().file_types();
  ASSERT_EQ(2U, file_types.size());
  ASSERT_EQ(file_types.size(), root["fileTypes"].size());
  for (int i = 0, n = file_types.size(); i < n; ++i) {
    EXPECT_EQ(file_types[i], root["fileTypes"][i].asString());
  }
  EXPECT_EQ("css", root["fileTypes"][0].asString());
  EXPECT_EQ("png", root["fileTypes"][1].asString());

  const PathRuleVector& rules = config().excluded_path_rules();
  ASSERT_EQ(2U, rules.size());
  ASSERT_EQ(rules.size(), root["excludedPaths"].size());
  for (int i = 0, n = rules.size(); i < n; ++i) {
    GoogleString path = root["excludedPaths"][i].asString();
    EXPECT_EQ(rules[i].spec(), path);
    EXPECT_EQ(rules[i].is_prefix(), StringPiece(path).ends_with("*"));
  }
  EXPECT_EQ("/private/*", root["excludedPaths"][0].asString());
  EXPECT_EQ("/exact.js", root["excludedPaths"][1].asString());

  EXPECT_TRUE(config().IsExcludedPath("/private/a/b.css"));
  EXPECT_TRUE(config().IsExcludedPath("/exact.js"));
  EXPECT_FALSE(config().IsExcludedPath("/exact.js/more"));
}

TEST_F(CdnConfigScriptTest, JsonCannotCloseScript) {
  options_.set_site_url("https://site.example/</script><script>alert(1)");
  ResetRewriter();
  GoogleString json = script_->ConfigJson();
  EXPECT_EQ(GoogleString::npos, json.find("</"));
  EXPECT_HAS_SUBSTR("<\\/script>", json);
}

TEST_F(CdnConfigScriptTest, EmitsScriptElement) {
  GoogleString out = Emit();
  EXPECT_TRUE(
      StringPiece(out).starts_with("<script type=\"text/javascript\">"));
  EXPECT_HAS_SUBSTR(
      StrCat("window.cdnMirrorConfig = ", script_->ConfigJson(), ";"), out);
  EXPECT_HAS_SUBSTR(JS_cdn_rewriter, out);
  EXPECT_HAS_SUBSTR("MutationObserver", out);
  EXPECT_TRUE(StringPiece(out).ends_with("</script>"));
  EXPECT_EQ(out, script_->ScriptElement());
}

TEST_F(CdnConfigScriptTest, NothingWhenDisabled) {
  options_.set_enabled(false);
  ResetRewriter();
  EXPECT_EQ("", Emit());
}

TEST_F(CdnConfigScriptTest, NothingWithoutBase) {
  options_.set_explicit_cdn_base_url("");
  ResetRewriter();
  EXPECT_EQ("", Emit());
}

TEST_F(CdnConfigScriptTest, NothingInAdminContext) {
  request_context()->set_admin_request(true);
  EXPECT_EQ("", Emit());
}

TEST(CdnConfigScriptInsertTest, InsertAfterHeadTag) {
  GoogleString html =
      "<html><header>x</header><HEAD lang=\"en\"><title>t</title></HEAD>";
  EXPECT_TRUE(CdnConfigScript::InsertAfterHeadTag("<s></s>", &html));
  EXPECT_EQ("<html><header>x</header><HEAD lang=\"en\"><s></s><title>t"
            "</title></HEAD>", html);

  html = "<head><title>t</title>";
  EXPECT_TRUE(CdnConfigScript::InsertAfterHeadTag("<s></s>", &html));
  EXPECT_EQ("<head><s></s><title>t</title>", html);
}

TEST(CdnConfigScriptInsertTest, NoHeadTag) {
  GoogleString html = "<html><header>x</header><body></body>";
  EXPECT_FALSE(CdnConfigScript::InsertAfterHeadTag("<s></s>", &html));
  EXPECT_EQ("<html><header>x</header><body></body>", html);

  html = "<p>fragment</p><head";
  EXPECT_FALSE(CdnConfigScript::InsertAfterHeadTag("<s></s>", &html));
  EXPECT_EQ("<p>fragment</p><head", html);
}

}  // namespace

}  // namespace net_cdnmirror
