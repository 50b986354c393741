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

#include "net/cdnmirror/rewriter/public/cdn_rewrite_test_base.h"

namespace net_cdnmirror {

const char CdnRewriteTestBase::kSiteUrl[] = "https://site.example";
const char CdnRewriteTestBase::kCdnBaseUrl[] =
    "https://cdn.example/user/repo@main/";

CdnRewriteTestBase::CdnRewriteTestBase() {
  options_.set_enabled(true);
  options_.set_site_url(kSiteUrl);
  options_.set_explicit_cdn_base_url(kCdnBaseUrl);
}

CdnRewriteTestBase::~CdnRewriteTestBase() {
}

void CdnRewriteTestBase::SetUp() {
  testing::Test::SetUp();
  ResetRewriter();
}

void CdnRewriteTestBase::ResetRewriter() {
  // The rewriter points at the snapshot and resolver, so it goes first.
  rewriter_.reset(NULL);
  resolver_.reset(NULL);
  config_.reset(new CdnConfigSnapshot(options_));
  resolver_.reset(new SiteRootPathResolver(config_.get()));
  rewriter_.reset(new CdnUrlRewriter(config_.get(), resolver_.get(),
                                     &request_context_, &message_handler_));
}

}  // namespace net_cdnmirror
