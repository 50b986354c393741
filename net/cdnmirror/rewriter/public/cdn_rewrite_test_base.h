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

// Base class for tests that rewrite urls or content through a
// CdnUrlRewriter configured like a typical installation.

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_CDN_REWRITE_TEST_BASE_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_CDN_REWRITE_TEST_BASE_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/gtest.h"
#include "cdnmirror/kernel/base/mock_message_handler.h"
#include "cdnmirror/kernel/base/scoped_ptr.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"
#include "net/cdnmirror/rewriter/public/cdn_config_snapshot.h"
#include "net/cdnmirror/rewriter/public/cdn_options.h"
#include "net/cdnmirror/rewriter/public/cdn_request_context.h"
#include "net/cdnmirror/rewriter/public/cdn_url_rewriter.h"
#include "net/cdnmirror/rewriter/public/remote_path_resolver.h"

namespace net_cdnmirror {

class CdnRewriteTestBase : public testing::Test {
 protected:
  static const char kSiteUrl[];
  static const char kCdnBaseUrl[];

  CdnRewriteTestBase();
  virtual ~CdnRewriteTestBase();

  virtual void SetUp();

  // Rebuilds the snapshot and everything that depends on it from
  // options_.  Call after changing options_.
  virtual void ResetRewriter();

  GoogleString Rewrite(const StringPiece& url) {
    return rewriter_->Rewrite(url);
  }

  // kCdnBaseUrl followed by path, e.g. CdnUrl("wp-content/a.css").
  GoogleString CdnUrl(const StringPiece& path) const {
    return StrCat(kCdnBaseUrl, path);
  }

  // kSiteUrl followed by path, e.g. SiteUrl("/wp-content/a.css").
  GoogleString SiteUrl(const StringPiece& path) const {
    return StrCat(kSiteUrl, path);
  }

  CdnOptions* options() { return &options_; }
  const CdnConfigSnapshot& config() const { return *config_; }
  CdnUrlRewriter* rewriter() { return rewriter_.get(); }
  CdnRequestContext* request_context() { return &request_context_; }

  CdnOptions options_;
  CdnRequestContext request_context_;
  MockMessageHandler message_handler_;
  scoped_ptr<CdnConfigSnapshot> config_;
  scoped_ptr<SiteRootPathResolver> resolver_;
  scoped_ptr<CdnUrlRewriter> rewriter_;

 private:
  DISALLOW_COPY_AND_ASSIGN(CdnRewriteTestBase);
};

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_CDN_REWRITE_TEST_BASE_H_
