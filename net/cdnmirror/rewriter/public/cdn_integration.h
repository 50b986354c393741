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

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_CDN_INTEGRATION_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_CDN_INTEGRATION_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/scoped_ptr.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"
#include "net/cdnmirror/rewriter/public/image_url_rewriter.h"

namespace net_cdnmirror {

class CdnConfigScript;
class CdnConfigSnapshot;
class CdnContentScanner;
class CdnHookRegistry;
class CdnOptions;
class CdnRequestContext;
class CdnUrlRewriter;
class MessageHandler;
class RemotePathResolver;
class Writer;

// Everything needed to rewrite one page: builds the configuration
// snapshot from the options and wires the rewriters to it.  Create one per
// request.
class CdnIntegration {
 public:
  static const char kHeadHook[];
  static const char kStyleLoaderSrcHook[];
  static const char kScriptLoaderSrcHook[];
  static const char kContentHook[];
  static const char kAttachmentUrlHook[];
  static const char kAttachmentImageSrcHook[];
  static const char kImageSrcsetHook[];

  // The config script goes in early; the rewrite filters run after
  // everything else has had its say.
  static const int kConfigScriptPriority = 5;
  static const int kRewritePriority = 9999;

  // request_context and handler are not owned.  The options are copied
  // into a snapshot, so later changes to them have no effect.
  CdnIntegration(const CdnOptions& options,
                 const CdnRequestContext* request_context,
                 MessageHandler* handler);
  ~CdnIntegration();

  GoogleString RewriteUrl(const StringPiece& url);
  GoogleString RewriteContentUrls(const StringPiece& html);
  void RewriteImageSrc(ImageSource* image);
  void RewriteImageSrcset(SrcsetCandidateVector* candidates);
  GoogleString RewriteSrcsetAttribute(const StringPiece& srcset);
  bool EmitConfigScript(Writer* writer, MessageHandler* handler);

  // Registers the url, content and image filters and the config script
  // action.
  // Registers nothing if rewriting is disabled or this is an admin request.
  // The registered callbacks point at this object, so it must outlive any
  // use of the registry.
  void RegisterHooks(CdnHookRegistry* registry);

  const CdnConfigSnapshot& config() const { return *config_; }
  CdnUrlRewriter* url_rewriter() { return url_rewriter_.get(); }

 private:
  void FilterUrl(const StringPiece& url, GoogleString* out);
  void FilterContent(const StringPiece& html, GoogleString* out);
  void EmitConfigScriptAction(Writer* writer, MessageHandler* handler);

  const CdnRequestContext* request_context_;
  scoped_ptr<CdnConfigSnapshot> config_;
  scoped_ptr<RemotePathResolver> resolver_;
  scoped_ptr<CdnUrlRewriter> url_rewriter_;
  scoped_ptr<CdnContentScanner> content_scanner_;
  scoped_ptr<ImageUrlRewriter> image_rewriter_;
  scoped_ptr<CdnConfigScript> config_script_;

  DISALLOW_COPY_AND_ASSIGN(CdnIntegration);
};

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_CDN_INTEGRATION_H_
