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

#include "net/cdnmirror/rewriter/public/cdn_integration.h"

#include "cdnmirror/kernel/base/message_handler.h"
#include "net/cdnmirror/rewriter/public/cdn_config_script.h"
#include "net/cdnmirror/rewriter/public/cdn_config_snapshot.h"
#include "net/cdnmirror/rewriter/public/cdn_content_scanner.h"
#include "net/cdnmirror/rewriter/public/cdn_hook_registry.h"
#include "net/cdnmirror/rewriter/public/cdn_options.h"
#include "net/cdnmirror/rewriter/public/cdn_request_context.h"
#include "net/cdnmirror/rewriter/public/cdn_url_rewriter.h"
#include "net/cdnmirror/rewriter/public/remote_path_resolver.h"

namespace net_cdnmirror {

const char CdnIntegration::kHeadHook[] = "wp_head";
const char CdnIntegration::kStyleLoaderSrcHook[] = "style_loader_src";
const char CdnIntegration::kScriptLoaderSrcHook[] = "script_loader_src";
const char CdnIntegration::kContentHook[] = "the_content";
const char CdnIntegration::kAttachmentUrlHook[] = "wp_get_attachment_url";
const char CdnIntegration::kAttachmentImageSrcHook[] =
    "wp_get_attachment_image_src";
const char CdnIntegration::kImageSrcsetHook[] = "wp_calculate_image_srcset";

const int CdnIntegration::kConfigScriptPriority;
const int CdnIntegration::kRewritePriority;

CdnIntegration::CdnIntegration(const CdnOptions& options,
                               const CdnRequestContext* request_context,
                               MessageHandler* handler)
    : request_context_(request_context),
      config_(new CdnConfigSnapshot(options)) {
  resolver_.reset(new SiteRootPathResolver(config_.get()));
  url_rewriter_.reset(new CdnUrlRewriter(config_.get(), resolver_.get(),
                                         request_context, handler));
  content_scanner_.reset(new CdnContentScanner(url_rewriter_.get()));
  image_rewriter_.reset(new ImageUrlRewriter(url_rewriter_.get()));
  config_script_.reset(new CdnConfigScript(config_.get(), request_context));
}

CdnIntegration::~CdnIntegration() {
}

GoogleString CdnIntegration::RewriteUrl(const StringPiece& url) {
  return url_rewriter_->Rewrite(url);
}

GoogleString CdnIntegration::RewriteContentUrls(const StringPiece& html) {
  return content_scanner_->RewriteContent(html);
}

void CdnIntegration::RewriteImageSrc(ImageSource* image) {
  image_rewriter_->RewriteImageSource(image);
}

void CdnIntegration::RewriteImageSrcset(SrcsetCandidateVector* candidates) {
  image_rewriter_->RewriteSrcsetCandidates(candidates);
}

GoogleString CdnIntegration::RewriteSrcsetAttribute(
    const StringPiece& srcset) {
  return image_rewriter_->RewriteSrcsetAttribute(srcset);
}

bool CdnIntegration::EmitConfigScript(Writer* writer,
                                      MessageHandler* handler) {
  return config_script_->Emit(writer, handler);
}

void CdnIntegration::FilterUrl(const StringPiece& url, GoogleString* out) {
  *out = RewriteUrl(url);
}

void CdnIntegration::FilterContent(const StringPiece& html,
                                   GoogleString* out) {
  *out = RewriteContentUrls(html);
}

void CdnIntegration::EmitConfigScriptAction(Writer* writer,
                                            MessageHandler* handler) {
  if (!EmitConfigScript(writer, handler)) {
    handler->Message(kError, "Failed to write the CDN config script");
  }
}

void CdnIntegration::RegisterHooks(CdnHookRegistry* registry) {
  if (!config_->enabled() || request_context_->admin_request()) {
    return;
  }
  registry->AddAction(
      kHeadHook, kConfigScriptPriority,
      NewPermanentCallback(this, &CdnIntegration::EmitConfigScriptAction));

  const char* const kUrlHooks[] = {
    kStyleLoaderSrcHook, kScriptLoaderSrcHook, kAttachmentUrlHook
  };
  for (int i = 0; i < static_cast<int>(arraysize(kUrlHooks)); ++i) {
    registry->AddFilter(
        kUrlHooks[i], kRewritePriority,
        NewPermanentCallback(this, &CdnIntegration::FilterUrl));
  }
  registry->AddFilter(
      kContentHook, kRewritePriority,
      NewPermanentCallback(this, &CdnIntegration::FilterContent));
  registry->AddImageSourceFilter(
      kAttachmentImageSrcHook, kRewritePriority,
      NewPermanentCallback(this, &CdnIntegration::RewriteImageSrc));
  registry->AddSrcsetFilter(
      kImageSrcsetHook, kRewritePriority,
      NewPermanentCallback(this, &CdnIntegration::RewriteImageSrcset));
}

}  // namespace net_cdnmirror
