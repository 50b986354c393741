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

#include "net/cdnmirror/rewriter/public/cdn_url_rewriter.h"

#include "cdnmirror/kernel/base/message_handler.h"
#include "net/cdnmirror/rewriter/public/cdn_config_snapshot.h"
#include "net/cdnmirror/rewriter/public/cdn_request_context.h"
#include "net/cdnmirror/rewriter/public/url_eligibility.h"

namespace net_cdnmirror {

CdnUrlRewriter::CdnUrlRewriter(const CdnConfigSnapshot* config,
                               const RemotePathResolver* resolver,
                               const CdnRequestContext* request_context,
                               MessageHandler* handler)
    : config_(config),
      request_context_(request_context),
      handler_(handler),
      cache_(&hasher_),
      mapper_(config, resolver) {
}

CdnUrlRewriter::~CdnUrlRewriter() {
}

bool CdnUrlRewriter::RewritingActive() const {
  return config_->active() && !request_context_->InAdminContext();
}

GoogleString CdnUrlRewriter::Rewrite(const StringPiece& url) {
  if (request_context_->InAdminContext()) {
    return url.as_string();
  }

  // Admin-area urls are left out of the cache so that a rewriter shared
  // between admin and front-end phases never replays those decisions.
  if (!config_->enabled() || url.empty() ||
      UrlEligibility::HasAdminMarker(url)) {
    return url.as_string();
  }

  GoogleString rewritten;
  if (cache_.Lookup(url, &rewritten)) {
    return rewritten;
  }

  if (config_->cdn_base_url().empty() ||
      !UrlEligibility::ShouldRewrite(url, *config_)) {
    url.CopyToString(&rewritten);
  } else {
    rewritten = mapper_.MapToCdnUrl(url);
    if (config_->debug()) {
      GoogleString url_string = url.as_string();
      handler_->Message(kInfo, "Rewrote URL: %s to %s", url_string.c_str(),
                        rewritten.c_str());
    }
  }
  cache_.Insert(url, rewritten);
  return rewritten;
}

}  // namespace net_cdnmirror
