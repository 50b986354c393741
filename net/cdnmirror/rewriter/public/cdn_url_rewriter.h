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

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_CDN_URL_REWRITER_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_CDN_URL_REWRITER_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/md5_hasher.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"
#include "net/cdnmirror/rewriter/public/cdn_path_mapper.h"
#include "net/cdnmirror/rewriter/public/cdn_url_cache.h"

namespace net_cdnmirror {

class CdnConfigSnapshot;
class CdnRequestContext;
class MessageHandler;
class RemotePathResolver;

// Rewrites one asset url to its CDN location, or returns it unchanged.
// This is the primitive the content scanner and the image rewriters are
// built on.  Results are cached for the life of the rewriter, so one
// instance should serve one request; call ClearCache() before reusing it.
class CdnUrlRewriter {
 public:
  // None of the arguments are owned, and all must outlive the rewriter.
  CdnUrlRewriter(const CdnConfigSnapshot* config,
                 const RemotePathResolver* resolver,
                 const CdnRequestContext* request_context,
                 MessageHandler* handler);
  ~CdnUrlRewriter();

  // Returns the CDN url for url, or url itself if it is not eligible.
  // Nothing is cached while in an admin context, while rewriting is
  // disabled, or for urls naming the admin area.
  GoogleString Rewrite(const StringPiece& url);

  // True if Rewrite() could change anything for this request.
  bool RewritingActive() const;

  void ClearCache() { cache_.Clear(); }
  const CdnUrlCache& cache() const { return cache_; }

  const CdnConfigSnapshot* config() const { return config_; }
  const CdnRequestContext* request_context() const { return request_context_; }

 private:
  const CdnConfigSnapshot* config_;
  const CdnRequestContext* request_context_;
  MessageHandler* handler_;
  MD5Hasher hasher_;
  CdnUrlCache cache_;
  CdnPathMapper mapper_;

  DISALLOW_COPY_AND_ASSIGN(CdnUrlRewriter);
};

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_CDN_URL_REWRITER_H_
