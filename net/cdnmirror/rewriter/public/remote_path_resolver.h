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

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_REMOTE_PATH_RESOLVER_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_REMOTE_PATH_RESOLVER_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

class CdnConfigSnapshot;

// Finds where an origin asset lives in the mirror, relative to the CDN
// base.  How the mirror is laid out is up to whoever publishes it.
class RemotePathResolver {
 public:
  RemotePathResolver() {}
  virtual ~RemotePathResolver();

  // Only called for urls that passed UrlEligibility::ShouldRewrite.
  virtual GoogleString RemotePathForUrl(const StringPiece& url) const = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(RemotePathResolver);
};

// Mirrors the site root: "https://site.example/blog/wp-content/a.css?v=2"
// on a site installed at "https://site.example/blog" maps to
// "/wp-content/a.css?v=2".  Query and fragment are kept as written.
// Relative references are returned unchanged.
class SiteRootPathResolver : public RemotePathResolver {
 public:
  explicit SiteRootPathResolver(const CdnConfigSnapshot* config);
  virtual ~SiteRootPathResolver();

  virtual GoogleString RemotePathForUrl(const StringPiece& url) const;

 private:
  // Site path without trailing slash, e.g. "/blog", or "" at the root.
  GoogleString site_path_;

  DISALLOW_COPY_AND_ASSIGN(SiteRootPathResolver);
};

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_REMOTE_PATH_RESOLVER_H_
