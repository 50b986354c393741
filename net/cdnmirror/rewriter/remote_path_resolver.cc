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

#include "net/cdnmirror/rewriter/public/remote_path_resolver.h"

#include "cdnmirror/kernel/http/google_url.h"
#include "net/cdnmirror/rewriter/public/cdn_config_snapshot.h"

namespace net_cdnmirror {

RemotePathResolver::~RemotePathResolver() {
}

SiteRootPathResolver::SiteRootPathResolver(const CdnConfigSnapshot* config) {
  const GoogleUrl& site = config->site_gurl();
  if (site.IsWebValid()) {
    StringPiece path = site.PathSansQuery();
    while (path.ends_with("/")) {
      path.remove_suffix(1);
    }
    path.CopyToString(&site_path_);
  }
}

SiteRootPathResolver::~SiteRootPathResolver() {
}

GoogleString SiteRootPathResolver::RemotePathForUrl(
    const StringPiece& url) const {
  StringPiece path(url);
  switch (GoogleUrl::FindRelativity(url)) {
    case kAbsoluteUrl:
    case kNetPath: {
      // Drop scheme and authority, leaving "/path?query#fragment".
      stringpiece_ssize_type authority = path.find("//");
      if (authority == StringPiece::npos) {
        return url.as_string();
      }
      stringpiece_ssize_type end = path.find_first_of("/?#", authority + 2);
      if (end == StringPiece::npos) {
        return "";
      }
      path.remove_prefix(end);
      break;
    }
    case kAbsolutePath:
      break;
    case kRelativePath:
      return url.as_string();
  }

  if (!site_path_.empty() && path.starts_with(site_path_)) {
    StringPiece rest = path.substr(site_path_.size());
    if (rest.empty() || rest[0] == '/' || rest[0] == '?' || rest[0] == '#') {
      path = rest;
    }
  }
  return path.as_string();
}

}  // namespace net_cdnmirror
