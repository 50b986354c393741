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

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_CDN_CONFIG_SNAPSHOT_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_CDN_CONFIG_SNAPSHOT_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"
#include "cdnmirror/kernel/http/google_url.h"
#include "net/cdnmirror/rewriter/public/path_rule.h"

namespace net_cdnmirror {

class CdnOptions;

// Read-only view of the CDN settings for one request.  Built once from
// CdnOptions before rendering starts and shared by reference with every
// component that processes the request.  Nothing in it changes after
// construction.
class CdnConfigSnapshot {
 public:
  explicit CdnConfigSnapshot(const CdnOptions& options);
  ~CdnConfigSnapshot();

  // True if rewriting can happen at all: enabled, with a CDN base.
  bool active() const { return enabled_ && !cdn_base_url_.empty(); }

  // True if ext (lower-case, no leading dot) is one of the accepted
  // file types.
  bool IsAcceptedExtension(const StringPiece& ext) const;

  // True if path matches any of the excluded-path rules.
  bool IsExcludedPath(const StringPiece& path) const;

  bool enabled() const { return enabled_; }
  bool debug() const { return debug_; }
  const GoogleString& cdn_base_url() const { return cdn_base_url_; }

  // The absolute url of the serving site, e.g. "https://site.example/blog".
  const GoogleString& site_url() const { return site_url_; }
  const GoogleUrl& site_gurl() const { return site_gurl_; }

  const StringVector& file_types() const { return file_types_; }
  const PathRuleVector& excluded_path_rules() const {
    return excluded_path_rules_;
  }

 private:
  const bool enabled_;
  const bool debug_;
  const GoogleString cdn_base_url_;
  const GoogleString site_url_;
  GoogleUrl site_gurl_;
  StringVector file_types_;
  StringSet accepted_extensions_;
  PathRuleVector excluded_path_rules_;

  DISALLOW_COPY_AND_ASSIGN(CdnConfigSnapshot);
};

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_CDN_CONFIG_SNAPSHOT_H_
