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

#include "net/cdnmirror/rewriter/public/cdn_config_snapshot.h"

#include "net/cdnmirror/rewriter/public/cdn_options.h"

namespace net_cdnmirror {

CdnConfigSnapshot::CdnConfigSnapshot(const CdnOptions& options)
    : enabled_(options.enabled()),
      debug_(options.debug()),
      cdn_base_url_(options.CdnBaseUrl()),
      site_url_(options.site_url()),
      site_gurl_(options.site_url()),
      file_types_(options.file_types()),
      accepted_extensions_(options.file_types().begin(),
                           options.file_types().end()) {
  const StringVector& excluded = options.excluded_paths();
  for (int i = 0, n = excluded.size(); i < n; ++i) {
    excluded_path_rules_.push_back(PathRule(excluded[i]));
  }
}

CdnConfigSnapshot::~CdnConfigSnapshot() {
}

bool CdnConfigSnapshot::IsAcceptedExtension(const StringPiece& ext) const {
  return accepted_extensions_.find(ext.as_string()) !=
      accepted_extensions_.end();
}

bool CdnConfigSnapshot::IsExcludedPath(const StringPiece& path) const {
  for (int i = 0, n = excluded_path_rules_.size(); i < n; ++i) {
    if (excluded_path_rules_[i].Matches(path)) {
      return true;
    }
  }
  return false;
}

}  // namespace net_cdnmirror
