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

#include "net/cdnmirror/rewriter/public/cdn_path_mapper.h"

#include "net/cdnmirror/rewriter/public/cdn_config_snapshot.h"
#include "net/cdnmirror/rewriter/public/remote_path_resolver.h"

namespace net_cdnmirror {

CdnPathMapper::CdnPathMapper(const CdnConfigSnapshot* config,
                             const RemotePathResolver* resolver)
    : config_(config),
      resolver_(resolver) {
}

CdnPathMapper::~CdnPathMapper() {
}

GoogleString CdnPathMapper::MapToCdnUrl(const StringPiece& url) const {
  return JoinCdnUrl(config_->cdn_base_url(), resolver_->RemotePathForUrl(url));
}

GoogleString CdnPathMapper::JoinCdnUrl(const StringPiece& base,
                                       const StringPiece& remote_path) {
  StringPiece trimmed_base(base);
  while (trimmed_base.ends_with("/")) {
    trimmed_base.remove_suffix(1);
  }
  StringPiece trimmed_path(remote_path);
  while (trimmed_path.starts_with("/")) {
    trimmed_path.remove_prefix(1);
  }
  return StrCat(trimmed_base, "/", trimmed_path);
}

}  // namespace net_cdnmirror
