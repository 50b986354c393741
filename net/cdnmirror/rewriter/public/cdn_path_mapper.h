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

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_CDN_PATH_MAPPER_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_CDN_PATH_MAPPER_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

class CdnConfigSnapshot;
class RemotePathResolver;

// Composes the CDN url for an eligible origin reference.
class CdnPathMapper {
 public:
  // Neither argument is owned.
  CdnPathMapper(const CdnConfigSnapshot* config,
                const RemotePathResolver* resolver);
  ~CdnPathMapper();

  // Only meaningful for urls that passed UrlEligibility::ShouldRewrite.
  GoogleString MapToCdnUrl(const StringPiece& url) const;

  // Joins base and remote_path with exactly one '/' between them.  No
  // characters are escaped or unescaped.
  static GoogleString JoinCdnUrl(const StringPiece& base,
                                 const StringPiece& remote_path);

 private:
  const CdnConfigSnapshot* config_;
  const RemotePathResolver* resolver_;

  DISALLOW_COPY_AND_ASSIGN(CdnPathMapper);
};

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_CDN_PATH_MAPPER_H_
