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

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_URL_ELIGIBILITY_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_URL_ELIGIBILITY_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

class CdnConfigSnapshot;

// Decides whether an asset reference found in a page may be served from
// the CDN mirror.  A reference qualifies when it is a same-origin (or
// relative) reference to a file with an accepted extension that is not
// under an excluded path or the site's admin area.
class UrlEligibility {
 public:
  // Path fragments identifying the admin area and the login page.  A url
  // containing either anywhere is never rewritten.
  static const char kAdminMarker[];
  static const char kLoginMarker[];

  static bool ShouldRewrite(const StringPiece& url,
                            const CdnConfigSnapshot& config);

  static bool HasAdminMarker(const StringPiece& url);

  // True for "data:" urls, in any case.
  static bool IsDataUrl(const StringPiece& url);

  // True if url spells its authority as "//host" right after the scheme
  // (or at the start, for protocol-relative urls), with no backslash
  // before the query.  The path mapper reads the authority textually, so
  // urls that only parse with the browser's fixups are not rewritten.
  static bool HasLiteralAuthority(const StringPiece& url);

  // Finds the path that exclusion rules and extension checks apply to.
  // Absolute and protocol-relative urls must have a literal authority and
  // the same origin as the site, and yield their path without query.
  // Other references are cut at the first '?' or '#' and used as written.
  // Returns false if there is no usable path.
  static bool ExtractSameOriginPath(const StringPiece& url,
                                    const CdnConfigSnapshot& config,
                                    GoogleString* path);

  // Sets *ext to the lower-cased text after the last '.' of the final path
  // segment.  Returns false if the segment has no '.' or ends with one.
  static bool ExtractExtension(const StringPiece& path, GoogleString* ext);

 private:
  DISALLOW_IMPLICIT_CONSTRUCTORS(UrlEligibility);
};

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_URL_ELIGIBILITY_H_
