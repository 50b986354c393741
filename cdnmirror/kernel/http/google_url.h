/*
 * Copyright 2010 Google Inc.
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

#ifndef CDNMIRROR_KERNEL_HTTP_GOOGLE_URL_H_
#define CDNMIRROR_KERNEL_HTTP_GOOGLE_URL_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

#include "googleurl/src/gurl.h"

namespace net_cdnmirror {

enum UrlRelativity {
  kAbsoluteUrl,   // http://example.com/foo/bar/file.ext?k=v#f
  kNetPath,       // //example.com/foo/bar/file.ext?k=v#f
  kAbsolutePath,  // /foo/bar/file.ext?k=v#f
  kRelativePath,  // bar/file.ext?k=v#f
};

// The parts of a GURL that asset rewriting compares: its origin and its
// path.  Both accessors return views into the canonicalized spec.
class GoogleUrl {
 public:
  explicit GoogleUrl(const StringPiece& sp);

  // Creates a new GoogleUrl by resolving relative against base.
  GoogleUrl(const GoogleUrl& base, const StringPiece& relative);

  // Returns true if the url is valid and its scheme is http or https.
  bool IsWebValid() const { return is_web_valid_; }

  // Returns true if the url is valid, regardless of scheme.
  bool IsAnyValid() const { return gurl_.is_valid(); }

  // For "http://a.com:8080/b/c?d" returns "http://a.com:8080", without the
  // trailing slash.  The default port is never shown.
  StringPiece Origin() const;

  // For "http://a.com/b/c/d.css?q=v" returns "/b/c/d.css", including the
  // leading slash.
  StringPiece PathSansQuery() const;

  // Classifies a url string by how much of it would need resolving against
  // a base.  Does not require the string to be a valid url.
  static UrlRelativity FindRelativity(const StringPiece& url);

 private:
  void Init();

  GURL gurl_;
  bool is_web_valid_;

  DISALLOW_COPY_AND_ASSIGN(GoogleUrl);
};

}  // namespace net_cdnmirror

#endif  // CDNMIRROR_KERNEL_HTTP_GOOGLE_URL_H_
