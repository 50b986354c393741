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

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_CDN_URL_CACHE_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_CDN_URL_CACHE_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

class Hasher;

// Remembers the result of rewriting each url seen while rendering one
// page.  Entries are never evicted; Clear() must be called before an
// instance is reused for another request.
class CdnUrlCache {
 public:
  // hasher is not owned.
  explicit CdnUrlCache(const Hasher* hasher);
  ~CdnUrlCache();

  // Returns true and sets *rewritten if url has been seen.
  bool Lookup(const StringPiece& url, GoogleString* rewritten) const;
  void Insert(const StringPiece& url, const StringPiece& rewritten);
  void Clear();

  int size() const { return map_.size(); }

  GoogleString CacheKey(const StringPiece& url) const;

 private:
  const Hasher* hasher_;
  StringStringMap map_;

  DISALLOW_COPY_AND_ASSIGN(CdnUrlCache);
};

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_CDN_URL_CACHE_H_
