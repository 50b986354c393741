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

#include "net/cdnmirror/rewriter/public/cdn_url_cache.h"

#include "cdnmirror/kernel/base/hasher.h"

namespace net_cdnmirror {

CdnUrlCache::CdnUrlCache(const Hasher* hasher) : hasher_(hasher) {
}

CdnUrlCache::~CdnUrlCache() {
}

GoogleString CdnUrlCache::CacheKey(const StringPiece& url) const {
  return hasher_->Hash(url);
}

bool CdnUrlCache::Lookup(const StringPiece& url,
                         GoogleString* rewritten) const {
  StringStringMap::const_iterator p = map_.find(CacheKey(url));
  if (p == map_.end()) {
    return false;
  }
  *rewritten = p->second;
  return true;
}

void CdnUrlCache::Insert(const StringPiece& url,
                         const StringPiece& rewritten) {
  rewritten.CopyToString(&map_[CacheKey(url)]);
}

void CdnUrlCache::Clear() {
  map_.clear();
}

}  // namespace net_cdnmirror
