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

#include "cdnmirror/kernel/base/md5_hasher.h"

#include "base/md5.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

namespace {

const int kMD5NumBytes = sizeof(base::MD5Digest);

}  // namespace

MD5Hasher::~MD5Hasher() {
}

GoogleString MD5Hasher::RawHash(const StringPiece& content) const {
  // The MD5Context is cheap to set up compared to MD5Update, so a fresh
  // one per call keeps this const and reentrant.
  base::MD5Digest digest;
  base::MD5Sum(content.data(), content.size(), &digest);
  // Note: digest.a is an unsigned char[16] so it's not null-terminated.
  GoogleString raw_hash(reinterpret_cast<char*>(digest.a), sizeof(digest.a));
  return raw_hash;
}

int MD5Hasher::RawHashSizeInBytes() const {
  return kMD5NumBytes;
}

}  // namespace net_cdnmirror
