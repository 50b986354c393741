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

#include "cdnmirror/kernel/base/hasher.h"

#include "base/logging.h"
#include "base/strings/string_number_conversions.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

Hasher::~Hasher() {
}

GoogleString Hasher::Hash(const StringPiece& content) const {
  GoogleString raw_hash = RawHash(content);
  DCHECK_EQ(static_cast<size_t>(RawHashSizeInBytes()), raw_hash.size());
  GoogleString out = base::HexEncode(raw_hash.data(), raw_hash.size());
  LowerString(&out);
  return out;
}

}  // namespace net_cdnmirror
