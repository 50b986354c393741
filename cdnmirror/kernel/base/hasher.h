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

#ifndef CDNMIRROR_KERNEL_BASE_HASHER_H_
#define CDNMIRROR_KERNEL_BASE_HASHER_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

// Interface for a hash function.
class Hasher {
 public:
  Hasher() {}
  virtual ~Hasher();

  // Computes a lower-case hexadecimal hash of the content.
  GoogleString Hash(const StringPiece& content) const;

  // Computes a binary hash of the given content. The returned value
  // is not printable as it is the direct binary encoding of the hash.
  virtual GoogleString RawHash(const StringPiece& content) const = 0;

  // The number of bytes RawHash will produce.
  virtual int RawHashSizeInBytes() const = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(Hasher);
};

}  // namespace net_cdnmirror

#endif  // CDNMIRROR_KERNEL_BASE_HASHER_H_
