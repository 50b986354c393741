/*
 * Copyright 2012 Google Inc.
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

#ifndef CDNMIRROR_KERNEL_UTIL_RE2_H_
#define CDNMIRROR_KERNEL_UTIL_RE2_H_

#include "cdnmirror/kernel/base/string_util.h"

#include "re2/re2.h"

using re2::RE2;

typedef re2::StringPiece Re2StringPiece;

// RE2 captures into its own StringPiece type; this views the same bytes as
// a chromium StringPiece.
inline StringPiece Re2ToStringPiece(re2::StringPiece sp) {
  return StringPiece(sp.data(), sp.size());
}

#endif  // CDNMIRROR_KERNEL_UTIL_RE2_H_
