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

#include "net/cdnmirror/rewriter/public/path_rule.h"

#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

PathRule::PathRule(const StringPiece& spec)
    : is_prefix_(spec.ends_with("*")) {
  spec.CopyToString(&spec_);
  StringPiece pattern(spec);
  if (is_prefix_) {
    pattern.remove_suffix(1);
  }
  pattern.CopyToString(&pattern_);
}

bool PathRule::Matches(const StringPiece& path) const {
  if (is_prefix_) {
    return path.starts_with(pattern_);
  }
  return path == pattern_;
}

}  // namespace net_cdnmirror
