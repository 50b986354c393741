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

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_PATH_RULE_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_PATH_RULE_H_

#include <vector>

#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

// An excluded-path rule.  A rule written with a trailing '*' is a prefix
// rule: "/wp-admin/*" matches every path starting with "/wp-admin/".  Any
// other rule must equal the path exactly.  '*' elsewhere in the rule has no
// special meaning.
class PathRule {
 public:
  explicit PathRule(const StringPiece& spec);

  bool Matches(const StringPiece& path) const;

  // The rule as written, including any trailing '*'.
  const GoogleString& spec() const { return spec_; }
  bool is_prefix() const { return is_prefix_; }

 private:
  GoogleString spec_;
  GoogleString pattern_;
  bool is_prefix_;

  // Copy and assign are OK.
};

typedef std::vector<PathRule> PathRuleVector;

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_PATH_RULE_H_
