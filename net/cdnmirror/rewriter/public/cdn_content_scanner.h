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

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_CDN_CONTENT_SCANNER_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_CDN_CONTENT_SCANNER_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"
#include "cdnmirror/kernel/util/re2.h"

namespace net_cdnmirror {

class CdnUrlRewriter;

// Finds asset references in an HTML fragment and points them at the CDN.
// This is a textual scan with regular expressions, not an HTML parse:
// only the url tokens themselves are substituted, and everything around
// them is left byte-for-byte as it was.  A tag that doesn't match (e.g.
// one that is never closed) is simply not rewritten.
//
// References are looked for in this order, each pass seeing the output of
// the previous one:
//   1. <img src=...>
//   2. <link href=...>
//   3. <script src=...>
//   4. background and background-image url(...) in style attributes
//   5. url(...) inside <style> blocks
class CdnContentScanner {
 public:
  // rewriter is not owned.
  explicit CdnContentScanner(CdnUrlRewriter* rewriter);
  ~CdnContentScanner();

  GoogleString RewriteContent(const StringPiece& html);

  // Replaces every occurrence in *text of a key of replacements that
  // stands as a whole url token.  A token starts at the start of text, or
  // after whitespace or one of "'(=,> and ends at the end of text, or
  // before whitespace or one of "')<>, characters.  Where keys overlap the
  // longest wins.  Replacements are made in one pass, so replaced text is
  // never matched again.  Returns the number of replacements.
  static int ReplaceUrlTokens(const StringStringMap& replacements,
                              GoogleString* text);

 private:
  // Rewrites the urls captured by an attribute pattern wherever they occur
  // in *html.
  void RewriteAttributeUrls(const RE2& pattern, GoogleString* html);
  void RewriteInlineStyles(GoogleString* html);
  void RewriteStyleBlocks(GoogleString* html);

  // Rewrites every url(...) in css, returning true if any changed.
  bool RewriteCssUrls(GoogleString* css);

  // Records url -> rewritten in *replacements if the rewriter changes it.
  void AddReplacement(const StringPiece& url, StringStringMap* replacements);

  CdnUrlRewriter* rewriter_;
  RE2 img_src_pattern_;
  RE2 link_href_pattern_;
  RE2 script_src_pattern_;
  RE2 inline_style_pattern_;
  RE2 style_block_pattern_;
  RE2 css_url_pattern_;

  DISALLOW_COPY_AND_ASSIGN(CdnContentScanner);
};

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_CDN_CONTENT_SCANNER_H_
