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

#include "net/cdnmirror/rewriter/public/cdn_content_scanner.h"

#include <utility>
#include <vector>

#include "base/logging.h"
#include "net/cdnmirror/rewriter/public/cdn_url_rewriter.h"

namespace net_cdnmirror {

namespace {

const char kImgSrcPattern[] =
    "(?i)<img[^>]*src=['\"]([^'\"]+)['\"][^>]*>";
const char kLinkHrefPattern[] =
    "(?i)<link[^>]*href=['\"]([^'\"]+)['\"][^>]*>";
const char kScriptSrcPattern[] =
    "(?i)<script[^>]*src=['\"]([^'\"]+)['\"][^>]*>";

// Group 1 is the whole style attribute, group 2 the url.
const char kInlineStylePattern[] =
    "(style=['\"][^\"']*background(?:-image)?:\\s*"
    "url\\(['\"]?([^'\")\\s]+)['\"]?\\)[^\"']*['\"])";

const char kStyleBlockPattern[] = "(?is)<style[^>]*>(.*?)</style>";
const char kCssUrlPattern[] = "(?i)url\\(['\"]?([^'\")\\s]+)['\"]?\\)";

bool IsTokenStart(char c) {
  return (c == '"' || c == '\'' || c == '(' || c == '=' || c == ',' ||
          c == '>' || IsHtmlSpace(c));
}

bool IsTokenEnd(char c) {
  return (c == '"' || c == '\'' || c == ')' || c == ',' || c == '<' ||
          c == '>' || IsHtmlSpace(c));
}

}  // namespace

CdnContentScanner::CdnContentScanner(CdnUrlRewriter* rewriter)
    : rewriter_(rewriter),
      img_src_pattern_(kImgSrcPattern),
      link_href_pattern_(kLinkHrefPattern),
      script_src_pattern_(kScriptSrcPattern),
      inline_style_pattern_(kInlineStylePattern),
      style_block_pattern_(kStyleBlockPattern),
      css_url_pattern_(kCssUrlPattern) {
  DCHECK(img_src_pattern_.ok()) << img_src_pattern_.error();
  DCHECK(link_href_pattern_.ok()) << link_href_pattern_.error();
  DCHECK(script_src_pattern_.ok()) << script_src_pattern_.error();
  DCHECK(inline_style_pattern_.ok()) << inline_style_pattern_.error();
  DCHECK(style_block_pattern_.ok()) << style_block_pattern_.error();
  DCHECK(css_url_pattern_.ok()) << css_url_pattern_.error();
}

CdnContentScanner::~CdnContentScanner() {
}

GoogleString CdnContentScanner::RewriteContent(const StringPiece& html) {
  GoogleString result;
  html.CopyToString(&result);
  if (html.empty() || !rewriter_->RewritingActive()) {
    return result;
  }
  RewriteAttributeUrls(img_src_pattern_, &result);
  RewriteAttributeUrls(link_href_pattern_, &result);
  RewriteAttributeUrls(script_src_pattern_, &result);
  RewriteInlineStyles(&result);
  RewriteStyleBlocks(&result);
  return result;
}

void CdnContentScanner::AddReplacement(const StringPiece& url,
                                       StringStringMap* replacements) {
  GoogleString rewritten = rewriter_->Rewrite(url);
  if (rewritten != url) {
    (*replacements)[url.as_string()] = rewritten;
  }
}

void CdnContentScanner::RewriteAttributeUrls(const RE2& pattern,
                                             GoogleString* html) {
  StringStringMap replacements;
  Re2StringPiece input(*html);
  Re2StringPiece url;
  while (RE2::FindAndConsume(&input, pattern, &url)) {
    AddReplacement(Re2ToStringPiece(url), &replacements);
  }
  if (!replacements.empty()) {
    ReplaceUrlTokens(replacements, html);
  }
}

void CdnContentScanner::RewriteInlineStyles(GoogleString* html) {
  // The edits are collected first, as *html can't change under the scan.
  std::vector<std::pair<GoogleString, GoogleString> > edits;
  Re2StringPiece input(*html);
  Re2StringPiece unit, url;
  while (RE2::FindAndConsume(&input, inline_style_pattern_, &unit, &url)) {
    StringStringMap replacements;
    AddReplacement(Re2ToStringPiece(url), &replacements);
    if (replacements.empty()) {
      continue;
    }
    GoogleString new_unit(unit.data(), unit.size());
    if (ReplaceUrlTokens(replacements, &new_unit) > 0) {
      edits.push_back(std::make_pair(GoogleString(unit.data(), unit.size()),
                                     new_unit));
    }
  }
  for (int i = 0, n = edits.size(); i < n; ++i) {
    GlobalReplaceSubstring(edits[i].first, edits[i].second, html);
  }
}

bool CdnContentScanner::RewriteCssUrls(GoogleString* css) {
  StringStringMap replacements;
  Re2StringPiece input(*css);
  Re2StringPiece url;
  while (RE2::FindAndConsume(&input, css_url_pattern_, &url)) {
    AddReplacement(Re2ToStringPiece(url), &replacements);
  }
  return (!replacements.empty() && (ReplaceUrlTokens(replacements, css) > 0));
}

void CdnContentScanner::RewriteStyleBlocks(GoogleString* html) {
  // Each block is rewritten on its own and spliced back at its position,
  // so one block's urls never leak into another.
  GoogleString result;
  size_t copied = 0;
  Re2StringPiece input(*html);
  Re2StringPiece block;
  while (RE2::FindAndConsume(&input, style_block_pattern_, &block)) {
    GoogleString css(block.data(), block.size());
    if (!RewriteCssUrls(&css)) {
      continue;
    }
    size_t start = block.data() - html->data();
    result.append(*html, copied, start - copied);
    result.append(css);
    copied = start + block.size();
  }
  if (copied != 0) {
    result.append(*html, copied, GoogleString::npos);
    html->swap(result);
  }
}

int CdnContentScanner::ReplaceUrlTokens(const StringStringMap& replacements,
                                        GoogleString* text) {
  GoogleString result;
  int num_replaced = 0;
  size_t pos = 0;
  size_t copied = 0;
  const size_t size = text->size();
  while (pos < size) {
    if ((pos != 0) && !IsTokenStart((*text)[pos - 1])) {
      ++pos;
      continue;
    }
    StringPiece rest(text->data() + pos, size - pos);
    StringStringMap::const_iterator best = replacements.end();
    for (StringStringMap::const_iterator p = replacements.begin(),
             e = replacements.end(); p != e; ++p) {
      const GoogleString& token = p->first;
      if (token.empty() || !rest.starts_with(token)) {
        continue;
      }
      if ((token.size() != rest.size()) && !IsTokenEnd(rest[token.size()])) {
        continue;
      }
      if ((best == replacements.end()) ||
          (token.size() > best->first.size())) {
        best = p;
      }
    }
    if (best == replacements.end()) {
      ++pos;
      continue;
    }
    result.append(*text, copied, pos - copied);
    result.append(best->second);
    pos += best->first.size();
    copied = pos;
    ++num_replaced;
  }
  if (num_replaced != 0) {
    result.append(*text, copied, GoogleString::npos);
    text->swap(result);
  }
  return num_replaced;
}

}  // namespace net_cdnmirror
