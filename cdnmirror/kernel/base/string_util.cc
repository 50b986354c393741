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

#include "cdnmirror/kernel/base/string_util.h"

#include <cstddef>
#include <cstdio>
#include <vector>

#include "cdnmirror/kernel/base/string.h"

namespace net_cdnmirror {

GoogleString StrCat(StringPiece a, StringPiece b) {
  GoogleString res;
  res.reserve(a.size() + b.size());
  a.AppendToString(&res);
  b.AppendToString(&res);
  return res;
}

GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c) {
  GoogleString res;
  res.reserve(a.size() + b.size() + c.size());
  a.AppendToString(&res);
  b.AppendToString(&res);
  c.AppendToString(&res);
  return res;
}

GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c,
                    StringPiece d) {
  GoogleString res;
  res.reserve(a.size() + b.size() + c.size() + d.size());
  a.AppendToString(&res);
  b.AppendToString(&res);
  c.AppendToString(&res);
  d.AppendToString(&res);
  return res;
}

GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c,
                    StringPiece d, StringPiece e) {
  GoogleString res;
  res.reserve(a.size() + b.size() + c.size() + d.size() + e.size());
  a.AppendToString(&res);
  b.AppendToString(&res);
  c.AppendToString(&res);
  d.AppendToString(&res);
  e.AppendToString(&res);
  return res;
}

GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c,
                    StringPiece d, StringPiece e, StringPiece f) {
  GoogleString res;
  res.reserve(a.size() + b.size() + c.size() + d.size() + e.size() +
              f.size());
  a.AppendToString(&res);
  b.AppendToString(&res);
  c.AppendToString(&res);
  d.AppendToString(&res);
  e.AppendToString(&res);
  f.AppendToString(&res);
  return res;
}

GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c,
                    StringPiece d, StringPiece e, StringPiece f,
                    StringPiece g) {
  GoogleString res = StrCat(a, b, c, d, e, f);
  g.AppendToString(&res);
  return res;
}

GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c,
                    StringPiece d, StringPiece e, StringPiece f,
                    StringPiece g, StringPiece h) {
  GoogleString res;
  res.reserve(a.size() + b.size() + c.size() + d.size() + e.size() +
              f.size() + g.size() + h.size());
  a.AppendToString(&res);
  b.AppendToString(&res);
  c.AppendToString(&res);
  d.AppendToString(&res);
  e.AppendToString(&res);
  f.AppendToString(&res);
  g.AppendToString(&res);
  h.AppendToString(&res);
  return res;
}

void StrAppend(GoogleString* target, StringPiece a, StringPiece b) {
  target->reserve(target->size() + a.size() + b.size());
  a.AppendToString(target);
  b.AppendToString(target);
}

void StrAppend(GoogleString* target, StringPiece a, StringPiece b,
               StringPiece c) {
  target->reserve(target->size() + a.size() + b.size() + c.size());
  a.AppendToString(target);
  b.AppendToString(target);
  c.AppendToString(target);
}

void SplitStringPieceToVector(StringPiece sp, StringPiece separators,
                              StringPieceVector* components,
                              bool omit_empty_strings) {
  size_t prev_pos = 0;
  size_t pos = 0;
  while ((pos = sp.find_first_of(separators, pos)) != StringPiece::npos) {
    if (!omit_empty_strings || (pos > prev_pos)) {
      components->push_back(sp.substr(prev_pos, pos - prev_pos));
    }
    ++pos;
    prev_pos = pos;
  }
  if (!omit_empty_strings || (prev_pos < sp.size())) {
    components->push_back(sp.substr(prev_pos));
  }
}

GoogleString CEscape(StringPiece src) {
  GoogleString dest;
  dest.reserve(src.size());
  for (size_t i = 0; i < src.size(); ++i) {
    unsigned char ch = static_cast<unsigned char>(src[i]);
    switch (ch) {
      case '\n': dest.append("\\n"); break;
      case '\r': dest.append("\\r"); break;
      case '\t': dest.append("\\t"); break;
      case '\"': dest.append("\\\""); break;
      case '\'': dest.append("\\\'"); break;
      case '\\': dest.append("\\\\"); break;
      default:
        if (ch < 32 || ch >= 127) {
          StringAppendF(&dest, "\\%03o", ch);
        } else {
          dest.push_back(ch);
        }
        break;
    }
  }
  return dest;
}

void LowerString(GoogleString* s) {
  GoogleString::iterator end = s->end();
  for (GoogleString::iterator i = s->begin(); i != end; ++i) {
    *i = LowerChar(*i);
  }
}

int GlobalReplaceSubstring(StringPiece substring, StringPiece replacement,
                           GoogleString* s) {
  CHECK(s != NULL);
  if (s->empty() || substring.empty()) {
    return 0;
  }
  GoogleString tmp;
  int num_replacements = 0;
  size_t pos = 0;
  for (size_t match_pos = s->find(substring.data(), pos, substring.length());
       match_pos != GoogleString::npos;
       pos = match_pos + substring.length(),
           match_pos = s->find(substring.data(), pos, substring.length())) {
    ++num_replacements;
    // Append the original content before the match.
    tmp.append(*s, pos, match_pos - pos);
    // Append the replacement for the match.
    tmp.append(replacement.data(), replacement.size());
  }
  // Append the content after the last match. If no replacements were made, the
  // original string is left untouched.
  if (num_replacements > 0) {
    tmp.append(*s, pos, s->length() - pos);
    s->swap(tmp);
  }
  return num_replacements;
}

stringpiece_ssize_type FindIgnoreCase(StringPiece haystack,
                                      StringPiece needle) {
  stringpiece_ssize_type pos = 0;
  while (haystack.size() >= needle.size()) {
    if (StringCaseStartsWith(haystack, needle)) {
      return pos;
    }
    ++pos;
    haystack.remove_prefix(1);
  }
  return StringPiece::npos;
}

bool StringCaseStartsWith(StringPiece str, StringPiece prefix) {
  return ((str.size() >= prefix.size()) &&
          StringCaseEqual(prefix, str.substr(0, prefix.size())));
}

void ParseShellLikeString(StringPiece input, StringVector* output) {
  output->clear();
  for (size_t index = 0; index < input.size();) {
    const char ch = input[index];
    if (ch == '"' || ch == '\'') {
      // If we see a quoted section, treat it as a single item even if there are
      // spaces in it.
      const char quote = ch;
      ++index;  // skip open quote
      output->push_back("");
      GoogleString& part = output->back();
      for (; index < input.size() && input[index] != quote; ++index) {
        if (input[index] == '\\') {
          ++index;  // skip backslash
          if (index >= input.size()) {
            break;
          }
        }
        part.push_back(input[index]);
      }
      ++index;  // skip close quote
    } else if (!IsHtmlSpace(ch)) {
      // Without quotes, items are whitespace-separated.
      output->push_back("");
      GoogleString& part = output->back();
      for (; index < input.size() && !IsHtmlSpace(input[index]); ++index) {
        part.push_back(input[index]);
      }
    } else {
      // Ignore whitespace (outside of quotes).
      ++index;
    }
  }
}

bool TrimTrailingWhitespace(StringPiece* str) {
  stringpiece_ssize_type rightmost = str->size();
  while (rightmost != 0 && IsHtmlSpace(str->data()[rightmost - 1])) {
    --rightmost;
  }
  if (rightmost != str->size()) {
    str->remove_suffix(str->size() - rightmost);
    return true;
  }
  return false;
}

bool TrimWhitespace(StringPiece* str) {
  stringpiece_ssize_type leading = 0;
  while (leading != str->size() && IsHtmlSpace((*str)[leading])) {
    ++leading;
  }
  str->remove_prefix(leading);
  return TrimTrailingWhitespace(str) || (leading > 0);
}

bool StringCaseEqual(StringPiece s1, StringPiece s2) {
  if (s1.size() != s2.size()) {
    return false;
  }
  for (stringpiece_ssize_type i = 0; i < s1.size(); ++i) {
    if (LowerChar(s1[i]) != LowerChar(s2[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace net_cdnmirror
