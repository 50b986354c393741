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

#ifndef CDNMIRROR_KERNEL_BASE_STRING_UTIL_H_
#define CDNMIRROR_KERNEL_BASE_STRING_UTIL_H_

#include <cstddef>
#include <map>
#include <set>
#include <vector>

#include "base/logging.h"
#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/string.h"

#include <string>  // NOLINT
#include "base/strings/string_piece.h"
#include "base/strings/stringprintf.h"

using base::StringAppendF;
using base::StringAppendV;
using base::StringPiece;
using base::StringPrintf;

typedef StringPiece::size_type stringpiece_ssize_type;

// Quick macro to get the size of a static char[] without trailing '\0'.
// Note: Cannot be used for char*, std::string, etc.
#define STATIC_STRLEN(static_string) (arraysize(static_string) - 1)

namespace net_cdnmirror {

typedef std::map<GoogleString, GoogleString> StringStringMap;
typedef std::set<GoogleString> StringSet;
typedef std::vector<GoogleString> StringVector;
typedef std::vector<StringPiece> StringPieceVector;

GoogleString StrCat(StringPiece a, StringPiece b);
GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c);
GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c, StringPiece d);
GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c, StringPiece d,
                    StringPiece e);
GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c, StringPiece d,
                    StringPiece e, StringPiece f);
GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c, StringPiece d,
                    StringPiece e, StringPiece f, StringPiece g);
GoogleString StrCat(StringPiece a, StringPiece b, StringPiece c, StringPiece d,
                    StringPiece e, StringPiece f, StringPiece g, StringPiece h);

inline void StrAppend(GoogleString* target, StringPiece a) {
  a.AppendToString(target);
}
void StrAppend(GoogleString* target, StringPiece a, StringPiece b);
void StrAppend(GoogleString* target, StringPiece a, StringPiece b,
               StringPiece c);

// Split sp into pieces that are separated by any character in the given
// string of separators, and push those pieces in order onto components.
void SplitStringPieceToVector(StringPiece sp, StringPiece separators,
                              StringPieceVector* components,
                              bool omit_empty_strings);

// Escapes src into a C string literal body, octal-escaping non-printables.
GoogleString CEscape(StringPiece src);

void LowerString(GoogleString* str);

// Replaces all instances of 'substring' in 's' with 'replacement'.
// Returns the number of instances replaced.  Replacements are not
// subject to re-matching.
//
// NOTE: The string pieces must not overlap s.
int GlobalReplaceSubstring(StringPiece substring, StringPiece replacement,
                           GoogleString* s);

// Finds the first occurrence of needle in haystack, ignoring case.
// Returns StringPiece::npos if there is none.
stringpiece_ssize_type FindIgnoreCase(StringPiece haystack, StringPiece needle);

// lower-case a single character and return it.
// tolower() changes based on locale.  We don't want this!
inline char LowerChar(char c) {
  if ((c >= 'A') && (c <= 'Z')) {
    c += 'a' - 'A';
  }
  return c;
}

// Check if given character is an HTML (or CSS) space (not the same as isspace,
// and not locale-dependent!).  Note in particular that isspace always includes
// '\v' and HTML does not.
inline bool IsHtmlSpace(char c) {
  return (c == ' ') || (c == '\t') || (c == '\r') || (c == '\n') || (c == '\f');
}

// In-place removal of leading and trailing HTML whitespace.  Returns true if
// any whitespace was trimmed.
bool TrimWhitespace(StringPiece* str);

// Trims trailing HTML whitespace.  Returns true if any whitespace was trimmed.
bool TrimTrailingWhitespace(StringPiece* str);

// Return true iff the two strings are equal, ignoring ASCII case.
bool StringCaseEqual(StringPiece s1, StringPiece s2);

// Return true iff str starts with prefix, ignoring case.
bool StringCaseStartsWith(StringPiece str, StringPiece prefix);

// Parse a list of strings separated by whitespace.  Quoted sections are
// treated as a single item even when they contain spaces, and backslash
// escapes the next character inside quotes.
//   input: 'FileTypes "js, css"' -> output: ["FileTypes", "js, css"]
void ParseShellLikeString(StringPiece input, StringVector* output);

// Joins an iterable collection of strings such as a StringSet or
// StringVector, separated by sep.
template<typename C>
GoogleString JoinCollection(const C& collection, StringPiece sep) {
  GoogleString result;
  for (typename C::const_iterator str = collection.begin();
       str != collection.end(); ++str) {
    if (str != collection.begin()) {
      sep.AppendToString(&result);
    }
    StrAppend(&result, *str);
  }
  return result;
}

}  // namespace net_cdnmirror

#endif  // CDNMIRROR_KERNEL_BASE_STRING_UTIL_H_
