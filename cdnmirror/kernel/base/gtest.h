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

#ifndef CDNMIRROR_KERNEL_BASE_GTEST_H_
#define CDNMIRROR_KERNEL_BASE_GTEST_H_

#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"
#include "gtest/gtest.h"

// Checks that needle occurs in haystack.  Either may be a StringPiece,
// a char* or a GoogleString.
#define EXPECT_HAS_SUBSTR(needle, haystack) \
  EXPECT_PRED_FORMAT2(::testing::internal::CmpHelperSUBSTR, needle, haystack)

namespace testing {
namespace internal {

template <typename StringType>
inline AssertionResult CmpHelperSUBSTR(const char* needle_expression,
                                       const char* haystack_expression,
                                       const StringPiece& needle,
                                       const StringType& haystack) {
  return ::testing::IsSubstring(needle_expression, haystack_expression,
                                needle.as_string(),
                                StringPiece(haystack).as_string());
}

}  // namespace internal
}  // namespace testing

#endif  // CDNMIRROR_KERNEL_BASE_GTEST_H_
