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

#ifndef CDNMIRROR_KERNEL_BASE_STDIO_FILE_SYSTEM_H_
#define CDNMIRROR_KERNEL_BASE_STDIO_FILE_SYSTEM_H_

#include <cstdio>

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

class MessageHandler;

// Whole-file reads and writes over stdio.  The filename "-" names stdin
// for reads and stdout for writes.  Failures are reported to the handler
// and signalled by a false return.
class StdioFileSystem {
 public:
  StdioFileSystem() {}
  ~StdioFileSystem();

  bool ReadFile(const char* filename, GoogleString* buffer,
                MessageHandler* handler);
  bool WriteFile(const char* filename, const StringPiece& buffer,
                 MessageHandler* handler);

 private:
  bool ReadStream(FILE* f, const char* filename, GoogleString* buffer,
                  MessageHandler* handler);

  DISALLOW_COPY_AND_ASSIGN(StdioFileSystem);
};

}  // namespace net_cdnmirror

#endif  // CDNMIRROR_KERNEL_BASE_STDIO_FILE_SYSTEM_H_
