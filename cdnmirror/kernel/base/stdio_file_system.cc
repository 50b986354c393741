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

#include "cdnmirror/kernel/base/stdio_file_system.h"

#include <errno.h>
#include <cstdio>
#include <cstring>

#include "cdnmirror/kernel/base/message_handler.h"
#include "cdnmirror/kernel/base/string.h"

namespace net_cdnmirror {

namespace {

const char kStdioName[] = "-";
const int kReadChunkSize = 8192;

}  // namespace

StdioFileSystem::~StdioFileSystem() {
}

bool StdioFileSystem::ReadFile(const char* filename, GoogleString* buffer,
                               MessageHandler* handler) {
  if (strcmp(filename, kStdioName) == 0) {
    return ReadStream(stdin, "<stdin>", buffer, handler);
  }
  FILE* f = fopen(filename, "r");
  if (f == NULL) {
    handler->FileMessage(kError, filename, 0, "opening input file: %s",
                         strerror(errno));
    return false;
  }
  bool ret = ReadStream(f, filename, buffer, handler);
  if (fclose(f) != 0) {
    handler->FileMessage(kError, filename, 0, "closing file: %s",
                         strerror(errno));
    ret = false;
  }
  return ret;
}

bool StdioFileSystem::ReadStream(FILE* f, const char* filename,
                                 GoogleString* buffer,
                                 MessageHandler* handler) {
  char chunk[kReadChunkSize];
  size_t nread;
  while ((nread = fread(chunk, 1, sizeof(chunk), f)) > 0) {
    buffer->append(chunk, nread);
  }
  if (ferror(f) != 0) {
    handler->FileMessage(kError, filename, 0, "reading file: %s",
                         strerror(errno));
    return false;
  }
  return true;
}

bool StdioFileSystem::WriteFile(const char* filename,
                                const StringPiece& buffer,
                                MessageHandler* handler) {
  bool is_stdout = (strcmp(filename, kStdioName) == 0);
  FILE* f = is_stdout ? stdout : fopen(filename, "w");
  if (f == NULL) {
    handler->FileMessage(kError, filename, 0, "opening output file: %s",
                         strerror(errno));
    return false;
  }
  bool ret = true;
  size_t bytes_written = fwrite(buffer.data(), 1, buffer.size(), f);
  if (bytes_written != buffer.size()) {
    handler->FileMessage(kError, filename, 0, "writing file: %s",
                         strerror(errno));
    ret = false;
  }
  if (is_stdout) {
    if (fflush(f) != 0) {
      handler->FileMessage(kError, filename, 0, "flushing file: %s",
                           strerror(errno));
      ret = false;
    }
  } else if (fclose(f) != 0) {
    handler->FileMessage(kError, filename, 0, "closing file: %s",
                         strerror(errno));
    ret = false;
  }
  return ret;
}

}  // namespace net_cdnmirror
