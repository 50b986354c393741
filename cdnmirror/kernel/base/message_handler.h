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

#ifndef CDNMIRROR_KERNEL_BASE_MESSAGE_HANDLER_H_
#define CDNMIRROR_KERNEL_BASE_MESSAGE_HANDLER_H_

#include <cstdarg>

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/printf_format.h"
#include "cdnmirror/kernel/base/string.h"

namespace net_cdnmirror {

class Writer;

enum MessageType {
  kInfo,
  kWarning,
  kError,
  kFatal
};

// Receives the diagnostics of rewriting and of the tools.  Subclasses
// decide where the formatted text goes.
class MessageHandler {
 public:
  MessageHandler();
  virtual ~MessageHandler();

  // "Info", "Warning", "Error" or "Fatal".
  const char* MessageTypeToString(MessageType type) const;

  void Message(MessageType type, const char* msg, ...)
      CDNMIRROR_PRINTF_FORMAT(3, 4);

  // As Message, attributing the text to a line of an input file.
  void FileMessage(MessageType type, const char* filename, int line,
                   const char* msg, ...) CDNMIRROR_PRINTF_FORMAT(5, 6);

  // Writes the messages seen so far, or returns false if the handler does
  // not keep them.  The default keeps nothing.
  virtual bool Dump(Writer* writer);

 protected:
  // Called with the text already formatted.
  virtual void MessageSImpl(MessageType type, const GoogleString& message) = 0;
  virtual void FileMessageSImpl(
      MessageType type, const char* filename, int line,
      const GoogleString& message) = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(MessageHandler);
};

}  // namespace net_cdnmirror

#endif  // CDNMIRROR_KERNEL_BASE_MESSAGE_HANDLER_H_
