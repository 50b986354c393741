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

#include "cdnmirror/kernel/base/message_handler.h"

#include <cstdarg>

#include "base/logging.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

MessageHandler::MessageHandler() {
}

MessageHandler::~MessageHandler() {
}

const char* MessageHandler::MessageTypeToString(MessageType type) const {
  switch (type) {
    case kInfo:
      return "Info";
    case kWarning:
      return "Warning";
    case kError:
      return "Error";
    case kFatal:
      return "Fatal";
  }
  LOG(DFATAL) << "Invalid MessageType " << type;
  return "Unknown";
}

void MessageHandler::Message(MessageType type, const char* msg, ...) {
  GoogleString buffer;
  va_list args;
  va_start(args, msg);
  StringAppendV(&buffer, msg, args);
  va_end(args);
  MessageSImpl(type, buffer);
}

void MessageHandler::FileMessage(MessageType type, const char* filename,
                                 int line, const char* msg, ...) {
  GoogleString buffer;
  va_list args;
  va_start(args, msg);
  StringAppendV(&buffer, msg, args);
  va_end(args);
  FileMessageSImpl(type, filename, line, buffer);
}

bool MessageHandler::Dump(Writer* writer) {
  return false;
}

}  // namespace net_cdnmirror
