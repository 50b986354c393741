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

#include "cdnmirror/kernel/base/google_message_handler.h"

#include "base/logging.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

GoogleMessageHandler::~GoogleMessageHandler() {
}

void GoogleMessageHandler::MessageSImpl(MessageType type,
                                        const GoogleString& message) {
  FileMessageSImpl(type, NULL, 0, message);
}

void GoogleMessageHandler::FileMessageSImpl(MessageType type,
                                            const char* filename, int line,
                                            const GoogleString& message) {
  GoogleString text;
  if (filename != NULL) {
    text = StringPrintf("%s:%d: ", filename, line);
  }
  text += message;
  switch (type) {
    case kInfo:
      LOG(INFO) << text;
      break;
    case kWarning:
      LOG(WARNING) << text;
      break;
    case kError:
      LOG(ERROR) << text;
      break;
    case kFatal:
      LOG(FATAL) << text;
      break;
  }
}

}  // namespace net_cdnmirror
