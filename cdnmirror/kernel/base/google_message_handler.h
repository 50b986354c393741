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

#ifndef CDNMIRROR_KERNEL_BASE_GOOGLE_MESSAGE_HANDLER_H_
#define CDNMIRROR_KERNEL_BASE_GOOGLE_MESSAGE_HANDLER_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/message_handler.h"
#include "cdnmirror/kernel/base/string.h"

namespace net_cdnmirror {

// Sends messages to chromium logging at the matching severity.
class GoogleMessageHandler : public MessageHandler {
 public:
  GoogleMessageHandler() {}
  virtual ~GoogleMessageHandler();

 protected:
  virtual void MessageSImpl(MessageType type, const GoogleString& message);
  virtual void FileMessageSImpl(MessageType type, const char* filename,
                                int line, const GoogleString& message);

 private:
  DISALLOW_COPY_AND_ASSIGN(GoogleMessageHandler);
};

}  // namespace net_cdnmirror

#endif  // CDNMIRROR_KERNEL_BASE_GOOGLE_MESSAGE_HANDLER_H_
