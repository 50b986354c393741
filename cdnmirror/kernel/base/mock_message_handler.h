/*
 * Copyright 2011 Google Inc.
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

#ifndef CDNMIRROR_KERNEL_BASE_MOCK_MESSAGE_HANDLER_H_
#define CDNMIRROR_KERNEL_BASE_MOCK_MESSAGE_HANDLER_H_

#include <map>

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/message_handler.h"
#include "cdnmirror/kernel/base/string.h"

namespace net_cdnmirror {

class Writer;

// Message handler for tests.  Counts messages by type and keeps their text
// so diagnostics can be checked.
class MockMessageHandler : public MessageHandler {
 public:
  MockMessageHandler();
  virtual ~MockMessageHandler();

  int MessagesOfType(MessageType type) const;
  int TotalMessages() const;

  // Messages of any type other than kInfo.
  int SeriousMessages() const;

  // Writes "[Type] text" for each message, one per line.  Returns false if
  // there were no messages.
  virtual bool Dump(Writer* writer);

 protected:
  virtual void MessageSImpl(MessageType type, const GoogleString& message);
  virtual void FileMessageSImpl(MessageType type, const char* filename,
                                int line, const GoogleString& message);

 private:
  typedef std::map<MessageType, int> MessageCountMap;

  void AddMessage(MessageType type, const GoogleString& message);

  MessageCountMap message_counts_;
  GoogleString buffer_;

  DISALLOW_COPY_AND_ASSIGN(MockMessageHandler);
};

}  // namespace net_cdnmirror

#endif  // CDNMIRROR_KERNEL_BASE_MOCK_MESSAGE_HANDLER_H_
