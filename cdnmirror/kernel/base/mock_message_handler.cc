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

#include "cdnmirror/kernel/base/mock_message_handler.h"

#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"
#include "cdnmirror/kernel/base/writer.h"

namespace net_cdnmirror {

MockMessageHandler::MockMessageHandler() {
}

MockMessageHandler::~MockMessageHandler() {
}

void MockMessageHandler::AddMessage(MessageType type,
                                    const GoogleString& message) {
  StrAppend(&buffer_, "[", MessageTypeToString(type), "] ");
  StrAppend(&buffer_, message, "\n");
  ++message_counts_[type];
}

void MockMessageHandler::MessageSImpl(MessageType type,
                                      const GoogleString& message) {
  AddMessage(type, message);
}

void MockMessageHandler::FileMessageSImpl(MessageType type,
                                          const char* filename, int line,
                                          const GoogleString& message) {
  AddMessage(type, message);
}

int MockMessageHandler::MessagesOfType(MessageType type) const {
  MessageCountMap::const_iterator p = message_counts_.find(type);
  return (p == message_counts_.end()) ? 0 : p->second;
}

int MockMessageHandler::TotalMessages() const {
  int total = 0;
  for (MessageCountMap::const_iterator p = message_counts_.begin(),
           e = message_counts_.end(); p != e; ++p) {
    total += p->second;
  }
  return total;
}

int MockMessageHandler::SeriousMessages() const {
  return TotalMessages() - MessagesOfType(kInfo);
}

bool MockMessageHandler::Dump(Writer* writer) {
  if (buffer_.empty()) {
    return false;
  }
  return writer->Write(buffer_, this);
}

}  // namespace net_cdnmirror
