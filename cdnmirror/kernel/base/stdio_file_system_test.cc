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

#include "cdnmirror/kernel/base/gtest.h"
#include "cdnmirror/kernel/base/mock_message_handler.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

class StdioFileSystemTest : public testing::Test {
 protected:
  GoogleString TempFile(StringPiece leaf) {
    return StrCat(testing::TempDir(), "/", leaf);
  }

  StdioFileSystem file_system_;
  MockMessageHandler handler_;
};

TEST_F(StdioFileSystemTest, WriteThenRead) {
  GoogleString filename = TempFile("stdio_file_system_test.html");
  const char kContents[] = "<img src=\"/wp-content/a.png\">\n";
  ASSERT_TRUE(file_system_.WriteFile(filename.c_str(), kContents, &handler_));
  GoogleString buffer;
  ASSERT_TRUE(file_system_.ReadFile(filename.c_str(), &buffer, &handler_));
  EXPECT_EQ(kContents, buffer);
  EXPECT_EQ(0, handler_.SeriousMessages());
}

TEST_F(StdioFileSystemTest, ReadMissingFileReportsError) {
  GoogleString filename = TempFile("no/such/dir/file.html");
  GoogleString buffer;
  EXPECT_FALSE(file_system_.ReadFile(filename.c_str(), &buffer, &handler_));
  EXPECT_EQ(1, handler_.MessagesOfType(kError));
}

}  // namespace net_cdnmirror
