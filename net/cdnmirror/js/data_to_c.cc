// Copyright 2011 Google Inc. All Rights Reserved.
//
// Embeds a data file, such as the client-side rewriting script, into the
// binary as a C string constant.

#include <cstdlib>

#include "cdnmirror/kernel/base/google_message_handler.h"
#include "cdnmirror/kernel/base/stdio_file_system.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"
#include "cdnmirror/kernel/util/gflags.h"

DEFINE_string(data_file, "/tmp/a.js", "Input data file");
DEFINE_string(c_file, "/tmp/a.cc", "Output C++ file");
DEFINE_string(varname, "str", "Variable name.");

// The data is split into adjacent literals of kChunkSize bytes so no
// line of the generated file gets too long.
const int kChunkSize = 60;

const char kOutputTemplate[] =
    "// Generated by data_to_c from %s.  Do not edit.\n"
    "\n"
    "namespace net_cdnmirror {\n"
    "\n"
    "extern const char* %s;\n"
    "const char* %s =%s;\n"
    "\n"
    "}  // namespace net_cdnmirror\n";

namespace net_cdnmirror {

bool DataToC(int argc, char* argv[]) {
  ParseGflags(argv[0], &argc, &argv);
  GoogleMessageHandler handler;
  StdioFileSystem file_system;

  GoogleString input;
  if (!file_system.ReadFile(FLAGS_data_file.c_str(), &input, &handler)) {
    return false;
  }

  GoogleString joined;
  StringPiece rest(input);
  while (!rest.empty()) {
    StringPiece chunk = rest.substr(0, kChunkSize);
    rest.remove_prefix(chunk.size());
    StrAppend(&joined, "\n    \"", CEscape(chunk), "\"");
  }
  if (joined.empty()) {
    joined = " \"\"";
  }
  GoogleString output = StringPrintf(
      kOutputTemplate, FLAGS_data_file.c_str(), FLAGS_varname.c_str(),
      FLAGS_varname.c_str(), joined.c_str());

  return file_system.WriteFile(FLAGS_c_file.c_str(), output, &handler);
}

}  // namespace net_cdnmirror

int main(int argc, char* argv[]) {
  return net_cdnmirror::DataToC(argc, argv) ? EXIT_SUCCESS : EXIT_FAILURE;
}
