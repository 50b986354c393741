/*
 * Copyright 2016 Google Inc.
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

// Rewrites the asset references of one HTML document to point at the CDN
// mirror, as the host would while rendering a page.
//
// Usage: cdn_rewrite --config_file=cdn.conf [--input=in.html]
//            [--output=out.html] [--emit_config_script] [--admin_request]
//        cdn_rewrite --config_file=cdn.conf --srcset="a.jpg 1x, b.jpg 2x"

#include <cstdlib>

#include "cdnmirror/kernel/base/google_message_handler.h"
#include "cdnmirror/kernel/base/message_handler.h"
#include "cdnmirror/kernel/base/stdio_file_system.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"
#include "cdnmirror/kernel/base/string_writer.h"
#include "cdnmirror/kernel/util/gflags.h"
#include "net/cdnmirror/rewriter/public/cdn_config_script.h"
#include "net/cdnmirror/rewriter/public/cdn_hook_registry.h"
#include "net/cdnmirror/rewriter/public/cdn_integration.h"
#include "net/cdnmirror/rewriter/public/cdn_options.h"
#include "net/cdnmirror/rewriter/public/cdn_request_context.h"

DEFINE_string(config_file, "", "File of CDN directives, one per line.");
DEFINE_string(input, "-", "HTML file to rewrite; '-' reads stdin.");
DEFINE_string(output, "-", "Where to write the result; '-' writes stdout.");
DEFINE_bool(emit_config_script, false,
            "Insert the client-side rewriting script after the <head> tag.");
DEFINE_bool(admin_request, false,
            "Treat the document as an admin page, leaving it unchanged.");
DEFINE_string(srcset, "",
              "Rewrite this srcset attribute value and print it, instead of "
              "rewriting a document.");

namespace net_cdnmirror {

bool CdnRewrite_main() {
  StdioFileSystem file_system;
  GoogleMessageHandler handler;

  CdnOptions options;
  if (!FLAGS_config_file.empty()) {
    GoogleString config_text;
    if (!file_system.ReadFile(FLAGS_config_file.c_str(), &config_text,
                              &handler) ||
        !options.ParseConfigText(config_text, FLAGS_config_file.c_str(),
                                 &handler)) {
      return false;
    }
  }

  CdnRequestContext request_context;
  request_context.set_admin_request(FLAGS_admin_request);
  CdnIntegration integration(options, &request_context, &handler);

  if (!FLAGS_srcset.empty()) {
    GoogleString srcset = integration.RewriteSrcsetAttribute(FLAGS_srcset);
    return file_system.WriteFile(FLAGS_output.c_str(), StrCat(srcset, "\n"),
                                 &handler);
  }

  GoogleString html;
  if (!file_system.ReadFile(FLAGS_input.c_str(), &html, &handler)) {
    return false;
  }

  CdnHookRegistry registry;
  integration.RegisterHooks(&registry);

  GoogleString output =
      registry.ApplyFilters(CdnIntegration::kContentHook, html);
  if (FLAGS_emit_config_script) {
    GoogleString head;
    StringWriter head_writer(&head);
    registry.DoAction(CdnIntegration::kHeadHook, &head_writer, &handler);
    if (!head.empty() &&
        !CdnConfigScript::InsertAfterHeadTag(head, &output)) {
      handler.Message(kWarning, "%s: no <head> tag, config script omitted",
                      FLAGS_input.c_str());
    }
  }

  return file_system.WriteFile(FLAGS_output.c_str(), output, &handler);
}

}  // namespace net_cdnmirror

int main(int argc, char** argv) {
  net_cdnmirror::ParseGflags(argv[0], &argc, &argv);
  return net_cdnmirror::CdnRewrite_main() ? EXIT_SUCCESS : EXIT_FAILURE;
}
