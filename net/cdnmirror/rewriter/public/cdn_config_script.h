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

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_CDN_CONFIG_SCRIPT_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_CDN_CONFIG_SCRIPT_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

class CdnConfigSnapshot;
class CdnRequestContext;
class MessageHandler;
class Writer;

// Client-side script that applies the CDN rules to assets the page adds
// after it is served.  The script is compiled in from cdn_rewriter.js.
extern const char* JS_cdn_rewriter;

// Emits the <script> element carrying the CDN settings and the client-side
// rewriter.  It belongs early in <head>, once per page.
class CdnConfigScript {
 public:
  // Neither argument is owned.
  CdnConfigScript(const CdnConfigSnapshot* config,
                  const CdnRequestContext* request_context);
  ~CdnConfigScript();

  // Writes the script element, or nothing if rewriting is disabled, there
  // is no CDN base, or the request is in admin context.  Returns false if
  // the writer failed.
  bool Emit(Writer* writer, MessageHandler* handler) const;

  // The settings as a JSON object:
  //   {"baseUrl":...,"cdnBaseUrl":...,"excludedPaths":[...],"fileTypes":[...]}
  // "</" is escaped so the text can't close the surrounding script element.
  GoogleString ConfigJson() const;

  // The complete script element.
  GoogleString ScriptElement() const;

  // Inserts markup right after the first <head> start tag in *html.
  // Returns false, leaving *html alone, if there is no complete <head> tag.
  static bool InsertAfterHeadTag(const StringPiece& markup, GoogleString* html);

 private:
  const CdnConfigSnapshot* config_;
  const CdnRequestContext* request_context_;

  DISALLOW_COPY_AND_ASSIGN(CdnConfigScript);
};

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_CDN_CONFIG_SCRIPT_H_
