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

#include "net/cdnmirror/rewriter/public/cdn_config_script.h"

#include "cdnmirror/kernel/base/string_util.h"
#include "cdnmirror/kernel/base/writer.h"
#include "json/json.h"
#include "net/cdnmirror/rewriter/public/cdn_config_snapshot.h"
#include "net/cdnmirror/rewriter/public/cdn_request_context.h"

namespace net_cdnmirror {

CdnConfigScript::CdnConfigScript(const CdnConfigSnapshot* config,
                                 const CdnRequestContext* request_context)
    : config_(config),
      request_context_(request_context) {
}

CdnConfigScript::~CdnConfigScript() {
}

GoogleString CdnConfigScript::ConfigJson() const {
  Json::Value root(Json::objectValue);
  root["baseUrl"] = config_->site_url();
  root["cdnBaseUrl"] = config_->cdn_base_url();

  Json::Value file_types(Json::arrayValue);
  const StringVector& types = config_->file_types();
  for (int i = 0, n = types.size(); i < n; ++i) {
    file_types.append(types[i]);
  }
  root["fileTypes"] = file_types;

  Json::Value excluded_paths(Json::arrayValue);
  const PathRuleVector& rules = config_->excluded_path_rules();
  for (int i = 0, n = rules.size(); i < n; ++i) {
    excluded_paths.append(rules[i].spec());
  }
  root["excludedPaths"] = excluded_paths;

  Json::FastWriter writer;
  GoogleString json = writer.write(root);
  StringPiece trimmed(json);
  TrimTrailingWhitespace(&trimmed);
  GoogleString result = trimmed.as_string();
  GlobalReplaceSubstring("</", "<\\/", &result);
  return result;
}

GoogleString CdnConfigScript::ScriptElement() const {
  return StrCat("<script type=\"text/javascript\">\n"
                "window.cdnMirrorConfig = ", ConfigJson(), ";\n",
                JS_cdn_rewriter, "</script>");
}

bool CdnConfigScript::InsertAfterHeadTag(const StringPiece& markup,
                                         GoogleString* html) {
  StringPiece text(*html);
  size_t search_from = 0;
  while (search_from < text.size()) {
    stringpiece_ssize_type found =
        FindIgnoreCase(text.substr(search_from), "<head");
    if (found == StringPiece::npos) {
      return false;
    }
    size_t name_end = search_from + found + STATIC_STRLEN("<head");
    // Skip <header> and the like.
    if (name_end < text.size() &&
        (text[name_end] == '>' || IsHtmlSpace(text[name_end]))) {
      stringpiece_ssize_type tag_end = text.find('>', name_end);
      if (tag_end == StringPiece::npos) {
        return false;
      }
      html->insert(tag_end + 1, markup.data(), markup.size());
      return true;
    }
    search_from = name_end;
  }
  return false;
}

bool CdnConfigScript::Emit(Writer* writer, MessageHandler* handler) const {
  if (!config_->active() || request_context_->InAdminContext()) {
    return true;
  }
  return writer->Write(ScriptElement(), handler);
}

}  // namespace net_cdnmirror
