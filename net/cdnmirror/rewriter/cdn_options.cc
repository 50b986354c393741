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

#include "net/cdnmirror/rewriter/public/cdn_options.h"

#include "base/logging.h"
#include "cdnmirror/kernel/base/message_handler.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"
#include "cdnmirror/kernel/http/google_url.h"

namespace net_cdnmirror {

const char CdnOptions::kCdnBaseUrl[] = "CdnBaseUrl";
const char CdnOptions::kCdnDebug[] = "CdnDebug";
const char CdnOptions::kCdnEnabled[] = "CdnEnabled";
const char CdnOptions::kExcludedPaths[] = "ExcludedPaths";
const char CdnOptions::kFileTypes[] = "FileTypes";
const char CdnOptions::kGithubBranch[] = "GithubBranch";
const char CdnOptions::kGithubRepository[] = "GithubRepository";
const char CdnOptions::kGithubUsername[] = "GithubUsername";
const char CdnOptions::kSiteUrl[] = "SiteUrl";

const char CdnOptions::kDefaultGithubBranch[] = "main";
const char CdnOptions::kDefaultFileTypes[] =
    "js,css,png,jpg,jpeg,gif,svg,woff,woff2,ttf,eot";
const char CdnOptions::kDefaultExcludedPaths[] = "/wp-admin/*, /wp-login.php";

const char CdnOptions::kJsDelivrGithubPrefix[] = "https://cdn.jsdelivr.net/gh/";

namespace {

bool IsListDirective(StringPiece name) {
  return (StringCaseEqual(name, CdnOptions::kFileTypes) ||
          StringCaseEqual(name, CdnOptions::kExcludedPaths));
}

// Empty means "unset" and is always accepted.
bool IsAcceptableBaseUrl(StringPiece arg) {
  if (arg.empty()) {
    return true;
  }
  GoogleUrl url(arg);
  return url.IsWebValid();
}

}  // namespace

CdnOptions::CdnOptions()
    : enabled_(false),
      debug_(false),
      github_branch_(kDefaultGithubBranch) {
  set_file_types(kDefaultFileTypes);
  set_excluded_paths(kDefaultExcludedPaths);
}

CdnOptions::~CdnOptions() {
}

void CdnOptions::SplitCommaList(StringPiece list, StringVector* out) {
  out->clear();
  StringPieceVector pieces;
  SplitStringPieceToVector(list, ",", &pieces, true);
  for (int i = 0, n = pieces.size(); i < n; ++i) {
    StringPiece piece = pieces[i];
    TrimWhitespace(&piece);
    if (!piece.empty()) {
      out->push_back(piece.as_string());
    }
  }
}

void CdnOptions::set_file_types(StringPiece comma_separated) {
  SplitCommaList(comma_separated, &file_types_);
  for (int i = 0, n = file_types_.size(); i < n; ++i) {
    GoogleString& type = file_types_[i];
    if (!type.empty() && type[0] == '.') {
      type.erase(0, 1);
    }
    LowerString(&type);
  }
}

void CdnOptions::set_excluded_paths(StringPiece comma_separated) {
  SplitCommaList(comma_separated, &excluded_paths_);
}

GoogleString CdnOptions::CdnBaseUrl() const {
  if (!explicit_cdn_base_url_.empty()) {
    return explicit_cdn_base_url_;
  }
  if (github_username_.empty() || github_repository_.empty()) {
    return "";
  }
  GoogleString base = StrCat(kJsDelivrGithubPrefix, github_username_, "/",
                             github_repository_);
  StrAppend(&base, "@", github_branch_, "/");
  return base;
}

CdnOptions::OptionSettingResult CdnOptions::ParseBool(StringPiece arg,
                                                      bool* value) {
  if (StringCaseEqual(arg, "on") || StringCaseEqual(arg, "true")) {
    *value = true;
  } else if (StringCaseEqual(arg, "off") || StringCaseEqual(arg, "false")) {
    *value = false;
  } else {
    return kOptionValueInvalid;
  }
  return kOptionOk;
}

CdnOptions::OptionSettingResult CdnOptions::ParseAndSetOptions0(
    StringPiece directive, GoogleString* msg, MessageHandler* handler) {
  if (StringCaseEqual(directive, "on")) {
    set_enabled(true);
  } else if (StringCaseEqual(directive, "off")) {
    set_enabled(false);
  } else {
    return kOptionNameUnknown;
  }
  return kOptionOk;
}

CdnOptions::OptionSettingResult CdnOptions::ParseAndSetOptionFromName1(
    StringPiece name, StringPiece arg, GoogleString* msg,
    MessageHandler* handler) {
  OptionSettingResult result = kOptionOk;
  if (StringCaseEqual(name, kCdnEnabled)) {
    result = ParseBool(arg, &enabled_);
    if (result != kOptionOk) {
      *msg = "must be on or off";
    }
  } else if (StringCaseEqual(name, kCdnDebug)) {
    result = ParseBool(arg, &debug_);
    if (result != kOptionOk) {
      *msg = "must be on or off";
    }
  } else if (StringCaseEqual(name, kGithubUsername) ||
             StringCaseEqual(name, kGithubRepository)) {
    if (arg.find_first_of("/@") != StringPiece::npos) {
      *msg = "must not contain '/' or '@'";
      result = kOptionValueInvalid;
    } else if (StringCaseEqual(name, kGithubUsername)) {
      set_github_username(arg);
    } else {
      set_github_repository(arg);
    }
  } else if (StringCaseEqual(name, kGithubBranch)) {
    if (arg.empty()) {
      *msg = "must not be empty";
      result = kOptionValueInvalid;
    } else {
      set_github_branch(arg);
    }
  } else if (StringCaseEqual(name, kCdnBaseUrl) ||
             StringCaseEqual(name, kSiteUrl)) {
    if (!IsAcceptableBaseUrl(arg)) {
      *msg = "must be an absolute http or https url";
      result = kOptionValueInvalid;
    } else if (StringCaseEqual(name, kCdnBaseUrl)) {
      set_explicit_cdn_base_url(arg);
    } else {
      set_site_url(arg);
    }
  } else if (StringCaseEqual(name, kFileTypes)) {
    set_file_types(arg);
  } else if (StringCaseEqual(name, kExcludedPaths)) {
    set_excluded_paths(arg);
  } else {
    result = kOptionNameUnknown;
  }
  return result;
}

bool CdnOptions::ParseAndSetOptions(const StringVector& args,
                                    const char* source_name, int line,
                                    MessageHandler* handler) {
  CHECK(!args.empty());
  const GoogleString& directive = args[0];
  GoogleString msg;
  OptionSettingResult result;
  if (args.size() == 1) {
    result = ParseAndSetOptions0(directive, &msg, handler);
  } else if (args.size() == 2) {
    result = ParseAndSetOptionFromName1(directive, args[1], &msg, handler);
  } else if (IsListDirective(directive)) {
    // Unquoted lists such as "/wp-admin/*, /wp-login.php" arrive split on
    // whitespace.
    StringVector rest(args.begin() + 1, args.end());
    result = ParseAndSetOptionFromName1(directive, JoinCollection(rest, " "),
                                        &msg, handler);
  } else {
    result = kOptionNameUnknown;
  }

  switch (result) {
    case kOptionOk:
      return true;
    case kOptionNameUnknown:
      handler->FileMessage(kError, source_name, line,
                           "\"%s\" not recognized or too many arguments",
                           directive.c_str());
      return false;
    case kOptionValueInvalid: {
      GoogleString full_directive = JoinCollection(args, " ");
      handler->FileMessage(kError, source_name, line, "\"%s\" %s",
                           full_directive.c_str(), msg.c_str());
      return false;
    }
  }

  CHECK(false);
  return false;
}

bool CdnOptions::ParseConfigText(StringPiece text, const char* source_name,
                                 MessageHandler* handler) {
  bool ret = true;
  StringPieceVector lines;
  SplitStringPieceToVector(text, "\n", &lines, false);
  for (int i = 0, n = lines.size(); i < n; ++i) {
    StringPiece line = lines[i];
    TrimWhitespace(&line);
    if (line.empty() || line.starts_with("#")) {
      continue;
    }
    StringVector args;
    ParseShellLikeString(line, &args);
    if (!args.empty() &&
        !ParseAndSetOptions(args, source_name, i + 1, handler)) {
      ret = false;
    }
  }
  return ret;
}

}  // namespace net_cdnmirror
