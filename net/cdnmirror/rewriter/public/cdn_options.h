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

// Mutable CDN settings, as read from a configuration file or set by the
// host.  A CdnConfigSnapshot is built from these once per request.

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_CDN_OPTIONS_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_CDN_OPTIONS_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

class MessageHandler;

class CdnOptions {
 public:
  enum OptionSettingResult {
    kOptionOk,
    kOptionNameUnknown,
    kOptionValueInvalid
  };

  // Directive names, matched case-insensitively.
  static const char kCdnBaseUrl[];
  static const char kCdnDebug[];
  static const char kCdnEnabled[];
  static const char kExcludedPaths[];
  static const char kFileTypes[];
  static const char kGithubBranch[];
  static const char kGithubRepository[];
  static const char kGithubUsername[];
  static const char kSiteUrl[];

  // Values a fresh installation starts with.
  static const char kDefaultGithubBranch[];
  static const char kDefaultFileTypes[];
  static const char kDefaultExcludedPaths[];

  // Prefix of the CDN base derived from the GitHub settings.
  static const char kJsDelivrGithubPrefix[];

  CdnOptions();
  ~CdnOptions();

  // Handles the single-word directives "on" and "off".
  OptionSettingResult ParseAndSetOptions0(
      StringPiece directive, GoogleString* msg, MessageHandler* handler);

  // Sets the option called 'name' from 'arg'.  On kOptionValueInvalid, *msg
  // says what was wrong with the value.
  OptionSettingResult ParseAndSetOptionFromName1(
      StringPiece name, StringPiece arg, GoogleString* msg,
      MessageHandler* handler);

  // Applies one directive, args[0] being its name.  Problems are reported
  // to handler, naming source_name and line; returns false on failure.
  bool ParseAndSetOptions(const StringVector& args, const char* source_name,
                          int line, MessageHandler* handler);

  // Applies a whole configuration file: one directive per line, with
  // shell-like quoting; blank lines and lines starting with '#' are
  // skipped.  Every bad line is reported.  Returns false if any line failed.
  bool ParseConfigText(StringPiece text, const char* source_name,
                       MessageHandler* handler);

  // The CDN base url in effect: the explicit CdnBaseUrl if one was set,
  // otherwise the jsDelivr url for the GitHub repository, e.g.
  //   https://cdn.jsdelivr.net/gh/user/repo@main/
  // Returns "" if neither is configured.
  GoogleString CdnBaseUrl() const;

  bool enabled() const { return enabled_; }
  void set_enabled(bool x) { enabled_ = x; }

  bool debug() const { return debug_; }
  void set_debug(bool x) { debug_ = x; }

  const GoogleString& github_username() const { return github_username_; }
  void set_github_username(StringPiece x) { x.CopyToString(&github_username_); }

  const GoogleString& github_repository() const { return github_repository_; }
  void set_github_repository(StringPiece x) {
    x.CopyToString(&github_repository_);
  }

  const GoogleString& github_branch() const { return github_branch_; }
  void set_github_branch(StringPiece x) { x.CopyToString(&github_branch_); }

  const GoogleString& explicit_cdn_base_url() const {
    return explicit_cdn_base_url_;
  }
  void set_explicit_cdn_base_url(StringPiece x) {
    x.CopyToString(&explicit_cdn_base_url_);
  }

  const GoogleString& site_url() const { return site_url_; }
  void set_site_url(StringPiece x) { x.CopyToString(&site_url_); }

  // Lower-cased extensions without the leading dot, in configured order.
  const StringVector& file_types() const { return file_types_; }
  void set_file_types(StringPiece comma_separated);

  // Rule specs such as "/wp-admin/*", in configured order.
  const StringVector& excluded_paths() const { return excluded_paths_; }
  void set_excluded_paths(StringPiece comma_separated);

  // Splits a comma-separated list, trimming whitespace around each entry
  // and dropping empty ones.
  static void SplitCommaList(StringPiece list, StringVector* out);

 private:
  static OptionSettingResult ParseBool(StringPiece arg, bool* value);

  bool enabled_;
  bool debug_;
  GoogleString github_username_;
  GoogleString github_repository_;
  GoogleString github_branch_;
  GoogleString explicit_cdn_base_url_;
  GoogleString site_url_;
  StringVector file_types_;
  StringVector excluded_paths_;

  DISALLOW_COPY_AND_ASSIGN(CdnOptions);
};

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_CDN_OPTIONS_H_
