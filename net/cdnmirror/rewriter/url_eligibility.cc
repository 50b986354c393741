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

#include "net/cdnmirror/rewriter/public/url_eligibility.h"

#include "cdnmirror/kernel/http/google_url.h"
#include "net/cdnmirror/rewriter/public/cdn_config_snapshot.h"

namespace net_cdnmirror {

const char UrlEligibility::kAdminMarker[] = "/wp-admin";
const char UrlEligibility::kLoginMarker[] = "/wp-login";

bool UrlEligibility::HasAdminMarker(const StringPiece& url) {
  return ((url.find(kAdminMarker) != StringPiece::npos) ||
          (url.find(kLoginMarker) != StringPiece::npos));
}

bool UrlEligibility::IsDataUrl(const StringPiece& url) {
  return StringCaseStartsWith(url, "data:");
}

bool UrlEligibility::HasLiteralAuthority(const StringPiece& url) {
  StringPiece sans_query(url);
  stringpiece_ssize_type end = sans_query.find_first_of("?#");
  if (end != StringPiece::npos) {
    sans_query = sans_query.substr(0, end);
  }
  if (sans_query.find('\\') != StringPiece::npos) {
    return false;
  }
  if (sans_query.starts_with("//")) {
    return true;
  }
  stringpiece_ssize_type colon = sans_query.find(':');
  return ((colon != StringPiece::npos) &&
          sans_query.substr(colon + 1).starts_with("//"));
}

bool UrlEligibility::ExtractSameOriginPath(const StringPiece& url,
                                           const CdnConfigSnapshot& config,
                                           GoogleString* path) {
  switch (GoogleUrl::FindRelativity(url)) {
    case kAbsoluteUrl:
    case kNetPath: {
      const GoogleUrl& site = config.site_gurl();
      if (!site.IsWebValid() || !HasLiteralAuthority(url)) {
        return false;
      }
      GoogleUrl gurl(site, url);
      if (!gurl.IsWebValid() || gurl.Origin() != site.Origin()) {
        return false;
      }
      gurl.PathSansQuery().CopyToString(path);
      break;
    }
    case kAbsolutePath:
    case kRelativePath: {
      StringPiece sans_query(url);
      stringpiece_ssize_type end = sans_query.find_first_of("?#");
      if (end != StringPiece::npos) {
        sans_query = sans_query.substr(0, end);
      }
      sans_query.CopyToString(path);
      break;
    }
  }
  return !path->empty();
}

bool UrlEligibility::ExtractExtension(const StringPiece& path,
                                      GoogleString* ext) {
  StringPiece leaf(path);
  stringpiece_ssize_type slash = leaf.rfind('/');
  if (slash != StringPiece::npos) {
    leaf.remove_prefix(slash + 1);
  }
  stringpiece_ssize_type dot = leaf.rfind('.');
  if (dot == StringPiece::npos || dot + 1 == leaf.size()) {
    return false;
  }
  leaf.substr(dot + 1).CopyToString(ext);
  LowerString(ext);
  return true;
}

bool UrlEligibility::ShouldRewrite(const StringPiece& url,
                                   const CdnConfigSnapshot& config) {
  if (url.empty() || !config.active()) {
    return false;
  }
  if (IsDataUrl(url) || HasAdminMarker(url)) {
    return false;
  }

  GoogleString path;
  if (!ExtractSameOriginPath(url, config, &path)) {
    return false;
  }
  if (config.IsExcludedPath(path)) {
    return false;
  }

  GoogleString ext;
  if (!ExtractExtension(path, &ext)) {
    return false;
  }
  return config.IsAcceptedExtension(ext);
}

}  // namespace net_cdnmirror
