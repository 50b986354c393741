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

#include "cdnmirror/kernel/http/google_url.h"

#include <string>

#include "base/logging.h"
#include "googleurl/src/url_parse.h"

namespace net_cdnmirror {

GoogleUrl::GoogleUrl(const StringPiece& sp)
    : gurl_(sp.as_string()) {
  Init();
}

GoogleUrl::GoogleUrl(const GoogleUrl& base, const StringPiece& relative)
    : gurl_(base.gurl_.Resolve(relative.as_string())) {
  Init();
}

void GoogleUrl::Init() {
  is_web_valid_ = (gurl_.is_valid() &&
                   (gurl_.SchemeIs("http") || gurl_.SchemeIs("https")));
}

StringPiece GoogleUrl::Origin() const {
  if (!gurl_.is_valid()) {
    LOG(DFATAL) << "Invalid URL: " << gurl_.possibly_invalid_spec();
    return StringPiece();
  }
  const std::string& spec = gurl_.spec();
  url_parse::Parsed parsed = gurl_.parsed_for_possibly_invalid_spec();
  int origin_size = parsed.path.is_valid() ? parsed.path.begin
                                           : static_cast<int>(spec.size());
  DCHECK_LT(0, origin_size);
  return StringPiece(spec.data(), origin_size);
}

StringPiece GoogleUrl::PathSansQuery() const {
  if (!gurl_.is_valid()) {
    LOG(DFATAL) << "Invalid URL: " << gurl_.possibly_invalid_spec();
    return StringPiece();
  }
  url_parse::Parsed parsed = gurl_.parsed_for_possibly_invalid_spec();
  if (!parsed.path.is_valid()) {
    return StringPiece();
  }
  return StringPiece(gurl_.spec().data() + parsed.path.begin,
                     parsed.path.len);
}

UrlRelativity GoogleUrl::FindRelativity(const StringPiece& url) {
  GoogleUrl temp(url);
  if (temp.IsAnyValid()) {
    return kAbsoluteUrl;
  } else if (url.starts_with("//")) {
    return kNetPath;
  } else if (url.starts_with("/")) {
    return kAbsolutePath;
  } else {
    return kRelativePath;
  }
}

}  // namespace net_cdnmirror
