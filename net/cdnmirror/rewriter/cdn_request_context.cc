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

#include "net/cdnmirror/rewriter/public/cdn_request_context.h"

#include "cdnmirror/kernel/http/google_url.h"

namespace net_cdnmirror {

CdnRequestContext::CdnRequestContext()
    : admin_request_(false),
      doing_ajax_(false) {
}

CdnRequestContext::~CdnRequestContext() {
}

bool CdnRequestContext::InAdminContext() const {
  if (!admin_request_) {
    return false;
  }
  if (doing_ajax_ && !referer_.empty()) {
    StringPiece referer_path;
    GoogleUrl referer(referer_);
    if (referer.IsAnyValid()) {
      referer_path = referer.PathSansQuery();
    } else {
      referer_path = referer_;
    }
    if (referer_path.find("/wp-admin/") == StringPiece::npos) {
      return false;
    }
  }
  return true;
}

}  // namespace net_cdnmirror
