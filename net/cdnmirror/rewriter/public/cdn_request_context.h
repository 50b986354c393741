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

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_CDN_REQUEST_CONTEXT_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_CDN_REQUEST_CONTEXT_H_

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

// What the host knows about the request being rendered.  Every public
// rewriting entry point returns its input unchanged while
// InAdminContext() is true.
class CdnRequestContext {
 public:
  CdnRequestContext();
  ~CdnRequestContext();

  // True when serving an admin page.  AJAX calls are routed through the
  // admin endpoint even when a front-end page made them; those count as
  // admin only if the referring page is itself under /wp-admin/.  An AJAX
  // call with no referer counts as admin.
  bool InAdminContext() const;

  bool admin_request() const { return admin_request_; }
  void set_admin_request(bool x) { admin_request_ = x; }

  bool doing_ajax() const { return doing_ajax_; }
  void set_doing_ajax(bool x) { doing_ajax_ = x; }

  const GoogleString& referer() const { return referer_; }
  void set_referer(const StringPiece& x) { x.CopyToString(&referer_); }

 private:
  bool admin_request_;
  bool doing_ajax_;
  GoogleString referer_;

  DISALLOW_COPY_AND_ASSIGN(CdnRequestContext);
};

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_CDN_REQUEST_CONTEXT_H_
