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

#include "cdnmirror/kernel/base/gtest.h"

namespace net_cdnmirror {

namespace {

TEST(CdnRequestContextTest, FrontEndRequest) {
  CdnRequestContext context;
  EXPECT_FALSE(context.InAdminContext());
  context.set_doing_ajax(true);
  EXPECT_FALSE(context.InAdminContext());
}

TEST(CdnRequestContextTest, AdminPage) {
  CdnRequestContext context;
  context.set_admin_request(true);
  EXPECT_TRUE(context.InAdminContext());
}

TEST(CdnRequestContextTest, AjaxFromFrontEndPage) {
  CdnRequestContext context;
  context.set_admin_request(true);
  context.set_doing_ajax(true);
  context.set_referer("https://site.example/shop/?add=1");
  EXPECT_FALSE(context.InAdminContext());
}

TEST(CdnRequestContextTest, AjaxFromAdminPage) {
  CdnRequestContext context;
  context.set_admin_request(true);
  context.set_doing_ajax(true);
  context.set_referer("https://site.example/wp-admin/post.php?post=3");
  EXPECT_TRUE(context.InAdminContext());
}

TEST(CdnRequestContextTest, AdminMarkerInRefererQueryDoesNotCount) {
  CdnRequestContext context;
  context.set_admin_request(true);
  context.set_doing_ajax(true);
  context.set_referer("https://site.example/?from=/wp-admin/");
  EXPECT_FALSE(context.InAdminContext());
}

TEST(CdnRequestContextTest, AjaxWithoutReferer) {
  CdnRequestContext context;
  context.set_admin_request(true);
  context.set_doing_ajax(true);
  EXPECT_TRUE(context.InAdminContext());
}

}  // namespace

}  // namespace net_cdnmirror
