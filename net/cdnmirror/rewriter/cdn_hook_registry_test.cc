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

#include "net/cdnmirror/rewriter/public/cdn_hook_registry.h"

#include "cdnmirror/kernel/base/gtest.h"
#include "cdnmirror/kernel/base/mock_message_handler.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_writer.h"
#include "cdnmirror/kernel/base/writer.h"

namespace net_cdnmirror {

namespace {

// Appends a fixed suffix to whatever it filters, or writes it for actions.
class Suffixer {
 public:
  explicit Suffixer(const StringPiece& suffix) : suffix_(suffix.as_string()) {}

  void Filter(const StringPiece& in, GoogleString* out) {
    *out = StrCat(in, suffix_);
  }

  void Act(Writer* writer, MessageHandler* handler) {
    EXPECT_TRUE(writer->Write(suffix_, handler));
  }

  void FilterImage(ImageSource* image) {
    image->url += suffix_;
  }

  void FilterSrcset(SrcsetCandidateVector* candidates) {
    for (int i = 0, n = candidates->size(); i < n; ++i) {
      (*candidates)[i].url += suffix_;
    }
  }

 private:
  GoogleString suffix_;
};

class CdnHookRegistryTest : public testing::Test {
 protected:
  CdnHookRegistryTest() : a_("a"), b_("b"), c_("c") {}

  CdnHookRegistry::FilterCallback* Filter(Suffixer* suffixer) {
    return NewPermanentCallback(suffixer, &Suffixer::Filter);
  }

  CdnHookRegistry::ActionCallback* Action(Suffixer* suffixer) {
    return NewPermanentCallback(suffixer, &Suffixer::Act);
  }

  CdnHookRegistry::ImageSourceCallback* ImageFilter(Suffixer* suffixer) {
    return NewPermanentCallback(suffixer, &Suffixer::FilterImage);
  }

  CdnHookRegistry::SrcsetCallback* SrcsetFilter(Suffixer* suffixer) {
    return NewPermanentCallback(suffixer, &Suffixer::FilterSrcset);
  }

  Suffixer a_, b_, c_;
  MockMessageHandler handler_;
  CdnHookRegistry registry_;
};

TEST_F(CdnHookRegistryTest, NoFilters) {
  EXPECT_EQ("x", registry_.ApplyFilters("the_content", "x"));
  EXPECT_EQ(0, registry_.NumHandlers("the_content"));
  EXPECT_EQ(-1, registry_.FirstPriority("the_content"));
}

TEST_F(CdnHookRegistryTest, PriorityOrder) {
  registry_.AddFilter("hook", 9999, Filter(&a_));
  registry_.AddFilter("hook", 10, Filter(&b_));
  registry_.AddFilter("hook", 9999, Filter(&c_));
  EXPECT_EQ("xbac", registry_.ApplyFilters("hook", "x"));
  EXPECT_EQ(3, registry_.NumHandlers("hook"));
  EXPECT_EQ(10, registry_.FirstPriority("hook"));
  EXPECT_EQ("y", registry_.ApplyFilters("other_hook", "y"));
}

TEST_F(CdnHookRegistryTest, Actions) {
  registry_.AddAction("wp_head", 10, Action(&a_));
  registry_.AddAction("wp_head", 5, Action(&b_));
  registry_.AddFilter("wp_head", 1, Filter(&c_));
  GoogleString out;
  StringWriter writer(&out);
  registry_.DoAction("wp_head", &writer, &handler_);
  EXPECT_EQ("ba", out);
  registry_.DoAction("wp_footer", &writer, &handler_);
  EXPECT_EQ("ba", out);
}

TEST_F(CdnHookRegistryTest, ImageSourceFilters) {
  registry_.AddImageSourceFilter("wp_get_attachment_image_src", 9999,
                                 ImageFilter(&a_));
  registry_.AddImageSourceFilter("wp_get_attachment_image_src", 10,
                                 ImageFilter(&b_));
  registry_.AddFilter("wp_get_attachment_image_src", 1, Filter(&c_));
  EXPECT_EQ(3, registry_.NumHandlers("wp_get_attachment_image_src"));
  EXPECT_EQ(1, registry_.FirstPriority("wp_get_attachment_image_src"));

  ImageSource image;
  image.url = "x";
  image.width = 300;
  registry_.ApplyImageSourceFilters("wp_get_attachment_image_src", &image);
  EXPECT_EQ("xba", image.url);
  EXPECT_EQ(300, image.width);

  // String filters ignore image values and vice versa.
  EXPECT_EQ("yc", registry_.ApplyFilters("wp_get_attachment_image_src", "y"));
  registry_.ApplyImageSourceFilters("other_hook", &image);
  EXPECT_EQ("xba", image.url);
}

TEST_F(CdnHookRegistryTest, SrcsetFilters) {
  registry_.AddSrcsetFilter("wp_calculate_image_srcset", 9999,
                            SrcsetFilter(&a_));
  registry_.AddSrcsetFilter("wp_calculate_image_srcset", 9999,
                            SrcsetFilter(&b_));
  registry_.AddImageSourceFilter("wp_calculate_image_srcset", 1,
                                 ImageFilter(&c_));

  SrcsetCandidateVector candidates(2);
  candidates[0].url = "x";
  candidates[0].descriptor = "1x";
  candidates[1].url = "y";
  candidates[1].descriptor = "2x";
  registry_.ApplySrcsetFilters("wp_calculate_image_srcset", &candidates);
  EXPECT_EQ("xab", candidates[0].url);
  EXPECT_EQ("1x", candidates[0].descriptor);
  EXPECT_EQ("yab", candidates[1].url);
  EXPECT_EQ("2x", candidates[1].descriptor);
}

}  // namespace

}  // namespace net_cdnmirror
