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

#ifndef NET_CDNMIRROR_REWRITER_PUBLIC_IMAGE_URL_REWRITER_H_
#define NET_CDNMIRROR_REWRITER_PUBLIC_IMAGE_URL_REWRITER_H_

#include <vector>

#include "cdnmirror/kernel/base/basictypes.h"
#include "cdnmirror/kernel/base/string.h"
#include "cdnmirror/kernel/base/string_util.h"

namespace net_cdnmirror {

class CdnUrlRewriter;

// An image as the host describes it when resolving an attachment.
struct ImageSource {
  ImageSource() : width(0), height(0), is_intermediate(false) {}

  GoogleString url;
  int width;
  int height;
  bool is_intermediate;
};

// One entry of a responsive image's candidate list.  Records built by the
// host may lack a url, in which case has_url is false.
struct SrcsetCandidate {
  SrcsetCandidate() : has_url(false) {}

  bool has_url;
  GoogleString url;
  GoogleString descriptor;  // e.g. "300w" or "2x"; may be empty.
};

typedef std::vector<SrcsetCandidate> SrcsetCandidateVector;

// Applies CdnUrlRewriter to the urls inside typed image records.
class ImageUrlRewriter {
 public:
  // rewriter is not owned.
  explicit ImageUrlRewriter(CdnUrlRewriter* rewriter);
  ~ImageUrlRewriter();

  // Rewrites image->url.  Does nothing for NULL or for an empty url.
  void RewriteImageSource(ImageSource* image);

  // Rewrites the url of each candidate that has one.
  void RewriteSrcsetCandidates(SrcsetCandidateVector* candidates);

  // Rewrites the urls of a srcset attribute value, returning the new value.
  // The value is returned as given if no url changes.
  GoogleString RewriteSrcsetAttribute(const StringPiece& srcset);

  // Splits a srcset attribute value into candidates, following the HTML
  // parsing rules for "a.jpg 1x, b.jpg 2x".  Every candidate produced has a
  // url.
  static void ParseSrcSet(StringPiece input, SrcsetCandidateVector* out);

  // Inverse of ParseSrcSet, modulo whitespace.
  static GoogleString SerializeSrcSet(const SrcsetCandidateVector& in);

 private:
  CdnUrlRewriter* rewriter_;

  DISALLOW_COPY_AND_ASSIGN(ImageUrlRewriter);
};

}  // namespace net_cdnmirror

#endif  // NET_CDNMIRROR_REWRITER_PUBLIC_IMAGE_URL_REWRITER_H_
