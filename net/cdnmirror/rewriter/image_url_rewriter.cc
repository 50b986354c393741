/*
 * Copyright 2015 Google Inc.
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

#include "net/cdnmirror/rewriter/public/image_url_rewriter.h"

#include "net/cdnmirror/rewriter/public/cdn_url_rewriter.h"

namespace net_cdnmirror {

ImageUrlRewriter::ImageUrlRewriter(CdnUrlRewriter* rewriter)
    : rewriter_(rewriter) {
}

ImageUrlRewriter::~ImageUrlRewriter() {
}

void ImageUrlRewriter::RewriteImageSource(ImageSource* image) {
  if (image == NULL || image->url.empty() || !rewriter_->RewritingActive()) {
    return;
  }
  image->url = rewriter_->Rewrite(image->url);
}

void ImageUrlRewriter::RewriteSrcsetCandidates(
    SrcsetCandidateVector* candidates) {
  if (!rewriter_->RewritingActive()) {
    return;
  }
  for (int i = 0, n = candidates->size(); i < n; ++i) {
    SrcsetCandidate& candidate = (*candidates)[i];
    if (candidate.has_url) {
      candidate.url = rewriter_->Rewrite(candidate.url);
    }
  }
}

GoogleString ImageUrlRewriter::RewriteSrcsetAttribute(
    const StringPiece& srcset) {
  if (!rewriter_->RewritingActive()) {
    return srcset.as_string();
  }
  SrcsetCandidateVector candidates;
  ParseSrcSet(srcset, &candidates);
  bool changed = false;
  for (int i = 0, n = candidates.size(); i < n; ++i) {
    GoogleString rewritten = rewriter_->Rewrite(candidates[i].url);
    if (rewritten != candidates[i].url) {
      candidates[i].url.swap(rewritten);
      changed = true;
    }
  }
  return changed ? SerializeSrcSet(candidates) : srcset.as_string();
}

void ImageUrlRewriter::ParseSrcSet(StringPiece input,
                                   SrcsetCandidateVector* out) {
  out->clear();

  // ref: https://html.spec.whatwg.org/multipage/embedded-content.html#parse-a-srcset-attribute
  while (true) {
    // Strip leading whitespace, commas.
    while (!input.empty() &&
           (IsHtmlSpace(input[0]) || input[0] == ',')) {
      input.remove_prefix(1);
    }

    if (input.empty()) {
      break;
    }

    // Find where the URL ends --- it's WS terminated.
    stringpiece_ssize_type url_end = input.find_first_of(" \f\n\r\t");
    StringPiece url;

    if (url_end == StringPiece::npos) {
      url = input;
      input.clear();
    } else {
      url = input.substr(0, url_end);
      input = input.substr(url_end);
    }

    // URL may have trailing commas, which also means there is no
    // descriptor.
    bool expect_descriptor = true;
    while (url.ends_with(",")) {
      url.remove_suffix(1);
      expect_descriptor = false;
    }

    StringPiece descriptor;
    if (expect_descriptor) {
      bool inside_paren = false;
      int pos, n;
      for (pos = 0, n = input.size(); pos < n; ++pos) {
        if (input[pos] == '(') {
          inside_paren = true;
        } else if (input[pos] == ')' && inside_paren) {
          inside_paren = false;
        } else if (input[pos] == ',' && !inside_paren) {
          break;
        }
      }
      descriptor = input.substr(0, pos);
      input = input.substr(pos);
      TrimWhitespace(&descriptor);
    }

    SrcsetCandidate cand;
    cand.has_url = true;
    url.CopyToString(&cand.url);
    descriptor.CopyToString(&cand.descriptor);
    out->push_back(cand);
  }
}

GoogleString ImageUrlRewriter::SerializeSrcSet(
    const SrcsetCandidateVector& in) {
  GoogleString result;
  for (int i = 0, n = in.size(); i < n; ++i) {
    if (i != 0) {
      StrAppend(&result, ", ");
    }
    StrAppend(&result, in[i].url);
    if (!in[i].descriptor.empty()) {
      StrAppend(&result, " ", in[i].descriptor);
    }
  }
  return result;
}

}  // namespace net_cdnmirror
